#include "calculator.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cmath>
#include <map>

namespace {

// FX pairs quoted in JPY move in 0.01 steps
const std::map<std::string, double> kPipSizes = {
    {"EURUSD", 0.0001},
    {"GBPUSD", 0.0001},
    {"USDJPY", 0.01},
    {"AUDUSD", 0.0001},
    {"USDCAD", 0.0001},
    {"USDCHF", 0.0001},
};

const std::map<std::string, double> kPointValues = {
    {"US30", 1.0},
    {"NAS100", 1.0},
    {"SPX500", 0.1},
};

} // namespace

double LevelCalculator::pip_size(const std::string& asset, const AssetRule* rule) {
    if (rule && rule->pip_size) return *rule->pip_size;

    auto it = kPipSizes.find(asset);
    return it != kPipSizes.end() ? it->second : DEFAULT_PIP_SIZE;
}

double LevelCalculator::point_value(const std::string& asset, const AssetRule* rule) {
    if (rule && rule->point_value) return *rule->point_value;

    auto it = kPointValues.find(asset);
    return it != kPointValues.end() ? it->second : DEFAULT_POINT_VALUE;
}

double LevelCalculator::round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

double LevelCalculator::risk_reward(double tp1, double tp2, double tp3, double sl) {
    if (sl <= 0.0) return 0.0;

    double avg_tp = (tp1 + tp2 + tp3) / 3.0;
    return round2(avg_tp / sl);
}

CalcResult LevelCalculator::calculate(Direction direction,
                                      const std::string& asset,
                                      const std::string& timeframe,
                                      double entry_price,
                                      const RuleTable& rules) {
    CalcResult result;

    if (!std::isfinite(entry_price) || entry_price <= 0.0) {
        result.error = SignalError{
            ErrorKind::InvalidEntry,
            fmt::format("Entry price for {} must be positive, got {}", asset, entry_price)
        };
        return result;
    }

    const LevelRule* rule = rules.find_rule(asset, timeframe);
    if (!rule) {
        result.error = SignalError{
            ErrorKind::UnknownRule,
            fmt::format("No rule configured for {} {}", asset, timeframe)
        };
        return result;
    }

    double unit_size = 1.0;
    switch (rule->unit) {
        case Unit::Percent: break;
        case Unit::Pips: unit_size = pip_size(asset, rules.find_asset(asset)); break;
        case Unit::Points: unit_size = point_value(asset, rules.find_asset(asset)); break;
    }

    // Targets move with the trade, the stop against it
    double sign = direction == Direction::Long ? 1.0 : -1.0;

    TradingLevels levels;
    levels.direction = direction;
    levels.asset = asset;
    levels.timeframe = timeframe;
    levels.entry = entry_price;

    if (rule->unit == Unit::Percent) {
        levels.tp1 = entry_price * (1.0 + sign * rule->tp1 / 100.0);
        levels.tp2 = entry_price * (1.0 + sign * rule->tp2 / 100.0);
        levels.tp3 = entry_price * (1.0 + sign * rule->tp3 / 100.0);
        levels.sl = entry_price * (1.0 - sign * rule->sl / 100.0);
    } else {
        levels.tp1 = entry_price + sign * rule->tp1 * unit_size;
        levels.tp2 = entry_price + sign * rule->tp2 * unit_size;
        levels.tp3 = entry_price + sign * rule->tp3 * unit_size;
        levels.sl = entry_price - sign * rule->sl * unit_size;
    }

    levels.tp1_distance = rule->tp1;
    levels.tp2_distance = rule->tp2;
    levels.tp3_distance = rule->tp3;
    levels.sl_distance = rule->sl;
    levels.unit = rule->unit;
    levels.rr_ratio = risk_reward(rule->tp1, rule->tp2, rule->tp3, rule->sl);

    spdlog::debug("{} {} {} @ {}: TP {}/{}/{} SL {} RR {}",
                  direction_string(direction), asset, timeframe, entry_price,
                  levels.tp1, levels.tp2, levels.tp3, levels.sl, levels.rr_ratio);

    result.levels = std::move(levels);
    return result;
}
