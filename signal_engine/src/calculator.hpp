#pragma once

#include "types.hpp"
#include "rule_table.hpp"
#include <string>
#include <optional>

struct TradingLevels {
    Direction direction;
    std::string asset;
    std::string timeframe;
    double entry;

    double tp1;
    double tp2;
    double tp3;
    double sl;

    // Rule distances, in `unit`
    double tp1_distance;
    double tp2_distance;
    double tp3_distance;
    double sl_distance;
    Unit unit;

    double rr_ratio;  // mean TP distance / SL distance, 2 decimals
};

struct CalcResult {
    std::optional<TradingLevels> levels;
    std::optional<SignalError> error;

    bool is_valid() const { return !error.has_value(); }
};

class LevelCalculator {
public:
    static CalcResult calculate(Direction direction,
                                const std::string& asset,
                                const std::string& timeframe,
                                double entry_price,
                                const RuleTable& rules);

    // Price delta of one pip / one point for the asset
    static double pip_size(const std::string& asset, const AssetRule* rule = nullptr);
    static double point_value(const std::string& asset, const AssetRule* rule = nullptr);

    // Half away from zero at the second decimal
    static double round2(double value);
    static double risk_reward(double tp1, double tp2, double tp3, double sl);

private:
    static constexpr double DEFAULT_PIP_SIZE = 0.0001;
    static constexpr double DEFAULT_POINT_VALUE = 1.0;
};
