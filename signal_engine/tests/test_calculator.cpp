#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/calculator.hpp"
#include "fixtures.hpp"
#include <cmath>
#include <limits>

using Catch::Approx;

TEST_CASE("Percentage levels", "[calculator]") {
    const RuleTable& rules = sample_rules();

    SECTION("Long") {
        auto result = LevelCalculator::calculate(Direction::Long, "BTCUSD", "M5", 65000.0, rules);
        REQUIRE(result.is_valid());

        const auto& lv = *result.levels;
        REQUIRE(lv.tp1 == Approx(65650.0));
        REQUIRE(lv.tp2 == Approx(66300.0));
        REQUIRE(lv.tp3 == Approx(67275.0));
        REQUIRE(lv.sl == Approx(64025.0));
        REQUIRE(lv.rr_ratio == 1.44);

        REQUIRE(lv.entry == 65000.0);
        REQUIRE(lv.tp3_distance == 3.5);
        REQUIRE(lv.sl_distance == 1.5);
        REQUIRE(lv.unit == Unit::Percent);
        REQUIRE(lv.asset == "BTCUSD");
        REQUIRE(lv.timeframe == "M5");
    }

    SECTION("Short") {
        auto result = LevelCalculator::calculate(Direction::Short, "BTCUSD", "M5", 65000.0, rules);
        REQUIRE(result.is_valid());

        const auto& lv = *result.levels;
        REQUIRE(lv.tp1 == Approx(64350.0));
        REQUIRE(lv.tp2 == Approx(63700.0));
        REQUIRE(lv.tp3 == Approx(62725.0));
        REQUIRE(lv.sl == Approx(65975.0));
        REQUIRE(lv.rr_ratio == 1.44);
    }
}

TEST_CASE("Pip levels", "[calculator]") {
    const RuleTable& rules = sample_rules();

    SECTION("Default pip size") {
        auto result = LevelCalculator::calculate(Direction::Long, "EURUSD", "M15", 1.0850, rules);
        REQUIRE(result.is_valid());

        const auto& lv = *result.levels;
        REQUIRE(lv.tp1 == Approx(1.0865));
        REQUIRE(lv.tp2 == Approx(1.0880));
        REQUIRE(lv.tp3 == Approx(1.0900));
        REQUIRE(lv.sl == Approx(1.0830));
        REQUIRE(lv.unit == Unit::Pips);
        REQUIRE(lv.rr_ratio == 1.58);
    }

    SECTION("JPY pairs use 0.01") {
        auto result = LevelCalculator::calculate(Direction::Short, "USDJPY", "M15", 151.50, rules);
        REQUIRE(result.is_valid());

        const auto& lv = *result.levels;
        REQUIRE(lv.tp1 == Approx(151.35));
        REQUIRE(lv.tp2 == Approx(151.20));
        REQUIRE(lv.tp3 == Approx(151.00));
        REQUIRE(lv.sl == Approx(151.70));
    }

    SECTION("Asset override beats the built-in table") {
        auto doc = sample_rules_json();
        doc["assets"]["EURUSD"]["pip_size"] = 0.001;
        auto table = RuleTable::load(doc);

        auto result = LevelCalculator::calculate(Direction::Long, "EURUSD", "M15", 1.0850, table);
        REQUIRE(result.is_valid());
        REQUIRE(result.levels->tp1 == Approx(1.1000));
        REQUIRE(result.levels->sl == Approx(1.0650));
    }

    REQUIRE(LevelCalculator::pip_size("USDJPY") == 0.01);
    REQUIRE(LevelCalculator::pip_size("EURUSD") == 0.0001);
    REQUIRE(LevelCalculator::pip_size("NZDUSD") == 0.0001);
}

TEST_CASE("Point levels", "[calculator]") {
    const RuleTable& rules = sample_rules();

    SECTION("Dow, one point per unit") {
        auto result = LevelCalculator::calculate(Direction::Long, "US30", "H1", 39500.0, rules);
        REQUIRE(result.is_valid());

        const auto& lv = *result.levels;
        REQUIRE(lv.tp1 == Approx(39580.0));
        REQUIRE(lv.tp2 == Approx(39660.0));
        REQUIRE(lv.tp3 == Approx(39750.0));
        REQUIRE(lv.sl == Approx(39400.0));
        REQUIRE(lv.rr_ratio == 1.63);
    }

    SECTION("S&P point value of 0.1") {
        auto result = LevelCalculator::calculate(Direction::Short, "SPX500", "H1", 5200.0, rules);
        REQUIRE(result.is_valid());

        const auto& lv = *result.levels;
        REQUIRE(lv.tp1 == Approx(5190.0));
        REQUIRE(lv.tp2 == Approx(5180.0));
        REQUIRE(lv.tp3 == Approx(5165.0));
        REQUIRE(lv.sl == Approx(5215.0));
    }

    REQUIRE(LevelCalculator::point_value("SPX500") == 0.1);
    REQUIRE(LevelCalculator::point_value("GER40") == 1.0);
}

TEST_CASE("Risk/reward", "[calculator]") {
    SECTION("Zero stop distance gives zero") {
        auto result = LevelCalculator::calculate(Direction::Long, "NDX100", "H1", 18000.0,
                                                 sample_rules());
        REQUIRE(result.is_valid());
        REQUIRE(result.levels->rr_ratio == 0.0);
        REQUIRE(result.levels->sl == Approx(18000.0));
    }

    SECTION("Rounded half away from zero") {
        REQUIRE(LevelCalculator::round2(1.125) == 1.13);
        REQUIRE(LevelCalculator::round2(-1.125) == -1.13);
        // 2.675 is stored just below the half, but the scaled product rounds up
        REQUIRE(LevelCalculator::round2(2.675) == 2.68);
        REQUIRE(LevelCalculator::risk_reward(1.125, 1.125, 1.125, 1.0) == 1.13);
        REQUIRE(LevelCalculator::risk_reward(1.0, 2.0, 3.5, 1.5) == 1.44);
    }

    SECTION("Never negative") {
        REQUIRE(LevelCalculator::risk_reward(0.0, 0.0, 0.0, 1.0) == 0.0);
        REQUIRE(LevelCalculator::risk_reward(1.0, 2.0, 3.0, 0.0) == 0.0);
    }
}

TEST_CASE("Calculation failures", "[calculator]") {
    const RuleTable& rules = sample_rules();

    SECTION("Timeframe without a rule") {
        auto result = LevelCalculator::calculate(Direction::Long, "BTCUSD", "H4", 65000.0, rules);
        REQUIRE_FALSE(result.is_valid());
        REQUIRE_FALSE(result.levels.has_value());
        REQUIRE(result.error->kind == ErrorKind::UnknownRule);
    }

    SECTION("Unknown asset") {
        auto result = LevelCalculator::calculate(Direction::Long, "DOGEUSD", "M5", 0.15, rules);
        REQUIRE(result.error->kind == ErrorKind::UnknownRule);
    }

    SECTION("Entry must be positive and finite") {
        for (double entry : {0.0, -100.0, std::numeric_limits<double>::quiet_NaN(),
                             std::numeric_limits<double>::infinity()}) {
            auto result = LevelCalculator::calculate(Direction::Long, "BTCUSD", "M5", entry, rules);
            REQUIRE_FALSE(result.is_valid());
            REQUIRE(result.error->kind == ErrorKind::InvalidEntry);
        }
    }
}

TEST_CASE("Sign law and monotonicity hold for every rule", "[calculator]") {
    const RuleTable& rules = sample_rules();
    const double entry = 1234.5;

    for (const auto& symbol : rules.asset_symbols()) {
        const AssetRule* asset = rules.find_asset(symbol);
        REQUIRE(asset != nullptr);

        for (const auto& entry_rule : asset->timeframe_rules) {
            const std::string& tf = entry_rule.first;
            const LevelRule& rule = entry_rule.second;

            double unit_size = 1.0;
            if (rule.unit == Unit::Pips) unit_size = LevelCalculator::pip_size(symbol, asset);
            if (rule.unit == Unit::Points) unit_size = LevelCalculator::point_value(symbol, asset);

            auto delta = [&](double d) {
                return rule.unit == Unit::Percent ? entry * d / 100.0 : d * unit_size;
            };

            auto lng = LevelCalculator::calculate(Direction::Long, symbol, tf, entry, rules);
            auto sht = LevelCalculator::calculate(Direction::Short, symbol, tf, entry, rules);
            REQUIRE(lng.is_valid());
            REQUIRE(sht.is_valid());

            REQUIRE(lng.levels->tp1 == Approx(entry + delta(rule.tp1)));
            REQUIRE(lng.levels->tp2 == Approx(entry + delta(rule.tp2)));
            REQUIRE(lng.levels->tp3 == Approx(entry + delta(rule.tp3)));
            REQUIRE(lng.levels->sl == Approx(entry - delta(rule.sl)));

            REQUIRE(sht.levels->tp1 == Approx(entry - delta(rule.tp1)));
            REQUIRE(sht.levels->tp2 == Approx(entry - delta(rule.tp2)));
            REQUIRE(sht.levels->tp3 == Approx(entry - delta(rule.tp3)));
            REQUIRE(sht.levels->sl == Approx(entry + delta(rule.sl)));

            if (rule.tp1 <= rule.tp2 && rule.tp2 <= rule.tp3) {
                REQUIRE(lng.levels->tp1 <= lng.levels->tp2);
                REQUIRE(lng.levels->tp2 <= lng.levels->tp3);
                REQUIRE(sht.levels->tp1 >= sht.levels->tp2);
                REQUIRE(sht.levels->tp2 >= sht.levels->tp3);
            }

            REQUIRE(lng.levels->rr_ratio >= 0.0);
            REQUIRE(lng.levels->rr_ratio == sht.levels->rr_ratio);
        }
    }
}
