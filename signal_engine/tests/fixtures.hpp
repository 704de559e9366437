#pragma once

#include "../src/rule_table.hpp"
#include <nlohmann/json.hpp>

// Small rule set shared by the tests; BTCUSD/M5 is the 1/2/3.5/1.5 % row
inline nlohmann::json sample_rules_json() {
    return nlohmann::json::parse(R"({
        "directions": {
            "LONG": ["LONG", "BUY", "🟢"],
            "SHORT": ["SHORT", "SELL", "🔴"]
        },
        "timeframes": {
            "aliases": {
                "M1": "M1", "1M": "M1", "1": "M1",
                "M5": "M5", "5M": "M5", "5": "M5",
                "M15": "M15", "15M": "M15", "15": "M15", "15MIN": "M15",
                "H1": "H1", "1H": "H1",
                "H4": "H4", "4H": "H4"
            }
        },
        "assets": {
            "BTCUSD": {
                "aliases": ["BTC", "BITCOIN"],
                "M5": { "tp1": 1.0, "tp2": 2.0, "tp3": 3.5, "sl": 1.5, "unit": "%" },
                "M15": { "tp1": 1.5, "tp2": 3.0, "tp3": 5.0, "sl": 2.0, "unit": "%" },
                "H1": { "tp1": 2.0, "tp2": 4.0, "tp3": 7.0, "sl": 3.0 }
            },
            "ETHUSDT": {
                "aliases": ["ETH", "ETHEREUM"],
                "H1": { "tp1": 2.5, "tp2": 5.0, "tp3": 8.0, "sl": 3.5, "unit": "%" }
            },
            "XAUUSD": {
                "aliases": ["GOLD", "XAU"],
                "M1": { "tp1": 0.2, "tp2": 0.4, "tp3": 0.7, "sl": 0.3, "unit": "%" }
            },
            "EURUSD": {
                "aliases": ["EURO"],
                "M15": { "tp1": 15, "tp2": 30, "tp3": 50, "sl": 20, "unit": "pips" }
            },
            "USDJPY": {
                "aliases": ["YEN"],
                "M15": { "tp1": 15, "tp2": 30, "tp3": 50, "sl": 20, "unit": "pips" }
            },
            "US30": {
                "aliases": ["DOW"],
                "H1": { "tp1": 80, "tp2": 160, "tp3": 250, "sl": 100, "unit": "points" }
            },
            "SPX500": {
                "aliases": ["SPX"],
                "H1": { "tp1": 100, "tp2": 200, "tp3": 350, "sl": 150, "unit": "points" }
            },
            "NAS100": {
                "aliases": ["NASDAQ"],
                "H1": { "tp1": 60, "tp2": 120, "tp3": 200, "sl": 80, "unit": "points" }
            },
            "NDX100": {
                "aliases": ["NASDAQ100"],
                "H1": { "tp1": 60, "tp2": 120, "tp3": 200, "sl": 0, "unit": "points" }
            }
        },
        "reference_prices": {
            "BTCUSD": 65000,
            "XAUUSD": 2350
        }
    })");
}

inline const RuleTable& sample_rules() {
    static const RuleTable table = RuleTable::load(sample_rules_json());
    return table;
}
