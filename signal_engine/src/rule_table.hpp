#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

// Raised at load time; a table that fails validation is never constructed
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct LevelRule {
    double tp1;
    double tp2;
    double tp3;
    double sl;
    Unit unit;
};

struct AssetRule {
    std::string symbol;
    std::vector<std::string> aliases;
    std::map<std::string, LevelRule> timeframe_rules;

    // Per-asset overrides of the calculator's built-in unit sizes
    std::optional<double> pip_size;
    std::optional<double> point_value;

    // Timeframes ordered by duration (M1, M5, ..., H1, H4, D1)
    std::vector<std::string> supported_timeframes() const;
};

/*
 * Immutable lookup structure built from the JSON rule file:
 *
 *   {
 *     "directions": { "LONG": ["BUY", ...], "SHORT": ["SELL", ...] },
 *     "timeframes": { "aliases": { "5M": "M5", "5": "M5", ... } },
 *     "assets": {
 *       "XAUUSD": { "aliases": ["GOLD"], "M1": { "tp1": 0.2, ..., "unit": "%" } }
 *     }
 *   }
 *
 * All alias indices are built in one pass by load() and never mutated after.
 * Keys are stored upper-case; callers pass upper-cased tokens.
 */
class RuleTable {
public:
    static RuleTable load(const nlohmann::json& doc);
    static RuleTable load_file(const std::string& path);

    static std::optional<Unit> parse_unit(const std::string& unit);

    std::optional<Direction> resolve_direction(const std::string& token) const;
    std::optional<std::string> resolve_asset(const std::string& token) const;
    std::optional<std::string> resolve_timeframe(const std::string& token) const;

    const AssetRule* find_asset(const std::string& symbol) const;
    const LevelRule* find_rule(const std::string& asset, const std::string& timeframe) const;

    // Every asset alias (symbols included), longest first, ties alphabetical
    const std::vector<std::string>& asset_aliases_longest_first() const {
        return asset_aliases_by_length_;
    }

    std::vector<std::string> asset_symbols() const;
    std::vector<std::string> direction_aliases() const;
    std::vector<std::string> canonical_timeframes() const;

    size_t asset_count() const { return assets_.size(); }

private:
    RuleTable() = default;

    void load_directions(const nlohmann::json& section);
    void load_timeframes(const nlohmann::json& section);
    void load_assets(const nlohmann::json& section);

    static LevelRule load_level_rule(const std::string& symbol,
                                     const std::string& timeframe,
                                     const nlohmann::json& rule);
    static void register_alias(std::map<std::string, std::string>& index,
                               const std::string& alias,
                               const std::string& canonical,
                               const char* category);

    std::map<std::string, Direction> direction_lookup_;
    std::map<std::string, std::string> asset_lookup_;
    std::map<std::string, std::string> tf_lookup_;
    std::map<std::string, AssetRule> assets_;
    std::vector<std::string> asset_aliases_by_length_;
};

// Reads and parses a JSON document, raising ConfigError on I/O or syntax errors
nlohmann::json load_json_file(const std::string& path);

// Orders timeframe names by duration: minutes, hours, days, weeks
bool timeframe_less(const std::string& a, const std::string& b);
