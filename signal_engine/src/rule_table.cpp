#include "rule_table.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <map>
#include <set>

namespace {

// Keys inside an asset object that are not timeframe rules, upper-case -> spelling read
const std::map<std::string, std::string> kReservedAssetKeys = {
    {"ALIASES", "aliases"},
    {"PIP_SIZE", "pip_size"},
    {"POINT_VALUE", "point_value"},
};

int timeframe_rank(char c) {
    switch (c) {
        case 'M': return 0;
        case 'H': return 1;
        case 'D': return 2;
        case 'W': return 3;
        default: return 4;
    }
}

// Splits "M15" into (rank, 15); shapes other than <letter><digits> get rank 5
std::pair<int, long> timeframe_key(const std::string& tf) {
    if (tf.size() < 2 || !std::isalpha(static_cast<unsigned char>(tf[0]))) {
        return {5, 0};
    }
    for (size_t i = 1; i < tf.size(); i++) {
        if (!std::isdigit(static_cast<unsigned char>(tf[i]))) return {5, 0};
    }
    try {
        return {timeframe_rank(tf[0]), std::stol(tf.substr(1))};
    } catch (const std::out_of_range&) {
        return {5, 0};
    }
}

std::optional<double> read_positive_override(const nlohmann::json& asset,
                                             const char* key,
                                             const std::string& symbol) {
    if (!asset.contains(key)) return std::nullopt;
    double value = asset.at(key).get<double>();
    if (!std::isfinite(value) || value <= 0.0) {
        throw ConfigError(fmt::format("{}: {} must be positive, got {}", symbol, key, value));
    }
    return value;
}

} // namespace

bool timeframe_less(const std::string& a, const std::string& b) {
    auto ka = timeframe_key(a);
    auto kb = timeframe_key(b);
    if (ka != kb) return ka < kb;
    return a < b;
}

std::vector<std::string> AssetRule::supported_timeframes() const {
    std::vector<std::string> tfs;
    for (const auto& [tf, rule] : timeframe_rules) {
        tfs.push_back(tf);
    }
    std::sort(tfs.begin(), tfs.end(), timeframe_less);
    return tfs;
}

nlohmann::json load_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("Cannot open rules file: " + path);
    }

    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(fmt::format("Invalid JSON in {}: {}", path, e.what()));
    }
}

RuleTable RuleTable::load_file(const std::string& path) {
    return load(load_json_file(path));
}

RuleTable RuleTable::load(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("Rule table must be a JSON object");
    }

    RuleTable table;

    try {
        table.load_directions(doc.at("directions"));
        table.load_timeframes(doc.at("timeframes"));
        table.load_assets(doc.at("assets"));
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Malformed rule table: ") + e.what());
    }

    // Substring fallback in the parser needs longest aliases first
    for (const auto& [alias, symbol] : table.asset_lookup_) {
        table.asset_aliases_by_length_.push_back(alias);
    }
    std::stable_sort(table.asset_aliases_by_length_.begin(),
                     table.asset_aliases_by_length_.end(),
                     [](const std::string& a, const std::string& b) {
                         return a.size() > b.size();
                     });

    spdlog::info("Rule table loaded: {} assets, {} asset aliases, {} timeframe aliases",
                 table.assets_.size(), table.asset_lookup_.size(), table.tf_lookup_.size());

    return table;
}

std::optional<Unit> RuleTable::parse_unit(const std::string& unit) {
    std::string u = util::trim(unit);
    std::transform(u.begin(), u.end(), u.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (u == "%" || u == "percent") return Unit::Percent;
    if (u == "pips") return Unit::Pips;
    if (u == "points") return Unit::Points;
    return std::nullopt;
}

void RuleTable::register_alias(std::map<std::string, std::string>& index,
                               const std::string& alias,
                               const std::string& canonical,
                               const char* category) {
    std::string key = util::to_upper(util::trim(alias));
    if (key.empty()) {
        throw ConfigError(fmt::format("Empty {} alias for {}", category, canonical));
    }

    auto it = index.find(key);
    if (it != index.end() && it->second != canonical) {
        throw ConfigError(fmt::format("Duplicate {} alias '{}': {} and {}",
                                      category, key, it->second, canonical));
    }
    index[key] = canonical;
}

void RuleTable::load_directions(const nlohmann::json& section) {
    if (!section.is_object()) {
        throw ConfigError("'directions' must be an object");
    }

    std::set<Direction> seen;
    for (auto it = section.begin(); it != section.end(); ++it) {
        const std::string& name = it.key();
        const auto& aliases = it.value();
        auto direction = direction_from_string(util::to_upper(util::trim(name)));
        if (!direction) {
            throw ConfigError("Unknown direction '" + name + "', expected LONG or SHORT");
        }
        seen.insert(*direction);

        std::vector<std::string> tokens = aliases.get<std::vector<std::string>>();
        tokens.push_back(direction_string(*direction));

        for (const auto& alias : tokens) {
            std::string key = util::to_upper(util::trim(alias));
            if (key.empty()) {
                throw ConfigError("Empty direction alias for " + direction_string(*direction));
            }
            auto existing = direction_lookup_.find(key);
            if (existing != direction_lookup_.end() && existing->second != *direction) {
                throw ConfigError(fmt::format("Duplicate direction alias '{}': {} and {}",
                                              key, direction_string(existing->second),
                                              direction_string(*direction)));
            }
            direction_lookup_[key] = *direction;
        }
    }

    if (seen.size() != 2) {
        throw ConfigError("'directions' must declare both LONG and SHORT");
    }
}

void RuleTable::load_timeframes(const nlohmann::json& section) {
    const auto& aliases = section.at("aliases");
    if (!aliases.is_object()) {
        throw ConfigError("'timeframes.aliases' must be an object");
    }

    std::set<std::string> canonical;
    for (auto it = aliases.begin(); it != aliases.end(); ++it) {
        const std::string& alias = it.key();
        const auto& tf = it.value();
        std::string value = util::to_upper(util::trim(tf.get<std::string>()));
        if (value.empty()) {
            throw ConfigError("Empty canonical timeframe for alias '" + alias + "'");
        }
        register_alias(tf_lookup_, alias, value, "timeframe");
        canonical.insert(value);
    }

    // A canonical name always resolves to itself unless claimed by another alias
    for (const auto& tf : canonical) {
        tf_lookup_.emplace(tf, tf);
    }
}

LevelRule RuleTable::load_level_rule(const std::string& symbol,
                                     const std::string& timeframe,
                                     const nlohmann::json& rule) {
    if (!rule.is_object()) {
        throw ConfigError(fmt::format("{}/{}: rule must be an object", symbol, timeframe));
    }

    LevelRule out;

    std::string unit_str = rule.value("unit", std::string("%"));
    auto unit = parse_unit(unit_str);
    if (!unit) {
        throw ConfigError(fmt::format("{}/{}: unknown unit '{}'", symbol, timeframe, unit_str));
    }
    out.unit = *unit;

    auto distance = [&](const char* key) {
        if (!rule.contains(key)) {
            throw ConfigError(fmt::format("{}/{}: missing '{}'", symbol, timeframe, key));
        }
        double d = rule.at(key).get<double>();
        if (!std::isfinite(d) || d < 0.0) {
            throw ConfigError(fmt::format("{}/{}: {} must be non-negative, got {}",
                                          symbol, timeframe, key, d));
        }
        return d;
    };

    out.tp1 = distance("tp1");
    out.tp2 = distance("tp2");
    out.tp3 = distance("tp3");
    out.sl = distance("sl");

    if (out.tp1 > out.tp2 || out.tp2 > out.tp3) {
        spdlog::warn("{}/{}: take-profit distances are not non-decreasing", symbol, timeframe);
    }

    return out;
}

void RuleTable::load_assets(const nlohmann::json& section) {
    if (!section.is_object() || section.empty()) {
        throw ConfigError("'assets' must be a non-empty object");
    }

    for (auto it = section.begin(); it != section.end(); ++it) {
        const std::string& raw_symbol = it.key();
        const auto& data = it.value();
        if (!data.is_object()) {
            throw ConfigError("Asset " + raw_symbol + " must be an object");
        }

        AssetRule asset;
        asset.symbol = util::to_upper(util::trim(raw_symbol));
        if (asset.symbol.empty() || assets_.count(asset.symbol)) {
            throw ConfigError("Empty or duplicate asset symbol '" + raw_symbol + "'");
        }

        register_alias(asset_lookup_, asset.symbol, asset.symbol, "asset");

        if (data.contains("aliases")) {
            for (const auto& alias : data.at("aliases").get<std::vector<std::string>>()) {
                register_alias(asset_lookup_, alias, asset.symbol, "asset");
                asset.aliases.push_back(util::to_upper(util::trim(alias)));
            }
        }

        asset.pip_size = read_positive_override(data, "pip_size", asset.symbol);
        asset.point_value = read_positive_override(data, "point_value", asset.symbol);

        for (auto rule = data.begin(); rule != data.end(); ++rule) {
            std::string tf = util::to_upper(util::trim(rule.key()));
            auto reserved = kReservedAssetKeys.find(tf);
            if (reserved != kReservedAssetKeys.end()) {
                if (rule.key() != reserved->second) {
                    throw ConfigError(fmt::format("{}: key '{}' must be spelled '{}'",
                                                  asset.symbol, rule.key(), reserved->second));
                }
                continue;
            }

            if (!tf_lookup_.count(tf)) {
                spdlog::warn("{}: timeframe {} has no alias and is only reachable by name",
                             asset.symbol, tf);
            }
            asset.timeframe_rules[tf] = load_level_rule(asset.symbol, tf, rule.value());
        }

        if (asset.timeframe_rules.empty()) {
            throw ConfigError("Asset " + asset.symbol + " declares no timeframe rules");
        }

        assets_.emplace(asset.symbol, std::move(asset));
    }
}

std::optional<Direction> RuleTable::resolve_direction(const std::string& token) const {
    auto it = direction_lookup_.find(token);
    if (it == direction_lookup_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> RuleTable::resolve_asset(const std::string& token) const {
    auto it = asset_lookup_.find(token);
    if (it == asset_lookup_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> RuleTable::resolve_timeframe(const std::string& token) const {
    auto it = tf_lookup_.find(token);
    if (it == tf_lookup_.end()) return std::nullopt;
    return it->second;
}

const AssetRule* RuleTable::find_asset(const std::string& symbol) const {
    auto it = assets_.find(symbol);
    return it == assets_.end() ? nullptr : &it->second;
}

const LevelRule* RuleTable::find_rule(const std::string& asset,
                                      const std::string& timeframe) const {
    const AssetRule* a = find_asset(asset);
    if (!a) return nullptr;

    auto it = a->timeframe_rules.find(timeframe);
    return it == a->timeframe_rules.end() ? nullptr : &it->second;
}

std::vector<std::string> RuleTable::asset_symbols() const {
    std::vector<std::string> symbols;
    for (const auto& [symbol, asset] : assets_) {
        symbols.push_back(symbol);
    }
    return symbols;
}

std::vector<std::string> RuleTable::direction_aliases() const {
    std::vector<std::string> aliases;
    for (const auto& [alias, direction] : direction_lookup_) {
        aliases.push_back(alias);
    }
    return aliases;
}

std::vector<std::string> RuleTable::canonical_timeframes() const {
    std::set<std::string> unique;
    for (const auto& [alias, tf] : tf_lookup_) {
        unique.insert(tf);
    }
    std::vector<std::string> tfs(unique.begin(), unique.end());
    std::sort(tfs.begin(), tfs.end(), timeframe_less);
    return tfs;
}
