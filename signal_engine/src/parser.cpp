#include "parser.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

namespace {

// UTF-8 encodings of the green and red circle emoji used as buy/sell shorthand
const std::string kBuyGlyph = "\xF0\x9F\x9F\xA2";
const std::string kSellGlyph = "\xF0\x9F\x94\xB4";

// M5, 5M, 15MIN, 15
const std::regex kTimeframePattern(R"(\b([MHD]\d+|\d+[MHD]|\d+MIN?|\d+)\b)");

// Anything shaped like a canonical timeframe name, aliased or not
const std::regex kTimeframeShape(R"(\b([MHDW]\d+)\b)");

const std::regex kPricePattern(R"(@\s*([\d.,]+))");

bool is_word_char(unsigned char c) {
    return std::isalnum(c) || c == '_';
}

} // namespace

std::string SignalParser::normalize(const std::string& text) {
    return util::to_upper(util::trim(text));
}

std::string SignalParser::strip_token(const std::string& token, bool keep_direction_glyphs) {
    std::string out;
    size_t i = 0;
    while (i < token.size()) {
        if (keep_direction_glyphs) {
            if (token.compare(i, kBuyGlyph.size(), kBuyGlyph) == 0) {
                out += kBuyGlyph;
                i += kBuyGlyph.size();
                continue;
            }
            if (token.compare(i, kSellGlyph.size(), kSellGlyph) == 0) {
                out += kSellGlyph;
                i += kSellGlyph.size();
                continue;
            }
        }

        unsigned char c = static_cast<unsigned char>(token[i]);
        if (c < 0x80 && is_word_char(c)) {
            out += static_cast<char>(c);
        }
        i++;
    }
    return out;
}

std::optional<Direction> SignalParser::extract_direction(const std::string& normalized,
                                                         const RuleTable& rules) {
    auto words = util::split_whitespace(normalized);
    size_t window = std::min(words.size(), DIRECTION_TOKEN_WINDOW);

    for (size_t i = 0; i < window; i++) {
        auto direction = rules.resolve_direction(strip_token(words[i], true));
        if (direction) return direction;
    }
    return std::nullopt;
}

std::optional<std::string> SignalParser::match_asset_token(const std::string& normalized,
                                                           const RuleTable& rules) {
    // '@' separates too, so "BTC@65000" still yields BTC
    std::string spaced = normalized;
    std::replace(spaced.begin(), spaced.end(), '@', ' ');

    for (const auto& word : util::split_whitespace(spaced)) {
        auto asset = rules.resolve_asset(strip_token(word));
        if (asset) return asset;
    }
    return std::nullopt;
}

std::optional<std::string> SignalParser::match_asset_substring(const std::string& normalized,
                                                               const RuleTable& rules) {
    for (const auto& alias : rules.asset_aliases_longest_first()) {
        if (normalized.find(alias) != std::string::npos) {
            spdlog::debug("Asset resolved by substring match on '{}'", alias);
            return rules.resolve_asset(alias);
        }
    }
    return std::nullopt;
}

std::optional<std::string> SignalParser::extract_asset(const std::string& normalized,
                                                       const RuleTable& rules) {
    if (auto asset = match_asset_token(normalized, rules)) return asset;
    return match_asset_substring(normalized, rules);
}

std::optional<std::string> SignalParser::match_timeframe_pattern(const std::string& normalized,
                                                                 const RuleTable& rules) {
    auto begin = std::sregex_iterator(normalized.begin(), normalized.end(), kTimeframePattern);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        auto tf = rules.resolve_timeframe((*it)[1].str());
        if (tf) return tf;
    }
    return std::nullopt;
}

std::optional<std::string> SignalParser::match_timeframe_token(const std::string& normalized,
                                                               const RuleTable& rules) {
    for (const auto& word : util::split_whitespace(normalized)) {
        auto tf = rules.resolve_timeframe(strip_token(word));
        if (tf) return tf;
    }
    return std::nullopt;
}

std::optional<std::string> SignalParser::match_timeframe_shape(const std::string& normalized) {
    std::smatch match;
    if (std::regex_search(normalized, match, kTimeframeShape)) {
        return match[1].str();
    }
    return std::nullopt;
}

std::optional<std::string> SignalParser::extract_timeframe(const std::string& normalized,
                                                           const RuleTable& rules) {
    if (auto tf = match_timeframe_pattern(normalized, rules)) return tf;
    if (auto tf = match_timeframe_token(normalized, rules)) return tf;

    // Unaliased names like M99 still resolve so validation can name the asset's timeframes
    return match_timeframe_shape(normalized);
}

std::optional<double> SignalParser::extract_price(const std::string& normalized) {
    std::smatch match;
    if (!std::regex_search(normalized, match, kPricePattern)) {
        return std::nullopt;
    }

    std::string literal = match[1].str();
    literal.erase(std::remove(literal.begin(), literal.end(), ','), literal.end());

    try {
        size_t consumed = 0;
        double price = std::stod(literal, &consumed);
        if (consumed != literal.size() || !std::isfinite(price) || price <= 0.0) {
            spdlog::debug("Ignoring unusable price literal '{}'", match[1].str());
            return std::nullopt;
        }
        return price;
    } catch (const std::invalid_argument&) {
        spdlog::debug("Ignoring unparsable price literal '{}'", match[1].str());
    } catch (const std::out_of_range&) {
        spdlog::debug("Ignoring out-of-range price literal '{}'", match[1].str());
    }
    return std::nullopt;
}

ParseResult SignalParser::parse(const std::string& text, const RuleTable& rules) {
    ParseResult result;
    std::string message = normalize(text);

    auto direction = extract_direction(message, rules);
    if (!direction) {
        result.error = SignalError{
            ErrorKind::NoDirection,
            fmt::format("Direction not found. Use: {}", util::join(rules.direction_aliases(), "/"))
        };
        return result;
    }

    auto asset = extract_asset(message, rules);
    if (!asset) {
        result.error = SignalError{
            ErrorKind::NoAsset,
            fmt::format("Asset not recognized. Available: {}", util::join(rules.asset_symbols(), ", "))
        };
        return result;
    }

    auto timeframe = extract_timeframe(message, rules);
    if (!timeframe) {
        result.error = SignalError{
            ErrorKind::NoTimeframe,
            fmt::format("Timeframe not found. Use: {}", util::join(rules.canonical_timeframes(), "/"))
        };
        return result;
    }

    if (!rules.find_rule(*asset, *timeframe)) {
        const AssetRule* asset_rule = rules.find_asset(*asset);
        std::vector<std::string> available;
        if (asset_rule) available = asset_rule->supported_timeframes();

        result.error = SignalError{
            ErrorKind::UnsupportedTimeframe,
            fmt::format("TF {} not configured for {}. Available: {}",
                        *timeframe, *asset, util::join(available, ", "))
        };
        return result;
    }

    ParsedSignal signal;
    signal.direction = *direction;
    signal.asset = *asset;
    signal.timeframe = *timeframe;
    signal.entry_price = extract_price(message);
    signal.original_text = text;
    signal.parsed_at = std::chrono::system_clock::now();

    spdlog::debug("Parsed '{}' -> {} {} {}", text, direction_string(signal.direction),
                  signal.asset, signal.timeframe);

    result.signal = std::move(signal);
    return result;
}
