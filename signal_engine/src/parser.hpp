#pragma once

#include "types.hpp"
#include "rule_table.hpp"
#include <string>
#include <vector>
#include <optional>
#include <chrono>

struct ParsedSignal {
    Direction direction;
    std::string asset;
    std::string timeframe;
    std::optional<double> entry_price;  // only when the text carries @price
    std::string original_text;
    std::chrono::system_clock::time_point parsed_at;
};

struct ParseResult {
    std::optional<ParsedSignal> signal;
    std::optional<SignalError> error;

    bool is_valid() const { return !error.has_value(); }
};

/*
 * Turns instructions such as
 *   LONG BTCUSD M5
 *   BUY GOLD 5M
 *   SHORT ETH M1 @2450.50
 *   🟢 BTC 15
 * into a ParsedSignal. Each field is resolved by an ordered list of
 * strategies; the first one that yields a value wins.
 */
class SignalParser {
public:
    static ParseResult parse(const std::string& text, const RuleTable& rules);

    // Trimmed, ASCII upper-cased copy of the input
    static std::string normalize(const std::string& text);

    static std::optional<Direction> extract_direction(const std::string& normalized,
                                                      const RuleTable& rules);
    static std::optional<std::string> extract_asset(const std::string& normalized,
                                                    const RuleTable& rules);
    static std::optional<std::string> extract_timeframe(const std::string& normalized,
                                                        const RuleTable& rules);
    static std::optional<double> extract_price(const std::string& normalized);

    // Asset strategies
    static std::optional<std::string> match_asset_token(const std::string& normalized,
                                                        const RuleTable& rules);
    static std::optional<std::string> match_asset_substring(const std::string& normalized,
                                                            const RuleTable& rules);

    // Timeframe strategies
    static std::optional<std::string> match_timeframe_pattern(const std::string& normalized,
                                                              const RuleTable& rules);
    static std::optional<std::string> match_timeframe_token(const std::string& normalized,
                                                            const RuleTable& rules);
    static std::optional<std::string> match_timeframe_shape(const std::string& normalized);

    // Keeps [A-Z0-9_] and, when asked, the buy/sell glyphs
    static std::string strip_token(const std::string& token, bool keep_direction_glyphs = false);

private:
    static constexpr size_t DIRECTION_TOKEN_WINDOW = 3;
};
