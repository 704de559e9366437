#pragma once

#include "types.hpp"
#include "parser.hpp"
#include "calculator.hpp"
#include <string>
#include <chrono>
#include <nlohmann/json.hpp>

enum class PriceSource {
    Message,    // @price in the instruction text
    Caller,     // supplied alongside the text
    Reference   // static reference table
};

// Everything a renderer needs; carries no presentation decisions
struct SignalRecord {
    TradingLevels levels;
    std::string original_text;
    std::chrono::system_clock::time_point parsed_at;
    std::chrono::system_clock::time_point generated_at;
    PriceSource price_source;
};

class SignalAssembler {
public:
    static SignalRecord assemble(const ParsedSignal& parsed,
                                 const TradingLevels& levels,
                                 PriceSource source);

    static nlohmann::json to_json(const ParsedSignal& signal);
    static nlohmann::json to_json(const TradingLevels& levels);
    static nlohmann::json to_json(const SignalRecord& record);
    static nlohmann::json to_json(const SignalError& error);

    static std::string price_source_string(PriceSource source);
};
