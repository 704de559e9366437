#include "assembler.hpp"
#include "util.hpp"

SignalRecord SignalAssembler::assemble(const ParsedSignal& parsed,
                                       const TradingLevels& levels,
                                       PriceSource source) {
    SignalRecord record;
    record.levels = levels;
    record.original_text = parsed.original_text;
    record.parsed_at = parsed.parsed_at;
    record.generated_at = std::chrono::system_clock::now();
    record.price_source = source;
    return record;
}

std::string SignalAssembler::price_source_string(PriceSource source) {
    switch (source) {
        case PriceSource::Message: return "message";
        case PriceSource::Caller: return "caller";
        case PriceSource::Reference: return "reference";
    }
    return "reference";
}

nlohmann::json SignalAssembler::to_json(const ParsedSignal& signal) {
    nlohmann::json j;
    j["direction"] = direction_string(signal.direction);
    j["asset"] = signal.asset;
    j["timeframe"] = signal.timeframe;
    j["original_message"] = signal.original_text;
    j["timestamp"] = util::to_iso8601(signal.parsed_at);

    if (signal.entry_price) {
        j["entry_price"] = *signal.entry_price;
    } else {
        j["entry_price"] = nullptr;
    }
    return j;
}

nlohmann::json SignalAssembler::to_json(const TradingLevels& levels) {
    return {
        {"direction", direction_string(levels.direction)},
        {"asset", levels.asset},
        {"timeframe", levels.timeframe},
        {"entry", levels.entry},
        {"tp1", levels.tp1},
        {"tp2", levels.tp2},
        {"tp3", levels.tp3},
        {"sl", levels.sl},
        {"tp1_distance", levels.tp1_distance},
        {"tp2_distance", levels.tp2_distance},
        {"tp3_distance", levels.tp3_distance},
        {"sl_distance", levels.sl_distance},
        {"unit", unit_string(levels.unit)},
        {"rr_ratio", levels.rr_ratio}
    };
}

nlohmann::json SignalAssembler::to_json(const SignalRecord& record) {
    nlohmann::json j;
    j["signal"] = to_json(record.levels);
    j["meta"] = {
        {"original_message", record.original_text},
        {"parsed_at", util::to_iso8601(record.parsed_at)},
        {"generated_at", util::to_iso8601(record.generated_at)},
        {"price_source", price_source_string(record.price_source)}
    };
    return j;
}

nlohmann::json SignalAssembler::to_json(const SignalError& error) {
    return {
        {"error", error_kind_string(error.kind)},
        {"message", error.message}
    };
}
