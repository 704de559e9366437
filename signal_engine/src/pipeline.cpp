#include "pipeline.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

SignalPipeline::SignalPipeline(std::shared_ptr<const RuleTable> rules, PriceBook prices)
    : rules_(std::move(rules)),
      prices_(std::make_shared<const PriceBook>(std::move(prices))) {
    if (!rules_) {
        throw ConfigError("SignalPipeline requires a rule table");
    }
}

std::shared_ptr<const RuleTable> SignalPipeline::rules() const {
    return std::atomic_load(&rules_);
}

std::shared_ptr<const PriceBook> SignalPipeline::prices() const {
    return std::atomic_load(&prices_);
}

void SignalPipeline::reload(std::shared_ptr<const RuleTable> rules,
                            std::shared_ptr<const PriceBook> prices) {
    if (!rules || !prices) {
        throw ConfigError("Cannot reload an empty rule table or price book");
    }
    std::atomic_store(&rules_, std::move(rules));
    std::atomic_store(&prices_, std::move(prices));
    spdlog::info("Rule table reloaded");
}

bool SignalPipeline::reload_file(const std::string& path) {
    try {
        auto doc = load_json_file(path);
        auto rules = std::make_shared<const RuleTable>(RuleTable::load(doc));
        auto prices = std::make_shared<const PriceBook>(PriceBook::from_json(doc));
        reload(std::move(rules), std::move(prices));
        return true;
    } catch (const ConfigError& e) {
        spdlog::error("Reload failed, keeping previous rules: {}", e.what());
        return false;
    }
}

PipelineResult SignalPipeline::fail(SignalError error) {
    errors_++;
    spdlog::warn("Signal rejected ({}): {}", error_kind_string(error.kind), error.message);

    PipelineResult result;
    result.error = std::move(error);
    return result;
}

PipelineResult SignalPipeline::process(const std::string& text,
                                       std::optional<double> caller_price) {
    // Pin one table and price book for the whole call
    auto rules = this->rules();
    auto prices = this->prices();

    auto parsed = SignalParser::parse(text, *rules);
    if (!parsed.is_valid()) {
        return fail(*parsed.error);
    }
    const ParsedSignal& signal = *parsed.signal;

    double entry = 0.0;
    PriceSource source = PriceSource::Reference;

    if (signal.entry_price) {
        entry = *signal.entry_price;
        source = PriceSource::Message;
    } else if (caller_price) {
        entry = *caller_price;
        source = PriceSource::Caller;
    } else if (auto ref = prices->lookup(signal.asset)) {
        entry = *ref;
        source = PriceSource::Reference;
    } else {
        return fail(SignalError{
            ErrorKind::NoPrice,
            fmt::format("No price available for {}; add @price to the message", signal.asset)
        });
    }

    auto calc = LevelCalculator::calculate(signal.direction, signal.asset,
                                           signal.timeframe, entry, *rules);
    if (!calc.is_valid()) {
        return fail(*calc.error);
    }

    PipelineResult result;
    result.record = SignalAssembler::assemble(signal, *calc.levels, source);
    signals_generated_++;

    spdlog::info("Signal generated: {} {} {} @ {} ({})",
                 direction_string(signal.direction), signal.asset, signal.timeframe,
                 entry, SignalAssembler::price_source_string(source));
    return result;
}
