#pragma once

#include "rule_table.hpp"
#include "parser.hpp"
#include "calculator.hpp"
#include "assembler.hpp"
#include "price_book.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

struct PipelineResult {
    std::optional<SignalRecord> record;
    std::optional<SignalError> error;

    bool is_valid() const { return !error.has_value(); }
};

/*
 * parse -> resolve entry price -> calculate -> assemble.
 *
 * Entry price priority: @price in the text, then the caller's price, then the
 * reference book. The rule table and price book are shared read-only between
 * threads; reload() swaps in new ones without disturbing calls already running.
 */
class SignalPipeline {
public:
    SignalPipeline(std::shared_ptr<const RuleTable> rules, PriceBook prices);

    PipelineResult process(const std::string& text,
                           std::optional<double> caller_price = std::nullopt);

    void reload(std::shared_ptr<const RuleTable> rules,
                std::shared_ptr<const PriceBook> prices);

    // Rebuilds rules and reference prices from one file. On any ConfigError
    // the current pair stays in use and false is returned.
    bool reload_file(const std::string& path);

    std::shared_ptr<const RuleTable> rules() const;
    std::shared_ptr<const PriceBook> prices() const;

    int64_t signals_generated() const { return signals_generated_.load(); }
    int64_t errors() const { return errors_.load(); }

private:
    PipelineResult fail(SignalError error);

    std::shared_ptr<const RuleTable> rules_;
    std::shared_ptr<const PriceBook> prices_;

    std::atomic<int64_t> signals_generated_{0};
    std::atomic<int64_t> errors_{0};
};
