#include "price_book.hpp"
#include "rule_table.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cmath>

PriceBook::PriceBook(std::map<std::string, double> prices) : prices_(std::move(prices)) {
    for (const auto& [symbol, price] : prices_) {
        if (!std::isfinite(price) || price <= 0.0) {
            throw ConfigError(fmt::format("Reference price for {} must be positive, got {}",
                                          symbol, price));
        }
    }
}

PriceBook PriceBook::defaults() {
    return PriceBook({
        {"BTCUSD", 65000.0},
        {"ETHUSDT", 2450.0},
        {"XAUUSD", 2350.0},
        {"EURUSD", 1.0850},
        {"GBPUSD", 1.2650},
        {"USDJPY", 151.50},
        {"US30", 39500.0},
        {"NAS100", 17800.0},
    });
}

PriceBook PriceBook::from_json(const nlohmann::json& doc) {
    if (!doc.is_object() || !doc.contains("reference_prices")) {
        spdlog::info("No reference_prices section, using built-in prices");
        return defaults();
    }

    const auto& section = doc.at("reference_prices");
    if (!section.is_object()) {
        throw ConfigError("'reference_prices' must be an object");
    }

    std::map<std::string, double> prices;
    for (auto it = section.begin(); it != section.end(); ++it) {
        if (!it.value().is_number()) {
            throw ConfigError("Reference price for " + it.key() + " must be a number");
        }
        prices[util::to_upper(util::trim(it.key()))] = it.value().get<double>();
    }

    return PriceBook(std::move(prices));
}

std::optional<double> PriceBook::lookup(const std::string& symbol) const {
    auto it = prices_.find(symbol);
    if (it == prices_.end()) return std::nullopt;
    return it->second;
}
