#pragma once

#include <string>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

// Static reference prices used when a message carries no @price
class PriceBook {
public:
    PriceBook() = default;
    explicit PriceBook(std::map<std::string, double> prices);

    static PriceBook defaults();

    // Reads "reference_prices" from a rule document; falls back to defaults() when absent
    static PriceBook from_json(const nlohmann::json& doc);

    std::optional<double> lookup(const std::string& symbol) const;
    size_t size() const { return prices_.size(); }

private:
    std::map<std::string, double> prices_;
};
