#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Unit prices a swap router attaches to a quote
struct RouterPrices {
    std::optional<double> from_token_price;
    std::optional<double> to_token_price;
};

RouterPrices extract_router_prices(const nlohmann::json& router_result);

// api > router > stablecoin ticker; no provider is contacted
std::optional<double> best_price(std::optional<double> api_price,
                                 std::optional<double> router_price,
                                 const std::string& symbol);

std::optional<double> calculate_usd_value(double amount, std::optional<double> price);
