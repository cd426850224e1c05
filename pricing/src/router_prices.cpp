#include "router_prices.hpp"
#include "token_tables.hpp"
#include "util.hpp"
#include <cmath>
#include <initializer_list>

namespace {

std::optional<double> first_price(const nlohmann::json& result,
                                  std::initializer_list<const char*> fields) {
    for (const char* field : fields) {
        if (!result.contains(field)) {
            continue;
        }
        auto price = util::parse_number(result[field]);
        // zero means the router had no price
        if (price && *price != 0.0) {
            return price;
        }
    }
    return std::nullopt;
}

} // namespace

RouterPrices extract_router_prices(const nlohmann::json& router_result) {
    RouterPrices prices;
    if (!router_result.is_object()) {
        return prices;
    }
    prices.from_token_price = first_price(router_result, {"fromTokenUnitPrice", "fromTokenPrice"});
    prices.to_token_price = first_price(router_result, {"toTokenUnitPrice", "toTokenPrice"});
    return prices;
}

std::optional<double> best_price(std::optional<double> api_price,
                                 std::optional<double> router_price,
                                 const std::string& symbol) {
    if (util::is_valid_price(api_price)) {
        return api_price;
    }
    if (util::is_valid_price(router_price)) {
        return router_price;
    }
    return token_tables::stablecoin_fallback_price(symbol);
}

std::optional<double> calculate_usd_value(double amount, std::optional<double> price) {
    if (!std::isfinite(amount) || amount <= 0.0) {
        return std::nullopt;
    }
    if (!util::is_valid_price(price)) {
        return std::nullopt;
    }
    return amount * *price;
}
