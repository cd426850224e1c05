#include "dexscreener_client.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>
#include <unordered_map>

namespace {

const std::unordered_map<std::string, std::string>& chain_slugs() {
    static const std::unordered_map<std::string, std::string> slugs = {
        {"1", "ethereum"},
        {"56", "bsc"},
        {"137", "polygon"},
        {"42161", "arbitrum"},
        {"10", "optimism"},
        {"8453", "base"},
        {"43114", "avalanche"},
        {"250", "fantom"},
        {"324", "zksync"},
        {"59144", "linea"},
        {"534352", "scroll"},
        {"1101", "polygon-zkevm"},
        {"5000", "mantle"},
        {"81457", "blast"},
        {"7777777", "zora"},
        {"501", "solana"},
    };
    return slugs;
}

double pair_liquidity(const nlohmann::json& pair) {
    if (!pair.contains("liquidity") || !pair["liquidity"].is_object()) {
        return 0.0;
    }
    const auto& liquidity = pair["liquidity"];
    if (!liquidity.contains("usd")) {
        return 0.0;
    }
    return util::parse_number(liquidity["usd"]).value_or(0.0);
}

} // namespace

DexScreenerClient::DexScreenerClient(std::shared_ptr<HttpTransport> transport,
                                     const std::string& base_url)
    : transport_(std::move(transport))
    , base_url_(base_url)
{
    if (!transport_) {
        throw std::invalid_argument("DexScreenerClient requires a transport");
    }
}

std::optional<std::string> DexScreenerClient::chain_slug(const std::string& chain_id) {
    auto it = chain_slugs().find(chain_id);
    if (it == chain_slugs().end()) {
        return std::nullopt;
    }
    return it->second;
}

bool DexScreenerClient::supports_chain(const std::string& chain_id) const {
    return chain_slug(chain_id).has_value();
}

std::optional<double> DexScreenerClient::best_pair_price(const nlohmann::json& response) {
    const nlohmann::json* pairs = &response;
    if (response.is_object() && response.contains("pairs")) {
        pairs = &response["pairs"];
    }
    if (!pairs->is_array()) {
        return std::nullopt;
    }

    std::optional<double> best_price;
    double best_liquidity = -1.0;
    for (const auto& pair : *pairs) {
        if (!pair.is_object() || !pair.contains("priceUsd")) {
            continue;
        }
        auto price = util::parse_number(pair["priceUsd"]);
        if (!util::is_valid_price(price)) {
            continue;
        }
        double liquidity = pair_liquidity(pair);
        if (liquidity > best_liquidity) {
            best_liquidity = liquidity;
            best_price = price;
        }
    }
    return best_price;
}

std::optional<double> DexScreenerClient::get_price(const std::string& chain_id,
                                                   const std::string& token_address) {
    auto slug = chain_slug(chain_id);
    if (!slug) {
        return std::nullopt;
    }
    if (!util::is_plain_address(token_address)) {
        spdlog::debug("DexScreener lookup skipped for malformed address: {}", token_address);
        return std::nullopt;
    }

    std::string url = base_url_ + "/tokens/v1/" + *slug + "/" + token_address;
    try {
        auto response = transport_->get(url);
        if (response.status != 200) {
            spdlog::warn("DexScreener API error: {} for {}", response.status, token_address);
            return std::nullopt;
        }
        return best_pair_price(nlohmann::json::parse(response.body));
    } catch (const std::exception& e) {
        spdlog::warn("DexScreener price fetch failed for {}: {}", token_address, e.what());
        return std::nullopt;
    }
}
