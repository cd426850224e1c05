#include "dex_api_client.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

void to_json(nlohmann::json& j, const ListedToken& token) {
    j = nlohmann::json{
        {"address", token.address},
        {"symbol", token.symbol},
        {"name", token.name},
        {"decimals", token.decimals},
        {"logo_url", token.logo_url}
    };
}

DexApiClient::DexApiClient(std::shared_ptr<HttpTransport> transport, const std::string& base_url)
    : transport_(std::move(transport))
    , base_url_(base_url)
{
    if (!transport_) {
        throw std::invalid_argument("DexApiClient requires a transport");
    }
    if (base_url_.empty()) {
        throw std::invalid_argument("DexApiClient requires a base URL");
    }
}

nlohmann::json DexApiClient::call(const std::string& action, const nlohmann::json& params) {
    nlohmann::json request = {{"action", action}, {"params", params}};
    auto response = transport_->post_json(base_url_, request.dump());

    if (response.status != 200) {
        throw std::runtime_error(fmt::format("DEX API {} returned HTTP {}", action, response.status));
    }

    auto data = nlohmann::json::parse(response.body);
    if (data.is_object() && data.contains("error") && !data["error"].is_null()) {
        const auto& error = data["error"];
        throw std::runtime_error(fmt::format("DEX API {} error: {}", action,
                                             error.is_string() ? error.get<std::string>() : error.dump()));
    }
    return data;
}

std::vector<ListedToken> DexApiClient::parse_tokens(const nlohmann::json& data) {
    std::vector<ListedToken> tokens;
    if (!data.is_array()) {
        return tokens;
    }

    for (const auto& item : data) {
        if (!item.is_object()) {
            continue;
        }
        ListedToken token;
        token.address = item.value("tokenContractAddress", "");
        token.symbol = item.value("tokenSymbol", "");
        token.name = item.value("tokenName", "");
        token.logo_url = item.value("tokenLogoUrl", "");
        if (item.contains("decimals")) {
            auto decimals = util::parse_number(item["decimals"]);
            token.decimals = decimals ? static_cast<int>(*decimals) : 0;
        }
        if (token.address.empty()) {
            continue;
        }
        tokens.push_back(std::move(token));
    }
    return tokens;
}

std::vector<ListedToken> DexApiClient::get_tokens(const std::string& chain_id) {
    auto data = call("tokens", {{"chainIndex", chain_id}});
    auto tokens = parse_tokens(data);
    spdlog::debug("Fetched {} tokens for chain {}", tokens.size(), chain_id);
    return tokens;
}

std::optional<double> DexApiClient::get_token_price(const std::string& chain_id,
                                                    const std::string& token_address) {
    try {
        auto data = call("token-price", {{"chainIndex", chain_id}, {"tokenAddress", token_address}});
        if (!data.is_object() || !data.contains("price")) {
            return std::nullopt;
        }
        return util::parse_number(data["price"]);
    } catch (const std::exception& e) {
        spdlog::debug("DEX API price lookup failed for {} on chain {}: {}",
                      token_address, chain_id, e.what());
        return std::nullopt;
    }
}
