#include "defillama_client.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>
#include <unordered_map>

namespace {

const std::unordered_map<std::string, std::string>& coingecko_ids() {
    static const std::unordered_map<std::string, std::string> ids = {
        // Majors
        {"btc", "bitcoin"}, {"eth", "ethereum"}, {"sol", "solana"},
        {"xrp", "ripple"}, {"ada", "cardano"}, {"doge", "dogecoin"},
        {"dot", "polkadot"}, {"matic", "polygon"}, {"ltc", "litecoin"},
        {"link", "chainlink"}, {"atom", "cosmos"}, {"xlm", "stellar"},
        {"trx", "tron"}, {"etc", "ethereum-classic"}, {"bch", "bitcoin-cash"},
        {"near", "near"}, {"ftm", "fantom"}, {"fil", "filecoin"},
        {"hbar", "hedera-hashgraph"}, {"icp", "internet-computer"},
        {"avax", "avalanche-2"}, {"bnb", "binancecoin"}, {"okb", "okb"},
        {"ton", "the-open-network"}, {"apt", "aptos"}, {"sui", "sui"},
        // Stablecoins
        {"usdt", "tether"}, {"usdc", "usd-coin"}, {"dai", "dai"},
        {"busd", "binance-usd"}, {"tusd", "true-usd"}, {"usdp", "paxos-standard"},
        {"frax", "frax"},
        // DeFi and L2
        {"uni", "uniswap"}, {"aave", "aave"}, {"mkr", "maker"},
        {"snx", "havven"}, {"comp", "compound-governance-token"},
        {"crv", "curve-dao-token"}, {"sushi", "sushi"}, {"yfi", "yearn-finance"},
        {"ldo", "lido-dao"}, {"arb", "arbitrum"}, {"op", "optimism"},
        {"sei", "sei-network"}, {"inj", "injective-protocol"},
        // Meme
        {"shib", "shiba-inu"}, {"pepe", "pepe"}, {"floki", "floki"},
        {"bonk", "bonk"}, {"wif", "dogwifcoin"},
        // Gaming and data
        {"sand", "the-sandbox"}, {"mana", "decentraland"}, {"axs", "axie-infinity"},
        {"gala", "gala"}, {"imx", "immutable-x"}, {"ape", "apecoin"},
        {"rndr", "render-token"}, {"grt", "the-graph"}, {"fet", "fetch-ai"},
        {"qnt", "quant-network"}, {"stx", "blockstack"}, {"rune", "thorchain"},
        {"kas", "kaspa"},
    };
    return ids;
}

} // namespace

DefiLlamaClient::DefiLlamaClient(std::shared_ptr<HttpTransport> transport,
                                 const std::string& base_url)
    : transport_(std::move(transport))
    , base_url_(base_url)
{
    if (!transport_) {
        throw std::invalid_argument("DefiLlamaClient requires a transport");
    }
}

std::optional<std::string> DefiLlamaClient::coingecko_id(const std::string& ticker) {
    auto it = coingecko_ids().find(util::to_lower(ticker));
    if (it == coingecko_ids().end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<double> DefiLlamaClient::get_price(const std::string& ticker) {
    auto id = coingecko_id(ticker);
    if (!id) {
        return std::nullopt;
    }

    const std::string coin_key = "coingecko:" + *id;
    try {
        auto response = transport_->get(base_url_ + "/prices/current/" + coin_key);
        if (response.status != 200) {
            spdlog::warn("DefiLlama API error: {} for {}", response.status, ticker);
            return std::nullopt;
        }

        auto data = nlohmann::json::parse(response.body);
        if (!data.contains("coins") || !data["coins"].contains(coin_key)) {
            return std::nullopt;
        }
        const auto& coin = data["coins"][coin_key];
        if (!coin.contains("price")) {
            return std::nullopt;
        }
        return util::parse_number(coin["price"]);
    } catch (const std::exception& e) {
        spdlog::warn("DefiLlama price fetch failed for {}: {}", ticker, e.what());
        return std::nullopt;
    }
}
