#include "token_tables.hpp"
#include "util.hpp"
#include <unordered_map>
#include <unordered_set>

namespace token_tables {

namespace {

std::string make_key(const std::string& chain_id, const std::string& address) {
    return chain_id + ":" + util::to_lower(address);
}

const std::unordered_set<std::string>& stablecoin_registry() {
    static const std::unordered_set<std::string> registry = {
        // X Layer: USDG, USD₮0, USDT, USDC
        "196:0x4ae46a509f6b1d9056937ba4500cb143933d2dc8",
        "196:0x779ded0c9e1022225f8e0630b35a9b54be713736",
        "196:0x1e4a5963abfd975d8c9021ce480b42188849d41d",
        "196:0x74b7f16337b8972027f6196a17a631ac6de26d22",
        // Ethereum: USDT, USDC, DAI
        "1:0xdac17f958d2ee523a2206206994597c13d831ec7",
        "1:0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48",
        "1:0x6b175474e89094c44da98b954eedeac495271d0f",
        // BSC: USDT, USDC
        "56:0x55d398326f99059ff775485246999027b3197955",
        "56:0x8ac76a51cc950d9822d68b83fe1ad97b32cd580d",
        // Polygon: USDT, USDC
        "137:0xc2132d05d31c914a87c6611c10748aeb04b58e8f",
        "137:0x3c499c542cef5e3811e1192ce70d8cc03d5c3359",
        // Arbitrum: USDT, USDC
        "42161:0xfd086bc7cd5c481dcc9c85ebe478a1c0b69fcbb9",
        "42161:0xaf88d065e77c8cc2239327c5edb3a432268e5831",
        // Base: USDC
        "8453:0x833589fcd6edb6e08f4c7c32d4f71b54bda02913",
        // Optimism: USDC
        "10:0x0b2c639c533813f4aa9d7837caf62653d097ff85",
    };
    return registry;
}

const std::unordered_map<std::string, std::string>& wrapped_registry() {
    static const std::unordered_map<std::string, std::string> registry = {
        {"196:0xb7c00000bcdeef966b20b3d884b98e64d2b06b4f", "btc"},  // XBTC
        {"196:0xe7b000003a45145decf8a28fc755ad5ec5ea025a", "eth"},  // XETH
        {"196:0x505000008de8748dbd4422ff4687a4fc9beba15b", "sol"},  // XSOL
        {"196:0x5a77f1443d16ee5761d310e38b62f77f726bc71c", "eth"},  // WETH
        {"196:0xe538905cf8410324e03a5a23c1c177a474d59b2b", "okb"},  // WOKB
        {"1:0x2260fac5e5542a773aa44fbcfedf7c193bc2c599", "btc"},    // WBTC
        {"1:0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2", "eth"},    // WETH
    };
    return registry;
}

const std::unordered_set<std::string>& stablecoin_symbols() {
    static const std::unordered_set<std::string> symbols = {
        "USDT", "USDC", "USDG", "DAI", "BUSD", "TUSD", "FRAX", "LUSD",
        "USDD", "USDN", "MIM", "GUSD", "USDP", "SUSD", "CUSD", "EURS",
        "EUROC", "EURT", "PYUSD", "FDUSD",
    };
    return symbols;
}

} // namespace

bool is_registered_stablecoin(const std::string& chain_id, const std::string& address) {
    return stablecoin_registry().count(make_key(chain_id, address)) > 0;
}

std::optional<std::string> wrapped_underlying(const std::string& chain_id,
                                              const std::string& address) {
    const auto& registry = wrapped_registry();
    auto it = registry.find(make_key(chain_id, address));
    if (it == registry.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool is_stablecoin_symbol(const std::string& symbol) {
    return stablecoin_symbols().count(util::to_upper(symbol)) > 0;
}

std::optional<double> stablecoin_fallback_price(const std::string& symbol) {
    if (is_stablecoin_symbol(symbol)) {
        return 1.0;
    }
    return std::nullopt;
}

} // namespace token_tables
