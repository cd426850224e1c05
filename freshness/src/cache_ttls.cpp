#include "cache_ttls.hpp"

using namespace std::chrono_literals;

FreshnessOptions tier_options(FreshnessTier tier) {
    switch (tier) {
        case FreshnessTier::TokenList: return {5min, 30min};
        case FreshnessTier::Price:     return {10s, 60s};
        case FreshnessTier::Quote:     return {5s, 30s};
        case FreshnessTier::TokenInfo: return {10min, 60min};
        case FreshnessTier::Balance:   return {15s, 2min};
        case FreshnessTier::Default:   break;
    }
    return {30s, 5min};
}

std::string tier_name(FreshnessTier tier) {
    switch (tier) {
        case FreshnessTier::TokenList: return "token-list";
        case FreshnessTier::Price:     return "price";
        case FreshnessTier::Quote:     return "quote";
        case FreshnessTier::TokenInfo: return "token-info";
        case FreshnessTier::Balance:   return "balance";
        case FreshnessTier::Default:   break;
    }
    return "default";
}

namespace cache_keys {

std::string token_list(const std::string& chain) {
    return "token-list:" + chain;
}

std::string price(const std::string& chain, const std::string& address) {
    return "price:" + chain + ":" + address;
}

std::string quote(const std::string& chain, const std::string& from,
                  const std::string& to, const std::string& amount) {
    return "quote:" + chain + ":" + from + ":" + to + ":" + amount;
}

std::string token_info(const std::string& chain, const std::string& address) {
    return "token-info:" + chain + ":" + address;
}

std::string balance(const std::string& chain, const std::string& address,
                    const std::string& wallet) {
    return "balance:" + chain + ":" + address + ":" + wallet;
}

std::string gas_price(const std::string& chain) {
    return "gas-price:" + chain;
}

} // namespace cache_keys
