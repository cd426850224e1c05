#pragma once

#include <chrono>
#include <string>

struct FreshnessOptions {
    std::chrono::milliseconds stale_time;
    std::chrono::milliseconds max_age;
};

// TTL tiers, one per data class
enum class FreshnessTier {
    TokenList,    // changes rarely
    Price,        // time-sensitive
    Quote,        // must be fresh
    TokenInfo,    // near-static
    Balance,
    Default
};

FreshnessOptions tier_options(FreshnessTier tier);
std::string tier_name(FreshnessTier tier);

namespace cache_keys {
    std::string token_list(const std::string& chain);
    std::string price(const std::string& chain, const std::string& address);
    std::string quote(const std::string& chain, const std::string& from,
                      const std::string& to, const std::string& amount);
    std::string token_info(const std::string& chain, const std::string& address);
    std::string balance(const std::string& chain, const std::string& address,
                        const std::string& wallet);
    std::string gas_price(const std::string& chain);
}
