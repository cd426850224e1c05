#pragma once

#include "cache_ttls.hpp"
#include "dex_api_client.hpp"
#include "executor.hpp"
#include "price_resolver.hpp"
#include "swr_cache.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using PriceCache = SwrCache<std::optional<ResolvedPrice>>;
using TokenListCache = SwrCache<std::vector<ListedToken>>;

nlohmann::json stats_to_json(const CacheStats& stats, FreshnessTier tier);

// Request handling behind the HTTP routes. Each method either returns the
// response body or throws; the caller maps exceptions to status codes.
class PriceApi {
public:
    PriceApi(Executor& executor,
             std::shared_ptr<PriceResolver> resolver,
             std::shared_ptr<DexApiClient> dex_api,
             size_t cache_capacity = kDefaultCacheCapacity,
             Clock clock = steady_now);

    PriceApi(const PriceApi&) = delete;
    PriceApi& operator=(const PriceApi&) = delete;

    // Caller-supplied prices are resolved directly and never cached
    nlohmann::json get_price(const std::string& chain_id,
                             const std::string& token_address,
                             const std::string& symbol,
                             std::optional<double> api_price = std::nullopt,
                             std::optional<double> router_price = std::nullopt);

    nlohmann::json get_tokens(const std::string& chain_id);

    // Fetcher for token-list:{chain} keys, used by the prefetch scheduler
    std::vector<ListedToken> fetch_token_list(const std::string& key);

    void invalidate(const std::string& key);
    size_t invalidate_prefix(const std::string& prefix);
    void clear();

    nlohmann::json stats() const;

    PriceCache& price_cache() { return price_cache_; }
    TokenListCache& token_cache() { return token_cache_; }

private:
    std::shared_ptr<PriceResolver> resolver_;
    std::shared_ptr<DexApiClient> dex_api_;
    PriceCache price_cache_;
    TokenListCache token_cache_;

    std::optional<ResolvedPrice> fetch_price(const std::string& chain_id,
                                             const std::string& token_address,
                                             const std::string& symbol);
};
