#include "price_api.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace {

const std::string kTokenListPrefix = "token-list:";

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

nlohmann::json price_body(const std::string& chain_id, const std::string& address,
                          const std::optional<ResolvedPrice>& resolved, bool from_cache) {
    nlohmann::json body = {
        {"chain", chain_id},
        {"address", address},
        {"from_cache", from_cache}
    };
    if (resolved) {
        body["price"] = resolved->price;
        body["source"] = price_source_name(resolved->source);
    } else {
        body["price"] = nullptr;
        body["source"] = nullptr;
    }
    return body;
}

} // namespace

nlohmann::json stats_to_json(const CacheStats& stats, FreshnessTier tier) {
    const auto options = tier_options(tier);
    return {
        {"tier", tier_name(tier)},
        {"stale_ms", options.stale_time.count()},
        {"max_age_ms", options.max_age.count()},
        {"size", stats.size},
        {"pending", stats.pending},
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"evictions", stats.evictions},
        {"keys", stats.keys}
    };
}

PriceApi::PriceApi(Executor& executor,
                   std::shared_ptr<PriceResolver> resolver,
                   std::shared_ptr<DexApiClient> dex_api,
                   size_t cache_capacity,
                   Clock clock)
    : resolver_(std::move(resolver))
    , dex_api_(std::move(dex_api))
    , price_cache_(executor, FreshnessTier::Price, cache_capacity, clock)
    , token_cache_(executor, FreshnessTier::TokenList, cache_capacity, clock)
{
    if (!resolver_ || !dex_api_) {
        throw std::invalid_argument("PriceApi requires a resolver and a DEX API client");
    }
}

std::optional<ResolvedPrice> PriceApi::fetch_price(const std::string& chain_id,
                                                   const std::string& token_address,
                                                   const std::string& symbol) {
    auto explicit_price = dex_api_->get_token_price(chain_id, token_address);
    return resolver_->resolve_with_source({chain_id, token_address, symbol, explicit_price, std::nullopt});
}

nlohmann::json PriceApi::get_price(const std::string& chain_id,
                                   const std::string& token_address,
                                   const std::string& symbol,
                                   std::optional<double> api_price,
                                   std::optional<double> router_price) {
    const std::string address = lower(token_address);

    if (api_price || router_price) {
        auto resolved = resolver_->resolve_with_source({chain_id, address, symbol, api_price, router_price});
        return price_body(chain_id, address, resolved, false);
    }

    auto result = price_cache_.swr(cache_keys::price(chain_id, address),
        [this, chain_id, address, symbol]() { return fetch_price(chain_id, address, symbol); });
    return price_body(chain_id, address, result.data, result.from_cache);
}

nlohmann::json PriceApi::get_tokens(const std::string& chain_id) {
    auto key = cache_keys::token_list(chain_id);
    auto result = token_cache_.swr(key, [this, key]() { return fetch_token_list(key); });
    return {
        {"chain", chain_id},
        {"from_cache", result.from_cache},
        {"count", result.data.size()},
        {"tokens", result.data}
    };
}

std::vector<ListedToken> PriceApi::fetch_token_list(const std::string& key) {
    if (key.compare(0, kTokenListPrefix.size(), kTokenListPrefix) != 0 ||
        key.size() == kTokenListPrefix.size()) {
        throw std::invalid_argument("Not a token list key: " + key);
    }
    return dex_api_->get_tokens(key.substr(kTokenListPrefix.size()));
}

void PriceApi::invalidate(const std::string& key) {
    price_cache_.invalidate(key);
    token_cache_.invalidate(key);
    spdlog::debug("Invalidated {}", key);
}

size_t PriceApi::invalidate_prefix(const std::string& prefix) {
    size_t removed = price_cache_.invalidate_prefix(prefix) + token_cache_.invalidate_prefix(prefix);
    spdlog::debug("Invalidated {} entries under {}", removed, prefix);
    return removed;
}

void PriceApi::clear() {
    price_cache_.clear();
    token_cache_.clear();
    spdlog::info("All caches cleared");
}

nlohmann::json PriceApi::stats() const {
    return {
        {"price", stats_to_json(price_cache_.stats(), price_cache_.tier())},
        {"token_list", stats_to_json(token_cache_.stats(), token_cache_.tier())}
    };
}
