#include "price_strategies.hpp"
#include "token_tables.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

std::string price_source_name(PriceSource source) {
    switch (source) {
        case PriceSource::Api:                return "api";
        case PriceSource::Router:             return "router";
        case PriceSource::StablecoinRegistry: return "stablecoin-registry";
        case PriceSource::DexPair:            return "dex-pair";
        case PriceSource::SymbolAggregator:   return "symbol-aggregator";
        case PriceSource::WrappedUnderlying:  return "wrapped-underlying";
        case PriceSource::StablecoinSymbol:   return "stablecoin-symbol";
    }
    return "unknown";
}

std::optional<double> KnownApiPriceStrategy::try_resolve(const PriceQuery& query) {
    return query.known_api_price;
}

std::optional<double> KnownRouterPriceStrategy::try_resolve(const PriceQuery& query) {
    return query.known_router_price;
}

std::optional<double> StablecoinRegistryStrategy::try_resolve(const PriceQuery& query) {
    if (token_tables::is_registered_stablecoin(query.chain_id, query.token_address)) {
        return 1.0;
    }
    return std::nullopt;
}

DexPairStrategy::DexPairStrategy(std::shared_ptr<DexPairPriceProvider> provider)
    : provider_(std::move(provider))
{
    if (!provider_) {
        throw std::invalid_argument("DexPairStrategy requires a provider");
    }
}

std::optional<double> DexPairStrategy::try_resolve(const PriceQuery& query) {
    if (!provider_->supports_chain(query.chain_id)) {
        return std::nullopt;
    }
    return provider_->get_price(query.chain_id, query.token_address);
}

SymbolAggregatorStrategy::SymbolAggregatorStrategy(std::shared_ptr<SymbolPriceProvider> provider)
    : provider_(std::move(provider))
{
    if (!provider_) {
        throw std::invalid_argument("SymbolAggregatorStrategy requires a provider");
    }
}

std::optional<double> SymbolAggregatorStrategy::try_resolve(const PriceQuery& query) {
    if (query.symbol.empty()) {
        return std::nullopt;
    }
    return provider_->get_price(util::to_lower(query.symbol));
}

WrappedUnderlyingStrategy::WrappedUnderlyingStrategy(std::shared_ptr<SymbolPriceProvider> provider)
    : provider_(std::move(provider))
{
    if (!provider_) {
        throw std::invalid_argument("WrappedUnderlyingStrategy requires a provider");
    }
}

std::optional<double> WrappedUnderlyingStrategy::try_resolve(const PriceQuery& query) {
    auto underlying = token_tables::wrapped_underlying(query.chain_id, query.token_address);
    if (!underlying) {
        return std::nullopt;
    }
    spdlog::debug("{} on chain {} wraps {}", query.symbol, query.chain_id, *underlying);
    return provider_->get_price(*underlying);
}

std::optional<double> StablecoinSymbolStrategy::try_resolve(const PriceQuery& query) {
    return token_tables::stablecoin_fallback_price(query.symbol);
}
