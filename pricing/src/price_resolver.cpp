#include "price_resolver.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

PriceResolver::PriceResolver(std::shared_ptr<DexPairPriceProvider> dex_pairs,
                             std::shared_ptr<SymbolPriceProvider> symbols)
{
    strategies_.push_back(std::make_unique<KnownApiPriceStrategy>());
    strategies_.push_back(std::make_unique<KnownRouterPriceStrategy>());
    strategies_.push_back(std::make_unique<StablecoinRegistryStrategy>());
    strategies_.push_back(std::make_unique<DexPairStrategy>(std::move(dex_pairs)));
    strategies_.push_back(std::make_unique<SymbolAggregatorStrategy>(symbols));
    strategies_.push_back(std::make_unique<WrappedUnderlyingStrategy>(std::move(symbols)));
    strategies_.push_back(std::make_unique<StablecoinSymbolStrategy>());
}

PriceResolver::PriceResolver(std::vector<std::unique_ptr<PriceStrategy>> strategies)
    : strategies_(std::move(strategies))
{
    for (const auto& strategy : strategies_) {
        if (!strategy) {
            throw std::invalid_argument("PriceResolver strategy list contains a null entry");
        }
    }
}

std::optional<double> PriceResolver::resolve(const std::string& chain_id,
                                             const std::string& token_address,
                                             const std::string& symbol,
                                             std::optional<double> known_api_price,
                                             std::optional<double> known_router_price) {
    auto resolved = resolve_with_source(
        {chain_id, token_address, symbol, known_api_price, known_router_price});
    if (!resolved) {
        return std::nullopt;
    }
    return resolved->price;
}

std::optional<double> PriceResolver::resolve_sync(const std::string& chain_id,
                                                  const std::string& token_address,
                                                  const std::string& symbol,
                                                  std::optional<double> known_api_price,
                                                  std::optional<double> known_router_price) {
    auto resolved = resolve_sync_with_source(
        {chain_id, token_address, symbol, known_api_price, known_router_price});
    if (!resolved) {
        return std::nullopt;
    }
    return resolved->price;
}

std::optional<ResolvedPrice> PriceResolver::resolve_with_source(const PriceQuery& query) {
    return run_chain(query, true);
}

std::optional<ResolvedPrice> PriceResolver::resolve_sync_with_source(const PriceQuery& query) {
    return run_chain(query, false);
}

std::optional<ResolvedPrice> PriceResolver::run_chain(const PriceQuery& query,
                                                      bool include_blocking) {
    for (const auto& strategy : strategies_) {
        if (!include_blocking && strategy->is_blocking()) {
            continue;
        }

        const auto source = strategy->source();
        std::optional<double> price;
        try {
            price = strategy->try_resolve(query);
        } catch (const std::exception& e) {
            spdlog::debug("Price source {} failed for {} on chain {}: {}",
                          price_source_name(source), query.token_address,
                          query.chain_id, e.what());
            continue;
        } catch (...) {
            spdlog::debug("Price source {} failed for {} on chain {}: unknown error",
                          price_source_name(source), query.token_address, query.chain_id);
            continue;
        }

        if (util::is_valid_price(price)) {
            spdlog::debug("Resolved {} ({}) on chain {} via {}: {}",
                          query.symbol, query.token_address, query.chain_id,
                          price_source_name(source), *price);
            return ResolvedPrice{*price, source};
        }
    }

    spdlog::debug("No price for {} ({}) on chain {}",
                  query.symbol, query.token_address, query.chain_id);
    return std::nullopt;
}
