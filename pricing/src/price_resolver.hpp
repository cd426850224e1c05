#pragma once

#include "price_providers.hpp"
#include "price_strategies.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct ResolvedPrice {
    double price;
    PriceSource source;
};

// Resolves a USD price through an ordered list of strategies.
// The first strategy yielding a finite price > 0 wins; when none does the
// result is nullopt, never zero and never an exception.
class PriceResolver {
public:
    // Default chain: api, router, stablecoin registry, dex pair,
    // symbol aggregator, wrapped underlying, stablecoin ticker
    PriceResolver(std::shared_ptr<DexPairPriceProvider> dex_pairs,
                  std::shared_ptr<SymbolPriceProvider> symbols);

    explicit PriceResolver(std::vector<std::unique_ptr<PriceStrategy>> strategies);

    std::optional<double> resolve(const std::string& chain_id,
                                  const std::string& token_address,
                                  const std::string& symbol,
                                  std::optional<double> known_api_price = std::nullopt,
                                  std::optional<double> known_router_price = std::nullopt);

    // Non-blocking subset only, no provider is contacted
    std::optional<double> resolve_sync(const std::string& chain_id,
                                       const std::string& token_address,
                                       const std::string& symbol,
                                       std::optional<double> known_api_price = std::nullopt,
                                       std::optional<double> known_router_price = std::nullopt);

    std::optional<ResolvedPrice> resolve_with_source(const PriceQuery& query);
    std::optional<ResolvedPrice> resolve_sync_with_source(const PriceQuery& query);

    size_t strategy_count() const { return strategies_.size(); }

private:
    std::vector<std::unique_ptr<PriceStrategy>> strategies_;

    std::optional<ResolvedPrice> run_chain(const PriceQuery& query, bool include_blocking);
};
