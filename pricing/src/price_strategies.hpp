#pragma once

#include "price_providers.hpp"
#include <memory>
#include <optional>
#include <string>

struct PriceQuery {
    std::string chain_id;
    std::string token_address;
    std::string symbol;
    std::optional<double> known_api_price;
    std::optional<double> known_router_price;
};

enum class PriceSource {
    Api,
    Router,
    StablecoinRegistry,
    DexPair,
    SymbolAggregator,
    WrappedUnderlying,
    StablecoinSymbol
};

std::string price_source_name(PriceSource source);

// One step of the fallback chain
class PriceStrategy {
public:
    virtual ~PriceStrategy() = default;

    virtual std::optional<double> try_resolve(const PriceQuery& query) = 0;
    virtual PriceSource source() const = 0;

    // Blocking strategies talk to the network and are skipped by resolve_sync
    virtual bool is_blocking() const { return false; }
};

class KnownApiPriceStrategy : public PriceStrategy {
public:
    std::optional<double> try_resolve(const PriceQuery& query) override;
    PriceSource source() const override { return PriceSource::Api; }
};

// Unit price implied by a swap quote the caller already holds
class KnownRouterPriceStrategy : public PriceStrategy {
public:
    std::optional<double> try_resolve(const PriceQuery& query) override;
    PriceSource source() const override { return PriceSource::Router; }
};

class StablecoinRegistryStrategy : public PriceStrategy {
public:
    std::optional<double> try_resolve(const PriceQuery& query) override;
    PriceSource source() const override { return PriceSource::StablecoinRegistry; }
};

class DexPairStrategy : public PriceStrategy {
public:
    explicit DexPairStrategy(std::shared_ptr<DexPairPriceProvider> provider);

    std::optional<double> try_resolve(const PriceQuery& query) override;
    PriceSource source() const override { return PriceSource::DexPair; }
    bool is_blocking() const override { return true; }

private:
    std::shared_ptr<DexPairPriceProvider> provider_;
};

class SymbolAggregatorStrategy : public PriceStrategy {
public:
    explicit SymbolAggregatorStrategy(std::shared_ptr<SymbolPriceProvider> provider);

    std::optional<double> try_resolve(const PriceQuery& query) override;
    PriceSource source() const override { return PriceSource::SymbolAggregator; }
    bool is_blocking() const override { return true; }

private:
    std::shared_ptr<SymbolPriceProvider> provider_;
};

// Wrapped token priced as its underlying asset
class WrappedUnderlyingStrategy : public PriceStrategy {
public:
    explicit WrappedUnderlyingStrategy(std::shared_ptr<SymbolPriceProvider> provider);

    std::optional<double> try_resolve(const PriceQuery& query) override;
    PriceSource source() const override { return PriceSource::WrappedUnderlying; }
    bool is_blocking() const override { return true; }

private:
    std::shared_ptr<SymbolPriceProvider> provider_;
};

// Ticker heuristic, last resort after real price discovery
class StablecoinSymbolStrategy : public PriceStrategy {
public:
    std::optional<double> try_resolve(const PriceQuery& query) override;
    PriceSource source() const override { return PriceSource::StablecoinSymbol; }
};
