#pragma once

#include <optional>
#include <string>

// Price keyed by contract address on a specific chain
class DexPairPriceProvider {
public:
    virtual ~DexPairPriceProvider() = default;

    virtual bool supports_chain(const std::string& chain_id) const = 0;
    virtual std::optional<double> get_price(const std::string& chain_id,
                                            const std::string& token_address) = 0;
};

// Price keyed by ticker, independent of chain
class SymbolPriceProvider {
public:
    virtual ~SymbolPriceProvider() = default;

    virtual std::optional<double> get_price(const std::string& ticker) = 0;
};
