#pragma once

#include <optional>
#include <string>

// Static token classification used by the price resolver.
// Addresses compare case-insensitively; chain ids are OKX chain indexes.
namespace token_tables {

    constexpr const char* kXLayerChain = "196";

    // Address-level registry of fiat-pegged tokens
    bool is_registered_stablecoin(const std::string& chain_id, const std::string& address);

    // Ticker of the asset a wrapped token represents ("btc", "eth", ...)
    std::optional<std::string> wrapped_underlying(const std::string& chain_id,
                                                  const std::string& address);

    bool is_stablecoin_symbol(const std::string& symbol);

    // 1.0 for a stablecoin ticker, nullopt otherwise
    std::optional<double> stablecoin_fallback_price(const std::string& symbol);
}
