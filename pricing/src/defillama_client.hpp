#pragma once

#include "http_transport.hpp"
#include "price_providers.hpp"
#include <memory>
#include <optional>
#include <string>

// Ticker prices from the DefiLlama coins API, keyed by CoinGecko id
class DefiLlamaClient : public SymbolPriceProvider {
public:
    DefiLlamaClient(std::shared_ptr<HttpTransport> transport,
                    const std::string& base_url = "https://coins.llama.fi");

    std::optional<double> get_price(const std::string& ticker) override;

    static std::optional<std::string> coingecko_id(const std::string& ticker);

private:
    std::shared_ptr<HttpTransport> transport_;
    std::string base_url_;
};
