#pragma once

#include "http_transport.hpp"
#include "price_providers.hpp"
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Per-pair prices from DexScreener. X Layer is not listed there.
class DexScreenerClient : public DexPairPriceProvider {
public:
    DexScreenerClient(std::shared_ptr<HttpTransport> transport,
                      const std::string& base_url = "https://api.dexscreener.com");

    bool supports_chain(const std::string& chain_id) const override;
    std::optional<double> get_price(const std::string& chain_id,
                                    const std::string& token_address) override;

    static std::optional<std::string> chain_slug(const std::string& chain_id);

    // Price of the most liquid pair with a positive price
    static std::optional<double> best_pair_price(const nlohmann::json& response);

private:
    std::shared_ptr<HttpTransport> transport_;
    std::string base_url_;
};
