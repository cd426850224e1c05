#pragma once

#include "http_transport.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct ListedToken {
    std::string address;
    std::string symbol;
    std::string name;
    int decimals = 0;
    std::string logo_url;
};

void to_json(nlohmann::json& j, const ListedToken& token);

// DEX aggregator proxy speaking {action, params}
class DexApiClient {
public:
    DexApiClient(std::shared_ptr<HttpTransport> transport, const std::string& base_url);

    // Throws std::runtime_error on transport, status or proxy errors
    std::vector<ListedToken> get_tokens(const std::string& chain_id);

    // nullopt on any failure
    std::optional<double> get_token_price(const std::string& chain_id,
                                          const std::string& token_address);

    static std::vector<ListedToken> parse_tokens(const nlohmann::json& data);

private:
    std::shared_ptr<HttpTransport> transport_;
    std::string base_url_;

    nlohmann::json call(const std::string& action, const nlohmann::json& params);
};
