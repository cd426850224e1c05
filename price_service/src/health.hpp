#pragma once

#include "price_api.hpp"
#include "thread_pool.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

class HealthCheck {
public:
    HealthCheck(std::shared_ptr<ThreadPool> pool,
                std::shared_ptr<PriceApi> api,
                const std::string& service_name);

    nlohmann::json get_status() const;
    bool is_healthy() const;

private:
    std::shared_ptr<ThreadPool> pool_;
    std::shared_ptr<PriceApi> api_;
    std::string service_name_;
};
