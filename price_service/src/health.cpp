#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<ThreadPool> pool,
                         std::shared_ptr<PriceApi> api,
                         const std::string& service_name)
    : pool_(pool), api_(api), service_name_(service_name) {}

nlohmann::json HealthCheck::get_status() const {
    bool pool_ok = pool_->is_running();

    return {
        {"ok", pool_ok},
        {"service", service_name_},
        {"workers", pool_ok ? "up" : "stopped"},
        {"price_cache_size", api_->price_cache().size()},
        {"token_cache_size", api_->token_cache().size()},
        {"ts", util::current_iso8601()}
    };
}

bool HealthCheck::is_healthy() const {
    return pool_->is_running();
}
