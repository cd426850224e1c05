#include "config.hpp"
#include "thread_pool.hpp"
#include "cache_ttls.hpp"
#include "prefetch_scheduler.hpp"
#include "http_transport.hpp"
#include "dexscreener_client.hpp"
#include "defillama_client.hpp"
#include "dex_api_client.hpp"
#include "price_resolver.hpp"
#include "price_api.hpp"
#include "health.hpp"
#include "util.hpp"
#include <curl/curl.h>
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("freshquote", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("Logging initialized at level: {}", log_level);
}

std::vector<std::string> token_list_keys(const std::vector<std::string>& chains) {
    std::vector<std::string> keys;
    keys.reserve(chains.size());
    for (const auto& chain : chains) {
        keys.push_back(cache_keys::token_list(chain));
    }
    return keys;
}

void send_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void send_error(httplib::Response& res, int status, const std::string& message) {
    send_json(res, status, {{"error", message}, {"ts", util::current_iso8601()}});
}

std::optional<double> optional_price_param(const httplib::Request& req, const char* name) {
    if (!req.has_param(name)) return std::nullopt;
    auto value = util::parse_double(req.get_param_value(name));
    if (!value) {
        throw std::invalid_argument(std::string("Invalid number for ") + name);
    }
    return value;
}

int main() {
    try {
        Config config = Config::from_env();
        setup_logging(config.log_level);
        config.validate();

        spdlog::info("Starting {} on {}:{}",
                     config.service_name, config.listen_addr, config.listen_port);

        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            spdlog::error("Failed to initialize libcurl");
            return 1;
        }

        // Upstreams
        auto transport = std::make_shared<CurlTransport>(config.request_timeout_ms);
        auto dexscreener = std::make_shared<DexScreenerClient>(transport, config.dexscreener_base);
        auto defillama = std::make_shared<DefiLlamaClient>(transport, config.defillama_base);
        auto dex_api = std::make_shared<DexApiClient>(transport, config.dex_api_base);
        auto resolver = std::make_shared<PriceResolver>(dexscreener, defillama);

        // Caches and background work
        auto pool = std::make_shared<ThreadPool>(static_cast<size_t>(config.worker_threads));
        auto api = std::make_shared<PriceApi>(*pool, resolver, dex_api,
                                              static_cast<size_t>(config.cache_capacity));
        HealthCheck health(pool, api, config.service_name);

        using namespace std::chrono_literals;
        PrefetchScheduler<std::vector<ListedToken>> prefetcher(
            api->token_cache(), *pool,
            token_list_keys(config.prefetch_priority_chains),
            token_list_keys(config.prefetch_secondary_chains),
            [api](const std::string& key) { return api->fetch_token_list(key); },
            FreshnessOptions{60s, 5min},
            PrefetchTiming{std::chrono::milliseconds(config.prefetch_initial_delay_ms),
                           std::chrono::milliseconds(config.prefetch_secondary_delay_ms)});

        httplib::Server http_server;

        http_server.Get("/health", [&health](const httplib::Request&, httplib::Response& res) {
            send_json(res, health.is_healthy() ? 200 : 503, health.get_status());
        });

        http_server.Get("/price", [&api](const httplib::Request& req, httplib::Response& res) {
            if (!req.has_param("chain") || !req.has_param("address")) {
                send_error(res, 400, "chain and address are required");
                return;
            }
            try {
                auto api_price = optional_price_param(req, "api_price");
                auto router_price = optional_price_param(req, "router_price");
                send_json(res, 200, api->get_price(req.get_param_value("chain"),
                                                   req.get_param_value("address"),
                                                   req.get_param_value("symbol"),
                                                   api_price, router_price));
            } catch (const std::invalid_argument& e) {
                send_error(res, 400, e.what());
            } catch (const std::exception& e) {
                spdlog::error("Price lookup failed: {}", e.what());
                send_error(res, 502, e.what());
            }
        });

        http_server.Get("/tokens", [&api](const httplib::Request& req, httplib::Response& res) {
            if (!req.has_param("chain")) {
                send_error(res, 400, "chain is required");
                return;
            }
            try {
                send_json(res, 200, api->get_tokens(req.get_param_value("chain")));
            } catch (const std::exception& e) {
                spdlog::error("Token list fetch failed: {}", e.what());
                send_error(res, 502, e.what());
            }
        });

        http_server.Post("/prefetch", [&prefetcher](const httplib::Request& req, httplib::Response& res) {
            if (!req.has_param("chain")) {
                send_error(res, 400, "chain is required");
                return;
            }
            auto key = cache_keys::token_list(req.get_param_value("chain"));
            try {
                prefetcher.prefetch(key);
                send_json(res, 202, {{"queued", key}});
            } catch (const std::exception& e) {
                spdlog::warn("Prefetch of {} not queued: {}", key, e.what());
                send_error(res, 503, e.what());
            }
        });

        http_server.Post("/cache/invalidate", [&api](const httplib::Request& req, httplib::Response& res) {
            if (req.has_param("key")) {
                auto key = req.get_param_value("key");
                api->invalidate(key);
                send_json(res, 200, {{"invalidated", key}});
            } else if (req.has_param("prefix")) {
                auto prefix = req.get_param_value("prefix");
                send_json(res, 200, {{"prefix", prefix}, {"removed", api->invalidate_prefix(prefix)}});
            } else {
                send_error(res, 400, "key or prefix is required");
            }
        });

        http_server.Post("/cache/clear", [&api](const httplib::Request&, httplib::Response& res) {
            api->clear();
            send_json(res, 200, {{"cleared", true}});
        });

        http_server.Get("/cache/stats", [&api, &prefetcher](const httplib::Request&, httplib::Response& res) {
            auto body = api->stats();
            body["prefetch"] = {
                {"started", prefetcher.is_started()},
                {"complete", prefetcher.is_complete()}
            };
            send_json(res, 200, body);
        });

        std::thread http_thread([&]() {
            spdlog::info("HTTP server listening on {}:{}",
                         config.listen_addr, config.listen_port);
            if (!http_server.listen(config.listen_addr.c_str(), config.listen_port)) {
                spdlog::error("HTTP server failed to bind {}:{}",
                              config.listen_addr, config.listen_port);
                shutdown_requested = true;
            }
        });

        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);

        if (config.prefetch_enabled) {
            prefetcher.start();
        } else {
            spdlog::info("Prefetch disabled");
        }

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        // Graceful shutdown; workers stop before the caches they write to go away
        spdlog::info("Shutting down gracefully");
        http_server.stop();
        if (http_thread.joinable()) {
            http_thread.join();
        }
        pool->shutdown();
        curl_global_cleanup();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
