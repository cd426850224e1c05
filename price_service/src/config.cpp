#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    std::string v = val;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    spdlog::warn("Invalid boolean for {}, using default {}", name, default_val);
    return default_val;
}

Config Config::from_env() {
    Config cfg;

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "price_service");
    cfg.log_level = get_env("LOG_LEVEL", "info");
    cfg.worker_threads = get_env_int("WORKER_THREADS", 4);

    cfg.cache_capacity = get_env_int("CACHE_CAPACITY", 500);

    cfg.dex_api_base = get_env("DEX_API_BASE");
    cfg.dexscreener_base = get_env("DEXSCREENER_BASE", "https://api.dexscreener.com");
    cfg.defillama_base = get_env("DEFILLAMA_BASE", "https://coins.llama.fi");
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 8000);

    cfg.prefetch_enabled = get_env_bool("PREFETCH_ENABLED", true);
    cfg.prefetch_initial_delay_ms = get_env_int("PREFETCH_INITIAL_DELAY_MS", 500);
    cfg.prefetch_secondary_delay_ms = get_env_int("PREFETCH_SECONDARY_DELAY_MS", 3000);
    // Ethereum, X Layer, BSC, Base, Arbitrum, Polygon first; then Optimism, Avalanche, Solana
    cfg.prefetch_priority_chains =
        util::split(get_env("PREFETCH_PRIORITY_CHAINS", "1,196,56,8453,42161,137"), ',');
    cfg.prefetch_secondary_chains =
        util::split(get_env("PREFETCH_SECONDARY_CHAINS", "10,43114,501"), ',');

    return cfg;
}

void Config::validate() const {
    if (dex_api_base.empty()) {
        throw std::runtime_error("DEX_API_BASE is required");
    }
    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT must be between 1 and 65535");
    }
    if (worker_threads <= 0) {
        throw std::runtime_error("WORKER_THREADS must be positive");
    }
    if (cache_capacity <= 0) {
        throw std::runtime_error("CACHE_CAPACITY must be positive");
    }
    if (request_timeout_ms <= 0) {
        throw std::runtime_error("REQUEST_TIMEOUT_MS must be positive");
    }
    if (prefetch_initial_delay_ms < 0 || prefetch_secondary_delay_ms < 0) {
        throw std::runtime_error("Prefetch delays must not be negative");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Workers: {}, cache capacity: {}", worker_threads, cache_capacity);
    spdlog::info("  Prefetch: {} ({} priority, {} secondary chains)",
                 prefetch_enabled ? "on" : "off",
                 prefetch_priority_chains.size(), prefetch_secondary_chains.size());
}
