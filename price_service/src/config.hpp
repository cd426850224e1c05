#pragma once

#include <string>
#include <vector>
#include <cstdlib>

struct Config {
    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;
    int worker_threads;

    // Cache
    int cache_capacity;

    // Upstreams
    std::string dex_api_base;
    std::string dexscreener_base;
    std::string defillama_base;
    int request_timeout_ms;

    // Prefetch (token lists per chain)
    bool prefetch_enabled;
    int prefetch_initial_delay_ms;
    int prefetch_secondary_delay_ms;
    std::vector<std::string> prefetch_priority_chains;
    std::vector<std::string> prefetch_secondary_chains;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
