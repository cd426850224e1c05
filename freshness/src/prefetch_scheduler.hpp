#pragma once

#include "executor.hpp"
#include "swr_cache.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct PrefetchTiming {
    std::chrono::milliseconds initial_delay{500};     // stay clear of startup work
    std::chrono::milliseconds secondary_delay{3000};  // after the priority tier settles
};

// Warms a cache for two fixed tiers of keys. All warming is best-effort.
template <typename T>
class PrefetchScheduler {
public:
    using KeyFetcher = std::function<T(const std::string& key)>;

    PrefetchScheduler(SwrCache<T>& cache,
                      Executor& executor,
                      std::vector<std::string> priority_keys,
                      std::vector<std::string> secondary_keys,
                      KeyFetcher fetcher,
                      FreshnessOptions options,
                      PrefetchTiming timing = {})
        : cache_(cache)
        , executor_(executor)
        , priority_keys_(std::move(priority_keys))
        , secondary_keys_(std::move(secondary_keys))
        , fetcher_(std::move(fetcher))
        , options_(options)
        , timing_(timing)
    {}

    PrefetchScheduler(const PrefetchScheduler&) = delete;
    PrefetchScheduler& operator=(const PrefetchScheduler&) = delete;

    void start() {
        if (started_.exchange(true)) return;

        spdlog::debug("Prefetch scheduled: {} priority keys in {}ms, {} secondary keys after",
                      priority_keys_.size(), timing_.initial_delay.count(), secondary_keys_.size());

        executor_.post_after(timing_.initial_delay, [this]() {
            warm_tier(priority_keys_, "priority", [this]() { schedule_secondary(); });
        });
    }

    // Anticipatory warm for a single key, e.g. when a selector is hovered
    void prefetch(const std::string& key) {
        if (cache_.get(key).data) return;

        cache_.fetch_and_cache(key, [this, key]() { return fetcher_(key); }, options_,
            [key](const std::shared_future<T>& result) {
                try {
                    result.get();
                } catch (const std::exception& e) {
                    spdlog::debug("Prefetch of {} failed: {}", key, e.what());
                } catch (...) {
                    spdlog::debug("Prefetch of {} failed: unknown error", key);
                }
            });
    }

    bool is_started() const { return started_; }
    bool is_complete() const { return complete_; }

private:
    SwrCache<T>& cache_;
    Executor& executor_;
    std::vector<std::string> priority_keys_;
    std::vector<std::string> secondary_keys_;
    KeyFetcher fetcher_;
    FreshnessOptions options_;
    PrefetchTiming timing_;
    std::atomic<bool> started_{false};
    std::atomic<bool> complete_{false};

    void schedule_secondary() {
        try {
            executor_.post_after(timing_.secondary_delay, [this]() {
                warm_tier(secondary_keys_, "secondary", [this]() {
                    complete_ = true;
                    spdlog::debug("Prefetch complete");
                });
            });
        } catch (const std::exception& e) {
            spdlog::warn("Secondary prefetch not scheduled: {}", e.what());
        }
    }

    // on_done runs once every key in the tier has settled
    void warm_tier(const std::vector<std::string>& keys, const char* label,
                   std::function<void()> on_done) {
        if (keys.empty()) {
            on_done();
            return;
        }

        auto remaining = std::make_shared<std::atomic<size_t>>(keys.size());
        auto finish = [remaining, on_done]() {
            if (remaining->fetch_sub(1) == 1) {
                on_done();
            }
        };

        for (const auto& key : keys) {
            if (cache_.get(key).data) {
                spdlog::debug("Prefetch ({}) skipped {}: already cached", label, key);
                finish();
                continue;
            }

            cache_.fetch_and_cache(key, [this, key]() { return fetcher_(key); }, options_,
                [key, label, finish](const std::shared_future<T>& result) {
                    try {
                        result.get();
                        spdlog::debug("Prefetched ({}) {}", label, key);
                    } catch (const std::exception& e) {
                        spdlog::debug("Prefetch ({}) of {} failed: {}", label, key, e.what());
                    } catch (...) {
                        spdlog::debug("Prefetch ({}) of {} failed: unknown error", label, key);
                    }
                    finish();
                });
        }
    }
};
