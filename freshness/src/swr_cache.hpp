#pragma once

#include "cache_ttls.hpp"
#include "executor.hpp"
#include "freshness_store.hpp"
#include "request_coalescer.hpp"
#include <spdlog/spdlog.h>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

template <typename T>
struct SwrResult {
    T data;
    bool from_cache;
};

/*
 * Stale-while-revalidate cache for one data class.
 *
 * Fresh hits are served without touching the network, stale hits are served
 * immediately while a background refresh is posted to the executor, and misses
 * block on the fetch. Concurrent fetches for one key share a single request.
 * The store, its recency list and the pending map sit behind one mutex; the
 * fetcher itself always runs without the lock.
 */
template <typename T>
class SwrCache {
public:
    using Fetcher = std::function<T()>;
    using Continuation = typename PendingRequest<T>::Continuation;

    SwrCache(Executor& executor,
             FreshnessTier tier = FreshnessTier::Default,
             size_t capacity = kDefaultCacheCapacity,
             Clock clock = steady_now)
        : executor_(executor)
        , tier_(tier)
        , store_(capacity, std::move(clock))
    {}

    SwrCache(const SwrCache&) = delete;
    SwrCache& operator=(const SwrCache&) = delete;

    CacheLookup<T> get(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return store_.get(key);
    }

    void set(const std::string& key, T data) {
        set(key, std::move(data), tier_options(tier_));
    }

    void set(const std::string& key, T data, const FreshnessOptions& options) {
        std::lock_guard<std::mutex> lock(mutex_);
        store_.set(key, std::move(data), options);
    }

    std::shared_future<T> fetch_and_cache(const std::string& key, Fetcher fetcher) {
        return fetch_and_cache(key, std::move(fetcher), tier_options(tier_), nullptr);
    }

    std::shared_future<T> fetch_and_cache(const std::string& key, Fetcher fetcher,
                                          const FreshnessOptions& options,
                                          Continuation on_settled = nullptr) {
        std::shared_ptr<PendingRequest<T>> request;
        std::shared_ptr<std::promise<T>> promise;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (auto pending = coalescer_.find(key)) {
                if (on_settled) {
                    pending->continuations.push_back(std::move(on_settled));
                }
                spdlog::debug("Joined in-flight fetch for {}", key);
                return pending->future;
            }

            promise = std::make_shared<std::promise<T>>();
            request = std::make_shared<PendingRequest<T>>();
            request->epoch = epoch_;
            request->future = promise->get_future().share();
            if (on_settled) {
                request->continuations.push_back(std::move(on_settled));
            }
            coalescer_.open(key, request);
        }

        auto future = request->future;
        try {
            executor_.post([this, key, fetcher = std::move(fetcher), options, request, promise]() {
                run_fetch(key, fetcher, options, request, *promise);
            });
        } catch (const std::exception& e) {
            spdlog::error("Failed to schedule fetch for {}: {}", key, e.what());
            settle(key, options, request, *promise, nullptr, std::current_exception());
        }
        return future;
    }

    SwrResult<T> swr(const std::string& key, Fetcher fetcher) {
        return swr(key, std::move(fetcher), tier_options(tier_));
    }

    SwrResult<T> swr(const std::string& key, Fetcher fetcher, FreshnessTier tier) {
        return swr(key, std::move(fetcher), tier_options(tier));
    }

    SwrResult<T> swr(const std::string& key, Fetcher fetcher, const FreshnessOptions& options) {
        auto cached = get(key);

        if (cached.data && !cached.is_stale) {
            return {std::move(*cached.data), true};
        }

        if (cached.data) {
            revalidate(key, std::move(fetcher), options);
            return {std::move(*cached.data), true};
        }

        // Nothing to show: wait for the network and let failures through
        T data = fetch_and_cache(key, std::move(fetcher), options).get();
        return {std::move(data), false};
    }

    void invalidate(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        store_.invalidate(key);
    }

    size_t invalidate_prefix(const std::string& prefix) {
        std::lock_guard<std::mutex> lock(mutex_);
        return store_.invalidate_prefix(prefix);
    }

    // Hard reset. Fetches already running still answer their waiters but
    // their results are not written back.
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        store_.clear();
        coalescer_.clear();
        epoch_++;
    }

    bool contains(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return store_.contains(key);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return store_.size();
    }

    size_t pending_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return coalescer_.size();
    }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stats = store_.stats();
        stats.pending = coalescer_.size();
        return stats;
    }

    FreshnessTier tier() const { return tier_; }

private:
    Executor& executor_;
    FreshnessTier tier_;
    mutable std::mutex mutex_;
    FreshnessStore<T> store_;
    RequestCoalescer<T> coalescer_;
    uint64_t epoch_ = 0;

    void revalidate(const std::string& key, Fetcher fetcher, const FreshnessOptions& options) {
        try {
            fetch_and_cache(key, std::move(fetcher), options,
                [key](const std::shared_future<T>& result) {
                    try {
                        result.get();
                    } catch (const std::exception& e) {
                        // Stale data already went out; nothing to report upward
                        spdlog::debug("Cache revalidation failed for key: {} ({})", key, e.what());
                    } catch (...) {
                        spdlog::debug("Cache revalidation failed for key: {} (unknown error)", key);
                    }
                });
        } catch (const std::exception& e) {
            spdlog::debug("Cache revalidation not started for key: {} ({})", key, e.what());
        }
    }

    void run_fetch(const std::string& key, const Fetcher& fetcher, const FreshnessOptions& options,
                   const std::shared_ptr<PendingRequest<T>>& request, std::promise<T>& promise) {
        std::unique_ptr<T> value;
        std::exception_ptr error;
        try {
            value = std::make_unique<T>(fetcher());
        } catch (const std::exception& e) {
            spdlog::debug("Fetch failed for {}: {}", key, e.what());
            error = std::current_exception();
        } catch (...) {
            spdlog::debug("Fetch failed for {}: unknown error", key);
            error = std::current_exception();
        }
        settle(key, options, request, promise, value.get(), error);
    }

    void settle(const std::string& key, const FreshnessOptions& options,
                const std::shared_ptr<PendingRequest<T>>& request,
                std::promise<T>& promise, const T* value, std::exception_ptr error) {
        std::vector<Continuation> continuations;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (value && request->epoch == epoch_) {
                store_.set(key, *value, options);
            }
            coalescer_.release(key, request);
            continuations.swap(request->continuations);
        }

        if (value) {
            promise.set_value(*value);
        } else {
            promise.set_exception(error);
        }

        for (auto& continuation : continuations) {
            continuation(request->future);
        }
    }
};
