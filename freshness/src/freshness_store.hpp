#pragma once

#include "cache_ttls.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

using SteadyTime = std::chrono::steady_clock::time_point;
using Clock = std::function<SteadyTime()>;

inline SteadyTime steady_now() {
    return std::chrono::steady_clock::now();
}

constexpr size_t kDefaultCacheCapacity = 500;

template <typename T>
struct CacheEntry {
    T data;
    SteadyTime created_at;
    SteadyTime stale_at;
    SteadyTime expires_at;
};

template <typename T>
struct CacheLookup {
    std::optional<T> data;
    bool is_stale;
    bool is_expired;
};

struct CacheStats {
    size_t size = 0;
    size_t pending = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    std::vector<std::string> keys;
};

// TTL store with LRU eviction. Not synchronized; SwrCache serializes access.
// Recency list: front is most recently used, back is the eviction victim.
template <typename T>
class FreshnessStore {
public:
    explicit FreshnessStore(size_t capacity = kDefaultCacheCapacity, Clock clock = steady_now)
        : capacity_(capacity)
        , clock_(std::move(clock))
    {
        if (capacity_ == 0) {
            throw std::invalid_argument("FreshnessStore capacity must be positive");
        }
        if (!clock_) {
            throw std::invalid_argument("FreshnessStore requires a clock");
        }
    }

    CacheLookup<T> get(const std::string& key) {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            misses_++;
            return {std::nullopt, true, true};
        }

        auto now = clock_();
        if (now > it->second.entry.expires_at) {
            lru_list_.erase(it->second.lru_iterator);
            entries_.erase(it);
            misses_++;
            return {std::nullopt, true, true};
        }

        touch(it->second);
        hits_++;
        return {it->second.entry.data, now > it->second.entry.stale_at, false};
    }

    void set(const std::string& key, T data, const FreshnessOptions& options) {
        auto now = clock_();
        auto expires_at = now + options.max_age;
        auto stale_at = std::min(now + options.stale_time, expires_at);
        CacheEntry<T> entry{std::move(data), now, stale_at, expires_at};

        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second.entry = std::move(entry);
            touch(it->second);
            return;
        }

        // Make room first so the new key is never the victim
        while (entries_.size() >= capacity_ && !lru_list_.empty()) {
            evict_lru();
        }

        lru_list_.push_front(key);
        entries_.emplace(key, Slot{std::move(entry), lru_list_.begin()});
    }

    bool contains(const std::string& key) const {
        auto it = entries_.find(key);
        return it != entries_.end() && clock_() <= it->second.entry.expires_at;
    }

    void invalidate(const std::string& key) {
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            lru_list_.erase(it->second.lru_iterator);
            entries_.erase(it);
        }
    }

    size_t invalidate_prefix(const std::string& prefix) {
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->first.compare(0, prefix.size(), prefix) == 0) {
                lru_list_.erase(it->second.lru_iterator);
                it = entries_.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
        return removed;
    }

    void clear() {
        entries_.clear();
        lru_list_.clear();
    }

    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }

    // Keys in recency order, most recent first
    std::vector<std::string> keys() const {
        return std::vector<std::string>(lru_list_.begin(), lru_list_.end());
    }

    CacheStats stats() const {
        CacheStats stats;
        stats.size = entries_.size();
        stats.hits = hits_;
        stats.misses = misses_;
        stats.evictions = evictions_;
        stats.keys = keys();
        return stats;
    }

private:
    struct Slot {
        CacheEntry<T> entry;
        std::list<std::string>::iterator lru_iterator;
    };

    size_t capacity_;
    Clock clock_;
    std::unordered_map<std::string, Slot> entries_;
    std::list<std::string> lru_list_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;

    void touch(Slot& slot) {
        lru_list_.splice(lru_list_.begin(), lru_list_, slot.lru_iterator);
    }

    void evict_lru() {
        const std::string& victim = lru_list_.back();
        entries_.erase(victim);
        lru_list_.pop_back();
        evictions_++;
    }
};
