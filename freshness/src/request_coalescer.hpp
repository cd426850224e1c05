#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

template <typename T>
struct PendingRequest {
    using Continuation = std::function<void(const std::shared_future<T>&)>;

    uint64_t epoch = 0;
    std::shared_future<T> future;
    std::vector<Continuation> continuations;
};

// One in-flight request per key. Not synchronized; SwrCache holds the lock.
template <typename T>
class RequestCoalescer {
public:
    using RequestPtr = std::shared_ptr<PendingRequest<T>>;

    RequestPtr find(const std::string& key) const {
        auto it = pending_.find(key);
        return it == pending_.end() ? nullptr : it->second;
    }

    void open(const std::string& key, RequestPtr request) {
        pending_[key] = std::move(request);
    }

    // The slot may already belong to a newer request after clear()
    void release(const std::string& key, const RequestPtr& request) {
        auto it = pending_.find(key);
        if (it != pending_.end() && it->second == request) {
            pending_.erase(it);
        }
    }

    size_t size() const { return pending_.size(); }

    void clear() { pending_.clear(); }

private:
    std::unordered_map<std::string, RequestPtr> pending_;
};
