#include "formreg/CornerCache.hpp"
#include <chrono>
#include <exception>

namespace formreg {

CornerResult CornerCache::getOrCompute(const std::string& id, const Compute& compute) {
    std::shared_future<CornerResult> pending;
    std::promise<CornerResult> promise;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = entries_.find(id);
        if (it != entries_.end()) {
            pending = it->second;
        } else {
            pending = promise.get_future().share();
            entries_.emplace(id, pending);
            owner = true;
        }
    }

    if (owner) {
        // computed outside the lock so other pages are not serialized
        try {
            promise.set_value(compute());
        } catch (...) {
            promise.set_exception(std::current_exception());
            evict(id);
            throw;
        }
    }
    return pending.get();
}

void CornerCache::put(const std::string& id, const CornerResult& result) {
    std::promise<CornerResult> p;
    p.set_value(result);
    std::lock_guard<std::mutex> lock(mtx_);
    entries_[id] = p.get_future().share();
}

bool CornerCache::lookup(const std::string& id, CornerResult& out) const {
    std::shared_future<CornerResult> f;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return false;
        f = it->second;
    }
    if (f.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return false;
    out = f.get();
    return true;
}

bool CornerCache::evict(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.erase(id) > 0;
}

void CornerCache::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    entries_.clear();
}

size_t CornerCache::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.size();
}

}
