#pragma once
#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include "formreg/CornerFinder.hpp"

namespace formreg {

/*
  Memoizes corner detection per page id. Concurrent lookups of the same
  id share one computation; other ids are not blocked while it runs.
*/
class CornerCache {
public:
    using Compute = std::function<CornerResult()>;

    CornerResult getOrCompute(const std::string& id, const Compute& compute);

    // Stores known corners for a page (e.g. corrected by hand).
    void put(const std::string& id, const CornerResult& result);
    bool lookup(const std::string& id, CornerResult& out) const;

    bool evict(const std::string& id);
    void clear();
    size_t size() const;

private:
    mutable std::mutex mtx_;
    std::map<std::string, std::shared_future<CornerResult>> entries_;
};

}
