#pragma once

#include "params.hpp"
#include "tool-client.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <string>

namespace toolwire {

struct cache_stats {
    size_t hits   = 0;
    size_t misses = 0;
    size_t size   = 0;
};

// Memoizes the results of one designated tool, keyed by the fingerprint of
// its arguments. Every other call is forwarded untouched.
//
// The wrapped client is not owned and must outlive the wrapper.
class CachedClient : public ToolClient {
public:
    explicit CachedClient(ToolClient * client, const cache_params & params = cache_params());

    json initialize() override;
    json list_tools(std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) override;
    json call_tool(const std::string & name, const json & arguments,
                   std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) override;
    void close() override;

    cache_stats stats() const;
    void clear();

    const cache_params & params() const {
        return params_;
    }

private:
    ToolClient * client_;
    cache_params params_;

    mutable std::mutex          mutex_;
    std::map<std::string, json> cache_;
    std::deque<std::string>     insertion_order_; // eviction order when capacity is set
    size_t                      hits_;
    size_t                      misses_;
};

} // namespace toolwire
