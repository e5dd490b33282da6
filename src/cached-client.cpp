#include "cached-client.hpp"

#include "fingerprint.hpp"
#include "log.hpp"

#include <stdexcept>

namespace toolwire {

CachedClient::CachedClient(ToolClient * client, const cache_params & params)
    : client_(client), params_(params), hits_(0), misses_(0) {
    if (!client_) {
        throw std::invalid_argument("CachedClient requires a client to wrap");
    }
}

json CachedClient::initialize() {
    return client_->initialize();
}

json CachedClient::list_tools(std::chrono::milliseconds timeout) {
    return client_->list_tools(timeout);
}

json CachedClient::call_tool(const std::string & name, const json & arguments, std::chrono::milliseconds timeout) {
    if (name != params_.tool) {
        return client_->call_tool(name, arguments, timeout);
    }

    const std::string key = fingerprint(arguments, params_);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = cache_.find(key);
        if (it != cache_.end()) {
            ++hits_;
            TOOLWIRE_LOG_DEBUG("%s: cache hit for %s (%s)\n", __func__, name.c_str(), key.c_str());
            return it->second;
        }
        ++misses_;
    }

    // not holding the lock, the call may take a long time
    json result = client_->call_tool(name, arguments, timeout);

    std::lock_guard<std::mutex> lock(mutex_);

    // a concurrent miss may have stored the same key first, keep that value
    const auto inserted = cache_.emplace(key, result);
    if (!inserted.second) {
        return inserted.first->second;
    }

    insertion_order_.push_back(key);
    if (params_.capacity > 0) {
        while (cache_.size() > params_.capacity) {
            cache_.erase(insertion_order_.front());
            insertion_order_.pop_front();
        }
    }

    return result;
}

void CachedClient::close() {
    client_->close();
}

cache_stats CachedClient::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_stats s;
    s.hits   = hits_;
    s.misses = misses_;
    s.size   = cache_.size();
    return s;
}

void CachedClient::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    insertion_order_.clear();
    hits_   = 0;
    misses_ = 0;
    TOOLWIRE_LOG_DEBUG("%s: cache cleared\n", __func__);
}

} // namespace toolwire
