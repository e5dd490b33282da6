#include "correlator.hpp"

#include "log.hpp"

#include <stdexcept>

namespace toolwire {

Correlator::waiter Correlator::register_request(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (closed_) {
        throw ConnectionClosed(close_reason_);
    }
    if (pending_.count(id) > 0) {
        throw std::logic_error("Request id " + std::to_string(id) + " is already pending");
    }

    waiter w = std::make_shared<PendingRequest>(id);
    pending_.emplace(id, w);
    return w;
}

json Correlator::await(const waiter & w, std::chrono::milliseconds timeout) {
    if (w->result.wait_for(timeout) != std::future_status::ready) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = pending_.find(w->id);
        if (it != pending_.end() && it->second == w) {
            pending_.erase(it);
            lock.unlock();
            TOOLWIRE_LOG_ERROR("%s: timeout waiting for response id=%lld\n", __func__, (long long) w->id);
            throw TimeoutError(w->id);
        }
        // resolved between the wait and the lock, the result is already set
    }

    return w->result.get();
}

bool Correlator::deliver(int64_t id, json message) {
    waiter w;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return false;
        }
        w = it->second;
        pending_.erase(it);
    }

    w->signal.set_value(std::move(message));
    return true;
}

void Correlator::cancel(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(id);
}

void Correlator::fail_all(const std::string & reason) {
    std::map<int64_t, waiter> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        close_reason_ = reason;
        failed.swap(pending_);
    }

    for (auto & entry : failed) {
        entry.second->signal.set_exception(std::make_exception_ptr(ConnectionClosed(
            reason + " (request id=" + std::to_string(entry.first) + ")")));
    }

    if (!failed.empty()) {
        TOOLWIRE_LOG_WARN("%s: failed %zu pending request(s): %s\n", __func__, failed.size(), reason.c_str());
    }
}

size_t Correlator::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool Correlator::is_pending(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(id) > 0;
}

bool Correlator::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace toolwire
