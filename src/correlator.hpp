#pragma once

#include "error.hpp"

#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace toolwire {

struct PendingRequest {
    explicit PendingRequest(int64_t id) : id(id), result(signal.get_future()) {}

    const int64_t      id;
    std::promise<json> signal;
    std::future<json>  result;
};

// Maps outstanding request ids to their waiters.
//
// The frame reader is the only producer (deliver, fail_all) and each caller
// the only consumer of its own waiter. Every id is resolved exactly once:
// delivered, timed out, or failed.
class Correlator {
public:
    using waiter = std::shared_ptr<PendingRequest>;

    Correlator() = default;

    Correlator(const Correlator &) = delete;
    Correlator & operator=(const Correlator &) = delete;

    // Throws std::logic_error if `id` is already pending, ConnectionClosed after fail_all().
    waiter register_request(int64_t id);

    // Blocks until the response for `w` arrives. Throws TimeoutError after `timeout`
    // (the registration is removed) or ConnectionClosed if the stream ended.
    json await(const waiter & w, std::chrono::milliseconds timeout);

    // Returns false if nobody waits for `id`.
    bool deliver(int64_t id, json message);

    // Drops a registration without resolving it.
    void cancel(int64_t id);

    // Fails every pending request with ConnectionClosed and rejects new registrations.
    void fail_all(const std::string & reason);

    size_t pending() const;
    bool   is_pending(int64_t id) const;
    bool   is_closed() const;

private:
    mutable std::mutex          mutex_;
    std::map<int64_t, waiter>   pending_;
    bool                        closed_ = false;
    std::string                 close_reason_;
};

} // namespace toolwire
