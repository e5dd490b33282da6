#pragma once

#include "correlator.hpp"
#include "error.hpp"

#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace toolwire {

class Process;

// Reads newline-delimited JSON from the server's stdout on a dedicated thread
// and routes responses to their waiters. Unmatched messages (server
// notifications, late responses) are kept in a bounded backlog.
class FrameReader {
public:
    FrameReader(Process * process, Correlator * correlator, size_t backlog_capacity);
    ~FrameReader();

    FrameReader(const FrameReader &) = delete;
    FrameReader & operator=(const FrameReader &) = delete;

    void start();

    // Returns once the server's stdout reached end of stream.
    void join();

    size_t backlog_size() const;
    std::vector<json> backlog() const;

    // Routes one raw line. Returns false if the line was discarded as malformed.
    bool dispatch(const std::string & line);

private:
    void run();
    void push_backlog(json message);

    Process *    process_;
    Correlator * correlator_;
    size_t       backlog_capacity_;

    std::thread reader_thread_;

    mutable std::mutex backlog_mutex_;
    std::deque<json>   backlog_;
};

} // namespace toolwire
