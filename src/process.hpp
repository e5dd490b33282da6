#pragma once

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace toolwire {

// Owns a spawned server process and its three standard streams.
//
// stdin is written by any number of threads, one full line at a time.
// stdout has exactly one reader (see FrameReader). stderr is drained by an
// internal thread into the debug log.
class Process {
private:
    pid_t pid_;
    int   stdin_fd_; // non-blocking
    FILE* server_stdout_;
    FILE* server_stderr_;
    bool  running_;

    std::atomic<bool> closing_;

    std::mutex  write_mutex_;
    std::mutex  state_mutex_;
    std::thread stderr_thread_;

    bool try_reap();
    void signal_group(int sig);
    void drain_stderr();
    void cleanup();

public:
    Process();
    ~Process();

    Process(const Process &) = delete;
    Process & operator=(const Process &) = delete;

    // Throws SpawnError if the pipes cannot be created or the executable cannot be started.
    void spawn(const std::vector<std::string> & argv);

    // Appends '\n' and writes the line atomically. Returns false if the pipe stayed full until
    // `deadline`. Throws WriteError if stdin is closed or broken, or once close() has begun.
    bool write_line(const std::string & text,
                    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max());

    // Blocks until a full line is available. Returns false at end of stream.
    bool read_line(std::string & line);

    // Closes stdin, sends SIGTERM, waits up to `grace` and then sends SIGKILL. Safe to call repeatedly.
    void close(std::chrono::milliseconds grace);

    bool is_running();

    pid_t pid() const {
        return pid_;
    }
};

} // namespace toolwire
