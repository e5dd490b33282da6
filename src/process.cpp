#include "process.hpp"

#include "error.hpp"
#include "log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace toolwire {

namespace {

std::once_flag g_sigpipe_once;

void close_pipe(int fds[2]) {
    if (fds[0] != -1) { ::close(fds[0]); fds[0] = -1; }
    if (fds[1] != -1) { ::close(fds[1]); fds[1] = -1; }
}

bool make_pipe(int fds[2]) {
    if (pipe(fds) == -1) {
        fds[0] = fds[1] = -1;
        return false;
    }
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

void strip_newline(std::string & line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
}

} // namespace

Process::Process()
    : pid_(-1), stdin_fd_(-1), server_stdout_(nullptr), server_stderr_(nullptr), running_(false), closing_(false) {
}

Process::~Process() {
    close(std::chrono::milliseconds(100));
    cleanup();
}

void Process::cleanup() {
    if (stdin_fd_ != -1) {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
    }
    if (server_stdout_) {
        fclose(server_stdout_);
        server_stdout_ = nullptr;
    }
    if (server_stderr_) {
        fclose(server_stderr_);
        server_stderr_ = nullptr;
    }
}

void Process::spawn(const std::vector<std::string> & argv) {
    if (argv.empty() || argv[0].empty()) {
        throw SpawnError("Empty server command");
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (running_ || server_stdout_) {
            throw SpawnError("Server process already started");
        }
    }

    // A dead server must surface as EPIPE from write_line, not kill the client.
    std::call_once(g_sigpipe_once, [] { signal(SIGPIPE, SIG_IGN); });

    int stdin_pipe[2]  = { -1, -1 };
    int stdout_pipe[2] = { -1, -1 };
    int stderr_pipe[2] = { -1, -1 };
    int status_pipe[2] = { -1, -1 }; // reports exec failure, closed by a successful exec

    if (!make_pipe(stdin_pipe) || !make_pipe(stdout_pipe) || !make_pipe(stderr_pipe) || !make_pipe(status_pipe)) {
        const int err = errno;
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(status_pipe);
        throw SpawnError(std::string("Failed to create pipes: ") + strerror(err));
    }

    // Prepare arguments for execvp before forking, the child must not allocate
    std::vector<char*> args;
    for (const auto & arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    const pid_t pid = fork();
    if (pid == -1) {
        const int err = errno;
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(status_pipe);
        throw SpawnError(std::string("fork() failed: ") + strerror(err));
    }

    if (pid == 0) {
        // Child process - become the server
        setpgid(0, 0);

        struct sigaction dfl;
        memset(&dfl, 0, sizeof(dfl));
        dfl.sa_handler = SIG_DFL;
        sigemptyset(&dfl.sa_mask);
        sigaction(SIGPIPE, &dfl, nullptr);

        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        execvp(args[0], args.data());

        int err = errno;
        ssize_t n = write(status_pipe[1], &err, sizeof(err));
        (void) n;
        _exit(127);
    }

    // Parent process - set up communication
    setpgid(pid, pid);

    ::close(stdin_pipe[0]);
    ::close(stdout_pipe[1]);
    ::close(stderr_pipe[1]);
    ::close(status_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n == (ssize_t) sizeof(exec_errno)) {
        int status;
        waitpid(pid, &status, 0);
        ::close(stdin_pipe[1]);
        ::close(stdout_pipe[0]);
        ::close(stderr_pipe[0]);
        throw SpawnError("Failed to start '" + argv[0] + "': " + strerror(exec_errno));
    }

    std::lock_guard<std::mutex> lock(state_mutex_);

    pid_ = pid;
    running_ = true;

    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        stdin_fd_ = stdin_pipe[1];
    }
    // a full pipe must never block a writer past its deadline or past close()
    fcntl(stdin_pipe[1], F_SETFL, fcntl(stdin_pipe[1], F_GETFL) | O_NONBLOCK);

    server_stdout_ = fdopen(stdout_pipe[0], "r");
    server_stderr_ = fdopen(stderr_pipe[0], "r");

    if (!server_stdout_ || !server_stderr_) {
        if (!server_stdout_) ::close(stdout_pipe[0]);
        if (!server_stderr_) ::close(stderr_pipe[0]);
        signal_group(SIGKILL);
        int status;
        waitpid(pid_, &status, 0);
        running_ = false;
        cleanup();
        throw SpawnError("fdopen() failed for server pipes");
    }

    stderr_thread_ = std::thread(&Process::drain_stderr, this);

    TOOLWIRE_LOG_DEBUG("%s: started '%s' (pid %d)\n", __func__, argv[0].c_str(), (int) pid_);
}

bool Process::write_line(const std::string & text, std::chrono::steady_clock::time_point deadline) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (stdin_fd_ == -1 || closing_) {
        throw WriteError("Server stdin is closed");
    }

    const std::string frame = text + "\n";
    size_t offset = 0;

    while (offset < frame.size()) {
        const ssize_t n = ::write(stdin_fd_, frame.data() + offset, frame.size() - offset);
        if (n > 0) {
            offset += (size_t) n;
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        if (n == -1 && errno != EAGAIN && errno != EWOULDBLOCK) {
            const int err = errno;
            throw WriteError(std::string("Failed to send request to server: ") + strerror(err));
        }

        // pipe is full, wait in short slices so close() can take over
        if (closing_) {
            throw WriteError("Server stdin is closed");
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            if (offset > 0) {
                // the rest of a half-written frame can never be sent, the stream is unusable
                TOOLWIRE_LOG_WARN("%s: server stopped reading mid-message (%zu of %zu bytes), closing its stdin\n",
                        __func__, offset, frame.size());
                ::close(stdin_fd_);
                stdin_fd_ = -1;
            }
            return false;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const int slice = (int) std::max<int64_t>(1, std::min<int64_t>(remaining.count(), 50));

        struct pollfd pfd;
        pfd.fd      = stdin_fd_;
        pfd.events  = POLLOUT;
        pfd.revents = 0;
        if (poll(&pfd, 1, slice) == -1 && errno != EINTR) {
            const int err = errno;
            throw WriteError(std::string("poll() failed on server stdin: ") + strerror(err));
        }
    }

    return true;
}

bool Process::read_line(std::string & line) {
    if (!server_stdout_) {
        return false;
    }

    char * buffer = nullptr;
    size_t capacity = 0;

    const ssize_t n = getline(&buffer, &capacity, server_stdout_);
    if (n < 0) {
        free(buffer);
        return false;
    }

    line.assign(buffer, (size_t) n);
    free(buffer);

    strip_newline(line);
    return true;
}

void Process::drain_stderr() {
    char * buffer = nullptr;
    size_t capacity = 0;

    while (getline(&buffer, &capacity, server_stderr_) > 0) {
        std::string line(buffer);
        strip_newline(line);
        TOOLWIRE_LOG_DEBUG("%s: server: %s\n", __func__, line.c_str());
    }

    free(buffer);
}

// Caller holds state_mutex_.
bool Process::try_reap() {
    if (!running_) {
        return true;
    }

    int status;
    const pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == pid_ || (r == -1 && errno == ECHILD)) {
        running_ = false;
        return true;
    }
    return false;
}

// The server runs in its own process group so helpers it forks are signalled too.
void Process::signal_group(int sig) {
    if (kill(-pid_, sig) == -1) {
        kill(pid_, sig);
    }
}

void Process::close(std::chrono::milliseconds grace) {
    // a writer stuck on a full pipe notices this within one poll slice and lets go of write_mutex_
    closing_ = true;

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (stdin_fd_ != -1) {
            ::close(stdin_fd_);
            stdin_fd_ = -1;
        }
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!try_reap()) {
            signal_group(SIGTERM);
        }
    }

    const auto deadline = std::chrono::steady_clock::now() + grace;
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (try_reap()) {
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                signal_group(SIGKILL);
                int status;
                waitpid(pid_, &status, 0);
                running_ = false;
                TOOLWIRE_LOG_WARN("%s: forcefully killed server (pid %d)\n", __func__, (int) pid_);
                break;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }
}

bool Process::is_running() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return !try_reap();
}

} // namespace toolwire
