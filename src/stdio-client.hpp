#pragma once

#include "correlator.hpp"
#include "frame-reader.hpp"
#include "params.hpp"
#include "process.hpp"
#include "tool-client.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace toolwire {

// Turns a tools/call result into a value: the parsed JSON of the concatenated
// text segments, the raw text if it does not parse, or the raw result object
// when there is no text at all.
json unwrap_tool_result(const json & result);

// JSON-RPC client for a tool server spawned as a child process and reached
// over its stdin/stdout. Any number of requests may be in flight; responses
// are matched by id.
class StdioClient : public ToolClient {
public:
    enum class State {
        Uninitialized,
        Initialized,
        Closed,
    };

    explicit StdioClient(const client_params & params = client_params());
    ~StdioClient() override;

    // Spawns the server from an already tokenized command and starts reading its output.
    void start_server(const std::vector<std::string> & command);
    bool is_server_running();

    // Core JSON-RPC communication
    json request(const std::string & method, const json & params = nullptr,
                 std::chrono::milliseconds timeout = std::chrono::milliseconds(0));
    void notify(const std::string & method, const json & params = nullptr);

    // MCP protocol methods
    json initialize() override;
    json list_tools(std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) override;
    json call_tool(const std::string & name, const json & arguments,
                   std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) override;
    void close() override;

    State state() const;
    json server_info() const;
    json server_capabilities() const;

    size_t pending_requests() const {
        return correlator_.pending();
    }
    size_t backlog_size() const {
        return reader_.backlog_size();
    }
    std::vector<json> backlog() const {
        return reader_.backlog();
    }

private:
    int64_t next_request_id();
    void ensure_open() const;
    std::chrono::milliseconds resolve_timeout(std::chrono::milliseconds timeout) const;

    client_params params_;
    Process       process_;
    Correlator    correlator_;
    FrameReader   reader_;

    std::atomic<int64_t> request_id_counter_;

    mutable std::mutex state_mutex_;
    State              state_;
    json               server_info_;
    json               server_capabilities_;

    std::mutex close_mutex_;
    bool       closed_;
};

} // namespace toolwire
