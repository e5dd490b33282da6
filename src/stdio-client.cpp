#include "stdio-client.hpp"

#include "log.hpp"

#include <algorithm>
#include <chrono>

namespace toolwire {

json unwrap_tool_result(const json & result) {
    std::string text;

    if (result.is_object()) {
        const auto content = result.find("content");
        if (content != result.end() && content->is_array()) {
            for (const auto & item : *content) {
                if (!item.is_object() || !item.contains("type") || item["type"] != "text") {
                    continue;
                }
                const auto segment = item.find("text");
                if (segment != item.end() && segment->is_string()) {
                    text += segment->get<std::string>();
                }
            }
        }
    }

    if (text.empty()) {
        return result.is_null() ? json::object() : result;
    }

    json parsed = json::parse(text, nullptr, /* allow_exceptions = */ false);
    if (parsed.is_discarded()) {
        return text;
    }
    return parsed;
}

StdioClient::StdioClient(const client_params & params)
    : params_(params)
    , reader_(&process_, &correlator_, params.backlog_capacity)
    , request_id_counter_(0)
    , state_(State::Uninitialized)
    , server_info_(json::object())
    , server_capabilities_(json::object())
    , closed_(false) {
}

StdioClient::~StdioClient() {
    close();
}

void StdioClient::start_server(const std::vector<std::string> & command) {
    ensure_open();

    process_.spawn(command);
    reader_.start();
}

bool StdioClient::is_server_running() {
    return process_.is_running();
}

int64_t StdioClient::next_request_id() {
    return ++request_id_counter_;
}

void StdioClient::ensure_open() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == State::Closed) {
        throw ConnectionClosed("Client is closed");
    }
}

std::chrono::milliseconds StdioClient::resolve_timeout(std::chrono::milliseconds timeout) const {
    return timeout.count() > 0 ? timeout : std::chrono::milliseconds(params_.timeout_ms);
}

json StdioClient::request(const std::string & method, const json & params, std::chrono::milliseconds timeout) {
    ensure_open();

    const int64_t id = next_request_id();

    json payload = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method}
    };
    if (!params.is_null()) {
        payload["params"] = params;
    }

    // one deadline covers both sending the request and waiting for its response
    const auto deadline = std::chrono::steady_clock::now() + resolve_timeout(timeout);

    // register before writing, the response may arrive before write_line returns
    Correlator::waiter waiter = correlator_.register_request(id);
    bool sent = false;
    try {
        sent = process_.write_line(payload.dump(), deadline);
    } catch (const WriteError &) {
        correlator_.cancel(id);
        if (state() == State::Closed) {
            throw ConnectionClosed("Client closed");
        }
        throw;
    }
    if (!sent) {
        correlator_.cancel(id);
        TOOLWIRE_LOG_ERROR("%s: timed out sending '%s' (id=%lld)\n", __func__, method.c_str(), (long long) id);
        throw TimeoutError(id);
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return correlator_.await(waiter, std::max(remaining, std::chrono::milliseconds(0)));
}

void StdioClient::notify(const std::string & method, const json & params) {
    ensure_open();

    json notification = {
        {"jsonrpc", "2.0"},
        {"method", method}
    };
    if (!params.is_null()) {
        notification["params"] = params;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(params_.timeout_ms);
    if (!process_.write_line(notification.dump(), deadline)) {
        throw WriteError("Timed out sending notification '" + method + "'");
    }
}

json StdioClient::initialize() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == State::Initialized) {
            throw HandshakeError("Client is already initialized");
        }
    }

    json params = {
        {"protocolVersion", params_.protocol_version},
        {"capabilities", json::object()},
        {"clientInfo", {
            {"name", params_.client_name},
            {"version", params_.client_version}
        }}
    };

    json response;
    try {
        response = request("initialize", params);
    } catch (const TimeoutError & e) {
        throw HandshakeError(std::string("initialize: ") + e.what());
    } catch (const ConnectionClosed & e) {
        throw HandshakeError(std::string("initialize: ") + e.what());
    }

    const auto error = response.find("error");
    if (error != response.end() && !error->is_null()) {
        TOOLWIRE_LOG_ERROR("%s: server rejected initialize: %s\n", __func__, error->dump().c_str());
        throw HandshakeError("initialize rejected: " + error->dump());
    }

    notify("notifications/initialized", json::object());

    json result = response.value("result", json::object());
    if (!result.is_object()) {
        result = json::object();
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        server_info_         = result.value("serverInfo", json::object());
        server_capabilities_ = result.value("capabilities", json::object());
        if (state_ != State::Closed) {
            state_ = State::Initialized;
        }
    }

    TOOLWIRE_LOG_INFO("%s: connected to server %s\n", __func__, server_info().dump().c_str());

    return result;
}

json StdioClient::list_tools(std::chrono::milliseconds timeout) {
    json response = request("tools/list", nullptr, timeout);

    const auto error = response.find("error");
    if (error != response.end() && !error->is_null()) {
        throw ToolError("tools/list", *error);
    }

    const json result = response.value("result", json::object());
    if (result.is_object() && result.contains("tools") && result["tools"].is_array()) {
        return result["tools"];
    }
    return json::array();
}

json StdioClient::call_tool(const std::string & name, const json & arguments, std::chrono::milliseconds timeout) {
    TOOLWIRE_LOG_DEBUG("%s: calling tool '%s'\n", __func__, name.c_str());

    json response = request("tools/call", {
        {"name", name},
        {"arguments", arguments}
    }, timeout);

    const auto error = response.find("error");
    if (error != response.end() && !error->is_null()) {
        TOOLWIRE_LOG_ERROR("%s: tool '%s' failed: %s\n", __func__, name.c_str(), error->dump().c_str());
        throw ToolError(name, *error);
    }

    return unwrap_tool_result(response.value("result", json::object()));
}

void StdioClient::close() {
    std::lock_guard<std::mutex> close_lock(close_mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = State::Closed;
    }

    process_.close(std::chrono::milliseconds(params_.grace_ms));
    reader_.join();
    correlator_.fail_all("Client closed");
}

StdioClient::State StdioClient::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

json StdioClient::server_info() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_info_;
}

json StdioClient::server_capabilities() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_capabilities_;
}

} // namespace toolwire
