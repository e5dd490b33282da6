#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace toolwire {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string & what) : std::runtime_error(what) {}
};

// The server executable could not be started.
class SpawnError : public Error {
public:
    explicit SpawnError(const std::string & what) : Error(what) {}
};

// The server's stdin is closed or broken.
class WriteError : public Error {
public:
    explicit WriteError(const std::string & what) : Error(what) {}
};

class TimeoutError : public Error {
public:
    explicit TimeoutError(int64_t id)
        : Error("Timeout waiting for response id=" + std::to_string(id)), id_(id) {}

    int64_t id() const { return id_; }

private:
    int64_t id_;
};

// The server answered a request with a JSON-RPC error object.
class ToolError : public Error {
public:
    ToolError(const std::string & tool, const json & payload)
        : Error("Tool '" + tool + "' failed: " + payload.dump()), tool_(tool), payload_(payload) {}

    const std::string & tool() const { return tool_; }
    const json & payload() const { return payload_; }

    int code() const {
        if (payload_.is_object() && payload_.contains("code") && payload_["code"].is_number_integer()) {
            return payload_["code"].get<int>();
        }
        return 0;
    }

private:
    std::string tool_;
    json        payload_;
};

class HandshakeError : public Error {
public:
    explicit HandshakeError(const std::string & what) : Error(what) {}
};

// The server's stdout ended, or the client was closed, before a response arrived.
class ConnectionClosed : public Error {
public:
    explicit ConnectionClosed(const std::string & what) : Error(what) {}
};

} // namespace toolwire
