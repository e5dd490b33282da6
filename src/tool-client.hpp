#pragma once

#include "error.hpp"

#include <chrono>
#include <string>

namespace toolwire {

// Tool invocation seam shared by the stdio client and the caching wrapper.
class ToolClient {
public:
    virtual ~ToolClient() = default;

    virtual json initialize() = 0;
    virtual json list_tools(std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) = 0;

    // A zero timeout selects the client's configured default.
    virtual json call_tool(const std::string & name, const json & arguments,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) = 0;

    virtual void close() = 0;
};

} // namespace toolwire
