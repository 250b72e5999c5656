#pragma once
#include "config.hpp"
#include <atomic>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace fsgate {

class ToolDispatcher;

// JSON-RPC 2.0 error codes
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

// Thrown by request handlers; turned into a JSON-RPC error response.
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message)
        : std::runtime_error(message), code_(code) {}
    int code() const { return code_; }

private:
    int code_;
};

// Model Context Protocol server over newline-delimited JSON on stdio.
// Handles one request at a time; tool failures are results, not errors.
class McpServer {
public:
    McpServer(const ToolDispatcher& dispatcher, ServerConfig server);

    // Handle one input line. Returns the serialized response, or nullopt
    // for notifications and blank lines.
    std::optional<std::string> handle_line(const std::string& line) const;

    nlohmann::json handle_request(const nlohmann::json& request, bool& should_respond) const;

    // Read requests from in_fd and write responses to out until EOF or
    // until `stop` is set. Returns 0 on a clean end, 1 if a response
    // could not be written or the input failed.
    int serve(int in_fd, std::ostream& out, const std::atomic<bool>& stop) const;

private:
    static constexpr int kPollIntervalMs = 200;

    nlohmann::json handle_initialize(const nlohmann::json& params) const;
    nlohmann::json handle_tools_list() const;
    nlohmann::json handle_tools_call(const nlohmann::json& params) const;

    const ToolDispatcher& dispatcher_;
    ServerConfig server_;
};

nlohmann::json make_error_response(const nlohmann::json& id, int code,
                                   const std::string& message);

// Serialize for the wire; invalid UTF-8 is replaced rather than thrown on.
std::string dump_message(const nlohmann::json& j);

} // namespace fsgate
