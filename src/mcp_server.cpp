#include "mcp_server.hpp"
#include "dispatcher.hpp"
#include "util.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <ostream>

namespace fsgate {

nlohmann::json make_error_response(const nlohmann::json& id, int code,
                                   const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

std::string dump_message(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

McpServer::McpServer(const ToolDispatcher& dispatcher, ServerConfig server)
    : dispatcher_(dispatcher), server_(std::move(server)) {}

// ── Request handling ─────────────────────────────────────────────

nlohmann::json McpServer::handle_initialize(const nlohmann::json& params) const {
    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        const auto& client = params["clientInfo"];
        std::string name = "unknown";
        std::string version;
        if (client.contains("name") && client["name"].is_string())
            name = client["name"].get<std::string>();
        if (client.contains("version") && client["version"].is_string())
            version = client["version"].get<std::string>();
        std::cerr << "[server] Client: " << name << " " << version << "\n";
    }
    if (params.is_object() && params.contains("protocolVersion") &&
        params["protocolVersion"].is_string() &&
        params["protocolVersion"].get<std::string>() != server_.protocol_version) {
        std::cerr << "[server] Client requested protocol "
                  << params["protocolVersion"].get<std::string>()
                  << ", answering with " << server_.protocol_version << "\n";
    }

    return {
        {"protocolVersion", server_.protocol_version},
        {"capabilities", {{"tools", nlohmann::json::object()}}},
        {"serverInfo", {{"name", server_.name}, {"version", kServerVersion}}}
    };
}

nlohmann::json McpServer::handle_tools_list() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& spec : dispatcher_.specs()) {
        tools.push_back({
            {"name", spec.name},
            {"description", spec.description},
            {"inputSchema", nlohmann::json::parse(spec.parameters_json)}
        });
    }
    return {{"tools", tools}};
}

nlohmann::json McpServer::handle_tools_call(const nlohmann::json& params) const {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        throw RpcError(kInvalidParams, "tools/call requires a string 'name'");
    }
    std::string name = params["name"].get<std::string>();
    nlohmann::json arguments = params.contains("arguments") ? params["arguments"]
                                                            : nlohmann::json();
    return format_tool_result(dispatcher_.dispatch(name, arguments));
}

nlohmann::json McpServer::handle_request(const nlohmann::json& request,
                                         bool& should_respond) const {
    should_respond = true;
    if (!request.is_object()) {
        return make_error_response(nullptr, kInvalidRequest, "Invalid Request");
    }

    bool is_notification = !request.contains("id");
    nlohmann::json id = is_notification ? nlohmann::json() : request["id"];

    if (!request.contains("method") || !request["method"].is_string()) {
        return make_error_response(id, kInvalidRequest, "Invalid Request: missing method");
    }
    std::string method = request["method"].get<std::string>();

    if (is_notification) {
        std::cerr << "[server] Notification: " << method << "\n";
        should_respond = false;
        return {};
    }
    std::cerr << "[server] Request: " << method << "\n";

    nlohmann::json params = request.contains("params") ? request["params"]
                                                       : nlohmann::json::object();
    try {
        nlohmann::json result;
        if (method == "initialize") {
            result = handle_initialize(params);
        } else if (method == "tools/list") {
            result = handle_tools_list();
        } else if (method == "tools/call") {
            result = handle_tools_call(params);
        } else if (method == "ping") {
            result = nlohmann::json::object();
        } else {
            throw RpcError(kMethodNotFound, "Method not found: " + method);
        }
        return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
    } catch (const RpcError& e) {
        std::cerr << "[server] " << method << " failed: " << e.what() << "\n";
        return make_error_response(id, e.code(), e.what());
    } catch (const std::exception& e) {
        std::cerr << "[server] " << method << " internal error: " << e.what() << "\n";
        return make_error_response(id, kInternalError, std::string("Internal error: ") + e.what());
    }
}

std::optional<std::string> McpServer::handle_line(const std::string& line) const {
    if (trim(line).empty()) return std::nullopt;

    nlohmann::json request;
    try {
        request = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[server] Parse error: " << e.what() << "\n";
        return dump_message(make_error_response(nullptr, kParseError,
                                                std::string("Parse error: ") + e.what()));
    }

    bool should_respond = true;
    nlohmann::json response = handle_request(request, should_respond);
    if (!should_respond) return std::nullopt;
    return dump_message(response);
}

// ── Transport loop ───────────────────────────────────────────────

static bool write_response(std::ostream& out, const std::optional<std::string>& response) {
    if (!response) return true;
    out << *response << '\n';
    out.flush();
    return static_cast<bool>(out);
}

int McpServer::serve(int in_fd, std::ostream& out, const std::atomic<bool>& stop) const {
    std::string buffer;
    char chunk[4096];

    while (!stop.load()) {
        struct pollfd pfd = {in_fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, kPollIntervalMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[server] poll failed: " << std::strerror(errno) << "\n";
            return 1;
        }
        if (rc == 0) continue;

        ssize_t n = ::read(in_fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            std::cerr << "[server] read failed: " << std::strerror(errno) << "\n";
            return 1;
        }
        if (n == 0) {
            // A final request without a trailing newline is still served.
            if (!write_response(out, handle_line(buffer))) {
                std::cerr << "[server] Failed to write response\n";
                return 1;
            }
            std::cerr << "[server] Input closed\n";
            return 0;
        }

        buffer.append(chunk, static_cast<size_t>(n));
        size_t pos;
        while ((pos = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();

            if (!write_response(out, handle_line(line))) {
                std::cerr << "[server] Failed to write response\n";
                return 1;
            }
        }
    }

    std::cerr << "[server] Shutdown requested, closing transport\n";
    out.flush();
    return 0;
}

} // namespace fsgate
