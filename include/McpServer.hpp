#pragma once

#include "ToolDispatcher.hpp"
#include <csignal>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace odbcmcp {

using json = nlohmann::json;

constexpr const char* kServerName = "odbc-mcp-server";
constexpr const char* kServerVersion = "1.0.0";
constexpr const char* kProtocolVersion = "2024-11-05";

// JSON-RPC 2.0 error codes
enum JsonRpcError {
    kParseError = -32700,
    kInvalidRequest = -32600,
    kMethodNotFound = -32601,
    kInvalidParams = -32602,
    kInternalError = -32603
};

// MCP server over newline-delimited JSON-RPC.
//
// Reads one message per line and writes one response per line. Requests are
// handled strictly in order; notifications get no response.
class McpServer {
public:
    explicit McpServer(ToolDispatcher& dispatcher);

    // Serve until end of input or until *stopFlag becomes non-zero
    void run(std::istream& in, std::ostream& out,
             const volatile std::sig_atomic_t* stopFlag = nullptr);

    // Handle one raw line; nullopt when nothing should be written back
    std::optional<std::string> handleLine(const std::string& line);

    // Handle one parsed message; nullopt for notifications
    std::optional<json> handleMessage(const json& message);

    static json makeResult(const json& id, json result);
    static json makeError(const json& id, int code, const std::string& message);

    bool initialized() const { return m_initialized; }

private:
    json handleInitialize(const json& params);
    json handleToolsCall(const json& params);

    ToolDispatcher& m_dispatcher;
    bool m_initialized = false;
};

// Thrown by method handlers for malformed params
class InvalidParams : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace odbcmcp
