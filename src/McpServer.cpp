#include "McpServer.hpp"
#include <spdlog/spdlog.h>
#include <istream>
#include <ostream>

namespace odbcmcp {

McpServer::McpServer(ToolDispatcher& dispatcher)
    : m_dispatcher(dispatcher) {
}

json McpServer::makeResult(const json& id, json result) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["result"] = std::move(result);
    return response;
}

json McpServer::makeError(const json& id, int code, const std::string& message) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"] = {
        {"code", code},
        {"message", message}
    };
    return response;
}

void McpServer::run(std::istream& in, std::ostream& out,
                    const volatile std::sig_atomic_t* stopFlag) {
    spdlog::info("MCP server ready on stdio");

    std::string line;
    while ((!stopFlag || *stopFlag == 0) && std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        auto response = handleLine(line);
        if (response) {
            out << *response << '\n';
            out.flush();
        }
    }

    spdlog::info("MCP server input closed");
}

std::optional<std::string> McpServer::handleLine(const std::string& line) {
    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error& e) {
        spdlog::warn("Unparsable message: {}", e.what());
        return makeError(nullptr, kParseError, "Parse error").dump();
    }

    auto response = handleMessage(message);
    if (!response) {
        return std::nullopt;
    }
    // Tool output may carry bytes that are not valid UTF-8
    return response->dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<json> McpServer::handleMessage(const json& message) {
    if (!message.is_object()) {
        return makeError(nullptr, kInvalidRequest, "Invalid Request");
    }

    const bool isNotification = !message.contains("id");
    const json id = isNotification ? json(nullptr) : message["id"];

    auto methodIt = message.find("method");
    if (methodIt == message.end() || !methodIt->is_string()) {
        if (isNotification) {
            spdlog::debug("Ignoring message without method");
            return std::nullopt;
        }
        return makeError(id, kInvalidRequest, "Invalid Request: missing method");
    }

    const std::string method = methodIt->get<std::string>();
    const json params = message.value("params", json::object());

    if (isNotification) {
        if (method == "notifications/initialized") {
            m_initialized = true;
        }
        spdlog::debug("Notification: {}", method);
        return std::nullopt;
    }

    spdlog::debug("Request {}: {}", id.dump(), method);

    try {
        if (method == "initialize") {
            return makeResult(id, handleInitialize(params));
        } else if (method == "ping") {
            return makeResult(id, json::object());
        } else if (method == "tools/list") {
            return makeResult(id, m_dispatcher.toolsList());
        } else if (method == "tools/call") {
            return makeResult(id, handleToolsCall(params));
        }
    } catch (const InvalidParams& e) {
        return makeError(id, kInvalidParams, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Internal error handling {}: {}", method, e.what());
        return makeError(id, kInternalError, std::string("Internal error: ") + e.what());
    } catch (...) {
        spdlog::error("Internal error handling {}: unknown exception", method);
        return makeError(id, kInternalError, "Internal error: unknown exception");
    }

    spdlog::warn("Unknown method: {}", method);
    return makeError(id, kMethodNotFound, "Method not found: " + method);
}

json McpServer::handleInitialize(const json& params) {
    if (params.is_object() && params.contains("clientInfo")) {
        spdlog::info("Client: {}", params["clientInfo"].value("name", "unknown"));
    }

    json response;
    response["protocolVersion"] = kProtocolVersion;
    response["serverInfo"] = {
        {"name", kServerName},
        {"version", kServerVersion}
    };
    response["capabilities"] = {
        {"tools", json::object()}
    };
    return response;
}

json McpServer::handleToolsCall(const json& params) {
    if (!params.is_object()) {
        throw InvalidParams("params must be an object");
    }

    auto nameIt = params.find("name");
    if (nameIt == params.end() || !nameIt->is_string() || nameIt->get<std::string>().empty()) {
        throw InvalidParams("Missing required parameter: name");
    }

    json args = params.value("arguments", json::object());
    if (args.is_null()) {
        args = json::object();
    }
    if (!args.is_object()) {
        throw InvalidParams("arguments must be an object");
    }

    ToolResult result = m_dispatcher.callTool(nameIt->get<std::string>(), args);

    json response;
    response["content"] = json::array({
        {{"type", "text"}, {"text", result.text}}
    });
    response["isError"] = result.isError;
    return response;
}

}  // namespace odbcmcp
