#pragma once

#include "ConnectionManager.hpp"
#include "ConnectionTester.hpp"
#include "MetadataService.hpp"
#include "QueryExecutor.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace odbcmcp {

using json = nlohmann::json;

struct ToolResult {
    std::string text;
    bool isError = false;
};

struct ToolDefinition {
    std::string name;
    std::string description;
    json inputSchema;
    std::function<std::string(const json&)> handler;
};

// Maps tool invocations onto the gateway services.
//
// callTool never throws: every failure, including unknown tools and bad
// arguments, comes back as a ToolResult with isError set.
class ToolDispatcher {
public:
    ToolDispatcher(ConnectionManager& connections,
                   MetadataService& metadata,
                   QueryExecutor& executor,
                   ConnectionTester& tester);

    // Handlers capture this
    ToolDispatcher(const ToolDispatcher&) = delete;
    ToolDispatcher& operator=(const ToolDispatcher&) = delete;

    const std::vector<ToolDefinition>& tools() const { return m_tools; }

    // {"tools": [{name, description, inputSchema}, ...]}
    json toolsList() const;

    ToolResult callTool(const std::string& name, const json& args);

    // Argument helpers; throw GatewayError(InvalidArgument)
    static std::optional<std::string> optionalString(const json& args, const std::string& key);
    static std::string requiredString(const json& args, const std::string& key);
    static std::optional<size_t> optionalCount(const json& args, const std::string& key);

private:
    void registerTools();
    const ToolDefinition* findTool(const std::string& name) const;

    std::string listConnections(const json& args);
    std::string listAvailableDsns(const json& args);
    std::string testConnection(const json& args);
    std::string listTables(const json& args);
    std::string getTableSchema(const json& args);
    std::string executeQuery(const json& args);

    ConnectionManager& m_connections;
    MetadataService& m_metadata;
    QueryExecutor& m_executor;
    ConnectionTester& m_tester;
    std::vector<ToolDefinition> m_tools;
};

}  // namespace odbcmcp
