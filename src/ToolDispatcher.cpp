#include "ToolDispatcher.hpp"
#include "ErrorHandler.hpp"
#include "FormatConverter.hpp"
#include <spdlog/spdlog.h>

namespace odbcmcp {

namespace {

const json kConnectionNameProperty = {
    {"type", "string"},
    {"description", "Name of the connection to use (optional, uses default if not specified)"}
};

json objectSchema(json properties, std::vector<std::string> required) {
    return {
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", std::move(required)}
    };
}

}  // namespace

ToolDispatcher::ToolDispatcher(ConnectionManager& connections,
                               MetadataService& metadata,
                               QueryExecutor& executor,
                               ConnectionTester& tester)
    : m_connections(connections)
    , m_metadata(metadata)
    , m_executor(executor)
    , m_tester(tester) {
    registerTools();
}

void ToolDispatcher::registerTools() {
    m_tools.push_back({
        "list-connections",
        "List all configured database connections",
        objectSchema(json::object(), {}),
        [this](const json& args) { return listConnections(args); }
    });

    m_tools.push_back({
        "list-available-dsns",
        "List all available DSNs on the system",
        objectSchema(json::object(), {}),
        [this](const json& args) { return listAvailableDsns(args); }
    });

    m_tools.push_back({
        "test-connection",
        "Test a database connection and return information",
        objectSchema({{"connection_name", {
            {"type", "string"},
            {"description", "Name of the connection to test (optional, uses default if not specified)"}
        }}}, {}),
        [this](const json& args) { return testConnection(args); }
    });

    m_tools.push_back({
        "list-tables",
        "List all tables in the database",
        objectSchema({{"connection_name", kConnectionNameProperty}}, {}),
        [this](const json& args) { return listTables(args); }
    });

    m_tools.push_back({
        "get-table-schema",
        "Get schema information for a table",
        objectSchema({
            {"table_name", {
                {"type", "string"},
                {"description", "Name of the table to describe, optionally schema-qualified (required)"}
            }},
            {"connection_name", kConnectionNameProperty}
        }, {"table_name"}),
        [this](const json& args) { return getTableSchema(args); }
    });

    m_tools.push_back({
        "execute-query",
        "Execute an SQL query and return results",
        objectSchema({
            {"sql", {
                {"type", "string"},
                {"description", "SQL query to execute (required)"}
            }},
            {"connection_name", kConnectionNameProperty},
            {"max_rows", {
                {"type", "integer"},
                {"minimum", 1},
                {"description", "Maximum number of rows to return (optional, uses default if not specified)"}
            }},
            {"format", {
                {"type", "string"},
                {"enum", {"markdown", "csv", "json"}},
                {"description", "Result rendering (optional, markdown by default)"}
            }}
        }, {"sql"}),
        [this](const json& args) { return executeQuery(args); }
    });
}

json ToolDispatcher::toolsList() const {
    json list = json::array();
    for (const auto& tool : m_tools) {
        list.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.inputSchema}
        });
    }
    return {{"tools", std::move(list)}};
}

const ToolDefinition* ToolDispatcher::findTool(const std::string& name) const {
    for (const auto& tool : m_tools) {
        if (tool.name == name) {
            return &tool;
        }
    }
    return nullptr;
}

ToolResult ToolDispatcher::callTool(const std::string& name, const json& args) {
    ErrorContext ctx(name);
    spdlog::debug("Tool call: {} {}", name, args.dump(-1, ' ', false, json::error_handler_t::replace));

    ToolResult result;
    try {
        const ToolDefinition* tool = findTool(name);
        if (!tool) {
            std::string available;
            for (const auto& t : m_tools) {
                if (!available.empty()) available += ", ";
                available += t.name;
            }
            throw GatewayError(ErrorKind::UnknownTool,
                               "Unknown tool: " + name + ". Available tools: " + available);
        }

        if (!args.is_null() && !args.is_object()) {
            throw GatewayError(ErrorKind::InvalidArgument, "Tool arguments must be an object");
        }

        result.text = tool->handler(args.is_null() ? json::object() : args);
    } catch (const GatewayError& e) {
        spdlog::error("[{}] {}: {}", ErrorContext::current(), errorKindName(e.kind()), e.what());
        result.text = "Error executing " + name + ": " + e.what();
        result.isError = true;
    } catch (const std::exception& e) {
        spdlog::error("[{}] {}", ErrorContext::current(), e.what());
        result.text = "Error executing " + name + ": " + e.what();
        result.isError = true;
    } catch (...) {
        spdlog::error("[{}] Unknown exception", ErrorContext::current());
        result.text = "Error executing " + name + ": Unknown error";
        result.isError = true;
    }

    return result;
}

// ============================================================================
// Argument helpers
// ============================================================================

std::optional<std::string> ToolDispatcher::optionalString(const json& args, const std::string& key) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw GatewayError(ErrorKind::InvalidArgument, "Argument '" + key + "' must be a string");
    }
    std::string value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::string ToolDispatcher::requiredString(const json& args, const std::string& key) {
    auto value = optionalString(args, key);
    if (!value) {
        throw GatewayError(ErrorKind::InvalidArgument, "Missing required argument: " + key);
    }
    return *value;
}

std::optional<size_t> ToolDispatcher::optionalCount(const json& args, const std::string& key) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) {
        return std::nullopt;
    }

    int64_t value = 0;
    if (it->is_number_integer()) {
        value = it->get<int64_t>();
    } else if (it->is_string()) {
        // Some clients send every argument as a string
        try {
            size_t consumed = 0;
            const std::string text = it->get<std::string>();
            value = std::stoll(text, &consumed);
            if (consumed != text.size()) {
                throw std::invalid_argument(text);
            }
        } catch (const std::exception&) {
            throw GatewayError(ErrorKind::InvalidArgument, "Argument '" + key + "' must be an integer");
        }
    } else {
        throw GatewayError(ErrorKind::InvalidArgument, "Argument '" + key + "' must be an integer");
    }

    if (value <= 0) {
        throw GatewayError(ErrorKind::InvalidArgument, "Argument '" + key + "' must be positive");
    }
    return static_cast<size_t>(value);
}

// ============================================================================
// Tools
// ============================================================================

std::string ToolDispatcher::listConnections(const json&) {
    const Config& config = m_connections.config();
    return FormatConverter::connectionsToJSON(config.profileNames(), config.default_connection).dump(2);
}

std::string ToolDispatcher::listAvailableDsns(const json&) {
    return FormatConverter::dataSourcesToJSON(m_connections.driver().dataSources())
        .dump(2, ' ', false, json::error_handler_t::replace);
}

std::string ToolDispatcher::testConnection(const json& args) {
    ConnectionStatus status = m_tester.test(optionalString(args, "connection_name"));
    return FormatConverter::statusToJSON(status).dump(2, ' ', false, json::error_handler_t::replace);
}

std::string ToolDispatcher::listTables(const json& args) {
    auto profile = optionalString(args, "connection_name");
    ErrorContext ctx(m_connections.resolveName(profile));
    return FormatConverter::tablesToMarkdown(m_metadata.listTables(profile));
}

std::string ToolDispatcher::getTableSchema(const json& args) {
    std::string table = requiredString(args, "table_name");
    auto profile = optionalString(args, "connection_name");
    ErrorContext ctx(m_connections.resolveName(profile));
    return FormatConverter::schemaToMarkdown(table, m_metadata.getTableSchema(table, profile));
}

std::string ToolDispatcher::executeQuery(const json& args) {
    std::string sql = requiredString(args, "sql");
    auto profile = optionalString(args, "connection_name");
    auto maxRows = optionalCount(args, "max_rows");

    ResultFormat format = ResultFormat::Markdown;
    if (auto name = optionalString(args, "format")) {
        try {
            format = parseResultFormat(*name);
        } catch (const std::invalid_argument& e) {
            throw GatewayError(ErrorKind::InvalidArgument, e.what());
        }
    }

    ErrorContext ctx(m_connections.resolveName(profile));
    return FormatConverter::format(m_executor.execute(sql, profile, maxRows), format);
}

}  // namespace odbcmcp
