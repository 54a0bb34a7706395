#pragma once

#include "ConnectionTester.hpp"
#include "Driver.hpp"
#include "MetadataService.hpp"
#include "QueryExecutor.hpp"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace odbcmcp {

using json = nlohmann::json;

// Options structs declared outside the class to avoid default argument issues
struct CSVOptions {
    char delimiter = ',';
    char quote = '"';
    std::string lineEnding = "\n";
    bool includeHeader = true;
    bool quoteAll = false;
};

struct JSONOptions {
    bool pretty = true;
    int indent = 2;
};

enum class ResultFormat {
    Markdown,
    CSV,
    JSON
};

// Throws std::invalid_argument for unknown names
ResultFormat parseResultFormat(const std::string& name);

// Renders service results as the text handed back to tool callers
class FormatConverter {
public:
    static constexpr const char* kNoResults =
        "Query executed successfully, but no results were returned.";

    // Query results
    static std::string toMarkdown(const QueryResult& result);
    static std::string toCSV(const QueryResult& result, const CSVOptions& options = CSVOptions{});
    static std::string toJSON(const QueryResult& result, const JSONOptions& options = JSONOptions{});
    static std::string format(const QueryResult& result, ResultFormat format);

    // Metadata
    static std::string tablesToMarkdown(const std::vector<TableDescriptor>& tables);
    static std::string schemaToMarkdown(const std::string& tableName,
                                        const std::vector<ColumnDescriptor>& columns);

    static json connectionsToJSON(const std::vector<std::string>& names,
                                  const std::optional<std::string>& defaultName);
    static json dataSourcesToJSON(const std::vector<DataSourceInfo>& sources);
    static json statusToJSON(const ConnectionStatus& status);

    // Cell helpers
    static std::string valueToString(const SqlValue& value, const std::string& nullText = "NULL");
    static json valueToJSON(const SqlValue& value);
    static std::string escapeCSVField(const std::string& field,
                                      const CSVOptions& options = CSVOptions{});
    static std::string escapeMarkdownCell(const std::string& cell);
};

}  // namespace odbcmcp
