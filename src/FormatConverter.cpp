#include "FormatConverter.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace odbcmcp {

namespace {

std::string dumpJSON(const json& value, const JSONOptions& options) {
    // Driver text is not guaranteed to be valid UTF-8
    return value.dump(options.pretty ? options.indent : -1, ' ', false,
                      json::error_handler_t::replace);
}

}  // namespace

ResultFormat parseResultFormat(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.empty() || lower == "markdown" || lower == "md") {
        return ResultFormat::Markdown;
    } else if (lower == "csv") {
        return ResultFormat::CSV;
    } else if (lower == "json") {
        return ResultFormat::JSON;
    }

    throw std::invalid_argument("Unknown result format: " + name);
}

std::string FormatConverter::toMarkdown(const QueryResult& result) {
    if (result.columns.empty()) {
        return kNoResults;
    }

    std::ostringstream out;
    out << "### Query Results:\n\n";

    // Header
    out << "|";
    for (const auto& column : result.columns) {
        out << " " << escapeMarkdownCell(column) << " |";
    }
    out << "\n|";
    for (size_t i = 0; i < result.columns.size(); ++i) {
        out << " --- |";
    }
    out << "\n";

    // Rows
    for (const auto& row : result.rows) {
        out << "|";
        for (const auto& value : row) {
            out << " " << escapeMarkdownCell(valueToString(value)) << " |";
        }
        out << "\n";
    }

    out << "\n\n_Returned " << result.rows.size() << " rows_";
    if (result.rowLimit > 0 && result.rows.size() >= result.rowLimit) {
        out << " _(limited to " << result.rowLimit << " rows)_";
    }

    return out.str();
}

std::string FormatConverter::toCSV(const QueryResult& result, const CSVOptions& options) {
    if (result.columns.empty()) {
        return kNoResults;
    }

    std::ostringstream out;

    // Header
    if (options.includeHeader) {
        for (size_t i = 0; i < result.columns.size(); ++i) {
            if (i > 0) out << options.delimiter;
            out << escapeCSVField(result.columns[i], options);
        }
        out << options.lineEnding;
    }

    // Rows; NULL is an empty field
    for (const auto& row : result.rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) out << options.delimiter;

            if (!std::holds_alternative<std::monostate>(row[i])) {
                out << escapeCSVField(valueToString(row[i]), options);
            }
        }
        out << options.lineEnding;
    }

    return out.str();
}

std::string FormatConverter::toJSON(const QueryResult& result, const JSONOptions& options) {
    if (result.columns.empty()) {
        return kNoResults;
    }

    json rows = json::array();
    for (const auto& row : result.rows) {
        json values = json::array();
        for (const auto& value : row) {
            values.push_back(valueToJSON(value));
        }
        rows.push_back(std::move(values));
    }

    json wrapper = json::object();
    wrapper["columns"] = result.columns;
    wrapper["rows"] = std::move(rows);
    return dumpJSON(wrapper, options);
}

std::string FormatConverter::format(const QueryResult& result, ResultFormat format) {
    switch (format) {
        case ResultFormat::CSV:
            return toCSV(result);
        case ResultFormat::JSON:
            return toJSON(result);
        case ResultFormat::Markdown:
        default:
            return toMarkdown(result);
    }
}

std::string FormatConverter::tablesToMarkdown(const std::vector<TableDescriptor>& tables) {
    std::ostringstream out;
    out << "### Tables:\n\n";
    for (const auto& table : tables) {
        out << "- ";
        if (!table.schema.empty()) {
            out << table.schema << ".";
        }
        out << table.name << "\n";
    }
    return out.str();
}

std::string FormatConverter::schemaToMarkdown(const std::string& tableName,
                                              const std::vector<ColumnDescriptor>& columns) {
    std::ostringstream out;
    out << "### Schema for table " << tableName << ":\n\n";
    out << "| Column | Type | Size | Nullable |\n";
    out << "| ------ | ---- | ---- | -------- |\n";
    for (const auto& col : columns) {
        out << "| " << escapeMarkdownCell(col.name) << " | " << escapeMarkdownCell(col.type)
            << " | " << col.size << " | " << (col.nullable ? "Yes" : "No") << " |\n";
    }
    return out.str();
}

json FormatConverter::connectionsToJSON(const std::vector<std::string>& names,
                                        const std::optional<std::string>& defaultName) {
    json result = json::object();
    result["connections"] = names;
    result["default_connection"] = defaultName ? json(*defaultName) : json(nullptr);
    return result;
}

json FormatConverter::dataSourcesToJSON(const std::vector<DataSourceInfo>& sources) {
    json result = json::array();
    for (const auto& source : sources) {
        result.push_back({{"name", source.name}, {"driver", source.driver}});
    }
    return result;
}

json FormatConverter::statusToJSON(const ConnectionStatus& status) {
    json result = json::object();

    if (!status.connected) {
        result["status"] = "error";
        result["connection_name"] = status.connectionName;
        result["error"] = status.error.value_or("Unknown error");
        return result;
    }

    const std::string unknown = "Unknown";
    result["status"] = "connected";
    result["connection_name"] = status.connectionName;
    result["connection_info"] = {
        {"driver_name", status.driverName.value_or(unknown)},
        {"driver_version", status.driverVersion.value_or(unknown)},
        {"database_name", status.databaseName.value_or(unknown)},
        {"dbms_name", status.dbmsName.value_or(unknown)},
        {"dbms_version", status.dbmsVersion.value_or(unknown)},
    };

    json database_info = json::object();
    if (status.serverVersion) {
        database_info["version"] = *status.serverVersion;
    }
    result["database_info"] = std::move(database_info);

    return result;
}

std::string FormatConverter::valueToString(const SqlValue& value, const std::string& nullText) {
    if (std::holds_alternative<std::monostate>(value)) {
        return nullText;
    }
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return fmt::format("{}", *d);
    }
    return std::get<std::string>(value);
}

json FormatConverter::valueToJSON(const SqlValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return *i;
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    return nullptr;
}

std::string FormatConverter::escapeCSVField(const std::string& field,
                                            const CSVOptions& options) {
    bool needs_quoting = options.quoteAll;

    if (!needs_quoting) {
        for (char c : field) {
            if (c == options.delimiter || c == options.quote ||
                c == '\n' || c == '\r') {
                needs_quoting = true;
                break;
            }
        }
    }

    if (!needs_quoting) {
        return field;
    }

    std::string result;
    result.reserve(field.size() + 2);
    result += options.quote;

    for (char c : field) {
        if (c == options.quote) {
            result += options.quote;  // Double the quote
        }
        result += c;
    }

    result += options.quote;
    return result;
}

std::string FormatConverter::escapeMarkdownCell(const std::string& cell) {
    std::string result;
    result.reserve(cell.size());
    for (char c : cell) {
        switch (c) {
            case '|':  result += "\\|"; break;
            case '\r': break;
            case '\n': result += ' '; break;
            default:   result += c; break;
        }
    }
    return result;
}

}  // namespace odbcmcp
