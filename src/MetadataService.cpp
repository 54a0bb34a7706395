#include "MetadataService.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <sql.h>
#include <sqlext.h>
#include <algorithm>

namespace odbcmcp {

namespace {

// SQL Server driver extensions (msodbcsql.h)
constexpr int kSqlSsVariant = -150;
constexpr int kSqlSsUdt = -151;
constexpr int kSqlSsXml = -152;
constexpr int kSqlSsTime2 = -154;
constexpr int kSqlSsTimestampOffset = -155;

const char* const kInformationSchemaTables =
    "SELECT TABLE_CATALOG, TABLE_SCHEMA, TABLE_NAME, TABLE_TYPE "
    "FROM INFORMATION_SCHEMA.TABLES WHERE TABLE_TYPE = 'BASE TABLE'";

std::string columnText(const std::vector<DriverValue>& row, size_t index) {
    return index < row.size() ? valueToText(row[index]) : "";
}

}  // namespace

std::string sqlTypeName(int typeCode) {
    switch (typeCode) {
        // Character
        case SQL_CHAR: return "CHAR";
        case SQL_VARCHAR: return "VARCHAR";
        case SQL_LONGVARCHAR: return "LONGVARCHAR";
        case SQL_WCHAR: return "WCHAR";
        case SQL_WVARCHAR: return "WVARCHAR";
        case SQL_WLONGVARCHAR: return "WLONGVARCHAR";

        // Numeric
        case SQL_DECIMAL: return "DECIMAL";
        case SQL_NUMERIC: return "NUMERIC";
        case SQL_SMALLINT: return "SMALLINT";
        case SQL_INTEGER: return "INTEGER";
        case SQL_REAL: return "REAL";
        case SQL_FLOAT: return "FLOAT";
        case SQL_DOUBLE: return "DOUBLE";
        case SQL_BIT: return "BIT";
        case SQL_TINYINT: return "TINYINT";
        case SQL_BIGINT: return "BIGINT";

        // Binary
        case SQL_BINARY: return "BINARY";
        case SQL_VARBINARY: return "VARBINARY";
        case SQL_LONGVARBINARY: return "LONGVARBINARY";

        // Date/time (ODBC 3 and legacy ODBC 2 codes)
        case SQL_TYPE_DATE: return "DATE";
        case SQL_TYPE_TIME: return "TIME";
        case SQL_TYPE_TIMESTAMP: return "TIMESTAMP";
        case SQL_DATE: return "DATE";
        case SQL_TIME: return "TIME";
        case SQL_TIMESTAMP: return "TIMESTAMP";

        case SQL_GUID: return "GUID";

        // Vendor extensions
        case kSqlSsVariant: return "SQL_VARIANT";
        case kSqlSsUdt: return "UDT";
        case kSqlSsXml: return "XML";
        case kSqlSsTime2: return "TIME";
        case kSqlSsTimestampOffset: return "TIMESTAMPOFFSET";

        default:
            return "UNKNOWN(" + std::to_string(typeCode) + ")";
    }
}

MetadataService::MetadataService(ConnectionManager& connections)
    : m_connections(connections) {
}

std::pair<std::optional<std::string>, std::string> MetadataService::splitTableName(
    const std::string& tableName) {
    auto last = tableName.rfind('.');
    if (last == std::string::npos) {
        return {std::nullopt, tableName};
    }

    // catalog.schema.table keeps only the last two parts
    std::string qualifier = tableName.substr(0, last);
    auto prev = qualifier.rfind('.');
    std::string schema = prev == std::string::npos ? qualifier : qualifier.substr(prev + 1);
    return {schema, tableName.substr(last + 1)};
}

std::vector<TableDescriptor> MetadataService::listTables(const std::optional<std::string>& profile) {
    DriverConnection& conn = m_connections.acquire(profile);

    auto native = nativeTables(conn);
    if (native.ok()) {
        return std::move(native.items);
    }

    spdlog::debug("Catalog table enumeration failed ({}), querying INFORMATION_SCHEMA",
                  *native.error);

    auto fallback = informationSchemaTables(conn);
    if (fallback.ok()) {
        return std::move(fallback.items);
    }

    throw GatewayError(ErrorKind::MetadataUnavailable, "Failed to list tables: " + *native.error);
}

std::vector<ColumnDescriptor> MetadataService::getTableSchema(const std::string& tableName,
                                                              const std::optional<std::string>& profile) {
    DriverConnection& conn = m_connections.acquire(profile);
    auto [schema, table] = splitTableName(tableName);

    auto native = nativeColumns(conn, schema, table);
    if (native.ok() && !native.items.empty()) {
        return std::move(native.items);
    }

    spdlog::debug("No catalog columns for '{}' ({}), probing with an empty SELECT", tableName,
                  native.error.value_or("no columns found"));

    auto fallback = probeColumns(conn, tableName);
    if (fallback.ok()) {
        return std::move(fallback.items);
    }

    throw GatewayError(ErrorKind::SchemaUnavailable,
                       "Failed to get schema for table '" + tableName + "': " + *fallback.error);
}

MetadataAttempt<TableDescriptor> MetadataService::nativeTables(DriverConnection& conn) {
    MetadataAttempt<TableDescriptor> attempt;
    try {
        for (auto& entry : conn.tables()) {
            if (entry.type != "TABLE") {
                continue;
            }
            TableDescriptor table;
            table.catalog = std::move(entry.catalog);
            table.schema = std::move(entry.schema);
            table.name = std::move(entry.name);
            table.type = std::move(entry.type);
            attempt.items.push_back(std::move(table));
        }
    } catch (const OdbcException& e) {
        if (ErrorHandler::isNotSupported(e.sqlState())) {
            spdlog::debug("Driver has no catalog table enumeration");
        }
        attempt.items.clear();
        attempt.error = e.what();
    } catch (const std::exception& e) {
        attempt.items.clear();
        attempt.error = e.what();
    }
    return attempt;
}

MetadataAttempt<TableDescriptor> MetadataService::informationSchemaTables(DriverConnection& conn) {
    MetadataAttempt<TableDescriptor> attempt;
    try {
        auto rs = conn.execute(kInformationSchemaTables);
        std::vector<DriverValue> row;
        while (rs && rs->fetch(row)) {
            TableDescriptor table;
            table.catalog = columnText(row, 0);
            table.schema = columnText(row, 1);
            table.name = columnText(row, 2);
            table.type = columnText(row, 3);
            attempt.items.push_back(std::move(table));
        }
    } catch (const std::exception& e) {
        attempt.items.clear();
        attempt.error = e.what();
    }
    return attempt;
}

MetadataAttempt<ColumnDescriptor> MetadataService::nativeColumns(DriverConnection& conn,
                                                                 const std::optional<std::string>& schema,
                                                                 const std::string& table) {
    MetadataAttempt<ColumnDescriptor> attempt;
    try {
        for (auto& entry : conn.columns(schema, table)) {
            ColumnDescriptor col;
            col.name = std::move(entry.name);
            col.type = std::move(entry.typeName);
            col.size = entry.size;
            col.nullable = entry.nullable;
            col.position = entry.position;
            attempt.items.push_back(std::move(col));
        }
        std::stable_sort(attempt.items.begin(), attempt.items.end(),
                         [](const ColumnDescriptor& a, const ColumnDescriptor& b) {
                             return a.position < b.position;
                         });
    } catch (const std::exception& e) {
        attempt.items.clear();
        attempt.error = e.what();
    }
    return attempt;
}

MetadataAttempt<ColumnDescriptor> MetadataService::probeColumns(DriverConnection& conn,
                                                                const std::string& table) {
    MetadataAttempt<ColumnDescriptor> attempt;
    try {
        auto rs = conn.execute("SELECT * FROM " + table + " WHERE 1=0");
        if (!rs) {
            return attempt;
        }

        const auto& columns = rs->columns();
        for (size_t i = 0; i < columns.size(); ++i) {
            ColumnDescriptor col;
            col.name = columns[i].name;
            col.type = sqlTypeName(columns[i].typeCode);
            col.size = columns[i].size;
            col.nullable = columns[i].nullable;
            col.position = static_cast<int>(i) + 1;
            attempt.items.push_back(std::move(col));
        }
    } catch (const std::exception& e) {
        attempt.items.clear();
        attempt.error = e.what();
    }
    return attempt;
}

}  // namespace odbcmcp
