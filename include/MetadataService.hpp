#pragma once

#include "ConnectionManager.hpp"
#include "Driver.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace odbcmcp {

struct TableDescriptor {
    std::string catalog;
    std::string schema;
    std::string name;
    std::string type;
};

struct ColumnDescriptor {
    std::string name;
    std::string type;
    size_t size = 0;
    bool nullable = true;
    int position = 0;  // 1-based
};

// Outcome of one metadata strategy; error set means the strategy failed
template <typename T>
struct MetadataAttempt {
    std::vector<T> items;
    std::optional<std::string> error;

    bool ok() const { return !error.has_value(); }
};

// Canonical name for an ODBC SQL type code; "UNKNOWN(<code>)" otherwise
std::string sqlTypeName(int typeCode);

// Table listing and column description.
//
// Each operation tries the driver's catalog API first and falls back to plain
// SQL (INFORMATION_SCHEMA, or a zero-row SELECT) for drivers without catalog
// support. Only failure of both strategies is an error.
class MetadataService {
public:
    explicit MetadataService(ConnectionManager& connections);

    // Throws GatewayError(MetadataUnavailable) or acquisition errors
    std::vector<TableDescriptor> listTables(const std::optional<std::string>& profile);

    // "schema.table" is split; throws GatewayError(SchemaUnavailable)
    std::vector<ColumnDescriptor> getTableSchema(const std::string& tableName,
                                                 const std::optional<std::string>& profile);

    // Split a possibly qualified table name into (schema, table)
    static std::pair<std::optional<std::string>, std::string> splitTableName(const std::string& tableName);

private:
    MetadataAttempt<TableDescriptor> nativeTables(DriverConnection& conn);
    MetadataAttempt<TableDescriptor> informationSchemaTables(DriverConnection& conn);

    MetadataAttempt<ColumnDescriptor> nativeColumns(DriverConnection& conn,
                                                    const std::optional<std::string>& schema,
                                                    const std::string& table);
    MetadataAttempt<ColumnDescriptor> probeColumns(DriverConnection& conn, const std::string& table);

    ConnectionManager& m_connections;
};

}  // namespace odbcmcp
