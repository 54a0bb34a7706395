#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace odbcmcp {

using Bytes = std::vector<std::uint8_t>;

// A single fetched value; monostate is SQL NULL
using DriverValue = std::variant<std::monostate, int64_t, double, std::string, Bytes>;

// Hex text form of binary data, e.g. 0x0AFF
std::string bytesToText(const Bytes& bytes);

// Text form of any fetched value; NULL renders as an empty string
std::string valueToText(const DriverValue& value);

// Result-set column metadata
struct ResultColumn {
    std::string name;
    int typeCode = 0;  // SQL type code as reported by the driver
    size_t size = 0;
    bool nullable = true;
};

// Row of a catalog table enumeration
struct CatalogTable {
    std::string catalog;
    std::string schema;
    std::string name;
    std::string type;
};

// Row of a catalog column enumeration
struct CatalogColumn {
    std::string name;
    std::string typeName;
    size_t size = 0;
    bool nullable = true;
    int position = 0;
};

enum class InfoType {
    DriverName,
    DriverVersion,
    DatabaseName,
    DbmsName,
    DbmsVersion
};

struct ConnectOptions {
    int timeoutSeconds = 30;
    bool explicitAutocommit = false;
    bool utf8 = true;
};

struct DataSourceInfo {
    std::string name;
    std::string driver;
};

class DriverResultSet {
public:
    virtual ~DriverResultSet() = default;

    // Empty when the statement produced no result set
    virtual const std::vector<ResultColumn>& columns() const = 0;

    // Fetch the next row; false when exhausted
    virtual bool fetch(std::vector<DriverValue>& row) = 0;
};

class DriverConnection {
public:
    virtual ~DriverConnection() = default;

    // Non-copyable, non-movable
    DriverConnection(const DriverConnection&) = delete;
    DriverConnection& operator=(const DriverConnection&) = delete;

    virtual std::unique_ptr<DriverResultSet> execute(const std::string& sql) = 0;

    // Catalog enumeration; throws when the driver lacks the capability
    virtual std::vector<CatalogTable> tables() = 0;
    virtual std::vector<CatalogColumn> columns(const std::optional<std::string>& schema,
                                               const std::string& table) = 0;

    // Driver introspection; nullopt when unavailable
    virtual std::optional<std::string> getInfo(InfoType type) = 0;

    virtual void close() = 0;

protected:
    DriverConnection() = default;
};

class Driver {
public:
    virtual ~Driver() = default;

    // Throws OdbcException when the connection cannot be established
    virtual std::unique_ptr<DriverConnection> connect(const std::string& connectionString,
                                                      const ConnectOptions& options) = 0;

    // System-registered data sources
    virtual std::vector<DataSourceInfo> dataSources() = 0;
};

}  // namespace odbcmcp
