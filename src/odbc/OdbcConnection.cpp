/**
 * @file OdbcConnection.cpp
 * @brief Implementation of the ODBC connection wrapper.
 */

#include "OdbcConnection.hpp"
#include "ErrorHandler.hpp"
#include "OdbcResultSet.hpp"
#include <spdlog/spdlog.h>

namespace odbcmcp {

namespace {

// SQLColumns() result set positions
constexpr SQLUSMALLINT kColumnName = 4;
constexpr SQLUSMALLINT kTypeName = 6;
constexpr SQLUSMALLINT kColumnSize = 7;
constexpr SQLUSMALLINT kNullable = 11;
constexpr SQLUSMALLINT kOrdinalPosition = 17;

// SQLTables() result set positions
constexpr SQLUSMALLINT kTableCatalog = 1;
constexpr SQLUSMALLINT kTableSchema = 2;
constexpr SQLUSMALLINT kTableName = 3;
constexpr SQLUSMALLINT kTableType = 4;

std::string textAt(const std::vector<DriverValue>& row, SQLUSMALLINT position) {
    if (position == 0 || position > row.size()) {
        return "";
    }
    return valueToText(row[position - 1]);
}

int64_t integerAt(const std::vector<DriverValue>& row, SQLUSMALLINT position, int64_t fallback) {
    if (position == 0 || position > row.size()) {
        return fallback;
    }
    const DriverValue& value = row[position - 1];
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return *i;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        try {
            return std::stoll(*s);
        } catch (const std::exception&) {
            return fallback;
        }
    }
    return fallback;
}

SQLUSMALLINT infoCode(InfoType type) {
    switch (type) {
        case InfoType::DriverName:    return SQL_DRIVER_NAME;
        case InfoType::DriverVersion: return SQL_DRIVER_VER;
        case InfoType::DatabaseName:  return SQL_DATABASE_NAME;
        case InfoType::DbmsName:      return SQL_DBMS_NAME;
        case InfoType::DbmsVersion:   return SQL_DBMS_VER;
    }
    return SQL_DRIVER_NAME;
}

}  // namespace

// ============================================================================
// Connection Lifecycle
// ============================================================================

OdbcConnection::OdbcConnection(OdbcEnvironment& env, const std::string& connectionString,
                               const ConnectOptions& options)
    : m_utf8(options.utf8) {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_DBC, env.get(), &m_dbc);
    if (!SQL_SUCCEEDED(ret)) {
        m_dbc = SQL_NULL_HDBC;
        throw OdbcException("SQLAllocHandle(DBC)",
                            ErrorHandler::getDiagnostics(SQL_HANDLE_ENV, env.get()));
    }

    auto timeout = reinterpret_cast<SQLPOINTER>(static_cast<SQLULEN>(options.timeoutSeconds));
    // Not every driver honours timeouts; failures here are not fatal
    if (!SQL_SUCCEEDED(SQLSetConnectAttr(m_dbc, SQL_ATTR_LOGIN_TIMEOUT, timeout, 0))) {
        spdlog::debug("Driver rejected login timeout: {}",
                      ErrorHandler::getErrorMessage(SQL_HANDLE_DBC, m_dbc));
    }
    if (!SQL_SUCCEEDED(SQLSetConnectAttr(m_dbc, SQL_ATTR_CONNECTION_TIMEOUT, timeout, 0))) {
        spdlog::debug("Driver rejected connection timeout: {}",
                      ErrorHandler::getErrorMessage(SQL_HANDLE_DBC, m_dbc));
    }

    // Some drivers (ProvideX) refuse to toggle autocommit once connected
    if (options.explicitAutocommit) {
        ret = SQLSetConnectAttr(m_dbc, SQL_ATTR_AUTOCOMMIT,
                                reinterpret_cast<SQLPOINTER>(SQL_AUTOCOMMIT_ON), SQL_IS_UINTEGER);
        if (!SQL_SUCCEEDED(ret)) {
            spdlog::warn("Failed to enable autocommit before connect: {}",
                         ErrorHandler::getErrorMessage(SQL_HANDLE_DBC, m_dbc));
        }
    }

    std::vector<SQLCHAR> input(connectionString.begin(), connectionString.end());
    input.push_back('\0');
    SQLCHAR output[1024] = {0};
    SQLSMALLINT outputLength = 0;

    ret = SQLDriverConnect(m_dbc, nullptr, input.data(), SQL_NTS, output, sizeof(output),
                           &outputLength, SQL_DRIVER_NOPROMPT);
    if (!SQL_SUCCEEDED(ret)) {
        auto diagnostics = ErrorHandler::getDiagnostics(SQL_HANDLE_DBC, m_dbc);
        SQLFreeHandle(SQL_HANDLE_DBC, m_dbc);
        m_dbc = SQL_NULL_HDBC;
        throw OdbcException("SQLDriverConnect", diagnostics);
    }
    if (ret == SQL_SUCCESS_WITH_INFO) {
        spdlog::debug("Connect info: {}", ErrorHandler::getErrorMessage(SQL_HANDLE_DBC, m_dbc));
    }
}

OdbcConnection::~OdbcConnection() {
    if (m_dbc != SQL_NULL_HDBC) {
        SQLDisconnect(m_dbc);
        SQLFreeHandle(SQL_HANDLE_DBC, m_dbc);
        m_dbc = SQL_NULL_HDBC;
    }
}

void OdbcConnection::close() {
    if (m_dbc == SQL_NULL_HDBC) {
        return;
    }

    SQLRETURN ret = SQLDisconnect(m_dbc);
    std::vector<Diagnostic> diagnostics;
    if (!SQL_SUCCEEDED(ret)) {
        diagnostics = ErrorHandler::getDiagnostics(SQL_HANDLE_DBC, m_dbc);
    }
    SQLFreeHandle(SQL_HANDLE_DBC, m_dbc);
    m_dbc = SQL_NULL_HDBC;

    if (!SQL_SUCCEEDED(ret)) {
        throw OdbcException("SQLDisconnect", diagnostics);
    }
}

SQLHSTMT OdbcConnection::allocStatement() {
    if (m_dbc == SQL_NULL_HDBC) {
        throw OdbcException("08003", 0, "Connection is closed");
    }

    SQLHSTMT stmt = SQL_NULL_HSTMT;
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_STMT, m_dbc, &stmt);
    ErrorHandler::check(ret, SQL_HANDLE_DBC, m_dbc, "SQLAllocHandle(STMT)");
    return stmt;
}

// ============================================================================
// Statement Execution
// ============================================================================

std::unique_ptr<DriverResultSet> OdbcConnection::execute(const std::string& sql) {
    SQLHSTMT stmt = allocStatement();

    std::vector<SQLCHAR> text(sql.begin(), sql.end());
    text.push_back('\0');

    SQLRETURN ret = SQLExecDirect(stmt, text.data(), SQL_NTS);
    // SQL_NO_DATA: a searched UPDATE/DELETE that touched no rows
    if (!SQL_SUCCEEDED(ret) && ret != SQL_NO_DATA) {
        auto diagnostics = ErrorHandler::getDiagnostics(SQL_HANDLE_STMT, stmt);
        SQLFreeHandle(SQL_HANDLE_STMT, stmt);
        throw OdbcException("SQLExecDirect", diagnostics);
    }

    return std::make_unique<OdbcResultSet>(stmt, m_utf8);
}

// ============================================================================
// Catalog Queries
// ============================================================================

std::vector<CatalogTable> OdbcConnection::tables() {
    SQLHSTMT stmt = allocStatement();

    SQLCHAR tableType[] = "TABLE";
    SQLRETURN ret = SQLTables(stmt, nullptr, 0, nullptr, 0, nullptr, 0, tableType, SQL_NTS);
    if (!SQL_SUCCEEDED(ret)) {
        auto diagnostics = ErrorHandler::getDiagnostics(SQL_HANDLE_STMT, stmt);
        SQLFreeHandle(SQL_HANDLE_STMT, stmt);
        throw OdbcException("SQLTables", diagnostics);
    }

    OdbcResultSet rs(stmt, m_utf8);
    std::vector<CatalogTable> result;
    std::vector<DriverValue> row;
    while (rs.fetch(row)) {
        CatalogTable table;
        table.catalog = textAt(row, kTableCatalog);
        table.schema = textAt(row, kTableSchema);
        table.name = textAt(row, kTableName);
        table.type = textAt(row, kTableType);
        result.push_back(std::move(table));
    }
    return result;
}

std::vector<CatalogColumn> OdbcConnection::columns(const std::optional<std::string>& schema,
                                                   const std::string& table) {
    SQLHSTMT stmt = allocStatement();

    std::vector<SQLCHAR> tableName(table.begin(), table.end());
    tableName.push_back('\0');
    std::vector<SQLCHAR> schemaName;
    if (schema) {
        schemaName.assign(schema->begin(), schema->end());
        schemaName.push_back('\0');
    }

    SQLRETURN ret = SQLColumns(stmt, nullptr, 0,
                               schema ? schemaName.data() : nullptr, schema ? SQL_NTS : 0,
                               tableName.data(), SQL_NTS, nullptr, 0);
    if (!SQL_SUCCEEDED(ret)) {
        auto diagnostics = ErrorHandler::getDiagnostics(SQL_HANDLE_STMT, stmt);
        SQLFreeHandle(SQL_HANDLE_STMT, stmt);
        throw OdbcException("SQLColumns", diagnostics);
    }

    OdbcResultSet rs(stmt, m_utf8);
    std::vector<CatalogColumn> result;
    std::vector<DriverValue> row;
    while (rs.fetch(row)) {
        CatalogColumn col;
        col.name = textAt(row, kColumnName);
        col.typeName = textAt(row, kTypeName);
        int64_t size = integerAt(row, kColumnSize, 0);
        col.size = size > 0 ? static_cast<size_t>(size) : 0;
        col.nullable = integerAt(row, kNullable, SQL_NULLABLE_UNKNOWN) == SQL_NULLABLE;
        col.position = static_cast<int>(integerAt(row, kOrdinalPosition,
                                                  static_cast<int64_t>(result.size() + 1)));
        result.push_back(std::move(col));
    }
    return result;
}

// ============================================================================
// Driver Information
// ============================================================================

std::optional<std::string> OdbcConnection::getInfo(InfoType type) {
    if (m_dbc == SQL_NULL_HDBC) {
        return std::nullopt;
    }

    SQLCHAR buffer[512] = {0};
    SQLSMALLINT length = 0;
    SQLRETURN ret = SQLGetInfo(m_dbc, infoCode(type), buffer, sizeof(buffer), &length);
    if (!SQL_SUCCEEDED(ret)) {
        spdlog::debug("SQLGetInfo failed: {}", ErrorHandler::getErrorMessage(SQL_HANDLE_DBC, m_dbc));
        return std::nullopt;
    }

    std::string value(reinterpret_cast<const char*>(buffer));
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace odbcmcp
