#pragma once

/**
 * @file OdbcConnection.hpp
 * @brief RAII wrapper for an ODBC connection handle.
 *
 * This file provides the DriverConnection implementation used in
 * production. It wraps SQLHDBC with automatic disconnect, statement
 * execution and catalog queries.
 */

#include "Driver.hpp"
#include "OdbcEnvironment.hpp"
#include <sql.h>
#include <sqlext.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace odbcmcp {

/**
 * @class OdbcConnection
 * @brief One live session against an ODBC data source.
 *
 * Connection Lifecycle:
 * 1. Allocate SQLHDBC from the shared environment
 * 2. Apply login and connection timeouts
 * 3. Enable autocommit up front for drivers that require it
 * 4. SQLDriverConnect() with SQL_DRIVER_NOPROMPT
 *
 * Catalog Queries:
 * - tables() uses SQLTables() restricted to type "TABLE"
 * - columns() uses SQLColumns() for a single table
 *
 * Both throw OdbcException when the driver rejects the call, which the
 * metadata service treats as a signal to fall back to plain SQL.
 *
 * Thread Safety:
 * - Not thread-safe. ConnectionManager serializes access.
 */
class OdbcConnection : public DriverConnection {
public:
    /**
     * @brief Open a connection.
     * @param env Environment that outlives this connection.
     * @param connectionString Full ODBC connection string.
     * @param options Timeout, autocommit and text encoding settings.
     * @throws OdbcException if allocation or connect fails.
     */
    OdbcConnection(OdbcEnvironment& env, const std::string& connectionString,
                   const ConnectOptions& options);

    /**
     * @brief Destructor - disconnects and frees the handle.
     */
    ~OdbcConnection() override;

    /**
     * @brief Execute a statement directly.
     * @param sql Statement text.
     * @return Result set; its column list is empty for DML and DDL.
     * @throws OdbcException on execution errors.
     */
    std::unique_ptr<DriverResultSet> execute(const std::string& sql) override;

    /**
     * @brief List base tables via the ODBC catalog.
     * @throws OdbcException if SQLTables() is unsupported or fails.
     */
    std::vector<CatalogTable> tables() override;

    /**
     * @brief List the columns of one table via the ODBC catalog.
     * @param schema Schema filter, or nullopt for any schema.
     * @param table Unqualified table name.
     * @throws OdbcException if SQLColumns() is unsupported or fails.
     */
    std::vector<CatalogColumn> columns(const std::optional<std::string>& schema,
                                       const std::string& table) override;

    /**
     * @brief Read a driver or DBMS attribute with SQLGetInfo().
     * @return Attribute text, or nullopt if the driver does not report it.
     */
    std::optional<std::string> getInfo(InfoType type) override;

    /**
     * @brief Disconnect and free the handle.
     * @throws OdbcException if SQLDisconnect() reports an error.
     */
    void close() override;

    /**
     * @brief Check if the handle is still open.
     */
    bool isOpen() const { return m_dbc != SQL_NULL_HDBC; }

private:
    SQLHSTMT allocStatement();

    SQLHDBC m_dbc = SQL_NULL_HDBC;  ///< Connection handle
    bool m_utf8;                    ///< Fetch text as UTF-16
};

}  // namespace odbcmcp
