#pragma once

/**
 * @file OdbcEnvironment.hpp
 * @brief RAII wrapper for the ODBC environment handle.
 *
 * Every ODBC connection is allocated from an environment handle. This
 * file provides the owner of that handle and the driver-manager level
 * queries that need no connection, such as the DSN registry.
 */

#include "Driver.hpp"
#include <sql.h>
#include <sqlext.h>
#include <vector>

namespace odbcmcp {

/**
 * @class OdbcEnvironment
 * @brief Owns an SQLHENV configured for ODBC 3 behaviour.
 *
 * The environment must outlive every connection allocated from it.
 * OdbcDriver holds one environment for the whole process.
 *
 * Usage:
 * @code
 *   OdbcEnvironment env;
 *   for (const auto& dsn : env.dataSources()) {
 *       // dsn.name, dsn.driver
 *   }
 * @endcode
 */
class OdbcEnvironment {
public:
    /**
     * @brief Allocate the environment and request ODBC 3 semantics.
     * @throws OdbcException if the driver manager refuses either step.
     */
    OdbcEnvironment();

    /**
     * @brief Destructor - frees the environment handle.
     */
    ~OdbcEnvironment();

    // Non-copyable, non-movable
    OdbcEnvironment(const OdbcEnvironment&) = delete;
    OdbcEnvironment& operator=(const OdbcEnvironment&) = delete;

    /**
     * @brief Get the underlying environment handle.
     * @return Raw SQLHENV (still owned by this object).
     */
    SQLHENV get() const { return m_env; }

    /**
     * @brief Enumerate user and system data sources.
     * @return One entry per DSN with its driver description.
     *
     * Iterates SQLDataSources() from SQL_FETCH_FIRST until SQL_NO_DATA.
     */
    std::vector<DataSourceInfo> dataSources();

private:
    SQLHENV m_env = SQL_NULL_HENV;  ///< ODBC environment handle
};

}  // namespace odbcmcp
