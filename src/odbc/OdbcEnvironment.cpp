/**
 * @file OdbcEnvironment.cpp
 * @brief Implementation of the ODBC environment wrapper.
 */

#include "OdbcEnvironment.hpp"
#include "ErrorHandler.hpp"

namespace odbcmcp {

// ============================================================================
// Construction and Destruction
// ============================================================================

OdbcEnvironment::OdbcEnvironment() {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &m_env);
    if (!SQL_SUCCEEDED(ret)) {
        throw OdbcException("HY001", 0, "Failed to allocate ODBC environment handle");
    }

    ret = SQLSetEnvAttr(m_env, SQL_ATTR_ODBC_VERSION,
                        reinterpret_cast<SQLPOINTER>(static_cast<intptr_t>(SQL_OV_ODBC3)), 0);
    if (!SQL_SUCCEEDED(ret)) {
        auto diagnostics = ErrorHandler::getDiagnostics(SQL_HANDLE_ENV, m_env);
        SQLFreeHandle(SQL_HANDLE_ENV, m_env);
        m_env = SQL_NULL_HENV;
        throw OdbcException("SQLSetEnvAttr(SQL_ATTR_ODBC_VERSION)", diagnostics);
    }
}

OdbcEnvironment::~OdbcEnvironment() {
    if (m_env != SQL_NULL_HENV) {
        SQLFreeHandle(SQL_HANDLE_ENV, m_env);
    }
}

// ============================================================================
// Data Source Registry
// ============================================================================

std::vector<DataSourceInfo> OdbcEnvironment::dataSources() {
    std::vector<DataSourceInfo> sources;

    SQLCHAR name[SQL_MAX_DSN_LENGTH + 1];
    SQLCHAR description[1024];
    SQLSMALLINT nameLength = 0;
    SQLSMALLINT descriptionLength = 0;

    SQLUSMALLINT direction = SQL_FETCH_FIRST;
    for (;;) {
        SQLRETURN ret = SQLDataSources(m_env, direction, name, sizeof(name), &nameLength,
                                       description, sizeof(description), &descriptionLength);
        if (ret == SQL_NO_DATA) {
            break;
        }
        ErrorHandler::check(ret, SQL_HANDLE_ENV, m_env, "SQLDataSources");

        DataSourceInfo info;
        info.name = reinterpret_cast<const char*>(name);
        info.driver = reinterpret_cast<const char*>(description);
        sources.push_back(std::move(info));

        direction = SQL_FETCH_NEXT;
    }

    return sources;
}

}  // namespace odbcmcp
