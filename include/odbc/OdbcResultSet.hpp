#pragma once

/**
 * @file OdbcResultSet.hpp
 * @brief RAII wrapper for an ODBC statement handle and its result set.
 *
 * This file provides row iteration over an executed ODBC statement,
 * converting each column into a DriverValue and freeing the statement
 * handle automatically.
 */

#include "Driver.hpp"
#include <sql.h>
#include <sqlext.h>
#include <string>
#include <vector>

namespace odbcmcp {

/**
 * @class OdbcResultSet
 * @brief Owns an executed SQLHSTMT and streams its rows.
 *
 * Column metadata is read once with SQLNumResultCols()/SQLDescribeCol()
 * when the wrapper is constructed. Rows are pulled with SQLFetch() and
 * each column is read with SQLGetData() in chunks, so long character
 * and binary values are never truncated.
 *
 * Value Conversion:
 * - Integer types (BIT through BIGINT) are fetched as SQL_C_SBIGINT
 * - REAL, FLOAT and DOUBLE are fetched as SQL_C_DOUBLE
 * - Binary types are fetched as SQL_C_BINARY into Bytes
 * - Everything else (character, DECIMAL/NUMERIC, date/time) is text
 *
 * With UTF-8 forcing on, text is fetched as SQL_C_WCHAR and transcoded
 * from UTF-16, which sidesteps the driver's narrow code page.
 *
 * Thread Safety:
 * - Not thread-safe; a result set belongs to the request that made it.
 */
class OdbcResultSet : public DriverResultSet {
public:
    /**
     * @brief Take ownership of an executed statement.
     * @param stmt Statement handle after a successful execute or catalog call.
     * @param utf8 Fetch text as UTF-16 and transcode to UTF-8.
     * @throws OdbcException if the column metadata cannot be read.
     */
    OdbcResultSet(SQLHSTMT stmt, bool utf8);

    /**
     * @brief Destructor - closes the cursor and frees the statement.
     */
    ~OdbcResultSet() override;

    // Non-copyable
    OdbcResultSet(const OdbcResultSet&) = delete;
    OdbcResultSet& operator=(const OdbcResultSet&) = delete;

    /**
     * @brief Get the result-set columns.
     * @return Column list, empty for statements without a result set.
     */
    const std::vector<ResultColumn>& columns() const override { return m_columns; }

    /**
     * @brief Fetch the next row.
     * @param row Receives one value per column.
     * @return true if a row was fetched, false when no rows remain.
     * @throws OdbcException on fetch or conversion errors.
     */
    bool fetch(std::vector<DriverValue>& row) override;

private:
    DriverValue readColumn(SQLUSMALLINT index, int typeCode);

    SQLHSTMT m_stmt;                      ///< Statement handle (owned)
    bool m_utf8;                          ///< Fetch text as SQL_C_WCHAR
    std::vector<ResultColumn> m_columns;  ///< Described columns
};

/**
 * @brief Convert UTF-16 code units to UTF-8.
 * @param units UTF-16 code units as returned for SQL_C_WCHAR.
 * @return UTF-8 string; unpaired surrogates become U+FFFD.
 */
std::string utf16ToUtf8(const std::vector<SQLWCHAR>& units);

}  // namespace odbcmcp
