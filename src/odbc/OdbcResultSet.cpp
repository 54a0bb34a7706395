/**
 * @file OdbcResultSet.cpp
 * @brief Implementation of the ODBC result set wrapper.
 *
 * Reads columns with SQLGetData() in fixed-size chunks until the driver
 * reports the final piece, then converts the bytes to a DriverValue.
 */

#include "OdbcResultSet.hpp"
#include "ErrorHandler.hpp"

namespace odbcmcp {

namespace {

constexpr size_t kChunkUnits = 4096;

// Read one column in chunks. Returns false for SQL NULL.
template <typename Unit>
bool readChunks(SQLHSTMT stmt, SQLUSMALLINT index, SQLSMALLINT cType, std::vector<Unit>& out) {
    std::vector<Unit> buffer(kChunkUnits);
    // Character data is null-terminated in every chunk
    const size_t terminator = (cType == SQL_C_BINARY) ? 0 : 1;
    const size_t capacity = buffer.size() - terminator;

    for (;;) {
        SQLLEN indicator = 0;
        SQLRETURN ret = SQLGetData(stmt, index, cType, buffer.data(),
                                   static_cast<SQLLEN>(buffer.size() * sizeof(Unit)), &indicator);
        if (ret == SQL_NO_DATA) {
            break;
        }
        ErrorHandler::check(ret, SQL_HANDLE_STMT, stmt, "SQLGetData");

        if (indicator == SQL_NULL_DATA) {
            return false;
        }

        size_t units = capacity;
        bool last = ret == SQL_SUCCESS;
        if (indicator != SQL_NO_TOTAL && static_cast<size_t>(indicator) / sizeof(Unit) <= capacity) {
            units = static_cast<size_t>(indicator) / sizeof(Unit);
            last = true;
        }

        out.insert(out.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(units));
        if (last) {
            break;
        }
    }

    return true;
}

void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

}  // namespace

std::string utf16ToUtf8(const std::vector<SQLWCHAR>& units) {
    std::string out;
    out.reserve(units.size());

    for (size_t i = 0; i < units.size(); ++i) {
        uint32_t unit = static_cast<uint16_t>(units[i]);
        if (unit >= 0xD800 && unit <= 0xDBFF && i + 1 < units.size()) {
            uint32_t low = static_cast<uint16_t>(units[i + 1]);
            if (low >= 0xDC00 && low <= 0xDFFF) {
                appendUtf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
                ++i;
                continue;
            }
        }
        if (unit >= 0xD800 && unit <= 0xDFFF) {
            appendUtf8(out, 0xFFFD);
            continue;
        }
        appendUtf8(out, unit);
    }

    return out;
}

// ============================================================================
// Construction and Destruction
// ============================================================================

OdbcResultSet::OdbcResultSet(SQLHSTMT stmt, bool utf8) : m_stmt(stmt), m_utf8(utf8) {
    SQLSMALLINT count = 0;
    SQLRETURN ret = SQLNumResultCols(m_stmt, &count);
    if (!SQL_SUCCEEDED(ret)) {
        auto diagnostics = ErrorHandler::getDiagnostics(SQL_HANDLE_STMT, m_stmt);
        SQLFreeHandle(SQL_HANDLE_STMT, m_stmt);
        throw OdbcException("SQLNumResultCols", diagnostics);
    }

    for (SQLUSMALLINT i = 1; i <= static_cast<SQLUSMALLINT>(count); ++i) {
        SQLCHAR name[256] = {0};
        SQLSMALLINT nameLength = 0;
        SQLSMALLINT dataType = 0;
        SQLULEN columnSize = 0;
        SQLSMALLINT decimalDigits = 0;
        SQLSMALLINT nullable = SQL_NULLABLE_UNKNOWN;

        ret = SQLDescribeCol(m_stmt, i, name, sizeof(name), &nameLength, &dataType,
                             &columnSize, &decimalDigits, &nullable);
        if (!SQL_SUCCEEDED(ret)) {
            auto diagnostics = ErrorHandler::getDiagnostics(SQL_HANDLE_STMT, m_stmt);
            SQLFreeHandle(SQL_HANDLE_STMT, m_stmt);
            throw OdbcException("SQLDescribeCol", diagnostics);
        }

        ResultColumn col;
        col.name = reinterpret_cast<const char*>(name);
        col.typeCode = dataType;
        col.size = static_cast<size_t>(columnSize);
        col.nullable = nullable == SQL_NULLABLE;
        m_columns.push_back(std::move(col));
    }
}

OdbcResultSet::~OdbcResultSet() {
    if (m_stmt != SQL_NULL_HSTMT) {
        SQLCloseCursor(m_stmt);
        SQLFreeHandle(SQL_HANDLE_STMT, m_stmt);
    }
}

// ============================================================================
// Row Iteration
// ============================================================================

bool OdbcResultSet::fetch(std::vector<DriverValue>& row) {
    row.clear();
    if (m_columns.empty()) {
        return false;
    }

    SQLRETURN ret = SQLFetch(m_stmt);
    if (ret == SQL_NO_DATA) {
        return false;
    }
    ErrorHandler::check(ret, SQL_HANDLE_STMT, m_stmt, "SQLFetch");

    row.reserve(m_columns.size());
    for (size_t i = 0; i < m_columns.size(); ++i) {
        row.push_back(readColumn(static_cast<SQLUSMALLINT>(i + 1), m_columns[i].typeCode));
    }
    return true;
}

// ============================================================================
// Column Conversion
// ============================================================================

DriverValue OdbcResultSet::readColumn(SQLUSMALLINT index, int typeCode) {
    switch (typeCode) {
        case SQL_BIT:
        case SQL_TINYINT:
        case SQL_SMALLINT:
        case SQL_INTEGER:
        case SQL_BIGINT: {
            SQLBIGINT value = 0;
            SQLLEN indicator = 0;
            SQLRETURN ret = SQLGetData(m_stmt, index, SQL_C_SBIGINT, &value, sizeof(value), &indicator);
            ErrorHandler::check(ret, SQL_HANDLE_STMT, m_stmt, "SQLGetData");
            if (indicator == SQL_NULL_DATA) return std::monostate{};
            return static_cast<int64_t>(value);
        }

        case SQL_REAL:
        case SQL_FLOAT:
        case SQL_DOUBLE: {
            SQLDOUBLE value = 0;
            SQLLEN indicator = 0;
            SQLRETURN ret = SQLGetData(m_stmt, index, SQL_C_DOUBLE, &value, sizeof(value), &indicator);
            ErrorHandler::check(ret, SQL_HANDLE_STMT, m_stmt, "SQLGetData");
            if (indicator == SQL_NULL_DATA) return std::monostate{};
            return static_cast<double>(value);
        }

        case SQL_BINARY:
        case SQL_VARBINARY:
        case SQL_LONGVARBINARY: {
            Bytes bytes;
            if (!readChunks(m_stmt, index, SQL_C_BINARY, bytes)) return std::monostate{};
            return bytes;
        }

        default:
            break;
    }

    if (m_utf8) {
        std::vector<SQLWCHAR> units;
        if (!readChunks(m_stmt, index, SQL_C_WCHAR, units)) return std::monostate{};
        return utf16ToUtf8(units);
    }

    std::vector<char> chars;
    if (!readChunks(m_stmt, index, SQL_C_CHAR, chars)) return std::monostate{};
    return std::string(chars.begin(), chars.end());
}

}  // namespace odbcmcp
