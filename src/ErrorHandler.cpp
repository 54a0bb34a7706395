#include "ErrorHandler.hpp"

namespace odbcmcp {

thread_local std::string ErrorContext::s_currentContext;

std::string errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownProfile:
            return "UnknownProfile";
        case ErrorKind::AmbiguousDefault:
            return "AmbiguousDefault";
        case ErrorKind::ConnectionFailed:
            return "ConnectionFailed";
        case ErrorKind::WriteNotAllowed:
            return "WriteNotAllowed";
        case ErrorKind::ExecutionFailed:
            return "ExecutionFailed";
        case ErrorKind::MetadataUnavailable:
            return "MetadataUnavailable";
        case ErrorKind::SchemaUnavailable:
            return "SchemaUnavailable";
        case ErrorKind::InvalidArgument:
            return "InvalidArgument";
        case ErrorKind::UnknownTool:
            return "UnknownTool";
        default:
            return "Unknown";
    }
}

std::vector<Diagnostic> ErrorHandler::getDiagnostics(SQLSMALLINT handleType, SQLHANDLE handle) {
    std::vector<Diagnostic> diagnostics;
    if (handle == SQL_NULL_HANDLE) {
        return diagnostics;
    }

    for (SQLSMALLINT record = 1;; ++record) {
        SQLCHAR state[SQL_SQLSTATE_SIZE + 1] = {0};
        SQLINTEGER native = 0;
        SQLCHAR text[SQL_MAX_MESSAGE_LENGTH] = {0};
        SQLSMALLINT textLength = 0;

        SQLRETURN ret = SQLGetDiagRec(handleType, handle, record, state, &native,
                                      text, sizeof(text), &textLength);
        if (!SQL_SUCCEEDED(ret)) {
            break;
        }

        Diagnostic diag;
        diag.sqlState = reinterpret_cast<const char*>(state);
        diag.nativeError = native;
        diag.message = reinterpret_cast<const char*>(text);
        diagnostics.push_back(std::move(diag));
    }

    return diagnostics;
}

std::string ErrorHandler::formatDiagnostics(const std::vector<Diagnostic>& diagnostics) {
    if (diagnostics.empty()) {
        return "Unknown ODBC error";
    }

    std::string result;
    for (const auto& diag : diagnostics) {
        if (!result.empty()) result += "; ";
        result += "[" + diag.sqlState + "] " + diag.message;
        if (diag.nativeError != 0) {
            result += " (" + std::to_string(diag.nativeError) + ")";
        }
    }
    return result;
}

std::string ErrorHandler::getErrorMessage(SQLSMALLINT handleType, SQLHANDLE handle) {
    return formatDiagnostics(getDiagnostics(handleType, handle));
}

void ErrorHandler::check(SQLRETURN ret, SQLSMALLINT handleType, SQLHANDLE handle,
                         const std::string& context) {
    if (ret == SQL_INVALID_HANDLE) {
        throw OdbcException("HY000", 0, context + ": invalid handle");
    }
    if (ret == SQL_ERROR) {
        throw OdbcException(context, getDiagnostics(handleType, handle));
    }
}

bool ErrorHandler::isConnectionError(const std::string& sqlState) {
    return sqlState.rfind("08", 0) == 0 || sqlState == "HYT01";
}

bool ErrorHandler::isNotSupported(const std::string& sqlState) {
    return sqlState == "HYC00" || sqlState == "IM001";
}

std::string ErrorHandler::describeSqlState(const std::string& sqlState) {
    if (sqlState.size() < 2) {
        return "Unknown error";
    }

    // Exact codes first
    if (sqlState == "HYT00") return "Timeout expired";
    if (sqlState == "HYT01") return "Connection timeout expired";
    if (sqlState == "HYC00") return "Optional feature not implemented";
    if (sqlState == "IM001") return "Driver does not support this function";
    if (sqlState == "IM002") return "Data source not found";

    std::string cls = sqlState.substr(0, 2);
    if (cls == "00") return "Success";
    if (cls == "01") return "Warning";
    if (cls == "07") return "Dynamic SQL error";
    if (cls == "08") return "Connection exception";
    if (cls == "21") return "Cardinality violation";
    if (cls == "22") return "Data exception";
    if (cls == "23") return "Integrity constraint violation";
    if (cls == "24") return "Invalid cursor state";
    if (cls == "25") return "Invalid transaction state";
    if (cls == "28") return "Invalid authorization specification";
    if (cls == "3D") return "Invalid catalog name";
    if (cls == "3F") return "Invalid schema name";
    if (cls == "40") return "Transaction rollback";
    if (cls == "42") return "Syntax error or access violation";
    if (cls == "HY") return "General driver error";
    if (cls == "IM") return "Driver manager error";
    return "Driver error " + sqlState;
}

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

OdbcException::OdbcException(const std::string& sqlState, SQLINTEGER nativeError,
                             const std::string& message)
    : std::runtime_error(message)
    , m_sqlState(sqlState)
    , m_nativeError(nativeError) {
}

OdbcException::OdbcException(const std::string& context, const std::vector<Diagnostic>& diagnostics)
    : std::runtime_error(context + ": " + ErrorHandler::formatDiagnostics(diagnostics))
    , m_sqlState(diagnostics.empty() ? "HY000" : diagnostics.front().sqlState)
    , m_nativeError(diagnostics.empty() ? 0 : diagnostics.front().nativeError) {
}

GatewayError::GatewayError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , m_kind(kind) {
}

}  // namespace odbcmcp
