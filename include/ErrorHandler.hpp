#pragma once

#include <sql.h>
#include <sqlext.h>
#include <string>
#include <vector>
#include <stdexcept>

namespace odbcmcp {

// Failure taxonomy surfaced to tool callers
enum class ErrorKind {
    UnknownProfile,
    AmbiguousDefault,
    ConnectionFailed,
    WriteNotAllowed,
    ExecutionFailed,
    MetadataUnavailable,
    SchemaUnavailable,
    InvalidArgument,
    UnknownTool
};

std::string errorKindName(ErrorKind kind);

// One ODBC diagnostic record
struct Diagnostic {
    std::string sqlState;
    SQLINTEGER nativeError = 0;
    std::string message;
};

// ODBC diagnostics helpers
class ErrorHandler {
public:
    // Collect every diagnostic record attached to a handle
    static std::vector<Diagnostic> getDiagnostics(SQLSMALLINT handleType, SQLHANDLE handle);

    // Join diagnostic records into one human-readable message
    static std::string formatDiagnostics(const std::vector<Diagnostic>& diagnostics);
    static std::string getErrorMessage(SQLSMALLINT handleType, SQLHANDLE handle);

    // Throw OdbcException if ret is SQL_ERROR or SQL_INVALID_HANDLE
    static void check(SQLRETURN ret, SQLSMALLINT handleType, SQLHANDLE handle,
                      const std::string& context);

    // SQLSTATE class 08 and connection timeouts
    static bool isConnectionError(const std::string& sqlState);

    // Optional feature / function not supported by the driver
    static bool isNotSupported(const std::string& sqlState);

    // Short description of a SQLSTATE by class
    static std::string describeSqlState(const std::string& sqlState);
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    ErrorContext(const std::string& context);
    ~ErrorContext();

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

// Exception raised by the driver layer
class OdbcException : public std::runtime_error {
public:
    OdbcException(const std::string& sqlState, SQLINTEGER nativeError, const std::string& message);
    OdbcException(const std::string& context, const std::vector<Diagnostic>& diagnostics);

    const std::string& sqlState() const { return m_sqlState; }
    SQLINTEGER nativeError() const { return m_nativeError; }
    bool isConnectionError() const { return ErrorHandler::isConnectionError(m_sqlState); }

private:
    std::string m_sqlState;
    SQLINTEGER m_nativeError;
};

// Exception raised by the gateway services
class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

}  // namespace odbcmcp
