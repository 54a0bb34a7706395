#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ErrorHandler.hpp"

using namespace odbcmcp;
using ::testing::HasSubstr;

class ErrorHandlerTest : public ::testing::Test {
};

// Diagnostic formatting tests
TEST_F(ErrorHandlerTest, EmptyDiagnosticsAreUnknown) {
    EXPECT_EQ(ErrorHandler::formatDiagnostics({}), "Unknown ODBC error");
}

TEST_F(ErrorHandlerTest, DiagnosticsAreJoined) {
    std::vector<Diagnostic> diagnostics = {
        {"42S02", 208, "Invalid object name 'x'"},
        {"42000", 0, "Statement could not be prepared"},
    };

    EXPECT_EQ(ErrorHandler::formatDiagnostics(diagnostics),
              "[42S02] Invalid object name 'x' (208); [42000] Statement could not be prepared");
}

TEST_F(ErrorHandlerTest, NullHandleHasNoDiagnostics) {
    EXPECT_TRUE(ErrorHandler::getDiagnostics(SQL_HANDLE_STMT, SQL_NULL_HANDLE).empty());
}

// check() tests
TEST_F(ErrorHandlerTest, CheckAcceptsSuccessCodes) {
    EXPECT_NO_THROW(ErrorHandler::check(SQL_SUCCESS, SQL_HANDLE_STMT, SQL_NULL_HANDLE, "ok"));
    EXPECT_NO_THROW(ErrorHandler::check(SQL_SUCCESS_WITH_INFO, SQL_HANDLE_STMT, SQL_NULL_HANDLE, "ok"));
    EXPECT_NO_THROW(ErrorHandler::check(SQL_NO_DATA, SQL_HANDLE_STMT, SQL_NULL_HANDLE, "ok"));
}

TEST_F(ErrorHandlerTest, CheckThrowsOnError) {
    try {
        ErrorHandler::check(SQL_ERROR, SQL_HANDLE_STMT, SQL_NULL_HANDLE, "SQLExecDirect");
        FAIL() << "expected OdbcException";
    } catch (const OdbcException& e) {
        EXPECT_EQ(e.sqlState(), "HY000");
        EXPECT_THAT(e.what(), HasSubstr("SQLExecDirect"));
        EXPECT_THAT(e.what(), HasSubstr("Unknown ODBC error"));
    }
}

TEST_F(ErrorHandlerTest, CheckThrowsOnInvalidHandle) {
    EXPECT_THROW(ErrorHandler::check(SQL_INVALID_HANDLE, SQL_HANDLE_DBC, SQL_NULL_HANDLE, "SQLConnect"),
                 OdbcException);
}

// SQLSTATE classification tests
TEST_F(ErrorHandlerTest, IsConnectionError) {
    EXPECT_TRUE(ErrorHandler::isConnectionError("08001"));
    EXPECT_TRUE(ErrorHandler::isConnectionError("08S01"));
    EXPECT_TRUE(ErrorHandler::isConnectionError("HYT01"));
}

TEST_F(ErrorHandlerTest, IsNotConnectionError) {
    EXPECT_FALSE(ErrorHandler::isConnectionError("42S02"));
    EXPECT_FALSE(ErrorHandler::isConnectionError("HYT00"));
    EXPECT_FALSE(ErrorHandler::isConnectionError(""));
}

TEST_F(ErrorHandlerTest, IsNotSupported) {
    EXPECT_TRUE(ErrorHandler::isNotSupported("HYC00"));
    EXPECT_TRUE(ErrorHandler::isNotSupported("IM001"));
    EXPECT_FALSE(ErrorHandler::isNotSupported("42000"));
}

TEST_F(ErrorHandlerTest, DescribeSqlState) {
    EXPECT_EQ(ErrorHandler::describeSqlState("HYT00"), "Timeout expired");
    EXPECT_EQ(ErrorHandler::describeSqlState("IM002"), "Data source not found");
    EXPECT_EQ(ErrorHandler::describeSqlState("08001"), "Connection exception");
    EXPECT_EQ(ErrorHandler::describeSqlState("28000"), "Invalid authorization specification");
    EXPECT_EQ(ErrorHandler::describeSqlState("42S02"), "Syntax error or access violation");
    EXPECT_EQ(ErrorHandler::describeSqlState("HY001"), "General driver error");
}

TEST_F(ErrorHandlerTest, DescribeUnknownSqlState) {
    EXPECT_THAT(ErrorHandler::describeSqlState("ZZ999"), HasSubstr("ZZ999"));
    EXPECT_EQ(ErrorHandler::describeSqlState(""), "Unknown error");
}

TEST_F(ErrorHandlerTest, ErrorKindNames) {
    EXPECT_EQ(errorKindName(ErrorKind::UnknownProfile), "UnknownProfile");
    EXPECT_EQ(errorKindName(ErrorKind::AmbiguousDefault), "AmbiguousDefault");
    EXPECT_EQ(errorKindName(ErrorKind::WriteNotAllowed), "WriteNotAllowed");
    EXPECT_EQ(errorKindName(ErrorKind::SchemaUnavailable), "SchemaUnavailable");
    EXPECT_EQ(errorKindName(ErrorKind::UnknownTool), "UnknownTool");
}

// ErrorContext tests
class ErrorContextTest : public ::testing::Test {
};

TEST_F(ErrorContextTest, SetAndGetContext) {
    EXPECT_TRUE(ErrorContext::current().empty());

    {
        ErrorContext ctx("execute-query");
        EXPECT_EQ(ErrorContext::current(), "execute-query");
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

TEST_F(ErrorContextTest, NestedContext) {
    {
        ErrorContext ctx1("list-tables");
        {
            ErrorContext ctx2("warehouse");
            EXPECT_EQ(ErrorContext::current(), "list-tables > warehouse");
        }
        EXPECT_EQ(ErrorContext::current(), "list-tables");
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

TEST_F(ErrorContextTest, ContextRestoredOnException) {
    try {
        ErrorContext ctx1("outer");
        {
            ErrorContext ctx2("inner");
            throw std::runtime_error("test");
        }
    } catch (const std::runtime_error&) {
        // Context should be restored even on exception
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

// Exception tests
class OdbcExceptionTest : public ::testing::Test {
};

TEST_F(OdbcExceptionTest, CreateWithStateAndMessage) {
    OdbcException ex("08001", 17, "Server does not exist");

    EXPECT_EQ(ex.sqlState(), "08001");
    EXPECT_EQ(ex.nativeError(), 17);
    EXPECT_TRUE(ex.isConnectionError());
    EXPECT_STREQ(ex.what(), "Server does not exist");
}

TEST_F(OdbcExceptionTest, CreateFromDiagnosticsUsesFirstRecord) {
    std::vector<Diagnostic> diagnostics = {
        {"28000", 18456, "Login failed"},
        {"01S00", 0, "Invalid connection string attribute"},
    };
    OdbcException ex("SQLDriverConnect", diagnostics);

    EXPECT_EQ(ex.sqlState(), "28000");
    EXPECT_EQ(ex.nativeError(), 18456);
    EXPECT_FALSE(ex.isConnectionError());
    EXPECT_THAT(ex.what(), HasSubstr("SQLDriverConnect: [28000] Login failed (18456)"));
}

TEST_F(OdbcExceptionTest, CanBeCaughtAsRuntimeError) {
    bool caught = false;

    try {
        throw OdbcException("HY000", 0, "test");
    } catch (const std::runtime_error&) {
        caught = true;
    }

    EXPECT_TRUE(caught);
}

TEST_F(OdbcExceptionTest, GatewayErrorCarriesKind) {
    GatewayError ex(ErrorKind::WriteNotAllowed, "no writes");

    EXPECT_EQ(ex.kind(), ErrorKind::WriteNotAllowed);
    EXPECT_STREQ(ex.what(), "no writes");
}
