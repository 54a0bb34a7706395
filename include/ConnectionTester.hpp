#pragma once

#include "ConnectionManager.hpp"
#include <optional>
#include <string>

namespace odbcmcp {

struct ConnectionStatus {
    bool connected = false;
    std::string connectionName;
    std::optional<std::string> error;

    // Best-effort details; absent when the driver cannot report them
    std::optional<std::string> serverVersion;
    std::optional<std::string> driverName;
    std::optional<std::string> driverVersion;
    std::optional<std::string> databaseName;
    std::optional<std::string> dbmsName;
    std::optional<std::string> dbmsVersion;
};

// Connection check for the test-connection tool; never throws
class ConnectionTester {
public:
    explicit ConnectionTester(ConnectionManager& connections);

    ConnectionStatus test(const std::optional<std::string>& profile);

private:
    ConnectionManager& m_connections;
};

}  // namespace odbcmcp
