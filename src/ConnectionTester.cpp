#include "ConnectionTester.hpp"
#include <spdlog/spdlog.h>

namespace odbcmcp {

namespace {

std::optional<std::string> fetchServerVersion(DriverConnection& conn) {
    try {
        auto rs = conn.execute("SELECT @@version");
        std::vector<DriverValue> row;
        if (rs && rs->fetch(row) && !row.empty() &&
            !std::holds_alternative<std::monostate>(row.front())) {
            return valueToText(row.front());
        }
    } catch (const std::exception& e) {
        // Not every engine understands @@version
        spdlog::debug("Server version unavailable: {}", e.what());
    }
    return std::nullopt;
}

std::optional<std::string> fetchInfo(DriverConnection& conn, InfoType type) {
    try {
        return conn.getInfo(type);
    } catch (const std::exception& e) {
        spdlog::debug("Driver info unavailable: {}", e.what());
        return std::nullopt;
    }
}

}  // namespace

ConnectionTester::ConnectionTester(ConnectionManager& connections)
    : m_connections(connections) {
}

ConnectionStatus ConnectionTester::test(const std::optional<std::string>& profile) {
    ConnectionStatus status;
    status.connectionName = profile.value_or(
        m_connections.config().default_connection.value_or(""));

    try {
        status.connectionName = m_connections.resolveName(profile);
        DriverConnection& conn = m_connections.acquire(status.connectionName);

        status.serverVersion = fetchServerVersion(conn);
        status.driverName = fetchInfo(conn, InfoType::DriverName);
        status.driverVersion = fetchInfo(conn, InfoType::DriverVersion);
        status.databaseName = fetchInfo(conn, InfoType::DatabaseName);
        status.dbmsName = fetchInfo(conn, InfoType::DbmsName);
        status.dbmsVersion = fetchInfo(conn, InfoType::DbmsVersion);
        status.connected = true;
    } catch (const std::exception& e) {
        spdlog::warn("Connection test for '{}' failed: {}", status.connectionName, e.what());
        status.connected = false;
        status.error = e.what();
    }

    return status;
}

}  // namespace odbcmcp
