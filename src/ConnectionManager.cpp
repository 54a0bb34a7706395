#include "ConnectionManager.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace odbcmcp {

ConnectionManager::ConnectionManager(const Config& config, Driver& driver)
    : m_config(config), m_driver(driver) {
}

ConnectionManager::~ConnectionManager() {
    closeAll();
}

std::string ConnectionManager::resolveName(const std::optional<std::string>& name) const {
    if (name && !name->empty()) {
        return *name;
    }

    if (m_config.default_connection) {
        return *m_config.default_connection;
    }

    // If only one connection is defined, use it
    if (m_config.profiles.size() == 1) {
        return m_config.profiles.front().name;
    }

    throw GatewayError(ErrorKind::AmbiguousDefault,
                       "No default connection specified and multiple connections exist");
}

const ConnectionProfile& ConnectionManager::profile(const std::string& name) const {
    const ConnectionProfile* found = m_config.findProfile(name);
    if (!found) {
        throw GatewayError(ErrorKind::UnknownProfile,
                           "Connection '" + name + "' not found in configuration");
    }
    return *found;
}

DriverConnection& ConnectionManager::acquire(const std::optional<std::string>& name) {
    std::string resolved = resolveName(name);
    const ConnectionProfile& prof = profile(resolved);

    // Return existing connection if it still answers
    auto it = m_live.find(resolved);
    if (it != m_live.end()) {
        if (probe(*it->second)) {
            return *it->second;
        }

        spdlog::warn("Connection '{}' is stale, reconnecting", resolved);
        closeQuietly(resolved, *it->second);
        m_live.erase(it);
    }

    auto conn = connect(prof);
    DriverConnection& ref = *conn;
    m_live.emplace(resolved, std::move(conn));
    return ref;
}

void ConnectionManager::closeAll() {
    if (m_live.empty()) {
        return;
    }

    for (auto& [name, conn] : m_live) {
        closeQuietly(name, *conn);
    }
    spdlog::info("Closed {} database connection(s)", m_live.size());
    m_live.clear();
}

bool ConnectionManager::probe(DriverConnection& conn) const {
    try {
        conn.execute("SELECT 1");
        return true;
    } catch (const OdbcException& e) {
        spdlog::debug("Connection probe failed{}: {}",
                      e.isConnectionError() ? " (link lost)" : "", e.what());
        return false;
    } catch (const std::exception& e) {
        spdlog::debug("Connection probe failed: {}", e.what());
        return false;
    }
}

std::unique_ptr<DriverConnection> ConnectionManager::connect(const ConnectionProfile& profile) {
    std::string connStr = profile.connectionString();

    ConnectOptions options;
    options.timeoutSeconds = m_config.limits.timeout;
    options.explicitAutocommit = profile.requires_explicit_autocommit;
    options.utf8 = true;

    spdlog::info("Connecting to '{}' ({}){}", profile.name, maskConnectionString(connStr),
                 options.explicitAutocommit ? " with explicit autocommit" : "");

    try {
        auto conn = m_driver.connect(connStr, options);
        if (!conn) {
            throw std::runtime_error("driver returned no connection");
        }
        return conn;
    } catch (const OdbcException& e) {
        spdlog::error("Connection '{}' failed: {} ({})", profile.name,
                      ErrorHandler::describeSqlState(e.sqlState()), e.sqlState());
        throw GatewayError(ErrorKind::ConnectionFailed,
                           "Failed to connect to '" + profile.name + "': " + e.what());
    } catch (const std::exception& e) {
        throw GatewayError(ErrorKind::ConnectionFailed,
                           "Failed to connect to '" + profile.name + "': " + e.what());
    }
}

void ConnectionManager::closeQuietly(const std::string& name, DriverConnection& conn) {
    try {
        conn.close();
    } catch (const std::exception& e) {
        spdlog::debug("Ignoring error closing connection '{}': {}", name, e.what());
    }
}

}  // namespace odbcmcp
