#pragma once

#include "Config.hpp"
#include "Driver.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace odbcmcp {

// Owns one live driver connection per profile name.
//
// Connections are opened on first use and probed with "SELECT 1" before every
// reuse; a connection that fails the probe is closed and replaced. Not
// thread-safe: the server handles one request at a time.
class ConnectionManager {
public:
    ConnectionManager(const Config& config, Driver& driver);
    ~ConnectionManager();

    // Non-copyable
    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Explicit name > configured default > sole profile; throws GatewayError
    std::string resolveName(const std::optional<std::string>& name) const;

    // Throws GatewayError(UnknownProfile)
    const ConnectionProfile& profile(const std::string& name) const;

    // Live connection for the resolved profile; throws GatewayError
    DriverConnection& acquire(const std::optional<std::string>& name);

    // Close every live connection; safe to call repeatedly
    void closeAll();

    size_t liveCount() const { return m_live.size(); }
    const Config& config() const { return m_config; }
    Driver& driver() { return m_driver; }

private:
    bool probe(DriverConnection& conn) const;
    std::unique_ptr<DriverConnection> connect(const ConnectionProfile& profile);
    static void closeQuietly(const std::string& name, DriverConnection& conn);

    const Config& m_config;
    Driver& m_driver;
    std::map<std::string, std::unique_ptr<DriverConnection>> m_live;
};

}  // namespace odbcmcp
