#pragma once

/**
 * @file OdbcDriver.hpp
 * @brief Driver implementation backed by the system ODBC driver manager.
 */

#include "Driver.hpp"
#include "OdbcEnvironment.hpp"

namespace odbcmcp {

/**
 * @class OdbcDriver
 * @brief Factory for OdbcConnection instances.
 *
 * Holds the process-wide ODBC environment. Must outlive every
 * connection it creates.
 */
class OdbcDriver : public Driver {
public:
    /**
     * @brief Initialize the ODBC environment.
     * @throws OdbcException if the driver manager is unavailable.
     */
    OdbcDriver() = default;

    std::unique_ptr<DriverConnection> connect(const std::string& connectionString,
                                              const ConnectOptions& options) override;

    std::vector<DataSourceInfo> dataSources() override;

private:
    OdbcEnvironment m_env;
};

}  // namespace odbcmcp
