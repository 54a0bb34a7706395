/**
 * @file OdbcDriver.cpp
 * @brief Implementation of the ODBC driver factory.
 */

#include "OdbcDriver.hpp"
#include "OdbcConnection.hpp"

namespace odbcmcp {

std::unique_ptr<DriverConnection> OdbcDriver::connect(const std::string& connectionString,
                                                      const ConnectOptions& options) {
    return std::make_unique<OdbcConnection>(m_env, connectionString, options);
}

std::vector<DataSourceInfo> OdbcDriver::dataSources() {
    return m_env.dataSources();
}

}  // namespace odbcmcp
