#pragma once

#include "Config.hpp"
#include "Driver.hpp"
#include "ErrorHandler.hpp"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace odbcmcp {
namespace fake {

// Scripted result for one SQL statement
struct FakeTable {
    std::vector<ResultColumn> columns;
    std::vector<std::vector<DriverValue>> rows;
};

inline ResultColumn column(const std::string& name, int typeCode = 12, size_t size = 50,
                           bool nullable = true) {
    ResultColumn col;
    col.name = name;
    col.typeCode = typeCode;
    col.size = size;
    col.nullable = nullable;
    return col;
}

class FakeResultSet : public DriverResultSet {
public:
    explicit FakeResultSet(FakeTable table) : m_table(std::move(table)) {}

    const std::vector<ResultColumn>& columns() const override { return m_table.columns; }

    bool fetch(std::vector<DriverValue>& row) override {
        if (m_next >= m_table.rows.size()) {
            return false;
        }
        row = m_table.rows[m_next++];
        ++fetched;
        return true;
    }

    size_t fetched = 0;

private:
    FakeTable m_table;
    size_t m_next = 0;
};

class FakeDriver;

// Not derived from std::exception, like a fault escaping a driver callback
struct ForeignFault {
    std::string statement;
};

class FakeConnection : public DriverConnection {
public:
    FakeConnection(FakeDriver& driver, int id) : m_driver(driver), m_id(id) {}

    std::unique_ptr<DriverResultSet> execute(const std::string& sql) override;
    std::vector<CatalogTable> tables() override;
    std::vector<CatalogColumn> columns(const std::optional<std::string>& schema,
                                       const std::string& table) override;
    std::optional<std::string> getInfo(InfoType type) override;
    void close() override;

    int id() const { return m_id; }

    // Every statement fails, including the liveness probe
    bool broken = false;

private:
    FakeDriver& m_driver;
    int m_id;
};

// In-memory driver with failure injection and call recording
class FakeDriver : public Driver {
public:
    std::unique_ptr<DriverConnection> connect(const std::string& connectionString,
                                              const ConnectOptions& options) override {
        connectionStrings.push_back(connectionString);
        lastOptions = options;
        if (failConnect) {
            throw OdbcException("08001", 17, "[FakeDriver] Unable to connect");
        }
        int id = ++m_nextId;
        auto conn = std::make_unique<FakeConnection>(*this, id);
        connections.push_back(conn.get());
        return conn;
    }

    std::vector<DataSourceInfo> dataSources() override { return sources; }

    // Script a result for an exact statement
    void script(const std::string& sql, FakeTable table) { results[sql] = std::move(table); }

    // Statements other than the liveness probe
    std::vector<std::string> userStatements() const {
        std::vector<std::string> out;
        for (const auto& sql : executed) {
            if (sql != "SELECT 1") out.push_back(sql);
        }
        return out;
    }

    int closeCount(int id) const {
        auto it = closeCalls.find(id);
        return it == closeCalls.end() ? 0 : it->second;
    }

    // Scripted behaviour
    std::map<std::string, FakeTable> results;
    std::set<std::string> failingStatements;
    std::set<std::string> foreignFaultStatements;  // throw a non-std exception
    bool failConnect = false;
    bool failClose = false;

    bool catalogSupported = true;
    std::vector<CatalogTable> catalogTables;
    std::map<std::string, std::vector<CatalogColumn>> catalogColumns;
    std::map<InfoType, std::string> info;
    std::vector<DataSourceInfo> sources;

    // Recorders
    std::vector<std::string> executed;
    std::vector<std::string> connectionStrings;
    std::optional<ConnectOptions> lastOptions;
    std::map<int, int> closeCalls;
    std::vector<FakeConnection*> connections;  // not owned; may dangle after close

private:
    int m_nextId = 0;
};

inline std::unique_ptr<DriverResultSet> FakeConnection::execute(const std::string& sql) {
    m_driver.executed.push_back(sql);
    if (broken) {
        throw OdbcException("08S01", 0, "[FakeDriver] Communication link failure");
    }
    if (m_driver.failingStatements.count(sql)) {
        throw OdbcException("42S02", 208, "[FakeDriver] Invalid object name");
    }
    if (m_driver.foreignFaultStatements.count(sql)) {
        throw ForeignFault{sql};
    }
    auto it = m_driver.results.find(sql);
    if (it == m_driver.results.end()) {
        return std::make_unique<FakeResultSet>(FakeTable{});
    }
    return std::make_unique<FakeResultSet>(it->second);
}

inline std::vector<CatalogTable> FakeConnection::tables() {
    if (broken || !m_driver.catalogSupported) {
        throw OdbcException("IM001", 0, "[FakeDriver] Driver does not support this function");
    }
    return m_driver.catalogTables;
}

inline std::vector<CatalogColumn> FakeConnection::columns(const std::optional<std::string>& schema,
                                                          const std::string& table) {
    if (broken || !m_driver.catalogSupported) {
        throw OdbcException("IM001", 0, "[FakeDriver] Driver does not support this function");
    }
    std::string key = schema ? *schema + "." + table : table;
    auto it = m_driver.catalogColumns.find(key);
    if (it == m_driver.catalogColumns.end()) {
        return {};
    }
    return it->second;
}

inline std::optional<std::string> FakeConnection::getInfo(InfoType type) {
    auto it = m_driver.info.find(type);
    if (it == m_driver.info.end()) {
        return std::nullopt;
    }
    return it->second;
}

inline void FakeConnection::close() {
    ++m_driver.closeCalls[m_id];
    if (m_driver.failClose) {
        throw OdbcException("08003", 0, "[FakeDriver] Connection not open");
    }
}

inline CatalogColumn catalogColumn(const std::string& name, const std::string& typeName,
                                   size_t size, bool nullable, int position) {
    CatalogColumn col;
    col.name = name;
    col.typeName = typeName;
    col.size = size;
    col.nullable = nullable;
    col.position = position;
    return col;
}

inline ConnectionProfile makeProfile(const std::string& name, bool readonly = true) {
    ConnectionProfile profile;
    profile.name = name;
    profile.dsn = name;
    profile.readonly = readonly;
    return profile;
}

}  // namespace fake
}  // namespace odbcmcp
