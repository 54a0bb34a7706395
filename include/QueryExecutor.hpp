#pragma once

#include "ConnectionManager.hpp"
#include "Driver.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace odbcmcp {

// Serializable cell value; binary data is already converted to text
using SqlValue = std::variant<std::monostate, int64_t, double, std::string>;

struct QueryResult {
    std::vector<std::string> columns;
    std::vector<std::vector<SqlValue>> rows;
    size_t rowLimit = 0;  // effective limit the rows were cut at
};

SqlValue normalizeValue(DriverValue value);

// Runs ad-hoc SQL against a profile, enforcing its read-only flag
class QueryExecutor {
public:
    explicit QueryExecutor(ConnectionManager& connections);

    // Throws GatewayError(WriteNotAllowed / ExecutionFailed) or acquisition errors
    QueryResult execute(const std::string& sql,
                        const std::optional<std::string>& profile,
                        std::optional<size_t> maxRows = std::nullopt);

private:
    ConnectionManager& m_connections;
};

}  // namespace odbcmcp
