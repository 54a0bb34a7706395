#include "QueryExecutor.hpp"
#include "ErrorHandler.hpp"
#include "SqlClassifier.hpp"
#include <spdlog/spdlog.h>

namespace odbcmcp {

SqlValue normalizeValue(DriverValue value) {
    switch (value.index()) {
        case 1:
            return std::get<int64_t>(value);
        case 2:
            return std::get<double>(value);
        case 3:
            return std::move(std::get<std::string>(value));
        case 4:
            return bytesToText(std::get<Bytes>(value));
        default:
            return std::monostate{};
    }
}

QueryExecutor::QueryExecutor(ConnectionManager& connections)
    : m_connections(connections) {
}

QueryResult QueryExecutor::execute(const std::string& sql,
                                   const std::optional<std::string>& profile,
                                   std::optional<size_t> maxRows) {
    std::string name = m_connections.resolveName(profile);
    const ConnectionProfile& prof = m_connections.profile(name);
    DriverConnection& conn = m_connections.acquire(name);

    if (prof.readonly && !SqlClassifier::isReadOnly(sql)) {
        spdlog::warn("Rejected write statement on read-only connection '{}'", name);
        throw GatewayError(ErrorKind::WriteNotAllowed,
                           "Write operations are not allowed on read-only connections");
    }

    QueryResult result;
    result.rowLimit = maxRows.value_or(m_connections.config().limits.max_rows);

    try {
        auto rs = conn.execute(sql);
        if (!rs) {
            return result;
        }

        for (const auto& col : rs->columns()) {
            result.columns.push_back(col.name);
        }

        std::vector<DriverValue> row;
        while (result.rows.size() < result.rowLimit && rs->fetch(row)) {
            std::vector<SqlValue> normalized;
            normalized.reserve(row.size());
            for (auto& value : row) {
                normalized.push_back(normalizeValue(std::move(value)));
            }
            result.rows.push_back(std::move(normalized));
        }
    } catch (const std::exception& e) {
        throw GatewayError(ErrorKind::ExecutionFailed, e.what());
    }

    spdlog::debug("Query on '{}' returned {} row(s)", name, result.rows.size());
    return result;
}

}  // namespace odbcmcp
