#pragma once

#include <string>

namespace odbcmcp {

// Syntactic read-only check for ad-hoc SQL.
//
// Comments are stripped, whitespace collapsed and the text uppercased, then
// matched against anchored prefixes of mutating statements (INSERT INTO,
// UPDATE, DELETE FROM, DROP, CREATE, ALTER, TRUNCATE, GRANT, REVOKE, MERGE,
// EXEC, EXECUTE, CALL, SET, USE).
//
// Only the start of the normalized text is inspected: "SELECT 1; DROP TABLE x"
// is classified read-only. This is a heuristic, not a parser.
class SqlClassifier {
public:
    static bool isReadOnly(const std::string& sql);

    // Comment-free, single-spaced, trimmed, uppercased form
    static std::string normalize(const std::string& sql);
};

}  // namespace odbcmcp
