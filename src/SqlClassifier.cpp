#include "SqlClassifier.hpp"
#include <regex>
#include <vector>
#include <algorithm>
#include <cctype>

namespace odbcmcp {

namespace {

const std::vector<std::regex>& mutatingPatterns() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(^\s*INSERT\s+INTO)"),
        std::regex(R"(^\s*UPDATE\s+)"),
        std::regex(R"(^\s*DELETE\s+FROM)"),
        std::regex(R"(^\s*DROP\s+)"),
        std::regex(R"(^\s*CREATE\s+)"),
        std::regex(R"(^\s*ALTER\s+)"),
        std::regex(R"(^\s*TRUNCATE\s+)"),
        std::regex(R"(^\s*GRANT\s+)"),
        std::regex(R"(^\s*REVOKE\s+)"),
        std::regex(R"(^\s*MERGE\s+)"),
        std::regex(R"(^\s*EXEC\s+)"),
        std::regex(R"(^\s*EXECUTE\s+)"),
        std::regex(R"(^\s*CALL\s+)"),
        std::regex(R"(^\s*SET\s+)"),
        std::regex(R"(^\s*USE\s+)"),
    };
    return patterns;
}

std::string stripComments(const std::string& sql) {
    std::string out;
    out.reserve(sql.size());

    size_t i = 0;
    while (i < sql.size()) {
        if (sql.compare(i, 2, "--") == 0) {
            // Line comment runs through the newline
            size_t end = sql.find('\n', i + 2);
            out += ' ';
            i = (end == std::string::npos) ? sql.size() : end + 1;
        } else if (sql.compare(i, 2, "/*") == 0) {
            size_t end = sql.find("*/", i + 2);
            if (end == std::string::npos) {
                // Unterminated block comment is left as text
                out += sql[i++];
                continue;
            }
            out += ' ';
            i = end + 2;
        } else {
            out += sql[i++];
        }
    }
    return out;
}

// Byte length of the whitespace sequence starting at pos, or 0. Covers ASCII
// space and the separators 0x1c-0x1f, plus the UTF-8 encoded Unicode spaces
// a driver would treat as token separators.
size_t whitespaceLength(const std::string& s, size_t pos) {
    unsigned char c = static_cast<unsigned char>(s[pos]);
    if (std::isspace(c) || (c >= 0x1c && c <= 0x1f)) {
        return 1;
    }
    auto byteAt = [&s](size_t i) {
        return i < s.size() ? static_cast<unsigned char>(s[i]) : 0;
    };
    unsigned char b1 = byteAt(pos + 1);
    unsigned char b2 = byteAt(pos + 2);
    if (c == 0xC2 && (b1 == 0xA0 || b1 == 0x85)) {
        return 2;  // NBSP, NEL
    }
    if (c == 0xE1 && b1 == 0x9A && b2 == 0x80) {
        return 3;  // U+1680
    }
    if (c == 0xE2 && b1 == 0x80 &&
        ((b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF)) {
        return 3;  // U+2000..U+200A, U+2028, U+2029, U+202F
    }
    if (c == 0xE2 && b1 == 0x81 && b2 == 0x9F) {
        return 3;  // U+205F
    }
    if (c == 0xE3 && b1 == 0x80 && b2 == 0x80) {
        return 3;  // U+3000
    }
    return 0;
}

}  // namespace

std::string SqlClassifier::normalize(const std::string& sql) {
    std::string stripped = stripComments(sql);

    std::string result;
    result.reserve(stripped.size());
    bool pendingSpace = false;
    size_t i = 0;
    while (i < stripped.size()) {
        size_t spaceLen = whitespaceLength(stripped, i);
        if (spaceLen > 0) {
            pendingSpace = !result.empty();
            i += spaceLen;
            continue;
        }
        char c = stripped[i++];
        if (pendingSpace) {
            result += ' ';
            pendingSpace = false;
        }
        result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

bool SqlClassifier::isReadOnly(const std::string& sql) {
    std::string normalized = normalize(sql);

    const auto& patterns = mutatingPatterns();
    return std::none_of(patterns.begin(), patterns.end(), [&normalized](const std::regex& pattern) {
        return std::regex_search(normalized, pattern);
    });
}

}  // namespace odbcmcp
