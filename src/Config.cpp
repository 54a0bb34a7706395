#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace odbcmcp {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string toUpper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

bool parseBool(const std::string& key, const std::string& value) {
    std::string lower = toLower(value);
    if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") return true;
    if (lower == "false" || lower == "no" || lower == "0" || lower == "off") return false;
    throw std::invalid_argument("Invalid value for '" + key + "': " + value);
}

size_t parsePositive(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        long long parsed = std::stoll(value, &pos);
        if (pos != value.size() || parsed <= 0) {
            throw std::invalid_argument(value);
        }
        return static_cast<size_t>(parsed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid value for '" + key + "': " + value);
    }
}

const char* const kServerSection = "SERVER";

// Keys with a dedicated profile field; anything else is an extra parameter
bool applyProfileKey(ConnectionProfile& profile, const std::string& key, const std::string& value) {
    if (key == "connection_string") profile.connection_string = value;
    else if (key == "dsn") profile.dsn = value;
    else if (key == "username") profile.username = value;
    else if (key == "password") profile.password = value;
    else if (key == "driver") profile.driver = value;
    else if (key == "server") profile.server = value;
    else if (key == "database") profile.database = value;
    else if (key == "readonly") profile.readonly = parseBool(key, value);
    else if (key == "explicit_autocommit") profile.explicit_autocommit_override = parseBool(key, value);
    else return false;
    return true;
}

std::string jsonScalarToString(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return "";
    return value.dump();
}

}  // namespace

std::string ConnectionProfile::connectionString() const {
    if (!connection_string.empty()) {
        return connection_string;
    }

    std::vector<std::string> parts;
    if (!dsn.empty()) parts.push_back("DSN=" + dsn);
    if (!driver.empty()) parts.push_back("Driver={" + driver + "}");
    if (!server.empty()) parts.push_back("Server=" + server);
    if (!database.empty()) parts.push_back("Database=" + database);
    if (!username.empty()) parts.push_back("UID=" + username);
    if (!password.empty()) parts.push_back("PWD=" + password);

    for (const auto& [key, value] : extra_params) {
        parts.push_back(key + "=" + value);
    }

    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += ';';
        result += parts[i];
    }
    return result;
}

bool detectExplicitAutocommit(const ConnectionProfile& profile) {
    if (profile.explicit_autocommit_override) {
        return *profile.explicit_autocommit_override;
    }
    // ProvideX (Sage 100) refuses to toggle autocommit after connecting
    return toUpper(profile.connectionString()).find("PROVIDEX") != std::string::npos ||
           toUpper(profile.name) == "SAGE100";
}

std::string maskConnectionString(const std::string& connStr) {
    std::string result;
    size_t start = 0;
    while (start <= connStr.size()) {
        size_t end = connStr.find(';', start);
        if (end == std::string::npos) end = connStr.size();
        std::string part = connStr.substr(start, end - start);

        auto eq = part.find('=');
        if (eq != std::string::npos && toUpper(trim(part.substr(0, eq))) == "PWD") {
            part = part.substr(0, eq + 1) + "****";
        }
        result += part;
        if (end < connStr.size()) result += ';';
        start = end + 1;
    }
    return result;
}

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    config.source = path.string();
    std::string line;
    std::string current_section;
    ConnectionProfile* current_profile = nullptr;

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            current_profile = nullptr;
            if (current_section != kServerSection) {
                ConnectionProfile profile;
                profile.name = current_section;
                config.profiles.push_back(std::move(profile));
                current_profile = &config.profiles.back();
            }
            continue;
        }

        // Key-value pair
        auto eq_pos = std::min(line.find('='), line.find(':'));
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string raw_key = trim(line.substr(0, eq_pos));
        std::string key = toLower(raw_key);
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (current_section == kServerSection) {
            if (key == "default_connection") {
                if (!value.empty()) config.default_connection = value;
            }
            else if (key == "max_rows") config.limits.max_rows = parsePositive(key, value);
            else if (key == "timeout") config.limits.timeout = static_cast<int>(parsePositive(key, value));
            else if (key == "log_level") config.logging.level = toLower(value);
            else if (key == "log_file") config.logging.file = value;
        }
        else if (current_profile) {
            if (value.empty()) {
                continue;
            }
            if (!applyProfileKey(*current_profile, key, value)) {
                current_profile->extra_params.emplace_back(raw_key, value);
            }
        }
    }

    config.resolveDriverQuirks();
    return config;
}

std::filesystem::path Config::desktopConfigPath() {
#ifdef _WIN32
    const char* appdata = std::getenv("APPDATA");
    return std::filesystem::path(appdata ? appdata : "") / "Claude" / "claude_desktop_config.json";
#else
    const char* home = std::getenv("HOME");
    std::filesystem::path base(home ? home : "");
#ifdef __APPLE__
    return base / "Library" / "Application Support" / "Claude" / "claude_desktop_config.json";
#else
    return base / ".config" / "Claude" / "claude_desktop_config.json";
#endif
#endif
}

std::optional<Config> Config::loadFromDesktopConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        nlohmann::json root = nlohmann::json::parse(file);
        if (!root.contains("mcpServerEnv") || !root["mcpServerEnv"].contains("odbc_mcp_server")) {
            return std::nullopt;
        }
        const auto& section = root["mcpServerEnv"]["odbc_mcp_server"];

        Config config;
        config.source = path.string();

        if (section.contains("connections")) {
            for (const auto& [name, entry] : section["connections"].items()) {
                ConnectionProfile profile;
                profile.name = name;
                for (const auto& [key, value] : entry.items()) {
                    if (key == "additional_params") {
                        for (const auto& [pkey, pvalue] : value.items()) {
                            profile.extra_params.emplace_back(pkey, jsonScalarToString(pvalue));
                        }
                    } else if (key == "readonly" || key == "explicit_autocommit") {
                        std::string text = jsonScalarToString(value);
                        if (!value.is_boolean() && text.empty()) {
                            continue;
                        }
                        bool flag = value.is_boolean() ? value.get<bool>() : parseBool(key, text);
                        if (key == "readonly") profile.readonly = flag;
                        else profile.explicit_autocommit_override = flag;
                    } else if (key != "name") {
                        applyProfileKey(profile, key, jsonScalarToString(value));
                    }
                }
                config.profiles.push_back(std::move(profile));
            }
        }

        if (section.contains("default_connection") && section["default_connection"].is_string()) {
            config.default_connection = section["default_connection"].get<std::string>();
        }
        if (section.contains("max_rows")) {
            config.limits.max_rows = parsePositive("max_rows", jsonScalarToString(section["max_rows"]));
        }
        if (section.contains("timeout")) {
            config.limits.timeout =
                static_cast<int>(parsePositive("timeout", jsonScalarToString(section["timeout"])));
        }

        config.resolveDriverQuirks();
        return config;
    } catch (const std::exception& e) {
        spdlog::warn("Ignoring desktop config {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

Config Config::load(const std::string& explicitPath) {
    if (!explicitPath.empty()) {
        auto config = loadFromFile(explicitPath);
        if (!config) {
            throw std::runtime_error("Configuration file not found: " + explicitPath);
        }
        return *config;
    }

    if (const char* env_path = std::getenv("ODBC_MCP_CONFIG")) {
        if (*env_path && std::filesystem::exists(env_path)) {
            if (auto config = loadFromFile(env_path)) {
                return *config;
            }
        }
    }

    if (auto config = loadFromDesktopConfig(desktopConfigPath())) {
        return *config;
    }

    std::filesystem::path default_path = std::filesystem::path("config") / "config.ini";
    if (auto config = loadFromFile(default_path)) {
        return *config;
    }

    throw std::runtime_error(
        "No configuration found. Please provide a config file or set the "
        "ODBC_MCP_CONFIG environment variable.");
}

Config Config::parseArgs(int argc, char* argv[]) {
    CLI::App app{"ODBC MCP Server - expose ODBC databases to MCP clients"};

    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    bool debug = false;
    app.add_flag("-d,--debug", debug, "Enable debug logging");

    std::string log_file;
    app.add_option("--log-file", log_file, "Write logs to this file as well as stderr");

    size_t max_rows = 0;
    app.add_option("--max-rows", max_rows, "Default row limit for query results");

    int timeout = 0;
    app.add_option("--timeout", timeout, "Connection timeout in seconds");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    Config config = load(config_file);

    // Command line args override file config
    config.debug = debug;
    if (debug) config.logging.level = "debug";
    if (!log_file.empty()) config.logging.file = log_file;
    if (max_rows > 0) config.limits.max_rows = max_rows;
    if (timeout > 0) config.limits.timeout = timeout;

    return config;
}

void Config::validate() const {
    if (default_connection && !findProfile(*default_connection)) {
        throw std::invalid_argument("Default connection '" + *default_connection +
                                    "' not found in configured connections");
    }

    if (limits.max_rows == 0) {
        throw std::invalid_argument("max_rows must be positive");
    }

    if (limits.timeout <= 0) {
        throw std::invalid_argument("timeout must be positive");
    }

    for (size_t i = 0; i < profiles.size(); ++i) {
        const auto& profile = profiles[i];
        for (size_t j = 0; j < i; ++j) {
            if (profiles[j].name == profile.name) {
                throw std::invalid_argument("Duplicate connection '" + profile.name + "'");
            }
        }
        if (profile.connectionString().empty()) {
            spdlog::warn("Connection '{}' has no connection settings", profile.name);
        }
    }
}

const ConnectionProfile* Config::findProfile(const std::string& name) const {
    auto it = std::find_if(profiles.begin(), profiles.end(),
                           [&name](const ConnectionProfile& p) { return p.name == name; });
    return it != profiles.end() ? &*it : nullptr;
}

std::vector<std::string> Config::profileNames() const {
    std::vector<std::string> names;
    names.reserve(profiles.size());
    for (const auto& profile : profiles) {
        names.push_back(profile.name);
    }
    return names;
}

void Config::resolveDriverQuirks() {
    for (auto& profile : profiles) {
        profile.requires_explicit_autocommit = detectExplicitAutocommit(profile);
    }
}

}  // namespace odbcmcp
