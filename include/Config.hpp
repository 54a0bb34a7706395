#pragma once

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <filesystem>

namespace odbcmcp {

struct ConnectionProfile {
    std::string name;

    // Either a raw connection string or the components below
    std::string connection_string;
    std::string dsn;
    std::string driver;
    std::string server;
    std::string database;
    std::string username;
    std::string password;
    std::vector<std::pair<std::string, std::string>> extra_params;

    bool readonly = true;

    // Driver quirks, resolved once at load time
    bool requires_explicit_autocommit = false;
    std::optional<bool> explicit_autocommit_override;

    // Assemble the driver connection string
    std::string connectionString() const;
};

struct ServerLimits {
    size_t max_rows = 1000;
    int timeout = 30;  // seconds
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct Config {
    std::vector<ConnectionProfile> profiles;  // load order
    std::optional<std::string> default_connection;
    ServerLimits limits;
    LoggingConfig logging;

    std::string source;  // where the config came from
    bool debug = false;

    // Load from INI file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Load from the desktop client's JSON config
    static std::optional<Config> loadFromDesktopConfig(const std::filesystem::path& path);
    static std::filesystem::path desktopConfigPath();

    // Resolve config source by precedence: explicit path, env, desktop, ./config
    static Config load(const std::string& explicitPath);

    // Parse command line arguments and load the config they point at
    static Config parseArgs(int argc, char* argv[]);

    // Throws std::invalid_argument on inconsistent settings
    void validate() const;

    const ConnectionProfile* findProfile(const std::string& name) const;
    std::vector<std::string> profileNames() const;

    // Fill in requires_explicit_autocommit on every profile
    void resolveDriverQuirks();
};

// True for driver families that need autocommit set at connect time
bool detectExplicitAutocommit(const ConnectionProfile& profile);

// Replace PWD=... values with ****
std::string maskConnectionString(const std::string& connStr);

}  // namespace odbcmcp
