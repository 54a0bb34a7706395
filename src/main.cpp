#include "Config.hpp"
#include "ConnectionManager.hpp"
#include "ConnectionTester.hpp"
#include "McpServer.hpp"
#include "MetadataService.hpp"
#include "OdbcDriver.hpp"
#include "QueryExecutor.hpp"
#include "ToolDispatcher.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <csignal>
#include <cstring>
#include <vector>

using namespace odbcmcp;

namespace {

volatile std::sig_atomic_t g_signal_received = 0;

void signalHandler(int signal) {
    g_signal_received = signal;
}

void setupSignalHandlers() {
    // No SA_RESTART: a signal must interrupt the blocking read on stdin
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

// stdout carries the protocol stream, so the console sink is stderr
void setupLogging(const std::string& levelName, const std::string& logFile = "") {
    try {
        spdlog::level::level_enum level = spdlog::level::from_str(levelName);
        if (level == spdlog::level::off && levelName != "off") {
            level = spdlog::level::info;
        }

        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(level);
        sinks.push_back(console_sink);

        if (!logFile.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
                file_sink->set_level(level);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logFile << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("odbc-mcp", sinks.begin(), sinks.end());
        logger->set_level(level);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void printBanner() {
    std::cerr << "\n ODBC MCP Server v" << kServerVersion << "\n"
              << " Query ODBC data sources from MCP clients\n" << std::endl;
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [options]\n\n";
    std::cerr << "Configuration:\n";
    std::cerr << "  -c, --config <file>    Path to INI configuration file\n";
    std::cerr << "                         (default: $ODBC_MCP_CONFIG, desktop client config,\n";
    std::cerr << "                          then ./config/config.ini)\n";
    std::cerr << "\nLimits:\n";
    std::cerr << "  --max-rows <N>         Default row limit for query results (default: 1000)\n";
    std::cerr << "  --timeout <seconds>    Connection timeout (default: 30)\n";
    std::cerr << "\nLogging:\n";
    std::cerr << "  -d, --debug            Enable debug output\n";
    std::cerr << "  --log-file <file>      Also write logs to this file\n";
    std::cerr << "\nOther Options:\n";
    std::cerr << "  -h, --help             Show this help message\n";
    std::cerr << "  -V, --version          Show version information\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << program << " -c config/config.ini\n";
    std::cerr << "  ODBC_MCP_CONFIG=/etc/odbc-mcp.ini " << program << " --max-rows 200\n";
    std::cerr << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printBanner();
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-V" || arg == "--version") {
            std::cerr << kServerName << " version " << kServerVersion << std::endl;
            return 0;
        }
    }

    // Config loading logs too; keep it off stdout from the start
    setupLogging("info");

    Config config;
    try {
        config = Config::parseArgs(argc, argv);
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    setupLogging(config.logging.level, config.logging.file);
    printBanner();

    spdlog::info("Starting ODBC MCP server");
    spdlog::info("Configuration: {}", config.source);
    spdlog::info("{} connection(s) configured, default: {}", config.profiles.size(),
                 config.default_connection.value_or("(none)"));
    spdlog::info("Row limit {}, timeout {}s", config.limits.max_rows, config.limits.timeout);

    setupSignalHandlers();

    int result = 0;
    try {
        OdbcDriver driver;
        ConnectionManager connections(config, driver);
        MetadataService metadata(connections);
        QueryExecutor executor(connections);
        ConnectionTester tester(connections);
        ToolDispatcher dispatcher(connections, metadata, executor, tester);
        McpServer server(dispatcher);

        server.run(std::cin, std::cout, &g_signal_received);

        if (g_signal_received) {
            spdlog::info("Received signal {}, shutting down", g_signal_received);
        }

        connections.closeAll();
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        result = 1;
    }

    spdlog::info("ODBC MCP server stopped");
    return result;
}
