#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/ConfigManager.h"
#include "core/DirectoryConfig.h"
#include "core/Errors.h"
#include "mcp/MCPServer.h"
#include "tools/LogTools.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"

namespace {
    // stdout 是协议通道,帮助信息也走 stderr
    void printUsage() {
        std::cerr << "Usage: log-inspector [--log-dir <path>]... [--config <file.json>] [--server-log <file>] [--debug]\n"
                  << "\n"
                  << "MCP server (stdio) for inspecting log files.\n"
                  << "\n"
                  << "Log directory priority (highest to lowest):\n"
                  << "  1. --log-dir command line arguments (can specify multiple)\n"
                  << "  2. log_dirs in the --config file\n"
                  << "  3. LOG_MCP_DIR environment variable (colon-separated paths)\n"
                  << "  4. $XDG_RUNTIME_DIR/log (default)\n"
                  << "\n"
                  << "Examples:\n"
                  << "  log-inspector                                          # Use default $XDG_RUNTIME_DIR/log\n"
                  << "  log-inspector --log-dir /var/log                       # Use single custom directory\n"
                  << "  log-inspector --log-dir /var/log --log-dir /tmp/logs   # Use multiple directories\n"
                  << "  LOG_MCP_DIR=/var/log:/tmp/logs log-inspector           # Use environment variable\n";
    }

    struct CliOptions {
        std::vector<std::string> logDirs;
        std::string configPath;
        std::string serverLogPath;
        bool debug = false;
        bool help = false;
        bool version = false;
    };

    CliOptions parseArgs(int argc, char* argv[]) {
        CliOptions opts;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto takeValue = [&](const std::string& flag) -> std::string {
                if (i + 1 >= argc) {
                    throw std::invalid_argument(flag + " requires a value");
                }
                return argv[++i];
            };

            if (arg == "--log-dir") {
                opts.logDirs.push_back(takeValue(arg));
            } else if (arg.rfind("--log-dir=", 0) == 0) {
                opts.logDirs.push_back(arg.substr(10));
            } else if (arg == "--config") {
                opts.configPath = takeValue(arg);
            } else if (arg == "--server-log") {
                opts.serverLogPath = takeValue(arg);
            } else if (arg == "--debug") {
                opts.debug = true;
            } else if (arg == "--help" || arg == "-h") {
                opts.help = true;
            } else if (arg == "--version") {
                opts.version = true;
            } else {
                throw std::invalid_argument("Unknown argument: " + arg);
            }
        }
        return opts;
    }
}

int main(int argc, char* argv[]) {
    CliOptions opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n";
        printUsage();
        return 2;
    }
    if (opts.help) {
        printUsage();
        return 0;
    }
    if (opts.version) {
        std::cerr << MCPServer::SERVER_NAME << " " << MCPServer::SERVER_VERSION << std::endl;
        return 0;
    }

    Config cfg;
    if (!opts.configPath.empty()) {
        try {
            cfg = Config::load(opts.configPath);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load config: " << e.what() << std::endl;
            return 1;
        }
    }
    // 命令行覆盖配置文件
    if (!opts.logDirs.empty()) cfg.logDirs = opts.logDirs;
    if (!opts.serverLogPath.empty()) cfg.serverLogPath = opts.serverLogPath;
    if (opts.debug) cfg.enableDebug = true;

    Logger& logger = Logger::getInstance();
    logger.setLogFile(cfg.serverLogPath);
    logger.setDebugEnabled(cfg.enableDebug);

    DirectoryResolution resolution;
    try {
        resolution = DirectoryConfig::resolve(cfg.logDirs);
    } catch (const ConfigurationError& e) {
        logger.error(std::string("Error: ") + e.what());
        return 1;
    }

    for (const auto& missing : resolution.missingExplicit) {
        logger.warn("Log directory does not exist: " + missing.u8string());
    }
    for (const auto& dir : resolution.directories) {
        logger.debug("Log directory: " + dir.u8string());
    }

    // 目录列表在此之后不再修改,工具持有其 const 引用
    const PermittedDirectories& directories = resolution.directories;

    ToolRegistry registry;
    registerLogTools(registry, directories);

    MCPServer server(registry, directories);
    server.run(std::cin, std::cout);
    return 0;
}
