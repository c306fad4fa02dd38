#include <iostream>
#include <string>
#include <vector>
#include <filesystem>
#include <stdexcept>
#include "core/ConfigManager.h"
#include "mcp/ProcessLauncher.h"
#include "mcp/ToolDiscovery.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

// ANSI Color Codes
const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string RED = "\033[38;5;196m";
const std::string GREEN = "\033[38;5;46m";
const std::string YELLOW = "\033[38;5;226m";
const std::string CYAN = "\033[38;5;51m";
const std::string GRAY = "\033[38;5;242m";

namespace {
struct CliOptions {
    std::string configPath;
    std::string settingsPath;
    int timeoutMs = 0;
    bool all = false;
    bool help = false;
    std::string serverId;
};

void printUsage() {
    std::cerr << "Usage: toolscout [--config <file>] [--settings <file>] [--timeout <ms>] [--all] [<server-id>]\n"
              << "  no server id     list configured MCP servers\n"
              << "  <server-id>      discover the tools of one server\n"
              << "  --all            discover every enabled server\n";
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions cli;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) throw std::runtime_error("Missing value for " + flag);
            return argv[++i];
        };
        if (arg == "--config" || arg == "-c") {
            cli.configPath = next(arg);
        } else if (arg == "--settings" || arg == "-s") {
            cli.settingsPath = next(arg);
        } else if (arg == "--timeout" || arg == "-t") {
            std::string value = next(arg);
            try {
                cli.timeoutMs = std::stoi(value);
            } catch (const std::exception&) {
                throw std::runtime_error("Invalid timeout: " + value);
            }
        } else if (arg == "--all" || arg == "-a") {
            cli.all = true;
        } else if (arg == "--help" || arg == "-h") {
            cli.help = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::runtime_error("Unknown option: " + arg);
        } else if (cli.serverId.empty()) {
            cli.serverId = arg;
        } else {
            throw std::runtime_error("Unexpected argument: " + arg);
        }
    }
    return cli;
}

// 查找顺序：显式参数 > cwd > 上级目录；都没有时使用默认配置
Config loadConfig(const std::string& explicitPath) {
    if (!explicitPath.empty()) {
        return Config::load(explicitPath);
    }
    for (const char* candidate : {"config.json", "../config.json"}) {
        if (fs::exists(fs::u8path(candidate))) {
            return Config::load(candidate);
        }
    }
    return Config();
}

std::string describeCommand(const ServerConfig& server) {
    std::string line = server.command;
    for (const auto& arg : server.args) line += " " + arg;
    return line;
}

void listServers(const std::vector<std::pair<std::string, ServerConfig>>& servers) {
    std::cout << BOLD << "\nAvailable MCP servers:" << RESET << std::endl;
    int index = 1;
    for (const auto& [id, server] : servers) {
        const std::string status = server.disabled ? (YELLOW + "DISABLED") : (GREEN + "ENABLED");
        std::cout << index++ << ". " << id << " [" << status << RESET << "]" << std::endl;
        std::cout << GRAY << "   Command: " << describeCommand(server) << RESET << std::endl;
    }
    std::cout << "\nRun with a server id to discover its tools." << std::endl;
}

void printTools(const std::string& id, const std::vector<std::string>& tools) {
    std::cout << CYAN << BOLD << id << RESET << GRAY << " (" << tools.size() << " tools)" << RESET << std::endl;
    for (const auto& tool : tools) {
        std::cout << "  - " << tool << std::endl;
    }
}
} // namespace

int main(int argc, char* argv[]) {
    CliOptions cli;
    try {
        cli = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << RED << "✖ " << e.what() << RESET << std::endl;
        printUsage();
        return 1;
    }
    if (cli.help) {
        printUsage();
        return 0;
    }

    Config cfg;
    try {
        cfg = loadConfig(cli.configPath);
    } catch (const std::exception& e) {
        std::cerr << RED << "✖ Failed to load config: " << e.what() << RESET << std::endl;
        return 1;
    }

    Logger::getInstance().setMinLevel(Logger::parseLevel(cfg.logging.level));
    Logger::getInstance().setLogFile(cfg.logging.file);

    if (cli.timeoutMs > 0) cfg.discovery.timeoutMs = cli.timeoutMs;
    if (!cli.settingsPath.empty()) cfg.paths.settings = cli.settingsPath;

    std::vector<std::pair<std::string, ServerConfig>> servers;
    try {
        Logger::getInstance().info("Reading settings from: " + cfg.paths.settings);
        servers = Config::loadServerSettings(cfg.paths.settings);
    } catch (const std::exception& e) {
        std::cerr << RED << "✖ " << e.what() << RESET << std::endl;
        return 1;
    }

    if (cli.serverId.empty() && !cli.all) {
        listServers(servers);
        return 0;
    }

    if (!cfg.discovery.enabled) {
        Logger::getInstance().warn("Direct tool discovery is disabled in configuration");
        return 0;
    }

    ToolDiscovery discovery(DiscoveryOptions::fromConfig(cfg));

    if (cli.all) {
        auto results = discovery.discoverAll(servers);
        size_t total = 0;
        for (const auto& [id, tools] : results) {
            printTools(id, tools);
            total += tools.size();
        }
        Logger::getInstance().success("Discovered " + std::to_string(total) + " tools across " +
                                      std::to_string(results.size()) + " servers");
        return 0;
    }

    for (const auto& [id, server] : servers) {
        if (id != cli.serverId) continue;
        if (server.disabled) {
            Logger::getInstance().warn("Server " + id + " is disabled; probing anyway");
        }
        std::cout << GRAY << "Command: " << describeCommand(server) << RESET << std::endl;
        std::cout << GRAY << "Args (effective): ";
        for (const auto& arg : ProcessLauncher::effectiveArgs(server.args)) std::cout << arg << " ";
        std::cout << RESET << std::endl;

        auto tools = discovery.discoverTools(id, server);
        printTools(id, tools);
        if (tools.empty()) {
            Logger::getInstance().warn("No tools discovered for " + id);
        }
        return 0;
    }

    std::cerr << RED << "✖ Unknown server: " << cli.serverId << RESET << std::endl;
    listServers(servers);
    return 1;
}
