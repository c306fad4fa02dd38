#pragma once
#include <string>
#include <vector>
#include <map>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <filesystem>
#include <nlohmann/json.hpp>

// 单个 MCP 服务器的启动配置（对应 settings 文件中 mcpServers 的一项）
struct ServerConfig {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool disabled = false;
};

struct Config {
    struct Discovery {
        bool enabled = true;
        int timeoutMs = 10000;
        int startupDelayMs = 500;
    } discovery;

    struct Paths {
        std::string settings = "cline_mcp_settings.json";
    } paths;

    struct Logging {
        std::string level = "info";
        std::string file = "toolscout.log";
    } logging;

    static constexpr int kDefaultTimeoutMs = 10000;
    static constexpr int kDefaultStartupDelayMs = 500;

    static Config load(const std::string& pathStr) {
        return fromJson(readJsonFile(pathStr), pathStr);
    }

    static Config fromJson(const nlohmann::json& j, const std::string& origin = "<inline>") {
        Config cfg;
        if (!j.is_object()) {
            throw std::runtime_error("Config root must be an object: " + origin);
        }
        try {
            if (j.contains("discovery")) {
                const auto& d = j.at("discovery");
                cfg.discovery.enabled = d.value("enabled", true);
                cfg.discovery.timeoutMs = d.value("timeout", kDefaultTimeoutMs);
                cfg.discovery.startupDelayMs = d.value("startup_delay", kDefaultStartupDelayMs);
            }
            if (j.contains("paths")) {
                cfg.paths.settings = j.at("paths").value("settings", cfg.paths.settings);
            }
            if (j.contains("logging")) {
                cfg.logging.level = j.at("logging").value("level", cfg.logging.level);
                cfg.logging.file = j.at("logging").value("file", cfg.logging.file);
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config in " + origin + ": " + e.what());
        }

        if (cfg.discovery.timeoutMs <= 0) cfg.discovery.timeoutMs = kDefaultTimeoutMs;
        if (cfg.discovery.startupDelayMs < 0) cfg.discovery.startupDelayMs = kDefaultStartupDelayMs;
        return cfg;
    }

    /**
     * @brief 读取 MCP settings 文件，按文件中的顺序返回服务器列表
     * @throws std::runtime_error 文件不存在、JSON 无效或缺少 mcpServers
     */
    static std::vector<std::pair<std::string, ServerConfig>> loadServerSettings(const std::string& pathStr) {
        nlohmann::ordered_json j;
        try {
            j = nlohmann::ordered_json::parse(readText(pathStr));
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + pathStr + ": " + e.what());
        }
        if (!j.is_object() || !j.contains("mcpServers") || !j["mcpServers"].is_object()) {
            throw std::runtime_error("Invalid settings file: missing mcpServers object in " + pathStr);
        }

        std::vector<std::pair<std::string, ServerConfig>> servers;
        for (auto& [id, item] : j["mcpServers"].items()) {
            try {
                servers.emplace_back(id, parseServer(item));
            } catch (const nlohmann::json::exception& e) {
                throw std::runtime_error("Invalid entry for server " + id + ": " + e.what());
            }
        }
        return servers;
    }

    static ServerConfig parseServer(const nlohmann::ordered_json& item) {
        ServerConfig server;
        server.command = item.value("command", "");
        server.args = item.value("args", std::vector<std::string>{});
        server.disabled = item.value("disabled", false);
        if (item.contains("env") && item["env"].is_object()) {
            for (auto& [key, value] : item["env"].items()) {
                // 非字符串的值按 JSON 文本传递
                server.env[key] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }
        return server;
    }

private:
    static std::string readText(const std::string& pathStr) {
        std::ifstream f(std::filesystem::u8path(pathStr));
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();
        return content;
    }

    static nlohmann::json readJsonFile(const std::string& pathStr) {
        try {
            return nlohmann::json::parse(readText(pathStr));
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + pathStr + ": " + e.what());
        }
    }
};
