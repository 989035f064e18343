#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>

/**
 * @brief 启动配置
 *
 * 来源: 可选的 JSON 配置文件 (--config) 与命令行参数,命令行优先。
 * 配置在启动时确定,之后只读。
 *
 * 配置文件格式:
 * {
 *   "log_dirs": ["/var/log/app", "/tmp/logs"],
 *   "server_log": "/tmp/log-inspector.log",
 *   "enable_debug": false
 * }
 */
struct Config {
    std::vector<std::string> logDirs;   // 显式指定的日志目录 (保持顺序)
    std::string serverLogPath;          // 服务自身日志文件,空表示只写 stderr
    bool enableDebug = false;

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }
        if (!j.is_object()) {
            throw std::runtime_error("Config file must contain a JSON object: " + pathStr);
        }

        Config cfg;
        try {
            if (j.contains("log_dirs")) {
                cfg.logDirs = j["log_dirs"].get<std::vector<std::string>>();
            }
            cfg.serverLogPath = j.value("server_log", "");
            cfg.enableDebug = j.value("enable_debug", false);
        } catch (const nlohmann::json::type_error& e) {
            throw std::runtime_error("Invalid value in " + path.string() + ": " + e.what());
        }
        return cfg;
    }
};
