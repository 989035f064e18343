#pragma once
#include <string>

// 日志文件不保证是合法 UTF-8,而 nlohmann::json::dump 遇到非法字节会抛异常
namespace UTF8Utils {
    /**
     * @brief 验证并清理 UTF-8 字符串,非法或截断的序列替换为 '?'
     */
    std::string sanitize(const std::string& input);

    /**
     * @brief 检查字符串是否已是合法 UTF-8
     */
    bool isValid(const std::string& input);
}
