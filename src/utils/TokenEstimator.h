#pragma once
#include <cstddef>
#include <string>

/**
 * @brief 近似 token 计数
 *
 * 固定按 4 个字符折算 1 个 token,只用于控制响应大小,不追求与具体模型一致。
 */
namespace TokenEstimator {
    constexpr size_t CHARS_PER_TOKEN = 4;

    inline size_t estimate(const std::string& text) {
        return text.size() / CHARS_PER_TOKEN;
    }

    // 一行在文件中的代价,包含它携带的换行符
    inline size_t estimateLine(const std::string& line) {
        return (line.size() + 1) / CHARS_PER_TOKEN;
    }

    inline size_t charsForTokens(size_t tokens) {
        return tokens * CHARS_PER_TOKEN;
    }
}
