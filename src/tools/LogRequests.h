#pragma once
#include <string>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "logs/PatternSearcher.h"
#include "logs/ErrorScanner.h"

/**
 * 每个工具的强类型请求。parse 负责从 JSON 参数包中取值并做边界检查,
 * 越界或类型不对时抛 InvalidArgumentError。
 *
 * 覆盖优先级: 显式的行数 (num_lines / lines / max_matches) 总是覆盖 max_tokens。
 */
namespace RequestLimits {
    constexpr size_t DEFAULT_MAX_TOKENS = 4000;
    constexpr size_t MAX_TOKENS = 100000;
    constexpr size_t MAX_NUM_LINES = 1000;
    constexpr size_t MAX_HEAD_TAIL_LINES = 10000;
    constexpr size_t DEFAULT_CONTEXT_LINES = 2;
    constexpr size_t MAX_CONTEXT_LINES = 10;
    constexpr size_t MAX_MATCHES = 500;
}

struct GetContentRequest {
    std::string filename;
    size_t maxTokens = RequestLimits::DEFAULT_MAX_TOKENS;

    static GetContentRequest parse(const nlohmann::json& args);
};

struct PaginatedRequest {
    std::string filename;
    size_t startLine = 1;
    size_t maxTokens = RequestLimits::DEFAULT_MAX_TOKENS;
    std::optional<size_t> numLines;             // 旧版按行模式
    std::optional<std::uintmax_t> expectedSize;
    std::optional<double> expectedMtime;

    static PaginatedRequest parse(const nlohmann::json& args);
};

struct RangeRequest {
    std::string filename;
    size_t startLine = 1;
    std::optional<size_t> endLine;
    size_t maxTokens = RequestLimits::DEFAULT_MAX_TOKENS;

    static RangeRequest parse(const nlohmann::json& args);
};

// head_log / tail_log
struct EdgeRequest {
    std::string filename;
    std::optional<size_t> lines;
    size_t maxTokens = RequestLimits::DEFAULT_MAX_TOKENS;

    static EdgeRequest parse(const nlohmann::json& args);
};

struct SearchRequest {
    std::string filename;
    SearchOptions options;

    static SearchRequest parse(const nlohmann::json& args);
};

struct FindErrorsRequest {
    std::string filename;
    ErrorScanOptions options;

    static FindErrorsRequest parse(const nlohmann::json& args);
};
