#pragma once
#include <string>
#include <vector>
#include <map>
#include "logs/LogFile.h"
#include "logs/ErrorPatterns.h"

/**
 * @brief 去重后的输出块 (0-based 闭区间)
 *
 * 与前一个块相邻或重叠的行已被去掉,所以块之间互不重复。
 */
struct ErrorBlock {
    size_t first = 0;
    size_t last = 0;
};

struct ErrorScanOptions {
    size_t contextLines = 2;
    bool includeWarnings = false;
    size_t maxTokens = 4000;
};

struct ErrorScanResult {
    ErrorScanOptions options;
    size_t patternCount = 0;
    std::vector<size_t> hits;               // 所有命中行
    size_t shownHits = 0;                   // 已被输出块覆盖的命中数 (hits 的前缀)
    std::vector<ErrorBlock> blocks;
    size_t estimatedTokens = 0;
    std::map<std::string, size_t> categories;   // 已展示命中按类别计数

    size_t remaining() const { return hits.size() - shownHits; }
    bool isHit(size_t index) const;
};

/**
 * @brief 启发式错误扫描
 *
 * 复用 PatternSearcher 的上下文窗口,但已输出过的行不再重复,
 * token 预算只计算每个新块中新增的行。
 */
class ErrorScanner {
public:
    static ErrorScanResult scan(const LogFile& file, const ErrorScanOptions& options);
};
