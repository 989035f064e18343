#pragma once
#include <string>
#include <vector>
#include <regex>
#include <optional>
#include "logs/LogFile.h"

/**
 * @brief 一个匹配及其上下文块 (0-based 行下标,闭区间)
 */
struct MatchBlock {
    size_t matchIndex = 0;
    size_t first = 0;
    size_t last = 0;
    size_t tokens = 0;
};

struct SearchOptions {
    std::string pattern;
    bool caseSensitive = false;
    size_t contextBefore = 2;
    size_t contextAfter = 2;
    size_t skip = 0;
    size_t maxTokens = 4000;
    std::optional<size_t> maxMatches;   // 旧版按数量分页,给出时覆盖 token 预算
};

struct SearchResult {
    SearchOptions options;
    size_t totalMatches = 0;
    std::vector<MatchBlock> blocks;
    size_t estimatedTokens = 0;
    size_t remaining = 0;              // 本页之后还剩多少匹配

    bool noMatches() const { return totalMatches == 0; }
    // 有匹配,但全部被 skip 掉了
    bool exhausted() const { return totalMatches > 0 && blocks.empty(); }
    size_t nextSkip() const { return options.skip + blocks.size(); }
};

/**
 * @brief 正则搜索 + 上下文窗口 + 基于 skip 的分页
 *
 * 相邻匹配的上下文各自独立输出,重叠行会重复出现 (不去重)。
 */
class PatternSearcher {
public:
    // 每行只有前 MAX_MATCH_CHARS 个字符参与匹配,输出仍是整行
    static constexpr size_t MAX_MATCH_CHARS = 4096;

    /**
     * @throws InvalidPatternError 正则无法编译
     */
    static SearchResult search(const LogFile& file, const SearchOptions& options);

    static std::regex compile(const std::string& pattern, bool caseSensitive);

    static bool matchesLine(const std::string& line, const std::regex& regex);

    // 所有匹配行的 0-based 下标,升序
    static std::vector<size_t> findMatches(const LogFile& file, const std::regex& regex);

    // [index - before, index + after] 截到文件边界
    static MatchBlock contextBlock(const LogFile& file, size_t index, size_t before, size_t after);
};
