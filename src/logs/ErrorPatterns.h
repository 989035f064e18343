#pragma once
#include <string>
#include <vector>
#include <regex>
#include <optional>

enum class PatternSeverity {
    Error,
    Warning
};

/**
 * @brief 错误启发式表中的一项
 */
struct ErrorPattern {
    const char* pattern;     // ECMAScript 正则片段,匹配时忽略大小写
    const char* category;
    PatternSeverity severity;
};

/**
 * @brief find_errors 使用的固定启发式模式集
 *
 * 表是声明式的: 新增一种错误形态只需要加一行,扫描算法不用改。
 * 所有片段合并为一个忽略大小写的 alternation;includeWarnings 时追加警告片段。
 */
class ErrorPatternSet {
public:
    static constexpr int VERSION = 1;

    explicit ErrorPatternSet(bool includeWarnings);

    static const std::vector<ErrorPattern>& table();

    // 当前启用的表项 (按表顺序)
    const std::vector<const ErrorPattern*>& active() const { return entries; }

    const std::regex& combined() const { return combinedRegex; }
    bool includesWarnings() const { return withWarnings; }

    bool matches(const std::string& line) const;

    // 第一个命中的表项类别;不命中返回空
    std::optional<std::string> classify(const std::string& line) const;

    // "(?:a)|(?:b)|..."
    static std::string buildAlternation(const std::vector<const ErrorPattern*>& patterns);

private:
    bool withWarnings;
    std::vector<const ErrorPattern*> entries;
    std::vector<std::regex> perEntry;
    std::regex combinedRegex;
};
