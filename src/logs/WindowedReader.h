#pragma once
#include <string>
#include <optional>
#include "logs/LogFile.h"

/**
 * @brief 窗口的预算模式
 */
enum class BudgetMode {
    TokenBudget,   // 按估算 token 累加
    LineCount      // 按行数 (head/tail 的 lines, 分页的 num_lines)
};

enum class WindowKind {
    Head,
    Tail,
    Range,
    Paginated
};

/**
 * @brief 一次读取实际输出的行窗口
 *
 * 行号从 1 开始,[startLine, endLine] 闭区间。lineCount 为 0 表示空窗口
 * (仅在文件为空时出现)。nextStart 是调用方下次应传回的 start_line。
 */
struct ReadWindow {
    WindowKind kind = WindowKind::Paginated;
    BudgetMode mode = BudgetMode::TokenBudget;
    size_t limit = 0;              // max_tokens 或行数上限
    size_t totalLines = 0;
    size_t startLine = 0;
    size_t endLine = 0;
    size_t lineCount = 0;
    size_t estimatedTokens = 0;
    size_t rangeEnd = 0;           // 请求区间的末行 (range 模式用于续读提示)
    std::optional<size_t> nextStart;
    std::string staleWarning;      // 非空表示指纹不一致
};

/**
 * @brief get_log_content 的结果: 整个文件或按预算截断的前缀
 */
struct ContentRead {
    std::string body;
    bool truncated = false;
    size_t totalTokens = 0;
    size_t shownTokens = 0;
    size_t nextLine = 0;       // 截断时续读的 start_line (被截断的半行会重读)
};

/**
 * @brief 变更检测: 比较调用方回传的指纹与当前指纹
 *
 * 只是提示,不一致时返回警告文本,绝不让调用失败。
 */
class ChangeDetector {
public:
    static std::optional<std::string> compare(const std::optional<std::uintmax_t>& expectedSize,
                                              const std::optional<double>& expectedMtime,
                                              const FileFingerprint& current);
};

/**
 * @brief 共享的行窗口引擎
 *
 * 所有模式共用同一条预算规则: 行代价 = 估算 token;累加到下一行会超出预算时停止,
 * 但第一行无论多大都输出,避免零行响应。
 */
class WindowedReader {
public:
    /**
     * @brief 从第 1 行开始读取
     * @param maxLines 给出时只按行数截断 (优先于 token 预算)
     */
    static ReadWindow readHead(const LogFile& file, std::optional<size_t> maxLines, size_t maxTokens);

    /**
     * @brief 从末行向前累加,按原顺序输出
     */
    static ReadWindow readTail(const LogFile& file, std::optional<size_t> maxLines, size_t maxTokens);

    /**
     * @brief 输出 [startLine, min(endLine, totalLines)],预算耗尽时提前停止
     * @throws InvalidArgumentError startLine 超出文件长度或 endLine < startLine
     */
    static ReadWindow readRange(const LogFile& file, size_t startLine, std::optional<size_t> endLine, size_t maxTokens);

    /**
     * @brief 分页读取
     * @param numLines 给出时为旧版按行模式,覆盖 token 模式
     * @param expectedSize/expectedMtime 上一次返回的指纹,不一致时附带警告
     * @throws InvalidArgumentError startLine 超出文件长度
     */
    static ReadWindow readPaginated(const LogFile& file, size_t startLine, size_t maxTokens,
                                    std::optional<size_t> numLines,
                                    std::optional<std::uintmax_t> expectedSize = std::nullopt,
                                    std::optional<double> expectedMtime = std::nullopt);

    /**
     * @brief 整个文件;超出预算时截断到预算附近的行边界
     *
     * 截断点取最后一个换行,前提是它保留了至少 80% 的字符预算 (>=),否则硬截断。
     */
    static ContentRead readContent(const LogFile& file, size_t maxTokens);

private:
    // 从 firstIndex (0-based) 向后累加,最多到 lastIndex (含)
    static ReadWindow forwardWindow(const LogFile& file, size_t firstIndex, size_t lastIndex,
                                    BudgetMode mode, size_t limit);
};
