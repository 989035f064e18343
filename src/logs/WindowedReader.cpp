#include "logs/WindowedReader.h"
#include "core/Errors.h"
#include "utils/TokenEstimator.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace {
    // 当前已输出 emitted 行,总代价 total,下一行代价 cost,是否还能放下
    bool fitsBudget(BudgetMode mode, size_t limit, size_t emitted, size_t total, size_t cost) {
        if (emitted == 0) return true;
        if (mode == BudgetMode::LineCount) return emitted < limit;
        return total + cost <= limit;
    }

    std::string formatMtime(double mtime) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(6) << mtime;
        return oss.str();
    }
}

std::optional<std::string> ChangeDetector::compare(const std::optional<std::uintmax_t>& expectedSize,
                                                   const std::optional<double>& expectedMtime,
                                                   const FileFingerprint& current) {
    bool sizeChanged = expectedSize && *expectedSize != current.size;
    // 调用方回传的是格式化后的文本,差值小于 1ms 视为相同
    bool mtimeChanged = expectedMtime && std::fabs(*expectedMtime - current.mtime) >= 0.001;
    if (!sizeChanged && !mtimeChanged) {
        return std::nullopt;
    }

    std::ostringstream msg;
    msg << "Warning: file changed since the previous read (";
    if (sizeChanged) {
        msg << "size " << *expectedSize << " -> " << current.size;
    }
    if (mtimeChanged) {
        if (sizeChanged) msg << ", ";
        msg << "mtime " << formatMtime(*expectedMtime) << " -> " << formatMtime(current.mtime);
    }
    msg << "). Line numbers may have shifted; results below reflect the current file.";
    return msg.str();
}

ReadWindow WindowedReader::forwardWindow(const LogFile& file, size_t firstIndex, size_t lastIndex,
                                         BudgetMode mode, size_t limit) {
    const auto& lines = file.lines();
    ReadWindow window;
    window.mode = mode;
    window.limit = limit;
    window.totalLines = lines.size();
    window.startLine = firstIndex + 1;
    window.rangeEnd = lastIndex + 1;

    size_t i = firstIndex;
    for (; i <= lastIndex && i < lines.size(); ++i) {
        size_t cost = TokenEstimator::estimateLine(lines[i]);
        if (!fitsBudget(mode, limit, window.lineCount, window.estimatedTokens, cost)) break;
        window.estimatedTokens += cost;
        window.lineCount++;
    }
    window.endLine = window.startLine + window.lineCount - 1;
    if (window.lineCount > 0 && window.endLine < window.rangeEnd) {
        window.nextStart = window.endLine + 1;
    }
    return window;
}

ReadWindow WindowedReader::readHead(const LogFile& file, std::optional<size_t> maxLines, size_t maxTokens) {
    ReadWindow window;
    if (file.totalLines() == 0) {
        window.kind = WindowKind::Head;
        window.mode = maxLines ? BudgetMode::LineCount : BudgetMode::TokenBudget;
        window.limit = maxLines ? *maxLines : maxTokens;
        return window;
    }
    if (maxLines) {
        window = forwardWindow(file, 0, file.totalLines() - 1, BudgetMode::LineCount, *maxLines);
    } else {
        window = forwardWindow(file, 0, file.totalLines() - 1, BudgetMode::TokenBudget, maxTokens);
    }
    window.kind = WindowKind::Head;
    return window;
}

ReadWindow WindowedReader::readTail(const LogFile& file, std::optional<size_t> maxLines, size_t maxTokens) {
    const auto& lines = file.lines();
    ReadWindow window;
    window.kind = WindowKind::Tail;
    window.mode = maxLines ? BudgetMode::LineCount : BudgetMode::TokenBudget;
    window.limit = maxLines ? *maxLines : maxTokens;
    window.totalLines = lines.size();
    window.rangeEnd = lines.size();
    if (lines.empty()) {
        return window;
    }

    for (size_t i = lines.size(); i > 0; --i) {
        size_t cost = TokenEstimator::estimateLine(lines[i - 1]);
        if (!fitsBudget(window.mode, window.limit, window.lineCount, window.estimatedTokens, cost)) break;
        window.estimatedTokens += cost;
        window.lineCount++;
    }
    window.startLine = lines.size() - window.lineCount + 1;
    window.endLine = lines.size();
    // 尾部读取没有向后的续读点;更早的内容由格式化层提示用 read_log_range
    return window;
}

ReadWindow WindowedReader::readRange(const LogFile& file, size_t startLine, std::optional<size_t> endLine, size_t maxTokens) {
    size_t total = file.totalLines();
    if (startLine < 1) {
        throw InvalidArgumentError("start_line must be >= 1");
    }
    if (endLine && *endLine < startLine) {
        throw InvalidArgumentError("end_line (" + std::to_string(*endLine) +
                                   ") must be >= start_line (" + std::to_string(startLine) + ")");
    }
    if (startLine > total) {
        throw InvalidArgumentError("start_line " + std::to_string(startLine) +
                                   " exceeds file length (" + std::to_string(total) + " lines)");
    }
    size_t last = endLine ? std::min(*endLine, total) : total;
    ReadWindow window = forwardWindow(file, startLine - 1, last - 1, BudgetMode::TokenBudget, maxTokens);
    window.kind = WindowKind::Range;
    return window;
}

ReadWindow WindowedReader::readPaginated(const LogFile& file, size_t startLine, size_t maxTokens,
                                         std::optional<size_t> numLines,
                                         std::optional<std::uintmax_t> expectedSize,
                                         std::optional<double> expectedMtime) {
    size_t total = file.totalLines();
    if (startLine < 1) {
        throw InvalidArgumentError("start_line must be >= 1");
    }

    std::string stale;
    if (auto warning = ChangeDetector::compare(expectedSize, expectedMtime, file.fingerprint())) {
        stale = *warning;
    }

    ReadWindow window;
    if (total == 0 && startLine == 1) {
        window.mode = numLines ? BudgetMode::LineCount : BudgetMode::TokenBudget;
        window.limit = numLines ? *numLines : maxTokens;
    } else {
        if (startLine > total) {
            throw InvalidArgumentError("start_line " + std::to_string(startLine) +
                                       " exceeds file length (" + std::to_string(total) + " lines)");
        }
        if (numLines) {
            window = forwardWindow(file, startLine - 1, total - 1, BudgetMode::LineCount, *numLines);
        } else {
            window = forwardWindow(file, startLine - 1, total - 1, BudgetMode::TokenBudget, maxTokens);
        }
    }
    window.kind = WindowKind::Paginated;
    window.staleWarning = stale;
    return window;
}

ContentRead WindowedReader::readContent(const LogFile& file, size_t maxTokens) {
    ContentRead result;
    const std::string& content = file.content();
    result.totalTokens = TokenEstimator::estimate(content);

    size_t maxChars = TokenEstimator::charsForTokens(maxTokens);
    if (content.size() <= maxChars) {
        result.body = content;
    } else {
        std::string truncated = content.substr(0, maxChars);
        size_t lastNewline = truncated.rfind('\n');
        if (lastNewline != std::string::npos && lastNewline >= maxChars * 8 / 10) {
            truncated.resize(lastNewline);
        }
        result.body = std::move(truncated);
        result.truncated = true;
    }

    result.shownTokens = TokenEstimator::estimate(result.body);
    if (result.truncated) {
        size_t newlines = static_cast<size_t>(std::count(result.body.begin(), result.body.end(), '\n'));
        bool atLineBoundary = content[result.body.size()] == '\n';
        result.nextLine = atLineBoundary ? newlines + 2 : newlines + 1;
    }
    return result;
}
