#pragma once
#include <string>
#include "logs/LogFile.h"
#include "logs/LogDirectoryScanner.h"
#include "logs/WindowedReader.h"
#include "logs/PatternSearcher.h"
#include "logs/ErrorScanner.h"

/**
 * @brief 把各操作的结果渲染成一段文本 (唯一的输出契约)
 *
 * 顺序: 文件头 (路径, 大小) -> 模式相关元数据 -> 带固定宽度行号的正文 -> 截断时的续读提示。
 * 纯渲染,不抛异常。
 */
class ResultFormatter {
public:
    static std::string formatFileList(const FileListing& listing);
    static std::string formatContent(const LogFile& file, const ContentRead& read, size_t maxTokens);
    static std::string formatWindow(const LogFile& file, const ReadWindow& window);
    static std::string formatSearch(const LogFile& file, const SearchResult& result);
    static std::string formatErrorScan(const LogFile& file, const ErrorScanResult& result);
    static std::string formatError(const std::string& message);

    // "    42 | text",匹配行前缀 ">>> "
    static std::string formatLine(size_t lineNumber, const std::string& text, bool marked, bool withMarkerColumn);

    static const std::string SEPARATOR;
    static const std::string BLOCK_SEPARATOR;
};
