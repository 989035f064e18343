#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>
#include "logs/PathResolver.h"

namespace fs = std::filesystem;

/**
 * @brief 文件指纹 (大小, 修改时间)
 *
 * 仅用于两次分页调用之间的乐观变更检测,不是锁。
 * mtime 为 Unix 秒,精确到微秒。
 */
struct FileFingerprint {
    std::uintmax_t size = 0;
    double mtime = 0.0;
};

/**
 * @brief 一次调用内加载到内存的日志文件
 *
 * 每次调用都从磁盘重新读取完整内容,不跨调用缓存。
 */
class LogFile {
public:
    /**
     * @throws NotFoundError   文件不存在
     * @throws NotAFileError   路径是目录或其他非普通文件
     * @throws PermissionError 无读权限
     */
    static LogFile load(const ResolvedFile& resolved);

    // 测试用: 直接从文本构造
    static LogFile fromContent(const fs::path& path, const std::string& content);

    static FileFingerprint fingerprintOf(const fs::path& path);

    const fs::path& path() const { return filePath; }
    const std::string& content() const { return text; }
    const std::vector<std::string>& lines() const { return lineList; }
    size_t totalLines() const { return lineList.size(); }
    std::uintmax_t sizeBytes() const { return fingerprintValue.size; }
    const FileFingerprint& fingerprint() const { return fingerprintValue; }

private:
    fs::path filePath;
    std::string text;
    std::vector<std::string> lineList;
    FileFingerprint fingerprintValue;

    // 按 '\n' 切分,去掉行尾 '\r';末尾换行不产生空行
    static std::vector<std::string> splitLines(const std::string& content);
};
