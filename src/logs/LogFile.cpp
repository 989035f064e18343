#include "logs/LogFile.h"
#include "core/Errors.h"
#include <fstream>
#include <sstream>
#include <cerrno>
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>

FileFingerprint LogFile::fingerprintOf(const fs::path& path) {
    FileFingerprint fp;
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return fp;
    }
    fp.size = static_cast<std::uintmax_t>(st.st_size);
#ifdef __APPLE__
    fp.mtime = static_cast<double>(st.st_mtimespec.tv_sec) + st.st_mtimespec.tv_nsec / 1e9;
#else
    fp.mtime = static_cast<double>(st.st_mtim.tv_sec) + st.st_mtim.tv_nsec / 1e9;
#endif
    return fp;
}

std::vector<std::string> LogFile::splitLines(const std::string& content) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos < content.size()) {
        size_t nl = content.find('\n', pos);
        size_t end = (nl == std::string::npos) ? content.size() : nl;
        std::string line = content.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        if (nl == std::string::npos) break;
        pos = nl + 1;
    }
    return lines;
}

LogFile LogFile::load(const ResolvedFile& resolved) {
    const fs::path& path = resolved.path;
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        if (ec == std::errc::permission_denied) {
            throw PermissionError("Permission denied reading: " + path.u8string());
        }
        throw NotFoundError("Log file does not exist: " + path.u8string());
    }
    if (!fs::is_regular_file(status)) {
        throw NotAFileError("Path exists but is not a file: " + path.u8string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        if (errno == EACCES) {
            throw PermissionError("Permission denied reading: " + path.u8string());
        }
        throw LogToolError("Failed to open file: " + path.u8string());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw LogToolError("Error reading file: " + path.u8string());
    }

    LogFile log;
    log.filePath = path;
    log.text = buffer.str();
    log.lineList = splitLines(log.text);
    log.fingerprintValue = fingerprintOf(path);
    // 读取期间文件可能在增长,以实际读到的字节数为准
    log.fingerprintValue.size = log.text.size();
    return log;
}

LogFile LogFile::fromContent(const fs::path& path, const std::string& content) {
    LogFile log;
    log.filePath = path;
    log.text = content;
    log.lineList = splitLines(content);
    log.fingerprintValue.size = content.size();
    return log;
}
