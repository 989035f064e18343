#pragma once
#include <string>
#include <vector>
#include "core/DirectoryConfig.h"

struct FileListing {
    std::vector<fs::path> directories;
    std::vector<std::string> files;      // 绝对路径,已排序
    std::vector<std::string> warnings;   // 单个目录的问题,不影响其他目录
};

/**
 * @brief list_log_files: 列出所有允许目录下的普通文件 (不递归)
 *
 * 目录不存在、不是目录、无权限都只记为警告。
 */
class LogDirectoryScanner {
public:
    static FileListing scan(const PermittedDirectories& directories);
};
