#pragma once
#include <string>
#include <filesystem>
#include "core/DirectoryConfig.h"

namespace fs = std::filesystem;

/**
 * @brief 解析结果: 所属目录 + 文件绝对路径
 *
 * 不变式: path 的规范形式位于 directory 的规范形式之内。
 */
struct ResolvedFile {
    fs::path directory;
    fs::path path;
};

/**
 * @brief 把调用方给出的文件名映射到允许目录内的具体文件
 *
 * - 绝对路径: 规范化后按顺序检查包含关系,第一个包含它的目录胜出
 * - 相对路径: 按优先级查找第一个存在 directory/filename 的目录;
 *   都不存在时仍返回 directories[0]/filename,由调用方报告 "文件不存在"
 * - 任何情况下 ("../" 穿越、指向外部的符号链接) 都不会返回目录外的路径
 */
class PathResolver {
public:
    explicit PathResolver(const PermittedDirectories& directories);

    /**
     * @throws InvalidPathError 无法放进任何允许目录
     * @throws ConfigurationError 目录列表为空
     */
    ResolvedFile resolve(const std::string& filename) const;

    /**
     * @brief 按路径分量判断 dir 是否包含 p (p == dir 也算)
     *
     * "/var/log" 包含 "/var/log/x",但不包含 "/var/log2/x"。两个参数都应已规范化。
     */
    static bool isWithin(const fs::path& dir, const fs::path& p);

    // 存在则 canonical,否则 weakly_canonical
    static fs::path canonicalize(const fs::path& p);

private:
    const PermittedDirectories& directories;
};
