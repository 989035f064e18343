#pragma once
#include "ITool.h"
#include "core/DirectoryConfig.h"

/**
 * 日志检查工具集。每个工具持有启动时解析好的目录列表的 const 引用,
 * 调用之间不保存任何状态。
 */

/**
 * @brief 列出所有允许目录下的日志文件
 */
class ListLogFilesTool : public ITool {
public:
    explicit ListLogFilesTool(const PermittedDirectories& directories);

    std::string getName() const override { return "list_log_files"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    const PermittedDirectories& directories;
};

/**
 * @brief 读取整个日志文件,超出 token 预算时在行边界截断
 */
class GetLogContentTool : public ITool {
public:
    explicit GetLogContentTool(const PermittedDirectories& directories);

    std::string getName() const override { return "get_log_content"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    const PermittedDirectories& directories;
};

/**
 * @brief 分页读取 (token 预算或旧版 num_lines),支持指纹变更提示
 */
class ReadLogPaginatedTool : public ITool {
public:
    explicit ReadLogPaginatedTool(const PermittedDirectories& directories);

    std::string getName() const override { return "read_log_paginated"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    const PermittedDirectories& directories;
};

class ReadLogRangeTool : public ITool {
public:
    explicit ReadLogRangeTool(const PermittedDirectories& directories);

    std::string getName() const override { return "read_log_range"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    const PermittedDirectories& directories;
};

class HeadLogTool : public ITool {
public:
    explicit HeadLogTool(const PermittedDirectories& directories);

    std::string getName() const override { return "head_log"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    const PermittedDirectories& directories;
};

class TailLogTool : public ITool {
public:
    explicit TailLogTool(const PermittedDirectories& directories);

    std::string getName() const override { return "tail_log"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    const PermittedDirectories& directories;
};

/**
 * @brief 正则搜索,带上下文,按 skip_matches 分页
 */
class SearchLogFileTool : public ITool {
public:
    explicit SearchLogFileTool(const PermittedDirectories& directories);

    std::string getName() const override { return "search_log_file"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    const PermittedDirectories& directories;
};

/**
 * @brief 用固定启发式模式集定位可能的失败行
 */
class FindErrorsTool : public ITool {
public:
    explicit FindErrorsTool(const PermittedDirectories& directories);

    std::string getName() const override { return "find_errors"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    const PermittedDirectories& directories;
};

class ToolRegistry;

// 按固定顺序注册全部日志工具
void registerLogTools(ToolRegistry& registry, const PermittedDirectories& directories);
