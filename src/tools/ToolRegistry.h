#pragma once
#include <string>
#include <memory>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"

/**
 * @brief 工具注册中心
 *
 * 统一管理所有工具的注册、查找和执行。
 * executeTool 是错误边界: 任何工具异常都在这里变成 "Error: ..." 文本结果,
 * 不会让服务进程退出。
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    /**
     * @brief 注册一个工具,同名工具会被替换 (保留原注册位置)
     * @param tool 工具实例 (unique_ptr 转移所有权)
     */
    void registerTool(std::unique_ptr<ITool> tool);

    /**
     * @brief 获取工具实例
     * @return 工具指针 (如果不存在返回 nullptr)
     */
    ITool* getTool(const std::string& name);

    /**
     * @brief 按注册顺序列出所有工具定义 (MCP tools/list 格式)
     *
     * [
     *   {"name": "...", "description": "...", "inputSchema": { JSON Schema }}
     * ]
     */
    std::vector<nlohmann::json> listToolSchemas() const;

    /**
     * @brief 执行工具
     *
     * 工具不存在时返回 isError=true 的文本结果 "Error: Unknown tool: xxx"。
     */
    nlohmann::json executeTool(const std::string& name, const nlohmann::json& args);

    size_t getToolCount() const { return tools.size(); }

    bool hasTool(const std::string& name) const;

private:
    std::vector<std::unique_ptr<ITool>> tools;
    std::unordered_map<std::string, size_t> indexByName;
};
