#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "utils/UTF8Utils.h"

/**
 * @brief 工具接口定义
 *
 * 每个 MCP 工具实现此接口。工具只做一件事: 把参数解析为强类型请求,
 * 交给核心组件执行,再渲染成一段文本。
 *
 * 失败时直接抛出 LogToolError 派生异常,由 ToolRegistry 统一渲染为 "Error: ..."。
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief 获取工具名称
     * @return 工具的唯一标识名称 (tools/call 中的 name)
     */
    virtual std::string getName() const = 0;

    /**
     * @brief 获取工具描述
     * @return 工具功能的简短描述 (用于 LLM 理解)
     */
    virtual std::string getDescription() const = 0;

    /**
     * @brief 获取工具的 JSON Schema
     * @return 符合 JSON Schema 规范的参数定义 (MCP inputSchema)
     */
    virtual nlohmann::json getSchema() const = 0;

    /**
     * @brief 执行工具操作
     * @param args 工具参数 (JSON 格式)
     * @return 执行结果,遵循 MCP 标准:
     * {
     *   "content": [
     *     {"type": "text", "text": "结果内容"}
     *   ],
     *   "isError": false
     * }
     */
    virtual nlohmann::json execute(const nlohmann::json& args) = 0;

    /**
     * @brief 构造 MCP 文本结果,日志内容可能含非法 UTF-8,这里统一清理
     */
    static nlohmann::json textResult(const std::string& text, bool isError = false) {
        nlohmann::json contentItem;
        contentItem["type"] = "text";
        contentItem["text"] = UTF8Utils::sanitize(text);

        nlohmann::json result;
        result["content"] = nlohmann::json::array({contentItem});
        result["isError"] = isError;
        return result;
    }
};
