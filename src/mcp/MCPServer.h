#pragma once
#include <string>
#include <istream>
#include <ostream>
#include <nlohmann/json.hpp>
#include "core/DirectoryConfig.h"
#include "tools/ToolRegistry.h"

/**
 * @brief MCP 服务端 (JSON-RPC 2.0, stdio, 每行一个消息)
 *
 * 支持: initialize, ping, tools/list, tools/call, prompts/list, prompts/get。
 * 没有 id 的消息是通知,不回复。stdout 只承载协议数据,日志走 Logger (stderr)。
 */
class MCPServer {
public:
    static constexpr const char* PROTOCOL_VERSION = "2024-11-05";
    static constexpr const char* SERVER_NAME = "log-inspector";
    static constexpr const char* SERVER_VERSION = "1.0.0";

    // JSON-RPC 错误码
    static constexpr int PARSE_ERROR = -32700;
    static constexpr int INVALID_REQUEST = -32600;
    static constexpr int METHOD_NOT_FOUND = -32601;
    static constexpr int INVALID_PARAMS = -32602;
    static constexpr int INTERNAL_ERROR = -32603;

    MCPServer(ToolRegistry& registry, const PermittedDirectories& directories);

    /**
     * @brief 读到 EOF 为止,逐行处理请求
     */
    void run(std::istream& in, std::ostream& out);

    /**
     * @brief 处理一行原始输入
     * @return 响应;通知或空行返回 null
     */
    nlohmann::json handleLine(const std::string& line);

    /**
     * @brief 处理一个已解析的请求
     * @return 响应;通知返回 null
     */
    nlohmann::json handleRequest(const nlohmann::json& request);

private:
    ToolRegistry& registry;
    const PermittedDirectories& directories;

    nlohmann::json handleInitialize(const nlohmann::json& params);
    nlohmann::json handleToolsList();
    nlohmann::json handleToolsCall(const nlohmann::json& id, const nlohmann::json& params);
    nlohmann::json handlePromptsList();
    nlohmann::json handlePromptsGet(const nlohmann::json& id, const nlohmann::json& params);

    std::string runtimeLogsPrompt() const;

    static nlohmann::json makeResult(const nlohmann::json& id, const nlohmann::json& result);
    static nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message);
};
