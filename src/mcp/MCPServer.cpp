#include "mcp/MCPServer.h"
#include "utils/Logger.h"
#include <chrono>
#include <sstream>

MCPServer::MCPServer(ToolRegistry& registry, const PermittedDirectories& directories)
    : registry(registry), directories(directories) {}

nlohmann::json MCPServer::makeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json MCPServer::makeError(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

void MCPServer::run(std::istream& in, std::ostream& out) {
    Logger::getInstance().info("Serving " + std::to_string(registry.getToolCount()) + " tools on stdio");

    std::string line;
    while (std::getline(in, line)) {
        nlohmann::json response = handleLine(line);
        if (response.is_null()) continue;

        // 日志内容已在 ITool::textResult 中清理过,这里用 replace 兜底防止 dump 抛异常
        out << response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        out.flush();
    }

    Logger::getInstance().info("stdin closed, shutting down");
}

nlohmann::json MCPServer::handleLine(const std::string& rawLine) {
    std::string line = rawLine;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) {
        return nullptr;
    }

    nlohmann::json request;
    try {
        request = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        Logger::getInstance().warn(std::string("Malformed request: ") + e.what());
        return makeError(nullptr, PARSE_ERROR, std::string("Parse error: ") + e.what());
    }

    try {
        return handleRequest(request);
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Request handling failed: ") + e.what());
        nlohmann::json id = request.is_object() ? request.value("id", nlohmann::json()) : nlohmann::json();
        return makeError(id, INTERNAL_ERROR, std::string("Internal error: ") + e.what());
    }
}

nlohmann::json MCPServer::handleRequest(const nlohmann::json& request) {
    if (!request.is_object()) {
        return makeError(nullptr, INVALID_REQUEST, "Request must be a JSON object");
    }

    bool isNotification = !request.contains("id");
    nlohmann::json id = request.value("id", nlohmann::json());

    if (!request.contains("method") || !request["method"].is_string()) {
        if (isNotification) return nullptr;
        return makeError(id, INVALID_REQUEST, "Missing or invalid method");
    }

    std::string method = request["method"].get<std::string>();
    nlohmann::json params = request.value("params", nlohmann::json::object());
    if (!params.is_object()) {
        params = nlohmann::json::object();
    }

    if (isNotification) {
        // notifications/initialized, notifications/cancelled ...
        Logger::getInstance().debug("Notification: " + method);
        return nullptr;
    }

    if (method == "initialize") {
        return makeResult(id, handleInitialize(params));
    } else if (method == "ping") {
        return makeResult(id, nlohmann::json::object());
    } else if (method == "tools/list") {
        return makeResult(id, handleToolsList());
    } else if (method == "tools/call") {
        return handleToolsCall(id, params);
    } else if (method == "prompts/list") {
        return makeResult(id, handlePromptsList());
    } else if (method == "prompts/get") {
        return handlePromptsGet(id, params);
    }

    return makeError(id, METHOD_NOT_FOUND, "Unknown method: " + method);
}

nlohmann::json MCPServer::handleInitialize(const nlohmann::json& params) {
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        Logger::getInstance().info("Client connected: " + params["clientInfo"].value("name", std::string("unknown")));
    }
    return {
        {"protocolVersion", PROTOCOL_VERSION},
        {"capabilities", {
            {"tools", {{"listChanged", false}}},
            {"prompts", {{"listChanged", false}}}
        }},
        {"serverInfo", {
            {"name", SERVER_NAME},
            {"version", SERVER_VERSION}
        }}
    };
}

nlohmann::json MCPServer::handleToolsList() {
    nlohmann::json tools = nlohmann::json::array();
    for (auto& schema : registry.listToolSchemas()) {
        tools.push_back(std::move(schema));
    }
    return {{"tools", tools}};
}

nlohmann::json MCPServer::handleToolsCall(const nlohmann::json& id, const nlohmann::json& params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return makeError(id, INVALID_PARAMS, "Missing tool name");
    }
    std::string name = params["name"].get<std::string>();
    nlohmann::json arguments = params.value("arguments", nlohmann::json::object());
    if (arguments.is_null()) {
        arguments = nlohmann::json::object();
    }

    auto start = std::chrono::steady_clock::now();
    nlohmann::json result = registry.executeTool(name, arguments);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    Logger::getInstance().debug("tools/call " + name + " " + arguments.dump() + " (" +
                                std::to_string(elapsed.count()) + " ms)" +
                                (result.value("isError", false) ? " -> error" : ""));
    return makeResult(id, result);
}

nlohmann::json MCPServer::handlePromptsList() {
    return {
        {"prompts", nlohmann::json::array({
            {
                {"name", "runtime-logs"},
                {"description", "Information about runtime log inspection capabilities"}
            }
        })}
    };
}

nlohmann::json MCPServer::handlePromptsGet(const nlohmann::json& id, const nlohmann::json& params) {
    std::string name = params.value("name", std::string());
    if (name != "runtime-logs") {
        return makeError(id, INVALID_PARAMS, "Unknown prompt: " + name);
    }

    nlohmann::json message = {
        {"role", "user"},
        {"content", {
            {"type", "text"},
            {"text", runtimeLogsPrompt()}
        }}
    };
    return makeResult(id, {
        {"description", "Information about runtime log inspection capabilities"},
        {"messages", nlohmann::json::array({message})}
    });
}

std::string MCPServer::runtimeLogsPrompt() const {
    std::ostringstream dirs;
    if (directories.empty()) {
        dirs << "  - /run/user/[UID]/log\n";
    } else {
        for (const auto& dir : directories) {
            dirs << "  - " << dir.u8string() << "\n";
        }
    }

    std::ostringstream tools;
    int index = 1;
    for (const auto& schema : registry.listToolSchemas()) {
        tools << index++ << ". **" << schema["name"].get<std::string>() << "** - "
              << schema["description"].get<std::string>() << "\n";
    }

    std::ostringstream msg;
    msg << "# Runtime Log Inspection Available\n\n"
        << "This MCP server provides access to runtime logs stored in:\n"
        << dirs.str() << "\n"
        << "## Important: When to Use Log Inspection\n\n"
        << "**ALWAYS check runtime logs when:**\n"
        << "- The user reports errors or problems with their code\n"
        << "- There are runtime failures, crashes, or unexpected behavior\n"
        << "- The user mentions something \"not working\" or \"failing\"\n"
        << "- Debugging is needed for any application or service\n"
        << "- You need to understand what happened during execution\n\n"
        << "## Available Tools\n\n"
        << tools.str() << "\n"
        << "## Recommended Workflow\n\n"
        << "When a user reports a problem:\n"
        << "1. First use `list_log_files` to see what logs are available\n"
        << "2. Use `find_errors` or `tail_log` to locate the failure cheaply\n"
        << "3. Use `search_log_file` and `read_log_range` to inspect the surrounding context\n"
        << "4. Analyze the logs to identify the root cause\n"
        << "5. Provide solutions based on the actual error messages found\n\n"
        << "All responses are bounded by a token budget; follow the continuation hints "
        << "(start_line, skip_matches) to read further.";
    return msg.str();
}
