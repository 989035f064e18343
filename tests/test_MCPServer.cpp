/**
 * MCP 协议层测试: JSON-RPC 分发、通知、错误码、prompts 以及 stdio 循环。
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/DirectoryConfig.h"
#include "mcp/MCPServer.h"
#include "tools/LogTools.h"
#include "tools/ToolRegistry.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

static void createFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream f(path, std::ios::binary);
    f << content;
}

class MCPServerTest : public ::testing::Test {
protected:
    fs::path logDir = fs::temp_directory_path() / "loginspector_mcp_test";
    PermittedDirectories dirs{std::vector<fs::path>{logDir}};
    ToolRegistry registry;
    std::unique_ptr<MCPServer> server;

    void SetUp() override {
        fs::remove_all(logDir);
        createFile(logDir / "service.log", "boot\nERROR disk full\nshutdown\n");
        registerLogTools(registry, dirs);
        server = std::make_unique<MCPServer>(registry, dirs);
    }

    void TearDown() override {
        fs::remove_all(logDir);
    }

    json request(const std::string& method, const json& params = json::object(), int id = 1) {
        return server->handleRequest({{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}});
    }
};

TEST_F(MCPServerTest, Initialize) {
    json response = request("initialize", {
        {"protocolVersion", "2024-11-05"},
        {"clientInfo", {{"name", "test-client"}, {"version", "0.1"}}}
    });
    EXPECT_EQ(response["jsonrpc"], "2.0");
    EXPECT_EQ(response["id"], 1);
    const json& result = response["result"];
    EXPECT_EQ(result["protocolVersion"], MCPServer::PROTOCOL_VERSION);
    EXPECT_EQ(result["serverInfo"]["name"], "log-inspector");
    EXPECT_TRUE(result["capabilities"].contains("tools"));
    EXPECT_TRUE(result["capabilities"].contains("prompts"));
}

TEST_F(MCPServerTest, PingEchoesStringId) {
    json response = server->handleRequest({{"jsonrpc", "2.0"}, {"id", "abc"}, {"method", "ping"}});
    EXPECT_EQ(response["id"], "abc");
    EXPECT_TRUE(response["result"].is_object());
}

TEST_F(MCPServerTest, ToolsListInRegistrationOrder) {
    json tools = request("tools/list")["result"]["tools"];
    ASSERT_EQ(tools.size(), 8u);
    EXPECT_EQ(tools[0]["name"], "list_log_files");
    EXPECT_EQ(tools[7]["name"], "find_errors");
    for (const auto& tool : tools) {
        EXPECT_TRUE(tool.contains("description"));
        EXPECT_EQ(tool["inputSchema"]["type"], "object");
    }
    EXPECT_EQ(tools[6]["inputSchema"]["required"], json({"filename", "pattern"}));
}

TEST_F(MCPServerTest, ToolsCallReturnsTextContent) {
    json response = request("tools/call", {
        {"name", "find_errors"},
        {"arguments", {{"filename", "service.log"}, {"context_lines", 0}}}
    });
    const json& result = response["result"];
    EXPECT_FALSE(result["isError"].get<bool>());
    EXPECT_EQ(result["content"][0]["type"], "text");
    EXPECT_NE(result["content"][0]["text"].get<std::string>().find(">>>      2 | ERROR disk full"), std::string::npos);
}

TEST_F(MCPServerTest, ToolFailureIsAResultNotAProtocolError) {
    json response = request("tools/call", {{"name", "head_log"}, {"arguments", {{"filename", "nope.log"}}}});
    ASSERT_TRUE(response.contains("result"));
    EXPECT_TRUE(response["result"]["isError"].get<bool>());

    response = request("tools/call", {{"name", "no_such_tool"}});
    EXPECT_TRUE(response["result"]["isError"].get<bool>());
    EXPECT_EQ(response["result"]["content"][0]["text"], "Error: Unknown tool: no_such_tool");
}

TEST_F(MCPServerTest, ToolsCallWithoutName) {
    json response = request("tools/call", json::object());
    EXPECT_EQ(response["error"]["code"], MCPServer::INVALID_PARAMS);
}

TEST_F(MCPServerTest, NotificationsGetNoResponse) {
    json response = server->handleRequest({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    EXPECT_TRUE(response.is_null());
}

TEST_F(MCPServerTest, UnknownMethod) {
    json response = request("resources/list");
    EXPECT_EQ(response["error"]["code"], MCPServer::METHOD_NOT_FOUND);
    EXPECT_EQ(response["id"], 1);
}

TEST_F(MCPServerTest, MalformedLines) {
    json parseError = server->handleLine("{not json");
    EXPECT_EQ(parseError["error"]["code"], MCPServer::PARSE_ERROR);
    EXPECT_TRUE(parseError["id"].is_null());

    json notObject = server->handleLine("[1,2,3]");
    EXPECT_EQ(notObject["error"]["code"], MCPServer::INVALID_REQUEST);

    json noMethod = server->handleLine(R"({"jsonrpc":"2.0","id":4})");
    EXPECT_EQ(noMethod["error"]["code"], MCPServer::INVALID_REQUEST);
    EXPECT_EQ(noMethod["id"], 4);

    EXPECT_TRUE(server->handleLine("").is_null());
    EXPECT_TRUE(server->handleLine("   \r").is_null());
}

TEST_F(MCPServerTest, Prompts) {
    json prompts = request("prompts/list")["result"]["prompts"];
    ASSERT_EQ(prompts.size(), 1u);
    EXPECT_EQ(prompts[0]["name"], "runtime-logs");

    json result = request("prompts/get", {{"name", "runtime-logs"}})["result"];
    ASSERT_EQ(result["messages"].size(), 1u);
    EXPECT_EQ(result["messages"][0]["role"], "user");
    std::string text = result["messages"][0]["content"]["text"].get<std::string>();
    EXPECT_NE(text.find(logDir.string()), std::string::npos);
    EXPECT_NE(text.find("**tail_log**"), std::string::npos);

    json unknown = request("prompts/get", {{"name", "other"}});
    EXPECT_EQ(unknown["error"]["code"], MCPServer::INVALID_PARAMS);
}

TEST_F(MCPServerTest, RunLoopOverStreams) {
    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"tail_log","arguments":{"filename":"service.log","lines":1}}})" "\n"
        "garbage\n");
    std::ostringstream out;
    server->run(in, out);

    std::vector<json> responses;
    std::istringstream lines(out.str());
    std::string line;
    while (std::getline(lines, line)) {
        responses.push_back(json::parse(line));
    }
    ASSERT_EQ(responses.size(), 3u);
    EXPECT_EQ(responses[0]["id"], 1);
    EXPECT_EQ(responses[1]["id"], 2);
    EXPECT_NE(responses[1]["result"]["content"][0]["text"].get<std::string>().find("3 | shutdown"), std::string::npos);
    EXPECT_EQ(responses[2]["error"]["code"], MCPServer::PARSE_ERROR);
}
