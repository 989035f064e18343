#include "ToolRegistry.h"
#include "core/Errors.h"
#include "logs/ResultFormatter.h"
#include "utils/Logger.h"

void ToolRegistry::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) return;

    std::string name = tool->getName();
    auto it = indexByName.find(name);
    if (it != indexByName.end()) {
        Logger::getInstance().warn("Tool registered twice, replacing: " + name);
        tools[it->second] = std::move(tool);
        return;
    }

    indexByName[name] = tools.size();
    tools.push_back(std::move(tool));
}

ITool* ToolRegistry::getTool(const std::string& name) {
    auto it = indexByName.find(name);
    if (it == indexByName.end()) {
        return nullptr;
    }
    return tools[it->second].get();
}

std::vector<nlohmann::json> ToolRegistry::listToolSchemas() const {
    std::vector<nlohmann::json> schemas;

    for (const auto& tool : tools) {
        nlohmann::json schema;
        schema["name"] = tool->getName();
        schema["description"] = tool->getDescription();
        schema["inputSchema"] = tool->getSchema();
        schemas.push_back(schema);
    }

    return schemas;
}

nlohmann::json ToolRegistry::executeTool(const std::string& name, const nlohmann::json& args) {
    ITool* tool = getTool(name);
    if (!tool) {
        return ITool::textResult(ResultFormatter::formatError("Unknown tool: " + name), true);
    }

    try {
        return tool->execute(args);
    } catch (const LogToolError& e) {
        Logger::getInstance().warn(name + " failed: " + e.what());
        return ITool::textResult(ResultFormatter::formatError(e.what()), true);
    } catch (const std::exception& e) {
        Logger::getInstance().error(name + " failed unexpectedly: " + e.what());
        return ITool::textResult(ResultFormatter::formatError(std::string("Tool execution failed: ") + e.what()), true);
    }
}

bool ToolRegistry::hasTool(const std::string& name) const {
    return indexByName.count(name) > 0;
}
