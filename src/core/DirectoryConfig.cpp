#include "core/DirectoryConfig.h"
#include "core/Errors.h"
#include <algorithm>
#include <cstdlib>
#include <sstream>

PermittedDirectories::PermittedDirectories(std::vector<fs::path> input) {
    for (auto& dir : input) {
        fs::path normalized = fs::absolute(dir).lexically_normal();
        // "/var/log/" 归一化后带空的末尾分量
        if (!normalized.has_filename() && normalized.has_parent_path() && normalized != normalized.root_path()) {
            normalized = normalized.parent_path();
        }
        if (std::find(dirs.begin(), dirs.end(), normalized) == dirs.end()) {
            dirs.push_back(std::move(normalized));
        }
    }
}

std::optional<std::string> DirectoryConfig::processEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

std::vector<std::string> DirectoryConfig::splitDirList(const std::string& value) {
    std::vector<std::string> result;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ':')) {
        size_t first = item.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) continue;
        size_t last = item.find_last_not_of(" \t\r\n");
        result.push_back(item.substr(first, last - first + 1));
    }
    return result;
}

DirectoryResolution DirectoryConfig::resolve(const std::vector<std::string>& explicitDirs, const EnvLookup& env) {
    DirectoryResolution resolution;

    // 1. 显式指定
    std::vector<fs::path> explicitPaths;
    for (const auto& d : explicitDirs) {
        if (!d.empty()) explicitPaths.push_back(fs::u8path(d));
    }
    if (!explicitPaths.empty()) {
        resolution.source = DirectorySource::Explicit;
        resolution.directories = PermittedDirectories(explicitPaths);
        for (const auto& dir : resolution.directories) {
            std::error_code ec;
            if (!fs::exists(dir, ec)) {
                resolution.missingExplicit.push_back(dir);
            }
        }
        return resolution;
    }

    // 2. LOG_MCP_DIR
    if (auto value = env(DIRS_ENV)) {
        std::vector<fs::path> envPaths;
        for (const auto& d : splitDirList(*value)) {
            envPaths.push_back(fs::u8path(d));
        }
        if (!envPaths.empty()) {
            resolution.source = DirectorySource::Environment;
            resolution.directories = PermittedDirectories(envPaths);
            return resolution;
        }
    }

    // 3. $XDG_RUNTIME_DIR/log
    auto runtimeRoot = env(RUNTIME_ROOT_ENV);
    if (!runtimeRoot || runtimeRoot->empty()) {
        throw ConfigurationError(std::string(RUNTIME_ROOT_ENV) + " not set and no log directory specified");
    }
    resolution.source = DirectorySource::Default;
    resolution.directories = PermittedDirectories({fs::u8path(*runtimeRoot) / DEFAULT_SUBDIR});
    return resolution;
}
