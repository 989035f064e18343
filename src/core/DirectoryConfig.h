#pragma once
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <filesystem>

namespace fs = std::filesystem;

/**
 * @brief 允许访问的日志目录列表 (不可变)
 *
 * 启动时解析一次,之后以 const 引用传给每个工具。顺序即优先级,
 * 相对路径解析时先匹配者胜出。
 */
class PermittedDirectories {
public:
    PermittedDirectories() = default;
    explicit PermittedDirectories(std::vector<fs::path> dirs);

    const std::vector<fs::path>& list() const { return dirs; }
    bool empty() const { return dirs.empty(); }
    size_t size() const { return dirs.size(); }
    const fs::path& front() const { return dirs.front(); }

    std::vector<fs::path>::const_iterator begin() const { return dirs.begin(); }
    std::vector<fs::path>::const_iterator end() const { return dirs.end(); }

private:
    std::vector<fs::path> dirs;
};

/**
 * @brief 日志目录的来源
 */
enum class DirectorySource {
    Explicit,      // --log-dir 或配置文件 log_dirs
    Environment,   // LOG_MCP_DIR
    Default        // $XDG_RUNTIME_DIR/log
};

struct DirectoryResolution {
    PermittedDirectories directories;
    DirectorySource source = DirectorySource::Default;
    // 显式指定但不存在的目录: 非致命,由调用方决定是否提示
    std::vector<fs::path> missingExplicit;
};

/**
 * @brief 解析允许的日志目录
 *
 * 优先级: 显式目录 > LOG_MCP_DIR (冒号分隔, 去空白, 丢弃空项) > $XDG_RUNTIME_DIR/log。
 * 解析阶段不要求目录存在;存在性在每次操作时检查。
 */
class DirectoryConfig {
public:
    static constexpr const char* DIRS_ENV = "LOG_MCP_DIR";
    static constexpr const char* RUNTIME_ROOT_ENV = "XDG_RUNTIME_DIR";
    static constexpr const char* DEFAULT_SUBDIR = "log";

    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @param explicitDirs 命令行/配置文件给出的目录,保持顺序
     * @param env 环境变量查询 (测试中可替换)
     * @throws ConfigurationError 没有任何来源给出目录
     */
    static DirectoryResolution resolve(const std::vector<std::string>& explicitDirs,
                                       const EnvLookup& env = processEnv);

    static std::optional<std::string> processEnv(const std::string& name);

    // "a: b::c" -> {"a", "b", "c"}
    static std::vector<std::string> splitDirList(const std::string& value);
};
