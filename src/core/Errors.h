#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief 日志工具错误基类
 *
 * 所有核心组件抛出的错误都派生自此类。ToolRegistry 在工具边界捕获并渲染为
 * "Error: ..." 文本,不会穿透到协议层。
 */
class LogToolError : public std::runtime_error {
public:
    explicit LogToolError(const std::string& message) : std::runtime_error(message) {}
};

// 没有任何可用的日志目录
class ConfigurationError : public LogToolError {
public:
    using LogToolError::LogToolError;
};

// 绝对路径不在任何允许的目录内
class InvalidPathError : public LogToolError {
public:
    using LogToolError::LogToolError;
};

class NotFoundError : public LogToolError {
public:
    using LogToolError::LogToolError;
};

class NotAFileError : public LogToolError {
public:
    using LogToolError::LogToolError;
};

class PermissionError : public LogToolError {
public:
    using LogToolError::LogToolError;
};

// 参数越界、end_line < start_line、start_line 超出文件长度
class InvalidArgumentError : public LogToolError {
public:
    using LogToolError::LogToolError;
};

class InvalidPatternError : public LogToolError {
public:
    using LogToolError::LogToolError;
};
