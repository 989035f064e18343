#include "LogTools.h"
#include "ToolRegistry.h"
#include "LogRequests.h"
#include "logs/PathResolver.h"
#include "logs/LogFile.h"
#include "logs/LogDirectoryScanner.h"
#include "logs/WindowedReader.h"
#include "logs/PatternSearcher.h"
#include "logs/ErrorScanner.h"
#include "logs/ResultFormatter.h"

namespace {
    LogFile loadLogFile(const PermittedDirectories& directories, const std::string& filename) {
        PathResolver resolver(directories);
        return LogFile::load(resolver.resolve(filename));
    }

    nlohmann::json filenameProperty() {
        return {
            {"type", "string"},
            {"description", "Name of the log file (relative to a log directory) or an absolute path inside one"}
        };
    }

    nlohmann::json maxTokensProperty(const std::string& extra = "") {
        return {
            {"type", "integer"},
            {"minimum", 1},
            {"maximum", RequestLimits::MAX_TOKENS},
            {"default", RequestLimits::DEFAULT_MAX_TOKENS},
            {"description", "Approximate token budget for the response (1 token ~ 4 characters)." + extra}
        };
    }

    nlohmann::json contextProperty(const std::string& description) {
        return {
            {"type", "integer"},
            {"minimum", 0},
            {"maximum", RequestLimits::MAX_CONTEXT_LINES},
            {"description", description}
        };
    }
}

// ============================================================================
// ListLogFilesTool
// ============================================================================

ListLogFilesTool::ListLogFilesTool(const PermittedDirectories& directories) : directories(directories) {}

std::string ListLogFilesTool::getDescription() const {
    return "Lists all log files in the configured log directories. "
           "Use this FIRST when the user reports errors or problems to see what logs are available for inspection.";
}

nlohmann::json ListLogFilesTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", nlohmann::json::object()},
        {"required", nlohmann::json::array()}
    };
}

nlohmann::json ListLogFilesTool::execute(const nlohmann::json& /*args*/) {
    return textResult(ResultFormatter::formatFileList(LogDirectoryScanner::scan(directories)));
}

// ============================================================================
// GetLogContentTool
// ============================================================================

GetLogContentTool::GetLogContentTool(const PermittedDirectories& directories) : directories(directories) {}

std::string GetLogContentTool::getDescription() const {
    return "Returns the content of a log file. If the file exceeds max_tokens it is truncated at a line boundary "
           "with an explicit notice; use read_log_paginated, tail_log or search_log_file for large files.";
}

nlohmann::json GetLogContentTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"filename", filenameProperty()},
            {"max_tokens", maxTokensProperty()}
        }},
        {"required", {"filename"}}
    };
}

nlohmann::json GetLogContentTool::execute(const nlohmann::json& args) {
    auto req = GetContentRequest::parse(args);
    LogFile file = loadLogFile(directories, req.filename);
    ContentRead read = WindowedReader::readContent(file, req.maxTokens);
    return textResult(ResultFormatter::formatContent(file, read, req.maxTokens));
}

// ============================================================================
// ReadLogPaginatedTool
// ============================================================================

ReadLogPaginatedTool::ReadLogPaginatedTool(const PermittedDirectories& directories) : directories(directories) {}

std::string ReadLogPaginatedTool::getDescription() const {
    return "Reads a log file page by page under a token budget. Each response ends with the start_line to pass "
           "for the next page, plus expected_size/expected_mtime: pass them back to be warned if the file "
           "changed between pages. num_lines switches to a fixed line count (legacy mode).";
}

nlohmann::json ReadLogPaginatedTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"filename", filenameProperty()},
            {"start_line", {
                {"type", "integer"},
                {"minimum", 1},
                {"default", 1},
                {"description", "Starting line number (1-based)"}
            }},
            {"max_tokens", maxTokensProperty(" Ignored when num_lines is given.")},
            {"num_lines", {
                {"type", "integer"},
                {"minimum", 1},
                {"maximum", RequestLimits::MAX_NUM_LINES},
                {"description", "Legacy: number of lines to read. Overrides max_tokens."}
            }},
            {"expected_size", {
                {"type", "integer"},
                {"minimum", 0},
                {"description", "File size reported by the previous page, for change detection"}
            }},
            {"expected_mtime", {
                {"type", "number"},
                {"description", "Modification time reported by the previous page, for change detection"}
            }}
        }},
        {"required", {"filename"}}
    };
}

nlohmann::json ReadLogPaginatedTool::execute(const nlohmann::json& args) {
    auto req = PaginatedRequest::parse(args);
    LogFile file = loadLogFile(directories, req.filename);
    ReadWindow window = WindowedReader::readPaginated(file, req.startLine, req.maxTokens, req.numLines,
                                                      req.expectedSize, req.expectedMtime);
    return textResult(ResultFormatter::formatWindow(file, window));
}

// ============================================================================
// ReadLogRangeTool
// ============================================================================

ReadLogRangeTool::ReadLogRangeTool(const PermittedDirectories& directories) : directories(directories) {}

std::string ReadLogRangeTool::getDescription() const {
    return "Reads a specific line range [start_line, end_line] of a log file, stopping early if max_tokens is "
           "reached. Omit end_line to read to the end of the file.";
}

nlohmann::json ReadLogRangeTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"filename", filenameProperty()},
            {"start_line", {
                {"type", "integer"},
                {"minimum", 1},
                {"description", "First line to read (1-based)"}
            }},
            {"end_line", {
                {"type", "integer"},
                {"minimum", 1},
                {"description", "Last line to read (inclusive, >= start_line). Defaults to the end of the file."}
            }},
            {"max_tokens", maxTokensProperty()}
        }},
        {"required", {"filename", "start_line"}}
    };
}

nlohmann::json ReadLogRangeTool::execute(const nlohmann::json& args) {
    auto req = RangeRequest::parse(args);
    LogFile file = loadLogFile(directories, req.filename);
    ReadWindow window = WindowedReader::readRange(file, req.startLine, req.endLine, req.maxTokens);
    return textResult(ResultFormatter::formatWindow(file, window));
}

// ============================================================================
// HeadLogTool / TailLogTool
// ============================================================================

namespace {
    nlohmann::json edgeSchema(const std::string& which) {
        return {
            {"type", "object"},
            {"properties", {
                {"filename", filenameProperty()},
                {"lines", {
                    {"type", "integer"},
                    {"minimum", 1},
                    {"maximum", RequestLimits::MAX_HEAD_TAIL_LINES},
                    {"description", "Number of " + which + " lines to return. Takes precedence over max_tokens."}
                }},
                {"max_tokens", maxTokensProperty(" Used when lines is not given.")}
            }},
            {"required", {"filename"}}
        };
    }
}

HeadLogTool::HeadLogTool(const PermittedDirectories& directories) : directories(directories) {}

std::string HeadLogTool::getDescription() const {
    return "Returns the first lines of a log file, bounded by a line count or a token budget.";
}

nlohmann::json HeadLogTool::getSchema() const {
    return edgeSchema("first");
}

nlohmann::json HeadLogTool::execute(const nlohmann::json& args) {
    auto req = EdgeRequest::parse(args);
    LogFile file = loadLogFile(directories, req.filename);
    return textResult(ResultFormatter::formatWindow(file, WindowedReader::readHead(file, req.lines, req.maxTokens)));
}

TailLogTool::TailLogTool(const PermittedDirectories& directories) : directories(directories) {}

std::string TailLogTool::getDescription() const {
    return "Returns the last lines of a log file (most recent entries), bounded by a line count or a token budget. "
           "Usually the best first look at a log after a failure.";
}

nlohmann::json TailLogTool::getSchema() const {
    return edgeSchema("last");
}

nlohmann::json TailLogTool::execute(const nlohmann::json& args) {
    auto req = EdgeRequest::parse(args);
    LogFile file = loadLogFile(directories, req.filename);
    return textResult(ResultFormatter::formatWindow(file, WindowedReader::readTail(file, req.lines, req.maxTokens)));
}

// ============================================================================
// SearchLogFileTool
// ============================================================================

SearchLogFileTool::SearchLogFileTool(const PermittedDirectories& directories) : directories(directories) {}

std::string SearchLogFileTool::getDescription() const {
    return "Searches a log file with a regex (ECMAScript syntax) and returns matching lines with surrounding "
           "context, marked with >>>. Results are budgeted by max_tokens (or max_matches in legacy mode); "
           "pass the reported skip_matches to get the next page.";
}

nlohmann::json SearchLogFileTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"filename", filenameProperty()},
            {"pattern", {
                {"type", "string"},
                {"description", "Regex pattern to search for"}
            }},
            {"context_lines", contextProperty("Lines to show before and after each match (default: 2)")},
            {"context_before", contextProperty("Lines before each match; overrides context_lines")},
            {"context_after", contextProperty("Lines after each match; overrides context_lines")},
            {"case_sensitive", {
                {"type", "boolean"},
                {"default", false},
                {"description", "Whether the search is case-sensitive"}
            }},
            {"max_tokens", maxTokensProperty(" Ignored when max_matches is given.")},
            {"max_matches", {
                {"type", "integer"},
                {"minimum", 1},
                {"maximum", RequestLimits::MAX_MATCHES},
                {"description", "Legacy: maximum number of matches to return. Overrides max_tokens."}
            }},
            {"skip_matches", {
                {"type", "integer"},
                {"minimum", 0},
                {"default", 0},
                {"description", "Number of matches to skip (for pagination)"}
            }}
        }},
        {"required", {"filename", "pattern"}}
    };
}

nlohmann::json SearchLogFileTool::execute(const nlohmann::json& args) {
    auto req = SearchRequest::parse(args);
    // 先编译正则: 非法模式优先于文件问题报告
    PatternSearcher::compile(req.options.pattern, req.options.caseSensitive);
    LogFile file = loadLogFile(directories, req.filename);
    return textResult(ResultFormatter::formatSearch(file, PatternSearcher::search(file, req.options)));
}

// ============================================================================
// FindErrorsTool
// ============================================================================

FindErrorsTool::FindErrorsTool(const PermittedDirectories& directories) : directories(directories) {}

std::string FindErrorsTool::getDescription() const {
    return "Finds likely failure lines in a log file using a fixed set of heuristics (error/fatal keywords, "
           "exceptions and tracebacks, stack frames, crashes and panics, out-of-memory, HTTP 4xx/5xx, non-zero "
           "exit codes, assertion failures). Overlapping context is shown once.";
}

nlohmann::json FindErrorsTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"filename", filenameProperty()},
            {"context_lines", contextProperty("Lines to show before and after each hit (default: 2)")},
            {"include_warnings", {
                {"type", "boolean"},
                {"default", false},
                {"description", "Also match warning-level lines"}
            }},
            {"max_tokens", maxTokensProperty()}
        }},
        {"required", {"filename"}}
    };
}

nlohmann::json FindErrorsTool::execute(const nlohmann::json& args) {
    auto req = FindErrorsRequest::parse(args);
    LogFile file = loadLogFile(directories, req.filename);
    return textResult(ResultFormatter::formatErrorScan(file, ErrorScanner::scan(file, req.options)));
}

// ============================================================================

void registerLogTools(ToolRegistry& registry, const PermittedDirectories& directories) {
    registry.registerTool(std::make_unique<ListLogFilesTool>(directories));
    registry.registerTool(std::make_unique<GetLogContentTool>(directories));
    registry.registerTool(std::make_unique<ReadLogPaginatedTool>(directories));
    registry.registerTool(std::make_unique<ReadLogRangeTool>(directories));
    registry.registerTool(std::make_unique<HeadLogTool>(directories));
    registry.registerTool(std::make_unique<TailLogTool>(directories));
    registry.registerTool(std::make_unique<SearchLogFileTool>(directories));
    registry.registerTool(std::make_unique<FindErrorsTool>(directories));
}
