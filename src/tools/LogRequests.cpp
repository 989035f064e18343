#include "tools/LogRequests.h"
#include "core/Errors.h"
#include <cmath>
#include <cstdint>
#include <limits>

namespace {
    bool present(const nlohmann::json& args, const char* key) {
        return args.is_object() && args.contains(key) && !args[key].is_null();
    }

    std::string requireString(const nlohmann::json& args, const char* key) {
        if (!present(args, key) || !args[key].is_string() || args[key].get<std::string>().empty()) {
            throw InvalidArgumentError(std::string(key) + " parameter is required");
        }
        return args[key].get<std::string>();
    }

    // 整数参数;部分客户端会把数字当字符串发送,也接受
    std::optional<long long> optionalInt(const nlohmann::json& args, const char* key,
                                         long long minValue, long long maxValue) {
        if (!present(args, key)) return std::nullopt;
        const auto& v = args[key];
        auto outOfRange = [&]() {
            if (maxValue == std::numeric_limits<long long>::max()) {
                return InvalidArgumentError(std::string(key) + " must be >= " + std::to_string(minValue));
            }
            return InvalidArgumentError(std::string(key) + " must be between " + std::to_string(minValue) +
                                        " and " + std::to_string(maxValue));
        };

        long long value = 0;
        if (v.is_number_unsigned()) {
            auto u = v.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(maxValue)) throw outOfRange();
            value = static_cast<long long>(u);
        } else if (v.is_number_integer()) {
            value = v.get<long long>();
        } else if (v.is_number_float() && std::floor(v.get<double>()) == v.get<double>()) {
            // 先按 double 比较边界,超出 long long 的值不能直接转换 (2^63 本身也超出)
            double d = v.get<double>();
            if (d < static_cast<double>(minValue) || d > static_cast<double>(maxValue) ||
                d >= 9223372036854775808.0) {
                throw outOfRange();
            }
            value = static_cast<long long>(d);
        } else if (v.is_string()) {
            const std::string s = v.get<std::string>();
            size_t pos = 0;
            try {
                value = std::stoll(s, &pos);
            } catch (const std::exception&) {
                pos = 0;
            }
            if (pos == 0 || pos != s.size()) {
                throw InvalidArgumentError(std::string(key) + " must be an integer");
            }
        } else {
            throw InvalidArgumentError(std::string(key) + " must be an integer");
        }

        if (value < minValue || value > maxValue) {
            throw outOfRange();
        }
        return value;
    }

    std::optional<size_t> optionalCount(const nlohmann::json& args, const char* key,
                                        long long minValue, long long maxValue) {
        auto value = optionalInt(args, key, minValue, maxValue);
        if (!value) return std::nullopt;
        return static_cast<size_t>(*value);
    }

    bool optionalBool(const nlohmann::json& args, const char* key, bool defaultValue) {
        if (!present(args, key)) return defaultValue;
        const auto& v = args[key];
        if (v.is_boolean()) return v.get<bool>();
        if (v.is_string()) {
            const std::string s = v.get<std::string>();
            if (s == "true") return true;
            if (s == "false") return false;
        }
        throw InvalidArgumentError(std::string(key) + " must be a boolean");
    }

    std::optional<double> optionalNumber(const nlohmann::json& args, const char* key) {
        if (!present(args, key)) return std::nullopt;
        const auto& v = args[key];
        if (v.is_number()) return v.get<double>();
        if (v.is_string()) {
            const std::string s = v.get<std::string>();
            size_t pos = 0;
            double value = 0.0;
            try {
                value = std::stod(s, &pos);
            } catch (const std::exception&) {
                pos = 0;
            }
            if (pos != 0 && pos == s.size()) return value;
        }
        throw InvalidArgumentError(std::string(key) + " must be a number");
    }

    constexpr long long kNoUpperBound = std::numeric_limits<long long>::max();

    size_t maxTokensOf(const nlohmann::json& args) {
        return optionalCount(args, "max_tokens", 1, RequestLimits::MAX_TOKENS)
            .value_or(RequestLimits::DEFAULT_MAX_TOKENS);
    }

    size_t contextOf(const nlohmann::json& args, const char* key) {
        return optionalCount(args, key, 0, RequestLimits::MAX_CONTEXT_LINES)
            .value_or(RequestLimits::DEFAULT_CONTEXT_LINES);
    }
}

GetContentRequest GetContentRequest::parse(const nlohmann::json& args) {
    GetContentRequest req;
    req.filename = requireString(args, "filename");
    req.maxTokens = maxTokensOf(args);
    return req;
}

PaginatedRequest PaginatedRequest::parse(const nlohmann::json& args) {
    PaginatedRequest req;
    req.filename = requireString(args, "filename");
    req.startLine = optionalCount(args, "start_line", 1, kNoUpperBound).value_or(1);
    req.maxTokens = maxTokensOf(args);
    req.numLines = optionalCount(args, "num_lines", 1, RequestLimits::MAX_NUM_LINES);
    if (auto size = optionalInt(args, "expected_size", 0, kNoUpperBound)) {
        req.expectedSize = static_cast<std::uintmax_t>(*size);
    }
    req.expectedMtime = optionalNumber(args, "expected_mtime");
    return req;
}

RangeRequest RangeRequest::parse(const nlohmann::json& args) {
    RangeRequest req;
    req.filename = requireString(args, "filename");
    auto start = optionalCount(args, "start_line", 1, kNoUpperBound);
    if (!start) {
        throw InvalidArgumentError("start_line parameter is required");
    }
    req.startLine = *start;
    req.endLine = optionalCount(args, "end_line", 1, kNoUpperBound);
    if (req.endLine && *req.endLine < req.startLine) {
        throw InvalidArgumentError("end_line (" + std::to_string(*req.endLine) +
                                   ") must be >= start_line (" + std::to_string(req.startLine) + ")");
    }
    req.maxTokens = maxTokensOf(args);
    return req;
}

EdgeRequest EdgeRequest::parse(const nlohmann::json& args) {
    EdgeRequest req;
    req.filename = requireString(args, "filename");
    req.lines = optionalCount(args, "lines", 1, RequestLimits::MAX_HEAD_TAIL_LINES);
    req.maxTokens = maxTokensOf(args);
    return req;
}

SearchRequest SearchRequest::parse(const nlohmann::json& args) {
    SearchRequest req;
    req.filename = requireString(args, "filename");
    req.options.pattern = requireString(args, "pattern");
    req.options.caseSensitive = optionalBool(args, "case_sensitive", false);

    size_t context = contextOf(args, "context_lines");
    req.options.contextBefore = optionalCount(args, "context_before", 0, RequestLimits::MAX_CONTEXT_LINES).value_or(context);
    req.options.contextAfter = optionalCount(args, "context_after", 0, RequestLimits::MAX_CONTEXT_LINES).value_or(context);

    req.options.skip = optionalCount(args, "skip_matches", 0, kNoUpperBound).value_or(0);
    req.options.maxTokens = maxTokensOf(args);
    req.options.maxMatches = optionalCount(args, "max_matches", 1, RequestLimits::MAX_MATCHES);
    return req;
}

FindErrorsRequest FindErrorsRequest::parse(const nlohmann::json& args) {
    FindErrorsRequest req;
    req.filename = requireString(args, "filename");
    req.options.contextLines = contextOf(args, "context_lines");
    req.options.includeWarnings = optionalBool(args, "include_warnings", false);
    req.options.maxTokens = maxTokensOf(args);
    return req;
}
