#include "logs/PathResolver.h"
#include "core/Errors.h"

namespace {
    // 去掉末尾的空分量 ("/var/log/" 的最后一段)
    std::vector<fs::path> components(const fs::path& p) {
        std::vector<fs::path> parts;
        for (const auto& part : p) {
            parts.push_back(part);
        }
        while (!parts.empty() && parts.back().empty()) {
            parts.pop_back();
        }
        return parts;
    }
}

PathResolver::PathResolver(const PermittedDirectories& directories) : directories(directories) {}

fs::path PathResolver::canonicalize(const fs::path& p) {
    std::error_code ec;
    fs::path result = fs::canonical(p, ec);
    if (!ec) return result;
    result = fs::weakly_canonical(p, ec);
    if (!ec) return result;
    return fs::absolute(p).lexically_normal();
}

bool PathResolver::isWithin(const fs::path& dir, const fs::path& p) {
    auto dirParts = components(dir);
    auto pathParts = components(p);
    if (dirParts.empty() || pathParts.size() < dirParts.size()) {
        return false;
    }
    for (size_t i = 0; i < dirParts.size(); ++i) {
        if (dirParts[i] != pathParts[i]) return false;
    }
    return true;
}

ResolvedFile PathResolver::resolve(const std::string& filename) const {
    if (directories.empty()) {
        throw ConfigurationError("No log directories configured");
    }

    fs::path input = fs::u8path(filename);

    if (input.is_absolute()) {
        fs::path resolved = canonicalize(input);
        for (const auto& dir : directories) {
            if (isWithin(canonicalize(dir), resolved)) {
                return {dir, resolved};
            }
        }
        throw InvalidPathError("File not in any allowed log directory: " + filename);
    }

    for (const auto& dir : directories) {
        fs::path candidate = canonicalize(dir / input);
        if (!isWithin(canonicalize(dir), candidate)) {
            continue;
        }
        std::error_code ec;
        if (fs::exists(candidate, ec)) {
            return {dir, candidate};
        }
    }

    // 都不存在: 指向第一个目录,让调用方报告 "does not exist"
    const fs::path& first = directories.front();
    fs::path fallback = canonicalize(first / input);
    if (!isWithin(canonicalize(first), fallback)) {
        throw InvalidPathError("File not in any allowed log directory: " + filename);
    }
    return {first, fallback};
}
