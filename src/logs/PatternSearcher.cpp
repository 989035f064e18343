#include "logs/PatternSearcher.h"
#include "core/Errors.h"
#include "utils/TokenEstimator.h"
#include <algorithm>

std::regex PatternSearcher::compile(const std::string& pattern, bool caseSensitive) {
    auto flags = std::regex::ECMAScript;
    if (!caseSensitive) {
        flags |= std::regex::icase;
    }
    try {
        return std::regex(pattern, flags);
    } catch (const std::regex_error& e) {
        throw InvalidPatternError("Invalid regex pattern: " + pattern + " (" + e.what() + ")");
    }
}

bool PatternSearcher::matchesLine(const std::string& line, const std::regex& regex) {
    if (line.size() <= MAX_MATCH_CHARS) {
        return std::regex_search(line, regex);
    }
    // 截断处既不是行尾也不是单词边界
    auto flags = std::regex_constants::match_not_eol | std::regex_constants::match_not_eow;
    return std::regex_search(line.begin(), line.begin() + MAX_MATCH_CHARS, regex, flags);
}

std::vector<size_t> PatternSearcher::findMatches(const LogFile& file, const std::regex& regex) {
    std::vector<size_t> matches;
    const auto& lines = file.lines();
    for (size_t i = 0; i < lines.size(); ++i) {
        if (matchesLine(lines[i], regex)) {
            matches.push_back(i);
        }
    }
    return matches;
}

MatchBlock PatternSearcher::contextBlock(const LogFile& file, size_t index, size_t before, size_t after) {
    const auto& lines = file.lines();
    MatchBlock block;
    block.matchIndex = index;
    block.first = index >= before ? index - before : 0;
    block.last = std::min(lines.size() - 1, index + after);
    for (size_t i = block.first; i <= block.last; ++i) {
        block.tokens += TokenEstimator::estimateLine(lines[i]);
    }
    return block;
}

SearchResult PatternSearcher::search(const LogFile& file, const SearchOptions& options) {
    SearchResult result;
    result.options = options;

    std::regex regex = compile(options.pattern, options.caseSensitive);
    std::vector<size_t> matches = findMatches(file, regex);
    result.totalMatches = matches.size();
    if (matches.empty() || options.skip >= matches.size()) {
        return result;
    }

    for (size_t m = options.skip; m < matches.size(); ++m) {
        if (options.maxMatches) {
            if (result.blocks.size() >= *options.maxMatches) break;
        }
        MatchBlock block = contextBlock(file, matches[m], options.contextBefore, options.contextAfter);
        if (!options.maxMatches && !result.blocks.empty() &&
            result.estimatedTokens + block.tokens > options.maxTokens) {
            break;
        }
        result.estimatedTokens += block.tokens;
        result.blocks.push_back(block);
    }

    result.remaining = matches.size() - options.skip - result.blocks.size();
    return result;
}
