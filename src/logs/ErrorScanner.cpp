#include "logs/ErrorScanner.h"
#include "logs/PatternSearcher.h"
#include "utils/TokenEstimator.h"
#include <algorithm>

bool ErrorScanResult::isHit(size_t index) const {
    return std::binary_search(hits.begin(), hits.end(), index);
}

ErrorScanResult ErrorScanner::scan(const LogFile& file, const ErrorScanOptions& options) {
    ErrorScanResult result;
    result.options = options;

    ErrorPatternSet patterns(options.includeWarnings);
    result.patternCount = patterns.active().size();
    result.hits = PatternSearcher::findMatches(file, patterns.combined());
    if (result.hits.empty()) {
        return result;
    }

    const auto& lines = file.lines();
    std::vector<bool> seen(lines.size(), false);

    for (size_t hit : result.hits) {
        MatchBlock block = PatternSearcher::contextBlock(file, hit, options.contextLines, options.contextLines);

        std::vector<size_t> fresh;
        size_t incremental = 0;
        for (size_t i = block.first; i <= block.last; ++i) {
            if (seen[i]) continue;
            fresh.push_back(i);
            incremental += TokenEstimator::estimateLine(lines[i]);
        }

        if (!fresh.empty()) {
            if (!result.blocks.empty() && result.estimatedTokens + incremental > options.maxTokens) {
                break;
            }
            for (size_t i : fresh) seen[i] = true;
            result.estimatedTokens += incremental;

            // 命中是升序的,新行总是接在已输出内容之后;紧邻上一块时直接延长
            if (!result.blocks.empty() && result.blocks.back().last + 1 == fresh.front()) {
                result.blocks.back().last = fresh.back();
            } else {
                result.blocks.push_back({fresh.front(), fresh.back()});
            }
        }

        result.shownHits++;
        if (auto category = patterns.classify(lines[hit])) {
            result.categories[*category]++;
        }
    }
    return result;
}
