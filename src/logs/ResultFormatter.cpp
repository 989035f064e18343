#include "logs/ResultFormatter.h"
#include <iomanip>
#include <sstream>

const std::string ResultFormatter::SEPARATOR(60, '=');
const std::string ResultFormatter::BLOCK_SEPARATOR(60, '-');

namespace {
    std::string formatMtime(double mtime) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(6) << mtime;
        return oss.str();
    }

    void writeHeader(std::ostringstream& out, const LogFile& file) {
        out << "File: " << file.path().u8string() << "\n";
        out << "Size: " << file.sizeBytes() << " bytes\n";
    }

    const char* kindName(WindowKind kind) {
        switch (kind) {
            case WindowKind::Head: return "head";
            case WindowKind::Tail: return "tail";
            case WindowKind::Range: return "range";
            case WindowKind::Paginated: return "paginated";
        }
        return "paginated";
    }

    std::string modeDescription(BudgetMode mode, size_t limit) {
        if (mode == BudgetMode::LineCount) {
            return "line count (max " + std::to_string(limit) + " lines)";
        }
        return "token budget (max " + std::to_string(limit) + " tokens)";
    }
}

std::string ResultFormatter::formatLine(size_t lineNumber, const std::string& text, bool marked, bool withMarkerColumn) {
    std::ostringstream out;
    if (withMarkerColumn) {
        out << (marked ? ">>> " : "    ");
    }
    out << std::setw(6) << lineNumber << " | " << text << "\n";
    return out.str();
}

std::string ResultFormatter::formatError(const std::string& message) {
    return "Error: " + message;
}

std::string ResultFormatter::formatFileList(const FileListing& listing) {
    std::ostringstream out;
    if (listing.files.empty() && listing.warnings.empty()) {
        return "No log files found in any directory";
    }

    size_t dirCount = listing.directories.size();
    out << "Scanning " << dirCount << " log director" << (dirCount == 1 ? "y" : "ies") << ":\n";
    for (const auto& dir : listing.directories) {
        out << "  - " << dir.u8string() << "\n";
    }
    out << "\nFound " << listing.files.size() << " log file(s):\n\n";
    for (size_t i = 0; i < listing.files.size(); ++i) {
        out << listing.files[i];
        if (i + 1 < listing.files.size()) out << "\n";
    }

    if (!listing.warnings.empty()) {
        out << "\n\nWarnings:";
        for (const auto& w : listing.warnings) {
            out << "\n  - " << w;
        }
    }
    return out.str();
}

std::string ResultFormatter::formatContent(const LogFile& file, const ContentRead& read, size_t maxTokens) {
    std::ostringstream out;
    writeHeader(out, file);
    out << "Total lines: " << file.totalLines() << "\n";
    if (read.truncated) {
        out << "Content truncated to ~" << read.shownTokens << " of ~" << read.totalTokens
            << " tokens (max_tokens=" << maxTokens << ")\n";
    } else {
        out << "Content (~" << read.totalTokens << " tokens):\n";
    }
    out << "\n" << read.body;

    if (read.truncated) {
        out << "\n\n[Truncated: showing ~" << read.shownTokens << " of ~" << read.totalTokens << " tokens. "
            << "Use read_log_paginated with start_line=" << read.nextLine
            << " to continue, or search_log_file / find_errors to locate specific entries.]";
    }
    return out.str();
}

std::string ResultFormatter::formatWindow(const LogFile& file, const ReadWindow& window) {
    std::ostringstream out;
    if (!window.staleWarning.empty()) {
        out << window.staleWarning << "\n\n";
    }
    writeHeader(out, file);
    out << "Modified: " << formatMtime(file.fingerprint().mtime) << "\n";
    out << "Total lines: " << window.totalLines << "\n";
    out << "Mode: " << kindName(window.kind) << ", " << modeDescription(window.mode, window.limit) << "\n";

    if (window.lineCount == 0) {
        out << "\n(file is empty)";
        return out.str();
    }

    out << "Showing lines " << window.startLine << "-" << window.endLine
        << " (~" << window.estimatedTokens << " tokens)\n";
    out << "\n" << SEPARATOR << "\n\n";

    const auto& lines = file.lines();
    for (size_t n = window.startLine; n <= window.endLine; ++n) {
        out << formatLine(n, lines[n - 1], false, false);
    }

    switch (window.kind) {
        case WindowKind::Tail:
            if (window.startLine > 1) {
                size_t earlierEnd = window.startLine - 1;
                size_t earlierStart = earlierEnd > window.lineCount ? earlierEnd - window.lineCount + 1 : 1;
                out << "\n... " << earlierEnd << " earlier lines not shown. Use read_log_range with start_line="
                    << earlierStart << " end_line=" << earlierEnd << " to read backwards ...";
            }
            break;
        case WindowKind::Range:
            if (window.nextStart) {
                out << "\n... stopped at the token budget; " << (window.rangeEnd - window.endLine)
                    << " lines of the requested range remain. Continue with start_line=" << *window.nextStart
                    << " end_line=" << window.rangeEnd << " ...";
            }
            break;
        case WindowKind::Head:
            if (window.nextStart) {
                out << "\n... " << (window.totalLines - window.endLine)
                    << " more lines available. Continue with read_log_paginated start_line="
                    << *window.nextStart << " ...";
            }
            break;
        case WindowKind::Paginated:
            if (window.nextStart) {
                out << "\n... " << (window.totalLines - window.endLine)
                    << " more lines available. Continue with start_line=" << *window.nextStart
                    << " (expected_size=" << file.sizeBytes()
                    << ", expected_mtime=" << formatMtime(file.fingerprint().mtime) << ") ...";
            }
            break;
    }
    return out.str();
}

std::string ResultFormatter::formatSearch(const LogFile& file, const SearchResult& result) {
    const SearchOptions& opts = result.options;
    std::ostringstream out;
    writeHeader(out, file);
    out << "Pattern: " << opts.pattern << "\n";

    if (result.noMatches()) {
        out << "\nNo matches found for pattern: " << opts.pattern;
        return out.str();
    }
    if (result.exhausted()) {
        out << "\nNo more matches (total: " << result.totalMatches << ", skipped: " << opts.skip << ")";
        return out.str();
    }

    out << "Total matches: " << result.totalMatches << "\n";
    out << "Showing matches " << (opts.skip + 1) << "-" << (opts.skip + result.blocks.size())
        << " (~" << result.estimatedTokens << " tokens)\n";
    if (opts.maxMatches) {
        out << "Mode: match count (max " << *opts.maxMatches << " matches)\n";
    } else {
        out << "Mode: token budget (max " << opts.maxTokens << " tokens)\n";
    }
    if (opts.contextBefore == opts.contextAfter) {
        out << "Context lines: " << opts.contextBefore << "\n";
    } else {
        out << "Context lines: " << opts.contextBefore << " before, " << opts.contextAfter << " after\n";
    }
    out << "\n" << SEPARATOR << "\n\n";

    const auto& lines = file.lines();
    for (const auto& block : result.blocks) {
        for (size_t i = block.first; i <= block.last; ++i) {
            out << formatLine(i + 1, lines[i], i == block.matchIndex, true);
        }
        out << "\n" << BLOCK_SEPARATOR << "\n\n";
    }

    if (result.remaining > 0) {
        out << "... " << result.remaining << " more matches available (use skip_matches="
            << result.nextSkip() << ") ...";
    }
    return out.str();
}

std::string ResultFormatter::formatErrorScan(const LogFile& file, const ErrorScanResult& result) {
    const ErrorScanOptions& opts = result.options;
    std::ostringstream out;
    writeHeader(out, file);
    out << "Error patterns: " << result.patternCount
        << (opts.includeWarnings ? " (warnings included)" : " (warnings excluded)") << "\n";

    if (result.hits.empty()) {
        out << "\nNo error lines found"
            << (opts.includeWarnings ? "" : " (set include_warnings=true to also match warnings)");
        return out.str();
    }

    out << "Total hits: " << result.hits.size() << "\n";
    out << "Showing hits 1-" << result.shownHits << " in " << result.blocks.size() << " block(s) (~"
        << result.estimatedTokens << " tokens, max " << opts.maxTokens << ")\n";
    if (!result.categories.empty()) {
        out << "Categories:";
        bool first = true;
        for (const auto& [category, count] : result.categories) {
            out << (first ? " " : ", ") << category << "=" << count;
            first = false;
        }
        out << "\n";
    }
    out << "Context lines: " << opts.contextLines << "\n";
    out << "\n" << SEPARATOR << "\n\n";

    const auto& lines = file.lines();
    for (const auto& block : result.blocks) {
        for (size_t i = block.first; i <= block.last; ++i) {
            out << formatLine(i + 1, lines[i], result.isHit(i), true);
        }
        out << "\n" << BLOCK_SEPARATOR << "\n\n";
    }

    if (result.remaining() > 0) {
        size_t nextLine = result.hits[result.shownHits] + 1;
        out << "... " << result.remaining() << " more hits not shown (next at line " << nextLine
            << "). Increase max_tokens, or use read_log_paginated with start_line=" << nextLine << " ...";
    }
    return out.str();
}
