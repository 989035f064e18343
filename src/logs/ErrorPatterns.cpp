#include "logs/ErrorPatterns.h"
#include "logs/PatternSearcher.h"

namespace {
    constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase;

    // 所有重复都必须有上限
    const std::vector<ErrorPattern> kErrorPatternTable = {
        // Severity keywords
        {R"(\b(?:errors?|err|fatal|critical|crit|severe|emerg(?:ency)?|alert)\b)", "severity", PatternSeverity::Error},
        {R"(\bfail(?:ed|ure|s)?\b)", "failure", PatternSeverity::Error},
        // Exceptions and tracebacks
        {R"(\bexception\b)", "exception", PatternSeverity::Error},
        {R"(\b\w{1,64}(?:exception|error)\b)", "exception", PatternSeverity::Error},
        {R"(traceback \(most recent call last\))", "traceback", PatternSeverity::Error},
        {R"(\bunhandled\b|\buncaught\b)", "exception", PatternSeverity::Error},
        // Stack frames: Java/JS, Python, gdb/backtrace
        {R"(^\s{1,32}at\s{1,8}\S{1,512}\s{0,8}\(.{0,512}\))", "stack-frame", PatternSeverity::Error},
        {R"(^\s{0,32}File ".{0,512}", line \d{1,9})", "stack-frame", PatternSeverity::Error},
        {R"(^\s{0,32}#\d{1,6}\s{1,8}0x[0-9a-f]{1,16})", "stack-frame", PatternSeverity::Error},
        // Process aborts
        {R"(\b(?:segmentation fault|segfault|core dumped|sigsegv|sigabrt|sigbus|sigkill|aborted)\b)", "abort", PatternSeverity::Error},
        {R"(\bterminate called\b)", "abort", PatternSeverity::Error},
        // Panics
        {R"(\bpanic(?:ked|s)?\b)", "panic", PatternSeverity::Error},
        // Out of memory
        {R"(\bout of memory\b|\boom(?:[- ]killer)?\b|\bcannot allocate memory\b|\bbad_alloc\b)", "out-of-memory", PatternSeverity::Error},
        // HTTP 4xx/5xx
        {R"(\bHTTP/\d(?:\.\d)?"?\s{1,8}[45]\d\d\b)", "http", PatternSeverity::Error},
        {R"(\b(?:status|status_code|code)\s{0,8}[=:]\s{0,8}[45]\d\d\b)", "http", PatternSeverity::Error},
        {R"(\b[45]\d\d\s{1,8}(?:bad request|unauthorized|forbidden|not found|internal server error|bad gateway|service unavailable|gateway timeout)\b)", "http", PatternSeverity::Error},
        // Non-zero exit / return codes
        {R"(\bexit(?:ed)?\s{0,8}(?:with\s{1,8})?(?:code|status)?\s{0,8}[=:]?\s{0,8}-?[1-9]\d{0,9}\b)", "exit-code", PatternSeverity::Error},
        {R"(\breturn(?:ed)?\s{1,8}(?:code|status)\s{0,8}[=:]?\s{0,8}-?[1-9]\d{0,9}\b)", "exit-code", PatternSeverity::Error},
        {R"(\bnon-?zero exit\b)", "exit-code", PatternSeverity::Error},
        // Assertions
        {R"(\bassert(?:ion)?\s{0,8}(?:failed|failure|error)\b)", "assertion", PatternSeverity::Error},
        // Warnings (only with include_warnings)
        {R"(\bwarn(?:ing|ings)?\b)", "warning", PatternSeverity::Warning},
        {R"(\bdeprecat(?:ed|ion)\b)", "warning", PatternSeverity::Warning},
        {R"(\bcaution\b)", "warning", PatternSeverity::Warning},
    };
}

const std::vector<ErrorPattern>& ErrorPatternSet::table() {
    return kErrorPatternTable;
}

std::string ErrorPatternSet::buildAlternation(const std::vector<const ErrorPattern*>& patterns) {
    std::string alternation;
    for (const auto* p : patterns) {
        if (!alternation.empty()) alternation += "|";
        alternation += "(?:";
        alternation += p->pattern;
        alternation += ")";
    }
    return alternation;
}

ErrorPatternSet::ErrorPatternSet(bool includeWarnings) : withWarnings(includeWarnings) {
    // 错误项在前,警告项追加在后
    for (const auto& p : kErrorPatternTable) {
        if (p.severity == PatternSeverity::Error) entries.push_back(&p);
    }
    if (includeWarnings) {
        for (const auto& p : kErrorPatternTable) {
            if (p.severity == PatternSeverity::Warning) entries.push_back(&p);
        }
    }
    for (const auto* p : entries) {
        perEntry.emplace_back(p->pattern, kFlags);
    }
    combinedRegex = std::regex(buildAlternation(entries), kFlags);
}

bool ErrorPatternSet::matches(const std::string& line) const {
    return PatternSearcher::matchesLine(line, combinedRegex);
}

std::optional<std::string> ErrorPatternSet::classify(const std::string& line) const {
    for (size_t i = 0; i < entries.size(); ++i) {
        if (PatternSearcher::matchesLine(line, perEntry[i])) {
            return std::string(entries[i]->category);
        }
    }
    return std::nullopt;
}
