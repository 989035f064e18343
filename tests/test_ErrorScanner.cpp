/**
 * ErrorScanner / ErrorPatternSet 单元测试
 */
#include <gtest/gtest.h>
#include <regex>
#include <string>
#include <vector>

#include "logs/ErrorPatterns.h"
#include "logs/ErrorScanner.h"
#include "logs/LogFile.h"

static ErrorScanOptions withContext(size_t lines) {
    ErrorScanOptions opts;
    opts.contextLines = lines;
    return opts;
}

TEST(ErrorPatterns, EveryEntryCompiles) {
    for (const auto& entry : ErrorPatternSet::table()) {
        EXPECT_NO_THROW(std::regex(entry.pattern, std::regex::ECMAScript | std::regex::icase))
            << entry.pattern;
    }
    EXPECT_NO_THROW(ErrorPatternSet(true));
}

TEST(ErrorPatterns, WarningsOnlyWhenRequested) {
    ErrorPatternSet errorsOnly(false);
    ErrorPatternSet withWarnings(true);
    EXPECT_LT(errorsOnly.active().size(), withWarnings.active().size());
    EXPECT_EQ(withWarnings.active().size(), ErrorPatternSet::table().size());

    EXPECT_FALSE(errorsOnly.matches("WARNING: disk 91% full"));
    EXPECT_TRUE(withWarnings.matches("WARNING: disk 91% full"));
    EXPECT_EQ(withWarnings.classify("WARNING: disk 91% full").value_or(""), "warning");
}

TEST(ErrorPatterns, RecognizesCommonShapes) {
    ErrorPatternSet patterns(false);
    struct Case { const char* line; const char* category; };
    const std::vector<Case> cases = {
        {"2024-01-01 12:00:00 ERROR db connection lost", "severity"},
        {"[fatal] cannot continue", "severity"},
        {"job 7 failed after 3 retries", "failure"},
        {"java.lang.NullPointerException: foo", "exception"},
        {"Traceback (most recent call last):", "traceback"},
        {"    at com.example.Main.run(Main.java:42)", "stack-frame"},
        {"  File \"/app/main.py\", line 12, in <module>", "stack-frame"},
        {"#3  0x00007f1c2a3b in handler ()", "stack-frame"},
        {"Segmentation fault (core dumped)", "abort"},
        {"thread 'main' panicked at src/main.rs:3", "panic"},
        {"kernel: Out of memory: Killed process 812", "out-of-memory"},
        {"\"GET /api HTTP/1.1\" 503 12", "http"},
        {"upstream returned status=502", "http"},
        {"worker exited with code 137", "exit-code"},
        {"assertion error in parser", "severity"},
    };
    for (const auto& c : cases) {
        auto category = patterns.classify(c.line);
        ASSERT_TRUE(category.has_value()) << c.line;
        EXPECT_EQ(*category, c.category) << c.line;
        EXPECT_TRUE(patterns.matches(c.line)) << c.line;
    }

    for (const char* clean : {"GET /health 200 OK", "exited with code 0", "user logged in", "stderr redirected"}) {
        EXPECT_FALSE(patterns.matches(clean)) << clean;
    }
}

TEST(ErrorScanner, SingleHitWithContext) {
    auto file = LogFile::fromContent("/e.log", "a\nb\nERROR c\nd\ne\n");
    auto result = ErrorScanner::scan(file, withContext(1));

    ASSERT_EQ(result.hits.size(), 1u);
    ASSERT_EQ(result.blocks.size(), 1u);
    EXPECT_EQ(result.blocks[0].first, 1u);
    EXPECT_EQ(result.blocks[0].last, 3u);
    EXPECT_TRUE(result.isHit(2));
    EXPECT_FALSE(result.isHit(1));
    EXPECT_FALSE(result.isHit(3));
    EXPECT_EQ(result.remaining(), 0u);
}

TEST(ErrorScanner, OverlappingContextIsDeduplicated) {
    auto file = LogFile::fromContent("/e.log", "0\n1\n2\nERROR 3\n4\nERROR 5\n6\n7\n8\n9\n");
    auto result = ErrorScanner::scan(file, withContext(2));

    ASSERT_EQ(result.hits.size(), 2u);
    ASSERT_EQ(result.blocks.size(), 1u);
    EXPECT_EQ(result.blocks[0].first, 1u);
    EXPECT_EQ(result.blocks[0].last, 7u);
    EXPECT_EQ(result.shownHits, 2u);
    // 第 1-7 行各计一次
    size_t total = 0;
    for (size_t i = 1; i <= 7; ++i) total += (file.lines()[i].size() + 1) / 4;
    EXPECT_EQ(result.estimatedTokens, total);
}

TEST(ErrorScanner, DistantHitsStaySeparate) {
    auto file = LogFile::fromContent("/e.log", "0\nERROR 1\n2\n3\n4\n5\n6\n7\nERROR 8\n9\n");
    auto result = ErrorScanner::scan(file, withContext(1));
    ASSERT_EQ(result.blocks.size(), 2u);
    EXPECT_EQ(result.blocks[0].first, 0u);
    EXPECT_EQ(result.blocks[0].last, 2u);
    EXPECT_EQ(result.blocks[1].first, 7u);
    EXPECT_EQ(result.blocks[1].last, 9u);
}

TEST(ErrorScanner, NoBlockRepeatsALine) {
    std::string content;
    for (int i = 0; i < 60; ++i) {
        content += (i % 3 == 0) ? "ERROR step " + std::to_string(i) + "\n" : "ok " + std::to_string(i) + "\n";
    }
    auto file = LogFile::fromContent("/e.log", content);
    auto result = ErrorScanner::scan(file, withContext(2));

    std::vector<int> count(file.totalLines(), 0);
    for (const auto& block : result.blocks) {
        for (size_t i = block.first; i <= block.last; ++i) count[i]++;
    }
    for (size_t i = 0; i < count.size(); ++i) {
        EXPECT_LE(count[i], 1) << "line " << i + 1;
    }
}

TEST(ErrorScanner, BudgetCountsOnlyNewLines) {
    std::string content;
    for (int i = 0; i < 10; ++i) {
        std::string hit = "ERROR " + std::to_string(i);
        hit.resize(39, '.');
        content += hit + "\nok\n";
    }
    auto file = LogFile::fromContent("/e.log", content);

    ErrorScanOptions opts = withContext(0);
    opts.maxTokens = 25;
    auto result = ErrorScanner::scan(file, opts);
    EXPECT_EQ(result.hits.size(), 10u);
    EXPECT_EQ(result.shownHits, 2u);
    EXPECT_EQ(result.blocks.size(), 2u);
    EXPECT_EQ(result.estimatedTokens, 20u);
    EXPECT_EQ(result.remaining(), 8u);
}

TEST(ErrorScanner, FirstBlockShownEvenOverBudget) {
    auto file = LogFile::fromContent("/e.log", "FATAL " + std::string(500, 'x') + "\n");
    ErrorScanOptions opts;
    opts.maxTokens = 1;
    auto result = ErrorScanner::scan(file, opts);
    EXPECT_EQ(result.shownHits, 1u);
    EXPECT_EQ(result.blocks.size(), 1u);
}

TEST(ErrorScanner, CountsCategoriesOfShownHits) {
    auto file = LogFile::fromContent("/e.log",
        "start\nERROR a\nTraceback (most recent call last):\nWARNING low disk\nERROR b\n");

    auto errorsOnly = ErrorScanner::scan(file, withContext(0));
    EXPECT_EQ(errorsOnly.hits.size(), 3u);
    EXPECT_EQ(errorsOnly.categories.at("severity"), 2u);
    EXPECT_EQ(errorsOnly.categories.at("traceback"), 1u);
    EXPECT_EQ(errorsOnly.categories.count("warning"), 0u);

    ErrorScanOptions opts = withContext(0);
    opts.includeWarnings = true;
    auto withWarnings = ErrorScanner::scan(file, opts);
    EXPECT_EQ(withWarnings.hits.size(), 4u);
    EXPECT_EQ(withWarnings.categories.at("warning"), 1u);
    EXPECT_GT(withWarnings.patternCount, errorsOnly.patternCount);
}

TEST(ErrorScanner, CleanLogHasNoHits) {
    auto file = LogFile::fromContent("/e.log", "service started\nlistening on :8080\n");
    auto result = ErrorScanner::scan(file, ErrorScanOptions{});
    EXPECT_TRUE(result.hits.empty());
    EXPECT_TRUE(result.blocks.empty());
}

TEST(ErrorScanner, VeryLongLinesAreScannedSafely) {
    std::string blob(200000, 'x');
    auto file = LogFile::fromContent("/e.log", blob + "\nok\nERROR " + blob + "\n" + blob + "Exception\n");
    auto result = ErrorScanner::scan(file, withContext(0));

    ASSERT_EQ(result.hits.size(), 1u);
    EXPECT_EQ(result.hits[0], 2u);
    EXPECT_EQ(result.categories.at("severity"), 1u);
    EXPECT_EQ(file.lines()[2].size(), blob.size() + 6);
}
