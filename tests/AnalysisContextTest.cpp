#include "AnalysisErrors.h"
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

// <windows.h> defines ERROR and debug builds often pass -DDEBUG
#define DEBUG 1
#define ERROR 0
#include "AnalysisContext.h"
#undef DEBUG
#undef ERROR

using namespace VisualAnalysis;

TEST(AnalysisContextTest, ProgressIsClampedAndMonotonic) {
    AnalysisContext context("progress");
    std::vector<int> reported;
    context.SetProgressSink([&reported](int percent) { reported.push_back(percent); });

    context.ReportProgress(-10);
    context.ReportProgress(40);
    context.ReportProgress(30);
    context.ReportProgress(140);

    ASSERT_EQ(reported.size(), 3u);
    EXPECT_EQ(reported[0], 0);
    EXPECT_EQ(reported[1], 40);
    EXPECT_EQ(reported[2], 100);
    EXPECT_EQ(context.LastProgress(), 100);
}

TEST(AnalysisContextTest, LogLinesCarrySubmissionId) {
    AnalysisContext context("sub-42");
    std::vector<std::pair<LogLevel, std::string>> lines;
    context.SetLogSink([&lines](LogLevel level, const std::string& line) { lines.emplace_back(level, line); });

    context.Info("decoded");
    context.Error("broken");

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].first, LogLevel::Info);
    EXPECT_EQ(lines[0].second, "[sub-42] decoded");
    EXPECT_EQ(lines[1].first, LogLevel::Error);
    EXPECT_EQ(lines[1].second, "[sub-42] broken");
}

TEST(AnalysisContextTest, LevelTagsSurvivePlatformMacros) {
    AnalysisContext context("macros");
    std::vector<std::pair<LogLevel, std::string>> lines;
    context.SetLogSink([&lines](LogLevel level, const std::string& line) { lines.emplace_back(level, line); });

    context.Debug("trace");
    context.Warn("odd");

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].first, LogLevel::Debug);
    EXPECT_EQ(lines[1].first, LogLevel::Warning);
    EXPECT_NE(lines[0].first, lines[1].first);
}

TEST(AnalysisContextTest, WarningsAreLoggedAndKept) {
    AnalysisContext context("warn");
    int warningLines = 0;
    context.SetLogSink([&warningLines](LogLevel level, const std::string&) {
        if (level == LogLevel::Warning) warningLines++;
    });

    context.Warn("first");
    context.Warn("second");

    EXPECT_EQ(warningLines, 2);
    ASSERT_EQ(context.Warnings().size(), 2u);
    EXPECT_EQ(context.Warnings()[0], "first");
    EXPECT_EQ(context.Warnings()[1], "second");
}

TEST(AnalysisContextTest, CancellationThrowsWithStage) {
    AnalysisContext context;
    EXPECT_FALSE(context.IsCancelled());
    EXPECT_NO_THROW(context.ThrowIfCancelled(PipelineStage::STEP2_LUMINANCE));

    CancellationToken token = AnalysisContext::MakeCancellationToken();
    context.SetCancellationToken(token);
    EXPECT_FALSE(context.IsCancelled());

    token->store(true);
    EXPECT_TRUE(context.IsCancelled());
    try {
        context.ThrowIfCancelled(PipelineStage::STEP2_LUMINANCE);
        FAIL() << "expected CancelledError";
    } catch (const CancelledError& e) {
        EXPECT_EQ(e.stage(), PipelineStage::STEP2_LUMINANCE);
    }
}
