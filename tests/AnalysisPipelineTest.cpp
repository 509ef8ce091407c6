#include "AnalysisContext.h"
#include "AnalysisPipeline.h"
#include "TestImages.h"
#include <gtest/gtest.h>
#include <numeric>
#include <stdexcept>

using namespace VisualAnalysis;

namespace {
    const char* kArtifactNames[] = {
        "binary", "grayscale_3_level", "grayscale_4_level",
        "rgb_luminance", "lab_luminance",
        "hls_saturation", "hls_saturation_inverted",
        "hue_map", "colormax_segmentation_8"
    };

    cv::Mat SampleScene() {
        return Testing::Checkerboard(160, 120, 20, cv::Vec3b(220, 40, 40), cv::Vec3b(30, 60, 200));
    }
}

TEST(AnalysisPipelineTest, ProducesEveryArtifact) {
    AnalysisContext context = Testing::QuietContext("scene");
    std::vector<int> progress;
    context.SetProgressSink([&progress](int percent) { progress.push_back(percent); });

    AnalysisResult result = AnalysisPipeline::Execute(Testing::EncodePng(SampleScene()), PipelineParams(), context);

    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(result.state, PipelineStage::COMPLETE);
    EXPECT_EQ(result.submissionId, "scene");
    EXPECT_EQ(result.images.size(), 9u);
    for (const char* name : kArtifactNames) {
        auto it = result.images.find(name);
        ASSERT_NE(it, result.images.end()) << name;
        EXPECT_FALSE(it->second.bytes.empty()) << name;
        EXPECT_TRUE(it->second.withinBudget) << name;
        EXPECT_EQ(it->second.size, cv::Size(160, 120)) << name;
    }

    const AnalysisStatistics& stats = result.statistics;
    EXPECT_EQ(stats.workingSize, cv::Size(160, 120));
    ASSERT_EQ(stats.hueHistogram.size(), 36u);
    EXPECT_EQ(std::accumulate(stats.hueHistogram.begin(), stats.hueHistogram.end(), 0), 160 * 120);
    EXPECT_EQ(stats.clusterCount, 2);
    EXPECT_EQ(stats.clusteringStrategy, ClusteringStrategy::PER_BIN);
    ASSERT_EQ(stats.palette.size(), 2u);
    EXPECT_NEAR(stats.palette[0].ratio + stats.palette[1].ratio, 1.0, 1e-9);
    EXPECT_DOUBLE_EQ(stats.balanceScore, 1.0);
    EXPECT_EQ(stats.metrics.at("source_width"), 160);
    EXPECT_EQ(stats.metrics.at("exif_orientation"), 1);

    for (const char* stage : {"decoding", "step1", "step2", "step3", "step4", "step5", "encoding"}) {
        EXPECT_EQ(result.timings.count(stage), 1u) << stage;
    }
    EXPECT_GT(result.totalTimeMs, 0.0);

    ASSERT_FALSE(progress.empty());
    EXPECT_EQ(progress.front(), 30);
    EXPECT_EQ(progress.back(), 100);
    for (size_t i = 1; i < progress.size(); i++) {
        EXPECT_LE(progress[i - 1], progress[i]);
    }
}

TEST(AnalysisPipelineTest, SegmentationArtifactFollowsTarget) {
    AnalysisContext context = Testing::QuietContext();
    PipelineParams params;
    params.colorMax.targetClusters = 4;

    AnalysisResult result = AnalysisPipeline::Execute(Testing::EncodePng(SampleScene()), params, context);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(result.images.count("colormax_segmentation_4"), 1u);
    EXPECT_EQ(result.images.count("colormax_segmentation_8"), 0u);
    EXPECT_EQ(AnalysisPipeline::SegmentationArtifactName(12), "colormax_segmentation_12");
}

TEST(AnalysisPipelineTest, BufferInputIsBounded) {
    AnalysisContext context = Testing::QuietContext();
    PipelineParams params;
    params.normalizer.maxSide = 100;

    AnalysisResult result = AnalysisPipeline::ExecuteOnBuffer(Testing::GradientRgb(400, 200), params, context);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(result.statistics.workingSize, cv::Size(100, 50));
    EXPECT_EQ(result.images.at("binary").size, cv::Size(100, 50));
    EXPECT_EQ(result.statistics.metrics.at("source_width"), 400);
}

TEST(AnalysisPipelineTest, CancelledBeforeStartFailsAtDecoding) {
    AnalysisContext context = Testing::QuietContext();
    CancellationToken token = AnalysisContext::MakeCancellationToken();
    token->store(true);
    context.SetCancellationToken(token);

    AnalysisResult result = AnalysisPipeline::Execute(Testing::EncodePng(SampleScene()), PipelineParams(), context);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.state, PipelineStage::FAILED);
    EXPECT_EQ(result.failedStage, PipelineStage::DECODING);
    EXPECT_TRUE(result.images.empty());
}

TEST(AnalysisPipelineTest, CancelledMidRunStopsAtNextStage) {
    AnalysisContext context = Testing::QuietContext();
    CancellationToken token = AnalysisContext::MakeCancellationToken();
    context.SetCancellationToken(token);
    context.SetProgressSink([token](int percent) {
        if (percent >= 40) token->store(true);
    });

    AnalysisResult result = AnalysisPipeline::Execute(Testing::EncodePng(SampleScene()), PipelineParams(), context);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failedStage, PipelineStage::STEP2_LUMINANCE);
    EXPECT_TRUE(result.images.empty());
    EXPECT_TRUE(result.statistics.palette.empty());
}

TEST(AnalysisPipelineTest, UndecodableInputFailsWithoutImages) {
    AnalysisContext context = Testing::QuietContext();
    std::vector<uchar> bytes = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};

    AnalysisResult result = AnalysisPipeline::Execute(bytes, PipelineParams(), context);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failedStage, PipelineStage::DECODING);
    EXPECT_FALSE(result.errorMessage.empty());
    EXPECT_TRUE(result.images.empty());
}

TEST(AnalysisPipelineTest, QuantizeLevelsMapsBands) {
    cv::Mat gray = (cv::Mat_<uchar>(1, 6) << 0, 84, 85, 169, 170, 255);
    cv::Mat quantized = AnalysisPipeline::QuantizeLevels(gray, {85, 170}, {0, 127, 255});

    cv::Mat expected = (cv::Mat_<uchar>(1, 6) << 0, 0, 127, 127, 255, 255);
    EXPECT_EQ(cv::norm(quantized, expected, cv::NORM_INF), 0.0);

    EXPECT_THROW(AnalysisPipeline::QuantizeLevels(gray, {85}, {0, 127, 255}), std::invalid_argument);
    EXPECT_THROW(AnalysisPipeline::QuantizeLevels(cv::Mat(2, 2, CV_32F), {85}, {0, 255}), std::invalid_argument);
}
