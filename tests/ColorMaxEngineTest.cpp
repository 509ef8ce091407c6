#include "AnalysisContext.h"
#include "ColorBinning.h"
#include "ColorMaxEngine.h"
#include "TestImages.h"
#include <gtest/gtest.h>
#include <numeric>
#include <stdexcept>

using namespace VisualAnalysis;

namespace {
    double RatioSum(const ColorMaxResult& result) {
        double sum = 0.0;
        for (const auto& cluster : result.clusters) sum += cluster.ratio;
        return sum;
    }

    int64_t PixelSum(const ColorMaxResult& result) {
        int64_t sum = 0;
        for (const auto& cluster : result.clusters) sum += cluster.pixelCount;
        return sum;
    }
}

TEST(ColorBinningTest, SamplingStrideFollowsImageSide) {
    EXPECT_EQ(ColorBinning::SamplingStride(640 * 480, 800), 1);
    EXPECT_EQ(ColorBinning::SamplingStride(4000 * 4000, 800), 5);
    EXPECT_EQ(ColorBinning::SamplingStride(0, 800), 1);
    EXPECT_THROW(ColorBinning::SamplingStride(100, 0), std::invalid_argument);
}

TEST(ColorBinningTest, AchromaticColorsShareLowChromaBand) {
    ColorMaxParams params;
    BinKey gray = ColorBinning::KeyFor(cv::Vec3f(50.0f, 0.5f, -0.5f), params);
    BinKey red = ColorBinning::KeyFor(cv::Vec3f(53.0f, 80.0f, 67.0f), params);
    EXPECT_EQ(gray.chroma, 0);
    EXPECT_EQ(red.chroma, 1);
    EXPECT_EQ(gray.lightness, 17);

    BinKey white = ColorBinning::KeyFor(cv::Vec3f(100.0f, 0.0f, 0.0f), params);
    EXPECT_EQ(white.lightness, params.lightnessBands - 1);
}

TEST(ColorMaxEngineTest, SolidImageIsOneCluster) {
    AnalysisContext context = Testing::QuietContext();
    ColorMaxResult result = ColorMaxEngine::Segment(
        Testing::SolidRgb(1000, 1000, cv::Vec3b(255, 0, 0)), ColorMaxParams(), context);

    ASSERT_EQ(result.clusters.size(), 1u);
    EXPECT_DOUBLE_EQ(result.clusters[0].ratio, 1.0);
    EXPECT_EQ(result.clusters[0].pixelCount, 1000000);
    EXPECT_EQ(result.strategy, ClusteringStrategy::PER_BIN);
    EXPECT_EQ(result.binCount, 1);
    EXPECT_EQ(result.sampleStride, 1);

    std::vector<PaletteEntry> palette = ColorMaxEngine::ExtractDominantPalette(result, 8);
    ASSERT_EQ(palette.size(), 1u);
    EXPECT_GE(palette[0].rgb[0], 254);
    EXPECT_LE(palette[0].rgb[1], 1);
    EXPECT_LE(palette[0].rgb[2], 1);
    EXPECT_DOUBLE_EQ(palette[0].ratio, 1.0);

    EXPECT_EQ(cv::countNonZero(result.labels), 0);
    EXPECT_EQ(result.segmented.at<cv::Vec3b>(500, 500), result.clusters[0].rgb);
}

TEST(ColorMaxEngineTest, CheckerboardSplitsEvenly) {
    AnalysisContext context = Testing::QuietContext();
    cv::Mat rgb = Testing::Checkerboard(100, 100, 10, cv::Vec3b(0, 0, 0), cv::Vec3b(255, 255, 255));
    ColorMaxResult result = ColorMaxEngine::Segment(rgb, ColorMaxParams(), context);

    ASSERT_EQ(result.clusters.size(), 2u);
    EXPECT_NEAR(result.clusters[0].ratio, 0.5, 1e-12);
    EXPECT_NEAR(result.clusters[1].ratio, 0.5, 1e-12);
    EXPECT_EQ(result.strategy, ClusteringStrategy::PER_BIN);
    EXPECT_DOUBLE_EQ(ColorMaxEngine::BalanceScore({0.5, 0.5}), 1.0);

    // Black and white land in different clusters
    EXPECT_NE(result.labels.at<int>(0, 0), result.labels.at<int>(0, 10));
    EXPECT_EQ(result.labels.at<int>(0, 0), result.labels.at<int>(10, 10));
}

TEST(ColorMaxEngineTest, RatiosAndCountsCoverEveryPixel) {
    AnalysisContext context = Testing::QuietContext();
    cv::Mat rgb = Testing::NoiseRgb(120, 90, 11);
    ColorMaxResult result = ColorMaxEngine::Segment(rgb, ColorMaxParams(), context);

    EXPECT_NEAR(RatioSum(result), 1.0, 1e-6);
    EXPECT_EQ(PixelSum(result), 120 * 90);
    EXPECT_LE(static_cast<int>(result.clusters.size()), 8);
    EXPECT_GE(static_cast<int>(result.clusters.size()), 1);

    ASSERT_EQ(result.labels.size(), rgb.size());
    double minLabel = 0.0;
    double maxLabel = 0.0;
    cv::minMaxLoc(result.labels, &minLabel, &maxLabel);
    EXPECT_GE(minLabel, 0.0);
    EXPECT_LT(maxLabel, static_cast<double>(result.clusters.size()));
}

TEST(ColorMaxEngineTest, SegmentationIsDeterministic) {
    cv::Mat rgb = Testing::NoiseRgb(100, 80, 5);
    AnalysisContext first = Testing::QuietContext();
    AnalysisContext second = Testing::QuietContext();

    ColorMaxResult a = ColorMaxEngine::Segment(rgb, ColorMaxParams(), first);
    ColorMaxResult b = ColorMaxEngine::Segment(rgb, ColorMaxParams(), second);

    ASSERT_EQ(a.clusters.size(), b.clusters.size());
    EXPECT_EQ(a.strategy, b.strategy);
    for (size_t i = 0; i < a.clusters.size(); i++) {
        EXPECT_EQ(a.clusters[i].pixelCount, b.clusters[i].pixelCount);
        EXPECT_EQ(a.clusters[i].rgb, b.clusters[i].rgb);
    }
    EXPECT_EQ(cv::countNonZero(a.labels != b.labels), 0);
}

TEST(ColorMaxEngineTest, MidSizedBinSetIsSubsampledForWard) {
    AnalysisContext context = Testing::QuietContext();
    ColorMaxResult result = ColorMaxEngine::Segment(Testing::NoiseRgb(60, 60, 21), ColorMaxParams(), context);

    ASSERT_GT(result.binCount, 2000);
    ASSERT_LE(result.binCount, 5000);
    EXPECT_TRUE(result.binsSubsampled);
    EXPECT_EQ(result.strategy, ClusteringStrategy::HIERARCHICAL);
    EXPECT_FALSE(context.Warnings().empty());
    EXPECT_NEAR(RatioSum(result), 1.0, 1e-6);
}

TEST(ColorMaxEngineTest, LargeBinSetFallsBackToPartitional) {
    AnalysisContext context = Testing::QuietContext();
    ColorMaxResult result = ColorMaxEngine::Segment(Testing::NoiseRgb(200, 200, 3), ColorMaxParams(), context);

    ASSERT_GT(result.binCount, 5000);
    EXPECT_EQ(result.strategy, ClusteringStrategy::PARTITIONAL);
    EXPECT_FALSE(result.binsSubsampled);
    EXPECT_NEAR(RatioSum(result), 1.0, 1e-6);
    EXPECT_EQ(PixelSum(result), 200 * 200);
}

TEST(ColorMaxEngineTest, MemoryCeilingFallsBackToPartitional) {
    AnalysisContext context = Testing::QuietContext();
    ColorMaxParams params;
    params.hierarchicalMemoryCeiling = 16;

    cv::Mat rgb = Testing::Checkerboard(64, 64, 4, cv::Vec3b(200, 30, 30), cv::Vec3b(30, 30, 200));
    Testing::NoiseRgb(32, 64, 9).copyTo(rgb(cv::Rect(0, 0, 32, 64)));
    ColorMaxResult result = ColorMaxEngine::Segment(rgb, params, context);

    EXPECT_EQ(result.strategy, ClusteringStrategy::PARTITIONAL);
    EXPECT_NEAR(RatioSum(result), 1.0, 1e-6);
}

TEST(ColorMaxEngineTest, RejectsInvalidInput) {
    AnalysisContext context = Testing::QuietContext();
    ColorMaxParams params;
    cv::Mat gray(10, 10, CV_8UC1, cv::Scalar(0));
    EXPECT_THROW(ColorMaxEngine::Segment(gray, params, context), std::invalid_argument);

    params.targetClusters = 65;
    EXPECT_THROW(ColorMaxEngine::Segment(Testing::SolidRgb(4, 4, cv::Vec3b(1, 1, 1)), params, context),
                 std::invalid_argument);
    params.targetClusters = 0;
    EXPECT_THROW(ColorMaxEngine::Segment(Testing::SolidRgb(4, 4, cv::Vec3b(1, 1, 1)), params, context),
                 std::invalid_argument);
}

TEST(ColorMaxEngineTest, SmallClustersMergeIntoNearestAndIdsCompact) {
    // Cluster 1 is tiny and close to cluster 2
    std::vector<cv::Vec3d> centers = {
        cv::Vec3d(10, 0, 0), cv::Vec3d(80, 0, 0), cv::Vec3d(90, 0, 0)
    };
    std::vector<int64_t> counts = {500, 2, 498};
    std::vector<int> labels = {0, 1, 2};

    int count = ColorMaxEngine::AbsorbSmallClusters(labels, centers, counts, 3, 1000, 0.005);
    EXPECT_EQ(count, 2);
    EXPECT_EQ(labels, (std::vector<int>{0, 1, 1}));
}

TEST(ColorMaxEngineTest, AllSmallClustersAreLeftAlone) {
    std::vector<cv::Vec3d> centers = {cv::Vec3d(10, 0, 0), cv::Vec3d(60, 0, 0)};
    std::vector<int64_t> counts = {1, 1};
    std::vector<int> labels = {0, 1};

    int count = ColorMaxEngine::AbsorbSmallClusters(labels, centers, counts, 2, 1000, 0.5);
    EXPECT_EQ(count, 2);
    EXPECT_EQ(labels, (std::vector<int>{0, 1}));
}

TEST(ColorMaxEngineTest, NearestCentroidTiesGoToLowestIndex) {
    std::vector<cv::Vec3d> centroids = {cv::Vec3d(0, 0, 0), cv::Vec3d(10, 0, 0), cv::Vec3d(50, 0, 0)};
    std::vector<cv::Vec3f> pixels = {
        cv::Vec3f(5, 0, 0), cv::Vec3f(9, 0, 0), cv::Vec3f(48, 1, 1), cv::Vec3f(-3, 0, 0)
    };

    std::vector<int> nearest = ColorMaxEngine::NearestCentroids(pixels, centroids);
    EXPECT_EQ(nearest, (std::vector<int>{0, 1, 2, 0}));
}

TEST(ColorMaxEngineTest, PaletteIsOrderedByRatio) {
    ColorMaxResult result;
    for (double ratio : {0.2, 0.5, 0.2, 0.1}) {
        ClusterInfo info;
        info.ratio = ratio;
        info.rgb = cv::Vec3b(static_cast<uchar>(ratio * 100), 0, 0);
        result.clusters.push_back(info);
    }

    std::vector<PaletteEntry> palette = ColorMaxEngine::ExtractDominantPalette(result, 3);
    ASSERT_EQ(palette.size(), 3u);
    EXPECT_DOUBLE_EQ(palette[0].ratio, 0.5);
    EXPECT_DOUBLE_EQ(palette[1].ratio, 0.2);
    EXPECT_DOUBLE_EQ(palette[2].ratio, 0.2);
}

TEST(ColorMaxEngineTest, BalanceScoreIsOneMinusPopulationStd) {
    EXPECT_DOUBLE_EQ(ColorMaxEngine::BalanceScore({}), 1.0);
    EXPECT_DOUBLE_EQ(ColorMaxEngine::BalanceScore({1.0}), 1.0);
    EXPECT_NEAR(ColorMaxEngine::BalanceScore({0.75, 0.25}), 0.75, 1e-12);
}
