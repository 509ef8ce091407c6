#include "ChannelAnalysisSuite.h"
#include "ColorQualityAnalyzer.h"
#include "ShapeAnalyzer.h"
#include "TestImages.h"
#include "TextureAnalyzer.h"
#include "ValueStructureAnalyzer.h"
#include <gtest/gtest.h>
#include <cmath>
#include <numeric>
#include <stdexcept>

using namespace VisualAnalysis;

TEST(ShapeAnalyzerTest, BlankImageHasNoEdgesOrFeatures) {
    cv::Mat blank = Testing::SolidRgb(64, 64, cv::Vec3b(128, 128, 128));

    AnalyzerResult edges = ShapeAnalyzer::AnalyzeEdges(blank);
    EXPECT_DOUBLE_EQ(edges.metrics.at("edge_density"), 0.0);
    EXPECT_EQ(edges.maps.count("canny_edges"), 1u);

    AnalyzerResult features = ShapeAnalyzer::AnalyzeFeatures(blank);
    EXPECT_DOUBLE_EQ(features.metrics.at("feature_count"), 0.0);
    EXPECT_DOUBLE_EQ(features.metrics.at("feature_density"), 0.0);
}

TEST(ShapeAnalyzerTest, CheckerboardHasEdges) {
    cv::Mat board = Testing::Checkerboard(64, 64, 8, cv::Vec3b(0, 0, 0), cv::Vec3b(255, 255, 255));
    AnalyzerResult edges = ShapeAnalyzer::AnalyzeEdges(board);
    EXPECT_GT(edges.metrics.at("edge_density"), 0.0);
    EXPECT_GT(ShapeAnalyzer::AnalyzeFeatures(board).metrics.at("feature_count"), 0.0);
}

TEST(ShapeAnalyzerTest, FftShiftMatchesOddAndEvenWidths) {
    cv::Mat odd = (cv::Mat_<double>(1, 5) << 0, 1, 2, 3, 4);
    cv::Mat expectedOdd = (cv::Mat_<double>(1, 5) << 3, 4, 0, 1, 2);
    EXPECT_EQ(cv::norm(ShapeAnalyzer::FftShift(odd), expectedOdd, cv::NORM_INF), 0.0);

    cv::Mat even = (cv::Mat_<double>(2, 2) << 0, 1, 2, 3);
    cv::Mat expectedEven = (cv::Mat_<double>(2, 2) << 3, 2, 1, 0);
    EXPECT_EQ(cv::norm(ShapeAnalyzer::FftShift(even), expectedEven, cv::NORM_INF), 0.0);
}

TEST(ShapeAnalyzerTest, FlatImageHasNoHighFrequencyEnergy) {
    AnalyzerResult frequency = ShapeAnalyzer::AnalyzeFrequency(Testing::SolidRgb(32, 32, cv::Vec3b(90, 90, 90)));
    EXPECT_NEAR(frequency.metrics.at("high_freq_ratio"), 0.0, 1e-6);
    EXPECT_EQ(frequency.maps.count("fft_spectrum"), 1u);
}

TEST(ValueStructureAnalyzerTest, CentroidFollowsBrightRegion) {
    cv::Mat lightness = cv::Mat::zeros(10, 10, CV_32F);
    lightness.col(9).setTo(100.0f);

    cv::Point2d center = ValueStructureAnalyzer::LuminanceCentroid(lightness);
    EXPECT_NEAR(center.x, 9.0, 1e-9);
    EXPECT_NEAR(center.y, 4.5, 1e-9);

    cv::Point2d dark = ValueStructureAnalyzer::LuminanceCentroid(cv::Mat::zeros(10, 10, CV_32F));
    EXPECT_NEAR(dark.x, 5.0, 1e-9);
    EXPECT_NEAR(dark.y, 5.0, 1e-9);
}

TEST(ValueStructureAnalyzerTest, FlatImageHasNoLocalVariance) {
    cv::Mat values(20, 20, CV_32F, cv::Scalar(42.0f));
    cv::Mat variance = ValueStructureAnalyzer::LocalVariance(values, 3);
    double maxVal = 0.0;
    cv::minMaxLoc(variance, nullptr, &maxVal);
    EXPECT_NEAR(maxVal, 0.0, 1e-2);

    AnalyzerResult white = ValueStructureAnalyzer::AnalyzeLuminance(Testing::SolidRgb(8, 8, cv::Vec3b(255, 255, 255)));
    EXPECT_NEAR(white.metrics.at("l_mean"), 100.0, 0.01);
    EXPECT_NEAR(white.metrics.at("l_std"), 0.0, 1e-6);
}

TEST(ColorQualityAnalyzerTest, HueHistogramBucketsCoverRange) {
    cv::Mat hue = (cv::Mat_<uchar>(1, 4) << 0, 4, 5, 179);
    std::vector<int> histogram = ColorQualityAnalyzer::HueHistogram(hue);

    ASSERT_EQ(histogram.size(), 36u);
    EXPECT_EQ(histogram[0], 2);
    EXPECT_EQ(histogram[1], 1);
    EXPECT_EQ(histogram[35], 1);
    EXPECT_EQ(std::accumulate(histogram.begin(), histogram.end(), 0), 4);
}

TEST(ColorQualityAnalyzerTest, GraySceneHasNoSaturation) {
    AnalyzerResult saturation = ColorQualityAnalyzer::AnalyzeSaturation(Testing::SolidRgb(16, 16, cv::Vec3b(70, 70, 70)));
    EXPECT_DOUBLE_EQ(saturation.metrics.at("mean_saturation"), 0.0);
    EXPECT_DOUBLE_EQ(saturation.metrics.at("high_saturation_ratio"), 0.0);
}

TEST(TextureAnalyzerTest, StripesAreCoherent) {
    cv::Mat stripes(64, 64, CV_8UC3);
    for (int y = 0; y < 64; y++) {
        for (int x = 0; x < 64; x++) {
            uchar v = static_cast<uchar>(127.5 + 127.5 * std::sin(x * 0.5));
            stripes.at<cv::Vec3b>(y, x) = cv::Vec3b(v, v, v);
        }
    }

    AnalyzerResult coherence = TextureAnalyzer::AnalyzeCoherence(stripes);
    EXPECT_GT(coherence.metrics.at("mean_coherence"), 0.7);
    EXPECT_EQ(coherence.maps.count("coherence_map"), 1u);
}

TEST(ChannelAnalysisSuiteTest, RunsEveryAnalyzer) {
    std::map<std::string, AnalyzerResult> results =
        ChannelAnalysisSuite::RunAll(Testing::NoiseRgb(48, 40, 8), ContrastParams(), false);

    std::vector<ChannelAnalysisSuite::NamedAnalyzer> analyzers = ChannelAnalysisSuite::Analyzers(ContrastParams());
    EXPECT_EQ(analyzers.size(), 12u);
    EXPECT_EQ(results.size(), analyzers.size());
    for (const auto& analyzer : analyzers) {
        auto it = results.find(analyzer.name);
        ASSERT_NE(it, results.end()) << analyzer.name;
        EXPECT_FALSE(it->second.maps.empty()) << analyzer.name;
    }
}

TEST(ChannelAnalysisSuiteTest, ParallelMatchesSequential) {
    cv::Mat rgb = Testing::NoiseRgb(48, 40, 9);
    auto sequential = ChannelAnalysisSuite::RunAll(rgb, ContrastParams(), false);
    auto parallel = ChannelAnalysisSuite::RunAll(rgb, ContrastParams(), true);

    ASSERT_EQ(sequential.size(), parallel.size());
    for (const auto& [name, result] : sequential) {
        const AnalyzerResult& other = parallel.at(name);
        ASSERT_EQ(result.metrics.size(), other.metrics.size()) << name;
        for (const auto& [metric, value] : result.metrics) {
            EXPECT_DOUBLE_EQ(value, other.metrics.at(metric)) << name << "." << metric;
        }
    }
}

TEST(ChannelAnalysisSuiteTest, RejectsNonRgbInput) {
    cv::Mat gray(8, 8, CV_8UC1, cv::Scalar(0));
    EXPECT_THROW(ChannelAnalysisSuite::RunAll(gray, ContrastParams(), true), std::invalid_argument);
}
