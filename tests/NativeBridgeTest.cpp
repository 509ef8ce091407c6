#include "NativeBridge.h"
#include "TestImages.h"
#include <gtest/gtest.h>
#include <cstring>
#include <string>
#include <vector>

namespace {
    void RecordProgress(int percent, void* userData) {
        static_cast<std::vector<int>*>(userData)->push_back(percent);
    }

    std::vector<uchar> SceneBytes() {
        return VisualAnalysis::Testing::EncodePng(
            VisualAnalysis::Testing::Checkerboard(80, 60, 10, cv::Vec3b(240, 200, 30), cv::Vec3b(20, 40, 90)));
    }
}

TEST(NativeBridgeTest, DefaultsMatchPipeline) {
    VAParams params;
    std::memset(&params, 0, sizeof(params));
    va_default_params(&params);

    VisualAnalysis::PipelineParams defaults;
    EXPECT_EQ(params.binaryThreshold, defaults.binaryThreshold);
    EXPECT_EQ(params.maxSide, defaults.normalizer.maxSide);
    EXPECT_EQ(params.targetClusters, defaults.colorMax.targetClusters);
    EXPECT_EQ(params.paletteSize, defaults.paletteSize);
}

TEST(NativeBridgeTest, RunsPipelineAndFreesResult) {
    std::vector<uchar> bytes = SceneBytes();
    VAParams params;
    va_default_params(&params);
    std::vector<int> progress;

    VAResult* result = nullptr;
    int status = va_run_pipeline(bytes.data(), bytes.size(), &params, &RecordProgress, &progress, nullptr, &result);
    ASSERT_EQ(status, 0);
    ASSERT_NE(result, nullptr);

    EXPECT_EQ(result->success, 1);
    EXPECT_EQ(result->artifactCount, 9);
    for (int i = 0; i < result->artifactCount; i++) {
        EXPECT_NE(result->artifacts[i].data, nullptr) << result->artifacts[i].name;
        EXPECT_GT(result->artifacts[i].size, 0);
        EXPECT_EQ(result->artifacts[i].width, 80);
    }
    EXPECT_EQ(result->clusterCount, 2);
    EXPECT_EQ(result->paletteCount, 2);
    EXPECT_NEAR(result->palette[0].ratio + result->palette[1].ratio, 1.0, 1e-9);

    int histogramTotal = 0;
    for (int count : result->hueHistogram) histogramTotal += count;
    EXPECT_EQ(histogramTotal, 80 * 60);

    ASSERT_NE(result->statisticsJson, nullptr);
    EXPECT_NE(std::string(result->statisticsJson).find("colormax_segmentation_8"), std::string::npos);

    ASSERT_FALSE(progress.empty());
    EXPECT_EQ(progress.back(), 100);

    va_free_result(result);
}

TEST(NativeBridgeTest, HostCancelFlagFailsRun) {
    std::vector<uchar> bytes = SceneBytes();
    volatile int cancel = 1;

    VAResult* result = nullptr;
    int status = va_run_pipeline(bytes.data(), bytes.size(), nullptr, nullptr, nullptr, &cancel, &result);
    ASSERT_EQ(status, 1);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->success, 0);
    EXPECT_EQ(result->failedStage, static_cast<int>(VisualAnalysis::PipelineStage::DECODING));
    EXPECT_EQ(result->artifactCount, 0);
    EXPECT_EQ(result->artifacts, nullptr);
    EXPECT_NE(std::string(result->errorMessage), "");
    va_free_result(result);
}

TEST(NativeBridgeTest, BadBytesReportFailure) {
    std::vector<uchar> bytes = {'x', 'y', 'z'};
    VAResult* result = nullptr;
    ASSERT_EQ(va_run_pipeline(bytes.data(), bytes.size(), nullptr, nullptr, nullptr, nullptr, &result), 1);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->success, 0);
    va_free_result(result);
}

TEST(NativeBridgeTest, InvalidArgumentsAreRejected) {
    std::vector<uchar> bytes = SceneBytes();
    VAResult* result = nullptr;

    EXPECT_EQ(va_run_pipeline(nullptr, 10, nullptr, nullptr, nullptr, nullptr, &result), -1);
    EXPECT_EQ(va_run_pipeline(bytes.data(), 0, nullptr, nullptr, nullptr, nullptr, &result), -1);
    EXPECT_EQ(va_run_pipeline(bytes.data(), bytes.size(), nullptr, nullptr, nullptr, nullptr, nullptr), -1);
    EXPECT_EQ(result, nullptr);

    va_free_result(nullptr);
}
