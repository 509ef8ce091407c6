#include "ParameterLoader.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace VisualAnalysis;

TEST(ParameterLoaderTest, ReadsJsonDocument) {
    PipelineParams params = ParameterLoader::LoadString(
        "{ \"binary_threshold\": 100, \"palette_size\": 5,"
        "  \"normalizer\": { \"max_side\": 640, \"apply_exif_orientation\": 0 },"
        "  \"colormax\": { \"target_clusters\": 12, \"seed\": 7, \"small_cluster_ratio\": 0.01,"
        "                  \"hierarchical_memory_ceiling_mb\": 64 },"
        "  \"encoding\": { \"max_bytes\": 100000, \"jpeg_min_quality\": 40 } }");

    EXPECT_EQ(params.binaryThreshold, 100);
    EXPECT_EQ(params.paletteSize, 5);
    EXPECT_EQ(params.normalizer.maxSide, 640);
    EXPECT_FALSE(params.normalizer.applyExifOrientation);
    EXPECT_EQ(params.colorMax.targetClusters, 12);
    EXPECT_EQ(params.colorMax.seed, 7u);
    EXPECT_DOUBLE_EQ(params.colorMax.smallClusterRatio, 0.01);
    EXPECT_EQ(params.colorMax.hierarchicalMemoryCeiling, 64u * 1024u * 1024u);
    EXPECT_EQ(params.encoding.maxBytes, 100000u);
    EXPECT_EQ(params.encoding.jpegMinQuality, 40);
}

TEST(ParameterLoaderTest, MissingKeysKeepDefaults) {
    PipelineParams params = ParameterLoader::LoadString("{ \"palette_size\": 3 }");
    PipelineParams defaults;

    EXPECT_EQ(params.paletteSize, 3);
    EXPECT_EQ(params.binaryThreshold, defaults.binaryThreshold);
    EXPECT_EQ(params.colorMax.targetClusters, defaults.colorMax.targetClusters);
    EXPECT_EQ(params.colorMax.hueBands, defaults.colorMax.hueBands);
    EXPECT_EQ(params.encoding.maxBytes, defaults.encoding.maxBytes);
}

TEST(ParameterLoaderTest, ReadsYamlDocument) {
    PipelineParams params = ParameterLoader::LoadString(
        "%YAML:1.0\n"
        "---\n"
        "binary_threshold: 90\n"
        "contrast:\n"
        "   clahe_clip_limit: 3.5\n"
        "   variance_radius: 7\n");

    EXPECT_EQ(params.binaryThreshold, 90);
    EXPECT_DOUBLE_EQ(params.contrast.claheClipLimit, 3.5);
    EXPECT_EQ(params.contrast.varianceRadius, 7);
}

TEST(ParameterLoaderTest, ValidateClampsOutOfRangeValues) {
    PipelineParams params;
    params.binaryThreshold = 300;
    params.paletteSize = 0;
    params.normalizer.maxSide = 50000;
    params.colorMax.targetClusters = 100;
    params.colorMax.smallClusterRatio = -1.0;
    params.encoding.jpegStartQuality = 50;
    params.encoding.jpegMinQuality = 80;
    params.encoding.pngCompression = 12;

    PipelineParams clamped = ParameterLoader::Validate(params);
    EXPECT_EQ(clamped.binaryThreshold, 255);
    EXPECT_EQ(clamped.paletteSize, 1);
    EXPECT_EQ(clamped.normalizer.maxSide, clamped.normalizer.maxDimension);
    EXPECT_EQ(clamped.colorMax.targetClusters, 64);
    EXPECT_DOUBLE_EQ(clamped.colorMax.smallClusterRatio, 0.0);
    EXPECT_EQ(clamped.encoding.jpegMinQuality, 50);
    EXPECT_EQ(clamped.encoding.pngCompression, 9);
}

TEST(ParameterLoaderTest, LoadsFromFile) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / "visual_analysis_params.json";
    {
        std::ofstream file(path);
        file << "{ \"colormax\": { \"target_clusters\": 6 } }";
    }

    PipelineParams params = ParameterLoader::LoadFile(path.string());
    EXPECT_EQ(params.colorMax.targetClusters, 6);
    std::filesystem::remove(path);
}

TEST(ParameterLoaderTest, MissingFileThrows) {
    EXPECT_THROW(ParameterLoader::LoadFile("/nonexistent/visual_analysis_params.yml"), std::runtime_error);
}
