#pragma once

#include <opencv2/core.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace VisualAnalysis {

// Per-submission lifecycle, in execution order
enum class PipelineStage {
    PENDING,
    DECODING,
    STEP1_TONAL_THRESHOLDS,
    STEP2_LUMINANCE,
    STEP3_SATURATION,
    STEP4_HUE,
    STEP5_CLUSTERING,
    ASSEMBLING,
    COMPLETE,
    FAILED
};

// Which strategy produced the ColorMax partition
enum class ClusteringStrategy {
    NONE,
    PER_BIN,        // fewer bins than target: every bin is a cluster
    HIERARCHICAL,   // Ward linkage on bin centroids
    PARTITIONAL     // k-means++ on bin centroids
};

// Encoded container format
enum class ImageFormat {
    JPEG,
    PNG,
    WEBP,
    GIF,
    UNKNOWN
};

// Decoding / normalization parameters
struct NormalizerParams {
    int maxSide = 800;               // Working resolution bound (pipeline runs)
    int maxDimension = 20000;        // Hard ceiling per side, checked before decoding
    bool applyExifOrientation = true;
};

// Local contrast parameters
struct ContrastParams {
    double claheClipLimit = 2.0;
    int claheTileGrid = 8;           // Tiles per side
    int varianceRadius = 15;         // Disk radius for local variance
};

// ColorMax clustering parameters
struct ColorMaxParams {
    int targetClusters = 8;          // Requested palette size (1-64)

    // Binning
    int lightnessBands = 35;         // Equal bands over L in [0,100]
    int hueBands = 1224;             // Equal bands over [0,360)
    int chromaBands = 3;
    double chromaBandWidth = 60.0;   // Chroma thresholds at 60, 120

    // Sampling: stride = max(1, sqrt(pixels) / samplingTarget)
    int samplingTarget = 800;

    // Scale guards
    int hierarchicalBinCeiling = 5000;   // Above: partitional only
    int binSubsampleThreshold = 2000;    // Above: subsample bins to this count
    int binSubsampleUpperThreshold = 3000; // Above: subsample bins to this count instead
    size_t hierarchicalMemoryCeiling = 256u * 1024u * 1024u; // Condensed matrix bytes

    // Partitional fallback
    int kmeansAttempts = 10;
    int kmeansMaxIterations = 100;
    double kmeansEpsilon = 1e-4;

    // Small-cluster absorption
    double smallClusterRatio = 0.005;    // 0.5% of sampled pixels

    uint64_t seed = 42;              // Seeds bin subsampling and k-means++
};

// Output artifact size budget
struct EncodingParams {
    size_t maxBytes = 400 * 1024;    // Per-artifact budget
    int pngCompression = 9;          // 0-9
    int jpegStartQuality = 95;
    int jpegMinQuality = 30;
    int jpegQualityStep = 5;
    int minSide = 100;               // Floor for the last-resort downscale
};

// Orchestrator parameters
struct PipelineParams {
    int binaryThreshold = 140;       // Step 1 binarization (0-255)
    int paletteSize = 8;             // Top-N dominant colors reported
    NormalizerParams normalizer;
    ColorMaxParams colorMax;
    EncodingParams encoding;
    ContrastParams contrast;         // Comprehensive analyzer suite only
};

// One Lab cluster of the final partition
struct ClusterInfo {
    cv::Vec3d lab;                   // Centroid in Lab
    cv::Vec3b rgb;                   // Centroid converted for display
    int64_t pixelCount = 0;
    double ratio = 0.0;              // pixelCount / total pixels
};

struct PaletteEntry {
    cv::Vec3b rgb;
    double ratio = 0.0;
};

// ColorMax output
struct ColorMaxResult {
    cv::Mat segmented;               // CV_8UC3 RGB, every pixel = cluster centroid
    cv::Mat labels;                  // CV_32SC1 cluster index per pixel
    std::vector<ClusterInfo> clusters;
    ClusteringStrategy strategy = ClusteringStrategy::NONE;
    int binCount = 0;                // Populated bins in the sampled set
    int sampleStride = 1;
    bool binsSubsampled = false;
};

// Generic analyzer output: named maps, scalar metrics and series
struct AnalyzerResult {
    std::map<std::string, cv::Mat> maps;
    std::map<std::string, double> metrics;
    std::map<std::string, std::vector<double>> series;
};

// One compressed artifact
struct EncodedImage {
    std::string name;
    ImageFormat format = ImageFormat::PNG;
    std::vector<uchar> bytes;
    cv::Size size;
    int quality = 100;               // JPEG quality, 100 for lossless PNG
    bool withinBudget = true;
};

// Structured numbers persisted next to the artifacts
struct AnalysisStatistics {
    std::vector<int> hueHistogram;   // 36 buckets over hue [0,180)
    std::vector<PaletteEntry> palette; // Descending by ratio
    std::vector<double> clusterRatios;
    int clusterCount = 0;
    ClusteringStrategy clusteringStrategy = ClusteringStrategy::NONE;
    bool binsSubsampled = false;
    double balanceScore = 0.0;
    cv::Size workingSize;
    std::map<std::string, double> metrics;
};

// Orchestrator output
struct AnalysisResult {
    std::string submissionId;
    std::map<std::string, EncodedImage> images;
    AnalysisStatistics statistics;
    std::map<std::string, double> timings;   // Milliseconds per stage
    double totalTimeMs = 0.0;

    PipelineStage state = PipelineStage::PENDING;
    PipelineStage failedStage = PipelineStage::PENDING;
    bool success = false;
    std::string errorMessage;
    std::vector<std::string> warnings;
};

const char* ToString(PipelineStage stage);
const char* ToString(ClusteringStrategy strategy);
const char* ToString(ImageFormat format);

} // namespace VisualAnalysis
