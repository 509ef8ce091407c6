#pragma once

#include "AnalysisParameters.h"
#include "ColorBinning.h"
#include <opencv2/core.hpp>
#include <vector>

namespace VisualAnalysis {

class AnalysisContext;

// Dominant-color segmentation: perceptual binning, Ward clustering on the
// bin centroids, small-cluster absorption and a full-resolution reassignment.
class ColorMaxEngine {
public:
    // Throws std::invalid_argument for a non-RGB buffer or a target outside [1,64]
    static ColorMaxResult Segment(
        const cv::Mat& rgb,
        const ColorMaxParams& params,
        AnalysisContext& context
    );

    // Clusters by descending ratio (stable), at most topN
    static std::vector<PaletteEntry> ExtractDominantPalette(const ColorMaxResult& result, int topN);

    // 1 - population std of the ratios
    static double BalanceScore(const std::vector<double>& ratios);

    // Merge clusters below minRatio of sampledPixels into the nearest
    // non-small cluster and compact ids. No-op when every cluster is small.
    // Returns the new cluster count.
    static int AbsorbSmallClusters(
        std::vector<int>& binLabels,
        const std::vector<cv::Vec3d>& binCenters,
        const std::vector<int64_t>& binCounts,
        int clusterCount,
        int64_t sampledPixels,
        double minRatio
    );

    // Nearest Lab centroid per pixel, ties resolved to the lowest index
    static std::vector<int> NearestCentroids(
        const std::vector<cv::Vec3f>& pixels,
        const std::vector<cv::Vec3d>& centroids
    );

private:
    // Pixel-count-weighted centroid of each cluster; empty clusters keep (0,0,0)
    static std::vector<cv::Vec3d> WeightedCentroids(
        const std::vector<int>& binLabels,
        const std::vector<cv::Vec3d>& binCenters,
        const std::vector<int64_t>& binCounts,
        int clusterCount,
        std::vector<int64_t>& clusterSizes
    );

    // Seeded random subset of bins; false (bins unchanged) below the thresholds
    static bool SubsampleBins(
        std::vector<BinKey>& keys,
        std::vector<cv::Vec3d>& centers,
        std::vector<int64_t>& counts,
        const ColorMaxParams& params
    );
};

} // namespace VisualAnalysis
