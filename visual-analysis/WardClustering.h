#pragma once

#include <opencv2/core.hpp>
#include <cstddef>
#include <vector>

namespace VisualAnalysis {

// One agglomeration step: clusters held in slots a and b merged at height
struct WardMerge {
    int a = 0;
    int b = 0;
    double height = 0.0;
};

// Ward-linkage agglomerative clustering over Euclidean points
class WardClustering {
public:
    // Full dendrogram via the nearest-neighbor chain algorithm.
    // Throws ClusteringMemoryError when the condensed distance matrix would
    // exceed memoryCeiling bytes or cannot be allocated.
    static std::vector<WardMerge> Linkage(
        const std::vector<cv::Vec3d>& points,
        size_t memoryCeiling
    );

    // Cut a dendrogram into exactly clusterCount flat clusters.
    // Labels are 0-based, numbered in order of first appearance.
    static std::vector<int> Cut(
        const std::vector<WardMerge>& merges,
        int pointCount,
        int clusterCount
    );

    // Linkage + Cut
    static std::vector<int> Cluster(
        const std::vector<cv::Vec3d>& points,
        int clusterCount,
        size_t memoryCeiling
    );

    // Bytes needed by the condensed matrix for n points
    static size_t CondensedMatrixBytes(size_t n);
};

} // namespace VisualAnalysis
