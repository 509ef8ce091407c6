#include "WardClustering.h"
#include "AnalysisErrors.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <new>
#include <numeric>
#include <stdexcept>

namespace VisualAnalysis {

namespace {
    // Index of (i, j), i != j, in a condensed upper-triangular matrix
    inline size_t CondensedIndex(size_t n, size_t i, size_t j) {
        if (i > j) std::swap(i, j);
        return n * i - i * (i + 1) / 2 + (j - i - 1);
    }

    int FindRoot(std::vector<int>& parent, int x) {
        while (parent[x] != x) {
            parent[x] = parent[parent[x]];
            x = parent[x];
        }
        return x;
    }
}

size_t WardClustering::CondensedMatrixBytes(size_t n) {
    if (n < 2) return 0;
    return n * (n - 1) / 2 * sizeof(double);
}

std::vector<WardMerge> WardClustering::Linkage(
    const std::vector<cv::Vec3d>& points,
    size_t memoryCeiling
) {
    const size_t n = points.size();
    std::vector<WardMerge> merges;
    if (n < 2) return merges;

    size_t bytes = CondensedMatrixBytes(n);
    if (bytes > memoryCeiling) {
        throw ClusteringMemoryError(
            "Distance matrix for " + std::to_string(n) + " bins needs " +
            std::to_string(bytes) + " bytes (ceiling " + std::to_string(memoryCeiling) + ")"
        );
    }

    // Squared Euclidean distances; Ward's Lance-Williams update is exact on them
    std::vector<double> dist;
    try {
        dist.resize(n * (n - 1) / 2);
    } catch (const std::bad_alloc&) {
        throw ClusteringMemoryError("Could not allocate distance matrix for " + std::to_string(n) + " bins");
    }

    for (size_t i = 0; i < n; i++) {
        for (size_t j = i + 1; j < n; j++) {
            cv::Vec3d d = points[i] - points[j];
            dist[CondensedIndex(n, i, j)] = d.dot(d);
        }
    }

    std::vector<double> size(n, 1.0);
    std::vector<char> active(n, 1);
    std::vector<int> chain;
    chain.reserve(n);
    merges.reserve(n - 1);

    int firstActive = 0;
    for (size_t step = 0; step + 1 < n; step++) {
        if (chain.empty()) {
            while (!active[firstActive]) firstActive++;
            chain.push_back(firstActive);
        }

        int a = 0;
        int b = 0;
        double best = 0.0;
        for (;;) {
            a = chain.back();

            // Prefer the previous chain element on ties so the chain terminates
            b = -1;
            best = std::numeric_limits<double>::infinity();
            if (chain.size() >= 2) {
                b = chain[chain.size() - 2];
                best = dist[CondensedIndex(n, a, b)];
            }
            for (size_t c = 0; c < n; c++) {
                if (!active[c] || static_cast<int>(c) == a) continue;
                double d = dist[CondensedIndex(n, a, c)];
                if (d < best) {
                    best = d;
                    b = static_cast<int>(c);
                }
            }

            if (chain.size() >= 2 && b == chain[chain.size() - 2]) break;
            chain.push_back(b);
        }

        chain.pop_back();
        chain.pop_back();

        // Merged cluster lives on in the lower slot
        int keep = std::min(a, b);
        int drop = std::max(a, b);
        WardMerge merge;
        merge.a = keep;
        merge.b = drop;
        merge.height = std::sqrt(std::max(0.0, best));
        merges.push_back(merge);

        const double sizeKeep = size[keep];
        const double sizeDrop = size[drop];
        const double dKeepDrop = best;
        for (size_t c = 0; c < n; c++) {
            if (!active[c] || static_cast<int>(c) == keep || static_cast<int>(c) == drop) continue;
            const double sizeC = size[c];
            double& dKeep = dist[CondensedIndex(n, keep, c)];
            const double dDrop = dist[CondensedIndex(n, drop, c)];
            dKeep = ((sizeKeep + sizeC) * dKeep + (sizeDrop + sizeC) * dDrop - sizeC * dKeepDrop) /
                    (sizeKeep + sizeDrop + sizeC);
        }
        size[keep] = sizeKeep + sizeDrop;
        active[drop] = 0;
    }

    return merges;
}

std::vector<int> WardClustering::Cut(
    const std::vector<WardMerge>& merges,
    int pointCount,
    int clusterCount
) {
    if (clusterCount <= 0) {
        throw std::invalid_argument("clusterCount must be positive");
    }
    if (pointCount < 0 || merges.size() + 1 < static_cast<size_t>(pointCount)) {
        throw std::invalid_argument("Dendrogram does not cover every point");
    }

    std::vector<int> parent(pointCount);
    std::iota(parent.begin(), parent.end(), 0);

    // Lowest merges first; the merges form a spanning forest so each one
    // applied removes exactly one cluster
    std::vector<size_t> order(merges.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
        [&merges](size_t x, size_t y) { return merges[x].height < merges[y].height; });

    int toApply = std::max(0, pointCount - clusterCount);
    for (int i = 0; i < toApply; i++) {
        const WardMerge& merge = merges[order[i]];
        int rootA = FindRoot(parent, merge.a);
        int rootB = FindRoot(parent, merge.b);
        if (rootA != rootB) {
            parent[rootB] = rootA;
        }
    }

    std::vector<int> labels(pointCount, -1);
    std::vector<int> rootLabel(pointCount, -1);
    int next = 0;
    for (int i = 0; i < pointCount; i++) {
        int root = FindRoot(parent, i);
        if (rootLabel[root] < 0) {
            rootLabel[root] = next++;
        }
        labels[i] = rootLabel[root];
    }
    return labels;
}

std::vector<int> WardClustering::Cluster(
    const std::vector<cv::Vec3d>& points,
    int clusterCount,
    size_t memoryCeiling
) {
    std::vector<WardMerge> merges = Linkage(points, memoryCeiling);
    return Cut(merges, static_cast<int>(points.size()), clusterCount);
}

} // namespace VisualAnalysis
