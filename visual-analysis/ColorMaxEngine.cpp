#include "ColorMaxEngine.h"
#include "AnalysisContext.h"
#include "ClusteringStrategies.h"
#include "ColorSpaceConverter.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace VisualAnalysis {

namespace {
    const int kMaxTargetClusters = 64;
    const int kNearestChunkRows = 1 << 16;
}

std::vector<cv::Vec3d> ColorMaxEngine::WeightedCentroids(
    const std::vector<int>& binLabels,
    const std::vector<cv::Vec3d>& binCenters,
    const std::vector<int64_t>& binCounts,
    int clusterCount,
    std::vector<int64_t>& clusterSizes
) {
    std::vector<cv::Vec3d> sums(clusterCount, cv::Vec3d(0, 0, 0));
    clusterSizes.assign(clusterCount, 0);

    for (size_t i = 0; i < binLabels.size(); i++) {
        const double weight = static_cast<double>(binCounts[i]);
        sums[binLabels[i]] += binCenters[i] * weight;
        clusterSizes[binLabels[i]] += binCounts[i];
    }

    for (int c = 0; c < clusterCount; c++) {
        if (clusterSizes[c] > 0) {
            sums[c] *= 1.0 / static_cast<double>(clusterSizes[c]);
        }
    }
    return sums;
}

bool ColorMaxEngine::SubsampleBins(
    std::vector<BinKey>& keys,
    std::vector<cv::Vec3d>& centers,
    std::vector<int64_t>& counts,
    const ColorMaxParams& params
) {
    const int n = static_cast<int>(keys.size());
    int keep = n;
    if (n > params.binSubsampleUpperThreshold) {
        keep = params.binSubsampleUpperThreshold;
    } else if (n > params.binSubsampleThreshold) {
        keep = params.binSubsampleThreshold;
    }
    if (keep >= n) return false;

    // Partial Fisher-Yates with a fixed seed
    std::vector<int> indices(n);
    std::iota(indices.begin(), indices.end(), 0);
    cv::RNG rng(params.seed);
    for (int i = 0; i < keep; i++) {
        int j = i + static_cast<int>(rng.uniform(0, n - i));
        std::swap(indices[i], indices[j]);
    }
    indices.resize(keep);
    std::sort(indices.begin(), indices.end());

    std::vector<BinKey> keptKeys;
    std::vector<cv::Vec3d> keptCenters;
    std::vector<int64_t> keptCounts;
    keptKeys.reserve(keep);
    keptCenters.reserve(keep);
    keptCounts.reserve(keep);
    for (int index : indices) {
        keptKeys.push_back(keys[index]);
        keptCenters.push_back(centers[index]);
        keptCounts.push_back(counts[index]);
    }

    keys.swap(keptKeys);
    centers.swap(keptCenters);
    counts.swap(keptCounts);
    return true;
}

int ColorMaxEngine::AbsorbSmallClusters(
    std::vector<int>& binLabels,
    const std::vector<cv::Vec3d>& binCenters,
    const std::vector<int64_t>& binCounts,
    int clusterCount,
    int64_t sampledPixels,
    double minRatio
) {
    std::vector<int64_t> sizes;
    std::vector<cv::Vec3d> centroids = WeightedCentroids(binLabels, binCenters, binCounts, clusterCount, sizes);

    std::vector<int> smallClusters;
    std::vector<int> mainClusters;
    for (int c = 0; c < clusterCount; c++) {
        if (sizes[c] == 0) continue;
        double ratio = sampledPixels > 0 ? static_cast<double>(sizes[c]) / sampledPixels : 0.0;
        if (ratio < minRatio) {
            smallClusters.push_back(c);
        } else {
            mainClusters.push_back(c);
        }
    }

    std::vector<int> target(clusterCount);
    std::iota(target.begin(), target.end(), 0);
    if (!smallClusters.empty() && !mainClusters.empty()) {
        for (int small : smallClusters) {
            int nearest = mainClusters.front();
            double best = std::numeric_limits<double>::infinity();
            for (int main : mainClusters) {
                double d = cv::norm(centroids[small] - centroids[main]);
                if (d < best) {
                    best = d;
                    nearest = main;
                }
            }
            target[small] = nearest;
        }
    }

    // Compact surviving ids in ascending order of their old id
    std::vector<int> newId(clusterCount, -1);
    int next = 0;
    for (int c = 0; c < clusterCount; c++) {
        if (sizes[c] > 0 && target[c] == c) {
            newId[c] = next++;
        }
    }
    for (int& label : binLabels) {
        label = newId[target[label]];
    }
    return next;
}

std::vector<int> ColorMaxEngine::NearestCentroids(
    const std::vector<cv::Vec3f>& pixels,
    const std::vector<cv::Vec3d>& centroids
) {
    std::vector<int> nearest(pixels.size(), 0);
    const int k = static_cast<int>(centroids.size());
    if (pixels.empty() || k == 0) return nearest;

    cv::Mat centers(k, 3, CV_32F);
    cv::Mat centerNorms(1, k, CV_32F);
    for (int c = 0; c < k; c++) {
        float* row = centers.ptr<float>(c);
        for (int d = 0; d < 3; d++) row[d] = static_cast<float>(centroids[c][d]);
        centerNorms.at<float>(0, c) = row[0] * row[0] + row[1] * row[1] + row[2] * row[2];
    }

    // ||x - c||^2 = ||x||^2 - 2 x.c + ||c||^2; the ||x||^2 term is constant per row
    const int total = static_cast<int>(pixels.size());
    for (int start = 0; start < total; start += kNearestChunkRows) {
        const int rows = std::min(kNearestChunkRows, total - start);
        cv::Mat block(rows, 3, CV_32F, const_cast<cv::Vec3f*>(pixels.data() + start));

        cv::Mat norms;
        cv::repeat(centerNorms, rows, 1, norms);
        cv::Mat distances;
        cv::gemm(block, centers, -2.0, norms, 1.0, distances, cv::GEMM_2_T);

        for (int r = 0; r < rows; r++) {
            const float* row = distances.ptr<float>(r);
            int best = 0;
            for (int c = 1; c < k; c++) {
                if (row[c] < row[best]) best = c;
            }
            nearest[start + r] = best;
        }
    }
    return nearest;
}

ColorMaxResult ColorMaxEngine::Segment(
    const cv::Mat& rgb,
    const ColorMaxParams& params,
    AnalysisContext& context
) {
    if (rgb.empty() || rgb.type() != CV_8UC3) {
        throw std::invalid_argument("Expected non-empty CV_8UC3 input for ColorMax");
    }
    if (params.targetClusters < 1 || params.targetClusters > kMaxTargetClusters) {
        throw std::invalid_argument("targetClusters must be in [1, 64], got " + std::to_string(params.targetClusters));
    }

    ColorMaxResult result;
    const int h = rgb.rows;
    const int w = rgb.cols;
    const int64_t totalPixels = static_cast<int64_t>(h) * w;

    // 1-4. Lab, sampling stride, bins
    cv::Mat lab = ColorSpaceConverter::RgbToLab(rgb);
    result.sampleStride = ColorBinning::SamplingStride(totalPixels, params.samplingTarget);

    int64_t sampledPixels = 0;
    std::vector<BinKey> keys;
    std::vector<cv::Vec3d> centers;
    std::vector<int64_t> counts;
    {
        BinMap bins = ColorBinning::Accumulate(lab, result.sampleStride, params, sampledPixels);
        ColorBinning::Flatten(bins, keys, centers, counts);
    }
    result.binCount = static_cast<int>(keys.size());
    context.Debug("ColorMax: " + std::to_string(result.binCount) + " bins from " +
                  std::to_string(sampledPixels) + " sampled pixels (stride " +
                  std::to_string(result.sampleStride) + ")");

    // 5. Group bins
    std::vector<int> binLabels;
    int clusterCount = 0;
    if (result.binCount < params.targetClusters) {
        binLabels.resize(keys.size());
        std::iota(binLabels.begin(), binLabels.end(), 0);
        clusterCount = result.binCount;
        result.strategy = ClusteringStrategy::PER_BIN;
    } else {
        if (result.binCount <= params.hierarchicalBinCeiling) {
            result.binsSubsampled = SubsampleBins(keys, centers, counts, params);
            if (result.binsSubsampled) {
                context.Warn("ColorMax: " + std::to_string(result.binCount) + " bins subsampled to " +
                             std::to_string(keys.size()));
            }
        }

        StrategyChain chain = ClusteringChain::Default();
        ClusteringOutcome outcome = ClusteringChain::Run(chain, centers, params.targetClusters, params, context);
        binLabels = std::move(outcome.labels);
        result.strategy = outcome.strategy;
        clusterCount = binLabels.empty() ? 0 : *std::max_element(binLabels.begin(), binLabels.end()) + 1;
    }

    // 6-7. Weighted centroids after small-cluster absorption
    clusterCount = AbsorbSmallClusters(binLabels, centers, counts, clusterCount, sampledPixels, params.smallClusterRatio);
    std::vector<int64_t> clusterSizes;
    std::vector<cv::Vec3d> centroids = WeightedCentroids(binLabels, centers, counts, clusterCount, clusterSizes);

    std::map<BinKey, int> binToCluster;
    for (size_t i = 0; i < keys.size(); i++) {
        binToCluster.emplace(keys[i], binLabels[i]);
    }
    keys.clear();
    centers.clear();
    counts.clear();
    binLabels.clear();

    // 8. Full-resolution assignment
    cv::Mat labels(h, w, CV_32SC1);
    std::vector<cv::Vec3f> unmatchedPixels;
    std::vector<int> unmatchedIndices;
    for (int y = 0; y < h; y++) {
        const cv::Vec3f* src = lab.ptr<cv::Vec3f>(y);
        int* dst = labels.ptr<int>(y);
        for (int x = 0; x < w; x++) {
            auto it = binToCluster.find(ColorBinning::KeyFor(src[x], params));
            if (it != binToCluster.end()) {
                dst[x] = it->second;
            } else {
                dst[x] = -1;
                unmatchedPixels.push_back(src[x]);
                unmatchedIndices.push_back(y * w + x);
            }
        }
    }

    if (!unmatchedPixels.empty()) {
        std::vector<int> nearest = NearestCentroids(unmatchedPixels, centroids);
        int* flat = labels.ptr<int>(0);
        for (size_t i = 0; i < unmatchedIndices.size(); i++) {
            flat[unmatchedIndices[i]] = nearest[i];
        }
        context.Debug("ColorMax: " + std::to_string(unmatchedPixels.size()) +
                      " pixels assigned by nearest centroid");
    }
    unmatchedPixels.clear();
    unmatchedPixels.shrink_to_fit();
    unmatchedIndices.clear();
    unmatchedIndices.shrink_to_fit();

    // 9. Final centroids strictly from full-resolution pixels
    std::vector<cv::Vec3d> labSums(clusterCount, cv::Vec3d(0, 0, 0));
    std::vector<int64_t> pixelCounts(clusterCount, 0);
    for (int y = 0; y < h; y++) {
        const cv::Vec3f* src = lab.ptr<cv::Vec3f>(y);
        const int* label = labels.ptr<int>(y);
        for (int x = 0; x < w; x++) {
            labSums[label[x]] += cv::Vec3d(src[x][0], src[x][1], src[x][2]);
            pixelCounts[label[x]]++;
        }
    }
    lab.release();

    std::vector<int> finalId(clusterCount, -1);
    for (int c = 0; c < clusterCount; c++) {
        if (pixelCounts[c] == 0) continue;
        finalId[c] = static_cast<int>(result.clusters.size());

        ClusterInfo info;
        info.lab = labSums[c] * (1.0 / static_cast<double>(pixelCounts[c]));
        info.rgb = ColorSpaceConverter::LabToRgb(info.lab);
        info.pixelCount = pixelCounts[c];
        info.ratio = static_cast<double>(pixelCounts[c]) / static_cast<double>(totalPixels);
        result.clusters.push_back(info);
    }

    // 10. Render through a per-cluster color table
    result.segmented.create(h, w, CV_8UC3);
    for (int y = 0; y < h; y++) {
        int* label = labels.ptr<int>(y);
        cv::Vec3b* dst = result.segmented.ptr<cv::Vec3b>(y);
        for (int x = 0; x < w; x++) {
            label[x] = finalId[label[x]];
            dst[x] = result.clusters[label[x]].rgb;
        }
    }
    result.labels = labels;

    context.Info("ColorMax: " + std::to_string(result.clusters.size()) + " clusters via " +
                 ToString(result.strategy));
    return result;
}

std::vector<PaletteEntry> ColorMaxEngine::ExtractDominantPalette(const ColorMaxResult& result, int topN) {
    std::vector<size_t> order(result.clusters.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&result](size_t a, size_t b) {
        return result.clusters[a].ratio > result.clusters[b].ratio;
    });

    std::vector<PaletteEntry> palette;
    for (size_t i = 0; i < order.size() && static_cast<int>(i) < topN; i++) {
        PaletteEntry entry;
        entry.rgb = result.clusters[order[i]].rgb;
        entry.ratio = result.clusters[order[i]].ratio;
        palette.push_back(entry);
    }
    return palette;
}

double ColorMaxEngine::BalanceScore(const std::vector<double>& ratios) {
    if (ratios.empty()) return 1.0;

    double mean = std::accumulate(ratios.begin(), ratios.end(), 0.0) / ratios.size();
    double variance = 0.0;
    for (double r : ratios) {
        variance += (r - mean) * (r - mean);
    }
    variance /= ratios.size();
    return 1.0 - std::sqrt(variance);
}

} // namespace VisualAnalysis
