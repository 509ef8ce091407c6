#pragma once

#include "AnalysisParameters.h"
#include <opencv2/core.hpp>
#include <memory>
#include <string>
#include <vector>

namespace VisualAnalysis {

class AnalysisContext;

// Common result of every strategy in the chain
struct ClusteringOutcome {
    bool succeeded = false;
    ClusteringStrategy strategy = ClusteringStrategy::NONE;
    std::vector<int> labels;         // One cluster index per bin center
    std::string failureReason;
};

// One way of grouping bin centers into a target number of clusters
class BinClusteringStrategy {
public:
    virtual ~BinClusteringStrategy() = default;

    virtual ClusteringStrategy Kind() const = 0;

    // Whether the strategy may be attempted for this many bins
    virtual bool Applicable(size_t binCount, const ColorMaxParams& params) const = 0;

    // Recoverable failures are reported in the outcome, never thrown
    virtual ClusteringOutcome Run(
        const std::vector<cv::Vec3d>& centers,
        int targetClusters,
        const ColorMaxParams& params
    ) const = 0;
};

// Ward linkage cut at the target count
class HierarchicalStrategy : public BinClusteringStrategy {
public:
    ClusteringStrategy Kind() const override { return ClusteringStrategy::HIERARCHICAL; }
    bool Applicable(size_t binCount, const ColorMaxParams& params) const override;
    ClusteringOutcome Run(
        const std::vector<cv::Vec3d>& centers,
        int targetClusters,
        const ColorMaxParams& params
    ) const override;
};

// k-means++ with a fixed seed
class PartitionalStrategy : public BinClusteringStrategy {
public:
    ClusteringStrategy Kind() const override { return ClusteringStrategy::PARTITIONAL; }
    bool Applicable(size_t binCount, const ColorMaxParams& params) const override;
    ClusteringOutcome Run(
        const std::vector<cv::Vec3d>& centers,
        int targetClusters,
        const ColorMaxParams& params
    ) const override;
};

using StrategyChain = std::vector<std::unique_ptr<BinClusteringStrategy>>;

class ClusteringChain {
public:
    // Hierarchical, then partitional
    static StrategyChain Default();

    // First applicable strategy that succeeds with one label per bin. Failures
    // are logged and the next strategy is tried; throws std::runtime_error if
    // none succeeds.
    static ClusteringOutcome Run(
        const StrategyChain& chain,
        const std::vector<cv::Vec3d>& centers,
        int targetClusters,
        const ColorMaxParams& params,
        AnalysisContext& context
    );
};

} // namespace VisualAnalysis
