#include "ClusteringStrategies.h"
#include "AnalysisContext.h"
#include "AnalysisErrors.h"
#include "WardClustering.h"
#include <algorithm>
#include <stdexcept>

namespace VisualAnalysis {

namespace {
    // Seeds the thread-local OpenCV RNG for the lifetime of the guard
    class ScopedRngSeed {
    public:
        explicit ScopedRngSeed(uint64_t seed) : saved_(cv::theRNG()) {
            cv::theRNG() = cv::RNG(seed);
        }
        ~ScopedRngSeed() { cv::theRNG() = saved_; }

        ScopedRngSeed(const ScopedRngSeed&) = delete;
        ScopedRngSeed& operator=(const ScopedRngSeed&) = delete;

    private:
        cv::RNG saved_;
    };
}

bool HierarchicalStrategy::Applicable(size_t binCount, const ColorMaxParams& params) const {
    return binCount <= static_cast<size_t>(params.hierarchicalBinCeiling);
}

ClusteringOutcome HierarchicalStrategy::Run(
    const std::vector<cv::Vec3d>& centers,
    int targetClusters,
    const ColorMaxParams& params
) const {
    ClusteringOutcome outcome;
    outcome.strategy = Kind();

    try {
        outcome.labels = WardClustering::Cluster(centers, targetClusters, params.hierarchicalMemoryCeiling);
        if (outcome.labels.size() != centers.size()) {
            throw ClusteringSizeMismatchError(centers.size(), outcome.labels.size());
        }
        outcome.succeeded = true;
    } catch (const ClusteringMemoryError& e) {
        outcome.labels.clear();
        outcome.failureReason = e.what();
    } catch (const ClusteringSizeMismatchError& e) {
        outcome.labels.clear();
        outcome.failureReason = e.what();
    }
    return outcome;
}

bool PartitionalStrategy::Applicable(size_t binCount, const ColorMaxParams& params) const {
    (void)params;
    return binCount > 0;
}

ClusteringOutcome PartitionalStrategy::Run(
    const std::vector<cv::Vec3d>& centers,
    int targetClusters,
    const ColorMaxParams& params
) const {
    ClusteringOutcome outcome;
    outcome.strategy = Kind();

    const int n = static_cast<int>(centers.size());
    const int k = std::min(targetClusters, n);

    cv::Mat samples(n, 3, CV_32F);
    for (int i = 0; i < n; i++) {
        float* row = samples.ptr<float>(i);
        row[0] = static_cast<float>(centers[i][0]);
        row[1] = static_cast<float>(centers[i][1]);
        row[2] = static_cast<float>(centers[i][2]);
    }

    cv::Mat labels;
    cv::Mat clusterCenters;
    {
        ScopedRngSeed seed(params.seed);
        cv::kmeans(
            samples,
            k,
            labels,
            cv::TermCriteria(cv::TermCriteria::EPS + cv::TermCriteria::COUNT,
                             params.kmeansMaxIterations, params.kmeansEpsilon),
            params.kmeansAttempts,
            cv::KMEANS_PP_CENTERS,
            clusterCenters
        );
    }

    if (labels.rows != n) {
        outcome.failureReason = ClusteringSizeMismatchError(centers.size(), labels.rows).what();
        return outcome;
    }

    outcome.labels.assign(labels.begin<int>(), labels.end<int>());
    outcome.succeeded = true;
    return outcome;
}

StrategyChain ClusteringChain::Default() {
    StrategyChain chain;
    chain.push_back(std::make_unique<HierarchicalStrategy>());
    chain.push_back(std::make_unique<PartitionalStrategy>());
    return chain;
}

ClusteringOutcome ClusteringChain::Run(
    const StrategyChain& chain,
    const std::vector<cv::Vec3d>& centers,
    int targetClusters,
    const ColorMaxParams& params,
    AnalysisContext& context
) {
    for (const auto& strategy : chain) {
        if (!strategy->Applicable(centers.size(), params)) {
            context.Info(std::string("ColorMax: ") + ToString(strategy->Kind()) +
                         " skipped for " + std::to_string(centers.size()) + " bins");
            continue;
        }

        ClusteringOutcome outcome = strategy->Run(centers, targetClusters, params);
        if (outcome.succeeded && outcome.labels.size() != centers.size()) {
            outcome.succeeded = false;
            outcome.failureReason = ClusteringSizeMismatchError(centers.size(), outcome.labels.size()).what();
        }
        if (outcome.succeeded) {
            return outcome;
        }
        context.Error(std::string("ColorMax: ") + ToString(strategy->Kind()) +
                      " failed for " + std::to_string(centers.size()) + " bins: " +
                      outcome.failureReason + ", falling back");
    }

    throw std::runtime_error("No clustering strategy succeeded for " + std::to_string(centers.size()) + " bins");
}

} // namespace VisualAnalysis
