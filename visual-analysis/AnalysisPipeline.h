#pragma once

#include "AnalysisParameters.h"
#include <opencv2/core.hpp>
#include <map>
#include <string>
#include <vector>

namespace VisualAnalysis {

class AnalysisContext;

class AnalysisPipeline {
public:
    // Decode, then run the fixed 5-step sequence.
    // Never throws for per-submission failures: the result carries
    // success = false, failedStage and errorMessage, and no images.
    static AnalysisResult Execute(
        const std::vector<uchar>& encoded,
        const PipelineParams& params,
        AnalysisContext& context
    );

    // Same sequence on an already decoded RGB CV_8UC3 buffer, bounded to
    // params.normalizer.maxSide first
    static AnalysisResult ExecuteOnBuffer(
        const cv::Mat& rgb,
        const PipelineParams& params,
        AnalysisContext& context
    );

    // Name of the step-5 segmentation artifact for a cluster target
    static std::string SegmentationArtifactName(int targetClusters);

    // Map gray levels through ascending thresholds: values below
    // thresholds[i] (and not below an earlier one) become levels[i],
    // the rest levels.back()
    static cv::Mat QuantizeLevels(
        const cv::Mat& gray,
        const std::vector<int>& thresholds,
        const std::vector<uchar>& levels
    );

private:
    // Working state shared by the stages of one run
    struct RunState {
        PipelineStage stage = PipelineStage::PENDING;
        std::map<std::string, EncodedImage> images;
        double encodingMs = 0.0;
    };

    static AnalysisResult Run(
        const std::vector<uchar>* encoded,
        const cv::Mat* decoded,
        const PipelineParams& params,
        AnalysisContext& context
    );

    static void Enter(RunState& state, PipelineStage stage, AnalysisContext& context);

    static void Store(
        RunState& state,
        const std::string& name,
        const cv::Mat& image,
        const EncodingParams& params,
        AnalysisContext& context
    );

    static void ExecuteTonalThresholds(const cv::Mat& rgb, int threshold, RunState& state,
                                       const EncodingParams& encoding, AnalysisContext& context, double& timingMs);

    static void ExecuteLuminance(const cv::Mat& rgb, RunState& state,
                                 const EncodingParams& encoding, AnalysisContext& context, double& timingMs);

    static void ExecuteSaturation(const cv::Mat& rgb, RunState& state,
                                  const EncodingParams& encoding, AnalysisContext& context, double& timingMs);

    static void ExecuteHue(const cv::Mat& rgb, RunState& state, AnalysisStatistics& statistics,
                           const EncodingParams& encoding, AnalysisContext& context, double& timingMs);

    static void ExecuteClustering(const cv::Mat& rgb, const PipelineParams& params, RunState& state,
                                  AnalysisStatistics& statistics, AnalysisContext& context, double& timingMs);
};

} // namespace VisualAnalysis
