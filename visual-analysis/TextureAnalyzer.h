#pragma once

#include "AnalysisParameters.h"
#include <opencv2/core.hpp>

namespace VisualAnalysis {

class TextureAnalyzer {
public:
    // Gradient angle as hue, gradient magnitude as value.
    // Maps: orientation_field. Metrics: mean_orientation, orientation_std (degrees)
    static AnalyzerResult AnalyzeOrientation(const cv::Mat& rgb);

    // Structure-tensor coherence (lambda1 - lambda2) / (lambda1 + lambda2).
    // Maps: coherence_map. Metrics: mean_coherence, high_coherence_ratio (> 0.7)
    static AnalyzerResult AnalyzeCoherence(const cv::Mat& rgb, double sigma = 2.0);

    // CV_64FC1 coherence in [0,1]; 0 where the tensor trace is 0
    static cv::Mat Coherence(const cv::Mat& gray, double sigma);
};

} // namespace VisualAnalysis
