#pragma once

#include "AnalysisParameters.h"
#include <opencv2/core.hpp>

namespace VisualAnalysis {

// Tonal ("value") structure: perceptual lightness, local contrast and
// the lightness center of mass.
class ValueStructureAnalyzer {
public:
    // Maps: l_channel. Metrics: l_mean, l_std (L in [0,100])
    static AnalyzerResult AnalyzeLuminance(const cv::Mat& rgb);

    // Maps: clahe_enhanced, local_variance. Metrics: max_variance
    static AnalyzerResult AnalyzeLocalContrast(const cv::Mat& rgb, const ContrastParams& params);

    // Maps: marked_image. Metrics: center_x, center_y, center_x_percent, center_y_percent
    static AnalyzerResult AnalyzeLuminanceCentroid(const cv::Mat& rgb);

    // Lightness-weighted center of mass, clamped inside the image
    static cv::Point2d LuminanceCentroid(const cv::Mat& lightness);

    // Local variance over a disk footprint (E[x^2] - E[x]^2, clamped >= 0)
    static cv::Mat LocalVariance(const cv::Mat& values, int radius);

private:
    static cv::Mat DiskKernel(int radius);
};

} // namespace VisualAnalysis
