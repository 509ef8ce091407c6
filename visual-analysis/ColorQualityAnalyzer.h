#pragma once

#include "AnalysisParameters.h"
#include <opencv2/core.hpp>
#include <vector>

namespace VisualAnalysis {

class ColorQualityAnalyzer {
public:
    static constexpr int kHueHistogramBins = 36;

    // Maps: hue_map, hue_channel. Series: hue_histogram, dominant_hues (top 5 bin starts)
    static AnalyzerResult AnalyzeHueDistribution(const cv::Mat& rgb);

    // Maps: saturation_map, saturation_channel.
    // Metrics: mean_saturation, high_saturation_ratio (S > 200)
    static AnalyzerResult AnalyzeSaturation(const cv::Mat& rgb);

    // Regions where lightness is flat but hue varies, i.e. colors that
    // collapse to the same gray.
    // Maps: grayscale, conflict_marked. Metrics: conflict_ratio
    static AnalyzerResult AnalyzeDesaturatedReadability(const cv::Mat& rgb);

    // Maps: marked_image.
    // Metrics: overexposed_ratio (V > 250), underexposed_ratio (V < 10),
    // oversaturated_ratio (S > 240)
    static AnalyzerResult AnalyzeGamutShift(const cv::Mat& rgb);

    // 36 equal buckets over OpenCV hue [0,180)
    static std::vector<int> HueHistogram(const cv::Mat& hue);

    // Hue channel rendered through the HSV colormap, RGB
    static cv::Mat HueVisualization(const cv::Mat& hue);
};

} // namespace VisualAnalysis
