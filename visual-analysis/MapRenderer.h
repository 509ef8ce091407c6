#pragma once

#include <opencv2/core.hpp>

namespace VisualAnalysis {

// Rendering helpers shared by the channel analyzers
class MapRenderer {
public:
    // OpenCV colormap on an 8-bit map, returned in RGB order
    static cv::Mat ApplyColorMapRgb(const cv::Mat& map8u, int colormap);

    // value / maxValue * 255, truncated. All-zero output when maxValue <= 0.
    static cv::Mat NormalizeByMax(const cv::Mat& values, double maxValue);

    // Expand a single-channel 8-bit map to RGB
    static cv::Mat GrayToRgb(const cv::Mat& gray);

    // Fraction of non-zero mask pixels
    static double MaskRatio(const cv::Mat& mask);

    // Paint mask pixels of an RGB image with one color
    static void Paint(cv::Mat& rgb, const cv::Mat& mask, const cv::Vec3b& color);
};

} // namespace VisualAnalysis
