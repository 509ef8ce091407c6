#pragma once

#include <opencv2/core.hpp>

namespace VisualAnalysis {

// Color-space transforms shared by every analyzer.
// RGB buffers are CV_8UC3 in R,G,B order. Lab buffers are CV_32FC3 with
// L in [0,100] (sRGB, D65).
class ColorSpaceConverter {
public:
    static cv::Mat RgbToLab(const cv::Mat& rgb);
    static cv::Mat LabToRgb(const cv::Mat& lab);

    static cv::Vec3d RgbToLab(const cv::Vec3b& rgb);
    static cv::Vec3b LabToRgb(const cv::Vec3d& lab);

    // OpenCV 8-bit ranges: H in [0,180), S/V/L in [0,255]
    static cv::Mat RgbToHsv(const cv::Mat& rgb);
    static cv::Mat RgbToHls(const cv::Mat& rgb);

    // 0.299 R + 0.587 G + 0.114 B, truncated
    static cv::Mat Luma(const cv::Mat& rgb);

    // Gray as the edge/texture analyzers see it (OpenCV rounding)
    static cv::Mat Gray(const cv::Mat& rgb);

    // L / 100 * 255, truncated, CV_8UC1
    static cv::Mat LabLightness8U(const cv::Mat& lab);

    // L channel of a Lab buffer, CV_32FC1
    static cv::Mat LabLightness(const cv::Mat& lab);

private:
    static void RequireRgb(const cv::Mat& rgb, const char* caller);
};

} // namespace VisualAnalysis
