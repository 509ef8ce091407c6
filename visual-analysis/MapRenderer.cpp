#include "MapRenderer.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace VisualAnalysis {

cv::Mat MapRenderer::ApplyColorMapRgb(const cv::Mat& map8u, int colormap) {
    cv::Mat bgr;
    cv::applyColorMap(map8u, bgr, colormap);
    cv::Mat rgb;
    cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
    return rgb;
}

cv::Mat MapRenderer::NormalizeByMax(const cv::Mat& values, double maxValue) {
    cv::Mat out = cv::Mat::zeros(values.size(), CV_8UC1);
    if (maxValue <= 0.0) return out;

    cv::Mat scaled;
    values.convertTo(scaled, CV_64F, 255.0 / maxValue);
    for (int y = 0; y < scaled.rows; y++) {
        const double* src = scaled.ptr<double>(y);
        uchar* dst = out.ptr<uchar>(y);
        for (int x = 0; x < scaled.cols; x++) {
            dst[x] = static_cast<uchar>(std::max(0.0, std::min(255.0, src[x])));
        }
    }
    return out;
}

cv::Mat MapRenderer::GrayToRgb(const cv::Mat& gray) {
    cv::Mat rgb;
    cv::cvtColor(gray, rgb, cv::COLOR_GRAY2RGB);
    return rgb;
}

double MapRenderer::MaskRatio(const cv::Mat& mask) {
    if (mask.empty()) return 0.0;
    return static_cast<double>(cv::countNonZero(mask)) / static_cast<double>(mask.total());
}

void MapRenderer::Paint(cv::Mat& rgb, const cv::Mat& mask, const cv::Vec3b& color) {
    rgb.setTo(cv::Scalar(color[0], color[1], color[2]), mask);
}

} // namespace VisualAnalysis
