#include "ValueStructureAnalyzer.h"
#include "ColorSpaceConverter.h"
#include "MapRenderer.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace VisualAnalysis {

AnalyzerResult ValueStructureAnalyzer::AnalyzeLuminance(const cv::Mat& rgb) {
    cv::Mat lab = ColorSpaceConverter::RgbToLab(rgb);
    cv::Mat lightness = ColorSpaceConverter::LabLightness(lab);

    cv::Scalar mean, stddev;
    cv::meanStdDev(lightness, mean, stddev);

    AnalyzerResult result;
    result.maps["l_channel"] = ColorSpaceConverter::LabLightness8U(lab);
    result.metrics["l_mean"] = mean[0];
    result.metrics["l_std"] = stddev[0];
    return result;
}

cv::Mat ValueStructureAnalyzer::DiskKernel(int radius) {
    // Same footprint as x^2 + y^2 <= r^2
    int size = 2 * radius + 1;
    cv::Mat kernel = cv::Mat::zeros(size, size, CV_32F);
    for (int y = -radius; y <= radius; y++) {
        for (int x = -radius; x <= radius; x++) {
            if (x * x + y * y <= radius * radius) {
                kernel.at<float>(y + radius, x + radius) = 1.0f;
            }
        }
    }
    kernel /= cv::sum(kernel)[0];
    return kernel;
}

cv::Mat ValueStructureAnalyzer::LocalVariance(const cv::Mat& values, int radius) {
    cv::Mat valuesFloat;
    values.convertTo(valuesFloat, CV_32F);

    cv::Mat kernel = DiskKernel(std::max(1, radius));

    cv::Mat localMean, localMeanSq;
    cv::filter2D(valuesFloat, localMean, CV_32F, kernel, cv::Point(-1, -1), 0, cv::BORDER_REFLECT);
    cv::filter2D(valuesFloat.mul(valuesFloat), localMeanSq, CV_32F, kernel, cv::Point(-1, -1), 0, cv::BORDER_REFLECT);

    cv::Mat variance = localMeanSq - localMean.mul(localMean);
    cv::max(variance, 0.0, variance);
    return variance;
}

AnalyzerResult ValueStructureAnalyzer::AnalyzeLocalContrast(const cv::Mat& rgb, const ContrastParams& params) {
    cv::Mat lab = ColorSpaceConverter::RgbToLab(rgb);
    cv::Mat lightness8u = ColorSpaceConverter::LabLightness8U(lab);
    lab.release();

    // CLAHE on the lightness map
    cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(
        params.claheClipLimit,
        cv::Size(params.claheTileGrid, params.claheTileGrid)
    );
    cv::Mat enhanced;
    clahe->apply(lightness8u, enhanced);

    cv::Mat variance = LocalVariance(lightness8u, params.varianceRadius);
    double minVal, maxVal;
    cv::minMaxLoc(variance, &minVal, &maxVal);

    AnalyzerResult result;
    result.maps["clahe_enhanced"] = enhanced;
    result.maps["local_variance"] = MapRenderer::NormalizeByMax(variance, maxVal + 1e-10);
    result.metrics["max_variance"] = maxVal;
    return result;
}

cv::Point2d ValueStructureAnalyzer::LuminanceCentroid(const cv::Mat& lightness) {
    const int h = lightness.rows;
    const int w = lightness.cols;

    cv::Mat weights;
    lightness.convertTo(weights, CV_64F);

    // Explicit grids: x varies along columns, y along rows
    cv::Mat xRow(1, w, CV_64F);
    for (int x = 0; x < w; x++) xRow.at<double>(0, x) = x;
    cv::Mat yCol(h, 1, CV_64F);
    for (int y = 0; y < h; y++) yCol.at<double>(y, 0) = y;

    cv::Mat xCoords, yCoords;
    cv::repeat(xRow, h, 1, xCoords);
    cv::repeat(yCol, 1, w, yCoords);

    double totalWeight = cv::sum(weights)[0];
    double centerX = w / 2.0;
    double centerY = h / 2.0;
    if (totalWeight > 0.0) {
        centerX = cv::sum(xCoords.mul(weights))[0] / totalWeight;
        centerY = cv::sum(yCoords.mul(weights))[0] / totalWeight;
    }

    centerX = std::max(0.0, std::min(static_cast<double>(w - 1), centerX));
    centerY = std::max(0.0, std::min(static_cast<double>(h - 1), centerY));
    return cv::Point2d(centerX, centerY);
}

AnalyzerResult ValueStructureAnalyzer::AnalyzeLuminanceCentroid(const cv::Mat& rgb) {
    cv::Mat lab = ColorSpaceConverter::RgbToLab(rgb);
    cv::Mat lightness = ColorSpaceConverter::LabLightness(lab);
    cv::Point2d center = LuminanceCentroid(lightness);

    cv::Mat marked = MapRenderer::GrayToRgb(ColorSpaceConverter::LabLightness8U(lab));
    cv::Point marker(static_cast<int>(std::lround(center.x)), static_cast<int>(std::lround(center.y)));
    int ringRadius = std::max(10, std::min(rgb.cols, rgb.rows) / 30);
    cv::circle(marked, marker, ringRadius, cv::Scalar(255, 0, 0), 2);
    cv::circle(marked, marker, 3, cv::Scalar(255, 0, 0), -1);

    AnalyzerResult result;
    result.maps["marked_image"] = marked;
    result.metrics["center_x"] = center.x;
    result.metrics["center_y"] = center.y;
    result.metrics["center_x_percent"] = center.x / rgb.cols * 100.0;
    result.metrics["center_y_percent"] = center.y / rgb.rows * 100.0;
    return result;
}

} // namespace VisualAnalysis
