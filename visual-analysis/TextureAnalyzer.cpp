#include "TextureAnalyzer.h"
#include "ColorSpaceConverter.h"
#include "MapRenderer.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace VisualAnalysis {

AnalyzerResult TextureAnalyzer::AnalyzeOrientation(const cv::Mat& rgb) {
    cv::Mat gray = ColorSpaceConverter::Gray(rgb);

    cv::Mat gx, gy, magnitude;
    cv::Sobel(gray, gx, CV_64F, 1, 0, 3);
    cv::Sobel(gray, gy, CV_64F, 0, 1, 3);
    cv::magnitude(gx, gy, magnitude);

    double minVal, maxVal;
    cv::minMaxLoc(magnitude, &minVal, &maxVal);
    cv::Mat value = MapRenderer::NormalizeByMax(magnitude, maxVal);

    // Angle in [0,360] drives the cyclic hue channel
    cv::Mat degrees(gray.size(), CV_64F);
    cv::Mat hsv(gray.size(), CV_8UC3);
    for (int y = 0; y < gray.rows; y++) {
        const double* dx = gx.ptr<double>(y);
        const double* dy = gy.ptr<double>(y);
        const uchar* v = value.ptr<uchar>(y);
        double* deg = degrees.ptr<double>(y);
        cv::Vec3b* dst = hsv.ptr<cv::Vec3b>(y);
        for (int x = 0; x < gray.cols; x++) {
            deg[x] = std::atan2(dy[x], dx[x]) * 180.0 / M_PI + 180.0;
            dst[x] = cv::Vec3b(static_cast<uchar>(deg[x] / 360.0 * 179.0), 255, v[x]);
        }
    }

    cv::Mat orientationRgb;
    cv::cvtColor(hsv, orientationRgb, cv::COLOR_HSV2RGB);

    cv::Scalar mean, stddev;
    cv::meanStdDev(degrees, mean, stddev);

    AnalyzerResult result;
    result.maps["orientation_field"] = orientationRgb;
    result.metrics["mean_orientation"] = mean[0];
    result.metrics["orientation_std"] = stddev[0];
    return result;
}

cv::Mat TextureAnalyzer::Coherence(const cv::Mat& gray, double sigma) {
    cv::Mat grayFloat;
    gray.convertTo(grayFloat, CV_32F);

    cv::Mat gx, gy;
    cv::Sobel(grayFloat, gx, CV_64F, 1, 0, 3);
    cv::Sobel(grayFloat, gy, CV_64F, 0, 1, 3);

    // Smoothed structure tensor
    cv::Mat jxx, jyy, jxy;
    cv::GaussianBlur(gx.mul(gx), jxx, cv::Size(0, 0), sigma);
    cv::GaussianBlur(gy.mul(gy), jyy, cv::Size(0, 0), sigma);
    cv::GaussianBlur(gx.mul(gy), jxy, cv::Size(0, 0), sigma);

    cv::Mat coherence = cv::Mat::zeros(gray.size(), CV_64F);
    for (int y = 0; y < gray.rows; y++) {
        const double* xx = jxx.ptr<double>(y);
        const double* yy = jyy.ptr<double>(y);
        const double* xy = jxy.ptr<double>(y);
        double* dst = coherence.ptr<double>(y);
        for (int x = 0; x < gray.cols; x++) {
            double trace = xx[x] + yy[x];
            if (trace <= 0.0) continue;
            double det = xx[x] * yy[x] - xy[x] * xy[x];
            double discriminant = std::max(0.0, trace * trace - 4.0 * det);
            dst[x] = std::min(1.0, std::sqrt(discriminant) / trace);
        }
    }
    return coherence;
}

AnalyzerResult TextureAnalyzer::AnalyzeCoherence(const cv::Mat& rgb, double sigma) {
    cv::Mat coherence = Coherence(ColorSpaceConverter::Gray(rgb), sigma);

    cv::Mat coherence8u = MapRenderer::NormalizeByMax(coherence, 1.0);

    AnalyzerResult result;
    result.maps["coherence_map"] = MapRenderer::ApplyColorMapRgb(coherence8u, cv::COLORMAP_VIRIDIS);
    result.metrics["mean_coherence"] = cv::mean(coherence)[0];
    result.metrics["high_coherence_ratio"] = MapRenderer::MaskRatio(coherence > 0.7);
    return result;
}

} // namespace VisualAnalysis
