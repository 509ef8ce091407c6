#include "ShapeAnalyzer.h"
#include "ColorSpaceConverter.h"
#include "MapRenderer.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <vector>

namespace VisualAnalysis {

namespace {
    const double kCannyLow = 50.0;
    const double kCannyHigh = 150.0;
    const int kHarrisBlockSize = 2;
    const int kHarrisApertureSize = 3;
    const double kHarrisK = 0.04;
    const double kFeatureRelativeThreshold = 0.01;
    const double kLowFrequencyRadiusFactor = 0.3;
}

AnalyzerResult ShapeAnalyzer::AnalyzeEdges(const cv::Mat& rgb) {
    cv::Mat gray = ColorSpaceConverter::Gray(rgb);

    cv::Mat edges;
    cv::Canny(gray, edges, kCannyLow, kCannyHigh);

    cv::Mat gx, gy, magnitude;
    cv::Sobel(gray, gx, CV_64F, 1, 0, 3);
    cv::Sobel(gray, gy, CV_64F, 0, 1, 3);
    cv::magnitude(gx, gy, magnitude);

    double minVal, maxVal;
    cv::minMaxLoc(magnitude, &minVal, &maxVal);
    cv::Mat magnitude8u = MapRenderer::NormalizeByMax(magnitude, maxVal);

    AnalyzerResult result;
    result.maps["canny_edges"] = edges;
    result.maps["sobel_magnitude"] = magnitude8u;
    result.maps["edge_heatmap"] = MapRenderer::ApplyColorMapRgb(magnitude8u, cv::COLORMAP_JET);
    result.metrics["edge_density"] = MapRenderer::MaskRatio(edges);
    return result;
}

AnalyzerResult ShapeAnalyzer::AnalyzeFeatures(const cv::Mat& rgb) {
    cv::Mat gray = ColorSpaceConverter::Gray(rgb);

    cv::Mat response;
    cv::cornerHarris(gray, response, kHarrisBlockSize, kHarrisApertureSize, kHarrisK);
    cv::dilate(response, response, cv::Mat());

    double minVal, maxVal;
    cv::minMaxLoc(response, &minVal, &maxVal);

    // No positive response means no corners at all (flat image)
    cv::Mat features = cv::Mat::zeros(response.size(), CV_8UC1);
    if (maxVal > 0.0) {
        features = response > kFeatureRelativeThreshold * maxVal;
    }

    cv::Mat response8u = MapRenderer::NormalizeByMax(response, maxVal);
    cv::Mat marked = rgb.clone();
    MapRenderer::Paint(marked, features, cv::Vec3b(0, 255, 0));

    AnalyzerResult result;
    result.maps["feature_heatmap"] = MapRenderer::ApplyColorMapRgb(response8u, cv::COLORMAP_HOT);
    result.maps["marked_image"] = marked;
    result.metrics["feature_count"] = cv::countNonZero(features);
    result.metrics["feature_density"] = MapRenderer::MaskRatio(features);
    return result;
}

cv::Mat ShapeAnalyzer::FftShift(const cv::Mat& spectrum) {
    const int h = spectrum.rows;
    const int w = spectrum.cols;
    const int shiftY = h / 2;
    const int shiftX = w / 2;

    // out[y][x] = in[(y - h/2) mod h][(x - w/2) mod w]
    cv::Mat shifted(spectrum.size(), spectrum.type());
    for (int y = 0; y < h; y++) {
        int srcY = (y - shiftY + h) % h;
        cv::Mat srcRow = spectrum.row(srcY);
        cv::Mat dstRow = shifted.row(y);
        if (shiftX > 0) {
            srcRow.colRange(w - shiftX, w).copyTo(dstRow.colRange(0, shiftX));
        }
        srcRow.colRange(0, w - shiftX).copyTo(dstRow.colRange(shiftX, w));
    }
    return shifted;
}

cv::Mat ShapeAnalyzer::CenteredLogSpectrum(const cv::Mat& gray) {
    cv::Mat grayFloat;
    gray.convertTo(grayFloat, CV_64F);

    cv::Mat complex;
    cv::dft(grayFloat, complex, cv::DFT_COMPLEX_OUTPUT);

    std::vector<cv::Mat> planes;
    cv::split(complex, planes);
    cv::Mat magnitude;
    cv::magnitude(planes[0], planes[1], magnitude);

    magnitude += 1.0;
    cv::log(magnitude, magnitude);
    return FftShift(magnitude);
}

AnalyzerResult ShapeAnalyzer::AnalyzeFrequency(const cv::Mat& rgb) {
    cv::Mat gray = ColorSpaceConverter::Gray(rgb);
    cv::Mat spectrum = CenteredLogSpectrum(gray);

    double minVal, maxVal;
    cv::minMaxLoc(spectrum, &minVal, &maxVal);

    const int h = spectrum.rows;
    const int w = spectrum.cols;
    const int centerY = h / 2;
    const int centerX = w / 2;
    const double radius = std::min(h, w) * kLowFrequencyRadiusFactor;
    const double radiusSq = radius * radius;

    cv::Mat highFrequency = cv::Mat::zeros(spectrum.size(), CV_64F);
    double highEnergy = 0.0;
    for (int y = 0; y < h; y++) {
        const double* src = spectrum.ptr<double>(y);
        double* dst = highFrequency.ptr<double>(y);
        const double dy = y - centerY;
        for (int x = 0; x < w; x++) {
            const double dx = x - centerX;
            if (dx * dx + dy * dy > radiusSq) {
                dst[x] = src[x];
                highEnergy += src[x];
            }
        }
    }
    double totalEnergy = cv::sum(spectrum)[0];

    AnalyzerResult result;
    result.maps["fft_spectrum"] = MapRenderer::NormalizeByMax(spectrum, maxVal);
    result.maps["high_freq_heatmap"] = MapRenderer::ApplyColorMapRgb(
        MapRenderer::NormalizeByMax(highFrequency, maxVal), cv::COLORMAP_VIRIDIS);
    result.metrics["high_freq_energy"] = highEnergy;
    result.metrics["high_freq_ratio"] = totalEnergy > 0.0 ? highEnergy / totalEnergy : 0.0;
    return result;
}

} // namespace VisualAnalysis
