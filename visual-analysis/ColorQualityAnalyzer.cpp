#include "ColorQualityAnalyzer.h"
#include "ColorSpaceConverter.h"
#include "MapRenderer.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <numeric>

namespace VisualAnalysis {

std::vector<int> ColorQualityAnalyzer::HueHistogram(const cv::Mat& hue) {
    std::vector<int> histogram(kHueHistogramBins, 0);
    const double binWidth = 180.0 / kHueHistogramBins;

    for (int y = 0; y < hue.rows; y++) {
        const uchar* row = hue.ptr<uchar>(y);
        for (int x = 0; x < hue.cols; x++) {
            int bin = static_cast<int>(row[x] / binWidth);
            histogram[std::min(bin, kHueHistogramBins - 1)]++;
        }
    }
    return histogram;
}

cv::Mat ColorQualityAnalyzer::HueVisualization(const cv::Mat& hue) {
    cv::Mat scaled(hue.size(), CV_8UC1);
    for (int y = 0; y < hue.rows; y++) {
        const uchar* src = hue.ptr<uchar>(y);
        uchar* dst = scaled.ptr<uchar>(y);
        for (int x = 0; x < hue.cols; x++) {
            dst[x] = static_cast<uchar>(std::min(255.0, src[x] / 179.0 * 255.0));
        }
    }
    return MapRenderer::ApplyColorMapRgb(scaled, cv::COLORMAP_HSV);
}

AnalyzerResult ColorQualityAnalyzer::AnalyzeHueDistribution(const cv::Mat& rgb) {
    cv::Mat hsv = ColorSpaceConverter::RgbToHsv(rgb);
    cv::Mat hue;
    cv::extractChannel(hsv, hue, 0);

    std::vector<int> histogram = HueHistogram(hue);

    // Five most populated buckets, ties resolved toward the lower hue
    std::vector<int> order(histogram.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
        [&histogram](int a, int b) { return histogram[a] > histogram[b]; });

    const double binWidth = 180.0 / kHueHistogramBins;
    std::vector<double> dominantHues;
    for (size_t i = 0; i < 5 && i < order.size(); i++) {
        dominantHues.push_back(order[i] * binWidth);
    }

    AnalyzerResult result;
    result.maps["hue_map"] = HueVisualization(hue);
    result.maps["hue_channel"] = hue;
    result.series["hue_histogram"] = std::vector<double>(histogram.begin(), histogram.end());
    result.series["dominant_hues"] = dominantHues;
    return result;
}

AnalyzerResult ColorQualityAnalyzer::AnalyzeSaturation(const cv::Mat& rgb) {
    cv::Mat hsv = ColorSpaceConverter::RgbToHsv(rgb);
    cv::Mat saturation;
    cv::extractChannel(hsv, saturation, 1);

    // Saturation blended over mid-gray with itself as alpha
    cv::Mat blended(saturation.size(), CV_8UC1);
    for (int y = 0; y < saturation.rows; y++) {
        const uchar* src = saturation.ptr<uchar>(y);
        uchar* dst = blended.ptr<uchar>(y);
        for (int x = 0; x < saturation.cols; x++) {
            double alpha = src[x] / 255.0;
            dst[x] = static_cast<uchar>(128.0 * (1.0 - alpha) + src[x] * alpha);
        }
    }

    AnalyzerResult result;
    result.maps["saturation_map"] = MapRenderer::GrayToRgb(blended);
    result.maps["saturation_channel"] = saturation;
    result.metrics["mean_saturation"] = cv::mean(saturation)[0];
    result.metrics["high_saturation_ratio"] = MapRenderer::MaskRatio(saturation > 200);
    return result;
}

AnalyzerResult ColorQualityAnalyzer::AnalyzeDesaturatedReadability(const cv::Mat& rgb) {
    const cv::Size window(7, 7);

    cv::Mat lab = ColorSpaceConverter::RgbToLab(rgb);
    cv::Mat lightness8u = ColorSpaceConverter::LabLightness8U(lab);
    lab.release();

    cv::Mat hsv = ColorSpaceConverter::RgbToHsv(rgb);
    cv::Mat hue8u, hue;
    cv::extractChannel(hsv, hue8u, 0);
    hue8u.convertTo(hue, CV_32F);

    cv::Mat lightness;
    lightness8u.convertTo(lightness, CV_32F);

    cv::Mat localMean, localMeanSq;
    cv::boxFilter(lightness, localMean, CV_32F, window, cv::Point(-1, -1), true, cv::BORDER_REFLECT);
    cv::boxFilter(lightness.mul(lightness), localMeanSq, CV_32F, window, cv::Point(-1, -1), true, cv::BORDER_REFLECT);
    cv::Mat localVariance = localMeanSq - localMean.mul(localMean);
    cv::max(localVariance, 0.0, localVariance);
    cv::Mat localStd;
    cv::sqrt(localVariance, localStd);

    cv::Mat hueMean, hueMeanSq;
    cv::boxFilter(hue, hueMean, CV_32F, window, cv::Point(-1, -1), true, cv::BORDER_REFLECT);
    cv::boxFilter(hue.mul(hue), hueMeanSq, CV_32F, window, cv::Point(-1, -1), true, cv::BORDER_REFLECT);
    cv::Mat hueVariance = hueMeanSq - hueMean.mul(hueMean);

    cv::Mat conflict = (localStd < 10.0) & (hueVariance > 50.0);

    cv::Mat marked = MapRenderer::GrayToRgb(lightness8u);
    MapRenderer::Paint(marked, conflict, cv::Vec3b(255, 0, 0));

    AnalyzerResult result;
    result.maps["grayscale"] = lightness8u;
    result.maps["conflict_marked"] = marked;
    result.metrics["conflict_ratio"] = MapRenderer::MaskRatio(conflict);
    return result;
}

AnalyzerResult ColorQualityAnalyzer::AnalyzeGamutShift(const cv::Mat& rgb) {
    cv::Mat hsv = ColorSpaceConverter::RgbToHsv(rgb);
    std::vector<cv::Mat> channels;
    cv::split(hsv, channels);
    const cv::Mat& saturation = channels[1];
    const cv::Mat& value = channels[2];

    cv::Mat overexposed = value > 250;
    cv::Mat underexposed = value < 10;
    cv::Mat oversaturated = saturation > 240;

    // Later marks win where masks overlap
    cv::Mat marked = rgb.clone();
    MapRenderer::Paint(marked, overexposed, cv::Vec3b(255, 255, 0));
    MapRenderer::Paint(marked, underexposed, cv::Vec3b(0, 0, 255));
    MapRenderer::Paint(marked, oversaturated, cv::Vec3b(255, 0, 255));

    AnalyzerResult result;
    result.maps["marked_image"] = marked;
    result.metrics["overexposed_ratio"] = MapRenderer::MaskRatio(overexposed);
    result.metrics["underexposed_ratio"] = MapRenderer::MaskRatio(underexposed);
    result.metrics["oversaturated_ratio"] = MapRenderer::MaskRatio(oversaturated);
    return result;
}

} // namespace VisualAnalysis
