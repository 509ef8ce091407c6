#include "ColorBinning.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace VisualAnalysis {

namespace {
    int ClampBand(double scaled, int bands) {
        int band = static_cast<int>(scaled);
        return std::max(0, std::min(bands - 1, band));
    }
}

BinKey ColorBinning::KeyFor(const cv::Vec3f& lab, const ColorMaxParams& params) {
    const double L = lab[0];
    const double a = lab[1];
    const double b = lab[2];

    double hueAngle = std::atan2(b, a) * 180.0 / M_PI + 180.0;
    double chroma = std::sqrt(a * a + b * b);

    BinKey key;
    key.lightness = ClampBand(L / 100.0 * params.lightnessBands, params.lightnessBands);
    key.hue = ClampBand(hueAngle / 360.0 * params.hueBands, params.hueBands);
    key.chroma = ClampBand(chroma / params.chromaBandWidth, params.chromaBands);
    return key;
}

int ColorBinning::SamplingStride(int64_t pixelCount, int samplingTarget) {
    if (samplingTarget <= 0) {
        throw std::invalid_argument("samplingTarget must be positive");
    }
    int stride = static_cast<int>(std::sqrt(static_cast<double>(pixelCount)) / samplingTarget);
    return std::max(1, stride);
}

BinMap ColorBinning::Accumulate(
    const cv::Mat& lab,
    int stride,
    const ColorMaxParams& params,
    int64_t& sampledPixels
) {
    if (lab.type() != CV_32FC3) {
        throw std::invalid_argument("Expected CV_32FC3 Lab input for Accumulate");
    }

    BinMap bins;
    sampledPixels = 0;

    // Flat row-major stride, so the sampling phase crosses row boundaries
    const int64_t total = static_cast<int64_t>(lab.rows) * lab.cols;
    const int cols = lab.cols;
    for (int64_t index = 0; index < total; index += stride) {
        const cv::Vec3f& pixel = lab.at<cv::Vec3f>(static_cast<int>(index / cols), static_cast<int>(index % cols));
        ColorBin& bin = bins[KeyFor(pixel, params)];
        bin.labSum += cv::Vec3d(pixel[0], pixel[1], pixel[2]);
        bin.count++;
        sampledPixels++;
    }
    return bins;
}

void ColorBinning::Flatten(
    const BinMap& bins,
    std::vector<BinKey>& keys,
    std::vector<cv::Vec3d>& centers,
    std::vector<int64_t>& counts
) {
    keys.clear();
    centers.clear();
    counts.clear();
    keys.reserve(bins.size());
    centers.reserve(bins.size());
    counts.reserve(bins.size());

    for (const auto& entry : bins) {
        keys.push_back(entry.first);
        centers.push_back(entry.second.Mean());
        counts.push_back(entry.second.count);
    }
}

} // namespace VisualAnalysis
