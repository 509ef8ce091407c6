#pragma once

#include "AnalysisParameters.h"
#include <opencv2/core.hpp>
#include <cstdint>
#include <map>
#include <vector>

namespace VisualAnalysis {

// Identity of one perceptual cell: lightness band, hue-angle band, chroma band
struct BinKey {
    int lightness = 0;
    int hue = 0;
    int chroma = 0;

    bool operator==(const BinKey& other) const {
        return lightness == other.lightness && hue == other.hue && chroma == other.chroma;
    }
    bool operator!=(const BinKey& other) const { return !(*this == other); }

    // Lexicographic: lightness, then hue, then chroma
    bool operator<(const BinKey& other) const {
        if (lightness != other.lightness) return lightness < other.lightness;
        if (hue != other.hue) return hue < other.hue;
        return chroma < other.chroma;
    }
};

// Running Lab sum and population of one bin
struct ColorBin {
    cv::Vec3d labSum = cv::Vec3d(0, 0, 0);
    int64_t count = 0;

    cv::Vec3d Mean() const {
        return count > 0 ? labSum * (1.0 / static_cast<double>(count)) : labSum;
    }
};

using BinMap = std::map<BinKey, ColorBin>;

class ColorBinning {
public:
    // L in [0,100] over lightnessBands; atan2(b,a) shifted to [0,360) over
    // hueBands; chroma / chromaBandWidth. Every band is clamped to range.
    static BinKey KeyFor(const cv::Vec3f& lab, const ColorMaxParams& params);

    // max(1, int(sqrt(pixelCount) / samplingTarget))
    static int SamplingStride(int64_t pixelCount, int samplingTarget);

    // Bin every stride-th pixel of a CV_32FC3 Lab buffer in row-major order.
    // sampledPixels receives the number of pixels visited.
    static BinMap Accumulate(
        const cv::Mat& lab,
        int stride,
        const ColorMaxParams& params,
        int64_t& sampledPixels
    );

    // Bin means in key order, with the matching keys and counts
    static void Flatten(
        const BinMap& bins,
        std::vector<BinKey>& keys,
        std::vector<cv::Vec3d>& centers,
        std::vector<int64_t>& counts
    );
};

} // namespace VisualAnalysis
