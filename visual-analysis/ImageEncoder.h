#pragma once

#include "AnalysisParameters.h"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace VisualAnalysis {

class AnalysisContext;

// Compresses output arrays into artifacts within a byte budget
class ImageEncoder {
public:
    // One step of the fallback chain. Fills attempt with its best candidate
    // and returns true when that candidate fits the budget.
    using EncodeStep = bool (*)(const cv::Mat& image, const EncodingParams& params, EncodedImage& attempt);

    // PNG -> JPEG quality ladder -> downscale at minimum quality.
    // Accepts CV_8UC1 or RGB CV_8UC3. A final overrun is returned best-effort
    // with withinBudget = false and a warning logged through the context.
    static EncodedImage Encode(
        const cv::Mat& image,
        const std::string& name,
        const EncodingParams& params,
        AnalysisContext& context
    );

    static std::vector<EncodeStep> DefaultChain();

    static bool TryPng(const cv::Mat& image, const EncodingParams& params, EncodedImage& attempt);
    static bool TryJpegLadder(const cv::Mat& image, const EncodingParams& params, EncodedImage& attempt);
    static bool TryDownscale(const cv::Mat& image, const EncodingParams& params, EncodedImage& attempt);

    // File extension for a container, with the leading dot
    static std::string Extension(ImageFormat format);

private:
    // RGB -> BGR for the codec; single channel passes through
    static cv::Mat ToCodecOrder(const cv::Mat& image);

    static std::vector<uchar> EncodeBuffer(const cv::Mat& codecImage, const std::string& ext, const std::vector<int>& flags);
};

} // namespace VisualAnalysis
