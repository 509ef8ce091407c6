#include "ImageEncoder.h"
#include "AnalysisContext.h"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace VisualAnalysis {

cv::Mat ImageEncoder::ToCodecOrder(const cv::Mat& image) {
    if (image.type() == CV_8UC1) {
        return image;
    }
    if (image.type() == CV_8UC3) {
        cv::Mat bgr;
        cv::cvtColor(image, bgr, cv::COLOR_RGB2BGR);
        return bgr;
    }
    throw std::invalid_argument("Expected CV_8UC1 or CV_8UC3 image for encoding");
}

std::vector<uchar> ImageEncoder::EncodeBuffer(
    const cv::Mat& codecImage,
    const std::string& ext,
    const std::vector<int>& flags
) {
    std::vector<uchar> buffer;
    if (!cv::imencode(ext, codecImage, buffer, flags)) {
        throw std::runtime_error("Failed to encode image as " + ext);
    }
    return buffer;
}

std::string ImageEncoder::Extension(ImageFormat format) {
    switch (format) {
        case ImageFormat::JPEG: return ".jpg";
        case ImageFormat::PNG: return ".png";
        case ImageFormat::WEBP: return ".webp";
        case ImageFormat::GIF: return ".gif";
        default: return ".bin";
    }
}

bool ImageEncoder::TryPng(const cv::Mat& image, const EncodingParams& params, EncodedImage& attempt) {
    attempt.format = ImageFormat::PNG;
    attempt.quality = 100;
    attempt.size = image.size();
    attempt.bytes = EncodeBuffer(ToCodecOrder(image), ".png", {cv::IMWRITE_PNG_COMPRESSION, params.pngCompression});
    return attempt.bytes.size() <= params.maxBytes;
}

bool ImageEncoder::TryJpegLadder(const cv::Mat& image, const EncodingParams& params, EncodedImage& attempt) {
    cv::Mat codecImage = ToCodecOrder(image);
    for (int quality = params.jpegStartQuality; quality >= params.jpegMinQuality; quality -= params.jpegQualityStep) {
        attempt.format = ImageFormat::JPEG;
        attempt.quality = quality;
        attempt.size = image.size();
        attempt.bytes = EncodeBuffer(codecImage, ".jpg", {cv::IMWRITE_JPEG_QUALITY, quality});
        if (attempt.bytes.size() <= params.maxBytes) {
            return true;
        }
        if (params.jpegQualityStep <= 0) break;
    }
    return false;
}

bool ImageEncoder::TryDownscale(const cv::Mat& image, const EncodingParams& params, EncodedImage& attempt) {
    // Scale from the size of the last failed attempt
    double lastSize = static_cast<double>(std::max<size_t>(attempt.bytes.size(), 1));
    double scale = std::sqrt(static_cast<double>(params.maxBytes) / lastSize);

    int width = std::max(params.minSide, static_cast<int>(image.cols * scale));
    int height = std::max(params.minSide, static_cast<int>(image.rows * scale));

    cv::Mat resized;
    cv::resize(image, resized, cv::Size(width, height), 0, 0, cv::INTER_LANCZOS4);

    attempt.format = ImageFormat::JPEG;
    attempt.quality = params.jpegMinQuality;
    attempt.size = resized.size();
    attempt.bytes = EncodeBuffer(ToCodecOrder(resized), ".jpg", {cv::IMWRITE_JPEG_QUALITY, params.jpegMinQuality});
    return attempt.bytes.size() <= params.maxBytes;
}

std::vector<ImageEncoder::EncodeStep> ImageEncoder::DefaultChain() {
    return {&ImageEncoder::TryPng, &ImageEncoder::TryJpegLadder, &ImageEncoder::TryDownscale};
}

EncodedImage ImageEncoder::Encode(
    const cv::Mat& image,
    const std::string& name,
    const EncodingParams& params,
    AnalysisContext& context
) {
    if (image.empty()) {
        throw std::invalid_argument("Cannot encode empty image '" + name + "'");
    }

    EncodedImage attempt;
    attempt.name = name;
    for (EncodeStep step : DefaultChain()) {
        if (step(image, params, attempt)) {
            attempt.withinBudget = true;
            return attempt;
        }
    }

    attempt.withinBudget = false;
    context.Warn("Artifact '" + name + "' is " + std::to_string(attempt.bytes.size()) +
                 " bytes, over the " + std::to_string(params.maxBytes) + " byte budget");
    return attempt;
}

} // namespace VisualAnalysis
