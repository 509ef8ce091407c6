#pragma once

#include "AnalysisParameters.h"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace VisualAnalysis {

struct NormalizedImage {
    cv::Mat rgb;                     // CV_8UC3, R,G,B order
    ImageFormat format = ImageFormat::UNKNOWN;
    cv::Size sourceSize;             // Header dimensions before orientation/resize
    int orientation = 1;             // EXIF orientation that was applied (1 = none)
    bool hadAlpha = false;
};

class ImageNormalizer {
public:
    // Decode, orient, flatten and bound an encoded image.
    // Throws UnsupportedFormatError, ImageTooLargeError or DecodeError.
    static NormalizedImage Normalize(
        const std::vector<uchar>& encoded,
        const NormalizerParams& params
    );

    // Read a file into memory for Normalize()
    static std::vector<uchar> LoadFile(const std::string& path);

    // Sniff the container from its magic bytes
    static ImageFormat DetectFormat(const std::vector<uchar>& encoded);

    // Width/height from the container header, without decoding pixels
    static cv::Size ReadDimensions(const std::vector<uchar>& encoded, ImageFormat format);

    // EXIF orientation tag (1-8), 1 when absent
    static int ReadExifOrientation(const std::vector<uchar>& encoded, ImageFormat format);

    static cv::Mat ApplyOrientation(const cv::Mat& image, int orientation);

    // Downscale only; longer side becomes maxSide, shorter side truncated
    static cv::Mat BoundSize(const cv::Mat& rgb, int maxSide);

    // Any depth / channel layout from imdecode to RGB CV_8UC3, alpha over white
    static cv::Mat ToRgb(const cv::Mat& decoded, bool& hadAlpha);

private:
    static cv::Size ReadJpegDimensions(const std::vector<uchar>& data);
    static cv::Size ReadPngDimensions(const std::vector<uchar>& data);
    static cv::Size ReadGifDimensions(const std::vector<uchar>& data);
    static cv::Size ReadWebpDimensions(const std::vector<uchar>& data);

    // TIFF-structured EXIF block -> orientation tag
    static int ParseTiffOrientation(const uchar* data, size_t size);
};

} // namespace VisualAnalysis
