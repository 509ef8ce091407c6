#include "ImageNormalizer.h"
#include "AnalysisErrors.h"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <limits>

namespace VisualAnalysis {

namespace {
    uint32_t ReadBE16(const uchar* p) { return (uint32_t(p[0]) << 8) | p[1]; }
    uint32_t ReadBE32(const uchar* p) {
        return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | p[3];
    }
    uint32_t ReadLE16(const uchar* p) { return uint32_t(p[0]) | (uint32_t(p[1]) << 8); }
    uint32_t ReadLE24(const uchar* p) {
        return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16);
    }
    uint32_t ReadLE32(const uchar* p) {
        return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) | (uint32_t(p[3]) << 24);
    }

    // Header fields wider than int saturate so the size gate still sees them
    int ToDimension(uint32_t value) {
        const uint32_t ceiling = static_cast<uint32_t>(std::numeric_limits<int>::max());
        return static_cast<int>(std::min(value, ceiling));
    }

    bool HasPrefix(const std::vector<uchar>& data, size_t offset, const char* tag, size_t length) {
        return data.size() >= offset + length && std::memcmp(data.data() + offset, tag, length) == 0;
    }

    bool IsJpegStandalone(uchar marker) {
        return marker == 0xD8 || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7);
    }

    bool IsJpegFrameMarker(uchar marker) {
        return marker >= 0xC0 && marker <= 0xCF &&
               marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
    }

    // Calls visit(marker, payload, payloadSize) per JPEG segment until it returns true
    template <typename Visitor>
    bool WalkJpegSegments(const std::vector<uchar>& data, Visitor visit) {
        size_t pos = 2;
        const size_t size = data.size();
        while (pos < size) {
            if (data[pos] != 0xFF) return false;
            while (pos < size && data[pos] == 0xFF) pos++;
            if (pos >= size) return false;

            uchar marker = data[pos++];
            if (IsJpegStandalone(marker)) continue;
            if (marker == 0xD9 || marker == 0xDA) return false;
            if (pos + 2 > size) return false;

            size_t length = ReadBE16(&data[pos]);
            if (length < 2 || pos + length > size) return false;
            if (visit(marker, data.data() + pos + 2, length - 2)) return true;
            pos += length;
        }
        return false;
    }

    // Calls visit(fourcc, payload, payloadSize) per RIFF chunk of a WEBP file
    template <typename Visitor>
    bool WalkWebpChunks(const std::vector<uchar>& data, Visitor visit) {
        size_t pos = 12;
        while (pos + 8 <= data.size()) {
            std::string fourcc(reinterpret_cast<const char*>(&data[pos]), 4);
            size_t length = ReadLE32(&data[pos + 4]);
            if (pos + 8 + length > data.size()) return false;
            if (visit(fourcc, data.data() + pos + 8, length)) return true;
            pos += 8 + length + (length & 1);
        }
        return false;
    }
}

std::vector<uchar> ImageNormalizer::LoadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open image file: " + path);
    }
    return std::vector<uchar>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

ImageFormat ImageNormalizer::DetectFormat(const std::vector<uchar>& encoded) {
    static const uchar kPngSignature[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

    if (encoded.size() >= 3 && encoded[0] == 0xFF && encoded[1] == 0xD8 && encoded[2] == 0xFF) {
        return ImageFormat::JPEG;
    }
    if (encoded.size() >= 8 && std::memcmp(encoded.data(), kPngSignature, 8) == 0) {
        return ImageFormat::PNG;
    }
    if (HasPrefix(encoded, 0, "GIF87a", 6) || HasPrefix(encoded, 0, "GIF89a", 6)) {
        return ImageFormat::GIF;
    }
    if (HasPrefix(encoded, 0, "RIFF", 4) && HasPrefix(encoded, 8, "WEBP", 4)) {
        return ImageFormat::WEBP;
    }
    return ImageFormat::UNKNOWN;
}

cv::Size ImageNormalizer::ReadJpegDimensions(const std::vector<uchar>& data) {
    cv::Size size;
    bool found = WalkJpegSegments(data, [&size](uchar marker, const uchar* payload, size_t length) {
        if (!IsJpegFrameMarker(marker) || length < 5) return false;
        // precision(1) height(2) width(2)
        size.height = static_cast<int>(ReadBE16(payload + 1));
        size.width = static_cast<int>(ReadBE16(payload + 3));
        return true;
    });
    if (!found) {
        throw DecodeError("JPEG header carries no frame dimensions");
    }
    return size;
}

cv::Size ImageNormalizer::ReadPngDimensions(const std::vector<uchar>& data) {
    if (data.size() < 24 || !HasPrefix(data, 12, "IHDR", 4)) {
        throw DecodeError("PNG header is truncated");
    }
    return cv::Size(ToDimension(ReadBE32(&data[16])), ToDimension(ReadBE32(&data[20])));
}

cv::Size ImageNormalizer::ReadGifDimensions(const std::vector<uchar>& data) {
    if (data.size() < 10) {
        throw DecodeError("GIF header is truncated");
    }
    return cv::Size(static_cast<int>(ReadLE16(&data[6])), static_cast<int>(ReadLE16(&data[8])));
}

cv::Size ImageNormalizer::ReadWebpDimensions(const std::vector<uchar>& data) {
    if (data.size() < 30) {
        throw DecodeError("WEBP header is truncated");
    }

    if (HasPrefix(data, 12, "VP8X", 4)) {
        return cv::Size(static_cast<int>(ReadLE24(&data[24])) + 1,
                        static_cast<int>(ReadLE24(&data[27])) + 1);
    }
    if (HasPrefix(data, 12, "VP8L", 4)) {
        const uchar* b = &data[21];
        int width = 1 + (((b[1] & 0x3F) << 8) | b[0]);
        int height = 1 + (((b[3] & 0x0F) << 10) | (b[2] << 2) | ((b[1] & 0xC0) >> 6));
        return cv::Size(width, height);
    }
    if (HasPrefix(data, 12, "VP8 ", 4)) {
        // 3-byte frame tag, 3-byte start code, then 14-bit sizes
        return cv::Size(static_cast<int>(ReadLE16(&data[26]) & 0x3FFF),
                        static_cast<int>(ReadLE16(&data[28]) & 0x3FFF));
    }
    throw DecodeError("WEBP header has no VP8/VP8L/VP8X chunk");
}

cv::Size ImageNormalizer::ReadDimensions(const std::vector<uchar>& encoded, ImageFormat format) {
    switch (format) {
        case ImageFormat::JPEG: return ReadJpegDimensions(encoded);
        case ImageFormat::PNG: return ReadPngDimensions(encoded);
        case ImageFormat::GIF: return ReadGifDimensions(encoded);
        case ImageFormat::WEBP: return ReadWebpDimensions(encoded);
        case ImageFormat::UNKNOWN: break;
    }
    throw UnsupportedFormatError("Unsupported image format");
}

int ImageNormalizer::ParseTiffOrientation(const uchar* data, size_t size) {
    if (size < 8) return 1;

    bool littleEndian;
    if (data[0] == 'I' && data[1] == 'I') {
        littleEndian = true;
    } else if (data[0] == 'M' && data[1] == 'M') {
        littleEndian = false;
    } else {
        return 1;
    }

    auto read16 = [&](size_t offset) { return littleEndian ? ReadLE16(data + offset) : ReadBE16(data + offset); };
    auto read32 = [&](size_t offset) { return littleEndian ? ReadLE32(data + offset) : ReadBE32(data + offset); };

    size_t ifd = read32(4);
    if (ifd + 2 > size) return 1;

    size_t count = read16(ifd);
    for (size_t i = 0; i < count; i++) {
        size_t entry = ifd + 2 + i * 12;
        if (entry + 12 > size) break;
        if (read16(entry) == 0x0112) {
            int value = static_cast<int>(read16(entry + 8));
            return (value >= 1 && value <= 8) ? value : 1;
        }
    }
    return 1;
}

int ImageNormalizer::ReadExifOrientation(const std::vector<uchar>& encoded, ImageFormat format) {
    int orientation = 1;

    switch (format) {
        case ImageFormat::JPEG:
            WalkJpegSegments(encoded, [&orientation](uchar marker, const uchar* payload, size_t length) {
                if (marker != 0xE1 || length < 14 || std::memcmp(payload, "Exif\0\0", 6) != 0) return false;
                orientation = ParseTiffOrientation(payload + 6, length - 6);
                return true;
            });
            break;

        case ImageFormat::PNG: {
            size_t pos = 8;
            while (pos + 12 <= encoded.size()) {
                size_t length = ReadBE32(&encoded[pos]);
                if (pos + 12 + length > encoded.size()) break;
                if (std::memcmp(&encoded[pos + 4], "eXIf", 4) == 0) {
                    orientation = ParseTiffOrientation(encoded.data() + pos + 8, length);
                    break;
                }
                if (std::memcmp(&encoded[pos + 4], "IEND", 4) == 0) break;
                pos += 12 + length;
            }
            break;
        }

        case ImageFormat::WEBP:
            WalkWebpChunks(encoded, [&orientation](const std::string& fourcc, const uchar* payload, size_t length) {
                if (fourcc != "EXIF") return false;
                if (length >= 6 && std::memcmp(payload, "Exif\0\0", 6) == 0) {
                    payload += 6;
                    length -= 6;
                }
                orientation = ParseTiffOrientation(payload, length);
                return true;
            });
            break;

        case ImageFormat::GIF:
        case ImageFormat::UNKNOWN:
            break;
    }
    return orientation;
}

cv::Mat ImageNormalizer::ApplyOrientation(const cv::Mat& image, int orientation) {
    cv::Mat out;
    switch (orientation) {
        case 2:
            cv::flip(image, out, 1);
            break;
        case 3:
            cv::rotate(image, out, cv::ROTATE_180);
            break;
        case 4:
            cv::flip(image, out, 0);
            break;
        case 5:
            cv::transpose(image, out);
            break;
        case 6:
            cv::rotate(image, out, cv::ROTATE_90_CLOCKWISE);
            break;
        case 7:
            cv::transpose(image, out);
            cv::flip(out, out, -1);
            break;
        case 8:
            cv::rotate(image, out, cv::ROTATE_90_COUNTERCLOCKWISE);
            break;
        default:
            out = image;
            break;
    }
    return out;
}

cv::Mat ImageNormalizer::ToRgb(const cv::Mat& decoded, bool& hadAlpha) {
    hadAlpha = false;

    cv::Mat eightBit;
    switch (decoded.depth()) {
        case CV_8U:
            eightBit = decoded;
            break;
        case CV_16U:
            decoded.convertTo(eightBit, CV_8U, 1.0 / 257.0);
            break;
        case CV_32F:
            decoded.convertTo(eightBit, CV_8U, 255.0);
            break;
        default:
            throw DecodeError("Unsupported sample depth");
    }

    cv::Mat rgb;
    switch (eightBit.channels()) {
        case 1:
            cv::cvtColor(eightBit, rgb, cv::COLOR_GRAY2RGB);
            break;
        case 3:
            cv::cvtColor(eightBit, rgb, cv::COLOR_BGR2RGB);
            break;
        case 4: {
            hadAlpha = true;
            // Alpha composite over white
            rgb.create(eightBit.size(), CV_8UC3);
            for (int y = 0; y < eightBit.rows; y++) {
                const cv::Vec4b* src = eightBit.ptr<cv::Vec4b>(y);
                cv::Vec3b* dst = rgb.ptr<cv::Vec3b>(y);
                for (int x = 0; x < eightBit.cols; x++) {
                    double alpha = src[x][3] / 255.0;
                    for (int c = 0; c < 3; c++) {
                        // BGRA in, RGB out
                        double value = src[x][2 - c] * alpha + 255.0 * (1.0 - alpha);
                        dst[x][c] = cv::saturate_cast<uchar>(value);
                    }
                }
            }
            break;
        }
        default:
            throw DecodeError("Unsupported channel count: " + std::to_string(eightBit.channels()));
    }
    return rgb;
}

cv::Mat ImageNormalizer::BoundSize(const cv::Mat& rgb, int maxSide) {
    if (maxSide <= 0) {
        throw std::invalid_argument("maxSide must be positive");
    }

    int width = rgb.cols;
    int height = rgb.rows;
    if (std::max(width, height) <= maxSide) {
        return rgb;
    }

    int newWidth;
    int newHeight;
    if (width >= height) {
        newWidth = maxSide;
        newHeight = static_cast<int>(height * (static_cast<double>(maxSide) / width));
    } else {
        newHeight = maxSide;
        newWidth = static_cast<int>(width * (static_cast<double>(maxSide) / height));
    }
    newWidth = std::max(1, newWidth);
    newHeight = std::max(1, newHeight);

    cv::Mat resized;
    cv::resize(rgb, resized, cv::Size(newWidth, newHeight), 0, 0, cv::INTER_LANCZOS4);
    return resized;
}

NormalizedImage ImageNormalizer::Normalize(
    const std::vector<uchar>& encoded,
    const NormalizerParams& params
) {
    NormalizedImage result;

    // 1. Whitelist by magic bytes
    result.format = DetectFormat(encoded);
    if (result.format == ImageFormat::UNKNOWN) {
        throw UnsupportedFormatError("Unsupported image format (expected JPEG, PNG, WEBP or GIF)");
    }

    // 2. Size ceiling from the header, before any pixel decoding
    result.sourceSize = ReadDimensions(encoded, result.format);
    if (result.sourceSize.width > params.maxDimension || result.sourceSize.height > params.maxDimension) {
        throw ImageTooLargeError(result.sourceSize.width, result.sourceSize.height, params.maxDimension);
    }
    if (result.sourceSize.width <= 0 || result.sourceSize.height <= 0) {
        throw DecodeError("Image header reports an empty frame");
    }

    // 3. Decode; UNCHANGED keeps alpha and leaves orientation to us
    cv::Mat decoded = cv::imdecode(encoded, cv::IMREAD_UNCHANGED);
    if (decoded.empty() && result.format == ImageFormat::GIF) {
        // GIF reading only exists in OpenCV 4.11+ built with the GIF codec
        throw UnsupportedFormatError("Could not decode GIF payload (needs OpenCV 4.11+ with GIF support)");
    }
    if (decoded.empty()) {
        throw DecodeError(std::string("Could not decode ") + ToString(result.format) + " payload");
    }

    // 4. Orientation before any geometry
    if (params.applyExifOrientation) {
        result.orientation = ReadExifOrientation(encoded, result.format);
        decoded = ApplyOrientation(decoded, result.orientation);
    }

    // 5. Flatten to RGB
    cv::Mat rgb = ToRgb(decoded, result.hadAlpha);
    decoded.release();

    // 6. Bound the working resolution
    result.rgb = BoundSize(rgb, params.maxSide);
    return result;
}

} // namespace VisualAnalysis
