#include "ColorSpaceConverter.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace VisualAnalysis {

void ColorSpaceConverter::RequireRgb(const cv::Mat& rgb, const char* caller) {
    if (rgb.empty() || rgb.type() != CV_8UC3) {
        throw std::invalid_argument(std::string("Expected non-empty CV_8UC3 input for ") + caller);
    }
}

cv::Mat ColorSpaceConverter::RgbToLab(const cv::Mat& rgb) {
    RequireRgb(rgb, "RgbToLab");

    // Float input keeps the full L in [0,100] and a/b ranges
    cv::Mat rgbFloat;
    rgb.convertTo(rgbFloat, CV_32FC3, 1.0 / 255.0);

    cv::Mat lab;
    cv::cvtColor(rgbFloat, lab, cv::COLOR_RGB2Lab);
    return lab;
}

cv::Mat ColorSpaceConverter::LabToRgb(const cv::Mat& lab) {
    if (lab.empty() || lab.type() != CV_32FC3) {
        throw std::invalid_argument("Expected non-empty CV_32FC3 input for LabToRgb");
    }

    cv::Mat rgbFloat;
    cv::cvtColor(lab, rgbFloat, cv::COLOR_Lab2RGB);

    // convertTo rounds and saturates into [0,255]
    cv::Mat rgb;
    rgbFloat.convertTo(rgb, CV_8UC3, 255.0);
    return rgb;
}

cv::Vec3d ColorSpaceConverter::RgbToLab(const cv::Vec3b& rgb) {
    cv::Mat pixel(1, 1, CV_8UC3, cv::Scalar(rgb[0], rgb[1], rgb[2]));
    cv::Vec3f lab = RgbToLab(pixel).at<cv::Vec3f>(0, 0);
    return cv::Vec3d(lab[0], lab[1], lab[2]);
}

cv::Vec3b ColorSpaceConverter::LabToRgb(const cv::Vec3d& lab) {
    cv::Mat pixel(1, 1, CV_32FC3, cv::Scalar(lab[0], lab[1], lab[2]));
    return LabToRgb(pixel).at<cv::Vec3b>(0, 0);
}

cv::Mat ColorSpaceConverter::RgbToHsv(const cv::Mat& rgb) {
    RequireRgb(rgb, "RgbToHsv");
    cv::Mat hsv;
    cv::cvtColor(rgb, hsv, cv::COLOR_RGB2HSV);
    return hsv;
}

cv::Mat ColorSpaceConverter::RgbToHls(const cv::Mat& rgb) {
    RequireRgb(rgb, "RgbToHls");
    cv::Mat hls;
    cv::cvtColor(rgb, hls, cv::COLOR_RGB2HLS);
    return hls;
}

cv::Mat ColorSpaceConverter::Luma(const cv::Mat& rgb) {
    RequireRgb(rgb, "Luma");

    cv::Mat luma(rgb.size(), CV_8UC1);
    for (int y = 0; y < rgb.rows; y++) {
        const cv::Vec3b* src = rgb.ptr<cv::Vec3b>(y);
        uchar* dst = luma.ptr<uchar>(y);
        for (int x = 0; x < rgb.cols; x++) {
            double value = 0.299 * src[x][0] + 0.587 * src[x][1] + 0.114 * src[x][2];
            dst[x] = static_cast<uchar>(std::min(255.0, value));
        }
    }
    return luma;
}

cv::Mat ColorSpaceConverter::Gray(const cv::Mat& rgb) {
    RequireRgb(rgb, "Gray");
    cv::Mat gray;
    cv::cvtColor(rgb, gray, cv::COLOR_RGB2GRAY);
    return gray;
}

cv::Mat ColorSpaceConverter::LabLightness(const cv::Mat& lab) {
    if (lab.empty() || lab.type() != CV_32FC3) {
        throw std::invalid_argument("Expected non-empty CV_32FC3 input for LabLightness");
    }
    cv::Mat lightness;
    cv::extractChannel(lab, lightness, 0);
    return lightness;
}

cv::Mat ColorSpaceConverter::LabLightness8U(const cv::Mat& lab) {
    cv::Mat lightness = LabLightness(lab);

    cv::Mat out(lightness.size(), CV_8UC1);
    for (int y = 0; y < lightness.rows; y++) {
        const float* src = lightness.ptr<float>(y);
        uchar* dst = out.ptr<uchar>(y);
        for (int x = 0; x < lightness.cols; x++) {
            double value = src[x] / 100.0 * 255.0;
            dst[x] = static_cast<uchar>(std::max(0.0, std::min(255.0, value)));
        }
    }
    return out;
}

} // namespace VisualAnalysis
