#pragma once

#include "AnalysisParameters.h"
#include <opencv2/core.hpp>

namespace VisualAnalysis {

// Shape readability: edges, corner features, frequency content
class ShapeAnalyzer {
public:
    // Canny(50,150) + Sobel magnitude.
    // Maps: canny_edges, sobel_magnitude, edge_heatmap. Metrics: edge_density
    static AnalyzerResult AnalyzeEdges(const cv::Mat& rgb);

    // Harris response, features above 1% of the maximum response.
    // Maps: feature_heatmap, marked_image. Metrics: feature_density, feature_count
    static AnalyzerResult AnalyzeFeatures(const cv::Mat& rgb);

    // Centered log-magnitude spectrum; energy outside a disk of radius
    // 0.3 * min(h, w) around the DC term counts as high frequency.
    // Maps: fft_spectrum, high_freq_heatmap.
    // Metrics: high_freq_energy, high_freq_ratio
    static AnalyzerResult AnalyzeFrequency(const cv::Mat& rgb);

    // log(1 + |F|) with the zero frequency moved to (w/2, h/2)
    static cv::Mat CenteredLogSpectrum(const cv::Mat& gray);

    // Circular shift matching numpy.fft.fftshift for any size
    static cv::Mat FftShift(const cv::Mat& spectrum);
};

} // namespace VisualAnalysis
