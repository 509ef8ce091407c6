#include "ChannelAnalysisSuite.h"
#include "ColorQualityAnalyzer.h"
#include "ShapeAnalyzer.h"
#include "TextureAnalyzer.h"
#include "ValueStructureAnalyzer.h"
#include <future>
#include <stdexcept>

namespace VisualAnalysis {

std::vector<ChannelAnalysisSuite::NamedAnalyzer> ChannelAnalysisSuite::Analyzers(const ContrastParams& contrast) {
    return {
        // Value structure
        {"lab_luminance", ValueStructureAnalyzer::AnalyzeLuminance},
        {"local_contrast", [contrast](const cv::Mat& rgb) {
            return ValueStructureAnalyzer::AnalyzeLocalContrast(rgb, contrast);
        }},
        {"luminance_center", ValueStructureAnalyzer::AnalyzeLuminanceCentroid},

        // Color quality
        {"hue_distribution", ColorQualityAnalyzer::AnalyzeHueDistribution},
        {"saturation_distribution", ColorQualityAnalyzer::AnalyzeSaturation},
        {"desaturated_readability", ColorQualityAnalyzer::AnalyzeDesaturatedReadability},
        {"gamut_shift", ColorQualityAnalyzer::AnalyzeGamutShift},

        // Shape readability
        {"edge_sharpness", ShapeAnalyzer::AnalyzeEdges},
        {"feature_focus", ShapeAnalyzer::AnalyzeFeatures},
        {"frequency_domain", ShapeAnalyzer::AnalyzeFrequency},

        // Texture
        {"texture_orientation", TextureAnalyzer::AnalyzeOrientation},
        {"texture_coherence", [](const cv::Mat& rgb) {
            return TextureAnalyzer::AnalyzeCoherence(rgb);
        }},
    };
}

std::map<std::string, AnalyzerResult> ChannelAnalysisSuite::RunAll(
    const cv::Mat& rgb,
    const ContrastParams& contrast,
    bool parallel
) {
    if (rgb.empty() || rgb.type() != CV_8UC3) {
        throw std::invalid_argument("Expected non-empty CV_8UC3 input for ChannelAnalysisSuite");
    }

    std::vector<NamedAnalyzer> analyzers = Analyzers(contrast);
    std::map<std::string, AnalyzerResult> results;

    if (!parallel) {
        for (const auto& analyzer : analyzers) {
            results[analyzer.name] = analyzer.run(rgb);
        }
        return results;
    }

    std::vector<std::future<AnalyzerResult>> pending;
    pending.reserve(analyzers.size());
    for (const auto& analyzer : analyzers) {
        pending.push_back(std::async(std::launch::async, analyzer.run, std::cref(rgb)));
    }

    // get() rethrows; remaining futures are joined by their destructors
    for (size_t i = 0; i < analyzers.size(); i++) {
        results[analyzers[i].name] = pending[i].get();
    }
    return results;
}

} // namespace VisualAnalysis
