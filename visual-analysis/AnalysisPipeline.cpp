#include "AnalysisPipeline.h"
#include "AnalysisContext.h"
#include "ColorMaxEngine.h"
#include "ColorQualityAnalyzer.h"
#include "ColorSpaceConverter.h"
#include "ImageEncoder.h"
#include "ImageNormalizer.h"
#include <opencv2/imgproc.hpp>
#include <chrono>
#include <stdexcept>

namespace VisualAnalysis {

namespace {
    using Clock = std::chrono::high_resolution_clock;

    double ElapsedMs(Clock::time_point start) {
        return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    }

    // Progress reported once a stage has finished
    const int kProgressDecoded = 30;
    const int kProgressStep1 = 40;
    const int kProgressStep2 = 55;
    const int kProgressStep3 = 65;
    const int kProgressStep4 = 70;
    const int kProgressClusteringStarted = 72;
    const int kProgressClustered = 85;
    const int kProgressStep5 = 92;
    const int kProgressComplete = 100;
}

std::string AnalysisPipeline::SegmentationArtifactName(int targetClusters) {
    return "colormax_segmentation_" + std::to_string(targetClusters);
}

cv::Mat AnalysisPipeline::QuantizeLevels(
    const cv::Mat& gray,
    const std::vector<int>& thresholds,
    const std::vector<uchar>& levels
) {
    if (gray.type() != CV_8UC1) {
        throw std::invalid_argument("Expected CV_8UC1 input for QuantizeLevels");
    }
    if (levels.size() != thresholds.size() + 1) {
        throw std::invalid_argument("QuantizeLevels needs one more level than thresholds");
    }

    cv::Mat lut(1, 256, CV_8U);
    for (int value = 0; value < 256; value++) {
        size_t band = 0;
        while (band < thresholds.size() && value >= thresholds[band]) band++;
        lut.at<uchar>(0, value) = levels[band];
    }

    cv::Mat quantized;
    cv::LUT(gray, lut, quantized);
    return quantized;
}

void AnalysisPipeline::Enter(RunState& state, PipelineStage stage, AnalysisContext& context) {
    // A cancelled run fails at the stage it was about to enter
    state.stage = stage;
    context.ThrowIfCancelled(stage);
    context.Debug(std::string("Entering ") + ToString(stage));
}

void AnalysisPipeline::Store(
    RunState& state,
    const std::string& name,
    const cv::Mat& image,
    const EncodingParams& params,
    AnalysisContext& context
) {
    auto start = Clock::now();
    state.images[name] = ImageEncoder::Encode(image, name, params, context);
    state.encodingMs += ElapsedMs(start);
}

void AnalysisPipeline::ExecuteTonalThresholds(
    const cv::Mat& rgb,
    int threshold,
    RunState& state,
    const EncodingParams& encoding,
    AnalysisContext& context,
    double& timingMs
) {
    auto start = Clock::now();

    cv::Mat gray = ColorSpaceConverter::Gray(rgb);

    cv::Mat binary;
    cv::threshold(gray, binary, threshold, 255, cv::THRESH_BINARY);

    cv::Mat gray3 = QuantizeLevels(gray, {85, 170}, {0, 127, 255});
    cv::Mat gray4 = QuantizeLevels(gray, {64, 128, 192}, {0, 85, 170, 255});
    gray.release();

    timingMs = ElapsedMs(start);

    Store(state, "binary", binary, encoding, context);
    Store(state, "grayscale_3_level", gray3, encoding, context);
    Store(state, "grayscale_4_level", gray4, encoding, context);
}

void AnalysisPipeline::ExecuteLuminance(
    const cv::Mat& rgb,
    RunState& state,
    const EncodingParams& encoding,
    AnalysisContext& context,
    double& timingMs
) {
    auto start = Clock::now();

    cv::Mat luma = ColorSpaceConverter::Luma(rgb);
    cv::Mat lab = ColorSpaceConverter::RgbToLab(rgb);
    cv::Mat lightness = ColorSpaceConverter::LabLightness8U(lab);
    lab.release();

    timingMs = ElapsedMs(start);

    Store(state, "rgb_luminance", luma, encoding, context);
    Store(state, "lab_luminance", lightness, encoding, context);
}

void AnalysisPipeline::ExecuteSaturation(
    const cv::Mat& rgb,
    RunState& state,
    const EncodingParams& encoding,
    AnalysisContext& context,
    double& timingMs
) {
    auto start = Clock::now();

    // OpenCV HLS order: H, L, S
    cv::Mat hls = ColorSpaceConverter::RgbToHls(rgb);
    cv::Mat saturation;
    cv::extractChannel(hls, saturation, 2);
    hls.release();

    cv::Mat inverted;
    cv::bitwise_not(saturation, inverted);

    timingMs = ElapsedMs(start);

    Store(state, "hls_saturation", saturation, encoding, context);
    Store(state, "hls_saturation_inverted", inverted, encoding, context);
}

void AnalysisPipeline::ExecuteHue(
    const cv::Mat& rgb,
    RunState& state,
    AnalysisStatistics& statistics,
    const EncodingParams& encoding,
    AnalysisContext& context,
    double& timingMs
) {
    auto start = Clock::now();

    cv::Mat hsv = ColorSpaceConverter::RgbToHsv(rgb);
    cv::Mat hue;
    cv::extractChannel(hsv, hue, 0);
    hsv.release();

    cv::Mat hueMap = ColorQualityAnalyzer::HueVisualization(hue);
    statistics.hueHistogram = ColorQualityAnalyzer::HueHistogram(hue);

    timingMs = ElapsedMs(start);

    Store(state, "hue_map", hueMap, encoding, context);
}

void AnalysisPipeline::ExecuteClustering(
    const cv::Mat& rgb,
    const PipelineParams& params,
    RunState& state,
    AnalysisStatistics& statistics,
    AnalysisContext& context,
    double& timingMs
) {
    auto start = Clock::now();
    context.ReportProgress(kProgressClusteringStarted);

    ColorMaxResult colorMax = ColorMaxEngine::Segment(rgb, params.colorMax, context);
    context.ReportProgress(kProgressClustered);

    statistics.palette = ColorMaxEngine::ExtractDominantPalette(colorMax, params.paletteSize);
    statistics.clusterRatios.clear();
    for (const auto& cluster : colorMax.clusters) {
        statistics.clusterRatios.push_back(cluster.ratio);
    }
    statistics.clusterCount = static_cast<int>(colorMax.clusters.size());
    statistics.clusteringStrategy = colorMax.strategy;
    statistics.binsSubsampled = colorMax.binsSubsampled;
    statistics.balanceScore = ColorMaxEngine::BalanceScore(statistics.clusterRatios);
    statistics.metrics["colormax_bin_count"] = colorMax.binCount;
    statistics.metrics["colormax_sample_stride"] = colorMax.sampleStride;

    timingMs = ElapsedMs(start);

    Store(state, SegmentationArtifactName(params.colorMax.targetClusters), colorMax.segmented, params.encoding, context);
}

AnalysisResult AnalysisPipeline::Run(
    const std::vector<uchar>* encoded,
    const cv::Mat* decoded,
    const PipelineParams& params,
    AnalysisContext& context
) {
    AnalysisResult result;
    result.submissionId = context.SubmissionId();

    RunState state;
    auto totalStart = Clock::now();

    try {
        // Decoding
        Enter(state, PipelineStage::DECODING, context);
        auto decodeStart = Clock::now();
        cv::Mat rgb;
        if (encoded) {
            NormalizedImage normalized = ImageNormalizer::Normalize(*encoded, params.normalizer);
            rgb = normalized.rgb;
            result.statistics.metrics["source_width"] = normalized.sourceSize.width;
            result.statistics.metrics["source_height"] = normalized.sourceSize.height;
            result.statistics.metrics["exif_orientation"] = normalized.orientation;
        } else {
            if (decoded->empty() || decoded->type() != CV_8UC3) {
                throw std::invalid_argument("Expected non-empty CV_8UC3 RGB buffer");
            }
            result.statistics.metrics["source_width"] = decoded->cols;
            result.statistics.metrics["source_height"] = decoded->rows;
            rgb = ImageNormalizer::BoundSize(*decoded, params.normalizer.maxSide);
        }
        result.statistics.workingSize = rgb.size();
        result.timings["decoding"] = ElapsedMs(decodeStart);
        context.Info("Working resolution " + std::to_string(rgb.cols) + "x" + std::to_string(rgb.rows));
        context.ReportProgress(kProgressDecoded);

        // Step 1: binary + 3/4-level gray
        Enter(state, PipelineStage::STEP1_TONAL_THRESHOLDS, context);
        ExecuteTonalThresholds(rgb, params.binaryThreshold, state, params.encoding, context, result.timings["step1"]);
        context.ReportProgress(kProgressStep1);

        // Step 2: luma + Lab lightness
        Enter(state, PipelineStage::STEP2_LUMINANCE, context);
        ExecuteLuminance(rgb, state, params.encoding, context, result.timings["step2"]);
        context.ReportProgress(kProgressStep2);

        // Step 3: HLS saturation + inverse
        Enter(state, PipelineStage::STEP3_SATURATION, context);
        ExecuteSaturation(rgb, state, params.encoding, context, result.timings["step3"]);
        context.ReportProgress(kProgressStep3);

        // Step 4: hue map + histogram
        Enter(state, PipelineStage::STEP4_HUE, context);
        ExecuteHue(rgb, state, result.statistics, params.encoding, context, result.timings["step4"]);
        context.ReportProgress(kProgressStep4);

        // Step 5: ColorMax segmentation + palette
        Enter(state, PipelineStage::STEP5_CLUSTERING, context);
        ExecuteClustering(rgb, params, state, result.statistics, context, result.timings["step5"]);
        context.ReportProgress(kProgressStep5);
        rgb.release();

        // Assembling
        Enter(state, PipelineStage::ASSEMBLING, context);
        result.timings["encoding"] = state.encodingMs;
        result.images = std::move(state.images);

        state.stage = PipelineStage::COMPLETE;
        result.state = PipelineStage::COMPLETE;
        result.success = true;
        context.ReportProgress(kProgressComplete);
    }
    catch (const std::exception& e) {
        result.success = false;
        result.state = PipelineStage::FAILED;
        result.failedStage = state.stage;
        result.errorMessage = e.what();
        result.images.clear();
        result.statistics = AnalysisStatistics();
        context.Error(std::string("Analysis failed in ") + ToString(state.stage) + ": " + e.what());
    }

    result.totalTimeMs = ElapsedMs(totalStart);
    result.warnings = context.Warnings();
    if (result.success) {
        context.Info("Analysis complete in " + std::to_string(static_cast<int>(result.totalTimeMs)) + " ms, " +
                     std::to_string(result.images.size()) + " artifacts");
    }
    return result;
}

AnalysisResult AnalysisPipeline::Execute(
    const std::vector<uchar>& encoded,
    const PipelineParams& params,
    AnalysisContext& context
) {
    return Run(&encoded, nullptr, params, context);
}

AnalysisResult AnalysisPipeline::ExecuteOnBuffer(
    const cv::Mat& rgb,
    const PipelineParams& params,
    AnalysisContext& context
) {
    return Run(nullptr, &rgb, params, context);
}

} // namespace VisualAnalysis
