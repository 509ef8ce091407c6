// fastanalysis.cpp
#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include "AnalysisContext.h"
#include "AnalysisPipeline.h"
#include "ColorMaxEngine.h"
#include <cstring>
#include <string>
#include <vector>

namespace py = pybind11;
using namespace VisualAnalysis;

namespace {
    py::list RgbList(const cv::Vec3b& rgb) {
        py::list out;
        out.append(static_cast<int>(rgb[0]));
        out.append(static_cast<int>(rgb[1]));
        out.append(static_cast<int>(rgb[2]));
        return out;
    }
}

// --- Full 5-step pipeline on encoded bytes ---
py::dict analyze(py::bytes data, int binary_threshold, int max_side, int clusters, int palette_size,
                 const std::string& submission_id) {
    std::string raw = data;
    std::vector<uchar> encoded(raw.begin(), raw.end());

    PipelineParams params;
    params.binaryThreshold = binary_threshold;
    params.normalizer.maxSide = max_side;
    params.colorMax.targetClusters = clusters;
    params.paletteSize = palette_size;

    AnalysisContext context(submission_id);
    AnalysisResult result;
    {
        py::gil_scoped_release release;
        result = AnalysisPipeline::Execute(encoded, params, context);
    }

    py::dict out;
    out["success"] = result.success;
    out["state"] = ToString(result.state);
    if (!result.success) {
        out["failed_stage"] = ToString(result.failedStage);
        out["error"] = result.errorMessage;
    }

    py::dict images;
    for (const auto& entry : result.images) {
        const EncodedImage& image = entry.second;
        py::dict item;
        item["format"] = ToString(image.format);
        item["data"] = py::bytes(reinterpret_cast<const char*>(image.bytes.data()), image.bytes.size());
        item["width"] = image.size.width;
        item["height"] = image.size.height;
        item["within_budget"] = image.withinBudget;
        images[py::str(entry.first)] = item;
    }
    out["images"] = images;

    const AnalysisStatistics& stats = result.statistics;
    py::list palette;
    py::list paletteRatios;
    for (const auto& entry : stats.palette) {
        palette.append(RgbList(entry.rgb));
        paletteRatios.append(entry.ratio);
    }
    out["hue_histogram"] = stats.hueHistogram;
    out["palette"] = palette;
    out["palette_ratios"] = paletteRatios;
    out["cluster_ratios"] = stats.clusterRatios;
    out["cluster_count"] = stats.clusterCount;
    out["clustering_strategy"] = ToString(stats.clusteringStrategy);
    out["bins_subsampled"] = stats.binsSubsampled;
    out["balance_score"] = stats.balanceScore;
    out["timings"] = result.timings;
    out["total_time_ms"] = result.totalTimeMs;
    out["warnings"] = result.warnings;
    return out;
}

// --- ColorMax segmentation on an RGB array ---
py::dict colormax(py::array_t<uint8_t, py::array::c_style | py::array::forcecast> image, int target_n) {
    auto buf = image.request();
    if (buf.ndim != 3 || buf.shape[2] != 3)
        throw std::runtime_error("Image must be (H,W,3) uint8 RGB array");
    int h = static_cast<int>(buf.shape[0]);
    int w = static_cast<int>(buf.shape[1]);
    cv::Mat rgb(h, w, CV_8UC3, buf.ptr);

    ColorMaxParams params;
    params.targetClusters = target_n;

    AnalysisContext context("colormax");
    ColorMaxResult result;
    {
        py::gil_scoped_release release;
        result = ColorMaxEngine::Segment(rgb, params, context);
    }

    py::array_t<uint8_t> segmented({static_cast<size_t>(h), static_cast<size_t>(w), static_cast<size_t>(3)});
    std::memcpy(segmented.request().ptr, result.segmented.data, static_cast<size_t>(h) * w * 3);

    py::array_t<int32_t> labels({static_cast<size_t>(h), static_cast<size_t>(w)});
    std::memcpy(labels.request().ptr, result.labels.data, static_cast<size_t>(h) * w * sizeof(int32_t));

    std::vector<double> ratios;
    py::list colors;
    for (const auto& cluster : result.clusters) {
        ratios.push_back(cluster.ratio);
        colors.append(RgbList(cluster.rgb));
    }

    py::dict out;
    out["segmented_image"] = segmented;
    out["labels"] = labels;
    out["cluster_ratios"] = ratios;
    out["dominant_colors"] = colors;
    out["cluster_count"] = static_cast<int>(result.clusters.size());
    out["strategy"] = ToString(result.strategy);
    out["bins_subsampled"] = result.binsSubsampled;
    out["balance_score"] = ColorMaxEngine::BalanceScore(ratios);
    return out;
}

// --- Module definition ---
PYBIND11_MODULE(fastanalysis, m) {
    m.def("analyze", &analyze, "Run the 5-step visual analysis on encoded image bytes",
          py::arg("data"), py::arg("binary_threshold") = 140, py::arg("max_side") = 800,
          py::arg("clusters") = 8, py::arg("palette_size") = 8, py::arg("submission_id") = "python");
    m.def("colormax", &colormax, "ColorMax dominant-color segmentation of an RGB array",
          py::arg("image"), py::arg("target_n") = 8);
}
