#include "ParameterLoader.h"
#include <algorithm>
#include <stdexcept>

namespace VisualAnalysis {

namespace {
    template <typename T>
    void ReadIfPresent(const cv::FileNode& node, const char* key, T& value) {
        cv::FileNode child = node[key];
        if (!child.empty() && !child.isNone()) {
            child >> value;
        }
    }

    void ReadBool(const cv::FileNode& node, const char* key, bool& value) {
        cv::FileNode child = node[key];
        if (!child.empty() && !child.isNone()) {
            value = static_cast<int>(child) != 0;
        }
    }

    int Clamp(int value, int low, int high) {
        return std::max(low, std::min(high, value));
    }

    double Clamp(double value, double low, double high) {
        return std::max(low, std::min(high, value));
    }

    PipelineParams Load(cv::FileStorage& fs, const std::string& source) {
        if (!fs.isOpened()) {
            throw std::runtime_error("Could not open parameter file: " + source);
        }
        PipelineParams params;
        ParameterLoader::Apply(fs.root(), params);
        fs.release();
        return ParameterLoader::Validate(params);
    }
}

void ParameterLoader::Apply(const cv::FileNode& root, PipelineParams& params) {
    ReadIfPresent(root, "binary_threshold", params.binaryThreshold);
    ReadIfPresent(root, "palette_size", params.paletteSize);

    cv::FileNode normalizer = root["normalizer"];
    if (normalizer.isMap()) {
        ReadIfPresent(normalizer, "max_side", params.normalizer.maxSide);
        ReadIfPresent(normalizer, "max_dimension", params.normalizer.maxDimension);
        ReadBool(normalizer, "apply_exif_orientation", params.normalizer.applyExifOrientation);
    }

    cv::FileNode colorMax = root["colormax"];
    if (colorMax.isMap()) {
        ColorMaxParams& cm = params.colorMax;
        ReadIfPresent(colorMax, "target_clusters", cm.targetClusters);
        ReadIfPresent(colorMax, "lightness_bands", cm.lightnessBands);
        ReadIfPresent(colorMax, "hue_bands", cm.hueBands);
        ReadIfPresent(colorMax, "chroma_bands", cm.chromaBands);
        ReadIfPresent(colorMax, "chroma_band_width", cm.chromaBandWidth);
        ReadIfPresent(colorMax, "sampling_target", cm.samplingTarget);
        ReadIfPresent(colorMax, "hierarchical_bin_ceiling", cm.hierarchicalBinCeiling);
        ReadIfPresent(colorMax, "bin_subsample_threshold", cm.binSubsampleThreshold);
        ReadIfPresent(colorMax, "bin_subsample_upper_threshold", cm.binSubsampleUpperThreshold);
        ReadIfPresent(colorMax, "kmeans_attempts", cm.kmeansAttempts);
        ReadIfPresent(colorMax, "kmeans_max_iterations", cm.kmeansMaxIterations);
        ReadIfPresent(colorMax, "kmeans_epsilon", cm.kmeansEpsilon);
        ReadIfPresent(colorMax, "small_cluster_ratio", cm.smallClusterRatio);

        double ceilingMb = -1.0;
        ReadIfPresent(colorMax, "hierarchical_memory_ceiling_mb", ceilingMb);
        if (ceilingMb > 0.0) {
            cm.hierarchicalMemoryCeiling = static_cast<size_t>(ceilingMb * 1024.0 * 1024.0);
        }

        int seed = -1;
        ReadIfPresent(colorMax, "seed", seed);
        if (seed >= 0) {
            cm.seed = static_cast<uint64_t>(seed);
        }
    }

    cv::FileNode encoding = root["encoding"];
    if (encoding.isMap()) {
        EncodingParams& enc = params.encoding;
        double maxBytes = -1.0;
        ReadIfPresent(encoding, "max_bytes", maxBytes);
        if (maxBytes > 0.0) {
            enc.maxBytes = static_cast<size_t>(maxBytes);
        }
        ReadIfPresent(encoding, "png_compression", enc.pngCompression);
        ReadIfPresent(encoding, "jpeg_start_quality", enc.jpegStartQuality);
        ReadIfPresent(encoding, "jpeg_min_quality", enc.jpegMinQuality);
        ReadIfPresent(encoding, "jpeg_quality_step", enc.jpegQualityStep);
        ReadIfPresent(encoding, "min_side", enc.minSide);
    }

    cv::FileNode contrast = root["contrast"];
    if (contrast.isMap()) {
        ReadIfPresent(contrast, "clahe_clip_limit", params.contrast.claheClipLimit);
        ReadIfPresent(contrast, "clahe_tile_grid", params.contrast.claheTileGrid);
        ReadIfPresent(contrast, "variance_radius", params.contrast.varianceRadius);
    }
}

PipelineParams ParameterLoader::Validate(const PipelineParams& input) {
    PipelineParams params = input;

    params.binaryThreshold = Clamp(params.binaryThreshold, 0, 255);
    params.paletteSize = Clamp(params.paletteSize, 1, 64);

    params.normalizer.maxDimension = std::max(1, params.normalizer.maxDimension);
    params.normalizer.maxSide = Clamp(params.normalizer.maxSide, 1, params.normalizer.maxDimension);

    ColorMaxParams& cm = params.colorMax;
    cm.targetClusters = Clamp(cm.targetClusters, 1, 64);
    cm.lightnessBands = std::max(1, cm.lightnessBands);
    cm.hueBands = std::max(1, cm.hueBands);
    cm.chromaBands = std::max(1, cm.chromaBands);
    if (cm.chromaBandWidth <= 0.0) cm.chromaBandWidth = ColorMaxParams().chromaBandWidth;
    cm.samplingTarget = std::max(1, cm.samplingTarget);
    cm.hierarchicalBinCeiling = std::max(cm.targetClusters, cm.hierarchicalBinCeiling);
    cm.binSubsampleThreshold = std::max(cm.targetClusters, cm.binSubsampleThreshold);
    cm.binSubsampleUpperThreshold = std::max(cm.binSubsampleThreshold, cm.binSubsampleUpperThreshold);
    cm.kmeansAttempts = std::max(1, cm.kmeansAttempts);
    cm.kmeansMaxIterations = std::max(1, cm.kmeansMaxIterations);
    cm.kmeansEpsilon = std::max(0.0, cm.kmeansEpsilon);
    cm.smallClusterRatio = Clamp(cm.smallClusterRatio, 0.0, 1.0);

    EncodingParams& enc = params.encoding;
    enc.maxBytes = std::max<size_t>(1, enc.maxBytes);
    enc.pngCompression = Clamp(enc.pngCompression, 0, 9);
    enc.jpegStartQuality = Clamp(enc.jpegStartQuality, 1, 100);
    enc.jpegMinQuality = Clamp(enc.jpegMinQuality, 1, enc.jpegStartQuality);
    enc.jpegQualityStep = std::max(1, enc.jpegQualityStep);
    enc.minSide = std::max(1, enc.minSide);

    params.contrast.claheClipLimit = std::max(0.1, params.contrast.claheClipLimit);
    params.contrast.claheTileGrid = std::max(1, params.contrast.claheTileGrid);
    params.contrast.varianceRadius = std::max(1, params.contrast.varianceRadius);

    return params;
}

PipelineParams ParameterLoader::LoadFile(const std::string& path) {
    cv::FileStorage fs;
    try {
        fs.open(path, cv::FileStorage::READ);
    } catch (const cv::Exception& e) {
        throw std::runtime_error("Could not parse parameter file " + path + ": " + e.what());
    }
    return Load(fs, path);
}

PipelineParams ParameterLoader::LoadString(const std::string& document) {
    cv::FileStorage fs;
    try {
        fs.open(document, cv::FileStorage::READ | cv::FileStorage::MEMORY);
    } catch (const cv::Exception& e) {
        throw std::runtime_error(std::string("Could not parse parameter document: ") + e.what());
    }
    return Load(fs, "<memory>");
}

} // namespace VisualAnalysis
