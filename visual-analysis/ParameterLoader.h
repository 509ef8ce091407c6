#pragma once

#include "AnalysisParameters.h"
#include <opencv2/core.hpp>
#include <string>

namespace VisualAnalysis {

// Reads PipelineParams from YAML or JSON through cv::FileStorage.
// Any subset of keys may be given; missing keys keep their defaults.
//
//   binary_threshold: 140
//   palette_size: 8
//   normalizer: { max_side, max_dimension, apply_exif_orientation }
//   colormax:   { target_clusters, lightness_bands, hue_bands, chroma_bands,
//                 chroma_band_width, sampling_target, hierarchical_bin_ceiling,
//                 bin_subsample_threshold, bin_subsample_upper_threshold,
//                 hierarchical_memory_ceiling_mb, kmeans_attempts,
//                 kmeans_max_iterations, kmeans_epsilon, small_cluster_ratio, seed }
//   encoding:   { max_bytes, png_compression, jpeg_start_quality,
//                 jpeg_min_quality, jpeg_quality_step, min_side }
//   contrast:   { clahe_clip_limit, clahe_tile_grid, variance_radius }
class ParameterLoader {
public:
    // Throws std::runtime_error when the file cannot be opened or parsed
    static PipelineParams LoadFile(const std::string& path);

    // Document content in memory; format detected from the content
    static PipelineParams LoadString(const std::string& document);

    // Overlay the keys present under root onto params
    static void Apply(const cv::FileNode& root, PipelineParams& params);

    // Clamp every field to its usable range
    static PipelineParams Validate(const PipelineParams& params);
};

} // namespace VisualAnalysis
