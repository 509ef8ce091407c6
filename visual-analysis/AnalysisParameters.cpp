#include "AnalysisParameters.h"

namespace VisualAnalysis {

const char* ToString(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::PENDING: return "pending";
        case PipelineStage::DECODING: return "decoding";
        case PipelineStage::STEP1_TONAL_THRESHOLDS: return "step1";
        case PipelineStage::STEP2_LUMINANCE: return "step2";
        case PipelineStage::STEP3_SATURATION: return "step3";
        case PipelineStage::STEP4_HUE: return "step4";
        case PipelineStage::STEP5_CLUSTERING: return "step5";
        case PipelineStage::ASSEMBLING: return "assembling";
        case PipelineStage::COMPLETE: return "complete";
        case PipelineStage::FAILED: return "failed";
    }
    return "unknown";
}

const char* ToString(ClusteringStrategy strategy) {
    switch (strategy) {
        case ClusteringStrategy::NONE: return "none";
        case ClusteringStrategy::PER_BIN: return "per_bin";
        case ClusteringStrategy::HIERARCHICAL: return "hierarchical";
        case ClusteringStrategy::PARTITIONAL: return "partitional";
    }
    return "unknown";
}

const char* ToString(ImageFormat format) {
    switch (format) {
        case ImageFormat::JPEG: return "jpeg";
        case ImageFormat::PNG: return "png";
        case ImageFormat::WEBP: return "webp";
        case ImageFormat::GIF: return "gif";
        case ImageFormat::UNKNOWN: return "unknown";
    }
    return "unknown";
}

} // namespace VisualAnalysis
