#pragma once

#include "AnalysisParameters.h"
#include <stdexcept>
#include <string>

namespace VisualAnalysis {

class AnalysisError : public std::runtime_error {
public:
    explicit AnalysisError(const std::string& message)
        : std::runtime_error(message) {}
};

// Encoding outside the JPEG/PNG/WEBP/GIF whitelist
class UnsupportedFormatError : public AnalysisError {
public:
    explicit UnsupportedFormatError(const std::string& message)
        : AnalysisError(message) {}
};

// Header dimensions above the hard ceiling
class ImageTooLargeError : public AnalysisError {
public:
    ImageTooLargeError(int width, int height, int ceiling)
        : AnalysisError("Image too large: " + std::to_string(width) + "x" +
                        std::to_string(height) + " (max " + std::to_string(ceiling) +
                        " per side)"),
          width_(width), height_(height) {}

    int width() const { return width_; }
    int height() const { return height_; }

private:
    int width_;
    int height_;
};

// Whitelisted container that the codec could not decode
class DecodeError : public AnalysisError {
public:
    explicit DecodeError(const std::string& message)
        : AnalysisError(message) {}
};

// Hierarchical clustering exceeded its memory/size bounds.
// Recovered inside the ColorMax engine.
class ClusteringMemoryError : public AnalysisError {
public:
    explicit ClusteringMemoryError(const std::string& message)
        : AnalysisError(message) {}
};

// Bin and label arrays disagree in size. Recovered inside the ColorMax engine.
class ClusteringSizeMismatchError : public AnalysisError {
public:
    ClusteringSizeMismatchError(size_t bins, size_t labels)
        : AnalysisError("Cluster label count " + std::to_string(labels) +
                        " does not match bin count " + std::to_string(bins)) {}
};

// Cancellation observed between stages
class CancelledError : public AnalysisError {
public:
    explicit CancelledError(PipelineStage stage)
        : AnalysisError(std::string("Cancelled before ") + ToString(stage)),
          stage_(stage) {}

    PipelineStage stage() const { return stage_; }

private:
    PipelineStage stage_;
};

} // namespace VisualAnalysis
