#pragma once

#include "AnalysisParameters.h"
#include <cstddef>
#include <cstdint>

#ifdef _WIN32
#define VA_API __declspec(dllexport)
#else
#define VA_API
#endif

extern "C" {

// Parameter struct for host languages; zero fields fall back to defaults
struct VAParams {
    int binaryThreshold;
    int maxSide;
    int targetClusters;
    int paletteSize;
    int maxBytes;
};

struct VAArtifact {
    char name[64];
    int format;            // matches VisualAnalysis::ImageFormat enum
    uint8_t* data;
    int size;
    int width;
    int height;
    int quality;
    int withinBudget;      // bool
};

struct VAPaletteEntry {
    uint8_t rgb[3];
    double ratio;
};

struct VAResult {
    int success;           // bool
    int failedStage;       // matches VisualAnalysis::PipelineStage enum
    char errorMessage[256];

    VAArtifact* artifacts;
    int artifactCount;

    VAPaletteEntry* palette;
    int paletteCount;
    int hueHistogram[36];
    int clusterCount;
    int clusteringStrategy; // matches VisualAnalysis::ClusteringStrategy enum
    int binsSubsampled;     // bool
    double balanceScore;

    char* statisticsJson;   // NUL-terminated
    double totalTimeMs;
};

// Called with 0-100 at stage boundaries
typedef void (*VAProgressCallback)(int percent, void* userData);

// Fill params with the pipeline defaults
VA_API void va_default_params(VAParams* params);

// Run the 5-step pipeline on an encoded image (JPEG, PNG, WEBP or GIF).
// cancelFlag, when given, is polled at stage boundaries; non-zero cancels.
// Returns 0 on success, 1 when the analysis failed (details in the result),
// -1 on invalid arguments and -2 on an internal error.
// Caller must free the result with va_free_result.
VA_API int va_run_pipeline(const uint8_t* encoded,
                           size_t encodedSize,
                           const VAParams* params,
                           VAProgressCallback progress,
                           void* userData,
                           const volatile int* cancelFlag,
                           VAResult** outResult);

// Free result allocated by va_run_pipeline
VA_API void va_free_result(VAResult* result);

} // extern "C"
