#include "NativeBridge.h"
#include "AnalysisContext.h"
#include "AnalysisPipeline.h"
#include "ReportWriter.h"
#include <cstring>
#include <iostream>
#include <vector>

using namespace VisualAnalysis;

namespace {
    void CopyString(char* dst, size_t capacity, const std::string& src) {
        std::strncpy(dst, src.c_str(), capacity - 1);
        dst[capacity - 1] = '\0';
    }

    PipelineParams ToPipelineParams(const VAParams* p) {
        PipelineParams params;
        if (!p) return params;

        if (p->binaryThreshold > 0) params.binaryThreshold = p->binaryThreshold;
        if (p->maxSide > 0) params.normalizer.maxSide = p->maxSide;
        if (p->targetClusters > 0) params.colorMax.targetClusters = p->targetClusters;
        if (p->paletteSize > 0) params.paletteSize = p->paletteSize;
        if (p->maxBytes > 0) params.encoding.maxBytes = static_cast<size_t>(p->maxBytes);
        return params;
    }

    void CopyArtifacts(const std::map<std::string, EncodedImage>& src, VAArtifact* dst) {
        size_t i = 0;
        for (const auto& entry : src) {
            const EncodedImage& image = entry.second;
            CopyString(dst[i].name, sizeof(dst[i].name), entry.first);
            dst[i].format = static_cast<int>(image.format);
            dst[i].size = static_cast<int>(image.bytes.size());
            dst[i].width = image.size.width;
            dst[i].height = image.size.height;
            dst[i].quality = image.quality;
            dst[i].withinBudget = image.withinBudget ? 1 : 0;
            dst[i].data = nullptr;
            if (!image.bytes.empty()) {
                dst[i].data = new uint8_t[image.bytes.size()];
                std::memcpy(dst[i].data, image.bytes.data(), image.bytes.size());
            }
            ++i;
        }
    }

    VAResult* ToNative(const AnalysisResult& result) {
        VAResult* native = new VAResult();
        std::memset(native, 0, sizeof(VAResult));

        native->success = result.success ? 1 : 0;
        native->failedStage = static_cast<int>(result.failedStage);
        CopyString(native->errorMessage, sizeof(native->errorMessage), result.errorMessage);
        native->totalTimeMs = result.totalTimeMs;

        const AnalysisStatistics& stats = result.statistics;
        for (size_t i = 0; i < stats.hueHistogram.size() && i < 36; i++) {
            native->hueHistogram[i] = stats.hueHistogram[i];
        }
        native->clusterCount = stats.clusterCount;
        native->clusteringStrategy = static_cast<int>(stats.clusteringStrategy);
        native->binsSubsampled = stats.binsSubsampled ? 1 : 0;
        native->balanceScore = stats.balanceScore;

        if (!result.images.empty()) {
            native->artifactCount = static_cast<int>(result.images.size());
            native->artifacts = new VAArtifact[result.images.size()];
            std::memset(native->artifacts, 0, sizeof(VAArtifact) * result.images.size());
            CopyArtifacts(result.images, native->artifacts);
        }

        if (!stats.palette.empty()) {
            native->paletteCount = static_cast<int>(stats.palette.size());
            native->palette = new VAPaletteEntry[stats.palette.size()];
            for (size_t i = 0; i < stats.palette.size(); i++) {
                native->palette[i].rgb[0] = stats.palette[i].rgb[0];
                native->palette[i].rgb[1] = stats.palette[i].rgb[1];
                native->palette[i].rgb[2] = stats.palette[i].rgb[2];
                native->palette[i].ratio = stats.palette[i].ratio;
            }
        }

        std::string json = ReportWriter::StatisticsToJson(result);
        native->statisticsJson = new char[json.size() + 1];
        std::memcpy(native->statisticsJson, json.c_str(), json.size() + 1);
        return native;
    }
}

extern "C" {

void va_default_params(VAParams* params) {
    if (!params) return;
    PipelineParams defaults;
    params->binaryThreshold = defaults.binaryThreshold;
    params->maxSide = defaults.normalizer.maxSide;
    params->targetClusters = defaults.colorMax.targetClusters;
    params->paletteSize = defaults.paletteSize;
    params->maxBytes = static_cast<int>(defaults.encoding.maxBytes);
}

int va_run_pipeline(const uint8_t* encoded,
                    size_t encodedSize,
                    const VAParams* params,
                    VAProgressCallback progress,
                    void* userData,
                    const volatile int* cancelFlag,
                    VAResult** outResult) {
    if (!encoded || encodedSize == 0 || !outResult) {
        return -1;
    }
    *outResult = nullptr;

    try {
        std::vector<uchar> bytes(encoded, encoded + encodedSize);
        PipelineParams pipelineParams = ToPipelineParams(params);

        AnalysisContext context("native");
        CancellationToken token = AnalysisContext::MakeCancellationToken();
        context.SetCancellationToken(token);

        // The host flag is mirrored into the token whenever progress is reported
        context.SetProgressSink([progress, userData, cancelFlag, token](int percent) {
            if (cancelFlag && *cancelFlag != 0) {
                token->store(true);
            }
            if (progress) {
                progress(percent, userData);
            }
        });
        if (cancelFlag && *cancelFlag != 0) {
            token->store(true);
        }

        AnalysisResult result = AnalysisPipeline::Execute(bytes, pipelineParams, context);
        *outResult = ToNative(result);
        return result.success ? 0 : 1;
    }
    catch (const std::exception& e) {
        std::cerr << "va_run_pipeline: " << e.what() << "\n";
        return -2;
    }
}

void va_free_result(VAResult* result) {
    if (!result) return;
    if (result->artifacts) {
        for (int i = 0; i < result->artifactCount; ++i) {
            delete[] result->artifacts[i].data;
        }
        delete[] result->artifacts;
    }
    delete[] result->palette;
    delete[] result->statisticsJson;
    delete result;
}

} // extern "C"
