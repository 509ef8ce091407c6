#include "AnalysisContext.h"
#include "AnalysisParameters.h"
#include "AnalysisPipeline.h"
#include "ChannelAnalysisSuite.h"
#include "ImageNormalizer.h"
#include "ParameterLoader.h"
#include "ReportWriter.h"
#include <opencv2/core.hpp>
#include <chrono>
#include <filesystem>
#include <iostream>

using namespace VisualAnalysis;

namespace {
    const char* kKeys =
        "{help h usage ? |                 | print this message}"
        "{@image         |                 | input image (JPEG, PNG, WEBP or GIF)}"
        "{config c       |                 | YAML or JSON parameter file}"
        "{output o       | analysis_output | output directory}"
        "{threshold      |                 | binary threshold (0-255)}"
        "{max-side       |                 | working resolution bound}"
        "{clusters       |                 | ColorMax target cluster count (1-64)}"
        "{palette        |                 | dominant palette size}"
        "{full           |                 | also run the comprehensive analyzer suite}"
        "{parallel       |                 | run the analyzer suite on multiple threads}";

    // Max side for the comprehensive report
    const int kComprehensiveMaxSide = 1536;

    void PrintSummary(const AnalysisResult& result) {
        std::cout << "\n  Pipeline Results:\n";
        std::cout << "  ----------------\n";
        std::cout << "  Working size: " << result.statistics.workingSize.width << "x"
                  << result.statistics.workingSize.height << "\n";
        std::cout << "  Artifacts: " << result.images.size() << "\n";
        for (const auto& [name, image] : result.images) {
            std::cout << "    " << name << ": " << ToString(image.format) << ", "
                      << image.bytes.size() << " bytes"
                      << (image.withinBudget ? "" : " (over budget)") << "\n";
        }

        std::cout << "  ColorMax: " << result.statistics.clusterCount << " clusters via "
                  << ToString(result.statistics.clusteringStrategy)
                  << (result.statistics.binsSubsampled ? " (bins subsampled)" : "") << "\n";
        std::cout << "  Palette:\n";
        for (const auto& entry : result.statistics.palette) {
            std::cout << "    RGB(" << static_cast<int>(entry.rgb[0]) << ", "
                      << static_cast<int>(entry.rgb[1]) << ", "
                      << static_cast<int>(entry.rgb[2]) << ") "
                      << entry.ratio * 100.0 << "%\n";
        }
        std::cout << "  Balance score: " << result.statistics.balanceScore << "\n";

        std::cout << "  Stage timings:\n";
        for (const auto& [stage, time] : result.timings) {
            std::cout << "    " << stage << ": " << time << " ms\n";
        }
        std::cout << "  TOTAL: " << result.totalTimeMs << " ms\n";
    }

    PipelineParams BuildParams(const cv::CommandLineParser& parser) {
        PipelineParams params;
        if (parser.has("config")) {
            params = ParameterLoader::LoadFile(parser.get<cv::String>("config"));
        }

        if (parser.has("threshold")) params.binaryThreshold = parser.get<int>("threshold");
        if (parser.has("max-side")) params.normalizer.maxSide = parser.get<int>("max-side");
        if (parser.has("clusters")) params.colorMax.targetClusters = parser.get<int>("clusters");
        if (parser.has("palette")) params.paletteSize = parser.get<int>("palette");

        return ParameterLoader::Validate(params);
    }
}

int main(int argc, char** argv) {
    cv::CommandLineParser parser(argc, argv, kKeys);
    parser.about("Visual Analysis: tonal, color and shape analysis of a single image");

    if (parser.has("help")) {
        parser.printMessage();
        return 0;
    }

    std::string imagePath = parser.get<cv::String>("@image");
    if (!parser.check() || imagePath.empty()) {
        parser.printErrors();
        std::cerr << "Usage: " << argv[0] << " <image> [--config=] [--output=] [--threshold=] "
                  << "[--max-side=] [--clusters=] [--palette=] [--full] [--parallel]\n";
        return 1;
    }

    std::cout << "=== Visual Analysis ===\n";

    try {
        PipelineParams params = BuildParams(parser);
        std::string outputDir = parser.get<cv::String>("output");

        std::vector<uchar> bytes = ImageNormalizer::LoadFile(imagePath);
        std::cout << "Image loaded: " << imagePath << " (" << bytes.size() << " bytes)\n";

        AnalysisContext context(std::filesystem::path(imagePath).stem().string());
        context.SetProgressSink([](int percent) {
            std::cout << "  progress: " << percent << "%\n";
        });

        AnalysisResult result = AnalysisPipeline::Execute(bytes, params, context);
        if (!result.success) {
            std::cerr << "\nError: analysis failed in " << ToString(result.failedStage)
                      << ": " << result.errorMessage << "\n";
            if (!ReportWriter::WriteReport(result, outputDir)) {
                std::cerr << "  ERROR: Failed to write failure record to " << outputDir << "\n";
            }
            return 2;
        }

        PrintSummary(result);

        if (!ReportWriter::WriteReport(result, outputDir)) {
            std::cerr << "  ERROR: Failed to write report to " << outputDir << "\n";
            return 1;
        }
        std::cout << "  Saved: " << outputDir << "/statistics.json\n";

        if (parser.has("full")) {
            std::cout << "\n=== Comprehensive Analysis ===\n";
            bool parallel = parser.has("parallel");

            NormalizerParams normalizer = params.normalizer;
            normalizer.maxSide = kComprehensiveMaxSide;
            NormalizedImage image = ImageNormalizer::Normalize(bytes, normalizer);

            auto start = std::chrono::high_resolution_clock::now();
            auto analyzers = ChannelAnalysisSuite::RunAll(image.rgb, params.contrast, parallel);
            auto end = std::chrono::high_resolution_clock::now();
            auto duration = std::chrono::duration<double, std::milli>(end - start).count();

            for (const auto& [name, analyzer] : analyzers) {
                std::cout << "  " << name << ":";
                for (const auto& [metric, value] : analyzer.metrics) {
                    std::cout << " " << metric << "=" << value;
                }
                std::cout << "\n";
            }
            std::cout << "  Time: " << duration << " ms" << (parallel ? " (parallel)" : "") << "\n";

            std::string comprehensiveDir = (std::filesystem::path(outputDir) / "comprehensive").string();
            if (!ReportWriter::WriteAnalyzerReport(analyzers, comprehensiveDir, params.encoding, context)) {
                std::cerr << "  ERROR: Failed to write comprehensive report\n";
                return 1;
            }
            std::cout << "  Saved: " << comprehensiveDir << "/comprehensive.json\n";
        }

        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }
}
