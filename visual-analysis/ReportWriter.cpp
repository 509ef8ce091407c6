#include "ReportWriter.h"
#include "AnalysisContext.h"
#include "ImageEncoder.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace VisualAnalysis {

namespace filesystem = std::filesystem;

bool ReportWriter::EnsureDirectory(const std::string& directory) {
    std::error_code ec;
    filesystem::create_directories(directory, ec);
    if (ec) {
        std::cerr << "Error: could not create directory " << directory << ": " << ec.message() << "\n";
        return false;
    }
    return true;
}

bool ReportWriter::WriteBytes(const std::string& path, const std::vector<uchar>& bytes) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Error: could not open file " << path << "\n";
        return false;
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return file.good();
}

bool ReportWriter::WriteText(const std::string& path, const std::string& text) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "Error: could not open file " << path << "\n";
        return false;
    }
    file << text;
    return file.good();
}

void ReportWriter::WriteRgbArray(cv::FileStorage& fs, const cv::Vec3b& rgb) {
    fs << "[" << static_cast<int>(rgb[0]) << static_cast<int>(rgb[1]) << static_cast<int>(rgb[2]) << "]";
}

std::string ReportWriter::StatisticsToJson(const AnalysisResult& result) {
    cv::FileStorage fs(".json", cv::FileStorage::WRITE | cv::FileStorage::MEMORY | cv::FileStorage::FORMAT_JSON);

    fs << "submission_id" << result.submissionId;
    fs << "success" << (result.success ? 1 : 0);
    fs << "state" << ToString(result.state);
    if (!result.success) {
        fs << "failed_stage" << ToString(result.failedStage);
        fs << "error" << result.errorMessage;
    }

    const AnalysisStatistics& stats = result.statistics;
    fs << "statistics" << "{";
    fs << "working_width" << stats.workingSize.width;
    fs << "working_height" << stats.workingSize.height;

    fs << "hue_histogram" << "[";
    for (int count : stats.hueHistogram) fs << count;
    fs << "]";

    fs << "palette" << "[";
    for (const auto& entry : stats.palette) {
        fs << "{";
        fs << "rgb";
        WriteRgbArray(fs, entry.rgb);
        fs << "ratio" << entry.ratio;
        fs << "}";
    }
    fs << "]";

    fs << "cluster_ratios" << "[";
    for (double ratio : stats.clusterRatios) fs << ratio;
    fs << "]";
    fs << "cluster_count" << stats.clusterCount;
    fs << "clustering_strategy" << ToString(stats.clusteringStrategy);
    fs << "bins_subsampled" << (stats.binsSubsampled ? 1 : 0);
    fs << "balance_score" << stats.balanceScore;

    fs << "metrics" << "{";
    for (const auto& metric : stats.metrics) fs << metric.first << metric.second;
    fs << "}";
    fs << "}";

    fs << "artifacts" << "{";
    for (const auto& entry : result.images) {
        const EncodedImage& image = entry.second;
        fs << entry.first << "{";
        fs << "format" << ToString(image.format);
        fs << "bytes" << static_cast<int>(image.bytes.size());
        fs << "width" << image.size.width;
        fs << "height" << image.size.height;
        fs << "quality" << image.quality;
        fs << "within_budget" << (image.withinBudget ? 1 : 0);
        fs << "}";
    }
    fs << "}";

    fs << "timings_ms" << "{";
    for (const auto& timing : result.timings) fs << timing.first << timing.second;
    fs << "}";
    fs << "total_time_ms" << result.totalTimeMs;

    fs << "warnings" << "[";
    for (const auto& warning : result.warnings) fs << warning;
    fs << "]";

    return fs.releaseAndGetString();
}

std::string ReportWriter::AnalyzersToJson(const std::map<std::string, AnalyzerResult>& results) {
    cv::FileStorage fs(".json", cv::FileStorage::WRITE | cv::FileStorage::MEMORY | cv::FileStorage::FORMAT_JSON);

    for (const auto& entry : results) {
        const AnalyzerResult& analyzer = entry.second;
        fs << entry.first << "{";

        fs << "metrics" << "{";
        for (const auto& metric : analyzer.metrics) fs << metric.first << metric.second;
        fs << "}";

        fs << "series" << "{";
        for (const auto& series : analyzer.series) {
            fs << series.first << "[";
            for (double value : series.second) fs << value;
            fs << "]";
        }
        fs << "}";

        fs << "maps" << "[";
        for (const auto& map : analyzer.maps) fs << map.first;
        fs << "]";

        fs << "}";
    }

    return fs.releaseAndGetString();
}

bool ReportWriter::WriteReport(const AnalysisResult& result, const std::string& directory) {
    if (!EnsureDirectory(directory)) return false;

    bool ok = true;
    for (const auto& entry : result.images) {
        const EncodedImage& image = entry.second;
        filesystem::path path = filesystem::path(directory) / (entry.first + ImageEncoder::Extension(image.format));
        ok = WriteBytes(path.string(), image.bytes) && ok;
    }

    ok = WriteText((filesystem::path(directory) / "statistics.json").string(), StatisticsToJson(result)) && ok;
    return ok;
}

bool ReportWriter::WriteAnalyzerReport(
    const std::map<std::string, AnalyzerResult>& results,
    const std::string& directory,
    const EncodingParams& encoding,
    AnalysisContext& context
) {
    if (!EnsureDirectory(directory)) return false;

    bool ok = true;
    for (const auto& entry : results) {
        for (const auto& map : entry.second.maps) {
            std::string name = entry.first + "_" + map.first;
            EncodedImage image = ImageEncoder::Encode(map.second, name, encoding, context);
            filesystem::path path = filesystem::path(directory) / (name + ImageEncoder::Extension(image.format));
            ok = WriteBytes(path.string(), image.bytes) && ok;
        }
    }

    ok = WriteText((filesystem::path(directory) / "comprehensive.json").string(), AnalyzersToJson(results)) && ok;
    return ok;
}

} // namespace VisualAnalysis
