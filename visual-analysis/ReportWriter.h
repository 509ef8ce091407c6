#pragma once

#include "AnalysisParameters.h"
#include <opencv2/core.hpp>
#include <map>
#include <string>

namespace VisualAnalysis {

class AnalysisContext;

class ReportWriter {
public:
    // Statistics record, timings and artifact metadata as a JSON document
    static std::string StatisticsToJson(const AnalysisResult& result);

    // Metrics and series of every analyzer as a JSON document
    static std::string AnalyzersToJson(const std::map<std::string, AnalyzerResult>& results);

    // Write every artifact as <name>.<ext> plus statistics.json into
    // directory (created when missing). Returns false on any I/O failure.
    static bool WriteReport(const AnalysisResult& result, const std::string& directory);

    // Encode every analyzer map as <analyzer>_<map>.<ext> within budget and
    // write comprehensive.json next to them
    static bool WriteAnalyzerReport(
        const std::map<std::string, AnalyzerResult>& results,
        const std::string& directory,
        const EncodingParams& encoding,
        AnalysisContext& context
    );

private:
    static bool WriteBytes(const std::string& path, const std::vector<uchar>& bytes);
    static bool WriteText(const std::string& path, const std::string& text);
    static bool EnsureDirectory(const std::string& directory);

    static void WriteRgbArray(cv::FileStorage& fs, const cv::Vec3b& rgb);
};

} // namespace VisualAnalysis
