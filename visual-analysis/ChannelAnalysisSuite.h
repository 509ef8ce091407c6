#pragma once

#include "AnalysisParameters.h"
#include <opencv2/core.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace VisualAnalysis {

// The full analyzer battery ("comprehensive" report) over one RGB buffer
class ChannelAnalysisSuite {
public:
    using Analyzer = std::function<AnalyzerResult(const cv::Mat& rgb)>;

    struct NamedAnalyzer {
        std::string name;
        Analyzer run;
    };

    // Every channel analyzer, in report order
    static std::vector<NamedAnalyzer> Analyzers(const ContrastParams& contrast);

    // Results keyed by analyzer name. With parallel = true each analyzer runs
    // on its own thread over the shared read-only buffer; results are identical.
    // The first analyzer exception is rethrown.
    static std::map<std::string, AnalyzerResult> RunAll(
        const cv::Mat& rgb,
        const ContrastParams& contrast,
        bool parallel
    );
};

} // namespace VisualAnalysis
