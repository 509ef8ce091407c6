#include "AnalysisContext.h"
#include "AnalysisErrors.h"
#include <algorithm>
#include <iostream>

namespace VisualAnalysis {

namespace {
    const char* LevelTag(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info: return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error: return "ERROR";
        }
        return "INFO";
    }
}

AnalysisContext::AnalysisContext(std::string submissionId)
    : submissionId_(std::move(submissionId)) {}

CancellationToken AnalysisContext::MakeCancellationToken() {
    return std::make_shared<std::atomic<bool>>(false);
}

bool AnalysisContext::IsCancelled() const {
    return cancelToken_ && cancelToken_->load();
}

void AnalysisContext::ThrowIfCancelled(PipelineStage nextStage) const {
    if (IsCancelled()) {
        throw CancelledError(nextStage);
    }
}

void AnalysisContext::ReportProgress(int percent) {
    percent = std::max(0, std::min(100, percent));
    if (percent < lastProgress_) return;
    lastProgress_ = percent;
    if (progressSink_) {
        progressSink_(percent);
    }
}

void AnalysisContext::Log(LogLevel level, const std::string& message) const {
    std::string line = "[" + submissionId_ + "] " + message;
    if (logSink_) {
        logSink_(level, line);
        return;
    }

    if (level == LogLevel::Warning || level == LogLevel::Error) {
        std::cerr << LevelTag(level) << " " << line << "\n";
    } else {
        std::cout << LevelTag(level) << " " << line << "\n";
    }
}

void AnalysisContext::Warn(const std::string& message) {
    warnings_.push_back(message);
    Log(LogLevel::Warning, message);
}

} // namespace VisualAnalysis
