#pragma once

#include "AnalysisParameters.h"
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace VisualAnalysis {

// Mixed case: DEBUG and ERROR are predefined macros on common toolchains
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

// Shared flag the caller flips to request cancellation
using CancellationToken = std::shared_ptr<std::atomic<bool>>;

// Per-submission state threaded through every pipeline call.
// Holds no global state; one context per submission.
class AnalysisContext {
public:
    using ProgressSink = std::function<void(int percent)>;
    using LogSink = std::function<void(LogLevel, const std::string& line)>;

    explicit AnalysisContext(std::string submissionId = "local");

    const std::string& SubmissionId() const { return submissionId_; }

    void SetProgressSink(ProgressSink sink) { progressSink_ = std::move(sink); }
    void SetLogSink(LogSink sink) { logSink_ = std::move(sink); }
    void SetCancellationToken(CancellationToken token) { cancelToken_ = std::move(token); }

    static CancellationToken MakeCancellationToken();

    bool IsCancelled() const;

    // Throws CancelledError when cancellation was requested
    void ThrowIfCancelled(PipelineStage nextStage) const;

    // Clamped to [0,100] and never decreasing
    void ReportProgress(int percent);
    int LastProgress() const { return lastProgress_; }

    void Log(LogLevel level, const std::string& message) const;
    void Debug(const std::string& message) const { Log(LogLevel::Debug, message); }
    void Info(const std::string& message) const { Log(LogLevel::Info, message); }
    void Error(const std::string& message) const { Log(LogLevel::Error, message); }

    // Logged and kept for the result record
    void Warn(const std::string& message);
    const std::vector<std::string>& Warnings() const { return warnings_; }

private:
    std::string submissionId_;
    ProgressSink progressSink_;
    LogSink logSink_;
    CancellationToken cancelToken_;
    int lastProgress_ = 0;
    std::vector<std::string> warnings_;
};

} // namespace VisualAnalysis
