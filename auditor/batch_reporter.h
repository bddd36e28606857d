#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include "auditor/risk_analyzer.h"
#include "common/path_guard.h"
#include "common/status.h"

namespace Auditor {

/// File name -> analysis, ordered by file name
using BatchResults = std::map<std::string, SecurityAnalysis>;

struct BatchSummary {
    size_t total{0};
    size_t safe{0};
    size_t unsafe{0};
    double average_risk_score{0.0};               // One decimal, 0 when empty
    std::optional<std::string> highest_risk_file; // Unset when every score is 0
    double highest_risk_score{0.0};
};

/// Directory-wide risk audit used by markgate-audit.
class BatchReporter {
public:
    static constexpr const char* MODULE_EXTENSION = ".lua";
    static constexpr const char* ANALYSIS_FAILED = "Analysis failed";

    // Delete copy/move constructors
    BatchReporter() = delete;
    BatchReporter(const BatchReporter&) = delete;
    BatchReporter& operator=(const BatchReporter&) = delete;

    /// Analyzes every module file directly inside directory (not recursive).
    /// A file that cannot be read gets a worst-case analysis; only a
    /// directory that cannot be listed fails the call.
    static Common::Status batchAnalyze(const std::string& directory, BatchResults& out,
                                       bool parallel = true);

    [[nodiscard]] static BatchSummary summarize(const BatchResults& results);

    /// Synthetic analysis recorded for a file that could not be analyzed
    [[nodiscard]] static SecurityAnalysis failedAnalysis(const std::string& reason);

    static void printReport(const BatchResults& results, const BatchSummary& summary, bool verbose);

    /// Serializes results and summary as JSON into path. The path must pass
    /// the guard's location and extension checks.
    static Common::Status exportJSON(const BatchResults& results, const BatchSummary& summary,
                                     const std::string& path,
                                     const Common::PathGuard& guard = Common::PathGuard());
};

} // namespace Auditor
