#pragma once

#include <string>
#include <vector>

#include "auditor/risk_patterns.h"
#include "common/status.h"

namespace Auditor {

/// Verdict for one module's source text. Produced fresh per call.
struct SecurityAnalysis {
    bool safe{false};
    double risk_score{0.0};                     // [0, 10], one decimal
    std::vector<std::string> warnings;          // Catalog order, then structure
    std::vector<std::string> blocked_patterns;  // HIGH/CRITICAL matches
    bool structure_valid{false};
    std::string content_hash;                   // SHA-256 hex, 64 chars
};

/// Static risk scoring of transform module source against kRiskCatalog.
/// Lexical only: obfuscated code can get past it.
class RiskAnalyzer {
public:
    static constexpr double MAX_RISK_SCORE = 10.0;
    static constexpr double RISK_THRESHOLD = 7.0;        // Scores at or above are unsafe
    static constexpr uint32_t STRUCTURE_PENALTY = 3;
    static constexpr const char* STRUCTURE_WARNING =
        "Invalid transform structure: missing required export or transform function";

    // Delete copy/move constructors
    RiskAnalyzer() = delete;
    RiskAnalyzer(const RiskAnalyzer&) = delete;
    RiskAnalyzer& operator=(const RiskAnalyzer&) = delete;

    /// Pure: no I/O, identical input gives an identical result.
    [[nodiscard]] static SecurityAnalysis analyze(const std::string& source);

    /// Reads file_path and analyzes it. IO_FAILURE when unreadable.
    static Common::Status analyzeFile(const std::string& file_path, SecurityAnalysis& out);

    /// True when the source returns a module table and declares a
    /// transform function.
    [[nodiscard]] static bool validateStructure(const std::string& source);

    /// Lower-case hex SHA-256 of the raw text, "" if the digest fails.
    [[nodiscard]] static std::string contentHash(const std::string& source);

    [[nodiscard]] static const decltype(kRiskCatalog)& catalog() noexcept { return kRiskCatalog; }
};

} // namespace Auditor
