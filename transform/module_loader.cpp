#include "transform/module_loader.h"

#include <cstdio>
#include <filesystem>

#include "common/logging.h"

namespace Markgate {

using Common::ErrorKind;
using Common::Status;

std::string ModuleLoader::rejectionMessage(const std::string& file_name,
                                           const Auditor::SecurityAnalysis& analysis) {
    std::string message = "Transform file " + file_name + " failed security validation:";
    for (const auto& warning : analysis.warnings) {
        message += "\n  " + warning;
    }
    if (!analysis.blocked_patterns.empty()) {
        message += "\n  Blocked patterns detected:";
        for (const auto& pattern : analysis.blocked_patterns) {
            message += "\n  " + pattern;
        }
    }
    char score[32];
    std::snprintf(score, sizeof(score), "%g", analysis.risk_score);
    message += "\n  Risk score: ";
    message += score;
    message += "/10";
    return message;
}

Status ModuleLoader::load(const std::string& path, bool skip_security_check, ModuleDescriptor& out) {
    std::string resolved;
    Status status = guard_.validateFile(path, base_dir_, resolved);
    if (!status.isOk()) {
        return status;
    }
    const std::filesystem::path fs_path(resolved);
    const std::string file_name = fs_path.filename().string();

    std::vector<std::string> diagnostics;
    if (!skip_security_check) {
        Auditor::SecurityAnalysis analysis;
        status = Auditor::RiskAnalyzer::analyzeFile(resolved, analysis);
        if (!status.isOk()) {
            return status;
        }
        if (!analysis.safe) {
            LOG_ERROR("Security validation failed for %s (risk %.1f/10, %zu blocked)",
                      file_name.c_str(), analysis.risk_score, analysis.blocked_patterns.size());
            return Status(ErrorKind::SECURITY_REJECTION, rejectionMessage(file_name, analysis));
        }
        if (!analysis.warnings.empty()) {
            LOG_WARN("Security warnings for %s (risk %.1f/10):", file_name.c_str(), analysis.risk_score);
            for (const auto& warning : analysis.warnings) {
                LOG_WARN("  - %s", warning.c_str());
            }
        }
        diagnostics = std::move(analysis.warnings);
    } else {
        LOG_WARN("Security check skipped for %s", file_name.c_str());
    }

    std::unique_ptr<Script::TransformUnit> unit;
    status = evaluator_.evaluate(resolved, fs_path.stem().string(), unit);
    if (!status.isOk()) {
        if (status.kind() == ErrorKind::STRUCTURAL_INVALID) {
            LOG_WARN("Transform file %s does not export a valid transform function", file_name.c_str());
        } else {
            LOG_ERROR("Error loading transform from %s: %s", file_name.c_str(), status.message().c_str());
        }
        return status;
    }

    out.file_name = file_name;
    out.resolved_path = resolved;
    out.unit = std::move(unit);
    out.diagnostics = std::move(diagnostics);
    LOG_INFO("Loaded transform '%s' from %s", out.unit->name().c_str(), file_name.c_str());
    return Status::ok();
}

} // namespace Markgate
