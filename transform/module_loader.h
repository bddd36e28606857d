#pragma once

#include <memory>
#include <string>
#include <vector>

#include "auditor/risk_analyzer.h"
#include "common/path_guard.h"
#include "common/status.h"
#include "script/module_evaluator.h"

namespace Markgate {

/// A module that passed the gate and evaluated to a transform unit
struct ModuleDescriptor {
    std::string file_name;
    std::string resolved_path;
    std::unique_ptr<Script::TransformUnit> unit;
    std::vector<std::string> diagnostics;   // Non-fatal risk warnings
};

/// Loads transform modules, running the risk gate before any module code
/// executes.
class ModuleLoader {
public:
    /// base_dir, when non-empty, confines module paths to that directory.
    ModuleLoader(Script::ModuleEvaluator& evaluator, const Common::PathGuard& guard,
                 std::string base_dir = std::string())
        : evaluator_(evaluator), guard_(guard), base_dir_(std::move(base_dir)) {}

    // Delete copy/move constructors
    ModuleLoader(const ModuleLoader&) = delete;
    ModuleLoader& operator=(const ModuleLoader&) = delete;

    /// PATH_VIOLATION / MISSING_RESOURCE / IO_FAILURE from path validation,
    /// SECURITY_REJECTION when the analysis is unsafe, then whatever the
    /// evaluator reports.
    Common::Status load(const std::string& path, bool skip_security_check, ModuleDescriptor& out);

    /// Multi-line rejection text: warnings, blocked patterns and score
    [[nodiscard]] static std::string rejectionMessage(const std::string& file_name,
                                                      const Auditor::SecurityAnalysis& analysis);

private:
    Script::ModuleEvaluator& evaluator_;
    const Common::PathGuard& guard_;
    std::string base_dir_;
};

} // namespace Markgate
