#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "common/path_guard.h"
#include "common/status.h"

namespace Markgate {

namespace Dom {
class HtmlDocument;
}

/// Inputs shared by every transform of one run
struct PipelineContext {
    std::string modules_dir;                         // Module paths must stay inside, "" for no confinement
    Dom::HtmlDocument* reference{nullptr};
    const std::map<std::string, std::string>* data{nullptr};
    bool skip_security_check{false};
};

struct PipelineResult {
    std::vector<std::string> applied;                // Unit names, application order
    std::vector<std::string> skipped;                // File names skipped at load time
    std::vector<std::string> diagnostics;            // "<file>: <warning>"
};

/// Orders, loads and applies transform modules to one document.
/// Application is strictly sequential; each unit sees the previous ones' edits.
class TransformPipeline {
public:
    static constexpr const char* MODULE_EXTENSION = ".lua";
    static constexpr uint64_t NO_PREFIX = UINT64_MAX;  // Sorts after every numeric prefix

    explicit TransformPipeline(const Common::PathGuard& guard) noexcept : guard_(guard) {}

    // Delete copy/move constructors
    TransformPipeline(const TransformPipeline&) = delete;
    TransformPipeline& operator=(const TransformPipeline&) = delete;

    /// Module file names directly inside directory, sorted
    static Common::Status listModules(const std::string& directory, std::vector<std::string>& out);

    /// With an explicit order: listed names that exist, in list order, then
    /// the rest lexicographically. Without: by leading numeric prefix, then
    /// lexicographically.
    [[nodiscard]] static std::vector<std::string> orderModules(const std::vector<std::string>& files,
                                                               const std::vector<std::string>& explicit_order);

    /// Leading decimal digits of file_name, NO_PREFIX when there are none
    [[nodiscard]] static uint64_t numericPrefix(const std::string& file_name) noexcept;

    /// Loads every module, then applies them in list order.
    /// SECURITY_REJECTION and path errors abort before any transform runs;
    /// modules that fail to evaluate or export no transform are skipped.
    /// The first failing transform aborts with TRANSFORM_EXECUTION.
    Common::Status run(Dom::HtmlDocument& document, const std::vector<std::string>& ordered_module_paths,
                       const PipelineContext& context, PipelineResult& result);

private:
    const Common::PathGuard& guard_;
};

} // namespace Markgate
