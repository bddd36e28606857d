#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/path_guard.h"
#include "common/status.h"
#include "dom/formatter.h"
#include "transform/transform_pipeline.h"

namespace Markgate {

/// Resolved settings for transforming a batch of input files
struct TransformOptions {
    std::string transforms_dir;                  // Absolute, validated
    std::vector<std::string> module_paths;       // Already ordered
    std::string reference;                       // Validated reference document, "" for none
    std::map<std::string, std::string> data;
    bool skip_security_check{false};
    bool dry_run{false};
    bool no_format{false};
    Dom::FormatOptions format;
};

/// Per-input-file driver: parse, run the pipeline, serialize, format.
class Transformer {
public:
    Transformer(const Common::PathGuard& guard, TransformOptions options)
        : guard_(guard), options_(std::move(options)), pipeline_(guard) {}

    // Delete copy/move constructors
    Transformer(const Transformer&) = delete;
    Transformer& operator=(const Transformer&) = delete;

    /// Transforms one input file into html. Dry runs skip formatting.
    Common::Status transformFile(const std::string& input_path, std::string& html, PipelineResult& result);

    /// Expands an input glob into sorted, absolute regular files. "**"
    /// matches any number of directories. MISSING_RESOURCE when nothing matches.
    static Common::Status expandInputs(const std::string& pattern, std::vector<std::string>& out);

    /// Directory holding the literal part of a pattern: everything before
    /// the first segment with a wildcard, or the parent of a plain path.
    [[nodiscard]] static std::string inputBase(const std::string& pattern);

    [[nodiscard]] const TransformOptions& options() const noexcept { return options_; }

private:
    const Common::PathGuard& guard_;
    TransformOptions options_;
    TransformPipeline pipeline_;
};

} // namespace Markgate
