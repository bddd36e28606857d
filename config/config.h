#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/path_guard.h"
#include "common/status.h"

namespace Markgate {

/// Parsed transforms-directory configuration. CLI flags are merged on top.
struct TransformConfig {
    std::vector<std::string> transforms;        // Explicit module order (file names)
    std::string input;                          // Input glob
    std::string output;                         // Output directory
    std::string reference;                      // Reference/template document
    std::string format_config;                  // Formatter options file (JSON)
    bool dry_run{false};
    bool verbose{false};
    bool no_format{false};
    bool skip_security_check{false};
    std::map<std::string, std::string> data;    // Exposed to transforms as ctx.config

    std::string source_path;                    // File this was loaded from, "" if none
};

/// Locates and parses config.yaml / config.yml / config.json.
class ConfigLoader {
public:
    static constexpr const char* CANDIDATES[] = {"config.yaml", "config.yml", "config.json"};

    // Delete copy/move constructors
    ConfigLoader() = delete;
    ConfigLoader(const ConfigLoader&) = delete;
    ConfigLoader& operator=(const ConfigLoader&) = delete;

    /// First existing candidate inside transforms_dir. False when none exists.
    [[nodiscard]] static auto findConfigFile(const std::string& transforms_dir, std::string& found) -> bool;

    /// Parses path by extension (.yaml/.yml or .json) and validates it.
    [[nodiscard]] static auto load(const std::string& path, TransformConfig& out) -> Common::Status;

    /// load() once guard accepts path as a readable config file. A non-empty
    /// base confines the file (symlinks resolved) to that directory.
    [[nodiscard]] static auto loadConfined(const Common::PathGuard& guard, const std::string& path,
                                           const std::string& base, TransformConfig& out) -> Common::Status;

    [[nodiscard]] static auto parseYaml(const std::string& text, TransformConfig& out) -> Common::Status;
    [[nodiscard]] static auto parseJson(const std::string& text, TransformConfig& out) -> Common::Status;

    [[nodiscard]] static auto validate(const TransformConfig& config) -> Common::Status;

    static auto printConfig(const TransformConfig& config) noexcept -> void;
};

} // namespace Markgate
