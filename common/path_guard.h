#pragma once

#include <cstdint>
#include <regex>
#include <string>
#include <vector>

#include "common/status.h"

namespace Common {

/// Read-only path policy: blocked path patterns, allowed file extensions and
/// the glob traversal cap. The process-wide instance is built once.
class PathPolicy {
public:
    struct BlockedRule {
        const char* pattern;   // ECMAScript regex, tested against the normalized path
        bool ignore_case;
    };

    static constexpr uint32_t DEFAULT_MAX_GLOB_TRAVERSAL = 3;

    PathPolicy(const std::vector<BlockedRule>& blocked,
               std::vector<std::string> allowed_extensions,
               uint32_t max_glob_traversal);

    /// Policy used by the CLIs: system dirs, credential files, traversal.
    [[nodiscard]] static const PathPolicy& defaults();

    [[nodiscard]] bool matchesBlocked(const std::string& normalized) const;
    [[nodiscard]] bool isAllowedExtension(const std::string& lowercase_ext) const noexcept;

    [[nodiscard]] const std::vector<std::string>& allowedExtensions() const noexcept { return allowed_extensions_; }
    [[nodiscard]] const std::vector<std::string>& blockedPatterns() const noexcept { return blocked_sources_; }
    [[nodiscard]] uint32_t maxGlobTraversal() const noexcept { return max_glob_traversal_; }

private:
    std::vector<std::regex> blocked_;
    std::vector<std::string> blocked_sources_;
    std::vector<std::string> allowed_extensions_;
    uint32_t max_glob_traversal_;
};

/// Confines every file-system path the tool touches to the policy.
/// All checks are fail-closed: any rejection is returned as an error Status.
class PathGuard {
public:
    explicit PathGuard(const PathPolicy& policy = PathPolicy::defaults()) noexcept
        : policy_(policy) {}

    /// Lexically normalizes path and tests it against the blocked patterns.
    [[nodiscard]] bool isBlocked(const std::string& path) const;

    /// Rejects empty and blocked paths. With a non-empty base the path is
    /// resolved against it and must stay inside it. resolved receives the
    /// absolute, normalized path.
    Status validatePath(const std::string& path, const std::string& base,
                        std::string& resolved) const;

    /// Extension (case-insensitive) must be present and allow-listed.
    Status validateExtension(const std::string& path) const;

    /// validatePath + exists + is a directory.
    Status validateDirectory(const std::string& path, std::string& resolved) const;

    /// validatePath + validateExtension + exists + regular file + readable.
    /// With a base, the symlink-resolved target must also stay inside it.
    Status validateFile(const std::string& path, const std::string& base,
                        std::string& resolved) const;

    /// Checks the literal portion of a glob (before the first "/*") for
    /// blocked locations and excessive ".." traversal.
    Status validateGlobPattern(const std::string& pattern, const std::string& base) const;

    /// Literal directory portion of a glob pattern, "" when it has none.
    [[nodiscard]] static std::string globBasePortion(const std::string& pattern);

    [[nodiscard]] const PathPolicy& policy() const noexcept { return policy_; }

private:
    const PathPolicy& policy_;
};

} // namespace Common
