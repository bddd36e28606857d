#include "common/path_guard.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#include <unistd.h>

#include "common/logging.h"

namespace fs = std::filesystem;

namespace Common {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Absolute + lexically normal; falls back to the normalized input when the
// working directory cannot be determined.
fs::path absoluteNormal(const fs::path& p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec) {
        return p.lexically_normal();
    }
    return abs.lexically_normal();
}

bool startsWithDotDot(const fs::path& rel) {
    auto it = rel.begin();
    return it != rel.end() && it->string().rfind("..", 0) == 0;
}

size_t countDotDot(const std::string& s) {
    size_t count = 0;
    for (size_t pos = s.find(".."); pos != std::string::npos; pos = s.find("..", pos + 2)) {
        ++count;
    }
    return count;
}

} // namespace

// ========== PathPolicy ==========

PathPolicy::PathPolicy(const std::vector<BlockedRule>& blocked,
                       std::vector<std::string> allowed_extensions,
                       uint32_t max_glob_traversal)
    : blocked_(),
      blocked_sources_(),
      allowed_extensions_(std::move(allowed_extensions)),
      max_glob_traversal_(max_glob_traversal) {
    blocked_.reserve(blocked.size());
    blocked_sources_.reserve(blocked.size());
    for (const auto& rule : blocked) {
        auto flags = std::regex::ECMAScript | std::regex::optimize;
        if (rule.ignore_case) {
            flags |= std::regex::icase;
        }
        blocked_.emplace_back(rule.pattern, flags);
        blocked_sources_.emplace_back(rule.ignore_case ? std::string(rule.pattern) + " (i)" : rule.pattern);
    }
}

const PathPolicy& PathPolicy::defaults() {
    static const PathPolicy policy(
        {
            {R"(\.\.)", false},                 // Path traversal
            {R"(^/etc(/|$))", false},           // System directories
            {R"(^/usr(/|$))", false},
            {R"(^/bin(/|$))", false},
            {R"(^/sbin(/|$))", false},
            {R"(^/root(/|$))", false},
            {R"(^/proc(/|$))", false},
            {R"(^/sys(/|$))", false},
            {R"(^/dev(/|$))", false},
            {R"(^/var/log(/|$))", false},
            {R"(^/home/[^/]+/\.)", false},      // Hidden entries in home dirs
            {R"(\.ssh)", true},
            {R"(\.aws)", true},
            {R"(\.env)", true},
            {R"(\.key$)", true},
            {R"(\.pem$)", true},
            {R"(\.p12$)", true},
            {R"(\.pfx$)", true},
            {R"(id_rsa)", true},
            {R"(id_dsa)", true},
            {R"(id_ecdsa)", true},
            {R"(authorized_keys)", true},
            {R"(known_hosts)", true},
        },
        {".html", ".htm", ".lua", ".json", ".yaml", ".yml", ".md"},
        DEFAULT_MAX_GLOB_TRAVERSAL);
    return policy;
}

bool PathPolicy::matchesBlocked(const std::string& normalized) const {
    for (const auto& re : blocked_) {
        if (std::regex_search(normalized, re)) {
            return true;
        }
    }
    return false;
}

bool PathPolicy::isAllowedExtension(const std::string& lowercase_ext) const noexcept {
    return std::find(allowed_extensions_.begin(), allowed_extensions_.end(), lowercase_ext)
           != allowed_extensions_.end();
}

// ========== PathGuard ==========

bool PathGuard::isBlocked(const std::string& path) const {
    return policy_.matchesBlocked(fs::path(path).lexically_normal().string());
}

Status PathGuard::validatePath(const std::string& path, const std::string& base,
                               std::string& resolved) const {
    if (path.empty()) {
        return Status::error(ErrorKind::PATH_VIOLATION, "Invalid path: path must be a non-empty string");
    }

    const fs::path normalized = fs::path(path).lexically_normal();
    if (policy_.matchesBlocked(normalized.string())) {
        LOG_WARN("Security: blocked path access attempt: %s", path.c_str());
        return Status::error(ErrorKind::PATH_VIOLATION,
                             "Access denied: path violates security policy: %s", path.c_str());
    }

    if (!base.empty()) {
        const fs::path resolved_base = absoluteNormal(base);
        const fs::path candidate = (resolved_base / normalized).lexically_normal();
        const fs::path rel = candidate.lexically_relative(resolved_base);
        if (rel.empty() || startsWithDotDot(rel) || rel.is_absolute()) {
            LOG_WARN("Security: path traversal attempt blocked: %s (base %s)", path.c_str(), base.c_str());
            return Status::error(ErrorKind::PATH_VIOLATION,
                                 "Access denied: path outside allowed directory: %s", path.c_str());
        }
        resolved = candidate.string();
        return Status::ok();
    }

    resolved = absoluteNormal(normalized).string();
    return Status::ok();
}

Status PathGuard::validateExtension(const std::string& path) const {
    if (path.empty()) {
        return Status::error(ErrorKind::PATH_VIOLATION, "Invalid file path for extension validation");
    }
    const std::string ext = toLower(fs::path(path).extension().string());
    if (ext.empty()) {
        return Status::error(ErrorKind::PATH_VIOLATION, "File must have an extension: %s", path.c_str());
    }
    if (!policy_.isAllowedExtension(ext)) {
        LOG_WARN("Security: blocked file extension: %s", ext.c_str());
        return Status::error(ErrorKind::PATH_VIOLATION, "File extension not allowed: %s", ext.c_str());
    }
    return Status::ok();
}

Status PathGuard::validateDirectory(const std::string& path, std::string& resolved) const {
    std::string candidate;
    Status status = validatePath(path, "", candidate);
    if (!status.isOk()) {
        return status;
    }

    std::error_code ec;
    if (!fs::exists(candidate, ec)) {
        return Status::error(ErrorKind::MISSING_RESOURCE, "Requested directory does not exist: %s", path.c_str());
    }
    if (!fs::is_directory(candidate, ec)) {
        return Status::error(ErrorKind::MISSING_RESOURCE, "Requested path is not a directory: %s", path.c_str());
    }
    resolved = candidate;
    return Status::ok();
}

Status PathGuard::validateFile(const std::string& path, const std::string& base,
                               std::string& resolved) const {
    std::string candidate;
    Status status = validatePath(path, base, candidate);
    if (!status.isOk()) {
        return status;
    }
    status = validateExtension(candidate);
    if (!status.isOk()) {
        return status;
    }

    std::error_code ec;
    if (!fs::exists(candidate, ec)) {
        return Status::error(ErrorKind::MISSING_RESOURCE, "Requested file does not exist: %s", path.c_str());
    }
    if (!fs::is_regular_file(candidate, ec)) {
        return Status::error(ErrorKind::MISSING_RESOURCE, "Requested path is not a file: %s", path.c_str());
    }
    if (::access(candidate.c_str(), R_OK) != 0) {
        return Status::error(ErrorKind::IO_FAILURE, "Requested file is not accessible: %s", path.c_str());
    }

    // Lexical containment does not see symlinks; compare real locations too
    if (!base.empty()) {
        const fs::path real_file = fs::canonical(candidate, ec);
        if (ec) {
            return Status::error(ErrorKind::IO_FAILURE, "Cannot resolve %s: %s", path.c_str(), ec.message().c_str());
        }
        const fs::path real_base = fs::canonical(absoluteNormal(base), ec);
        if (ec) {
            return Status::error(ErrorKind::MISSING_RESOURCE, "Cannot resolve base directory %s: %s",
                                 base.c_str(), ec.message().c_str());
        }
        const fs::path rel = real_file.lexically_relative(real_base);
        if (rel.empty() || startsWithDotDot(rel)) {
            LOG_WARN("Security: symlink escape blocked: %s -> %s", path.c_str(), real_file.c_str());
            return Status::error(ErrorKind::PATH_VIOLATION,
                                 "Access denied: path outside allowed directory: %s", path.c_str());
        }
    }

    resolved = candidate;
    return Status::ok();
}

std::string PathGuard::globBasePortion(const std::string& pattern) {
    static const std::regex glob_suffix(R"(/\*\*?.*$)");
    return std::regex_replace(pattern, glob_suffix, "", std::regex_constants::format_first_only);
}

Status PathGuard::validateGlobPattern(const std::string& pattern, const std::string& base) const {
    if (pattern.empty()) {
        return Status::error(ErrorKind::PATH_VIOLATION, "Invalid glob pattern");
    }

    const std::string base_portion = globBasePortion(pattern);
    const fs::path root = base.empty() ? fs::path(".") : fs::path(base);
    const fs::path resolved = absoluteNormal(root / base_portion);

    if (policy_.matchesBlocked(resolved.string())) {
        LOG_WARN("Security: glob pattern targets blocked path: %s", pattern.c_str());
        return Status::error(ErrorKind::PATH_VIOLATION,
                             "Glob pattern attempts to access blocked path: %s", pattern.c_str());
    }
    if (countDotDot(base_portion) > policy_.maxGlobTraversal()) {
        return Status::error(ErrorKind::PATH_VIOLATION,
                             "Glob pattern contains excessive path traversal: %s", pattern.c_str());
    }
    return Status::ok();
}

} // namespace Common
