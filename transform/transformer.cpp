#include "transform/transformer.h"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <glob.h>
#include <memory>
#include <regex>
#include <sys/stat.h>

#include "common/logging.h"
#include "common/time_utils.h"
#include "dom/html_document.h"

namespace Markgate {

using Common::ErrorKind;
using Common::Status;

namespace fs = std::filesystem;

namespace {

bool hasWildcard(const std::string& segment) noexcept {
    return segment.find_first_of("*?[") != std::string::npos;
}

bool isRegularFile(const char* path) noexcept {
    struct stat st;
    return stat(path, &st) == 0 && S_ISREG(st.st_mode);
}

// Glob remainder (relative to the literal base) as an anchored regex
std::string globToRegex(const std::string& glob) {
    std::string out;
    for (size_t i = 0; i < glob.size(); ++i) {
        const char c = glob[i];
        if (c == '*') {
            if (i + 1 < glob.size() && glob[i + 1] == '*') {
                if (i + 2 < glob.size() && glob[i + 2] == '/') {
                    out += "(?:.*/)?";
                    i += 2;
                } else {
                    out += ".*";
                    i += 1;
                }
            } else {
                out += "[^/]*";
            }
        } else if (c == '?') {
            out += "[^/]";
        } else if (c == '[') {
            const size_t close = glob.find(']', i + 1);
            if (close == std::string::npos) {
                out += "\\[";
                continue;
            }
            std::string cls = glob.substr(i + 1, close - i - 1);
            if (!cls.empty() && cls[0] == '!') {
                cls[0] = '^';
            }
            out += "[" + cls + "]";
            i = close;
        } else if (std::strchr(".+()^$|{}\\", c)) {
            out += '\\';
            out += c;
        } else {
            out += c;
        }
    }
    return out;
}

Status expandRecursive(const std::string& pattern, std::vector<std::string>& out) {
    const std::string base = Transformer::inputBase(pattern);
    std::string remainder = pattern;
    if (base != "." || pattern.compare(0, 2, "./") == 0) {
        remainder = pattern.substr(std::min(pattern.size(), base.size() + (base == "/" ? 0 : 1)));
    }

    std::regex matcher;
    try {
        matcher.assign(globToRegex(remainder), std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        return Status::error(ErrorKind::INVALID_ARGUMENT, "Invalid input pattern %s: %s", pattern.c_str(), e.what());
    }

    std::error_code ec;
    fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Status::error(ErrorKind::MISSING_RESOURCE, "Cannot read input directory %s: %s",
                             base.c_str(), ec.message().c_str());
    }
    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            LOG_WARN("Input scan error under %s: %s", base.c_str(), ec.message().c_str());
            break;
        }
        if (!it->is_regular_file(ec)) continue;
        const std::string relative = it->path().lexically_relative(base).generic_string();
        if (std::regex_match(relative, matcher)) {
            out.push_back(fs::absolute(it->path()).lexically_normal().string());
        }
    }
    return Status::ok();
}

} // namespace

std::string Transformer::inputBase(const std::string& pattern) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= pattern.size()) {
        const size_t slash = pattern.find('/', start);
        const size_t end = slash == std::string::npos ? pattern.size() : slash;
        segments.push_back(pattern.substr(start, end - start));
        if (slash == std::string::npos) break;
        start = slash + 1;
    }

    size_t literal = 0;
    while (literal < segments.size() && !hasWildcard(segments[literal])) {
        ++literal;
    }
    // A plain path: its parent directory
    if (literal == segments.size()) {
        literal = segments.size() - 1;
    }

    std::string base;
    for (size_t i = 0; i < literal; ++i) {
        if (i > 0) base += '/';
        base += segments[i];
    }
    if (base.empty()) {
        return (!pattern.empty() && pattern[0] == '/') ? "/" : ".";
    }
    return base;
}

Status Transformer::expandInputs(const std::string& pattern, std::vector<std::string>& out) {
    out.clear();
    if (pattern.find("**") != std::string::npos) {
        Status status = expandRecursive(pattern, out);
        if (!status.isOk()) {
            return status;
        }
    } else {
        glob_t matches;
        std::memset(&matches, 0, sizeof(matches));
        const int rc = glob(pattern.c_str(), 0, nullptr, &matches);
        if (rc != 0 && rc != GLOB_NOMATCH) {
            globfree(&matches);
            return Status::error(ErrorKind::IO_FAILURE, "Failed to expand input pattern %s (glob error %d)",
                                 pattern.c_str(), rc);
        }
        for (size_t i = 0; i < matches.gl_pathc; ++i) {
            if (isRegularFile(matches.gl_pathv[i])) {
                out.push_back(fs::absolute(matches.gl_pathv[i]).lexically_normal().string());
            }
        }
        globfree(&matches);
    }

    if (out.empty()) {
        return Status::error(ErrorKind::MISSING_RESOURCE, "No files found matching pattern: %s", pattern.c_str());
    }
    std::sort(out.begin(), out.end());
    return Status::ok();
}

Status Transformer::transformFile(const std::string& input_path, std::string& html, PipelineResult& result) {
    std::string resolved_input;
    Status status = guard_.validateFile(input_path, "", resolved_input);
    if (!status.isOk()) {
        return status;
    }

    const uint64_t start = Common::getNanosSinceEpoch();
    std::unique_ptr<Dom::HtmlDocument> document;
    status = Dom::HtmlDocument::load(resolved_input, document);
    if (!status.isOk()) {
        return status;
    }

    // Reloaded per input so one file's transforms cannot leak into the next
    std::unique_ptr<Dom::HtmlDocument> reference;
    if (!options_.reference.empty()) {
        status = Dom::HtmlDocument::load(options_.reference, reference);
        if (!status.isOk()) {
            return status.withContext("Reference document");
        }
    }

    PipelineContext context;
    context.modules_dir = options_.transforms_dir;
    context.reference = reference.get();
    context.data = &options_.data;
    context.skip_security_check = options_.skip_security_check;

    status = pipeline_.run(*document, options_.module_paths, context, result);
    if (!status.isOk()) {
        return status;
    }

    html = document->serialize();
    if (!options_.dry_run && !options_.no_format) {
        html = Dom::Formatter(options_.format).format(html);
    }

    LOG_INFO("Transformed %s with %zu transforms in %.2f ms", resolved_input.c_str(), result.applied.size(),
             Common::nanosToMillis(start, Common::getNanosSinceEpoch()));
    return Status::ok();
}

} // namespace Markgate
