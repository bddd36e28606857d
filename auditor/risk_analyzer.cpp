#include "auditor/risk_analyzer.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iterator>
#include <regex>

#include <openssl/evp.h>

#include "common/file_utils.h"
#include "common/logging.h"

namespace Auditor {

using Common::ErrorKind;
using Common::Status;

namespace {

// Catalog regexes, compiled once on first use
const std::vector<std::regex>& compiledCatalog() {
    static const std::vector<std::regex> compiled = [] {
        std::vector<std::regex> out;
        out.reserve(kRiskCatalog.size());
        for (const auto& p : kRiskCatalog) {
            out.emplace_back(p.pattern, std::regex::ECMAScript | std::regex::optimize);
        }
        return out;
    }();
    return compiled;
}

// Chunk-level export of a table literal, anywhere in the source
const std::regex& tableExportPattern() {
    static const std::regex re(R"(\breturn\s*\{)", std::regex::ECMAScript | std::regex::optimize);
    return re;
}

// Matched against the final code line only
const std::regex& nameExportPattern() {
    static const std::regex re(R"(\breturn\s+[A-Za-z_][\w.]*\s*;?$)", std::regex::ECMAScript | std::regex::optimize);
    return re;
}

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

// Last line holding code, with any trailing line comment cut off. Blank
// lines and whole-line "--" comments at the end of the source are skipped.
std::string lastCodeLine(const std::string& source) {
    size_t end = source.size();
    while (end > 0) {
        while (end > 0 && isSpace(source[end - 1])) {
            --end;
        }
        if (end == 0) {
            break;
        }
        const size_t newline = source.rfind('\n', end - 1);
        size_t begin = (newline == std::string::npos) ? 0 : newline + 1;
        while (begin < end && isSpace(source[begin])) {
            ++begin;
        }
        if (source.compare(begin, 2, "--") == 0) {
            end = begin;
            continue;
        }

        std::string line = source.substr(begin, end - begin);
        const size_t comment = line.find("--");
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        while (!line.empty() && isSpace(line.back())) {
            line.pop_back();
        }
        return line;
    }
    return {};
}

const std::regex& transformPattern() {
    static const std::regex re(
        R"(\btransform\s*=\s*function\s*\()"                       // transform = function(
        R"(|\[\s*["']transform["']\s*\]\s*=\s*function\s*\()"      // ["transform"] = function(
        R"(|\bfunction\s+[A-Za-z_]\w*\s*[.:]\s*transform\s*\()"    // function M.transform( / M:transform(
        R"(|\bfunction\s+transform\s*\()"                           // [local] function transform(
        R"(|\btransform\s*=\s*(?!function\b)[A-Za-z_][\w.]*)",     // transform = named_fn
        std::regex::ECMAScript | std::regex::optimize);
    return re;
}

size_t countMatches(const std::string& text, const std::regex& re) {
    return static_cast<size_t>(std::distance(
        std::sregex_iterator(text.begin(), text.end(), re), std::sregex_iterator()));
}

} // namespace

SecurityAnalysis RiskAnalyzer::analyze(const std::string& source) {
    SecurityAnalysis result;
    const auto& compiled = compiledCatalog();
    uint64_t total_points = 0;

    for (size_t i = 0; i < kRiskCatalog.size(); ++i) {
        const RiskPattern& pattern = kRiskCatalog[i];
        const size_t occurrences = countMatches(source, compiled[i]);
        if (occurrences == 0) {
            continue;
        }

        char description[256];
        std::snprintf(description, sizeof(description), "%s (%zu occurrence%s)",
                      pattern.description, occurrences, occurrences > 1 ? "s" : "");
        result.warnings.emplace_back(description);
        if (isBlocking(pattern.severity)) {
            result.blocked_patterns.emplace_back(description);
        }

        // One repeated construct contributes at most twice its weight
        total_points += std::min<uint64_t>(uint64_t{pattern.weight} * occurrences,
                                           uint64_t{pattern.weight} * 2);
    }

    result.structure_valid = validateStructure(source);
    if (!result.structure_valid) {
        result.warnings.emplace_back(STRUCTURE_WARNING);
        total_points += STRUCTURE_PENALTY;
    }

    const double clamped = std::min(static_cast<double>(total_points), MAX_RISK_SCORE);
    result.risk_score = std::round(clamped * 10.0) / 10.0;
    result.content_hash = contentHash(source);
    result.safe = result.risk_score < RISK_THRESHOLD &&
                  result.blocked_patterns.empty() &&
                  result.structure_valid;
    return result;
}

Status RiskAnalyzer::analyzeFile(const std::string& file_path, SecurityAnalysis& out) {
    std::string source;
    Status status = Common::readTextFile(file_path, source);
    if (!status.isOk()) {
        return status;
    }
    out = analyze(source);
    LOG_DEBUG("Analyzed %s: score=%.1f safe=%d warnings=%zu",
              file_path.c_str(), out.risk_score, out.safe ? 1 : 0, out.warnings.size());
    return Status::ok();
}

bool RiskAnalyzer::validateStructure(const std::string& source) {
    const bool exports = std::regex_search(source, tableExportPattern()) ||
                         std::regex_search(lastCodeLine(source), nameExportPattern());
    return exports && std::regex_search(source, transformPattern());
}

std::string RiskAnalyzer::contentHash(const std::string& source) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(source.data(), source.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        LOG_ERROR("SHA-256 digest failed");
        return {};
    }

    char hex[EVP_MAX_MD_SIZE * 2 + 1];
    for (unsigned int i = 0; i < digest_len; ++i) {
        std::snprintf(hex + (i * 2), 3, "%02x", digest[i]);
    }
    hex[digest_len * 2] = '\0';
    return std::string(hex);
}

} // namespace Auditor
