#include "auditor/batch_reporter.h"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <future>
#include <utility>
#include <vector>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>

#include "common/file_utils.h"
#include "common/logging.h"
#include "common/time_utils.h"

namespace Auditor {

using Common::ErrorKind;
using Common::Status;

namespace {

bool hasModuleExtension(const char* name) noexcept {
    const size_t name_len = std::strlen(name);
    const size_t ext_len = std::strlen(BatchReporter::MODULE_EXTENSION);
    return name_len > ext_len &&
           std::strcmp(name + name_len - ext_len, BatchReporter::MODULE_EXTENSION) == 0;
}

SecurityAnalysis analyzeOne(const std::string& path) {
    SecurityAnalysis analysis;
    Status status = RiskAnalyzer::analyzeFile(path, analysis);
    if (!status.isOk()) {
        LOG_WARN("Batch analysis failed for %s: %s", path.c_str(), status.message().c_str());
        return BatchReporter::failedAnalysis(status.message());
    }
    return analysis;
}

void writeStringArray(rapidjson::PrettyWriter<rapidjson::StringBuffer>& writer,
                      const char* key, const std::vector<std::string>& values) {
    writer.Key(key);
    writer.StartArray();
    for (const auto& v : values) {
        writer.String(v.c_str(), static_cast<rapidjson::SizeType>(v.size()));
    }
    writer.EndArray();
}

} // namespace

Status BatchReporter::batchAnalyze(const std::string& directory, BatchResults& out, bool parallel) {
    DIR* dir = opendir(directory.c_str());
    if (!dir) {
        return Status::error(ErrorKind::IO_FAILURE, "Failed to read transform directory %s: %s",
                             directory.c_str(), std::strerror(errno));
    }

    std::vector<std::string> names;
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        if (entry->d_name[0] == '.') continue;
        if (!hasModuleExtension(entry->d_name)) continue;
        names.emplace_back(entry->d_name);
    }
    closedir(dir);

    const uint64_t start_ns = Common::getNanosSinceEpoch();
    out.clear();

    if (parallel && names.size() > 1) {
        // Each analysis is pure, so per-file tasks cannot change the results
        std::vector<std::pair<std::string, std::future<SecurityAnalysis>>> tasks;
        tasks.reserve(names.size());
        for (const auto& name : names) {
            tasks.emplace_back(name, std::async(std::launch::async, analyzeOne, directory + "/" + name));
        }
        for (auto& [name, task] : tasks) {
            out.emplace(name, task.get());
        }
    } else {
        for (const auto& name : names) {
            out.emplace(name, analyzeOne(directory + "/" + name));
        }
    }

    LOG_INFO("Batch analyzed %zu modules in %s (%.2f ms)", out.size(), directory.c_str(),
             Common::nanosToMillis(start_ns, Common::getNanosSinceEpoch()));
    return Status::ok();
}

BatchSummary BatchReporter::summarize(const BatchResults& results) {
    BatchSummary summary;
    summary.total = results.size();
    double total_score = 0.0;

    for (const auto& [file_name, analysis] : results) {
        if (analysis.safe) {
            ++summary.safe;
        } else {
            ++summary.unsafe;
        }
        total_score += analysis.risk_score;

        // Strictly greater: ties keep the earlier file
        if (analysis.risk_score > summary.highest_risk_score) {
            summary.highest_risk_score = analysis.risk_score;
            summary.highest_risk_file = file_name;
        }
    }

    if (summary.total > 0) {
        summary.average_risk_score =
            std::round(total_score / static_cast<double>(summary.total) * 10.0) / 10.0;
    }
    return summary;
}

SecurityAnalysis BatchReporter::failedAnalysis(const std::string& reason) {
    SecurityAnalysis analysis;
    analysis.safe = false;
    analysis.risk_score = RiskAnalyzer::MAX_RISK_SCORE;
    analysis.warnings.emplace_back("Failed to analyze: " + reason);
    analysis.blocked_patterns.emplace_back(ANALYSIS_FAILED);
    analysis.structure_valid = false;
    return analysis;
}

void BatchReporter::printReport(const BatchResults& results, const BatchSummary& summary, bool verbose) {
    printf("MODULES\n");
    printf("-------\n");
    for (const auto& [file_name, analysis] : results) {
        printf("  %-40s %s  score %4.1f/10\n", file_name.c_str(),
               analysis.safe ? "SAFE  " : "UNSAFE", analysis.risk_score);
        if (verbose || !analysis.safe) {
            for (const auto& warning : analysis.warnings) {
                printf("      - %s\n", warning.c_str());
            }
        }
        if (verbose && !analysis.content_hash.empty()) {
            printf("      sha256 %s\n", analysis.content_hash.c_str());
        }
    }
    printf("\n");

    printf("SUMMARY\n");
    printf("-------\n");
    printf("Total:          %zu\n", summary.total);
    printf("Safe:           %zu\n", summary.safe);
    printf("Unsafe:         %zu\n", summary.unsafe);
    printf("Average risk:   %.1f\n", summary.average_risk_score);
    if (summary.highest_risk_file) {
        printf("Highest risk:   %s (%.1f)\n", summary.highest_risk_file->c_str(), summary.highest_risk_score);
    }
    printf("\n");
}

Status BatchReporter::exportJSON(const BatchResults& results, const BatchSummary& summary,
                                 const std::string& path, const Common::PathGuard& guard) {
    std::string resolved;
    Status status = guard.validatePath(path, "", resolved);
    if (!status.isOk()) {
        return status;
    }
    status = guard.validateExtension(resolved);
    if (!status.isOk()) {
        return status;
    }

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("modules");
    writer.StartArray();
    for (const auto& [file_name, analysis] : results) {
        writer.StartObject();
        writer.Key("file");
        writer.String(file_name.c_str());
        writer.Key("safe");
        writer.Bool(analysis.safe);
        writer.Key("riskScore");
        writer.Double(analysis.risk_score);
        writer.Key("structureValid");
        writer.Bool(analysis.structure_valid);
        writer.Key("hash");
        writer.String(analysis.content_hash.c_str());
        writeStringArray(writer, "warnings", analysis.warnings);
        writeStringArray(writer, "blockedPatterns", analysis.blocked_patterns);
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("summary");
    writer.StartObject();
    writer.Key("total");
    writer.Uint64(summary.total);
    writer.Key("safe");
    writer.Uint64(summary.safe);
    writer.Key("unsafe");
    writer.Uint64(summary.unsafe);
    writer.Key("averageRiskScore");
    writer.Double(summary.average_risk_score);
    writer.Key("highestRiskFile");
    if (summary.highest_risk_file) {
        writer.String(summary.highest_risk_file->c_str());
    } else {
        writer.Null();
    }
    writer.Key("highestRiskScore");
    writer.Double(summary.highest_risk_score);
    writer.EndObject();
    writer.EndObject();

    const size_t len = buffer.GetSize();
    status = Common::writeTextFile(resolved, std::string(buffer.GetString(), len));
    if (!status.isOk()) {
        return status;
    }
    LOG_INFO("Audit report written to %s (%zu bytes)", resolved.c_str(), len);
    return Status::ok();
}

} // namespace Auditor
