#include "transform/transform_pipeline.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <set>

#include "common/logging.h"
#include "common/time_utils.h"
#include "dom/html_document.h"
#include "script/lua_evaluator.h"
#include "transform/module_loader.h"

namespace Markgate {

using Common::ErrorKind;
using Common::Status;

namespace {

bool hasModuleExtension(const char* name) noexcept {
    const size_t name_len = std::strlen(name);
    const size_t ext_len = std::strlen(TransformPipeline::MODULE_EXTENSION);
    return name_len > ext_len &&
           std::strcmp(name + name_len - ext_len, TransformPipeline::MODULE_EXTENSION) == 0;
}

// Load errors that stop the whole run rather than the one module
bool isFatalLoadError(ErrorKind kind) noexcept {
    return kind != ErrorKind::STRUCTURAL_INVALID && kind != ErrorKind::MODULE_LOAD_FAILURE;
}

} // namespace

Status TransformPipeline::listModules(const std::string& directory, std::vector<std::string>& out) {
    DIR* dir = opendir(directory.c_str());
    if (!dir) {
        return Status::error(ErrorKind::IO_FAILURE, "Failed to read transform directory %s: %s",
                             directory.c_str(), std::strerror(errno));
    }
    out.clear();
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        if (entry->d_name[0] == '.') continue;
        if (!hasModuleExtension(entry->d_name)) continue;
        out.emplace_back(entry->d_name);
    }
    closedir(dir);
    std::sort(out.begin(), out.end());
    return Status::ok();
}

uint64_t TransformPipeline::numericPrefix(const std::string& file_name) noexcept {
    if (file_name.empty() || file_name[0] < '0' || file_name[0] > '9') {
        return NO_PREFIX;
    }
    uint64_t value = 0;
    for (char c : file_name) {
        if (c < '0' || c > '9') break;
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        // Saturate just below the sentinel
        if (value > (NO_PREFIX - 1 - digit) / 10) {
            return NO_PREFIX - 1;
        }
        value = value * 10 + digit;
    }
    return value;
}

std::vector<std::string> TransformPipeline::orderModules(const std::vector<std::string>& files,
                                                         const std::vector<std::string>& explicit_order) {
    std::vector<std::string> ordered;
    ordered.reserve(files.size());

    if (!explicit_order.empty()) {
        const std::set<std::string> available(files.begin(), files.end());
        std::set<std::string> taken;
        for (const auto& name : explicit_order) {
            if (available.count(name) == 0) {
                LOG_WARN("Configured transform %s not found, ignoring", name.c_str());
                continue;
            }
            if (taken.insert(name).second) {
                ordered.push_back(name);
            }
        }
        std::vector<std::string> rest;
        for (const auto& name : files) {
            if (taken.count(name) == 0) {
                rest.push_back(name);
            }
        }
        std::sort(rest.begin(), rest.end());
        ordered.insert(ordered.end(), rest.begin(), rest.end());
        return ordered;
    }

    ordered = files;
    std::sort(ordered.begin(), ordered.end(), [](const std::string& a, const std::string& b) {
        const uint64_t pa = numericPrefix(a);
        const uint64_t pb = numericPrefix(b);
        if (pa != pb) {
            return pa < pb;
        }
        return a < b;
    });
    return ordered;
}

Status TransformPipeline::run(Dom::HtmlDocument& document, const std::vector<std::string>& ordered_module_paths,
                              const PipelineContext& context, PipelineResult& result) {
    result = PipelineResult();

    // Declared before the descriptors so units are released before the state closes
    Script::LuaEvaluator evaluator;
    ModuleLoader loader(evaluator, guard_, context.modules_dir);

    const uint64_t load_start = Common::getNanosSinceEpoch();
    std::vector<ModuleDescriptor> modules;
    modules.reserve(ordered_module_paths.size());
    for (const auto& path : ordered_module_paths) {
        ModuleDescriptor descriptor;
        Status status = loader.load(path, context.skip_security_check, descriptor);
        if (!status.isOk()) {
            if (isFatalLoadError(status.kind())) {
                return status;
            }
            LOG_WARN("Skipping transform %s: %s", path.c_str(), status.message().c_str());
            result.skipped.push_back(path);
            continue;
        }
        for (const auto& warning : descriptor.diagnostics) {
            result.diagnostics.push_back(descriptor.file_name + ": " + warning);
        }
        modules.push_back(std::move(descriptor));
    }
    LOG_INFO("Loaded %zu transforms (%zu skipped) in %.2f ms", modules.size(), result.skipped.size(),
             Common::nanosToMillis(load_start, Common::getNanosSinceEpoch()));

    Script::TransformContext transform_context;
    transform_context.document = &document;
    transform_context.reference = context.reference;
    transform_context.data = context.data;

    for (auto& module : modules) {
        const uint64_t start = Common::getNanosSinceEpoch();
        Status status = module.unit->apply(transform_context);
        if (!status.isOk()) {
            LOG_ERROR("Error applying transform \"%s\": %s", module.unit->name().c_str(),
                      status.message().c_str());
            return status;
        }
        LOG_DEBUG("Applied transform '%s' in %.2f ms", module.unit->name().c_str(),
                  Common::nanosToMillis(start, Common::getNanosSinceEpoch()));
        result.applied.push_back(module.unit->name());
    }

    return Status::ok();
}

} // namespace Markgate
