#include "config/config.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>
#include <system_error>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <yaml-cpp/yaml.h>

#include "common/file_utils.h"
#include "common/logging.h"

namespace Markgate {

using Common::ErrorKind;
using Common::Status;

namespace {

std::string lowerExtension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

// ========== YAML helpers ==========

auto yamlString(const YAML::Node& root, const char* key, std::string& out) -> Status {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        return Status::ok();
    }
    if (!node.IsScalar()) {
        return Status::error(ErrorKind::CONFIG_INVALID, "'%s' must be a string", key);
    }
    out = node.Scalar();
    return Status::ok();
}

auto yamlBool(const YAML::Node& root, const char* key, bool& out) -> Status {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        return Status::ok();
    }
    bool value = false;
    if (!node.IsScalar() || !YAML::convert<bool>::decode(node, value)) {
        return Status::error(ErrorKind::CONFIG_INVALID, "'%s' must be a boolean", key);
    }
    out = value;
    return Status::ok();
}

// ========== JSON helpers ==========

auto jsonString(const rapidjson::Value& root, const char* key, std::string& out) -> Status {
    if (!root.HasMember(key) || root[key].IsNull()) {
        return Status::ok();
    }
    if (!root[key].IsString()) {
        return Status::error(ErrorKind::CONFIG_INVALID, "'%s' must be a string", key);
    }
    out.assign(root[key].GetString(), root[key].GetStringLength());
    return Status::ok();
}

auto jsonBool(const rapidjson::Value& root, const char* key, bool& out) -> Status {
    if (!root.HasMember(key) || root[key].IsNull()) {
        return Status::ok();
    }
    if (!root[key].IsBool()) {
        return Status::error(ErrorKind::CONFIG_INVALID, "'%s' must be a boolean", key);
    }
    out = root[key].GetBool();
    return Status::ok();
}

// Known top-level keys; anything else is reported and ignored
constexpr const char* kKnownKeys[] = {
    "transforms", "input", "output", "reference", "dryRun", "verbose",
    "noFormat", "skipSecurityCheck", "formatConfig", "prettierConfig", "data"};

bool isKnownKey(const std::string& key) noexcept {
    return std::any_of(std::begin(kKnownKeys), std::end(kKnownKeys),
                       [&key](const char* known) { return key == known; });
}

} // namespace

auto ConfigLoader::findConfigFile(const std::string& transforms_dir, std::string& found) -> bool {
    for (const char* candidate : CANDIDATES) {
        const std::filesystem::path path = std::filesystem::path(transforms_dir) / candidate;
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec)) {
            found = path.string();
            return true;
        }
    }
    return false;
}

auto ConfigLoader::load(const std::string& path, TransformConfig& out) -> Status {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Status::error(ErrorKind::MISSING_RESOURCE, "Config file not found: %s", path.c_str());
    }

    std::string text;
    Status status = Common::readTextFile(path, text);
    if (!status.isOk()) {
        return status;
    }

    TransformConfig config;
    const std::string ext = lowerExtension(path);
    if (ext == ".yaml" || ext == ".yml") {
        status = parseYaml(text, config);
    } else if (ext == ".json") {
        status = parseJson(text, config);
    } else {
        return Status::error(ErrorKind::CONFIG_INVALID, "Unsupported config file format: %s", ext.c_str());
    }
    if (!status.isOk()) {
        return status.withContext("Failed to parse config file " + path);
    }

    status = validate(config);
    if (!status.isOk()) {
        return status.withContext(path);
    }

    config.source_path = path;
    out = std::move(config);
    LOG_INFO("Config loaded from %s (%zu ordered transforms)", path.c_str(), out.transforms.size());
    return Status::ok();
}

auto ConfigLoader::loadConfined(const Common::PathGuard& guard, const std::string& path,
                                const std::string& base, TransformConfig& out) -> Status {
    std::string resolved;
    Status status = guard.validateFile(path, base, resolved);
    if (!status.isOk()) {
        return status;
    }
    return load(resolved, out);
}

auto ConfigLoader::parseYaml(const std::string& text, TransformConfig& out) -> Status {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return Status::error(ErrorKind::CONFIG_INVALID, "YAML error at line %d: %s",
                             e.mark.line + 1, e.msg.c_str());
    }

    // An empty document is an empty mapping
    if (!root || root.IsNull()) {
        return Status::ok();
    }
    if (!root.IsMap()) {
        return Status::error(ErrorKind::CONFIG_INVALID, "Config root must be a mapping");
    }

    for (const auto& kv : root) {
        const std::string key = kv.first.as<std::string>("");
        if (!isKnownKey(key)) {
            LOG_WARN("Ignoring unknown config key: %s", key.c_str());
        }
    }

    const YAML::Node transforms = root["transforms"];
    if (transforms && !transforms.IsNull()) {
        if (!transforms.IsSequence()) {
            return Status::error(ErrorKind::CONFIG_INVALID, "'transforms' must be a list of file names");
        }
        for (const auto& item : transforms) {
            if (!item.IsScalar()) {
                return Status::error(ErrorKind::CONFIG_INVALID, "'transforms' entries must be strings");
            }
            out.transforms.push_back(item.Scalar());
        }
    }

    Status status;
    if (!(status = yamlString(root, "input", out.input)).isOk()) return status;
    if (!(status = yamlString(root, "output", out.output)).isOk()) return status;
    if (!(status = yamlString(root, "reference", out.reference)).isOk()) return status;
    if (!(status = yamlString(root, "prettierConfig", out.format_config)).isOk()) return status;
    if (!(status = yamlString(root, "formatConfig", out.format_config)).isOk()) return status;
    if (!(status = yamlBool(root, "dryRun", out.dry_run)).isOk()) return status;
    if (!(status = yamlBool(root, "verbose", out.verbose)).isOk()) return status;
    if (!(status = yamlBool(root, "noFormat", out.no_format)).isOk()) return status;
    if (!(status = yamlBool(root, "skipSecurityCheck", out.skip_security_check)).isOk()) return status;

    const YAML::Node data = root["data"];
    if (data && !data.IsNull()) {
        if (!data.IsMap()) {
            return Status::error(ErrorKind::CONFIG_INVALID, "'data' must be a mapping");
        }
        for (const auto& kv : data) {
            if (!kv.second.IsScalar()) {
                return Status::error(ErrorKind::CONFIG_INVALID, "'data' values must be scalars");
            }
            out.data[kv.first.as<std::string>("")] = kv.second.Scalar();
        }
    }
    return Status::ok();
}

auto ConfigLoader::parseJson(const std::string& text, TransformConfig& out) -> Status {
    rapidjson::Document doc;
    doc.Parse(text.c_str(), text.size());
    if (doc.HasParseError()) {
        return Status::error(ErrorKind::CONFIG_INVALID, "JSON error at offset %zu: %s",
                             doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError()));
    }
    if (!doc.IsObject()) {
        return Status::error(ErrorKind::CONFIG_INVALID, "Config root must be an object");
    }

    for (auto it = doc.MemberBegin(); it != doc.MemberEnd(); ++it) {
        if (!isKnownKey(it->name.GetString())) {
            LOG_WARN("Ignoring unknown config key: %s", it->name.GetString());
        }
    }

    if (doc.HasMember("transforms") && !doc["transforms"].IsNull()) {
        const rapidjson::Value& transforms = doc["transforms"];
        if (!transforms.IsArray()) {
            return Status::error(ErrorKind::CONFIG_INVALID, "'transforms' must be a list of file names");
        }
        for (const auto& item : transforms.GetArray()) {
            if (!item.IsString()) {
                return Status::error(ErrorKind::CONFIG_INVALID, "'transforms' entries must be strings");
            }
            out.transforms.emplace_back(item.GetString(), item.GetStringLength());
        }
    }

    Status status;
    if (!(status = jsonString(doc, "input", out.input)).isOk()) return status;
    if (!(status = jsonString(doc, "output", out.output)).isOk()) return status;
    if (!(status = jsonString(doc, "reference", out.reference)).isOk()) return status;
    if (!(status = jsonString(doc, "prettierConfig", out.format_config)).isOk()) return status;
    if (!(status = jsonString(doc, "formatConfig", out.format_config)).isOk()) return status;
    if (!(status = jsonBool(doc, "dryRun", out.dry_run)).isOk()) return status;
    if (!(status = jsonBool(doc, "verbose", out.verbose)).isOk()) return status;
    if (!(status = jsonBool(doc, "noFormat", out.no_format)).isOk()) return status;
    if (!(status = jsonBool(doc, "skipSecurityCheck", out.skip_security_check)).isOk()) return status;

    if (doc.HasMember("data") && !doc["data"].IsNull()) {
        const rapidjson::Value& data = doc["data"];
        if (!data.IsObject()) {
            return Status::error(ErrorKind::CONFIG_INVALID, "'data' must be an object");
        }
        for (auto it = data.MemberBegin(); it != data.MemberEnd(); ++it) {
            const rapidjson::Value& v = it->value;
            std::string value;
            if (v.IsString()) {
                value.assign(v.GetString(), v.GetStringLength());
            } else if (v.IsBool()) {
                value = v.GetBool() ? "true" : "false";
            } else if (v.IsInt64()) {
                value = std::to_string(v.GetInt64());
            } else if (v.IsNumber()) {
                value = std::to_string(v.GetDouble());
            } else {
                return Status::error(ErrorKind::CONFIG_INVALID, "'data' values must be scalars");
            }
            out.data[it->name.GetString()] = std::move(value);
        }
    }
    return Status::ok();
}

auto ConfigLoader::validate(const TransformConfig& config) -> Status {
    std::set<std::string> seen;
    for (const auto& name : config.transforms) {
        if (name.empty()) {
            LOG_ERROR("Config validation: empty entry in 'transforms'");
            return Status::error(ErrorKind::CONFIG_INVALID, "'transforms' contains an empty entry");
        }
        if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
            LOG_ERROR("Config validation: transform entry is not a plain file name: %s", name.c_str());
            return Status::error(ErrorKind::CONFIG_INVALID,
                                 "'transforms' entries must be file names, got: %s", name.c_str());
        }
        if (!seen.insert(name).second) {
            LOG_WARN("Config validation: duplicate transform entry %s", name.c_str());
        }
    }
    return Status::ok();
}

auto ConfigLoader::printConfig(const TransformConfig& config) noexcept -> void {
    LOG_INFO("=== Transform Configuration ===");
    LOG_INFO("Source: %s", config.source_path.empty() ? "(none)" : config.source_path.c_str());
    LOG_INFO("Input: %s", config.input.c_str());
    LOG_INFO("Output: %s", config.output.c_str());
    LOG_INFO("Reference: %s", config.reference.empty() ? "(none)" : config.reference.c_str());
    LOG_INFO("Transforms: %zu ordered", config.transforms.size());
    for (size_t i = 0; i < config.transforms.size(); ++i) {
        LOG_INFO("  %zu. %s", i + 1, config.transforms[i].c_str());
    }
    LOG_INFO("Flags: dry_run=%d verbose=%d no_format=%d skip_security_check=%d",
             config.dry_run, config.verbose, config.no_format, config.skip_security_check);
    LOG_INFO("Data entries: %zu", config.data.size());
    LOG_INFO("===============================");
}

} // namespace Markgate
