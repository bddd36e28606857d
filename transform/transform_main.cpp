#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

#include "common/file_utils.h"
#include "common/logging.h"
#include "common/path_guard.h"
#include "config/config.h"
#include "dom/formatter.h"
#include "transform/transform_pipeline.h"
#include "transform/transformer.h"

namespace fs = std::filesystem;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_TRANSFORM_FAILED = 1;
constexpr int EXIT_SECURITY = 2;
constexpr int EXIT_USAGE = 3;
constexpr int EXIT_PATH_VIOLATION = 4;

void printUsage(const char* program) {
    const char* usage = R"(
USAGE: %s -t <dir> [OPTIONS]

markgate - HTML document transformer driven by vetted Lua transform modules

OPTIONS:
    -t, --transforms <dir>      Directory holding transform modules and config (required)
    -i, --input <pattern>       Input HTML file pattern (glob, "**" recurses)
    -o, --output <dir>          Output directory
    -r, --reference <file>      Reference template HTML file (ctx.template)
    -c, --config <file>         Configuration file (default: config.yaml|yml|json in transforms dir)
    --dry-run                   Run transforms, write nothing
    --verbose                   Debug logging and per-file detail
    --no-format                 Skip output formatting
    --format-config <file>      Formatter options (JSON)
    --skip-security-check       Load modules without the risk gate
    -h, --help                  Show this help message

EXIT CODES:
    0 - Success
    1 - Transform or I/O failure
    2 - Security rejection
    3 - Usage or configuration error
    4 - Path violation

)";
    fprintf(stdout, usage, program);
}

int exitCodeFor(const Common::Status& status) noexcept {
    switch (status.kind()) {
        case Common::ErrorKind::NONE: return EXIT_OK;
        case Common::ErrorKind::SECURITY_REJECTION: return EXIT_SECURITY;
        case Common::ErrorKind::PATH_VIOLATION: return EXIT_PATH_VIOLATION;
        case Common::ErrorKind::CONFIG_INVALID:
        case Common::ErrorKind::INVALID_ARGUMENT: return EXIT_USAGE;
        default: return EXIT_TRANSFORM_FAILED;
    }
}

int fail(const Common::Status& status) {
    LOG_ERROR("%s", status.toString().c_str());
    fprintf(stderr, "Error: %s\n", status.message().c_str());
    Common::shutdownLogging();
    return exitCodeFor(status);
}

int usageError(const char* message) {
    LOG_ERROR("%s", message);
    fprintf(stderr, "Error: %s\n", message);
    Common::shutdownLogging();
    return EXIT_USAGE;
}

// Config-relative paths resolve against the transforms directory
std::string resolveAgainst(const std::string& dir, const std::string& path) {
    if (path.empty() || fs::path(path).is_absolute()) {
        return path;
    }
    return (fs::path(dir) / path).lexically_normal().string();
}

struct CliOptions {
    const char* transforms = nullptr;
    const char* input = nullptr;
    const char* output = nullptr;
    const char* reference = nullptr;
    const char* config = nullptr;
    const char* format_config = nullptr;
    bool dry_run = false;
    bool verbose = false;
    bool no_format = false;
    bool skip_security_check = false;
};

} // namespace

int main(int argc, char* argv[]) {
    CliOptions cli;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            printUsage(argv[0]);
            return EXIT_OK;
        }
        else if ((std::strcmp(arg, "-t") == 0 || std::strcmp(arg, "--transforms") == 0) && has_value) {
            cli.transforms = argv[++i];
        }
        else if ((std::strcmp(arg, "-i") == 0 || std::strcmp(arg, "--input") == 0) && has_value) {
            cli.input = argv[++i];
        }
        else if ((std::strcmp(arg, "-o") == 0 || std::strcmp(arg, "--output") == 0) && has_value) {
            cli.output = argv[++i];
        }
        else if ((std::strcmp(arg, "-r") == 0 || std::strcmp(arg, "--reference") == 0) && has_value) {
            cli.reference = argv[++i];
        }
        else if ((std::strcmp(arg, "-c") == 0 || std::strcmp(arg, "--config") == 0) && has_value) {
            cli.config = argv[++i];
        }
        else if (std::strcmp(arg, "--format-config") == 0 && has_value) {
            cli.format_config = argv[++i];
        }
        else if (std::strcmp(arg, "--dry-run") == 0) {
            cli.dry_run = true;
        }
        else if (std::strcmp(arg, "--verbose") == 0) {
            cli.verbose = true;
        }
        else if (std::strcmp(arg, "--no-format") == 0) {
            cli.no_format = true;
        }
        else if (std::strcmp(arg, "--skip-security-check") == 0) {
            cli.skip_security_check = true;
        }
        else {
            fprintf(stderr, "Unknown option: %s\n", arg);
            printUsage(argv[0]);
            return EXIT_USAGE;
        }
    }

    if (!cli.transforms) {
        fprintf(stderr, "Missing required option: -t <dir>\n");
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    char log_path[512];
    if (Common::defaultLogPath("markgate", log_path, sizeof(log_path))) {
        Common::initLogging(log_path);
    }
    Common::setLogLevel(cli.verbose ? Common::Logger::DEBUG : Common::Logger::INFO);
    LOG_INFO("markgate starting: transforms=%s", cli.transforms);

    const Common::PathGuard guard;

    // ========== Transforms directory ==========
    std::string transforms_dir;
    Common::Status status = guard.validateDirectory(cli.transforms, transforms_dir);
    if (!status.isOk()) {
        if (status.kind() == Common::ErrorKind::MISSING_RESOURCE) {
            return usageError(("Transforms directory not found: " + std::string(cli.transforms)).c_str());
        }
        return fail(status);
    }

    // ========== Configuration ==========
    Markgate::TransformConfig config;
    std::string config_path;
    if (cli.config) {
        config_path = cli.config;
        status = Markgate::ConfigLoader::loadConfined(guard, config_path, "", config);
        if (status.kind() == Common::ErrorKind::PATH_VIOLATION) {
            return fail(status);
        }
        if (!status.isOk()) {
            return usageError(status.message().c_str());
        }
    } else if (Markgate::ConfigLoader::findConfigFile(transforms_dir, config_path)) {
        status = Markgate::ConfigLoader::loadConfined(guard, config_path, transforms_dir, config);
        if (status.kind() == Common::ErrorKind::PATH_VIOLATION) {
            return fail(status);
        }
        if (!status.isOk()) {
            LOG_WARN("Ignoring config %s: %s", config_path.c_str(), status.message().c_str());
            fprintf(stderr, "Warning: %s\n", status.message().c_str());
            config = Markgate::TransformConfig();
        }
    } else {
        return usageError(("Config file (config.yaml, config.yml, or config.json) is required in "
                           "transforms directory: " + transforms_dir).c_str());
    }

    // CLI options override config
    const std::string input_pattern =
        cli.input ? std::string(cli.input) : resolveAgainst(transforms_dir, config.input);
    const std::string output_dir =
        cli.output ? std::string(cli.output) : resolveAgainst(transforms_dir, config.output);
    const std::string reference =
        cli.reference ? std::string(cli.reference) : resolveAgainst(transforms_dir, config.reference);
    const std::string format_config =
        cli.format_config ? std::string(cli.format_config) : resolveAgainst(transforms_dir, config.format_config);
    config.dry_run = cli.dry_run || config.dry_run;
    config.verbose = cli.verbose || config.verbose;
    config.no_format = cli.no_format || config.no_format;
    config.skip_security_check = cli.skip_security_check || config.skip_security_check;
    if (config.verbose) {
        Common::setLogLevel(Common::Logger::DEBUG);
        Markgate::ConfigLoader::printConfig(config);
    }

    if (input_pattern.empty()) {
        return usageError("Input pattern is required (either via CLI option -i or config file)");
    }
    if (output_dir.empty()) {
        return usageError("Output directory is required (either via CLI option -o or config file)");
    }

    // ========== Paths ==========
    status = guard.validateGlobPattern(input_pattern, "");
    if (!status.isOk()) {
        return fail(status);
    }
    std::vector<std::string> inputs;
    status = Markgate::Transformer::expandInputs(input_pattern, inputs);
    if (!status.isOk()) {
        return fail(status);
    }
    const std::string input_base = fs::absolute(Markgate::Transformer::inputBase(input_pattern))
                                       .lexically_normal().string();

    std::string resolved_output;
    status = guard.validatePath(output_dir, "", resolved_output);
    if (!status.isOk()) {
        return fail(status);
    }
    if (!config.dry_run) {
        status = Common::createDirectories(resolved_output);
        if (!status.isOk()) {
            return fail(status);
        }
    }

    Markgate::TransformOptions options;
    options.transforms_dir = transforms_dir;
    options.data = config.data;
    options.skip_security_check = config.skip_security_check;
    options.dry_run = config.dry_run;
    options.no_format = config.no_format;

    if (!reference.empty()) {
        status = guard.validateFile(reference, "", options.reference);
        if (!status.isOk()) {
            return fail(status);
        }
    }
    if (!format_config.empty() && !config.no_format) {
        status = Markgate::Dom::Formatter::loadOptions(guard, format_config, options.format);
        if (status.kind() == Common::ErrorKind::PATH_VIOLATION) {
            return fail(status);
        }
        if (!status.isOk()) {
            LOG_WARN("Using default format options: %s", status.message().c_str());
        }
    }

    // ========== Modules ==========
    std::vector<std::string> module_files;
    status = Markgate::TransformPipeline::listModules(transforms_dir, module_files);
    if (!status.isOk()) {
        return fail(status);
    }
    for (const auto& name : Markgate::TransformPipeline::orderModules(module_files, config.transforms)) {
        options.module_paths.push_back((fs::path(transforms_dir) / name).string());
    }
    if (config.skip_security_check) {
        fprintf(stderr, "Warning: security checks disabled, modules run unvetted\n");
    }

    // ========== Transform ==========
    printf("Processing %zu HTML file%s with %zu transform%s...\n", inputs.size(), inputs.size() == 1 ? "" : "s",
           options.module_paths.size(), options.module_paths.size() == 1 ? "" : "s");
    if (config.dry_run) {
        printf("Dry run mode - no files will be written\n");
    }

    Markgate::Transformer transformer(guard, std::move(options));
    for (const auto& input : inputs) {
        std::string html;
        Markgate::PipelineResult result;
        status = transformer.transformFile(input, html, result);
        if (!status.isOk()) {
            return fail(status.withContext(input));
        }
        if (config.verbose) {
            for (const auto& name : result.applied) {
                printf("  applied %s\n", name.c_str());
            }
            for (const auto& skipped : result.skipped) {
                printf("  skipped %s\n", skipped.c_str());
            }
        }

        // Preserve the layout below the pattern's literal base
        const std::string relative =
            fs::absolute(input).lexically_normal().lexically_proximate(input_base).string();
        std::string output_path;
        status = guard.validatePath((fs::path(resolved_output) / relative).string(), resolved_output, output_path);
        if (status.isOk()) {
            status = guard.validateExtension(output_path);
        }
        if (!status.isOk()) {
            return fail(status);
        }

        if (config.dry_run) {
            printf("  %s -> %s (dry run)\n", input.c_str(), output_path.c_str());
            continue;
        }
        status = Common::createDirectories(fs::path(output_path).parent_path().string());
        if (status.isOk()) {
            status = Common::writeTextFile(output_path, html);
        }
        if (!status.isOk()) {
            return fail(status);
        }
        printf("  %s -> %s\n", input.c_str(), output_path.c_str());
    }

    printf("Transformation completed successfully (%zu files processed)\n", inputs.size());
    LOG_INFO("markgate finished: %zu files", inputs.size());
    Common::shutdownLogging();
    return EXIT_OK;
}
