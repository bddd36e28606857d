#include <cstdio>
#include <cstring>
#include <string>

#include "auditor/batch_reporter.h"
#include "common/logging.h"
#include "common/path_guard.h"

static void printUsage(const char* program) {
    const char* usage = R"(
USAGE: %s --dir <path> [OPTIONS]

markgate-audit - Static risk audit of Lua transform modules

OPTIONS:
    --dir <path>            Transforms directory to audit (required)
    --json <path>           Export results and summary as JSON
    --verbose               Print every warning and content hash
    --fail-on-unsafe        Exit with error when any module is unsafe
    --sequential            Analyze files one at a time
    --help                  Show this help message

EXAMPLES:
    # Audit a transforms directory
    %s --dir ./transforms

    # CI gate with a JSON report
    %s --dir ./transforms --json audit.json --fail-on-unsafe

EXIT CODES:
    0 - Audit completed
    1 - Unsafe modules found (with --fail-on-unsafe)
    3 - Usage, directory or report error

RISK TIERS:
    CRITICAL - Code execution (os.execute, io.popen, load, dofile)
    HIGH     - File system and environment access (io.open, os.remove, debug)
    MEDIUM   - Network modules, process exit, environment reads
    LOW      - Global table indexing, console output

A module is safe when its score is below 7/10, no HIGH or CRITICAL
construct appears, and it returns a table with a transform function.

)";

    fprintf(stdout, usage, program, program, program);
}

int main(int argc, char* argv[]) {
    const char* dir_path = nullptr;
    const char* json_path = nullptr;
    bool verbose = false;
    bool fail_on_unsafe = false;
    bool parallel = true;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        }
        else if (std::strcmp(argv[i], "--dir") == 0 && i + 1 < argc) {
            dir_path = argv[++i];
        }
        else if (std::strcmp(argv[i], "--json") == 0 && i + 1 < argc) {
            json_path = argv[++i];
        }
        else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        }
        else if (std::strcmp(argv[i], "--fail-on-unsafe") == 0) {
            fail_on_unsafe = true;
        }
        else if (std::strcmp(argv[i], "--sequential") == 0) {
            parallel = false;
        }
        else {
            fprintf(stderr, "Unknown option: %s\n", argv[i]);
            printUsage(argv[0]);
            return 3;
        }
    }

    if (!dir_path) {
        fprintf(stderr, "Missing required option: --dir <path>\n");
        printUsage(argv[0]);
        return 3;
    }

    char log_path[512];
    if (Common::defaultLogPath("markgate_audit", log_path, sizeof(log_path))) {
        Common::initLogging(log_path);
    }
    if (verbose) {
        Common::setLogLevel(Common::Logger::DEBUG);
    }

    const Common::PathGuard guard;
    std::string directory;
    Common::Status status = guard.validateDirectory(dir_path, directory);
    if (!status.isOk()) {
        fprintf(stderr, "Error: %s\n", status.message().c_str());
        LOG_ERROR("Audit aborted: %s", status.toString().c_str());
        Common::shutdownLogging();
        return 3;
    }

    printf("==============================================\n");
    printf("MARKGATE AUDIT - Transform Module Risk Report\n");
    printf("==============================================\n");
    printf("Directory: %s\n", directory.c_str());
    printf("\n");

    Auditor::BatchResults results;
    status = Auditor::BatchReporter::batchAnalyze(directory, results, parallel);
    if (!status.isOk()) {
        fprintf(stderr, "Error: %s\n", status.message().c_str());
        LOG_ERROR("Audit aborted: %s", status.toString().c_str());
        Common::shutdownLogging();
        return 3;
    }

    const Auditor::BatchSummary summary = Auditor::BatchReporter::summarize(results);
    Auditor::BatchReporter::printReport(results, summary, verbose);

    if (json_path) {
        status = Auditor::BatchReporter::exportJSON(results, summary, json_path, guard);
        if (!status.isOk()) {
            fprintf(stderr, "Error: %s\n", status.message().c_str());
            LOG_ERROR("JSON export failed: %s", status.toString().c_str());
            Common::shutdownLogging();
            return 3;
        }
        printf("JSON report exported to: %s\n", json_path);
    }

    const int exit_code = (fail_on_unsafe && summary.unsafe > 0) ? 1 : 0;

    printf("\n");
    printf("==============================================\n");
    if (summary.unsafe == 0) {
        printf("AUDIT PASSED - %zu module%s, all safe\n", summary.total, summary.total == 1 ? "" : "s");
    } else {
        printf("AUDIT FOUND %zu UNSAFE MODULE%s - Exit code: %d\n", summary.unsafe,
               summary.unsafe == 1 ? "" : "S", exit_code);
    }
    printf("==============================================\n");

    LOG_INFO("Audit complete: %zu total, %zu safe, %zu unsafe", summary.total, summary.safe, summary.unsafe);
    Common::shutdownLogging();
    return exit_code;
}
