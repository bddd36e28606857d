#pragma once

#include <array>
#include <cstdint>

namespace Auditor {

/// Severity tiers; HIGH and CRITICAL matches block a module outright
enum class Severity : uint8_t {
    LOW = 0,       // Noise worth surfacing (console output)
    MEDIUM = 1,    // Environment/network reach
    HIGH = 2,      // Filesystem mutation, debug hooks
    CRITICAL = 3   // Code evaluation, process spawning, native code
};

[[nodiscard]] constexpr const char* severityToString(Severity s) noexcept {
    switch (s) {
        case Severity::LOW:      return "low";
        case Severity::MEDIUM:   return "medium";
        case Severity::HIGH:     return "high";
        case Severity::CRITICAL: return "critical";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool isBlocking(Severity s) noexcept {
    return s == Severity::HIGH || s == Severity::CRITICAL;
}

/// One lexical rule of the risk catalog
struct RiskPattern {
    const char* pattern;      // ECMAScript regex over the module source
    const char* description;
    Severity severity;
    uint32_t weight;          // Risk points per occurrence, saturates at 2x
};

/// Dangerous constructs in Lua transform modules. Order is the order
/// warnings are reported in. Call patterns also match the single-argument
/// call forms without parentheses: f "s", f [[s]], f {t}.
inline constexpr std::array<RiskPattern, 27> kRiskCatalog{{
    // Process execution and code evaluation
    {R"(\bos\s*\.\s*execute\s*[('"\[{])",           "os.execute() process execution",          Severity::CRITICAL, 10},
    {R"(\bio\s*\.\s*popen\s*[('"\[{])",             "io.popen() process spawn",                Severity::CRITICAL, 10},
    {R"((?:^|[^\w.:])load\s*[('"\[{])",             "load() dynamic code evaluation",          Severity::CRITICAL, 10},
    {R"(\bloadstring\s*[('"\[{])",                  "loadstring() dynamic code evaluation",    Severity::CRITICAL, 10},
    {R"(\bdofile\s*[('"\[{])",                      "dofile() external code execution",        Severity::CRITICAL, 10},
    {R"(\bloadfile\s*[('"\[{])",                    "loadfile() external code loading",        Severity::CRITICAL, 10},
    {R"(\bpackage\s*\.\s*loadlib\s*[('"\[{])",      "package.loadlib() native library loading", Severity::CRITICAL, 10},
    {R"(\brequire\s*\(?\s*["']ffi["'])",            "ffi module import",                       Severity::CRITICAL, 10},

    // File system
    {R"(\bio\s*\.\s*open\s*[('"\[{])",              "io.open() file access",                   Severity::HIGH, 8},
    {R"(\bio\s*\.\s*lines\s*[('"\[{])",             "io.lines() file read",                    Severity::HIGH, 7},
    {R"(\bio\s*\.\s*output\s*[('"\[{])",            "io.output() stream redirection",          Severity::HIGH, 8},
    {R"(\bio\s*\.\s*input\s*[('"\[{])",             "io.input() stream redirection",           Severity::HIGH, 7},
    {R"(\bos\s*\.\s*remove\s*[('"\[{])",            "os.remove() file deletion",               Severity::HIGH, 8},
    {R"(\bos\s*\.\s*rename\s*[('"\[{])",            "os.rename() file rename",                 Severity::HIGH, 8},
    {R"(\brequire\s*\(?\s*["']lfs["'])",            "lfs module import",                       Severity::HIGH, 8},

    // Runtime introspection and dynamic loading
    {R"(\bdebug\s*\.\s*\w+)",                       "debug library access",                    Severity::HIGH, 8},
    {R"(\b(?:setfenv|getfenv)\s*[('"\[{])",         "setfenv()/getfenv() environment manipulation", Severity::HIGH, 7},
    {R"(\brequire\s*\(\s*[^'"\[\s])",               "Dynamic require() call",                  Severity::HIGH, 7},

    // Network and process environment
    {R"(\brequire\s*\(?\s*["'](?:socket|ssl|http)(?:\.\w+)?["'])", "network module import", Severity::MEDIUM, 6},
    {R"(\bos\s*\.\s*exit\s*[('"\[{])",              "os.exit() call",                          Severity::MEDIUM, 6},
    {R"(\bos\s*\.\s*getenv\s*[('"\[{])",            "os.getenv() environment access",          Severity::MEDIUM, 5},
    {R"(\bos\s*\.\s*tmpname\s*[('"\[{])",           "os.tmpname() temp file creation",         Severity::MEDIUM, 5},
    {R"(\bstring\s*\.\s*dump\s*[('"\[{])",          "string.dump() bytecode extraction",       Severity::MEDIUM, 5},
    {R"(\bpackage\s*\.\s*c?path\b)",                "package.path/cpath access",               Severity::MEDIUM, 5},

    // Low impact
    {R"(\b_G\s*\[)",                                "_G global table indexing",                Severity::LOW, 3},
    {R"(\bcollectgarbage\s*[('"\[{])",              "collectgarbage() call",                   Severity::LOW, 2},
    {R"(\bprint\s*[('"\[{])",                       "print() console output",                  Severity::LOW, 1},
}};

} // namespace Auditor
