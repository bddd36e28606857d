#include <gtest/gtest.h>

#include <algorithm>
#include <string>

#include "auditor/risk_analyzer.h"
#include "test_support.h"

using Auditor::RiskAnalyzer;
using Auditor::SecurityAnalysis;
using Auditor::Severity;

class RiskAnalyzerTest : public MarkgateTestBase {
protected:
    static bool contains(const std::vector<std::string>& list, const std::string& value) {
        return std::find(list.begin(), list.end(), value) != list.end();
    }

    // Wraps a body in a structurally valid module
    static std::string module(const std::string& body) {
        return "return {\n  transform = function(ctx)\n" + body + "\n  end,\n}\n";
    }
};

// ========== Verdicts ==========

TEST_F(RiskAnalyzerTest, CleanModuleIsSafe) {
    const SecurityAnalysis analysis = RiskAnalyzer::analyze(kTitleModule);
    EXPECT_TRUE(analysis.safe);
    EXPECT_DOUBLE_EQ(analysis.risk_score, 0.0);
    EXPECT_TRUE(analysis.warnings.empty());
    EXPECT_TRUE(analysis.blocked_patterns.empty());
    EXPECT_TRUE(analysis.structure_valid);
    EXPECT_EQ(analysis.content_hash.size(), 64u);
}

TEST_F(RiskAnalyzerTest, DynamicLoadIsBlocked) {
    const SecurityAnalysis analysis = RiskAnalyzer::analyze(module(R"(    local f = load("x"))"));
    EXPECT_FALSE(analysis.safe);
    EXPECT_DOUBLE_EQ(analysis.risk_score, 10.0);
    ASSERT_EQ(analysis.blocked_patterns.size(), 1u);
    EXPECT_EQ(analysis.blocked_patterns[0], "load() dynamic code evaluation (1 occurrence)");
    EXPECT_TRUE(contains(analysis.warnings, analysis.blocked_patterns[0]));
}

TEST_F(RiskAnalyzerTest, LoadLookalikesAreNotDynamicLoad) {
    const SecurityAnalysis analysis = RiskAnalyzer::analyze(module(
        "    local a = ctx.load(1)\n    local b = obj:load(2)\n    local c = reload(3)"));
    EXPECT_TRUE(analysis.blocked_patterns.empty());
    EXPECT_TRUE(analysis.safe);
}

TEST_F(RiskAnalyzerTest, EachCriticalConstructIsBlocked) {
    const char* bodies[] = {
        R"(os.execute("ls"))",
        R"(local p = io.popen("ls"))",
        R"(local f = loadstring("return 1"))",
        R"(dofile("x.lua"))",
        R"(local f = loadfile("x.lua"))",
        R"(package.loadlib("lib.so", "init"))",
        R"(local ffi = require("ffi"))",
        R"(local ffi = require "ffi")",
    };
    for (const char* body : bodies) {
        const SecurityAnalysis analysis = RiskAnalyzer::analyze(module(body));
        EXPECT_FALSE(analysis.safe) << body;
        EXPECT_FALSE(analysis.blocked_patterns.empty()) << body;
        EXPECT_DOUBLE_EQ(analysis.risk_score, 10.0) << body;
    }
}

TEST_F(RiskAnalyzerTest, CallsWithoutParenthesesAreDetected) {
    // Lua calls with a single string or table argument need no parentheses
    const struct {
        const char* body;
        const char* blocked;
    } cases[] = {
        {R"(os.execute "touch /tmp/marker")", "os.execute() process execution (1 occurrence)"},
        {R"(local p = io.popen "id")", "io.popen() process spawn (1 occurrence)"},
        {R"(local f = load "return 1")", "load() dynamic code evaluation (1 occurrence)"},
        {R"(local f = load[[return 1]])", "load() dynamic code evaluation (1 occurrence)"},
        {R"(local f = loadstring [[return 1]])", "loadstring() dynamic code evaluation (1 occurrence)"},
        {R"(local f = io.open "/etc/passwd")", "io.open() file access (1 occurrence)"},
        {R"(local f = io.open'/etc/passwd')", "io.open() file access (1 occurrence)"},
        {R"(os.remove "index.html")", "os.remove() file deletion (1 occurrence)"},
        {R"(package.loadlib{"lib.so", "init"})", "package.loadlib() native library loading (1 occurrence)"},
    };
    for (const auto& c : cases) {
        const SecurityAnalysis analysis = RiskAnalyzer::analyze(module(c.body));
        EXPECT_FALSE(analysis.safe) << c.body;
        EXPECT_TRUE(contains(analysis.blocked_patterns, c.blocked)) << c.body;
    }

    const SecurityAnalysis env = RiskAnalyzer::analyze(module(R"(    local home = os.getenv "HOME")"));
    EXPECT_TRUE(contains(env.warnings, "os.getenv() environment access (1 occurrence)"));
}

TEST_F(RiskAnalyzerTest, HighSeverityBlocksEvenWithLowScore) {
    const SecurityAnalysis analysis = RiskAnalyzer::analyze(module(R"(    local f = io.lines("a.txt"))"));
    EXPECT_DOUBLE_EQ(analysis.risk_score, 7.0);
    EXPECT_FALSE(analysis.safe);
    EXPECT_TRUE(contains(analysis.blocked_patterns, "io.lines() file read (1 occurrence)"));
}

TEST_F(RiskAnalyzerTest, MediumPatternsAccumulateWithoutBlocking) {
    const SecurityAnalysis analysis = RiskAnalyzer::analyze(module(
        "    local home = os.getenv(\"HOME\")\n    local tmp = os.getenv(\"TMP\")"));
    EXPECT_TRUE(analysis.blocked_patterns.empty());
    EXPECT_DOUBLE_EQ(analysis.risk_score, 10.0);
    EXPECT_FALSE(analysis.safe) << "Score at or above threshold is unsafe";
    EXPECT_TRUE(contains(analysis.warnings, "os.getenv() environment access (2 occurrences)"));
}

TEST_F(RiskAnalyzerTest, RepeatedPatternSaturatesAtTwiceWeight) {
    const SecurityAnalysis analysis = RiskAnalyzer::analyze(module(
        "    print(1)\n    print(2)\n    print(3)\n    print(4)"));
    EXPECT_DOUBLE_EQ(analysis.risk_score, 2.0);
    EXPECT_TRUE(analysis.safe) << "Low severity warnings alone keep a module safe";
    ASSERT_EQ(analysis.warnings.size(), 1u);
    EXPECT_EQ(analysis.warnings[0], "print() console output (4 occurrences)");
}

TEST_F(RiskAnalyzerTest, ScoreIsClampedToTen) {
    const SecurityAnalysis analysis = RiskAnalyzer::analyze(module(
        "    os.execute('a')\n    io.open('b')\n    os.remove('c')\n    os.exit(1)"));
    EXPECT_DOUBLE_EQ(analysis.risk_score, RiskAnalyzer::MAX_RISK_SCORE);
    EXPECT_EQ(analysis.blocked_patterns.size(), 3u);
}

TEST_F(RiskAnalyzerTest, ScoreIsMonotonicInDistinctPatterns) {
    const double one = RiskAnalyzer::analyze(module("    print(1)")).risk_score;
    const double two = RiskAnalyzer::analyze(module("    print(1)\n    collectgarbage()")).risk_score;
    const double three = RiskAnalyzer::analyze(module("    print(1)\n    collectgarbage()\n    local g = _G[\"x\"]")).risk_score;
    EXPECT_LE(one, two);
    EXPECT_LE(two, three);
    EXPECT_DOUBLE_EQ(three, 6.0);
}

// ========== Structure ==========

TEST_F(RiskAnalyzerTest, MissingStructureAddsPenalty) {
    const SecurityAnalysis analysis = RiskAnalyzer::analyze("local x = 1\nprint(x)\n");
    EXPECT_FALSE(analysis.structure_valid);
    EXPECT_FALSE(analysis.safe);
    EXPECT_DOUBLE_EQ(analysis.risk_score, 4.0);
    ASSERT_FALSE(analysis.warnings.empty());
    EXPECT_EQ(analysis.warnings.back(), RiskAnalyzer::STRUCTURE_WARNING);
}

TEST_F(RiskAnalyzerTest, RecognizedModuleShapes) {
    EXPECT_TRUE(RiskAnalyzer::validateStructure(
        "local M = {}\nfunction M.transform(ctx) end\nreturn M\n"));
    EXPECT_TRUE(RiskAnalyzer::validateStructure(
        "local M = {}\nfunction M:transform(ctx) end\nreturn M -- module\n"));
    EXPECT_TRUE(RiskAnalyzer::validateStructure(
        "return { [\"transform\"] = function(ctx) end }"));
    EXPECT_TRUE(RiskAnalyzer::validateStructure(
        "local function transform(ctx) end\nreturn { transform = transform }"));
    EXPECT_TRUE(RiskAnalyzer::validateStructure(
        "local function apply(ctx) end\nreturn { name = 'x', transform = apply }"));
    EXPECT_TRUE(RiskAnalyzer::validateStructure(
        "local M = {}\nfunction M.transform(ctx) end\nreturn M;\n\n-- history\n  -- v2\n\n"));
}

TEST_F(RiskAnalyzerTest, RejectedModuleShapes) {
    EXPECT_FALSE(RiskAnalyzer::validateStructure("return { name = \"x\" }"));
    EXPECT_FALSE(RiskAnalyzer::validateStructure(
        "local M = {}\nfunction M.transform(ctx) end\nreturn M\nM.extra = 1\n"));
    EXPECT_FALSE(RiskAnalyzer::validateStructure(
        "local M = {}\nfunction M.transform(ctx) end\n-- return M\n"));
    EXPECT_FALSE(RiskAnalyzer::validateStructure("transform = function(ctx) end"));
    EXPECT_FALSE(RiskAnalyzer::validateStructure(""));
}

TEST_F(RiskAnalyzerTest, LongTrailingCommentsAndBlankLines) {
    // === GIVEN === a module followed by a long changelog and blank lines
    std::string source = "local M = {}\nfunction M.transform(ctx)\n  ctx.document:query('h1'):set_text('x')\nend\nreturn M\n";
    for (int i = 0; i < 2000; ++i) {
        source += "-- changelog entry " + std::to_string(i) + ": adjusted heading markup and spacing\n";
    }
    source.append(50000, '\n');
    ASSERT_GT(source.size(), 100u * 1024u);

    // === WHEN ===
    const SecurityAnalysis analysis = RiskAnalyzer::analyze(source);

    // === THEN ===
    EXPECT_TRUE(analysis.structure_valid);
    EXPECT_TRUE(analysis.safe);
    EXPECT_DOUBLE_EQ(analysis.risk_score, 0.0);

    std::string table_module = module("    ctx.document:query('h1'):set_text('x')");
    table_module.append(120000, ' ');
    EXPECT_TRUE(RiskAnalyzer::analyze(table_module).structure_valid);
}

// ========== Hash and determinism ==========

TEST_F(RiskAnalyzerTest, ContentHashIsSha256) {
    EXPECT_EQ(RiskAnalyzer::contentHash(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(RiskAnalyzer::contentHash("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(RiskAnalyzerTest, AnalysisIsDeterministic) {
    const std::string source = module("    print('a')\n    os.getenv('B')");
    const SecurityAnalysis first = RiskAnalyzer::analyze(source);
    const SecurityAnalysis second = RiskAnalyzer::analyze(source);
    EXPECT_EQ(first.safe, second.safe);
    EXPECT_DOUBLE_EQ(first.risk_score, second.risk_score);
    EXPECT_EQ(first.warnings, second.warnings);
    EXPECT_EQ(first.blocked_patterns, second.blocked_patterns);
    EXPECT_EQ(first.content_hash, second.content_hash);
    EXPECT_GE(first.risk_score, 0.0);
    EXPECT_LE(first.risk_score, 10.0);
}

// ========== Files and catalog ==========

TEST_F(RiskAnalyzerTest, AnalyzeFile) {
    const std::string file = writeFile("01-title.lua", kTitleModule);
    SecurityAnalysis analysis;
    ASSERT_TRUE(RiskAnalyzer::analyzeFile(file, analysis).isOk());
    EXPECT_TRUE(analysis.safe);
    EXPECT_EQ(analysis.content_hash, RiskAnalyzer::contentHash(kTitleModule));

    EXPECT_EQ(RiskAnalyzer::analyzeFile(path("missing.lua"), analysis).kind(), Common::ErrorKind::IO_FAILURE);
}

TEST_F(RiskAnalyzerTest, CatalogIsConsistent) {
    const auto& catalog = RiskAnalyzer::catalog();
    EXPECT_EQ(catalog.size(), 27u);
    for (const auto& pattern : catalog) {
        EXPECT_GT(pattern.weight, 0u) << pattern.description;
        EXPECT_LE(pattern.weight, 10u) << pattern.description;
        if (pattern.severity == Severity::CRITICAL) {
            EXPECT_EQ(pattern.weight, 10u) << pattern.description;
        }
        EXPECT_EQ(Auditor::isBlocking(pattern.severity),
                  pattern.severity == Severity::HIGH || pattern.severity == Severity::CRITICAL);
    }
}
