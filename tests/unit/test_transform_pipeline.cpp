#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/path_guard.h"
#include "dom/html_document.h"
#include "dom/selector.h"
#include "test_support.h"
#include "transform/transform_pipeline.h"
#include "transform/transformer.h"

using Common::ErrorKind;
using Common::PathGuard;
using Common::Status;
using Markgate::PipelineContext;
using Markgate::PipelineResult;
using Markgate::TransformOptions;
using Markgate::Transformer;
using Markgate::TransformPipeline;
using Markgate::Dom::HtmlDocument;

namespace {

constexpr const char* kAddStepClass = R"(return {
    name = "step-one",
    transform = function(ctx)
        ctx.document:query(".content"):add_class("step-one")
    end,
}
)";

constexpr const char* kReadStepClass = R"(return {
    name = "step-two",
    transform = function(ctx)
        local content = ctx.document:query(".content")
        if content:has_class("step-one") then
            content:query(".old-class"):set_text("saw step one")
        end
    end,
}
)";

constexpr const char* kUnsafeModule = R"(return {
    transform = function(ctx)
        os.execute("touch /tmp/pwned")
    end,
}
)";

constexpr const char* kBrokenModule = R"(return {
    name = "broken",
    transform = function(ctx)
        error("kaboom")
    end,
}
)";

} // namespace

class TransformPipelineTest : public MarkgateTestBase {
protected:
    void SetUp() override {
        MarkgateTestBase::SetUp();
        std::filesystem::create_directories(path("mods"));
        ASSERT_TRUE(HtmlDocument::parse(kSampleHtml, "sample.html", doc_).isOk());
    }

    std::string module(const std::string& file_name, const std::string& source) {
        return writeFile("mods/" + file_name, source);
    }

    Status run(const std::vector<std::string>& paths, PipelineResult& result,
               HtmlDocument* reference = nullptr, const std::map<std::string, std::string>* data = nullptr) {
        PipelineContext context;
        context.modules_dir = path("mods");
        context.reference = reference;
        context.data = data;
        TransformPipeline pipeline(guard_);
        return pipeline.run(*doc_, paths, context, result);
    }

    std::string text(const std::string& selector_text) {
        Markgate::Dom::Selector selector;
        EXPECT_TRUE(Markgate::Dom::Selector::compile(selector_text, selector).isOk());
        xmlNodePtr node = doc_->query(selector);
        return node ? Markgate::Dom::textContent(node) : std::string();
    }

    PathGuard guard_;
    std::unique_ptr<HtmlDocument> doc_;
};

// ========== Ordering ==========

TEST_F(TransformPipelineTest, NumericPrefix) {
    EXPECT_EQ(TransformPipeline::numericPrefix("01-title.lua"), 1u);
    EXPECT_EQ(TransformPipeline::numericPrefix("10-footer.lua"), 10u);
    EXPECT_EQ(TransformPipeline::numericPrefix("header.lua"), TransformPipeline::NO_PREFIX);
    EXPECT_EQ(TransformPipeline::numericPrefix("99999999999999999999999-big.lua"), TransformPipeline::NO_PREFIX - 1);
}

TEST_F(TransformPipelineTest, OrdersByNumericPrefixThenName) {
    const std::vector<std::string> ordered = TransformPipeline::orderModules(
        {"update-header.lua", "10-z.lua", "2-b.lua", "01-a.lua", "03-c.lua", "alpha.lua"}, {});
    EXPECT_EQ(ordered, (std::vector<std::string>{
                           "01-a.lua", "2-b.lua", "03-c.lua", "10-z.lua", "alpha.lua", "update-header.lua"}));
}

TEST_F(TransformPipelineTest, ExplicitOrderWinsThenRestSorted) {
    const std::vector<std::string> ordered = TransformPipeline::orderModules(
        {"a.lua", "b.lua", "c.lua", "d.lua"}, {"c.lua", "missing.lua", "a.lua", "c.lua"});
    EXPECT_EQ(ordered, (std::vector<std::string>{"c.lua", "a.lua", "b.lua", "d.lua"}));
}

TEST_F(TransformPipelineTest, ListModules) {
    module("02-b.lua", kTitleModule);
    module("01-a.lua", kTitleModule);
    module("readme.md", "# notes");
    module(".hidden.lua", kTitleModule);

    std::vector<std::string> files;
    ASSERT_TRUE(TransformPipeline::listModules(path("mods"), files).isOk());
    EXPECT_EQ(files, (std::vector<std::string>{"01-a.lua", "02-b.lua"}));

    EXPECT_EQ(TransformPipeline::listModules(path("none"), files).kind(), ErrorKind::IO_FAILURE);
}

// ========== Running ==========

TEST_F(TransformPipelineTest, AppliesModuleToDocument) {
    // === GIVEN ===
    const std::string title = module("01-title.lua", kTitleModule);

    // === WHEN ===
    PipelineResult result;
    const Status status = run({title}, result);

    // === THEN ===
    ASSERT_TRUE(status.isOk()) << status.toString();
    EXPECT_EQ(text("title"), "Updated");
    EXPECT_EQ(result.applied, (std::vector<std::string>{"update-title"}));
    EXPECT_TRUE(result.skipped.empty());
}

TEST_F(TransformPipelineTest, LaterModulesSeeEarlierEdits) {
    const std::string one = module("01-one.lua", kAddStepClass);
    const std::string two = module("02-two.lua", kReadStepClass);

    PipelineResult result;
    ASSERT_TRUE(run({one, two}, result).isOk());
    EXPECT_EQ(text(".old-class"), "saw step one");
    EXPECT_EQ(result.applied, (std::vector<std::string>{"step-one", "step-two"}));
}

TEST_F(TransformPipelineTest, UnsafeModuleAbortsBeforeAnyTransform) {
    const std::string title = module("01-title.lua", kTitleModule);
    const std::string evil = module("02-evil.lua", kUnsafeModule);

    PipelineResult result;
    const Status status = run({title, evil}, result);
    EXPECT_EQ(status.kind(), ErrorKind::SECURITY_REJECTION);
    EXPECT_EQ(text("title"), "Original Title") << "Nothing runs when any module is rejected";
    EXPECT_TRUE(result.applied.empty());
}

TEST_F(TransformPipelineTest, SkipSecurityCheckAdmitsFlaggedModules) {
    const std::string flagged = module("01-flagged.lua", R"(return {
    transform = function(ctx)
        local home = os.getenv("HOME") or os.getenv("USERPROFILE")
        ctx.document:query("title"):set_text("admitted")
    end,
}
)");
    PipelineContext context;
    context.modules_dir = path("mods");
    context.skip_security_check = true;
    TransformPipeline pipeline(guard_);
    PipelineResult result;
    ASSERT_TRUE(pipeline.run(*doc_, {flagged}, context, result).isOk());
    EXPECT_EQ(text("title"), "admitted");
}

TEST_F(TransformPipelineTest, StructurallyInvalidModuleIsSkipped) {
    const std::string shape = module("01-shape.lua", "local transform = 5\nreturn { transform = transform }\n");
    const std::string title = module("02-title.lua", kTitleModule);

    PipelineResult result;
    const Status status = run({shape, title}, result);
    ASSERT_TRUE(status.isOk()) << status.toString();
    EXPECT_EQ(result.skipped, (std::vector<std::string>{shape}));
    EXPECT_EQ(result.applied, (std::vector<std::string>{"update-title"}));
    EXPECT_EQ(text("title"), "Updated");
}

TEST_F(TransformPipelineTest, FailingTransformStopsTheRun) {
    const std::string title = module("01-title.lua", kTitleModule);
    const std::string broken = module("02-broken.lua", kBrokenModule);
    const std::string step = module("03-step.lua", kAddStepClass);

    PipelineResult result;
    const Status status = run({title, broken, step}, result);
    ASSERT_EQ(status.kind(), ErrorKind::TRANSFORM_EXECUTION);
    EXPECT_NE(status.message().find("Transform 'broken' failed"), std::string::npos);
    EXPECT_NE(status.message().find("kaboom"), std::string::npos);
    EXPECT_EQ(result.applied, (std::vector<std::string>{"update-title"}));
}

TEST_F(TransformPipelineTest, ScriptErrorsFromBindingsAreTransformErrors) {
    const std::string bad = module("01-bad-selector.lua", R"(return {
    name = "bad-selector",
    transform = function(ctx)
        ctx.document:query("div >")
    end,
}
)");
    PipelineResult result;
    const Status status = run({bad}, result);
    EXPECT_EQ(status.kind(), ErrorKind::TRANSFORM_EXECUTION);
    EXPECT_NE(status.message().find("Invalid selector"), std::string::npos);
}

TEST_F(TransformPipelineTest, ContextExposesConfigAndTemplate) {
    // === GIVEN ===
    std::unique_ptr<HtmlDocument> reference;
    ASSERT_TRUE(HtmlDocument::parse(
        "<html><body><footer class=\"site\"><p>Shared footer</p></footer></body></html>", "reference.html",
        reference).isOk());
    const std::map<std::string, std::string> data{{"title", "From Config"}};
    const std::string apply = module("01-apply.lua", R"(return {
    name = "apply-template",
    transform = function(ctx)
        ctx.document:query("title"):set_text(ctx.config.title)
        local source = ctx.template:query("footer")
        local footer = ctx.document:create_element("footer")
        ctx.utils.copy_attributes(source, footer)
        footer:set_inner_html(source:inner_html())
        ctx.document:query("body"):append_child(footer)
    end,
}
)");

    // === WHEN ===
    PipelineResult result;
    const Status status = run({apply}, result, reference.get(), &data);

    // === THEN ===
    ASSERT_TRUE(status.isOk()) << status.toString();
    EXPECT_EQ(text("title"), "From Config");
    EXPECT_EQ(text("body > footer.site > p"), "Shared footer");
}

TEST_F(TransformPipelineTest, TemplateIsNilWithoutReference) {
    const std::string check = module("01-check.lua", R"(return {
    name = "check",
    transform = function(ctx)
        if ctx.template ~= nil then error("template should be nil") end
        if ctx.config.title ~= nil then error("config should be empty") end
    end,
}
)");
    PipelineResult result;
    const Status status = run({check}, result);
    EXPECT_TRUE(status.isOk()) << status.toString();
}

TEST_F(TransformPipelineTest, WarningsAreReportedAsDiagnostics) {
    const std::string chatty = module("01-chatty.lua", R"(return {
    name = "chatty",
    transform = function(ctx)
        print("hello")
    end,
}
)");
    PipelineResult result;
    ASSERT_TRUE(run({chatty}, result).isOk());
    EXPECT_EQ(result.diagnostics, (std::vector<std::string>{"01-chatty.lua: print() console output (1 occurrence)"}));
}

TEST_F(TransformPipelineTest, ModulesOutsideTheDirectoryAbort) {
    const std::string outside = writeFile("elsewhere/01-title.lua", kTitleModule);
    PipelineResult result;
    EXPECT_EQ(run({outside}, result).kind(), ErrorKind::PATH_VIOLATION);
}

// ========== Transformer ==========

class TransformerTest : public MarkgateTestBase {
protected:
    TransformOptions options(const std::vector<std::string>& module_paths) {
        TransformOptions opts;
        opts.transforms_dir = path("mods");
        opts.module_paths = module_paths;
        opts.no_format = true;
        return opts;
    }

    PathGuard guard_;
};

TEST_F(TransformerTest, InputBase) {
    EXPECT_EQ(Transformer::inputBase("src/**/*.html"), "src");
    EXPECT_EQ(Transformer::inputBase("pages/*.html"), "pages");
    EXPECT_EQ(Transformer::inputBase("index.html"), ".");
    EXPECT_EQ(Transformer::inputBase("*.html"), ".");
    EXPECT_EQ(Transformer::inputBase("/srv/site/index.html"), "/srv/site");
    EXPECT_EQ(Transformer::inputBase("/*.html"), "/");
    EXPECT_EQ(Transformer::inputBase("../input/**/*.html"), "../input");
}

TEST_F(TransformerTest, ExpandInputs) {
    writeFile("in/index.html", kSampleHtml);
    writeFile("in/blog/post.html", kSampleHtml);
    writeFile("in/blog/2026/deep.html", kSampleHtml);
    writeFile("in/notes.txt", "not html");

    std::vector<std::string> files;
    ASSERT_TRUE(Transformer::expandInputs(path("in") + "/**/*.html", files).isOk());
    EXPECT_EQ(files, (std::vector<std::string>{
                         path("in/blog/2026/deep.html"), path("in/blog/post.html"), path("in/index.html")}));

    ASSERT_TRUE(Transformer::expandInputs(path("in") + "/*.html", files).isOk());
    EXPECT_EQ(files, (std::vector<std::string>{path("in/index.html")}));

    const Status status = Transformer::expandInputs(path("in") + "/*.xml", files);
    EXPECT_EQ(status.kind(), ErrorKind::MISSING_RESOURCE);
    EXPECT_NE(status.message().find("No files found matching pattern"), std::string::npos);
}

TEST_F(TransformerTest, TransformFile) {
    const std::string title = writeFile("mods/01-title.lua", kTitleModule);
    const std::string input = writeFile("in/index.html", kSampleHtml);

    Transformer transformer(guard_, options({title}));
    std::string html;
    PipelineResult result;
    const Status status = transformer.transformFile(input, html, result);
    ASSERT_TRUE(status.isOk()) << status.toString();
    EXPECT_NE(html.find("<title>Updated</title>"), std::string::npos);
    EXPECT_EQ(readFile(input), kSampleHtml) << "Input files are never modified";
}

TEST_F(TransformerTest, ReferenceIsFreshForEveryInput) {
    const std::string reference = writeFile("reference.html",
                                            "<html><body><footer>Shared</footer></body></html>");
    const std::string mutate = writeFile("mods/01-mutate.lua", R"(return {
    name = "mutate",
    transform = function(ctx)
        local footer = ctx.template:query("footer")
        ctx.document:query("title"):set_text(footer:text())
        footer:set_text("mutated")
    end,
}
)");
    const std::string first = writeFile("in/a.html", kSampleHtml);
    const std::string second = writeFile("in/b.html", kSampleHtml);

    TransformOptions opts = options({mutate});
    opts.reference = reference;
    Transformer transformer(guard_, opts);

    for (const std::string& input : {first, second}) {
        std::string html;
        PipelineResult result;
        ASSERT_TRUE(transformer.transformFile(input, html, result).isOk());
        EXPECT_NE(html.find("<title>Shared</title>"), std::string::npos) << input;
    }
}

TEST_F(TransformerTest, FormattingFollowsOptions) {
    const std::string title = writeFile("mods/01-title.lua", kTitleModule);
    const std::string input = writeFile("in/index.html", "<html><head><title>x</title></head><body><div><p>a</p></div></body></html>");

    TransformOptions opts = options({title});
    opts.no_format = false;
    Transformer formatted(guard_, opts);
    std::string html;
    PipelineResult result;
    ASSERT_TRUE(formatted.transformFile(input, html, result).isOk());
    EXPECT_NE(html.find("<title>Updated</title>"), std::string::npos);

    opts.dry_run = true;
    Transformer dry(guard_, opts);
    std::string dry_html;
    ASSERT_TRUE(dry.transformFile(input, dry_html, result).isOk());
    EXPECT_NE(dry_html.find("<title>Updated</title>"), std::string::npos);
}

TEST_F(TransformerTest, MissingInputIsReported) {
    Transformer transformer(guard_, options({}));
    std::string html;
    PipelineResult result;
    EXPECT_EQ(transformer.transformFile(path("in/none.html"), html, result).kind(), ErrorKind::MISSING_RESOURCE);
}
