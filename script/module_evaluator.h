#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "common/status.h"

namespace Markgate::Dom {
class HtmlDocument;
}

namespace Markgate::Script {

/// Everything a transform sees while it runs. Non-owning.
struct TransformContext {
    Dom::HtmlDocument* document{nullptr};
    Dom::HtmlDocument* reference{nullptr};                 // Optional template document
    const std::map<std::string, std::string>* data{nullptr};
};

/// One named, callable transform procedure.
class TransformUnit {
public:
    virtual ~TransformUnit() = default;

    [[nodiscard]] virtual const std::string& name() const noexcept = 0;
    [[nodiscard]] virtual const std::string& description() const noexcept = 0;
    [[nodiscard]] virtual std::optional<double> order() const noexcept = 0;

    /// Runs the transform against context.document. TRANSFORM_EXECUTION on
    /// any error raised by the module code.
    virtual Common::Status apply(TransformContext& context) = 0;
};

/// Turns a module file into a TransformUnit. Units are only valid while the
/// evaluator that produced them is alive.
class ModuleEvaluator {
public:
    virtual ~ModuleEvaluator() = default;

    /// MODULE_LOAD_FAILURE when the source fails to evaluate,
    /// STRUCTURAL_INVALID when it evaluates but exports no transform.
    /// fallback_name is used when the module declares no name.
    virtual Common::Status evaluate(const std::string& path, const std::string& fallback_name,
                                    std::unique_ptr<TransformUnit>& out) = 0;
};

} // namespace Markgate::Script
