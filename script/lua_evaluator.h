#pragma once

#include <memory>
#include <string>

#include "script/module_evaluator.h"

struct lua_State;

namespace Markgate::Script {

/// Evaluates Lua transform modules inside one interpreter state.
///
/// A module file is a chunk returning a table (or a table under `default`):
///   return { name = "...", description = "...", order = 1,
///            transform = function(ctx) ... end }
/// The state is closed when the evaluator is destroyed, which invalidates
/// every unit it created.
class LuaEvaluator final : public ModuleEvaluator {
public:
    LuaEvaluator();
    ~LuaEvaluator() override;

    // Delete copy/move constructors
    LuaEvaluator(const LuaEvaluator&) = delete;
    LuaEvaluator& operator=(const LuaEvaluator&) = delete;
    LuaEvaluator(LuaEvaluator&&) = delete;
    LuaEvaluator& operator=(LuaEvaluator&&) = delete;

    Common::Status evaluate(const std::string& path, const std::string& fallback_name,
                            std::unique_ptr<TransformUnit>& out) override;

    [[nodiscard]] lua_State* state() const noexcept { return state_; }

private:
    lua_State* state_;
};

} // namespace Markgate::Script
