#include "script/lua_evaluator.h"

#include <cmath>
#include <cstring>

extern "C" {
#include <lauxlib.h>
#include <lua.h>
#include <lualib.h>
}

#include "common/logging.h"
#include "script/lua_dom_bindings.h"

namespace Markgate::Script {

using Common::ErrorKind;
using Common::Status;

namespace {

// Message handler appending a traceback to runtime errors
int tracebackHandler(lua_State* L) {
    const char* msg = lua_tostring(L, 1);
    if (msg == nullptr) {
        msg = luaL_tolstring(L, 1, nullptr);
    }
    luaL_traceback(L, L, msg, 1);
    return 1;
}

std::string popError(lua_State* L) {
    size_t len = 0;
    const char* msg = lua_tolstring(L, -1, &len);
    std::string out = msg ? std::string(msg, len) : std::string("(non-string error)");
    lua_pop(L, 1);
    return out;
}

// Pushes table[key] without invoking metamethods; the module table is read
// outside any protected call
void rawField(lua_State* L, int table, const char* key) {
    table = lua_absindex(L, table);
    lua_pushstring(L, key);
    lua_rawget(L, table);
}

std::string optStringField(lua_State* L, int table, const char* key) {
    rawField(L, table, key);
    std::string out;
    if (lua_type(L, -1) == LUA_TSTRING) {
        size_t len = 0;
        const char* s = lua_tolstring(L, -1, &len);
        out.assign(s, len);
    }
    lua_pop(L, 1);
    return out;
}

/// Transform function held in the registry of the evaluator's state
class LuaTransformUnit final : public TransformUnit {
public:
    LuaTransformUnit(lua_State* L, int function_ref, std::string name, std::string description,
                     std::optional<double> order)
        : state_(L), function_ref_(function_ref), name_(std::move(name)),
          description_(std::move(description)), order_(order) {}

    ~LuaTransformUnit() override {
        luaL_unref(state_, LUA_REGISTRYINDEX, function_ref_);
    }

    // Delete copy/move constructors
    LuaTransformUnit(const LuaTransformUnit&) = delete;
    LuaTransformUnit& operator=(const LuaTransformUnit&) = delete;

    const std::string& name() const noexcept override { return name_; }
    const std::string& description() const noexcept override { return description_; }
    std::optional<double> order() const noexcept override { return order_; }

    Status apply(TransformContext& context) override {
        lua_State* L = state_;
        const int base = lua_gettop(L);
        lua_pushcfunction(L, tracebackHandler);
        lua_rawgeti(L, LUA_REGISTRYINDEX, function_ref_);
        LuaDomBindings::pushContext(L, context);

        const int rc = lua_pcall(L, 1, 0, base + 1);
        if (rc != LUA_OK) {
            std::string error = popError(L);
            lua_settop(L, base);
            return Status::error(ErrorKind::TRANSFORM_EXECUTION, "Transform '%s' failed: %s",
                                 name_.c_str(), error.c_str());
        }
        lua_settop(L, base);
        return Status::ok();
    }

private:
    lua_State* state_;
    int function_ref_;
    std::string name_;
    std::string description_;
    std::optional<double> order_;
};

} // namespace

LuaEvaluator::LuaEvaluator() : state_(luaL_newstate()) {
    if (state_) {
        luaL_openlibs(state_);
        LuaDomBindings::registerTypes(state_);
    } else {
        LOG_ERROR("Failed to create Lua state");
    }
}

LuaEvaluator::~LuaEvaluator() {
    if (state_) {
        lua_close(state_);
    }
}

Status LuaEvaluator::evaluate(const std::string& path, const std::string& fallback_name,
                              std::unique_ptr<TransformUnit>& out) {
    if (!state_) {
        return Status::error(ErrorKind::MODULE_LOAD_FAILURE, "Lua state unavailable");
    }
    lua_State* L = state_;
    const int base = lua_gettop(L);

    lua_pushcfunction(L, tracebackHandler);
    int rc = luaL_loadfile(L, path.c_str());
    if (rc != LUA_OK) {
        std::string error = popError(L);
        lua_settop(L, base);
        return Status::error(ErrorKind::MODULE_LOAD_FAILURE, "Failed to load transform %s: %s",
                             path.c_str(), error.c_str());
    }
    rc = lua_pcall(L, 0, 1, base + 1);
    if (rc != LUA_OK) {
        std::string error = popError(L);
        lua_settop(L, base);
        return Status::error(ErrorKind::MODULE_LOAD_FAILURE, "Failed to evaluate transform %s: %s",
                             path.c_str(), error.c_str());
    }

    if (!lua_istable(L, -1)) {
        lua_settop(L, base);
        return Status::error(ErrorKind::STRUCTURAL_INVALID,
                             "Transform file does not export a valid transform function");
    }

    // Prefer module.default when it is a table
    rawField(L, -1, "default");
    if (lua_istable(L, -1)) {
        lua_remove(L, -2);
    } else {
        lua_pop(L, 1);
    }
    const int module = lua_gettop(L);

    rawField(L, module, "transform");
    if (!lua_isfunction(L, -1)) {
        lua_settop(L, base);
        return Status::error(ErrorKind::STRUCTURAL_INVALID,
                             "Transform file does not export a valid transform function");
    }
    const int function_ref = luaL_ref(L, LUA_REGISTRYINDEX);

    std::string name = optStringField(L, module, "name");
    if (name.empty()) {
        name = fallback_name;
    }
    std::string description = optStringField(L, module, "description");

    std::optional<double> order;
    rawField(L, module, "order");
    if (lua_type(L, -1) == LUA_TNUMBER) {
        const double value = lua_tonumber(L, -1);
        if (std::isfinite(value)) {
            order = value;
        }
    }
    lua_settop(L, base);

    out = std::make_unique<LuaTransformUnit>(L, function_ref, std::move(name), std::move(description), order);
    LOG_DEBUG("Evaluated transform module %s as '%s'", path.c_str(), out->name().c_str());
    return Status::ok();
}

} // namespace Markgate::Script
