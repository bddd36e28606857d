#pragma once

#include "script/module_evaluator.h"

struct lua_State;

namespace Markgate::Script {

/// Lua-side view of the DOM: document and element userdata plus the ctx
/// table handed to every transform.
///
///   ctx.document / ctx.template : query(sel) query_all(sel) create_element(tag) root() serialize()
///   element : tag() text() set_text(s) get_attribute(n) set_attribute(n, v)
///             remove_attribute(n) has_class(c) add_class(c, ...) remove_class(c)
///             query(sel) query_all(sel) children() parent() append_child(el)
///             remove() inner_html() set_inner_html(html) outer_html()
///   ctx.utils : copy_attributes(from, to) move_children(from, to) replace_element(old, new)
///   ctx.config : string table
///
/// Userdata only borrow nodes; the documents must outlive the state.
class LuaDomBindings {
public:
    static constexpr const char* NODE_METATABLE = "markgate.node";
    static constexpr const char* DOCUMENT_METATABLE = "markgate.document";

    // Delete copy/move constructors
    LuaDomBindings() = delete;
    LuaDomBindings(const LuaDomBindings&) = delete;
    LuaDomBindings& operator=(const LuaDomBindings&) = delete;

    /// Creates the metatables. Call once per state.
    static void registerTypes(lua_State* L);

    /// Pushes the ctx table for context.
    static void pushContext(lua_State* L, const TransformContext& context);
};

} // namespace Markgate::Script
