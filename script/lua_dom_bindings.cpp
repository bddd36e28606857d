#include "script/lua_dom_bindings.h"

#include <cctype>
#include <cstdio>
#include <string>
#include <vector>

extern "C" {
#include <lauxlib.h>
#include <lua.h>
}

#include "dom/html_document.h"
#include "dom/selector.h"

namespace Markgate::Script {

using Dom::HtmlDocument;

namespace {

// Errors are raised with luaL_error only once every C++ temporary in the
// binding is gone; fixed-size buffers carry the message out.
constexpr size_t ERROR_BUFFER_SIZE = 256;

struct NodeRef {
    xmlNodePtr node;
};

struct DocumentRef {
    HtmlDocument* document;
};

// ========== Userdata helpers ==========

void pushNode(lua_State* L, xmlNodePtr node) {
    if (!node) {
        lua_pushnil(L);
        return;
    }
    auto* ref = static_cast<NodeRef*>(lua_newuserdata(L, sizeof(NodeRef)));
    ref->node = node;
    luaL_setmetatable(L, LuaDomBindings::NODE_METATABLE);
}

void pushDocument(lua_State* L, HtmlDocument* document) {
    if (!document) {
        lua_pushnil(L);
        return;
    }
    auto* ref = static_cast<DocumentRef*>(lua_newuserdata(L, sizeof(DocumentRef)));
    ref->document = document;
    luaL_setmetatable(L, LuaDomBindings::DOCUMENT_METATABLE);
}

xmlNodePtr checkNode(lua_State* L, int index) {
    return static_cast<NodeRef*>(luaL_checkudata(L, index, LuaDomBindings::NODE_METATABLE))->node;
}

HtmlDocument* checkDocument(lua_State* L, int index) {
    return static_cast<DocumentRef*>(luaL_checkudata(L, index, LuaDomBindings::DOCUMENT_METATABLE))->document;
}

void pushNodeList(lua_State* L, const std::vector<xmlNodePtr>& nodes) {
    lua_createtable(L, static_cast<int>(nodes.size()), 0);
    lua_Integer i = 1;
    for (xmlNodePtr node : nodes) {
        pushNode(L, node);
        lua_rawseti(L, -2, i++);
    }
}

void pushString(lua_State* L, const std::string& s) {
    lua_pushlstring(L, s.data(), s.size());
}

// ========== Query ==========

bool runQuery(lua_State* L, const HtmlDocument* document, xmlNodePtr scope, const std::string& text,
              bool all, char* error, size_t error_size) {
    Dom::Selector selector;
    Common::Status status = Dom::Selector::compile(text, selector);
    if (!status.isOk()) {
        std::snprintf(error, error_size, "%s", status.message().c_str());
        return false;
    }
    if (all) {
        pushNodeList(L, document->queryAll(selector, scope));
    } else {
        pushNode(L, document->query(selector, scope));
    }
    return true;
}

int queryFrom(lua_State* L, const HtmlDocument* document, xmlNodePtr scope, bool all) {
    size_t len = 0;
    const char* text = luaL_checklstring(L, 2, &len);
    char error[ERROR_BUFFER_SIZE];
    if (!runQuery(L, document, scope, std::string(text, len), all, error, sizeof(error))) {
        return luaL_error(L, "%s", error);
    }
    return 1;
}

HtmlDocument* ownerOf(lua_State* L, xmlNodePtr node) {
    HtmlDocument* document = HtmlDocument::owner(node);
    if (!document) {
        luaL_error(L, "element does not belong to a document");
    }
    return document;
}

// ========== Document methods ==========

int documentQuery(lua_State* L) {
    return queryFrom(L, checkDocument(L, 1), nullptr, false);
}

int documentQueryAll(lua_State* L) {
    return queryFrom(L, checkDocument(L, 1), nullptr, true);
}

bool isValidTag(const char* tag, size_t len) noexcept {
    if (len == 0 || !std::isalpha(static_cast<unsigned char>(tag[0]))) {
        return false;
    }
    for (size_t i = 1; i < len; ++i) {
        const auto c = static_cast<unsigned char>(tag[i]);
        if (!std::isalnum(c) && c != '-') {
            return false;
        }
    }
    return true;
}

int documentCreateElement(lua_State* L) {
    HtmlDocument* document = checkDocument(L, 1);
    size_t len = 0;
    const char* tag = luaL_checklstring(L, 2, &len);
    if (!isValidTag(tag, len)) {
        return luaL_error(L, "invalid element name '%s'", tag);
    }
    pushNode(L, document->createElement(std::string(tag, len)));
    return 1;
}

int documentRoot(lua_State* L) {
    pushNode(L, checkDocument(L, 1)->root());
    return 1;
}

int documentSerialize(lua_State* L) {
    pushString(L, checkDocument(L, 1)->serialize());
    return 1;
}

int documentToString(lua_State* L) {
    lua_pushfstring(L, "document(%s)", checkDocument(L, 1)->name().c_str());
    return 1;
}

// ========== Element methods ==========

int nodeTag(lua_State* L) {
    pushString(L, Dom::tagName(checkNode(L, 1)));
    return 1;
}

int nodeText(lua_State* L) {
    pushString(L, Dom::textContent(checkNode(L, 1)));
    return 1;
}

int nodeSetText(lua_State* L) {
    xmlNodePtr node = checkNode(L, 1);
    size_t len = 0;
    const char* text = luaL_checklstring(L, 2, &len);
    Dom::setTextContent(node, std::string(text, len));
    return 0;
}

int nodeGetAttribute(lua_State* L) {
    xmlNodePtr node = checkNode(L, 1);
    const char* name = luaL_checkstring(L, 2);
    if (!Dom::hasAttribute(node, name)) {
        lua_pushnil(L);
        return 1;
    }
    pushString(L, Dom::getAttribute(node, name));
    return 1;
}

int nodeSetAttribute(lua_State* L) {
    xmlNodePtr node = checkNode(L, 1);
    const char* name = luaL_checkstring(L, 2);
    const char* value = luaL_checkstring(L, 3);
    Dom::setAttribute(node, name, value);
    return 0;
}

int nodeRemoveAttribute(lua_State* L) {
    xmlNodePtr node = checkNode(L, 1);
    Dom::removeAttribute(node, luaL_checkstring(L, 2));
    return 0;
}

int nodeHasClass(lua_State* L) {
    xmlNodePtr node = checkNode(L, 1);
    lua_pushboolean(L, Dom::hasClass(node, luaL_checkstring(L, 2)));
    return 1;
}

int nodeAddClass(lua_State* L) {
    xmlNodePtr node = checkNode(L, 1);
    const int top = lua_gettop(L);
    for (int i = 2; i <= top; ++i) {
        Dom::addClass(node, luaL_checkstring(L, i));
    }
    return 0;
}

int nodeRemoveClass(lua_State* L) {
    xmlNodePtr node = checkNode(L, 1);
    const int top = lua_gettop(L);
    for (int i = 2; i <= top; ++i) {
        Dom::removeClass(node, luaL_checkstring(L, i));
    }
    return 0;
}

int nodeQuery(lua_State* L) {
    xmlNodePtr node = checkNode(L, 1);
    return queryFrom(L, ownerOf(L, node), node, false);
}

int nodeQueryAll(lua_State* L) {
    xmlNodePtr node = checkNode(L, 1);
    return queryFrom(L, ownerOf(L, node), node, true);
}

int nodeChildren(lua_State* L) {
    pushNodeList(L, Dom::childElements(checkNode(L, 1)));
    return 1;
}

int nodeParent(lua_State* L) {
    xmlNodePtr node = checkNode(L, 1);
    pushNode(L, Dom::isElement(node->parent) ? node->parent : nullptr);
    return 1;
}

int nodeAppendChild(lua_State* L) {
    xmlNodePtr parent = checkNode(L, 1);
    xmlNodePtr child = checkNode(L, 2);
    xmlNodePtr inserted = Dom::appendChild(parent, child);
    if (!inserted) {
        return luaL_error(L, "cannot append an element into itself or its descendants");
    }
    pushNode(L, inserted);
    return 1;
}

int nodeRemove(lua_State* L) {
    xmlNodePtr node = checkNode(L, 1);
    if (node->parent) {
        ownerOf(L, node)->detach(node);
    }
    return 0;
}

int nodeInnerHtml(lua_State* L) {
    pushString(L, Dom::innerHtml(checkNode(L, 1)));
    return 1;
}

bool applyInnerHtml(xmlNodePtr node, const std::string& html, char* error, size_t error_size) {
    Common::Status status = Dom::setInnerHtml(node, html);
    if (!status.isOk()) {
        std::snprintf(error, error_size, "%s", status.message().c_str());
        return false;
    }
    return true;
}

int nodeSetInnerHtml(lua_State* L) {
    xmlNodePtr node = checkNode(L, 1);
    size_t len = 0;
    const char* html = luaL_checklstring(L, 2, &len);
    char error[ERROR_BUFFER_SIZE];
    if (!applyInnerHtml(node, std::string(html, len), error, sizeof(error))) {
        return luaL_error(L, "%s", error);
    }
    return 0;
}

int nodeOuterHtml(lua_State* L) {
    pushString(L, Dom::outerHtml(checkNode(L, 1)));
    return 1;
}

int nodeEquals(lua_State* L) {
    lua_pushboolean(L, checkNode(L, 1) == checkNode(L, 2));
    return 1;
}

int nodeToString(lua_State* L) {
    xmlNodePtr node = checkNode(L, 1);
    lua_pushfstring(L, "element<%s>", node->name ? reinterpret_cast<const char*>(node->name) : "?");
    return 1;
}

// ========== ctx.utils ==========

int utilCopyAttributes(lua_State* L) {
    xmlNodePtr from = checkNode(L, 1);
    xmlNodePtr to = checkNode(L, 2);
    Dom::copyAttributes(from, to);
    return 0;
}

int utilMoveChildren(lua_State* L) {
    xmlNodePtr from = checkNode(L, 1);
    xmlNodePtr to = checkNode(L, 2);
    Dom::moveChildren(from, to);
    return 0;
}

int utilReplaceElement(lua_State* L) {
    xmlNodePtr old_node = checkNode(L, 1);
    xmlNodePtr replacement = checkNode(L, 2);
    Dom::replaceElement(old_node, replacement);
    return 0;
}

const luaL_Reg kDocumentMethods[] = {
    {"query", documentQuery},
    {"query_all", documentQueryAll},
    {"create_element", documentCreateElement},
    {"root", documentRoot},
    {"serialize", documentSerialize},
    {nullptr, nullptr}};

const luaL_Reg kNodeMethods[] = {
    {"tag", nodeTag},
    {"text", nodeText},
    {"set_text", nodeSetText},
    {"get_attribute", nodeGetAttribute},
    {"set_attribute", nodeSetAttribute},
    {"remove_attribute", nodeRemoveAttribute},
    {"has_class", nodeHasClass},
    {"add_class", nodeAddClass},
    {"remove_class", nodeRemoveClass},
    {"query", nodeQuery},
    {"query_all", nodeQueryAll},
    {"children", nodeChildren},
    {"parent", nodeParent},
    {"append_child", nodeAppendChild},
    {"remove", nodeRemove},
    {"inner_html", nodeInnerHtml},
    {"set_inner_html", nodeSetInnerHtml},
    {"outer_html", nodeOuterHtml},
    {nullptr, nullptr}};

const luaL_Reg kUtils[] = {
    {"copy_attributes", utilCopyAttributes},
    {"move_children", utilMoveChildren},
    {"replace_element", utilReplaceElement},
    {nullptr, nullptr}};

void newMetatable(lua_State* L, const char* name, const luaL_Reg* methods, lua_CFunction to_string) {
    luaL_newmetatable(L, name);
    lua_newtable(L);
    luaL_setfuncs(L, methods, 0);
    lua_setfield(L, -2, "__index");
    lua_pushcfunction(L, to_string);
    lua_setfield(L, -2, "__tostring");
    lua_pushliteral(L, "locked");
    lua_setfield(L, -2, "__metatable");
}

} // namespace

void LuaDomBindings::registerTypes(lua_State* L) {
    newMetatable(L, DOCUMENT_METATABLE, kDocumentMethods, documentToString);
    lua_pop(L, 1);

    newMetatable(L, NODE_METATABLE, kNodeMethods, nodeToString);
    lua_pushcfunction(L, nodeEquals);
    lua_setfield(L, -2, "__eq");
    lua_pop(L, 1);
}

void LuaDomBindings::pushContext(lua_State* L, const TransformContext& context) {
    lua_createtable(L, 0, 4);

    pushDocument(L, context.document);
    lua_setfield(L, -2, "document");

    pushDocument(L, context.reference);
    lua_setfield(L, -2, "template");

    lua_newtable(L);
    if (context.data) {
        for (const auto& [key, value] : *context.data) {
            pushString(L, value);
            lua_setfield(L, -2, key.c_str());
        }
    }
    lua_setfield(L, -2, "config");

    lua_newtable(L);
    luaL_setfuncs(L, kUtils, 0);
    lua_setfield(L, -2, "utils");
}

} // namespace Markgate::Script
