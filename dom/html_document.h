#pragma once

#include <memory>
#include <string>
#include <vector>

#include <libxml/HTMLparser.h>
#include <libxml/tree.h>

#include "common/status.h"

namespace Markgate::Dom {

class Selector;

/// Owning wrapper around a libxml2 HTML document.
///
/// Nodes are never freed while the document is alive: anything removed from
/// the tree is unlinked and parked in a detached list, so handles held by
/// scripts stay valid until the document itself is destroyed.
class HtmlDocument {
public:
    static constexpr int PARSE_OPTIONS =
        HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET;

    ~HtmlDocument();

    // Delete copy/move constructors
    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;
    HtmlDocument(HtmlDocument&&) = delete;
    HtmlDocument& operator=(HtmlDocument&&) = delete;

    static Common::Status parse(const std::string& html, const std::string& name,
                                std::unique_ptr<HtmlDocument>& out);
    static Common::Status load(const std::string& path, std::unique_ptr<HtmlDocument>& out);

    /// Document owning node, nullptr for foreign or orphaned nodes
    [[nodiscard]] static HtmlDocument* owner(const xmlNode* node) noexcept;

    [[nodiscard]] xmlDocPtr raw() const noexcept { return doc_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// Root element (<html>), nullptr for an empty document
    [[nodiscard]] xmlNodePtr root() const noexcept;

    /// Matches in document order below scope (the whole document when null)
    [[nodiscard]] std::vector<xmlNodePtr> queryAll(const Selector& selector, xmlNodePtr scope = nullptr) const;
    [[nodiscard]] xmlNodePtr query(const Selector& selector, xmlNodePtr scope = nullptr) const;

    /// New detached element owned by this document
    [[nodiscard]] xmlNodePtr createElement(const std::string& tag);

    /// Deep copy of a node from any document into this one, detached
    [[nodiscard]] xmlNodePtr importNode(const xmlNode* node);

    /// Parses an HTML fragment into detached nodes owned by this document
    Common::Status parseFragment(const std::string& html, std::vector<xmlNodePtr>& nodes);

    /// Unlinks node from its parent and keeps it alive until destruction
    void detach(xmlNodePtr node);

    /// Detached-list bookkeeping for nodes entering or leaving the tree
    void track(xmlNodePtr node);
    void untrack(xmlNodePtr node) noexcept;

    /// Whole document as markup, unformatted
    [[nodiscard]] std::string serialize() const;

private:
    HtmlDocument(xmlDocPtr doc, std::string name) noexcept;

    xmlDocPtr doc_;
    std::string name_;
    std::vector<xmlNodePtr> detached_;
};

// ========== Node helpers ==========

[[nodiscard]] bool isElement(const xmlNode* node) noexcept;
[[nodiscard]] std::string tagName(const xmlNode* node);
[[nodiscard]] std::string textContent(const xmlNode* node);
void setTextContent(xmlNodePtr node, const std::string& text);

[[nodiscard]] bool hasAttribute(const xmlNode* node, const std::string& name);
[[nodiscard]] std::string getAttribute(const xmlNode* node, const std::string& name);
void setAttribute(xmlNodePtr node, const std::string& name, const std::string& value);
void removeAttribute(xmlNodePtr node, const std::string& name);

[[nodiscard]] std::vector<std::string> classList(const xmlNode* node);
[[nodiscard]] bool hasClass(const xmlNode* node, const std::string& cls);
void addClass(xmlNodePtr node, const std::string& cls);
void removeClass(xmlNodePtr node, const std::string& cls);

/// Element children only
[[nodiscard]] std::vector<xmlNodePtr> childElements(const xmlNode* node);

/// Appends child to parent. A node from another document is deep-copied;
/// the returned pointer is the node actually inserted, nullptr when the
/// insertion would make a node its own ancestor.
xmlNodePtr appendChild(xmlNodePtr parent, xmlNodePtr child);

/// True when ancestor is node or one of its ancestors
[[nodiscard]] bool isInclusiveAncestor(const xmlNode* ancestor, const xmlNode* node) noexcept;

[[nodiscard]] std::string innerHtml(const xmlNode* node);
[[nodiscard]] std::string outerHtml(const xmlNode* node);
Common::Status setInnerHtml(xmlNodePtr node, const std::string& html);

// ========== Transform utilities ==========

/// Copies every attribute of from onto to, overwriting same-named ones
void copyAttributes(const xmlNode* from, xmlNodePtr to);

/// Moves every child node of from to the end of to
void moveChildren(xmlNodePtr from, xmlNodePtr to);

/// Puts a deep clone of replacement where old_node is; no-op for a
/// parentless old_node
void replaceElement(xmlNodePtr old_node, const xmlNode* replacement);

} // namespace Markgate::Dom
