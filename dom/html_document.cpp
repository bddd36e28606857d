#include "dom/html_document.h"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <sstream>

#include <libxml/HTMLtree.h>
#include <libxml/parser.h>

#include "common/file_utils.h"
#include "common/logging.h"
#include "dom/selector.h"

namespace Markgate::Dom {

using Common::ErrorKind;
using Common::Status;

namespace {

constexpr const char* kEmptyDocument = "<html><head></head><body></body></html>";

void ensureParserInitialized() {
    static std::once_flag once;
    std::call_once(once, [] { xmlInitParser(); });
}

const xmlChar* toXml(const std::string& s) noexcept {
    return reinterpret_cast<const xmlChar*>(s.c_str());
}

// Takes ownership of a libxml2-allocated string
std::string takeXmlString(xmlChar* value) {
    if (!value) {
        return {};
    }
    std::string out(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return out;
}

struct XmlDocDeleter {
    void operator()(xmlDocPtr doc) const noexcept { xmlFreeDoc(doc); }
};

struct XmlBufferDeleter {
    void operator()(xmlBufferPtr buf) const noexcept { xmlBufferFree(buf); }
};

using XmlBuffer = std::unique_ptr<xmlBuffer, XmlBufferDeleter>;

void collectMatches(const Selector& selector, xmlNodePtr first, std::vector<xmlNodePtr>& out, bool first_only) {
    for (xmlNodePtr node = first; node; node = node->next) {
        if (node->type != XML_ELEMENT_NODE) continue;
        if (selector.matches(node)) {
            out.push_back(node);
            if (first_only) return;
        }
        collectMatches(selector, node->children, out, first_only);
        if (first_only && !out.empty()) return;
    }
}

// Unlinks every child of node, parking them in the owner's detached list
void clearChildren(xmlNodePtr node) {
    HtmlDocument* owner = HtmlDocument::owner(node);
    while (node->children) {
        xmlNodePtr child = node->children;
        if (owner) {
            owner->detach(child);
        } else {
            xmlUnlinkNode(child);
            xmlFreeNode(child);
        }
    }
}

// Adds a detached node under parent, leaving the detached list first since
// xmlAddChild may merge and free text nodes
xmlNodePtr insertChild(xmlNodePtr parent, xmlNodePtr child) {
    if (HtmlDocument* owner = HtmlDocument::owner(child)) {
        owner->untrack(child);
    }
    return xmlAddChild(parent, child);
}

} // namespace

// ========== HtmlDocument ==========

HtmlDocument::HtmlDocument(xmlDocPtr doc, std::string name) noexcept
    : doc_(doc), name_(std::move(name)), detached_() {
    doc_->_private = this;
}

HtmlDocument::~HtmlDocument() {
    // Collect roots first: freeing one subtree may free other tracked nodes
    std::vector<xmlNodePtr> roots;
    for (xmlNodePtr node : detached_) {
        if (node->parent == nullptr) {
            roots.push_back(node);
        }
    }
    for (xmlNodePtr node : roots) {
        xmlFreeNode(node);
    }
    doc_->_private = nullptr;
    xmlFreeDoc(doc_);
}

Status HtmlDocument::parse(const std::string& html, const std::string& name,
                           std::unique_ptr<HtmlDocument>& out) {
    ensureParserInitialized();
    const std::string& source = html.empty() ? std::string(kEmptyDocument) : html;
    xmlDocPtr doc = htmlReadMemory(source.data(), static_cast<int>(source.size()),
                                   name.empty() ? nullptr : name.c_str(), "UTF-8", PARSE_OPTIONS);
    if (!doc) {
        return Status::error(ErrorKind::IO_FAILURE, "Failed to parse HTML document %s",
                             name.empty() ? "(memory)" : name.c_str());
    }
    out.reset(new HtmlDocument(doc, name));
    return Status::ok();
}

Status HtmlDocument::load(const std::string& path, std::unique_ptr<HtmlDocument>& out) {
    std::string html;
    Status status = Common::readTextFile(path, html);
    if (!status.isOk()) {
        return status;
    }
    return parse(html, path, out);
}

HtmlDocument* HtmlDocument::owner(const xmlNode* node) noexcept {
    if (!node || !node->doc) {
        return nullptr;
    }
    return static_cast<HtmlDocument*>(node->doc->_private);
}

xmlNodePtr HtmlDocument::root() const noexcept {
    return xmlDocGetRootElement(doc_);
}

std::vector<xmlNodePtr> HtmlDocument::queryAll(const Selector& selector, xmlNodePtr scope) const {
    std::vector<xmlNodePtr> out;
    collectMatches(selector, scope ? scope->children : doc_->children, out, false);
    return out;
}

xmlNodePtr HtmlDocument::query(const Selector& selector, xmlNodePtr scope) const {
    std::vector<xmlNodePtr> out;
    collectMatches(selector, scope ? scope->children : doc_->children, out, true);
    return out.empty() ? nullptr : out.front();
}

xmlNodePtr HtmlDocument::createElement(const std::string& tag) {
    std::string lower = tag;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    xmlNodePtr node = xmlNewDocNode(doc_, nullptr, toXml(lower), nullptr);
    if (node) {
        track(node);
    }
    return node;
}

xmlNodePtr HtmlDocument::importNode(const xmlNode* node) {
    xmlNodePtr copy = xmlDocCopyNode(const_cast<xmlNodePtr>(node), doc_, 1);
    if (copy) {
        track(copy);
    }
    return copy;
}

Status HtmlDocument::parseFragment(const std::string& html, std::vector<xmlNodePtr>& nodes) {
    nodes.clear();
    if (html.empty()) {
        return Status::ok();
    }

    // Parse inside a throwaway document, then copy the body's children over
    const std::string wrapped = "<html><body>" + html + "</body></html>";
    std::unique_ptr<xmlDoc, XmlDocDeleter> scratch(
        htmlReadMemory(wrapped.data(), static_cast<int>(wrapped.size()), nullptr, "UTF-8", PARSE_OPTIONS));
    if (!scratch) {
        return Status::error(ErrorKind::INVALID_ARGUMENT, "Failed to parse HTML fragment");
    }

    xmlNodePtr body = nullptr;
    for (xmlNodePtr n = xmlDocGetRootElement(scratch.get()) ? xmlDocGetRootElement(scratch.get())->children : nullptr;
         n; n = n->next) {
        if (n->type == XML_ELEMENT_NODE && xmlStrcasecmp(n->name, BAD_CAST "body") == 0) {
            body = n;
            break;
        }
    }
    if (!body) {
        return Status::ok();
    }

    for (xmlNodePtr child = body->children; child; child = child->next) {
        xmlNodePtr copy = xmlDocCopyNode(child, doc_, 1);
        if (!copy) {
            return Status::error(ErrorKind::IO_FAILURE, "Failed to copy HTML fragment node");
        }
        track(copy);
        nodes.push_back(copy);
    }
    return Status::ok();
}

void HtmlDocument::detach(xmlNodePtr node) {
    xmlUnlinkNode(node);
    track(node);
}

void HtmlDocument::track(xmlNodePtr node) {
    if (std::find(detached_.begin(), detached_.end(), node) == detached_.end()) {
        detached_.push_back(node);
    }
}

void HtmlDocument::untrack(xmlNodePtr node) noexcept {
    detached_.erase(std::remove(detached_.begin(), detached_.end(), node), detached_.end());
}

std::string HtmlDocument::serialize() const {
    xmlChar* mem = nullptr;
    int size = 0;
    htmlDocDumpMemoryFormat(doc_, &mem, &size, 0);
    if (!mem) {
        return {};
    }
    std::string out(reinterpret_cast<const char*>(mem), static_cast<size_t>(size));
    xmlFree(mem);
    return out;
}

// ========== Node helpers ==========

bool isElement(const xmlNode* node) noexcept {
    return node && node->type == XML_ELEMENT_NODE;
}

std::string tagName(const xmlNode* node) {
    return (node && node->name) ? std::string(reinterpret_cast<const char*>(node->name)) : std::string();
}

std::string textContent(const xmlNode* node) {
    return takeXmlString(xmlNodeGetContent(node));
}

void setTextContent(xmlNodePtr node, const std::string& text) {
    clearChildren(node);
    if (!text.empty()) {
        xmlAddChild(node, xmlNewDocText(node->doc, toXml(text)));
    }
}

bool hasAttribute(const xmlNode* node, const std::string& name) {
    return xmlHasProp(node, toXml(name)) != nullptr;
}

std::string getAttribute(const xmlNode* node, const std::string& name) {
    return takeXmlString(xmlGetProp(node, toXml(name)));
}

void setAttribute(xmlNodePtr node, const std::string& name, const std::string& value) {
    xmlSetProp(node, toXml(name), toXml(value));
}

void removeAttribute(xmlNodePtr node, const std::string& name) {
    xmlAttrPtr attr = xmlHasProp(node, toXml(name));
    if (attr) {
        xmlRemoveProp(attr);
    }
}

std::vector<std::string> classList(const xmlNode* node) {
    std::vector<std::string> out;
    std::istringstream in(getAttribute(node, "class"));
    std::string cls;
    while (in >> cls) {
        if (std::find(out.begin(), out.end(), cls) == out.end()) {
            out.push_back(cls);
        }
    }
    return out;
}

bool hasClass(const xmlNode* node, const std::string& cls) {
    const auto classes = classList(node);
    return std::find(classes.begin(), classes.end(), cls) != classes.end();
}

namespace {

std::string joinClasses(const std::vector<std::string>& classes) {
    std::string out;
    for (const auto& cls : classes) {
        if (!out.empty()) out += ' ';
        out += cls;
    }
    return out;
}

} // namespace

void addClass(xmlNodePtr node, const std::string& cls) {
    auto classes = classList(node);
    if (cls.empty() || std::find(classes.begin(), classes.end(), cls) != classes.end()) {
        return;
    }
    classes.push_back(cls);
    setAttribute(node, "class", joinClasses(classes));
}

void removeClass(xmlNodePtr node, const std::string& cls) {
    if (!hasAttribute(node, "class")) {
        return;
    }
    auto classes = classList(node);
    classes.erase(std::remove(classes.begin(), classes.end(), cls), classes.end());
    setAttribute(node, "class", joinClasses(classes));
}

std::vector<xmlNodePtr> childElements(const xmlNode* node) {
    std::vector<xmlNodePtr> out;
    for (xmlNodePtr child = node->children; child; child = child->next) {
        if (child->type == XML_ELEMENT_NODE) {
            out.push_back(child);
        }
    }
    return out;
}

bool isInclusiveAncestor(const xmlNode* ancestor, const xmlNode* node) noexcept {
    for (const xmlNode* n = node; n; n = n->parent) {
        if (n == ancestor) return true;
    }
    return false;
}

xmlNodePtr appendChild(xmlNodePtr parent, xmlNodePtr child) {
    if (child->doc != parent->doc) {
        xmlNodePtr copy = xmlDocCopyNode(child, parent->doc, 1);
        return copy ? xmlAddChild(parent, copy) : nullptr;
    }
    if (isInclusiveAncestor(child, parent)) {
        LOG_WARN("Refusing to append <%s> into its own subtree", tagName(child).c_str());
        return nullptr;
    }
    xmlUnlinkNode(child);
    return insertChild(parent, child);
}

std::string innerHtml(const xmlNode* node) {
    XmlBuffer buf(xmlBufferCreate());
    if (!buf) {
        return {};
    }
    for (xmlNodePtr child = node->children; child; child = child->next) {
        htmlNodeDump(buf.get(), node->doc, child);
    }
    return std::string(reinterpret_cast<const char*>(xmlBufferContent(buf.get())),
                       static_cast<size_t>(xmlBufferLength(buf.get())));
}

std::string outerHtml(const xmlNode* node) {
    XmlBuffer buf(xmlBufferCreate());
    if (!buf) {
        return {};
    }
    htmlNodeDump(buf.get(), node->doc, const_cast<xmlNodePtr>(node));
    return std::string(reinterpret_cast<const char*>(xmlBufferContent(buf.get())),
                       static_cast<size_t>(xmlBufferLength(buf.get())));
}

Status setInnerHtml(xmlNodePtr node, const std::string& html) {
    HtmlDocument* owner = HtmlDocument::owner(node);
    if (!owner) {
        return Status::error(ErrorKind::INVALID_ARGUMENT, "Node does not belong to a managed document");
    }
    std::vector<xmlNodePtr> nodes;
    Status status = owner->parseFragment(html, nodes);
    if (!status.isOk()) {
        return status;
    }
    clearChildren(node);
    for (xmlNodePtr child : nodes) {
        insertChild(node, child);
    }
    return Status::ok();
}

// ========== Transform utilities ==========

void copyAttributes(const xmlNode* from, xmlNodePtr to) {
    for (xmlAttrPtr attr = from->properties; attr; attr = attr->next) {
        std::string value = takeXmlString(xmlNodeListGetString(from->doc, attr->children, 1));
        xmlSetProp(to, attr->name, toXml(value));
    }
}

void moveChildren(xmlNodePtr from, xmlNodePtr to) {
    if (from == to) {
        return;
    }
    if (from->doc != to->doc) {
        for (xmlNodePtr child = from->children; child; child = child->next) {
            xmlNodePtr copy = xmlDocCopyNode(child, to->doc, 1);
            if (copy) {
                xmlAddChild(to, copy);
            }
        }
        clearChildren(from);
        return;
    }
    if (isInclusiveAncestor(from, to)) {
        LOG_WARN("moveChildren target <%s> lies inside the source subtree", tagName(to).c_str());
        return;
    }
    while (from->children) {
        xmlNodePtr child = from->children;
        xmlUnlinkNode(child);
        insertChild(to, child);
    }
}

void replaceElement(xmlNodePtr old_node, const xmlNode* replacement) {
    if (!old_node->parent) {
        return;
    }
    xmlNodePtr clone = xmlDocCopyNode(const_cast<xmlNodePtr>(replacement), old_node->doc, 1);
    if (!clone) {
        return;
    }
    xmlReplaceNode(old_node, clone);
    if (HtmlDocument* owner = HtmlDocument::owner(old_node)) {
        owner->track(old_node);
    } else {
        xmlFreeNode(old_node);
    }
}

} // namespace Markgate::Dom
