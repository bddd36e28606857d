#include "dom/selector.h"

#include <algorithm>
#include <cctype>
#include <cstring>

#include "dom/html_document.h"

namespace Markgate::Dom {

using Common::ErrorKind;
using Common::Status;

namespace {

bool isIdentChar(char c) noexcept {
    const auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '-' || c == '_' || u >= 0x80;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void skipSpace(const std::string& text, size_t& pos, size_t end) noexcept {
    while (pos < end && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
}

size_t readIdent(const std::string& text, size_t pos, size_t end, std::string& out) {
    const size_t start = pos;
    while (pos < end && isIdentChar(text[pos])) {
        ++pos;
    }
    out.assign(text, start, pos - start);
    return pos;
}

Status syntaxError(const std::string& text, size_t pos) {
    return Status::error(ErrorKind::INVALID_ARGUMENT, "Invalid selector '%s' at offset %zu",
                         text.c_str(), pos);
}

const xmlNode* parentElement(const xmlNode* node) noexcept {
    const xmlNode* parent = node->parent;
    return (parent && parent->type == XML_ELEMENT_NODE) ? parent : nullptr;
}

bool containsWord(const std::string& list, const std::string& word) {
    size_t pos = 0;
    while (pos < list.size()) {
        while (pos < list.size() && std::isspace(static_cast<unsigned char>(list[pos]))) ++pos;
        size_t end = pos;
        while (end < list.size() && !std::isspace(static_cast<unsigned char>(list[end]))) ++end;
        if (end > pos && list.compare(pos, end - pos, word) == 0 && end - pos == word.size()) {
            return true;
        }
        pos = end;
    }
    return false;
}

} // namespace

Status Selector::compile(const std::string& text, Selector& out) {
    Selector compiled;
    compiled.text_ = text;

    // Split on commas outside brackets and quotes
    size_t group_start = 0;
    char quote = '\0';
    int depth = 0;
    for (size_t i = 0; i <= text.size(); ++i) {
        const char c = i < text.size() ? text[i] : ',';
        if (quote) {
            if (c == quote) quote = '\0';
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '[') {
            ++depth;
        } else if (c == ']') {
            --depth;
        } else if (c == ',' && depth == 0) {
            Complex complex;
            Status status = parseGroup(text, group_start, i, complex);
            if (!status.isOk()) {
                return status;
            }
            compiled.groups_.push_back(std::move(complex));
            group_start = i + 1;
        }
    }
    if (quote || depth != 0) {
        return syntaxError(text, text.size());
    }

    out = std::move(compiled);
    return Status::ok();
}

Status Selector::parseGroup(const std::string& text, size_t begin, size_t end, Complex& out) {
    size_t pos = begin;
    skipSpace(text, pos, end);
    if (pos >= end) {
        return syntaxError(text, pos);
    }

    while (pos < end) {
        Combinator combinator = out.empty() ? Combinator::NONE : Combinator::DESCENDANT;
        if (!out.empty()) {
            const size_t before = pos;
            skipSpace(text, pos, end);
            if (pos >= end) break;
            if (text[pos] == '>') {
                combinator = Combinator::CHILD;
                ++pos;
                skipSpace(text, pos, end);
            } else if (pos == before) {
                return syntaxError(text, pos);
            }
        }

        Step step;
        step.combinator = combinator;
        Compound& compound = step.compound;
        bool any = false;

        if (pos < end && text[pos] == '*') {
            compound.tag = "*";
            ++pos;
            any = true;
        } else if (pos < end && isIdentChar(text[pos])) {
            pos = readIdent(text, pos, end, compound.tag);
            compound.tag = toLower(compound.tag);
            any = true;
        }

        while (pos < end) {
            const char c = text[pos];
            if (c == '#' || c == '.') {
                std::string ident;
                const size_t next = readIdent(text, pos + 1, end, ident);
                if (ident.empty()) {
                    return syntaxError(text, pos);
                }
                if (c == '#') {
                    compound.id = ident;
                } else {
                    compound.classes.push_back(ident);
                }
                pos = next;
                any = true;
            } else if (c == '[') {
                AttributeTest test;
                ++pos;
                skipSpace(text, pos, end);
                pos = readIdent(text, pos, end, test.name);
                if (test.name.empty()) {
                    return syntaxError(text, pos);
                }
                test.name = toLower(test.name);
                skipSpace(text, pos, end);
                if (pos < end && std::strchr("^$*~", text[pos]) && pos + 1 < end && text[pos + 1] == '=') {
                    test.op = text[pos];
                    pos += 2;
                } else if (pos < end && text[pos] == '=') {
                    test.op = '=';
                    ++pos;
                }
                if (test.op != '\0') {
                    skipSpace(text, pos, end);
                    if (pos < end && (text[pos] == '"' || text[pos] == '\'')) {
                        const char q = text[pos];
                        const size_t close = text.find(q, pos + 1);
                        if (close == std::string::npos || close >= end) {
                            return syntaxError(text, pos);
                        }
                        test.value.assign(text, pos + 1, close - pos - 1);
                        pos = close + 1;
                    } else {
                        pos = readIdent(text, pos, end, test.value);
                    }
                    skipSpace(text, pos, end);
                }
                if (pos >= end || text[pos] != ']') {
                    return syntaxError(text, pos);
                }
                ++pos;
                compound.attributes.push_back(std::move(test));
                any = true;
            } else {
                break;
            }
        }

        if (!any) {
            return syntaxError(text, pos);
        }
        out.push_back(std::move(step));
    }
    return Status::ok();
}

bool Selector::matches(const xmlNode* element) const {
    if (!isElement(element)) {
        return false;
    }
    return std::any_of(groups_.begin(), groups_.end(), [element](const Complex& complex) {
        return matchFrom(complex, complex.size() - 1, element);
    });
}

bool Selector::matchFrom(const Complex& complex, size_t index, const xmlNode* element) {
    if (!matchCompound(complex[index].compound, element)) {
        return false;
    }
    if (index == 0) {
        return true;
    }

    if (complex[index].combinator == Combinator::CHILD) {
        const xmlNode* parent = parentElement(element);
        return parent && matchFrom(complex, index - 1, parent);
    }
    for (const xmlNode* ancestor = parentElement(element); ancestor; ancestor = parentElement(ancestor)) {
        if (matchFrom(complex, index - 1, ancestor)) {
            return true;
        }
    }
    return false;
}

bool Selector::matchCompound(const Compound& compound, const xmlNode* element) {
    if (!compound.tag.empty() && compound.tag != "*" && toLower(tagName(element)) != compound.tag) {
        return false;
    }
    if (!compound.id.empty() && getAttribute(element, "id") != compound.id) {
        return false;
    }
    if (!compound.classes.empty()) {
        const std::string cls = getAttribute(element, "class");
        for (const auto& wanted : compound.classes) {
            if (!containsWord(cls, wanted)) {
                return false;
            }
        }
    }

    for (const auto& test : compound.attributes) {
        if (!hasAttribute(element, test.name)) {
            return false;
        }
        if (test.op == '\0') {
            continue;
        }
        const std::string value = getAttribute(element, test.name);
        bool ok = false;
        switch (test.op) {
            case '=': ok = value == test.value; break;
            case '^': ok = !test.value.empty() && value.compare(0, test.value.size(), test.value) == 0; break;
            case '$': ok = !test.value.empty() && value.size() >= test.value.size() &&
                           value.compare(value.size() - test.value.size(), test.value.size(), test.value) == 0; break;
            case '*': ok = !test.value.empty() && value.find(test.value) != std::string::npos; break;
            case '~': ok = containsWord(value, test.value); break;
            default: break;
        }
        if (!ok) {
            return false;
        }
    }
    return true;
}

} // namespace Markgate::Dom
