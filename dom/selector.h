#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <libxml/tree.h>

#include "common/status.h"

namespace Markgate::Dom {

/// Compiled CSS selector subset:
///   tag  *  #id  .class  [attr]  [attr=v]  [attr^=v]  [attr$=v]  [attr*=v]  [attr~=v]
/// compounds joined by descendant (space) or child (>) combinators, and
/// comma-separated groups.
class Selector {
public:
    Selector() = default;

    static Common::Status compile(const std::string& text, Selector& out);

    /// True when element matches any group. Ancestors outside a query scope
    /// still take part, as in the DOM.
    [[nodiscard]] bool matches(const xmlNode* element) const;

    [[nodiscard]] const std::string& text() const noexcept { return text_; }

private:
    struct AttributeTest {
        std::string name;
        char op{'\0'};  // '\0' presence, '=', '^', '$', '*', '~'
        std::string value;
    };

    struct Compound {
        std::string tag;  // lower case, "" or "*" for any
        std::string id;
        std::vector<std::string> classes;
        std::vector<AttributeTest> attributes;
    };

    enum class Combinator : uint8_t {
        NONE = 0,        // Leftmost compound
        DESCENDANT = 1,
        CHILD = 2
    };

    struct Step {
        Compound compound;
        Combinator combinator{Combinator::NONE};  // Relation to the step on its left
    };

    using Complex = std::vector<Step>;

    static Common::Status parseGroup(const std::string& text, size_t begin, size_t end, Complex& out);
    static bool matchCompound(const Compound& compound, const xmlNode* element);
    static bool matchFrom(const Complex& complex, size_t index, const xmlNode* element);

    std::vector<Complex> groups_;
    std::string text_;
};

} // namespace Markgate::Dom
