#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lolite::css {

enum class SimpleSelectorType {
    Type,        // card, matched against the `tag` attribute
    Class,       // .foo
    Id,          // #bar
    Universal,   // *
    Attribute,   // [attr=val]
    PseudoClass  // :first-child, :nth-child(2n+1)
};

enum class AttributeMatch {
    Exists,     // [attr]
    Exact,      // [attr=val]
    Includes,   // [attr~=val]
    DashMatch,  // [attr|=val]
    Prefix,     // [attr^=val]
    Suffix,     // [attr$=val]
    Substring   // [attr*=val]
};

// an+b, as used by :nth-child() and :nth-last-child().
struct NthExpression {
    int a = 0;
    int b = 0;

    bool matches(int index) const;  // 1-based
};

struct SimpleSelector {
    SimpleSelectorType type;
    std::string value;

    // Attribute selector specifics
    AttributeMatch attr_match = AttributeMatch::Exists;
    std::string attr_name;
    std::string attr_value;

    // Pseudo-class argument text and its parsed form for nth-*
    std::string argument;
    NthExpression nth;
};

enum class Combinator {
    Descendant,   // space
    Child,        // >
    NextSibling,  // +
    SubsequentSibling  // ~
};

struct CompoundSelector {
    std::vector<SimpleSelector> simple_selectors;
};

struct ComplexSelector {
    struct Part {
        CompoundSelector compound;
        std::optional<Combinator> combinator;  // combinator BEFORE this compound
    };
    std::vector<Part> parts;
};

struct SelectorList {
    std::vector<ComplexSelector> selectors;
};

struct Specificity {
    int a = 0;  // ID selectors
    int b = 0;  // class, attribute, pseudo-class
    int c = 0;  // type

    bool operator<(const Specificity& other) const;
    bool operator==(const Specificity& other) const;
    bool operator>(const Specificity& other) const { return other < *this; }
};

Specificity compute_specificity(const ComplexSelector& selector);

// Parses a comma separated selector list. Any part outside the supported
// subset invalidates the whole list: nullopt is returned and `error`, when
// given, describes the first problem.
std::optional<SelectorList> parse_selector_list(std::string_view input,
                                                std::string* error = nullptr);

// Parses "odd", "even", "3", "2n+1", "-n+3", ...
std::optional<NthExpression> parse_nth_expression(std::string_view text);

// Serializes a selector back to canonical text, e.g. "div > .a:first-child".
std::string to_string(const ComplexSelector& selector);

} // namespace lolite::css
