#pragma once
#include <lolite/css/parser/selector.h>
#include <lolite/css/parser/tokenizer.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lolite::css {

struct ComponentValue {
    enum Type { Token, Function, Block };
    Type type;
    std::string value;
    double numeric_value = 0;
    std::string unit;
    CSSToken::Type token_type = CSSToken::Delim;  // for Token values
    std::vector<ComponentValue> children;  // for Function/Block
};

struct Declaration {
    std::string property;  // lowercased
    std::vector<ComponentValue> values;
    bool important = false;
    size_t position = 0;
};

struct StyleRule {
    SelectorList selectors;
    std::vector<Declaration> declarations;
    std::string selector_text;  // prelude text, whitespace collapsed
    size_t position = 0;
};

// A problem the parser recovered from. The offending rule or declaration is
// dropped; parsing continues at the next boundary.
struct ParseIssue {
    size_t position = 0;
    size_t line = 1;
    size_t column = 1;
    std::string message;
};

struct IgnoredAtRule {
    std::string name;
    size_t position = 0;
};

struct StyleSheet {
    std::vector<StyleRule> rules;
    std::vector<ParseIssue> issues;
    std::vector<IgnoredAtRule> ignored_at_rules;
    // Set when the input cannot be recovered from (unterminated block,
    // comment or string). `rules` is left empty in that case.
    std::optional<ParseIssue> fatal;
};

StyleSheet parse_stylesheet(std::string_view css);

// Builds an issue with 1-based line and column for `position` in `source`.
ParseIssue locate_issue(std::string_view source, size_t position, std::string message);

// "#7777ff", "rgb(1, 2, 3)", "1px solid red"
std::string component_value_to_string(const ComponentValue& cv);
std::string component_values_to_string(const std::vector<ComponentValue>& values);

} // namespace lolite::css
