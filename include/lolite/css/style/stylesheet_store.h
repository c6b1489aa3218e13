#pragma once
#include <lolite/core/error.h>
#include <lolite/css/parser/stylesheet.h>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace lolite::css {

struct CascadeDeclaration {
    std::string property;  // longhand, lowercased
    std::string value;     // as written, or a CSS-wide keyword
    bool important = false;
};

// A rule as the cascade sees it: validated longhand declarations plus its
// position across every stylesheet ever appended to the store.
struct CascadeRule {
    SelectorList selectors;
    std::vector<CascadeDeclaration> declarations;
    std::string selector_text;
    size_t origin = 0;
};

struct StylesheetResult {
    core::Status status;
    size_t rules_added = 0;
    std::vector<ParseIssue> issues;
    std::vector<std::string> ignored_at_rules;

    bool ok() const { return status.ok(); }
};

// Append-only, origin-ordered rule list.
class StylesheetStore {
public:
    // Parses `css` and appends its rules. Unterminated input fails the
    // whole call with ParseError and appends nothing; every other problem
    // only drops the offending rule or declaration and is listed in
    // `issues`.
    StylesheetResult add(std::string_view css);

    const std::vector<CascadeRule>& rules() const { return rules_; }
    size_t rule_count() const { return rules_.size(); }
    size_t stylesheet_count() const { return stylesheet_count_; }

private:
    std::vector<CascadeRule> rules_;
    size_t stylesheet_count_ = 0;
};

} // namespace lolite::css
