#include <lolite/css/style/stylesheet_store.h>
#include <lolite/css/style/property_registry.h>
#include <algorithm>

namespace lolite::css {

StylesheetResult StylesheetStore::add(std::string_view css) {
    StylesheetResult result;
    StyleSheet sheet = parse_stylesheet(css);

    if (sheet.fatal) {
        const ParseIssue& fatal = *sheet.fatal;
        result.status = core::Status::error(
            core::ErrorCode::ParseError,
            fatal.message + " at line " + std::to_string(fatal.line) +
                ", column " + std::to_string(fatal.column),
            fatal.position);
        result.issues.push_back(fatal);
        return result;
    }

    result.issues = std::move(sheet.issues);
    for (const auto& at_rule : sheet.ignored_at_rules) {
        result.ignored_at_rules.push_back(at_rule.name);
    }

    for (auto& rule : sheet.rules) {
        CascadeRule cascade_rule;
        cascade_rule.selectors = std::move(rule.selectors);
        cascade_rule.selector_text = std::move(rule.selector_text);

        for (const auto& decl : rule.declarations) {
            std::string error;
            auto longhands = expand_declaration(decl, error);
            if (!longhands) {
                result.issues.push_back(locate_issue(css, decl.position, error));
                continue;
            }
            for (auto& lh : *longhands) {
                cascade_rule.declarations.push_back(
                    {std::move(lh.property), std::move(lh.value), decl.important});
            }
        }

        // A rule whose declarations were all dropped still takes an origin
        // slot; it simply contributes nothing.
        cascade_rule.origin = rules_.size();
        rules_.push_back(std::move(cascade_rule));
        ++result.rules_added;
    }

    std::stable_sort(result.issues.begin(), result.issues.end(),
                     [](const ParseIssue& a, const ParseIssue& b) {
                         return a.position < b.position;
                     });

    ++stylesheet_count_;
    return result;
}

} // namespace lolite::css
