#include <lolite/css/style/selector_matcher.h>
#include <algorithm>
#include <cctype>

namespace lolite::css {

const std::string* ElementView::attribute(const std::string& name) const {
    for (const auto& [n, v] : attributes) {
        if (n == name) return &v;
    }
    return nullptr;
}

std::vector<std::string> split_class_list(const std::string& value) {
    std::vector<std::string> classes;
    std::string token;
    for (char c : value) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!token.empty()) {
                classes.push_back(token);
                token.clear();
            }
        } else {
            token += c;
        }
    }
    if (!token.empty()) {
        classes.push_back(token);
    }
    return classes;
}

static bool matches_attribute(const std::string& val, const SimpleSelector& simple) {
    switch (simple.attr_match) {
        case AttributeMatch::Exists:
            return true;
        case AttributeMatch::Exact:
            return val == simple.attr_value;
        case AttributeMatch::Includes: {
            auto tokens = split_class_list(val);
            return std::find(tokens.begin(), tokens.end(), simple.attr_value) != tokens.end();
        }
        case AttributeMatch::DashMatch:
            return val == simple.attr_value ||
                   (val.length() > simple.attr_value.length() &&
                    val.compare(0, simple.attr_value.length(), simple.attr_value) == 0 &&
                    val[simple.attr_value.length()] == '-');
        case AttributeMatch::Prefix:
            if (simple.attr_value.empty() || val.length() < simple.attr_value.length()) {
                return false;
            }
            return val.compare(0, simple.attr_value.length(), simple.attr_value) == 0;
        case AttributeMatch::Suffix:
            if (simple.attr_value.empty() || val.length() < simple.attr_value.length()) {
                return false;
            }
            return val.compare(
                       val.length() - simple.attr_value.length(),
                       simple.attr_value.length(),
                       simple.attr_value) == 0;
        case AttributeMatch::Substring:
            if (simple.attr_value.empty()) {
                return false;
            }
            return val.find(simple.attr_value) != std::string::npos;
    }
    return false;
}

bool SelectorMatcher::matches(const ElementView& element, const ComplexSelector& selector) const {
    if (selector.parts.empty()) {
        return false;
    }
    return matches_part(element, selector, selector.parts.size() - 1);
}

// Matches parts[0..index] with parts[index] as the subject. Descendant and
// subsequent-sibling steps try every candidate, so "a > b c" finds a `b`
// with an `a` parent even when a nearer `b` lacks one.
bool SelectorMatcher::matches_part(const ElementView& element, const ComplexSelector& selector,
                                   size_t index) const {
    const ComplexSelector::Part& part = selector.parts[index];
    if (!matches_compound(element, part.compound)) {
        return false;
    }
    if (index == 0) {
        return true;
    }

    switch (part.combinator.value_or(Combinator::Descendant)) {
        case Combinator::Child:
            return element.parent != nullptr &&
                   matches_part(*element.parent, selector, index - 1);
        case Combinator::NextSibling:
            return element.prev_sibling != nullptr &&
                   matches_part(*element.prev_sibling, selector, index - 1);
        case Combinator::Descendant:
            for (const ElementView* a = element.parent; a != nullptr; a = a->parent) {
                if (matches_part(*a, selector, index - 1)) return true;
            }
            return false;
        case Combinator::SubsequentSibling:
            for (const ElementView* s = element.prev_sibling; s != nullptr; s = s->prev_sibling) {
                if (matches_part(*s, selector, index - 1)) return true;
            }
            return false;
    }
    return false;
}

bool SelectorMatcher::matches_compound(const ElementView& element, const CompoundSelector& compound) const {
    for (const auto& simple : compound.simple_selectors) {
        if (!matches_simple(element, simple)) {
            return false;
        }
    }
    return true;
}

bool SelectorMatcher::matches_simple(const ElementView& element, const SimpleSelector& simple) const {
    switch (simple.type) {
        case SimpleSelectorType::Universal:
            return true;

        case SimpleSelectorType::Type:
            return element.tag_name == simple.value;

        case SimpleSelectorType::Class:
            return std::find(element.classes.begin(), element.classes.end(), simple.value)
                   != element.classes.end();

        case SimpleSelectorType::Id:
            return !element.id.empty() && element.id == simple.value;

        case SimpleSelectorType::Attribute: {
            const std::string* val = element.attribute(simple.attr_name);
            return val != nullptr && matches_attribute(*val, simple);
        }

        case SimpleSelectorType::PseudoClass: {
            const auto& name = simple.value;
            // Structural pseudo-classes only apply to nodes with a parent
            bool in_tree = element.parent != nullptr;
            int position = static_cast<int>(element.child_index) + 1;
            int from_end = static_cast<int>(element.sibling_count - element.child_index);
            if (name == "root") {
                return element.is_document_root;
            } else if (name == "first-child") {
                return in_tree && element.child_index == 0;
            } else if (name == "last-child") {
                return in_tree && element.child_index + 1 == element.sibling_count;
            } else if (name == "only-child") {
                return in_tree && element.sibling_count == 1;
            } else if (name == "empty") {
                return element.children.empty() && !element.has_text;
            } else if (name == "nth-child") {
                return in_tree && simple.nth.matches(position);
            } else if (name == "nth-last-child") {
                return in_tree && simple.nth.matches(from_end);
            }
            return false;
        }
    }
    return false;
}

} // namespace lolite::css
