#pragma once
#include <lolite/css/parser/selector.h>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace lolite::css {

// Minimal element interface for matching (avoids depending on the DOM)
struct ElementView {
    std::uint64_t node_id = 0;
    std::string tag_name;  // lowercased `tag` attribute
    std::string id;
    std::vector<std::string> classes;
    std::vector<std::pair<std::string, std::string>> attributes;
    ElementView* parent = nullptr;
    ElementView* prev_sibling = nullptr;
    std::vector<ElementView*> children;
    size_t child_index = 0;  // 0-based index among siblings
    size_t sibling_count = 0;
    bool is_document_root = false;
    bool has_text = false;

    const std::string* attribute(const std::string& name) const;
};

// Splits a `class` attribute value on ASCII whitespace.
std::vector<std::string> split_class_list(const std::string& value);

class SelectorMatcher {
public:
    bool matches(const ElementView& element, const ComplexSelector& selector) const;
    bool matches_compound(const ElementView& element, const CompoundSelector& compound) const;
    bool matches_simple(const ElementView& element, const SimpleSelector& simple) const;

private:
    bool matches_part(const ElementView& element, const ComplexSelector& selector,
                      size_t index) const;
};

} // namespace lolite::css
