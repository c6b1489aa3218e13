#pragma once
#include <lolite/css/style/resolved_style.h>
#include <lolite/css/style/selector_matcher.h>
#include <lolite/css/style/stylesheet_store.h>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace lolite::css {

struct MatchedRule {
    const CascadeRule* rule;
    Specificity specificity;  // highest among the rule's matching selectors
    size_t source_order;      // the rule's origin index
};

class PropertyCascade {
public:
    // `parent_style` is null for the topmost node of a tree, which inherits
    // initial values.
    ResolvedStyle cascade(const std::vector<MatchedRule>& matched_rules,
                          const ResolvedStyle* parent_style,
                          std::uint64_t node_id) const;
};

// Pull-based cascade with a per-node memo. The memo is only valid while
// the tree and the store are unchanged; callers invalidate what they mutate.
class StyleResolver {
public:
    explicit StyleResolver(const StylesheetStore& store) : store_(store) {}

    // Pure resolution against the parent's resolved style.
    ResolvedStyle resolve(const ElementView& element,
                          const ResolvedStyle* parent_style) const;

    // Memoized resolution; resolves (and caches) uncached ancestors first.
    const ResolvedStyle& resolve_cached(const ElementView& element);

    std::vector<MatchedRule> collect_matching_rules(const ElementView& element) const;

    void invalidate(std::uint64_t node_id);
    void invalidate_all();
    bool is_cached(std::uint64_t node_id) const;
    size_t cached_count() const { return cache_.size(); }

private:
    const StylesheetStore& store_;
    SelectorMatcher matcher_;
    PropertyCascade cascade_;
    std::unordered_map<std::uint64_t, ResolvedStyle> cache_;
};

} // namespace lolite::css
