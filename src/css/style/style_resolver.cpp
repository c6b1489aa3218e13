#include <lolite/css/style/style_resolver.h>
#include <lolite/css/style/property_registry.h>
#include <algorithm>
#include <string>

namespace lolite::css {

const char* origin_kind_name(PropertyOrigin::Kind kind) {
    switch (kind) {
        case PropertyOrigin::Kind::Declared:  return "declared";
        case PropertyOrigin::Kind::Inherited: return "inherited";
        case PropertyOrigin::Kind::Initial:   return "initial";
    }
    return "unknown";
}

std::string ResolvedStyle::value(const std::string& property) const {
    const ResolvedProperty* resolved = get(property);
    return resolved ? resolved->value : std::string();
}

namespace {

struct PrioritizedDecl {
    const CascadeDeclaration* decl;
    const CascadeRule* rule;
    Specificity specificity;
    size_t source_order;
    bool important;
};

ResolvedProperty initial_value(const PropertySpec& property) {
    ResolvedProperty resolved;
    resolved.value = property.initial;
    resolved.origin.kind = PropertyOrigin::Kind::Initial;
    return resolved;
}

ResolvedProperty inherited_value(const PropertySpec& property,
                                 const ResolvedStyle* parent_style) {
    if (parent_style == nullptr) {
        return initial_value(property);
    }
    const ResolvedProperty* from_parent = parent_style->get(property.name);
    if (from_parent == nullptr) {
        return initial_value(property);
    }
    ResolvedProperty resolved = *from_parent;
    resolved.origin.kind = PropertyOrigin::Kind::Inherited;
    return resolved;
}

} // namespace

// ---------------------------------------------------------------------------
// PropertyCascade
// ---------------------------------------------------------------------------

ResolvedStyle PropertyCascade::cascade(const std::vector<MatchedRule>& matched_rules,
                                       const ResolvedStyle* parent_style,
                                       std::uint64_t node_id) const {
    std::vector<PrioritizedDecl> all_decls;

    for (const auto& matched : matched_rules) {
        for (const auto& decl : matched.rule->declarations) {
            all_decls.push_back({
                &decl,
                matched.rule,
                matched.specificity,
                matched.source_order,
                decl.important
            });
        }
    }

    // Winning declarations come last:
    // 1. !important over normal
    // 2. higher specificity
    // 3. later origin
    std::stable_sort(all_decls.begin(), all_decls.end(),
        [](const PrioritizedDecl& a, const PrioritizedDecl& b) {
            if (a.important != b.important) {
                return !a.important;
            }
            if (!(a.specificity == b.specificity)) {
                return a.specificity < b.specificity;
            }
            return a.source_order < b.source_order;
        });

    std::unordered_map<std::string, const PrioritizedDecl*> winners;
    for (const auto& pd : all_decls) {
        winners[pd.decl->property] = &pd;
    }

    ResolvedStyle style;
    for (const auto& property : all_properties()) {
        auto it = winners.find(property.name);
        if (it == winners.end()) {
            style.set(property.name, property.inherited
                                         ? inherited_value(property, parent_style)
                                         : initial_value(property));
            continue;
        }

        const PrioritizedDecl& winner = *it->second;
        const std::string& value = winner.decl->value;

        ResolvedProperty resolved;
        bool use_parent = value == "inherit" || (value == "unset" && property.inherited);
        bool use_initial = value == "initial" || (value == "unset" && !property.inherited);
        if (use_parent) {
            resolved = inherited_value(property, parent_style);
        } else if (use_initial) {
            resolved = initial_value(property);
        } else {
            resolved.value = value;
            resolved.origin.kind = PropertyOrigin::Kind::Declared;
        }
        if (!use_parent) {
            resolved.origin.rule_origin = winner.source_order;
            resolved.origin.selector = winner.rule->selector_text;
            resolved.origin.important = winner.important;
            resolved.origin.source_node = node_id;
        }
        style.set(property.name, std::move(resolved));
    }

    return style;
}

// ---------------------------------------------------------------------------
// StyleResolver
// ---------------------------------------------------------------------------

std::vector<MatchedRule> StyleResolver::collect_matching_rules(const ElementView& element) const {
    std::vector<MatchedRule> result;
    for (const auto& rule : store_.rules()) {
        bool matched_any = false;
        Specificity best;
        for (const auto& complex_sel : rule.selectors.selectors) {
            if (!matcher_.matches(element, complex_sel)) continue;
            Specificity spec = compute_specificity(complex_sel);
            if (!matched_any || best < spec) {
                best = spec;
            }
            matched_any = true;
        }
        if (matched_any) {
            result.push_back({&rule, best, rule.origin});
        }
    }
    return result;
}

ResolvedStyle StyleResolver::resolve(const ElementView& element,
                                     const ResolvedStyle* parent_style) const {
    return cascade_.cascade(collect_matching_rules(element), parent_style, element.node_id);
}

const ResolvedStyle& StyleResolver::resolve_cached(const ElementView& element) {
    // Climb to the nearest cached ancestor, then resolve back down.
    std::vector<const ElementView*> chain;
    const ResolvedStyle* parent_style = nullptr;
    for (const ElementView* e = &element; e != nullptr; e = e->parent) {
        auto it = cache_.find(e->node_id);
        if (it != cache_.end()) {
            parent_style = &it->second;
            break;
        }
        chain.push_back(e);
    }

    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        ResolvedStyle style = resolve(**it, parent_style);
        parent_style = &cache_.insert_or_assign((*it)->node_id, std::move(style)).first->second;
    }
    return *parent_style;
}

void StyleResolver::invalidate(std::uint64_t node_id) {
    cache_.erase(node_id);
}

void StyleResolver::invalidate_all() {
    cache_.clear();
}

bool StyleResolver::is_cached(std::uint64_t node_id) const {
    return cache_.count(node_id) > 0;
}

} // namespace lolite::css
