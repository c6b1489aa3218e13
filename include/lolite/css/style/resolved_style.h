#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace lolite::css {

struct PropertyOrigin {
    enum class Kind { Declared, Inherited, Initial };
    Kind kind = Kind::Initial;
    // Rule that supplied the value. For inherited values this is the rule
    // that declared it on the ancestor.
    std::optional<size_t> rule_origin;
    std::string selector;
    std::uint64_t source_node = 0;  // node the declaration applied to
    bool important = false;

    bool operator==(const PropertyOrigin& other) const {
        return kind == other.kind && rule_origin == other.rule_origin &&
               selector == other.selector && source_node == other.source_node &&
               important == other.important;
    }
};

const char* origin_kind_name(PropertyOrigin::Kind kind);

struct ResolvedProperty {
    std::string value;
    PropertyOrigin origin;

    bool operator==(const ResolvedProperty& other) const {
        return value == other.value && origin == other.origin;
    }
};

// Final value of every registered property for one node, with provenance.
class ResolvedStyle {
public:
    using PropertyMap = std::map<std::string, ResolvedProperty>;

    void set(const std::string& property, ResolvedProperty resolved) {
        properties_[property] = std::move(resolved);
    }

    const ResolvedProperty* get(const std::string& property) const {
        auto it = properties_.find(property);
        return it == properties_.end() ? nullptr : &it->second;
    }

    // Value of `property`, or an empty string if it is not resolved.
    std::string value(const std::string& property) const;

    bool empty() const { return properties_.empty(); }
    size_t size() const { return properties_.size(); }
    const PropertyMap& properties() const { return properties_; }

    bool operator==(const ResolvedStyle& other) const {
        return properties_ == other.properties_;
    }

private:
    PropertyMap properties_;
};

} // namespace lolite::css
