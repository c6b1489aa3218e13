#pragma once
#include <lolite/css/parser/stylesheet.h>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lolite::css {

enum class ValueKind {
    Color,
    Length,        // <length> | <percentage>
    LengthOrAuto,  // <length> | <percentage> | auto
    Number,
    Integer,
    Keyword,
    LineHeight,    // normal | <number> | <length>
    FontSize,      // <length> | absolute/relative size keyword
    FontWeight,    // keyword | 1..1000
    FontFamily     // comma separated names
};

struct PropertySpec {
    std::string name;
    bool inherited = false;
    std::string initial;
    ValueKind kind = ValueKind::Keyword;
    std::vector<std::string> keywords;  // extra accepted idents
    bool non_negative = false;
};

// Every property the engine resolves, in a stable order.
const std::vector<PropertySpec>& all_properties();

const PropertySpec* find_property(std::string_view name);

bool is_css_wide_keyword(std::string_view value);

bool is_shorthand(std::string_view name);

// A validated longhand declaration ready for the cascade.
struct LonghandValue {
    std::string property;
    std::string value;
};

// Validates a parsed declaration and expands shorthands into longhands.
// Returns nullopt (with `error` set) for unknown properties or values the
// property's grammar rejects.
std::optional<std::vector<LonghandValue>> expand_declaration(const Declaration& decl,
                                                             std::string& error);

} // namespace lolite::css
