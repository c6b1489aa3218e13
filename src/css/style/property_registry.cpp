#include <lolite/css/style/property_registry.h>
#include <lolite/css/style/value_parser.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_map>

namespace lolite::css {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

PropertySpec spec(std::string name, bool inherited, std::string initial, ValueKind kind,
                  std::vector<std::string> keywords = {}, bool non_negative = false) {
    PropertySpec s;
    s.name = std::move(name);
    s.inherited = inherited;
    s.initial = std::move(initial);
    s.kind = kind;
    s.keywords = std::move(keywords);
    s.non_negative = non_negative;
    return s;
}

std::vector<PropertySpec> build_properties() {
    const std::vector<std::string> justify = {
        "flex-start", "flex-end", "center", "space-between", "space-around",
        "space-evenly", "start", "end"};
    const std::vector<std::string> align = {
        "stretch", "flex-start", "flex-end", "center", "baseline", "start", "end"};

    std::vector<PropertySpec> p;
    p.push_back(spec("display", false, "flex", ValueKind::Keyword,
                     {"flex", "block", "inline", "inline-block", "inline-flex", "none"}));
    p.push_back(spec("visibility", true, "visible", ValueKind::Keyword,
                     {"visible", "hidden", "collapse"}));
    p.push_back(spec("opacity", false, "1", ValueKind::Number, {}, true));

    // Colors
    p.push_back(spec("color", true, "black", ValueKind::Color));
    p.push_back(spec("background-color", false, "transparent", ValueKind::Color));
    p.push_back(spec("border-color", false, "currentcolor", ValueKind::Color));

    // Borders
    p.push_back(spec("border-width", false, "0px", ValueKind::Length,
                     {"thin", "medium", "thick"}, true));
    p.push_back(spec("border-style", false, "none", ValueKind::Keyword,
                     {"none", "hidden", "solid", "dashed", "dotted", "double",
                      "groove", "ridge", "inset", "outset"}));
    for (const char* corner : {"top-left", "top-right", "bottom-right", "bottom-left"}) {
        p.push_back(spec(std::string("border-") + corner + "-radius", false, "0px",
                         ValueKind::Length, {}, true));
    }

    // Box
    p.push_back(spec("box-sizing", false, "content-box", ValueKind::Keyword,
                     {"content-box", "border-box"}));
    for (const char* side : {"top", "right", "bottom", "left"}) {
        p.push_back(spec(std::string("margin-") + side, false, "0px", ValueKind::LengthOrAuto));
    }
    for (const char* side : {"top", "right", "bottom", "left"}) {
        p.push_back(spec(std::string("padding-") + side, false, "0px", ValueKind::Length,
                         {}, true));
    }
    p.push_back(spec("width", false, "auto", ValueKind::LengthOrAuto, {}, true));
    p.push_back(spec("height", false, "auto", ValueKind::LengthOrAuto, {}, true));

    // Text
    p.push_back(spec("font-family", true, "sans-serif", ValueKind::FontFamily));
    p.push_back(spec("font-size", true, "16px", ValueKind::FontSize,
                     {"xx-small", "x-small", "small", "medium", "large", "x-large",
                      "xx-large", "smaller", "larger"}, true));
    p.push_back(spec("font-weight", true, "normal", ValueKind::FontWeight,
                     {"normal", "bold", "bolder", "lighter"}));
    p.push_back(spec("font-style", true, "normal", ValueKind::Keyword,
                     {"normal", "italic", "oblique"}));
    p.push_back(spec("line-height", true, "normal", ValueKind::LineHeight, {"normal"}, true));
    p.push_back(spec("text-align", true, "start", ValueKind::Keyword,
                     {"start", "end", "left", "right", "center", "justify"}));

    // Flex container
    p.push_back(spec("flex-direction", false, "row", ValueKind::Keyword,
                     {"row", "row-reverse", "column", "column-reverse"}));
    p.push_back(spec("flex-wrap", false, "nowrap", ValueKind::Keyword,
                     {"nowrap", "wrap", "wrap-reverse"}));
    p.push_back(spec("justify-content", false, "flex-start", ValueKind::Keyword, justify));
    p.push_back(spec("align-items", false, "stretch", ValueKind::Keyword, align));
    p.push_back(spec("align-content", false, "stretch", ValueKind::Keyword,
                     {"stretch", "flex-start", "flex-end", "center", "space-between",
                      "space-around", "space-evenly"}));
    p.push_back(spec("row-gap", false, "0px", ValueKind::Length, {}, true));
    p.push_back(spec("column-gap", false, "0px", ValueKind::Length, {}, true));

    // Flex item
    p.push_back(spec("flex-grow", false, "0", ValueKind::Number, {}, true));
    p.push_back(spec("flex-shrink", false, "1", ValueKind::Number, {}, true));
    p.push_back(spec("flex-basis", false, "auto", ValueKind::LengthOrAuto, {"content"}, true));
    std::vector<std::string> self_align = align;
    self_align.insert(self_align.begin(), "auto");
    p.push_back(spec("align-self", false, "auto", ValueKind::Keyword, self_align));
    p.push_back(spec("order", false, "0", ValueKind::Integer));
    return p;
}

bool has_keyword(const PropertySpec& property, const std::string& ident) {
    return std::find(property.keywords.begin(), property.keywords.end(), ident) !=
           property.keywords.end();
}

bool is_numeric_token(const ComponentValue& cv) {
    return cv.type == ComponentValue::Token &&
           (cv.token_type == CSSToken::Number || cv.token_type == CSSToken::Dimension ||
            cv.token_type == CSSToken::Percentage);
}

bool is_ident(const ComponentValue& cv) {
    return cv.type == ComponentValue::Token && cv.token_type == CSSToken::Ident;
}

bool check_length(const ComponentValue& cv, bool allow_auto, bool non_negative) {
    if (is_ident(cv)) {
        return allow_auto && to_lower(cv.value) == "auto";
    }
    if (!is_numeric_token(cv)) {
        return false;
    }
    auto length = parse_length(cv.value);
    if (!length || length->is_auto()) {
        return false;
    }
    return !(non_negative && cv.numeric_value < 0);
}

bool check_number(const ComponentValue& cv, bool non_negative) {
    if (cv.type != ComponentValue::Token || cv.token_type != CSSToken::Number) {
        return false;
    }
    return !(non_negative && cv.numeric_value < 0);
}

// Validates one component value (or a list, for font-family) and returns
// the text stored in the cascade.
std::optional<std::string> validate_value(const PropertySpec& property,
                                          const std::vector<ComponentValue>& values,
                                          std::string& error) {
    if (values.empty()) {
        error = "empty value for '" + property.name + "'";
        return std::nullopt;
    }

    if (property.kind == ValueKind::FontFamily) {
        bool expect_name = true;
        for (const auto& cv : values) {
            bool comma = cv.type == ComponentValue::Token && cv.value == ",";
            bool name = cv.type == ComponentValue::Token &&
                        (cv.token_type == CSSToken::Ident || cv.token_type == CSSToken::String);
            if (comma) {
                if (expect_name) break;
                expect_name = true;
            } else if (name) {
                expect_name = false;
            } else {
                expect_name = true;
                break;
            }
        }
        if (expect_name) {
            error = "invalid font-family list '" + component_values_to_string(values) + "'";
            return std::nullopt;
        }
        return component_values_to_string(values);
    }

    if (values.size() != 1) {
        error = "'" + property.name + "' takes a single value, got '" +
                component_values_to_string(values) + "'";
        return std::nullopt;
    }

    const ComponentValue& cv = values.front();
    std::string text = component_value_to_string(cv);

    if (is_ident(cv) && has_keyword(property, to_lower(cv.value))) {
        return to_lower(cv.value);
    }

    bool ok = false;
    switch (property.kind) {
        case ValueKind::Color:
            ok = cv.type != ComponentValue::Block &&
                 parse_color(text, Color::black()).has_value();
            if (ok && is_ident(cv)) {
                text = to_lower(text);
            }
            break;
        case ValueKind::Length:
        case ValueKind::FontSize:
            ok = check_length(cv, false, property.non_negative);
            break;
        case ValueKind::LengthOrAuto:
            ok = check_length(cv, true, property.non_negative);
            if (ok && is_ident(cv)) {
                text = "auto";
            }
            break;
        case ValueKind::Number:
            ok = check_number(cv, property.non_negative);
            break;
        case ValueKind::Integer:
            ok = check_number(cv, false) &&
                 cv.numeric_value == std::floor(cv.numeric_value) &&
                 cv.value.find_first_of(".eE") == std::string::npos;
            break;
        case ValueKind::Keyword:
            ok = false;
            break;
        case ValueKind::LineHeight:
            ok = check_number(cv, true) || check_length(cv, false, true);
            break;
        case ValueKind::FontWeight:
            ok = check_number(cv, true) && cv.numeric_value >= 1 && cv.numeric_value <= 1000;
            break;
        case ValueKind::FontFamily:
            break;
    }

    if (!ok) {
        error = "invalid value '" + text + "' for '" + property.name + "'";
        return std::nullopt;
    }
    return text;
}

// ---------------------------------------------------------------------------
// Shorthands
// ---------------------------------------------------------------------------

using Expansion = std::vector<LonghandValue>;

const std::unordered_map<std::string, std::vector<std::string>>& shorthand_longhands() {
    static const std::unordered_map<std::string, std::vector<std::string>> table = {
        {"margin", {"margin-top", "margin-right", "margin-bottom", "margin-left"}},
        {"padding", {"padding-top", "padding-right", "padding-bottom", "padding-left"}},
        {"border-radius", {"border-top-left-radius", "border-top-right-radius",
                           "border-bottom-right-radius", "border-bottom-left-radius"}},
        {"gap", {"row-gap", "column-gap"}},
        {"background", {"background-color"}},
        {"border", {"border-width", "border-style", "border-color"}},
        {"flex", {"flex-grow", "flex-shrink", "flex-basis"}},
    };
    return table;
}

std::optional<std::string> validate_single(const std::string& longhand,
                                           const ComponentValue& cv,
                                           std::string& error) {
    return validate_value(*find_property(longhand), {cv}, error);
}

// margin, padding, border-radius: 1 to 4 values, CSS box order.
std::optional<Expansion> expand_box(const std::vector<std::string>& longhands,
                                    const std::vector<ComponentValue>& values,
                                    std::string& error) {
    if (values.empty() || values.size() > 4) {
        error = "expected 1 to 4 values";
        return std::nullopt;
    }
    std::vector<std::string> parsed;
    for (size_t i = 0; i < values.size(); ++i) {
        auto v = validate_single(longhands[i], values[i], error);
        if (!v) return std::nullopt;
        parsed.push_back(*v);
    }
    // top right bottom left
    std::string top = parsed[0];
    std::string right = parsed.size() > 1 ? parsed[1] : top;
    std::string bottom = parsed.size() > 2 ? parsed[2] : top;
    std::string left = parsed.size() > 3 ? parsed[3] : right;
    return Expansion{{longhands[0], top}, {longhands[1], right},
                     {longhands[2], bottom}, {longhands[3], left}};
}

std::optional<Expansion> expand_gap(const std::vector<ComponentValue>& values,
                                    std::string& error) {
    if (values.empty() || values.size() > 2) {
        error = "expected 1 or 2 values";
        return std::nullopt;
    }
    auto row = validate_single("row-gap", values[0], error);
    if (!row) return std::nullopt;
    auto column = values.size() > 1 ? validate_single("column-gap", values[1], error) : row;
    if (!column) return std::nullopt;
    return Expansion{{"row-gap", *row}, {"column-gap", *column}};
}

std::optional<Expansion> expand_background(const std::vector<ComponentValue>& values,
                                           std::string& error) {
    auto color = validate_value(*find_property("background-color"), values, error);
    if (!color) {
        error = "only a color is supported in 'background'";
        return std::nullopt;
    }
    return Expansion{{"background-color", *color}};
}

// border: <width> || <style> || <color>, in any order. Missing parts reset
// to their initial value.
std::optional<Expansion> expand_border(const std::vector<ComponentValue>& values,
                                       std::string& error) {
    if (values.empty() || values.size() > 3) {
        error = "expected 1 to 3 values";
        return std::nullopt;
    }
    std::optional<std::string> width, style, color;
    std::string ignored;
    for (const auto& cv : values) {
        if (!width) {
            if (auto v = validate_single("border-width", cv, ignored)) { width = v; continue; }
        }
        if (!style) {
            if (auto v = validate_single("border-style", cv, ignored)) { style = v; continue; }
        }
        if (!color) {
            if (auto v = validate_single("border-color", cv, ignored)) { color = v; continue; }
        }
        error = "invalid value '" + component_value_to_string(cv) + "' in 'border'";
        return std::nullopt;
    }
    return Expansion{
        {"border-width", width.value_or(find_property("border-width")->initial)},
        {"border-style", style.value_or(find_property("border-style")->initial)},
        {"border-color", color.value_or(find_property("border-color")->initial)}};
}

// flex: none | auto | <grow> [<shrink>] [<basis>] | <basis>
std::optional<Expansion> expand_flex(const std::vector<ComponentValue>& values,
                                     std::string& error) {
    auto make = [](std::string grow, std::string shrink, std::string basis) {
        return Expansion{{"flex-grow", std::move(grow)},
                         {"flex-shrink", std::move(shrink)},
                         {"flex-basis", std::move(basis)}};
    };

    if (values.size() == 1 && is_ident(values[0])) {
        std::string kw = to_lower(values[0].value);
        if (kw == "none") return make("0", "0", "auto");
        if (kw == "auto") return make("1", "1", "auto");
    }
    if (values.empty() || values.size() > 3) {
        error = "expected 1 to 3 values";
        return std::nullopt;
    }

    std::string grow = "1", shrink = "1", basis = "0%";
    std::string ignored;
    size_t i = 0;
    if (auto g = validate_single("flex-grow", values[i], ignored)) {
        grow = *g;
        ++i;
        if (i < values.size()) {
            if (auto s = validate_single("flex-shrink", values[i], ignored)) {
                shrink = *s;
                ++i;
            }
        }
    }
    if (i < values.size()) {
        auto b = validate_single("flex-basis", values[i], ignored);
        if (!b) {
            error = "invalid value '" + component_value_to_string(values[i]) + "' in 'flex'";
            return std::nullopt;
        }
        basis = *b;
        ++i;
    }
    if (i != values.size()) {
        error = "too many values in 'flex'";
        return std::nullopt;
    }
    return make(grow, shrink, basis);
}

} // namespace

const std::vector<PropertySpec>& all_properties() {
    static const std::vector<PropertySpec> properties = build_properties();
    return properties;
}

const PropertySpec* find_property(std::string_view name) {
    static const std::unordered_map<std::string, size_t> index = [] {
        std::unordered_map<std::string, size_t> m;
        const auto& props = all_properties();
        for (size_t i = 0; i < props.size(); ++i) {
            m.emplace(props[i].name, i);
        }
        return m;
    }();
    auto it = index.find(std::string(name));
    if (it == index.end()) return nullptr;
    return &all_properties()[it->second];
}

bool is_css_wide_keyword(std::string_view value) {
    return value == "inherit" || value == "initial" || value == "unset";
}

bool is_shorthand(std::string_view name) {
    return shorthand_longhands().count(std::string(name)) > 0;
}

std::optional<std::vector<LonghandValue>> expand_declaration(const Declaration& decl,
                                                             std::string& error) {
    const std::string& name = decl.property;
    const PropertySpec* longhand = find_property(name);
    auto shorthand = shorthand_longhands().find(name);

    if (longhand == nullptr && shorthand == shorthand_longhands().end()) {
        error = "unknown property '" + name + "'";
        return std::nullopt;
    }

    // inherit / initial / unset apply to every longhand
    if (decl.values.size() == 1 && is_ident(decl.values[0])) {
        std::string kw = to_lower(decl.values[0].value);
        if (is_css_wide_keyword(kw)) {
            if (longhand != nullptr) {
                return Expansion{{name, kw}};
            }
            Expansion out;
            for (const auto& lh : shorthand->second) {
                out.push_back({lh, kw});
            }
            return out;
        }
    }

    if (longhand != nullptr) {
        auto value = validate_value(*longhand, decl.values, error);
        if (!value) return std::nullopt;
        return Expansion{{name, *value}};
    }

    std::optional<Expansion> out;
    if (name == "margin" || name == "padding" || name == "border-radius") {
        out = expand_box(shorthand->second, decl.values, error);
    } else if (name == "gap") {
        out = expand_gap(decl.values, error);
    } else if (name == "background") {
        out = expand_background(decl.values, error);
    } else if (name == "border") {
        out = expand_border(decl.values, error);
    } else if (name == "flex") {
        out = expand_flex(decl.values, error);
    }
    if (!out && error.find(name) == std::string::npos) {
        error = "'" + name + "': " + error;
    }
    return out;
}

} // namespace lolite::css
