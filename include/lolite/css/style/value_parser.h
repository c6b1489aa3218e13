#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace lolite::css {

struct Color {
    uint8_t r = 0, g = 0, b = 0, a = 255;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    bool operator!=(const Color& other) const {
        return !(*this == other);
    }

    static Color black() { return {0, 0, 0, 255}; }
    static Color white() { return {255, 255, 255, 255}; }
    static Color transparent() { return {0, 0, 0, 0}; }
};

struct Length {
    enum class Unit { Px, Em, Rem, Percent, Vw, Vh, Auto, Zero };
    float value = 0;
    Unit unit = Unit::Px;

    static Length px(float v) { return {v, Unit::Px}; }
    static Length em(float v) { return {v, Unit::Em}; }
    static Length rem(float v) { return {v, Unit::Rem}; }
    static Length percent(float v) { return {v, Unit::Percent}; }
    static Length vw(float v) { return {v, Unit::Vw}; }
    static Length vh(float v) { return {v, Unit::Vh}; }
    static Length auto_val() { return {0, Unit::Auto}; }
    static Length zero() { return {0, Unit::Zero}; }

    bool is_auto() const { return unit == Unit::Auto; }

    bool operator==(const Length& other) const {
        return value == other.value && unit == other.unit;
    }
};

// Named colors, #rgb, #rgba, #rrggbb, #rrggbbaa, rgb(), rgba(), hsl(),
// hsla(), transparent. `currentcolor` is not a concrete color: it parses
// only when `current` is given.
std::optional<Color> parse_color(const std::string& input,
                                 std::optional<Color> current = std::nullopt);

// px, em, rem, %, vw, vh, unitless 0 and `auto`.
std::optional<Length> parse_length(const std::string& input);

std::optional<double> parse_number(const std::string& input);

bool is_named_color(const std::string& name);

} // namespace lolite::css
