#include <lolite/css/style/value_parser.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <unordered_map>
#include <vector>

namespace lolite::css {

namespace {

// Trim whitespace from both ends
std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

const std::unordered_map<std::string, Color>& named_colors() {
    static const std::unordered_map<std::string, Color> colors = {
        {"black",       {0, 0, 0, 255}},
        {"white",       {255, 255, 255, 255}},
        {"red",         {255, 0, 0, 255}},
        {"green",       {0, 128, 0, 255}},
        {"blue",        {0, 0, 255, 255}},
        {"yellow",      {255, 255, 0, 255}},
        {"orange",      {255, 165, 0, 255}},
        {"purple",      {128, 0, 128, 255}},
        {"gray",        {128, 128, 128, 255}},
        {"grey",        {128, 128, 128, 255}},
        {"transparent", {0, 0, 0, 0}},
        {"cyan",        {0, 255, 255, 255}},
        {"magenta",     {255, 0, 255, 255}},
        {"lime",        {0, 255, 0, 255}},
        {"maroon",      {128, 0, 0, 255}},
        {"navy",        {0, 0, 128, 255}},
        {"olive",       {128, 128, 0, 255}},
        {"teal",        {0, 128, 128, 255}},
        {"silver",      {192, 192, 192, 255}},
        {"aqua",        {0, 255, 255, 255}},
        {"fuchsia",     {255, 0, 255, 255}},
        {"pink",        {255, 192, 203, 255}},
        {"brown",       {165, 42, 42, 255}},
        {"gold",        {255, 215, 0, 255}},
        {"indigo",      {75, 0, 130, 255}},
        {"violet",      {238, 130, 238, 255}},
        {"coral",       {255, 127, 80, 255}},
        {"salmon",      {250, 128, 114, 255}},
        {"khaki",       {240, 230, 140, 255}},
        {"beige",       {245, 245, 220, 255}},
        {"crimson",     {220, 20, 60, 255}},
        {"lightgray",   {211, 211, 211, 255}},
        {"lightgrey",   {211, 211, 211, 255}},
        {"darkgray",    {169, 169, 169, 255}},
        {"darkgrey",    {169, 169, 169, 255}},
        {"whitesmoke",  {245, 245, 245, 255}},
        {"rebeccapurple", {102, 51, 153, 255}},
    };
    return colors;
}

// Splits "1, 2, 3 / 0.5" or "1 2 3" into its arguments.
std::vector<std::string> split_color_args(const std::string& inner) {
    std::vector<std::string> args;
    std::string cur;
    auto flush = [&]() {
        if (!cur.empty()) {
            args.push_back(cur);
            cur.clear();
        }
    };
    for (char c : inner) {
        if (c == ',' || c == ' ' || c == '\t' || c == '\n') {
            flush();
        } else if (c == '/') {
            flush();
            args.push_back("/");
        } else {
            cur += c;
        }
    }
    flush();
    // Drop the slash, the alpha is simply the fourth argument
    args.erase(std::remove(args.begin(), args.end(), "/"), args.end());
    return args;
}

std::optional<double> parse_plain_number(const std::string& s) {
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) return std::nullopt;
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

// "128" -> 128, "50%" -> 127.5
std::optional<double> parse_channel(const std::string& s) {
    if (!s.empty() && s.back() == '%') {
        auto pct = parse_plain_number(s.substr(0, s.size() - 1));
        if (!pct) return std::nullopt;
        return std::clamp(*pct, 0.0, 100.0) * 255.0 / 100.0;
    }
    auto v = parse_plain_number(s);
    if (!v) return std::nullopt;
    return std::clamp(*v, 0.0, 255.0);
}

// "0.5" -> 0.5, "50%" -> 0.5
std::optional<double> parse_alpha(const std::string& s) {
    if (!s.empty() && s.back() == '%') {
        auto pct = parse_plain_number(s.substr(0, s.size() - 1));
        if (!pct) return std::nullopt;
        return std::clamp(*pct / 100.0, 0.0, 1.0);
    }
    auto v = parse_plain_number(s);
    if (!v) return std::nullopt;
    return std::clamp(*v, 0.0, 1.0);
}

std::optional<double> parse_percentage(const std::string& s) {
    if (s.empty() || s.back() != '%') return std::nullopt;
    auto v = parse_plain_number(s.substr(0, s.size() - 1));
    if (!v) return std::nullopt;
    return std::clamp(*v, 0.0, 100.0) / 100.0;
}

std::optional<double> parse_hue(const std::string& s) {
    std::string value = s;
    if (value.size() > 3 && value.compare(value.size() - 3, 3, "deg") == 0) {
        value.resize(value.size() - 3);
    }
    auto v = parse_plain_number(value);
    if (!v) return std::nullopt;
    double h = std::fmod(*v, 360.0);
    if (h < 0) h += 360.0;
    return h;
}

uint8_t to_byte(double v) {
    return static_cast<uint8_t>(std::lround(std::clamp(v, 0.0, 255.0)));
}

Color hsl_to_rgb(double h, double s, double l, double alpha) {
    double c = (1.0 - std::fabs(2.0 * l - 1.0)) * s;
    double hp = h / 60.0;
    double x = c * (1.0 - std::fabs(std::fmod(hp, 2.0) - 1.0));
    double r = 0, g = 0, b = 0;
    if (hp < 1)      { r = c; g = x; }
    else if (hp < 2) { r = x; g = c; }
    else if (hp < 3) { g = c; b = x; }
    else if (hp < 4) { g = x; b = c; }
    else if (hp < 5) { r = x; b = c; }
    else             { r = c; b = x; }
    double m = l - c / 2.0;
    return Color{to_byte((r + m) * 255.0), to_byte((g + m) * 255.0),
                 to_byte((b + m) * 255.0), to_byte(alpha * 255.0)};
}

std::optional<Color> parse_hex(const std::string& hex) {
    std::vector<int> d;
    for (char c : hex) {
        int v = hex_digit(c);
        if (v < 0) return std::nullopt;
        d.push_back(v);
    }

    if (d.size() == 3 || d.size() == 4) {
        int a = d.size() == 4 ? d[3] : 15;
        return Color{static_cast<uint8_t>(d[0] * 17), static_cast<uint8_t>(d[1] * 17),
                     static_cast<uint8_t>(d[2] * 17), static_cast<uint8_t>(a * 17)};
    }
    if (d.size() == 6 || d.size() == 8) {
        int a = d.size() == 8 ? d[6] * 16 + d[7] : 255;
        return Color{static_cast<uint8_t>(d[0] * 16 + d[1]),
                     static_cast<uint8_t>(d[2] * 16 + d[3]),
                     static_cast<uint8_t>(d[4] * 16 + d[5]),
                     static_cast<uint8_t>(a)};
    }
    return std::nullopt;
}

} // namespace

bool is_named_color(const std::string& name) {
    return named_colors().count(to_lower(name)) > 0;
}

std::optional<Color> parse_color(const std::string& input, std::optional<Color> current) {
    std::string value = trim(to_lower(input));

    if (value.empty()) return std::nullopt;

    auto& colors = named_colors();
    auto it = colors.find(value);
    if (it != colors.end()) {
        return it->second;
    }

    if (value == "currentcolor") {
        return current;
    }

    if (value[0] == '#') {
        return parse_hex(value.substr(1));
    }

    auto open = value.find('(');
    if (open == std::string::npos || value.back() != ')') {
        return std::nullopt;
    }
    std::string name = trim(value.substr(0, open));
    auto args = split_color_args(value.substr(open + 1, value.size() - open - 2));
    if (args.size() != 3 && args.size() != 4) {
        return std::nullopt;
    }

    double alpha = 1.0;
    if (args.size() == 4) {
        auto a = parse_alpha(args[3]);
        if (!a) return std::nullopt;
        alpha = *a;
    }

    if (name == "rgb" || name == "rgba") {
        auto r = parse_channel(args[0]);
        auto g = parse_channel(args[1]);
        auto b = parse_channel(args[2]);
        if (!r || !g || !b) return std::nullopt;
        return Color{to_byte(*r), to_byte(*g), to_byte(*b), to_byte(alpha * 255.0)};
    }

    if (name == "hsl" || name == "hsla") {
        auto h = parse_hue(args[0]);
        auto s = parse_percentage(args[1]);
        auto l = parse_percentage(args[2]);
        if (!h || !s || !l) return std::nullopt;
        return hsl_to_rgb(*h, *s, *l, alpha);
    }

    return std::nullopt;
}

std::optional<Length> parse_length(const std::string& input) {
    std::string value = trim(to_lower(input));

    if (value.empty()) return std::nullopt;

    if (value == "auto") {
        return Length::auto_val();
    }

    // Split the numeric part from the unit
    size_t i = 0;
    if (value[i] == '+' || value[i] == '-') ++i;
    while (i < value.size() &&
           (std::isdigit(static_cast<unsigned char>(value[i])) || value[i] == '.')) {
        ++i;
    }
    auto number = parse_plain_number(value.substr(0, i));
    if (!number) return std::nullopt;
    std::string unit = value.substr(i);
    float v = static_cast<float>(*number);

    if (unit.empty()) {
        // Only zero may be written without a unit
        if (*number == 0.0) return Length::zero();
        return std::nullopt;
    }
    if (unit == "px") return Length::px(v);
    if (unit == "em") return Length::em(v);
    if (unit == "rem") return Length::rem(v);
    if (unit == "%") return Length::percent(v);
    if (unit == "vw") return Length::vw(v);
    if (unit == "vh") return Length::vh(v);
    return std::nullopt;
}

std::optional<double> parse_number(const std::string& input) {
    return parse_plain_number(trim(input));
}

} // namespace lolite::css
