#include <xdot_parser/color.hpp>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

namespace xdot_parser {

namespace {

bool hex_byte(std::string_view text, std::size_t pos, double& out) {
    if (pos + 2 > text.size()) return false;
    int value = 0;
    for (std::size_t i = pos; i < pos + 2; ++i) {
        const char c = text[i];
        int digit;
        if (c >= '0' && c <= '9') digit = c - '0';
        else if (c >= 'a' && c <= 'f') digit = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') digit = c - 'A' + 10;
        else return false;
        value = value * 16 + digit;
    }
    out = value / 255.0;
    return true;
}

std::optional<xdot_model::Color> parse_hex(std::string_view text) {
    xdot_model::Color c;
    if (!hex_byte(text, 1, c.r) || !hex_byte(text, 3, c.g) || !hex_byte(text, 5, c.b))
        return std::nullopt;
    if (!hex_byte(text, 7, c.a))
        c.a = 1.0;
    return c;
}

std::optional<xdot_model::Color> parse_hsv(std::string_view text) {
    std::string s(text);
    for (auto& ch : s)
        if (ch == ',') ch = ' ';

    std::istringstream in(s);
    std::vector<double> values;
    std::string field;
    while (in >> field) {
        char* end = nullptr;
        const double v = std::strtod(field.c_str(), &end);
        if (end == field.c_str() || *end != '\0' || !std::isfinite(v)) return std::nullopt;
        values.push_back(v);
    }
    if (values.size() != 3) return std::nullopt;
    return hsv_to_rgb(values[0], values[1], values[2]);
}

} // namespace

xdot_model::Color hsv_to_rgb(double h, double s, double v) {
    if (s == 0.0) return {v, v, v, 1.0};

    // Hue wraps around the color wheel.
    h = std::isfinite(h) ? h - std::floor(h) : 0.0;
    int i = static_cast<int>(h * 6.0);
    const double f = h * 6.0 - i;
    const double p = v * (1.0 - s);
    const double q = v * (1.0 - s * f);
    const double t = v * (1.0 - s * (1.0 - f));
    i = ((i % 6) + 6) % 6;
    switch (i) {
    case 0: return {v, t, p, 1.0};
    case 1: return {q, v, p, 1.0};
    case 2: return {p, v, t, 1.0};
    case 3: return {p, q, v, 1.0};
    case 4: return {t, p, v, 1.0};
    default: return {v, p, q, 1.0};
    }
}

std::optional<xdot_model::Color> parse_color(std::string_view text) {
    if (text.empty()) return std::nullopt;
    const char c1 = text.front();
    if (c1 == '#') return parse_hex(text);
    if (std::isdigit(static_cast<unsigned char>(c1)) || c1 == '.') return parse_hsv(text);
    return lookup_color_name(text);
}

} // namespace xdot_parser
