#pragma once

#include <cstddef>

namespace psgraph
{

// A PostScript drawing colour: either a grey level or an RGB triple.
// Components range from 0 (black) to 1 (brightest).
struct Color
{
    double r    = 0.0;
    double g    = 0.0;
    double b    = 0.0;
    bool   grey = true;   // r holds the grey level when set

    constexpr Color() = default;
    constexpr Color(double r, double g, double b, bool grey = false) : r(r), g(g), b(b), grey(grey)
    {
    }

    double level() const { return grey ? r : 0.30 * r + 0.59 * g + 0.11 * b; }
};

inline constexpr Color gray(double level)
{
    return Color{level, level, level, true};
}

inline constexpr Color rgb(double r, double g, double b)
{
    return Color{r, g, b, false};
}

inline constexpr Color complement(const Color& c)
{
    return c.grey ? gray(1.0 - c.r) : rgb(1.0 - c.r, 1.0 - c.g, 1.0 - c.b);
}

inline constexpr bool operator==(const Color& a, const Color& b)
{
    if (a.grey != b.grey)
        return false;
    if (a.grey)
        return a.r == b.r;
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

inline constexpr bool operator!=(const Color& a, const Color& b)
{
    return !(a == b);
}

namespace colors
{
inline constexpr Color black      = gray(0.0);
inline constexpr Color white      = gray(1.0);
inline constexpr Color mid_gray   = gray(0.5);
inline constexpr Color light_gray = gray(0.75);
inline constexpr Color red        = rgb(1.0, 0.0, 0.0);
inline constexpr Color green      = rgb(0.0, 1.0, 0.0);
inline constexpr Color blue       = rgb(0.0, 0.0, 1.0);
}   // namespace colors

}   // namespace psgraph
