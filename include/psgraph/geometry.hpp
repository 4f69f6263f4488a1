#pragma once

namespace psgraph
{

// Physical point in PostScript native units (1/72 inch).
struct Point
{
    double x = 0.0;
    double y = 0.0;
};

// Axis-aligned rectangle stored as (left, bottom, right, top), y upwards.
struct Box
{
    double left   = 0.0;
    double bottom = 0.0;
    double right  = 0.0;
    double top    = 0.0;

    double width() const { return right - left; }
    double height() const { return top - bottom; }
};

inline bool operator==(const Box& a, const Box& b)
{
    return a.left == b.left && a.bottom == b.bottom && a.right == b.right && a.top == b.top;
}

}   // namespace psgraph
