#include <cmath>
#include <cstdio>
#include <psgraph/number_format.hpp>

namespace psgraph
{

std::string format_number(double value)
{
    if (value == 0.0)
        return "0";
    if (!std::isfinite(value))
        return std::isnan(value) ? "nan" : (value > 0 ? "inf" : "-inf");

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.15g", value);
    std::string text(buf);
    if (text == "-0")
        return "0";
    return text;
}

}   // namespace psgraph
