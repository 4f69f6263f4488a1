#pragma once

#include <string>

namespace psgraph
{

// Formats a number the way it is written into PostScript and messages:
// up to 15 significant digits, no trailing zeros, and "-0" written as "0".
std::string format_number(double value);

}   // namespace psgraph
