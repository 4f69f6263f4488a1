#pragma once

#include <psgraph/color.hpp>
#include <psgraph/geometry.hpp>
#include <psgraph/scale.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace psgraph::ps
{

// Escapes the characters that are special inside a PostScript string literal.
// Bytes outside printable ASCII become \ddd octal escapes.
std::string escape(std::string_view text);

// Grey levels as a bare number, RGB as "[ r g b ]", as gpapercolor expects.
std::string color(const Color& c);

// Builds PostScript statements one token at a time. Tokens are separated by
// single spaces; op() closes a statement with a newline.
class Writer
{
   public:
    explicit Writer(int indent = 0) : indent_(indent) {}

    Writer& number(double v);
    Writer& integer(long v);
    Writer& name(std::string_view n);     // literal name, "/n"
    Writer& string(std::string_view s);   // "(s)"
    Writer& color(const Color& c);
    Writer& box(const Box& b);            // "left bottom right top"
    Writer& numbers(std::span<const double> values);
    Writer& integers(std::span<const int> values);
    Writer& strings(const std::vector<std::string>& values);
    Writer& labels(const std::vector<AxisLabel>& values);
    Writer& token(std::string_view t);

    // Appends `o` and ends the statement.
    Writer& op(std::string_view o);

    // "/key value def" on its own line.
    Writer& def(std::string_view key, double value);
    Writer& def(std::string_view key, std::string_view code);

    // "<dict> begin", indenting until the matching end().
    Writer& begin(std::string_view dict);
    Writer& end();

    // Copies `code` verbatim, one statement per line.
    Writer& raw(std::string_view code);

    const std::string& str() const { return out_; }

   private:
    void start_token();

    std::string out_;
    int         indent_     = 0;
    bool        line_start_ = true;
};

}   // namespace psgraph::ps
