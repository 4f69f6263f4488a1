#include <cstdio>
#include <psgraph/number_format.hpp>

#include "io/ps_writer.hpp"

namespace psgraph::ps
{

std::string escape(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        switch (c)
        {
            case '(':
            case ')':
            case '\\':
                out += '\\';
                out += c;
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
            {
                auto byte = static_cast<unsigned char>(c);
                if (byte < 0x20 || byte > 0x7e)
                {
                    char octal[5];
                    std::snprintf(octal, sizeof octal, "\\%03o", static_cast<unsigned>(byte));
                    out += octal;
                }
                else
                {
                    out += c;
                }
                break;
            }
        }
    }
    return out;
}

std::string color(const Color& c)
{
    if (c.grey)
        return format_number(c.r);
    return "[ " + format_number(c.r) + " " + format_number(c.g) + " " + format_number(c.b) + " ]";
}

void Writer::start_token()
{
    if (line_start_)
    {
        out_.append(static_cast<size_t>(indent_) * 4, ' ');
        line_start_ = false;
    }
    else
    {
        out_ += ' ';
    }
}

Writer& Writer::token(std::string_view t)
{
    start_token();
    out_ += t;
    return *this;
}

Writer& Writer::number(double v)
{
    return token(format_number(v));
}

Writer& Writer::integer(long v)
{
    return token(std::to_string(v));
}

Writer& Writer::name(std::string_view n)
{
    start_token();
    out_ += '/';
    out_ += n;
    return *this;
}

Writer& Writer::string(std::string_view s)
{
    start_token();
    out_ += '(';
    out_ += escape(s);
    out_ += ')';
    return *this;
}

Writer& Writer::color(const Color& c)
{
    return token(ps::color(c));
}

Writer& Writer::box(const Box& b)
{
    return number(b.left).number(b.bottom).number(b.right).number(b.top);
}

Writer& Writer::numbers(std::span<const double> values)
{
    token("[");
    for (double v : values)
        number(v);
    return token("]");
}

Writer& Writer::integers(std::span<const int> values)
{
    token("[");
    for (int v : values)
        integer(v);
    return token("]");
}

Writer& Writer::strings(const std::vector<std::string>& values)
{
    token("[");
    for (const auto& v : values)
        string(v);
    return token("]");
}

Writer& Writer::labels(const std::vector<AxisLabel>& values)
{
    token("[");
    for (const auto& v : values)
    {
        if (const auto* s = std::get_if<std::string>(&v))
            string(*s);
        else
            number(std::get<double>(v));
    }
    return token("]");
}

Writer& Writer::op(std::string_view o)
{
    token(o);
    out_ += '\n';
    line_start_ = true;
    return *this;
}

Writer& Writer::def(std::string_view key, double value)
{
    return name(key).number(value).op("def");
}

Writer& Writer::def(std::string_view key, std::string_view code)
{
    return name(key).token(code).op("def");
}

Writer& Writer::begin(std::string_view dict)
{
    token(dict).op("begin");
    ++indent_;
    return *this;
}

Writer& Writer::end()
{
    if (indent_ > 0)
        --indent_;
    return op("end");
}

Writer& Writer::raw(std::string_view code)
{
    size_t from = 0;
    while (from < code.size())
    {
        size_t nl   = code.find('\n', from);
        auto   line = code.substr(from, nl == std::string_view::npos ? code.size() - from : nl - from);
        if (!line.empty())
            op(line);
        if (nl == std::string_view::npos)
            break;
        from = nl + 1;
    }
    return *this;
}

}   // namespace psgraph::ps
