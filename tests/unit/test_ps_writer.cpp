#include <gtest/gtest.h>
#include <psgraph/color.hpp>
#include <psgraph/number_format.hpp>
#include <string>
#include <vector>

#include "io/ps_writer.hpp"

using namespace psgraph;

// --- format_number ---

TEST(FormatNumber, Integers)
{
    EXPECT_EQ(format_number(0.0), "0");
    EXPECT_EQ(format_number(-0.0), "0");
    EXPECT_EQ(format_number(468.0), "468");
    EXPECT_EQ(format_number(-60.0), "-60");
}

TEST(FormatNumber, Fractions)
{
    EXPECT_EQ(format_number(0.8325), "0.8325");
    EXPECT_EQ(format_number(301.5), "301.5");
    EXPECT_EQ(format_number(0.1 + 0.2), "0.3");
}

TEST(FormatNumber, RepeatingFractionsKeepFifteenDigits)
{
    EXPECT_EQ(format_number(67.0 / 3.0), "22.3333333333333");
}

// --- escape / color ---

TEST(PsEscape, SpecialCharacters)
{
    EXPECT_EQ(ps::escape("plain"), "plain");
    EXPECT_EQ(ps::escape("a (b) c"), "a \\(b\\) c");
    EXPECT_EQ(ps::escape("back\\slash"), "back\\\\slash");
    EXPECT_EQ(ps::escape("two\nlines"), "two\\nlines");
}

TEST(PsEscape, NonAsciiBytesBecomeOctal)
{
    EXPECT_EQ(ps::escape("caf\xc3\xa9"), "caf\\303\\251");
    EXPECT_EQ(ps::escape("bell\x07"), "bell\\007");
    EXPECT_EQ(ps::escape("del\x7f"), "del\\177");
    EXPECT_EQ(ps::escape("~ "), "~ ");
}

TEST(PsColor, GreyIsANumber)
{
    EXPECT_EQ(ps::color(gray(0.5)), "0.5");
    EXPECT_EQ(ps::color(colors::black), "0");
}

TEST(PsColor, RgbIsAnArray)
{
    EXPECT_EQ(ps::color(rgb(1.0, 0.5, 0.0)), "[ 1 0.5 0 ]");
}

// --- Writer ---

TEST(PsWriter, TokensAreSpaceSeparated)
{
    ps::Writer w;
    w.number(1.5).integer(3).name("Helvetica").string("Hi").op("show");
    EXPECT_EQ(w.str(), "1.5 3 /Helvetica (Hi) show\n");
}

TEST(PsWriter, Arrays)
{
    ps::Writer                w;
    std::vector<double>       values  = {0.5, 2.0};
    std::vector<int>          factors = {8, 5};
    std::vector<std::string>  names   = {"a", "b"};
    w.numbers(values).integers(factors).strings(names).op("x");
    EXPECT_EQ(w.str(), "[ 0.5 2 ] [ 8 5 ] [ (a) (b) ] x\n");
}

TEST(PsWriter, EmptyArray)
{
    ps::Writer          w;
    std::vector<double> none;
    w.numbers(none).op("setdash");
    EXPECT_EQ(w.str(), "[ ] setdash\n");
}

TEST(PsWriter, MixedLabels)
{
    ps::Writer             w;
    std::vector<AxisLabel> labels = {100.0, std::string("Jan"), std::string()};
    w.labels(labels).op("l");
    EXPECT_EQ(w.str(), "[ 100 (Jan) () ] l\n");
}

TEST(PsWriter, BoxAndColor)
{
    ps::Writer w;
    w.box({67.0, 135.0, 134.0, 468.0}).color(gray(1.0)).op("graph_area");
    EXPECT_EQ(w.str(), "67 135 134 468 1 graph_area\n");
}

TEST(PsWriter, Definitions)
{
    ps::Writer w;
    w.def("kx0", 149.0).def("ppshape", "/make_dot cvx");
    EXPECT_EQ(w.str(), "/kx0 149 def\n/ppshape /make_dot cvx def\n");
}

TEST(PsWriter, BeginIndentsUntilEnd)
{
    ps::Writer w;
    w.begin("gpaperdict").op("drawgpaper").end().op("after");
    EXPECT_EQ(w.str(), "gpaperdict begin\n    drawgpaper\nend\nafter\n");
}

TEST(PsWriter, RawCopiesLinesAtTheCurrentIndent)
{
    ps::Writer w;
    w.begin("d").raw("a b moveto\n\nc d lineto").end();
    EXPECT_EQ(w.str(), "d begin\n    a b moveto\n    c d lineto\nend\n");
}

TEST(PsWriter, StartingIndent)
{
    ps::Writer w(1);
    w.op("stroke");
    EXPECT_EQ(w.str(), "    stroke\n");
}
