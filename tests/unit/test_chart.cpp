#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <psgraph/chart.hpp>
#include <psgraph/errors.hpp>
#include <string>
#include <vector>

using namespace psgraph;

namespace
{

size_t count(const std::string& haystack, const std::string& needle)
{
    size_t n   = 0;
    size_t pos = haystack.find(needle);
    while (pos != std::string::npos)
    {
        ++n;
        pos = haystack.find(needle, pos + needle.size());
    }
    return n;
}

bool contains(const std::string& haystack, const std::string& needle)
{
    return count(haystack, needle) > 0;
}

const char* kReadings = "Label,Value\nFirst bar,150\nSecond bar,300\nThird bar,450\n";
const char* kTwoSeries = "Month,Sales,Costs\nJan,10,4\nFeb,12,6\nMar,9,7\nApr,14,5\n";
const char* kWaves     = "x,sin,cos\n0,0,1\n1,0.84,0.54\n2,0.91,-0.42\n3,0.14,-0.99\n";

}   // namespace

// --- BarChart ---

TEST(BarChart, SingleSeriesHasNoKey)
{
    BarChart chart;
    chart.build(parse_csv(kReadings));
    EXPECT_EQ(chart.key(), nullptr);
    EXPECT_EQ(chart.styles().size(), 1u);
    EXPECT_EQ(count(chart.file().page_code(0), "drawbar"), 3u);
}

TEST(BarChart, AddsEveryProcedureSet)
{
    BarChart chart;
    chart.build(parse_csv(kReadings));
    EXPECT_TRUE(chart.file().has_function("GraphPaper"));
    EXPECT_TRUE(chart.file().has_function("GraphChart"));
    EXPECT_TRUE(chart.file().has_function("GraphStyle"));
    EXPECT_FALSE(chart.file().has_function("GraphKey"));
}

TEST(BarChart, CategoriesComeFromTheFirstColumn)
{
    BarChart chart;
    chart.build(parse_csv(kReadings));
    const AxisLayout& x = chart.paper().layout().x_axis();
    EXPECT_TRUE(x.categorical());
    EXPECT_EQ(x.labels().size(), 4u);
    EXPECT_EQ(std::get<std::string>(x.labels()[1]), "Second bar");
}

TEST(BarChart, ValueAxisIncludesZero)
{
    BarChart chart;
    chart.build(parse_csv(kReadings));
    const AxisLayout& y = chart.paper().layout().y_axis();
    EXPECT_DOUBLE_EQ(y.low(), 0.0);
    EXPECT_GE(y.high(), 450.0);
}

TEST(BarChart, BarsStandOnTheAxisFloor)
{
    ChartOptions opt;
    opt.paper.page.right_edge = 250.0;
    opt.paper.page.top_edge   = 500.0;
    opt.paper.page.key_width  = 100.0;
    opt.paper.y_axis.low      = 123.0;
    opt.paper.y_axis.high     = 456.7;

    BarChart chart(opt);
    chart.build(parse_csv(kReadings));
    // The axis runs 100..500 over 135..468, so 300 reaches 301.5
    EXPECT_TRUE(contains(chart.file().page_code(0), " 135 111.666666666667 301.5 drawbar\n"));
}

TEST(BarChart, FirstStyleIsRed)
{
    BarChart chart;
    chart.build(parse_csv(kReadings));
    EXPECT_TRUE(contains(chart.file().page_code(0), "/bicolor [ 0.5 0 0 ] def"));
}

TEST(BarChart, SeveralSeriesShareEachSlot)
{
    BarChart chart;
    chart.build(parse_csv(kTwoSeries));
    ASSERT_NE(chart.key(), nullptr);
    EXPECT_EQ(chart.key()->items_added(), 2);
    EXPECT_EQ(chart.styles().size(), 2u);
    EXPECT_EQ(count(chart.file().page_code(0), "drawbar\n"), 8u);
    EXPECT_TRUE(contains(chart.file().page_code(0), "(Costs) show"));
}

TEST(BarChart, KeyCanBeSwitchedOff)
{
    ChartOptions opt;
    opt.show_key = false;
    BarChart chart(opt);
    chart.build(parse_csv(kTwoSeries));
    EXPECT_EQ(chart.key(), nullptr);
}

TEST(BarChart, KeyWidthIsReserved)
{
    BarChart chart;
    chart.build(parse_csv(kTwoSeries));
    const Layout& l = chart.paper().layout();
    EXPECT_DOUBLE_EQ(l.page().key_width, chart.key()->width());
    EXPECT_LE(chart.key()->box().right, l.page().right);
}

TEST(BarChart, RebuildStartsANewPage)
{
    BarChart chart;
    chart.build(parse_csv(kReadings));
    chart.build(parse_csv(kTwoSeries));
    EXPECT_EQ(chart.file().page_count(), 2u);
    EXPECT_FALSE(contains(chart.file().page_code(0), "Costs"));
    EXPECT_TRUE(contains(chart.file().page_code(1), "Costs"));
}

TEST(BarChart, BadDataThrowsBeforeDrawing)
{
    BarChart chart;
    EXPECT_THROW(chart.build(parse_csv("Label\nA\n")), DataShapeError);
    EXPECT_THROW(chart.build(parse_csv("Label,Value\nA,many\n")), DataShapeError);
    EXPECT_TRUE(chart.file().page_code(0).empty());
}

TEST(BarChart, LabelCountMustMatchRows)
{
    ChartOptions opt;
    opt.paper.x_axis.labels = std::vector<std::string>{"One", "Two"};
    BarChart chart(opt);
    EXPECT_THROW(chart.build(parse_csv(kReadings)), DataShapeError);
    EXPECT_TRUE(chart.file().page_code(0).empty());

    opt.paper.x_axis.labels = std::vector<std::string>{"One", "Two", "Three"};
    BarChart labelled(opt);
    labelled.build(parse_csv(kReadings));
    EXPECT_EQ(std::get<std::string>(labelled.paper().layout().x_axis().labels()[2]), "Three");
}

TEST(BarChart, StyleWithoutBarPartThrows)
{
    ChartOptions opt;
    opt.style.line = LineStyleOptions{};
    BarChart chart(opt);
    EXPECT_THROW(chart.build(parse_csv(kReadings)), ConfigurationError);
    EXPECT_TRUE(chart.file().page_code(0).empty());
}

TEST(BarChart, PaperBeforeBuildThrows)
{
    BarChart chart;
    EXPECT_THROW(chart.paper(), ResourceError);
}

// --- XYChart ---

TEST(XYChart, DrawsLinesAndPoints)
{
    XYChart chart;
    chart.build(parse_csv(kWaves));
    const std::string& ps = chart.file().page_code(0);
    EXPECT_EQ(count(ps, "] drawxyline\n"), 2u);
    EXPECT_EQ(count(ps, "] drawxypoints\n"), 2u);
}

TEST(XYChart, AxesCoverTheData)
{
    XYChart chart;
    chart.build(parse_csv(kWaves));
    const Layout& l = chart.paper().layout();
    EXPECT_LE(l.x_axis().low(), 0.0);
    EXPECT_GE(l.x_axis().high(), 3.0);
    EXPECT_LE(l.y_axis().low(), -0.99);
    EXPECT_GE(l.y_axis().high(), 1.0);
}

TEST(XYChart, SeriesGetDistinctShapes)
{
    XYChart chart;
    chart.build(parse_csv(kWaves));
    ASSERT_EQ(chart.styles().size(), 2u);
    EXPECT_EQ(chart.styles()[0].point()->shape, Shape::Dot);
    EXPECT_EQ(chart.styles()[1].point()->shape, Shape::Cross);
}

TEST(XYChart, SingleSeriesStillHasAKey)
{
    XYChart chart;
    chart.build(parse_csv("x,y\n1,2\n2,4\n"));
    ASSERT_NE(chart.key(), nullptr);
    EXPECT_TRUE(contains(chart.file().page_code(0), "drawkeyline"));
}

TEST(XYChart, PointOnlyStyle)
{
    ChartOptions opt;
    opt.style.point = PointStyleOptions{};
    XYChart chart(opt);
    chart.build(parse_csv(kWaves));
    const std::string& ps = chart.file().page_code(0);
    EXPECT_FALSE(contains(ps, "drawxyline"));
    EXPECT_TRUE(contains(ps, "draw1point"));
}

TEST(XYChart, FlatSeriesGetsAUnitRange)
{
    XYChart chart;
    chart.build(parse_csv("x,y\n0,5\n10,5\n"));
    const Layout& l = chart.paper().layout();
    EXPECT_LE(l.y_axis().low(), 5.0);
    EXPECT_GE(l.y_axis().high(), 6.0);
}

// --- Shared documents ---

TEST(Chart, ChartsShareADocument)
{
    PostScriptFile file(chart_document_config());
    BarChart       bars(file);
    XYChart        lines(file);

    bars.build(parse_csv(kTwoSeries));
    file.new_page();
    lines.build(parse_csv(kWaves));

    EXPECT_EQ(file.page_count(), 2u);
    EXPECT_EQ(&bars.file(), &file);
    EXPECT_TRUE(contains(file.page_code(0), "drawbar"));
    EXPECT_TRUE(contains(file.page_code(1), "drawxyline"));
    EXPECT_EQ(count(file.to_string(), "%%BeginResource: procset GraphPaper"), 1u);
}

class ChartWriteTest : public ::testing::Test
{
   protected:
    std::string csv_path_;
    std::string ps_path_;

    void SetUp() override
    {
        auto dir  = std::filesystem::temp_directory_path();
        csv_path_ = (dir / "psgraph_test_chart.csv").string();
        ps_path_  = (dir / "psgraph_test_chart.ps").string();
        std::ofstream out(csv_path_);
        out << kTwoSeries;
    }

    void TearDown() override
    {
        std::remove(csv_path_.c_str());
        std::remove(ps_path_.c_str());
    }
};

TEST_F(ChartWriteTest, BuildFromCsvAndWrite)
{
    BarChart chart;
    chart.build_csv(csv_path_);
    ASSERT_TRUE(chart.write(ps_path_));
    EXPECT_TRUE(std::filesystem::exists(ps_path_));
    EXPECT_GT(std::filesystem::file_size(ps_path_), 0u);
}

TEST_F(ChartWriteTest, MissingCsvThrows)
{
    BarChart chart;
    EXPECT_THROW(chart.build_csv(csv_path_ + ".missing"), ResourceError);
}
