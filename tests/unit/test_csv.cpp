#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <psgraph/data_table.hpp>
#include <psgraph/errors.hpp>
#include <string>
#include <vector>

using namespace psgraph;

// --- parse_csv ---

TEST(ParseCsv, HeaderAndRows)
{
    auto t = parse_csv("Month,Sales,Costs\nJan,10,4\nFeb,12.5,6\n");
    EXPECT_EQ(t.headers, (std::vector<std::string>{"Month", "Sales", "Costs"}));
    EXPECT_EQ(t.columns(), 3u);
    EXPECT_EQ(t.row_count(), 2u);
    EXPECT_EQ(t.cell(1, 0), "Feb");
    EXPECT_DOUBLE_EQ(t.number(1, 1), 12.5);
}

TEST(ParseCsv, TrimsUnquotedFields)
{
    auto t = parse_csv("  a , b\n 1 ,  2  \n");
    EXPECT_EQ(t.headers, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(t.cell(0, 1), "2");
}

TEST(ParseCsv, QuotedFields)
{
    auto t = parse_csv("name,value\n\"Smith, J\",3\n\"say \"\"hi\"\"\",4\n\" padded \",5\n");
    EXPECT_EQ(t.cell(0, 0), "Smith, J");
    EXPECT_EQ(t.cell(1, 0), "say \"hi\"");
    EXPECT_EQ(t.cell(2, 0), " padded ");
}

TEST(ParseCsv, QuotedFieldMaySpanLines)
{
    auto t = parse_csv("label,v\n\"two\nlines\",1\n");
    EXPECT_EQ(t.cell(0, 0), "two\nlines");
}

TEST(ParseCsv, SkipsBlankLinesAndCarriageReturns)
{
    auto t = parse_csv("x,y\r\n\r\n1,2\r\n\n3,4\r\n");
    EXPECT_EQ(t.row_count(), 2u);
    EXPECT_EQ(t.cell(1, 1), "4");
}

TEST(ParseCsv, NoTrailingNewline)
{
    auto t = parse_csv("x,y\n1,2");
    EXPECT_EQ(t.row_count(), 1u);
    EXPECT_EQ(t.cell(0, 1), "2");
}

TEST(ParseCsv, RaggedRowThrows)
{
    EXPECT_THROW(parse_csv("a,b\n1,2\n3\n"), DataShapeError);
}

TEST(ParseCsv, UnterminatedQuoteThrows)
{
    EXPECT_THROW(parse_csv("a,b\n\"open,2\n"), DataShapeError);
}

TEST(ParseCsv, EmptyInputThrows)
{
    EXPECT_THROW(parse_csv(""), DataShapeError);
    EXPECT_THROW(parse_csv("\n\n"), DataShapeError);
}

TEST(ParseCsv, HeaderOnlyThrows)
{
    EXPECT_THROW(parse_csv("a,b\n"), DataShapeError);
}

// --- DataTable ---

TEST(DataTable, NumericColumn)
{
    auto t = parse_csv("x,y\n1,-2.5\n3,1e3\n");
    EXPECT_EQ(t.numeric_column(1), (std::vector<double>{-2.5, 1000.0}));
    EXPECT_EQ(t.text_column(0), (std::vector<std::string>{"1", "3"}));
}

TEST(DataTable, NonNumericCellThrows)
{
    auto t = parse_csv("x,y\n1,abc\n2,3x\n3,\n");
    EXPECT_THROW(t.number(0, 1), DataShapeError);
    EXPECT_THROW(t.number(1, 1), DataShapeError);
    EXPECT_THROW(t.number(2, 1), DataShapeError);
}

TEST(DataTable, ErrorNamesRowAndColumn)
{
    auto t = parse_csv("x,Sales\n1,lots\n");
    try
    {
        t.number(0, 1);
        FAIL() << "expected DataShapeError";
    }
    catch (const DataShapeError& e)
    {
        EXPECT_STREQ(e.what(), "csv: row 1, column 'Sales': 'lots' is not a number");
    }
}

TEST(DataTable, MissingCellThrows)
{
    auto t = parse_csv("x\n1\n");
    EXPECT_THROW(t.cell(5, 0), DataShapeError);
    EXPECT_THROW(t.cell(0, 3), DataShapeError);
}

// --- read_csv ---

class ReadCsvTest : public ::testing::Test
{
   protected:
    std::string tmp_path_;

    void SetUp() override
    {
        tmp_path_ = (std::filesystem::temp_directory_path() / "psgraph_test_read.csv").string();
    }

    void TearDown() override { std::remove(tmp_path_.c_str()); }
};

TEST_F(ReadCsvTest, ReadsFile)
{
    {
        std::ofstream out(tmp_path_);
        out << "Label,Value\nA,1\nB,2\n";
    }
    auto t = read_csv(tmp_path_);
    EXPECT_EQ(t.row_count(), 2u);
    EXPECT_DOUBLE_EQ(t.number(1, 1), 2.0);
}

TEST_F(ReadCsvTest, MissingFileThrows)
{
    EXPECT_THROW(read_csv(tmp_path_ + ".missing"), ResourceError);
}
