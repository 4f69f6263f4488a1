#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace psgraph
{

// Rectangular table of text cells with a header row.
struct DataTable
{
    std::vector<std::string>              headers;
    std::vector<std::vector<std::string>> rows;

    size_t columns() const { return headers.size(); }
    size_t row_count() const { return rows.size(); }

    const std::string& cell(size_t row, size_t column) const;

    // Throws DataShapeError when the cell is not a number.
    double number(size_t row, size_t column) const;

    std::vector<std::string> text_column(size_t column) const;
    std::vector<double>      numeric_column(size_t column) const;
};

// Comma separated values. Fields may be wrapped in double quotes, with ""
// standing for a quote inside them. The first row is the header; blank lines
// are skipped. Throws DataShapeError for ragged rows, an unterminated quote,
// or input with no data rows.
DataTable parse_csv(std::string_view text);

// Throws ResourceError when the file cannot be read.
DataTable read_csv(const std::string& path);

}   // namespace psgraph
