#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <psgraph/data_table.hpp>
#include <sstream>

#include "core/fail.hpp"

namespace psgraph
{

namespace
{

std::string trim(std::string_view s)
{
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string_view::npos)
        return {};
    size_t e = s.find_last_not_of(" \t\r");
    return std::string(s.substr(b, e - b + 1));
}

// Splits one record starting at `pos`; leaves `pos` after its line ending.
std::vector<std::string> read_record(std::string_view text, size_t& pos, size_t line)
{
    std::vector<std::string> fields;
    std::string              field;
    bool                     quoted     = false;
    bool                     was_quoted = false;

    while (pos < text.size())
    {
        char c = text[pos++];
        if (quoted)
        {
            if (c == '"')
            {
                if (pos < text.size() && text[pos] == '"')
                {
                    field += '"';
                    ++pos;
                }
                else
                {
                    quoted = false;
                }
            }
            else
            {
                field += c;
            }
            continue;
        }

        if (c == '"' && trim(field).empty())
        {
            quoted     = true;
            was_quoted = true;
            field.clear();
        }
        else if (c == ',')
        {
            fields.push_back(was_quoted ? field : trim(field));
            field.clear();
            was_quoted = false;
        }
        else if (c == '\n')
        {
            break;
        }
        else if (!(was_quoted && (c == ' ' || c == '\t' || c == '\r')))
        {
            field += c;
        }
    }

    if (quoted)
        fail<DataShapeError>("csv", "csv: line " + std::to_string(line) + ": unterminated quote");
    fields.push_back(was_quoted ? field : trim(field));
    return fields;
}

bool is_blank(const std::vector<std::string>& record)
{
    return record.size() == 1 && record[0].empty();
}

}   // anonymous namespace

const std::string& DataTable::cell(size_t row, size_t column) const
{
    if (row >= rows.size() || column >= rows[row].size())
        fail<DataShapeError>("csv", "csv: no cell at row " + std::to_string(row) + ", column "
                                        + std::to_string(column));
    return rows[row][column];
}

double DataTable::number(size_t row, size_t column) const
{
    const std::string& text = cell(row, column);
    errno                   = 0;
    char*  end              = nullptr;
    double v                = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE)
    {
        std::string name = column < headers.size() ? headers[column] : std::to_string(column);
        fail<DataShapeError>("csv", "csv: row " + std::to_string(row + 1) + ", column '" + name
                                        + "': '" + text + "' is not a number");
    }
    return v;
}

std::vector<std::string> DataTable::text_column(size_t column) const
{
    std::vector<std::string> out;
    out.reserve(rows.size());
    for (size_t r = 0; r < rows.size(); ++r)
        out.push_back(cell(r, column));
    return out;
}

std::vector<double> DataTable::numeric_column(size_t column) const
{
    std::vector<double> out;
    out.reserve(rows.size());
    for (size_t r = 0; r < rows.size(); ++r)
        out.push_back(number(r, column));
    return out;
}

DataTable parse_csv(std::string_view text)
{
    DataTable table;
    size_t    pos  = 0;
    size_t    line = 0;
    bool      have_header = false;

    while (pos < text.size())
    {
        ++line;
        auto record = read_record(text, pos, line);
        if (is_blank(record))
            continue;

        if (!have_header)
        {
            table.headers = std::move(record);
            have_header   = true;
            continue;
        }
        if (record.size() != table.headers.size())
            fail<DataShapeError>("csv", "csv: line " + std::to_string(line) + " has "
                                            + std::to_string(record.size()) + " fields, expected "
                                            + std::to_string(table.headers.size()));
        table.rows.push_back(std::move(record));
    }

    if (!have_header)
        fail<DataShapeError>("csv", "csv: no header row");
    if (table.rows.empty())
        fail<DataShapeError>("csv", "csv: no data rows");

    PSGRAPH_LOG_DEBUG("csv", "parsed {} rows of {} columns", table.rows.size(), table.columns());
    return table;
}

DataTable read_csv(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
        fail<ResourceError>("csv", "csv: cannot open '" + path + "'");

    std::ostringstream content;
    content << file.rdbuf();
    return parse_csv(content.str());
}

}   // namespace psgraph
