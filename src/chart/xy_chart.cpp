#include <algorithm>
#include <psgraph/chart.hpp>

#include "core/fail.hpp"
#include "io/ps_writer.hpp"

namespace psgraph
{

namespace
{

// Smallest and largest of the given columns; an empty span becomes one unit wide.
std::pair<double, double> column_range(const DataTable& data, size_t first, size_t last)
{
    double low  = data.number(0, first);
    double high = low;
    for (size_t c = first; c <= last; ++c)
    {
        for (double v : data.numeric_column(c))
        {
            low  = std::min(low, v);
            high = std::max(high, v);
        }
    }
    if (low == high)
        high = low + 1.0;
    return {low, high};
}

}   // anonymous namespace

void XYChart::check_shape(const DataTable& data) const
{
    if (data.columns() < 2)
        fail<DataShapeError>("chart", "xy_chart: need an x column and at least one y series");
    if (data.row_count() == 0)
        fail<DataShapeError>("chart", "xy_chart: no data rows");
}

PaperOptions XYChart::paper_options(const DataTable& data) const
{
    PaperOptions po = options().paper;

    auto [xlo, xhi] = column_range(data, 0, 0);
    if (!po.x_axis.low)
        po.x_axis.low = xlo;
    if (!po.x_axis.high)
        po.x_axis.high = xhi;

    auto [ylo, yhi] = column_range(data, 1, data.columns() - 1);
    if (!po.y_axis.low)
        po.y_axis.low = ylo;
    if (!po.y_axis.high)
        po.y_axis.high = yhi;
    return po;
}

StyleOptions XYChart::default_style() const
{
    StyleOptions so;
    so.line  = LineStyleOptions{};
    so.point = PointStyleOptions{};
    return so;
}

void XYChart::check_style(const StyleOptions& style) const
{
    if (!style.line && !style.point)
        fail("chart", "xy_chart: style options must include a line or point part");
}

void XYChart::draw(const DataTable& data)
{
    const Layout&       l = layout();
    std::vector<double> x = data.numeric_column(0);

    for (size_t s = 1; s < data.columns(); ++s)
    {
        mutable_styles()[s - 1].write(file());

        std::vector<double> y = data.numeric_column(s);
        std::vector<double> points;
        points.reserve(2 * x.size());
        for (size_t i = 0; i < x.size(); ++i)
        {
            Point p = l.physical_point(x[i], y[i]);
            points.push_back(p.x);
            points.push_back(p.y);
        }

        ps::Writer w;
        w.begin("gchartdict");
        const Style& style = styles()[s - 1];
        if (style.line())
            w.numbers(points).op("drawxyline");
        if (style.point())
            w.numbers(points).op("drawxypoints");
        w.end();
        file().add_to_page(w.str());
    }
}

std::string XYChart::key_icon(const Style& style) const
{
    if (style.line() && style.point())
        return "kix0 kiy0 kix1 kiy1 gchartdict begin drawkeyline end";
    if (style.line())
        return "[ kix0 kiy0 kiy1 add 2 div kix1 kiy0 kiy1 add 2 div ] gchartdict begin drawxyline end";
    return "kix0 kix1 add 2 div kiy0 kiy1 add 2 div gchartdict begin draw1point end";
}

}   // namespace psgraph
