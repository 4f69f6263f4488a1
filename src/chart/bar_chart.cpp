#include <algorithm>
#include <psgraph/chart.hpp>
#include <string>

#include "core/fail.hpp"
#include "io/ps_writer.hpp"

namespace psgraph
{

void BarChart::check_shape(const DataTable& data) const
{
    if (data.columns() < 2)
        fail<DataShapeError>("chart", "bar_chart: need a label column and at least one series");
    if (data.row_count() == 0)
        fail<DataShapeError>("chart", "bar_chart: no data rows");

    const auto& labels = options().paper.x_axis.labels;
    if (labels && labels->size() != data.row_count())
        fail<DataShapeError>("chart", "bar_chart: " + std::to_string(labels->size())
                                          + " x axis labels for "
                                          + std::to_string(data.row_count()) + " data rows");
}

PaperOptions BarChart::paper_options(const DataTable& data) const
{
    PaperOptions po = options().paper;
    if (!po.x_axis.labels)
        po.x_axis.labels = data.text_column(0);

    // The value axis always includes zero, where the bars stand
    double low  = 0.0;
    double high = 0.0;
    for (size_t c = 1; c < data.columns(); ++c)
    {
        for (double v : data.numeric_column(c))
        {
            low  = std::min(low, v);
            high = std::max(high, v);
        }
    }
    if (low == high)
        high = low + 1.0;
    if (!po.y_axis.low)
        po.y_axis.low = low;
    if (!po.y_axis.high)
        po.y_axis.high = high;
    return po;
}

StyleOptions BarChart::default_style() const
{
    StyleOptions so;
    so.auto_choices = {Choice::Red, Choice::Green, Choice::Blue};
    so.bar          = BarStyleOptions{};
    return so;
}

void BarChart::check_style(const StyleOptions& style) const
{
    if (!style.bar)
        fail("chart", "bar_chart: style options must include a bar part");
}

void BarChart::draw(const DataTable& data)
{
    const Layout&     l      = layout();
    const AxisLayout& y      = l.y_axis();
    size_t            series = data.columns() - 1;
    double            base   = std::clamp(0.0, y.low(), y.high());

    for (size_t s = 0; s < series; ++s)
    {
        mutable_styles()[s].write(file());

        std::vector<double> values = data.numeric_column(s + 1);
        ps::Writer          w;
        w.begin("gchartdict");
        for (size_t i = 0; i < values.size(); ++i)
        {
            Box    slot  = l.vertical_bar_area(static_cast<int>(i));
            double width = slot.width() / series;
            double left  = slot.left + s * width;
            double top   = std::clamp(values[i], y.low(), y.high());
            w.number(left)
                .number(l.py(std::min(base, top)))
                .number(left + width)
                .number(l.py(std::max(base, top)))
                .op("drawbar");
        }
        w.end();
        file().add_to_page(w.str());
    }
}

std::string BarChart::key_icon(const Style&) const
{
    return "kix0 kiy0 kix1 kiy1 gchartdict begin drawbar end";
}

}   // namespace psgraph
