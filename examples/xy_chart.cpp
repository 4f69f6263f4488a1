#include <cmath>
#include <iostream>
#include <psgraph/psgraph.hpp>
#include <string>

using namespace psgraph;

int main()
{
    Logger::instance().add_sink(sinks::console_sink());

    // Damped oscillation and its envelope
    DataTable table;
    table.headers = {"t", "signal", "envelope"};
    for (int i = 0; i <= 60; ++i)
    {
        double t = i * 0.25;
        double e = std::exp(-t / 6.0);
        table.rows.push_back({format_number(t), format_number(e * std::cos(t)), format_number(e)});
    }

    ChartOptions opt;
    opt.paper.page.heading = "Damped oscillation";
    opt.paper.x_axis.title = "Time (s)";
    opt.style.line         = LineStyleOptions{};
    opt.style.auto_choices = {Choice::Red, Choice::Blue, Choice::Dashes};

    // Two charts in one landscape document
    DocumentConfig config = chart_document_config();
    config.landscape      = true;
    config.title          = "XY charts";
    PostScriptFile file(config);

    try
    {
        XYChart lines(file, opt);
        lines.build(table);

        file.new_page();
        ChartOptions points_opt = opt;
        points_opt.style.line.reset();
        points_opt.style.point = PointStyleOptions{};
        points_opt.style.auto_choices.clear();
        XYChart points(file, points_opt);
        points.build(table);
    }
    catch (const Error& e)
    {
        std::cerr << "xy_chart: " << e.what() << "\n";
        return 1;
    }

    return file.write("xy_chart.ps") ? 0 : 1;
}
