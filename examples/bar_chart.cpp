#include <iostream>
#include <psgraph/psgraph.hpp>

using namespace psgraph;

// Usage: bar_chart [data.csv] [out.ps]
int main(int argc, char** argv)
{
    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().add_sink(sinks::console_sink());

    std::string out = argc > 2 ? argv[2] : "bar_chart.ps";

    ChartOptions opt;
    opt.paper.page.heading = "Quarterly results";
    opt.paper.y_axis.title = "Thousands";
    opt.document.title     = "Bar chart";

    try
    {
        BarChart chart(opt);
        if (argc > 1)
            chart.build_csv(argv[1]);
        else
            chart.build(parse_csv("Quarter,Sales,Costs,Profit\n"
                                  "Q1,120,80,40\n"
                                  "Q2,135,90,45\n"
                                  "Q3,160,95,65\n"
                                  "Q4,150,110,40\n"));
        if (!chart.write(out))
            return 1;
    }
    catch (const Error& e)
    {
        std::cerr << "bar_chart: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
