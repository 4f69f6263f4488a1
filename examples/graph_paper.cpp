#include <iostream>
#include <psgraph/psgraph.hpp>

using namespace psgraph;

// Blank graph paper with a hand-drawn curve over it.
int main()
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    PostScriptFile file(chart_document_config());

    PaperOptions po;
    po.page.heading       = "Graph paper";
    po.page.color         = rgb(0.2, 0.4, 0.8);
    po.page.light_color   = rgb(0.7, 0.8, 1.0);
    po.x_axis.low         = -2.0;
    po.x_axis.high        = 2.0;
    po.y_axis.low         = 0.0;
    po.y_axis.high        = 4.0;
    po.y_axis.title       = "x squared";

    try
    {
        GraphPaper paper(&file, po);
        const Layout& l = paper.layout();

        Point start = l.physical_point(-2.0, 4.0);
        std::string path = format_number(start.x) + " " + format_number(start.y) + " moveto\n";
        for (int i = 1; i <= 40; ++i)
        {
            double x = -2.0 + i * 0.1;
            Point  p = l.physical_point(x, x * x);
            path += format_number(p.x) + " " + format_number(p.y) + " lineto\n";
        }
        file.add_to_page("newpath\n" + path + "1 0 0 setrgbcolor 1.5 setlinewidth stroke\n");
    }
    catch (const Error& e)
    {
        std::cerr << "graph_paper: " << e.what() << "\n";
        return 1;
    }

    return file.write("graph_paper.ps") ? 0 : 1;
}
