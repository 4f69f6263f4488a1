#include <psgraph/paper.hpp>
#include <string>

#include "core/fail.hpp"
#include "io/ps_procedures.hpp"
#include "io/ps_writer.hpp"

namespace psgraph
{

namespace
{

void write_axis_marks(ps::Writer& w, const AxisLayout& axis, std::string_view op)
{
    w.number(axis.mark_min)
        .number(axis.mark_multiplier)
        .number(axis.mark_max)
        .number(axis.mark_gap())
        .op(op);
}

void write_axis_labels(ps::Writer& w, const AxisLayout& axis, std::string_view op)
{
    w.integers(axis.factors())
        .labels(axis.labels())
        .integer(axis.label_depth())
        .integer(axis.flags())
        .name(axis.font)
        .number(axis.font_size)
        .color(axis.font_color)
        .string(axis.title)
        .op(op);
}

}   // anonymous namespace

Layout GraphPaper::make_layout(DocumentSink* sink, const PaperOptions& options)
{
    if (sink == nullptr)
        fail<ResourceError>("document", "graph_paper: no document sink to draw on");
    return Layout(options, sink->page_bounding_box());
}

GraphPaper::GraphPaper(DocumentSink* sink, const PaperOptions& options)
    : sink_(sink), layout_(make_layout(sink, options))
{
    write_procedures();
    write_scales();
}

void GraphPaper::write_procedures()
{
    sink_->add_function(std::string(ps::kGraphPaperName),
                        std::string(ps::graph_paper_procedures()));
}

void GraphPaper::write_scales()
{
    const PageLayout& p = layout_.page();
    const AxisLayout& x = layout_.x_axis();
    const AxisLayout& y = layout_.y_axis();

    ps::Writer w;
    w.begin("gpaperdict");
    w.box(p.graph).color(p.background).op("graph_area");
    w.number(p.heavy_width)
        .color(p.heavy_color)
        .number(p.mid_width)
        .color(p.mid_color)
        .number(p.light_width)
        .color(p.light_color)
        .op("graph_colors");
    w.box(p.heading_strip).op("heading_area");
    w.name(p.heading_font)
        .number(p.heading_font_size)
        .color(p.heading_font_color)
        .string(p.heading)
        .op("heading_labels");
    w.box(p.x_strip).op("xaxis_area");
    w.box(p.y_strip).op("yaxis_area");
    write_axis_marks(w, x, "xaxis_marks");
    write_axis_marks(w, y, "yaxis_marks");
    write_axis_labels(w, x, "xaxis_labels");
    write_axis_labels(w, y, "yaxis_labels");
    w.op("drawgpaper");
    w.number(x.transform.multiplier())
        .number(x.transform.constant())
        .number(y.transform.multiplier())
        .number(y.transform.constant())
        .op("conv_consts");
    w.end();

    sink_->add_to_page(w.str());
}

}   // namespace psgraph
