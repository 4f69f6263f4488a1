#include <psgraph/chart.hpp>

#include "core/fail.hpp"
#include "io/ps_procedures.hpp"

namespace psgraph
{

Chart::Chart(const ChartOptions& options)
    : opt_(options), own_file_(std::make_unique<PostScriptFile>(options.document))
{
    file_ = own_file_.get();
}

Chart::Chart(PostScriptFile& file, const ChartOptions& options) : opt_(options), file_(&file) {}

const GraphPaper& Chart::paper() const
{
    if (!paper_)
        fail<ResourceError>("chart", "chart: build() has not been called");
    return *paper_;
}

void Chart::make_key(const DataTable& data, PaperOptions& paper)
{
    KeyOptions ko = opt_.key;
    if (!ko.num_items)
        ko.num_items = static_cast<int>(data.columns() - 1);
    if (!ko.max_height)
    {
        Box    bbox    = file_->page_bounding_box();
        double spacing = paper.page.spacing.value_or(0.0);
        double top     = paper.page.top_edge.value_or(bbox.top - 1.0) - spacing;
        double bottom  = paper.page.bottom_edge.value_or(bbox.bottom + 1.0) + spacing;
        ko.max_height  = top - bottom;
    }
    key_ = std::make_unique<GraphKey>(ko);
    if (!paper.page.key_width)
        paper.page.key_width = key_->width();
}

StyleOptions Chart::style_options()
{
    StyleOptions so       = opt_.style;
    StyleOptions defaults = default_style();
    if (!so.line && !so.bar && !so.point)
    {
        so.line  = defaults.line;
        so.bar   = defaults.bar;
        so.point = defaults.point;
    }
    if (so.auto_choices.empty())
        so.auto_choices = defaults.auto_choices;
    if (so.sequence == nullptr)
        so.sequence = &sequence_;
    return so;
}

void Chart::build(const DataTable& data)
{
    check_shape(data);

    StyleOptions so = style_options();
    check_style(so);

    PaperOptions po     = paper_options(data);
    size_t       series = data.columns() - 1;

    key_.reset();
    if (opt_.show_key && wants_key(series))
        make_key(data, po);

    // Validate the whole layout before anything reaches the document
    Layout check(po, file_->page_bounding_box());
    if (paper_)
        file_->new_page();
    paper_ = std::make_unique<GraphPaper>(file_, po);
    file_->add_function(std::string(ps::kGraphChartName), std::string(ps::graph_chart_procedures()));

    styles_.clear();
    styles_.reserve(series);
    for (size_t s = 0; s < series; ++s)
    {
        styles_.emplace_back(so);
        styles_.back().resolve_background(layout().page().background);
    }

    PSGRAPH_LOG_INFO("chart", "drawing {} series of {} rows", series, data.row_count());
    draw(data);

    if (key_)
    {
        key_->build(*paper_);
        for (size_t s = 0; s < series; ++s)
        {
            styles_[s].write(*file_);
            key_->add_item(data.headers[s + 1], key_icon(styles_[s]));
        }
    }
}

}   // namespace psgraph
