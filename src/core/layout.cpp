#include <algorithm>
#include <cmath>
#include <limits>
#include <psgraph/layout.hpp>
#include <psgraph/number_format.hpp>

#include "core/fail.hpp"

namespace psgraph
{

namespace
{

constexpr double kDefaultYAxisWidth = 30.0;

// Width of one label character as a fraction of the font size.
constexpr double kCharWidth = 0.8;

void require_positive(std::string_view group, std::string_view field, double value)
{
    if (!(value > 0.0) || !std::isfinite(value))
        fail("layout", std::string(group) + ": " + std::string(field) + " ("
                           + format_number(value) + ") must be positive");
}

void require_non_negative(std::string_view group, std::string_view field, double value)
{
    if (!(value >= 0.0) || !std::isfinite(value))
        fail("layout", std::string(group) + ": " + std::string(field) + " ("
                           + format_number(value) + ") must not be negative");
}

void require_below(std::string_view group,
                   std::string_view low_field,
                   double           low,
                   std::string_view high_field,
                   double           high)
{
    if (!(low < high))
        fail("layout", std::string(group) + ": " + std::string(low_field) + " ("
                           + format_number(low) + ") must be below " + std::string(high_field)
                           + " (" + format_number(high) + ")");
}

size_t longest_label(const std::optional<std::vector<std::string>>& labels)
{
    size_t len = 0;
    if (labels)
    {
        for (const auto& l : *labels)
            len = std::max(len, l.size());
    }
    return len;
}

// Fonts, marks, flags and strip size of one axis. Needs the page fonts and,
// for x, the y strip and key width.
void resolve_axis_sizes(AxisLayout& axis, const AxisOptions& opt, const PageLayout& page, bool is_x)
{
    axis.mark_min   = opt.mark_min.value_or(0.5);
    axis.mark_max   = opt.mark_max.value_or(8.0);
    axis.font       = opt.font.value_or(page.font);
    axis.font_size  = opt.font_size.value_or(page.font_size);
    axis.font_color = opt.font_color.value_or(page.font_color);

    require_non_negative(axis.name, "mark_min", axis.mark_min);
    require_non_negative(axis.name, "mark_max", axis.mark_max);
    if (axis.mark_max < axis.mark_min)
        fail("layout", axis.name + ": mark_max (" + format_number(axis.mark_max)
                           + ") must not be below mark_min (" + format_number(axis.mark_min) + ")");
    require_positive(axis.name, "font_size", axis.font_size);

    bool has_labels = opt.labels.has_value();
    axis.rotate     = opt.rotate.value_or(has_labels && is_x);
    axis.center     = opt.center.value_or(has_labels);

    double maxlen = static_cast<double>(longest_label(opt.labels));
    double width;
    double height;
    if (is_x)
    {
        width = page.right - 1.0 - page.key_width - page.right_margin - page.y_strip.right;
        if (has_labels && axis.rotate)
            height = axis.mark_max + (1.0 + maxlen * kCharWidth) * axis.font_size;
        else
            height = axis.mark_max + 2.5 * axis.font_size;
    }
    else
    {
        if (has_labels && !axis.rotate)
            width = axis.mark_max + maxlen * kCharWidth * axis.font_size;
        else
            width = kDefaultYAxisWidth;
        height = page.top - page.bottom - 2.0 * page.spacing;
    }
    axis.width  = opt.width.value_or(width);
    axis.height = opt.height.value_or(height);
}

void resolve_scale(AxisLayout&        axis,
                   const AxisOptions& opt,
                   const PageLayout&  page,
                   double             physical_low,
                   double             physical_high)
{
    axis.title     = opt.title.value_or("");
    axis.label_gap = opt.label_gap.value_or(30.0);
    axis.smallest  = opt.smallest.value_or(3.0 * 72.0 / page.dots_per_inch);
    require_positive(axis.name, "label_gap", axis.label_gap);
    require_positive(axis.name, "smallest", axis.smallest);

    double extent = physical_high - physical_low;
    if (opt.labels)
    {
        axis.scale           = compute_categorical_scale(axis.name, *opt.labels, extent);
        axis.mark_multiplier = 0.0;
    }
    else
    {
        ScaleRequest req;
        req.axis            = axis.name;
        req.low             = opt.low.value_or(0.0);
        req.high            = opt.high.value_or(100.0);
        req.extent          = extent;
        req.smallest        = axis.smallest;
        double many         = std::min(std::floor(extent / axis.label_gap),
                                       static_cast<double>(std::numeric_limits<int>::max()));
        req.labels_required = opt.labels_required.value_or(static_cast<int>(many));
        axis.scale           = compute_numeric_scale(req);
        axis.mark_multiplier = (axis.mark_max - axis.mark_min) / axis.scale.factors.size();
    }

    double used    = axis.scale.total_marks() * axis.scale.mark_gap;
    axis.transform = AxisTransform(axis.name, axis.scale.low, axis.scale.high, physical_low,
                                   physical_low + used);

    PSGRAPH_LOG_DEBUG("layout", "{}: {} to {}, {} labels at depth {}, mark gap {}", axis.name,
                      axis.scale.low, axis.scale.high, axis.scale.labels.size(),
                      axis.scale.label_depth, axis.scale.mark_gap);
}

}   // anonymous namespace

Layout::Layout(const PaperOptions& options, const Box& page_bbox)
{
    const PageOptions& r = options.page;
    PageLayout&        p = page_;
    x_.name              = "x_axis";
    y_.name              = "y_axis";

    p.left          = r.left_edge.value_or(page_bbox.left + 1.0);
    p.bottom        = r.bottom_edge.value_or(page_bbox.bottom + 1.0);
    p.right         = r.right_edge.value_or(page_bbox.right - 1.0);
    p.top           = r.top_edge.value_or(page_bbox.top - 1.0);
    p.top_margin    = r.top_margin.value_or(5.0);
    p.right_margin  = r.right_margin.value_or(15.0);
    p.spacing       = r.spacing.value_or(0.0);
    p.dots_per_inch = r.dots_per_inch.value_or(300.0);

    require_below("paper", "left_edge", p.left, "right_edge", p.right);
    require_below("paper", "bottom_edge", p.bottom, "top_edge", p.top);
    require_non_negative("paper", "top_margin", p.top_margin);
    require_non_negative("paper", "right_margin", p.right_margin);
    require_non_negative("paper", "spacing", p.spacing);
    require_positive("paper", "dots_per_inch", p.dots_per_inch);

    p.color       = r.color.value_or(colors::mid_gray);
    p.background  = r.background.value_or(colors::white);
    p.heavy_color = r.heavy_color.value_or(p.color);
    p.mid_color   = r.mid_color.value_or(p.color);
    p.light_color = r.light_color.value_or(p.color);
    p.heavy_width = r.heavy_width.value_or(0.75);
    p.mid_width   = r.mid_width.value_or(0.5);
    p.light_width = r.light_width.value_or(0.25);
    require_non_negative("paper", "heavy_width", p.heavy_width);
    require_non_negative("paper", "mid_width", p.mid_width);
    require_non_negative("paper", "light_width", p.light_width);

    p.font               = r.font.value_or("Helvetica");
    p.font_size          = r.font_size.value_or(10.0);
    p.font_color         = r.font_color.value_or(colors::black);
    p.heading_font       = r.heading_font.value_or("Helvetica-Bold");
    p.heading_font_size  = r.heading_font_size.value_or(12.0);
    p.heading_font_color = r.heading_font_color.value_or(p.font_color);
    p.heading            = r.heading.value_or("");
    require_positive("paper", "font_size", p.font_size);
    require_positive("paper", "heading_font_size", p.heading_font_size);

    // The y strip and key both run the full chart height
    resolve_axis_sizes(y_, options.y_axis, p, false);
    p.y_strip.left   = p.left + p.spacing;
    p.y_strip.right  = p.y_strip.left + y_.width;
    p.y_strip.bottom = p.bottom + p.spacing;
    p.y_strip.top    = p.top - p.spacing;

    p.key_width = r.key_width.value_or(0.0);
    require_non_negative("paper", "key_width", p.key_width);

    // The heading and x strip fit between the y strip and the key
    resolve_axis_sizes(x_, options.x_axis, p, true);

    p.heading_height = r.heading_height.value_or(p.heading_font_size);
    require_non_negative("paper", "heading_height", p.heading_height);
    p.heading_height += 1.5 * y_.font_size;   // room for the y axis title

    p.heading_strip.left   = p.y_strip.right;
    p.heading_strip.right  = p.y_strip.right + x_.width;
    p.heading_strip.top    = p.top - p.spacing;
    p.heading_strip.bottom = p.heading_strip.top - p.heading_height - p.spacing;

    p.x_strip.left   = p.y_strip.right;
    p.x_strip.right  = p.heading_strip.right;
    p.x_strip.bottom = p.bottom + p.spacing;
    p.x_strip.top    = p.x_strip.bottom + x_.height;

    p.graph.left   = p.x_strip.left;
    p.graph.bottom = p.x_strip.top;
    p.graph.right  = p.x_strip.right;
    p.graph.top    = p.heading_strip.bottom - p.top_margin - p.spacing;

    if (!(p.graph.width() > 0.0))
        fail("layout", "paper: graph width (" + format_number(p.graph.width())
                           + ") must be positive; reduce the y axis width, key width or right margin");
    if (!(p.graph.height() > 0.0))
        fail("layout", "paper: graph height (" + format_number(p.graph.height())
                           + ") must be positive; reduce the heading or x axis height");

    resolve_scale(x_, options.x_axis, p, p.graph.left, p.graph.right);
    resolve_scale(y_, options.y_axis, p, p.graph.bottom, p.graph.top);
    transform_.x = x_.transform;
    transform_.y = y_.transform;

    PSGRAPH_LOG_DEBUG("layout", "graph area {} {} {} {}", p.graph.left, p.graph.bottom,
                      p.graph.right, p.graph.top);
}

Box Layout::key_area() const
{
    return {page_.graph.right + page_.right_margin, page_.bottom + page_.spacing,
            page_.right - page_.spacing - 1.0, page_.top - page_.spacing};
}

Box Layout::vertical_bar_area(int index) const
{
    return vertical_bar_area(index, y_.high());
}

Box Layout::vertical_bar_area(int index, double top) const
{
    double left = page_.graph.left + index * x_.mark_gap();
    return {left, page_.graph.bottom, left + x_.mark_gap(), py(top)};
}

Box Layout::horizontal_bar_area(int index) const
{
    return horizontal_bar_area(index, x_.high());
}

Box Layout::horizontal_bar_area(int index, double right) const
{
    double bottom = page_.graph.bottom + index * y_.mark_gap();
    return {page_.graph.left, bottom, px(right), bottom + y_.mark_gap()};
}

Point Layout::physical_point(double x, double y) const
{
    return transform_.to_physical({x, y});
}

Point Layout::logical_point(double px, double py) const
{
    return transform_.to_logical({px, py});
}

}   // namespace psgraph
