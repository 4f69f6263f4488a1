#pragma once

#include <optional>
#include <psgraph/color.hpp>
#include <psgraph/geometry.hpp>
#include <psgraph/scale.hpp>
#include <psgraph/transform.hpp>
#include <string>
#include <vector>

namespace psgraph
{

// ─── Options ────────────────────────────────────────────────────────────────
//
// Every field left empty receives its documented default when the layout is
// built. Fields that are set are validated and never silently replaced.

// Chart-wide sizing, colours and fonts.
struct PageOptions
{
    std::optional<double> left_edge;     // page bounding box left + 1
    std::optional<double> bottom_edge;   // page bounding box bottom + 1
    std::optional<double> right_edge;    // page bounding box right - 1
    std::optional<double> top_edge;      // page bounding box top - 1
    std::optional<double> top_margin;    // 5
    std::optional<double> right_margin;  // 15
    std::optional<double> spacing;       // 0
    std::optional<double> dots_per_inch; // 300

    std::optional<Color>  color;         // grey 0.5
    std::optional<Color>  background;    // grey 1
    std::optional<Color>  heavy_color;   // color
    std::optional<Color>  mid_color;     // color
    std::optional<Color>  light_color;   // color
    std::optional<double> heavy_width;   // 0.75
    std::optional<double> mid_width;     // 0.5
    std::optional<double> light_width;   // 0.25

    std::optional<std::string> font;                 // "Helvetica"
    std::optional<double>      font_size;            // 10
    std::optional<Color>       font_color;           // grey 0
    std::optional<std::string> heading_font;         // "Helvetica-Bold"
    std::optional<double>      heading_font_size;    // 12
    std::optional<Color>       heading_font_color;   // font_color
    std::optional<std::string> heading;              // ""
    std::optional<double>      heading_height;       // heading_font_size
    std::optional<double>      key_width;            // 0
};

// One axis. Giving `labels` makes the axis categorical and `low`/`high` are ignored.
struct AxisOptions
{
    std::optional<double>      low;        // 0
    std::optional<double>      high;       // 100
    std::optional<double>      label_gap;  // 30
    std::optional<double>      smallest;   // 3 dots at the page resolution
    std::optional<std::string> title;      // ""
    std::optional<double>      mark_min;   // 0.5
    std::optional<double>      mark_max;   // 8

    std::optional<std::string> font;        // page font
    std::optional<double>      font_size;   // page font size
    std::optional<Color>       font_color;  // page font colour

    std::optional<std::vector<std::string>> labels;
    std::optional<int>                      labels_required;   // extent / label_gap
    std::optional<bool>                     rotate;   // x axis with labels
    std::optional<bool>                     center;   // any axis with labels
    std::optional<double>                   width;
    std::optional<double>                   height;
};

struct PaperOptions
{
    PageOptions page;
    AxisOptions x_axis;
    AxisOptions y_axis;
};

// ─── Resolved values ────────────────────────────────────────────────────────

struct PageLayout
{
    double left          = 0.0;
    double bottom        = 0.0;
    double right         = 0.0;
    double top           = 0.0;
    double top_margin    = 0.0;
    double right_margin  = 0.0;
    double spacing       = 0.0;
    double dots_per_inch = 0.0;

    Color  color;
    Color  background;
    Color  heavy_color;
    Color  mid_color;
    Color  light_color;
    double heavy_width = 0.0;
    double mid_width   = 0.0;
    double light_width = 0.0;

    std::string font;
    double      font_size = 0.0;
    Color       font_color;
    std::string heading_font;
    double      heading_font_size = 0.0;
    Color       heading_font_color;
    std::string heading;
    double      heading_height = 0.0;   // includes the y title line
    double      key_width      = 0.0;

    Box heading_strip;
    Box x_strip;
    Box y_strip;
    Box graph;
};

struct AxisLayout
{
    std::string name;   // "x_axis" or "y_axis"
    std::string title;
    std::string font;
    double      font_size  = 0.0;
    Color       font_color;
    double      mark_min   = 0.0;
    double      mark_max   = 0.0;
    double      mark_multiplier = 0.0;   // extra mark length per depth shallower than the innermost
    double      label_gap  = 0.0;
    double      smallest   = 0.0;
    double      width      = 0.0;
    double      height     = 0.0;
    bool        rotate     = false;
    bool        center     = false;

    ResolvedScale scale;
    AxisTransform transform;

    // Bit 0 rotate, bit 1 center.
    int flags() const { return (rotate ? 1 : 0) | (center ? 2 : 0); }

    bool                          categorical() const { return scale.categorical; }
    double                        low() const { return scale.low; }
    double                        high() const { return scale.high; }
    double                        mark_gap() const { return scale.mark_gap; }
    int                           label_depth() const { return scale.label_depth; }
    int                           labels_required() const { return scale.labels_required; }
    const std::vector<int>&       factors() const { return scale.factors; }
    const std::vector<double>&    spreads() const { return scale.spreads; }
    const std::vector<AxisLabel>& labels() const { return scale.labels; }
};

// ─── Layout ─────────────────────────────────────────────────────────────────

// Divides a page bounding box into heading, axis strips, key area and graph,
// then resolves both axis scales against the graph size. Everything is
// computed in the constructor; the object is read-only afterwards.
class Layout
{
   public:
    // Throws ConfigurationError for invalid options or an empty graph area.
    Layout(const PaperOptions& options, const Box& page_bbox);

    const PageLayout& page() const { return page_; }
    const AxisLayout& x_axis() const { return x_; }
    const AxisLayout& y_axis() const { return y_; }

    const CoordinateTransform& transform() const { return transform_; }

    Box graph_area() const { return page_.graph; }
    Box heading_area() const { return page_.heading_strip; }
    Box x_axis_area() const { return page_.x_strip; }
    Box y_axis_area() const { return page_.y_strip; }
    Box key_area() const;

    // Slot `index` of a vertical bar chart, from the graph bottom up to logical `top`.
    Box vertical_bar_area(int index) const;
    Box vertical_bar_area(int index, double top) const;
    // Slot `index` of a horizontal bar chart, from the graph left out to logical `right`.
    Box horizontal_bar_area(int index) const;
    Box horizontal_bar_area(int index, double right) const;

    Point physical_point(double x, double y) const;
    Point logical_point(double px, double py) const;

    double px(double x) const { return transform_.x.to_physical(x); }
    double py(double y) const { return transform_.y.to_physical(y); }
    double lx(double px) const { return transform_.x.to_logical(px); }
    double ly(double py) const { return transform_.y.to_logical(py); }

   private:
    PageLayout          page_;
    AxisLayout          x_;
    AxisLayout          y_;
    CoordinateTransform transform_;
};

}   // namespace psgraph
