#pragma once

#include <optional>
#include <psgraph/color.hpp>
#include <psgraph/geometry.hpp>
#include <string>
#include <string_view>

namespace psgraph
{

class GraphPaper;
class DocumentSink;

struct KeyOptions
{
    std::optional<double> max_height;   // required
    std::optional<int>    num_items;    // required

    std::string title       = "Key";
    std::string title_font  = "Helvetica-Bold";
    double      title_size  = 12.0;
    Color       title_color = colors::black;
    std::string text_font   = "Helvetica";
    double      text_size   = 10.0;
    Color       text_color  = colors::black;
    std::optional<double> text_width;   // 4 x text_size

    Color  background    = colors::white;
    Color  outline_color = colors::black;
    double outline_width = 0.75;

    double                spacing = 4.0;
    std::optional<double> vertical_spacing;     // spacing
    std::optional<double> horizontal_spacing;   // 2 x spacing
    std::optional<double> icon_width;           // text_size
    std::optional<double> icon_height;          // text_size, never less
};

// Legend box laid out in columns of icon + text items, filling each column
// top to bottom before starting the next.
class GraphKey
{
   public:
    // Throws ConfigurationError when max_height or num_items is missing, not
    // positive, or too small to hold one row.
    explicit GraphKey(const KeyOptions& options);

    double width() const { return width_; }
    double height() const { return height_; }
    int    rows() const { return rows_; }
    int    columns() const { return columns_; }
    int    items_added() const { return current_; }

    // Offset of item n from the key box's bottom left corner.
    Point item_offset(int n) const;

    // Centres the key vertically in the paper's key area and draws its box
    // and title.
    void build(GraphPaper& paper);
    bool built() const { return sink_ != nullptr; }

    // Box drawn by build().
    const Box& box() const { return box_; }

    // Draws the next item. `icon_code` runs with the current point at the
    // icon's bottom left corner and kix0/kiy0/kix1/kiy1 naming its corners.
    // Throws ResourceError before build(), ConfigurationError once num_items
    // items have been added.
    void add_item(std::string_view label, std::string_view icon_code = {});

   private:
    KeyOptions    opt_;
    double        vspc_     = 0.0;
    double        hspc_     = 0.0;
    double        icon_w_   = 0.0;
    double        icon_h_   = 0.0;
    double        text_w_   = 0.0;
    double        dx_       = 0.0;
    double        dy_       = 0.0;
    double        tmargin_  = 0.0;
    double        width_    = 0.0;
    double        height_   = 0.0;
    int           items_    = 0;
    int           rows_     = 0;
    int           columns_  = 0;
    int           current_  = 0;
    Box           box_;
    DocumentSink* sink_ = nullptr;
};

}   // namespace psgraph
