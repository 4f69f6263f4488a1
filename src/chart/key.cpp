#include <algorithm>
#include <cmath>
#include <psgraph/document.hpp>
#include <psgraph/key.hpp>
#include <psgraph/number_format.hpp>
#include <psgraph/paper.hpp>
#include <string>

#include "core/fail.hpp"
#include "io/ps_procedures.hpp"
#include "io/ps_writer.hpp"

namespace psgraph
{

GraphKey::GraphKey(const KeyOptions& options) : opt_(options)
{
    if (!opt_.max_height)
        fail("key", "key: max_height must be given");
    if (!opt_.num_items)
        fail("key", "key: num_items must be given");
    if (!(*opt_.max_height > 0.0))
        fail("key", "key: max_height (" + format_number(*opt_.max_height) + ") must be positive");
    if (*opt_.num_items <= 0)
        fail("key", "key: num_items (" + std::to_string(*opt_.num_items) + ") must be positive");
    if (!(opt_.text_size > 0.0))
        fail("key", "key: text_size (" + format_number(opt_.text_size) + ") must be positive");

    items_  = *opt_.num_items;
    vspc_   = opt_.vertical_spacing.value_or(opt_.spacing);
    hspc_   = opt_.horizontal_spacing.value_or(2.0 * opt_.spacing);
    icon_w_ = opt_.icon_width.value_or(opt_.text_size);
    icon_h_ = std::max(opt_.icon_height.value_or(opt_.text_size), opt_.text_size);
    text_w_ = opt_.text_width.value_or(4.0 * opt_.text_size);

    dx_      = hspc_ + icon_w_ + hspc_ + text_w_ + hspc_;
    dy_      = vspc_ + icon_h_;
    tmargin_ = 2.0 * opt_.text_size + vspc_;

    double margins   = tmargin_ + 2.0 * vspc_;
    double available = *opt_.max_height - margins;
    if (items_ * dy_ <= available)
    {
        rows_    = items_;
        columns_ = 1;
    }
    else
    {
        rows_ = static_cast<int>(std::floor(available / dy_));
        if (rows_ <= 0)
            fail("key", "key: max_height (" + format_number(*opt_.max_height)
                            + ") is too small for a single row of items");
        columns_ = (items_ + rows_ - 1) / rows_;
    }

    height_ = margins + rows_ * dy_;
    width_  = hspc_ + columns_ * dx_;
    PSGRAPH_LOG_DEBUG("key", "{} items in {} rows x {} columns, {} x {}", items_, rows_, columns_,
                      width_, height_);
}

Point GraphKey::item_offset(int n) const
{
    int col = n / rows_;
    int row = n - col * rows_;
    return {col * dx_, height_ - tmargin_ - (row + 1) * dy_};
}

void GraphKey::build(GraphPaper& paper)
{
    Box    area   = paper.key_area();
    double offset = (area.top - area.bottom - height_) / 2.0;
    box_          = {area.left, area.bottom + offset, area.right, area.bottom + offset + height_};

    sink_ = &paper.file();
    sink_->add_function(std::string(ps::kGraphKeyName), std::string(ps::graph_key_procedures()));

    ps::Writer w;
    w.begin("graphkeydict");
    w.def("kx0", box_.left);
    w.def("ky0", box_.bottom);
    w.def("kx1", box_.right);
    w.def("ky1", box_.top);
    w.def("kvspc", vspc_);
    w.def("khspc", hspc_);
    w.def("kdxicon", icon_w_);
    w.def("kdyicon", icon_h_);
    w.def("kdxtext", text_w_);
    w.def("kdytext", opt_.text_size);
    w.name("kfont").name(opt_.text_font).op("def");
    w.def("ksize", opt_.text_size);
    w.name("kcol").color(opt_.text_color).op("def");
    w.string(opt_.title)
        .name(opt_.title_font)
        .number(opt_.title_size)
        .color(opt_.title_color)
        .number(opt_.outline_width)
        .color(opt_.outline_color)
        .color(opt_.background)
        .op("keybox");
    w.end();
    sink_->add_to_page(w.str());
}

void GraphKey::add_item(std::string_view label, std::string_view icon_code)
{
    if (sink_ == nullptr)
        fail<ResourceError>("key", "key: build() must be called before adding items");
    if (current_ >= items_)
        fail("key", "key: more than num_items (" + std::to_string(items_) + ") items added");

    Point offset = item_offset(current_++);

    ps::Writer w;
    w.begin("graphkeydict");
    w.def("kdx", offset.x);
    w.def("kdy", offset.y);
    w.op("newpath");
    w.op("movetoicon");
    w.raw(icon_code);
    w.op("stroke");
    w.op("movetotext");
    w.string(label).op("show");
    w.end();
    sink_->add_to_page(w.str());
}

}   // namespace psgraph
