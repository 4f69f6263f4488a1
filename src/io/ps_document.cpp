#include <algorithm>
#include <cmath>
#include <fstream>
#include <psgraph/document.hpp>
#include <psgraph/logger.hpp>
#include <psgraph/number_format.hpp>
#include <sstream>
#include <tuple>

#include "core/fail.hpp"

namespace psgraph
{

DocumentConfig chart_document_config()
{
    DocumentConfig config;
    config.left   = 36.0;
    config.right  = 36.0;
    config.top    = 36.0;
    config.bottom = 36.0;
    return config;
}

std::pair<double, double> paper_dimensions(PaperSize paper)
{
    switch (paper)
    {
        case PaperSize::A4:
            return {595.0, 842.0};
        case PaperSize::Letter:
            return {612.0, 792.0};
        case PaperSize::Legal:
            return {612.0, 1008.0};
        case PaperSize::A3:
            return {842.0, 1191.0};
        case PaperSize::A5:
            return {420.0, 595.0};
        case PaperSize::Custom:
            break;
    }
    fail("document", "document: custom paper has no fixed dimensions");
}

PostScriptFile::PostScriptFile(const DocumentConfig& config) : config_(config)
{
    double w;
    double h;
    if (config_.paper == PaperSize::Custom)
    {
        w = config_.custom_width;
        h = config_.custom_height;
        if (!(w > 0.0) || !(h > 0.0))
            fail("document", "document: custom paper size (" + format_number(w) + " x "
                                 + format_number(h) + ") must be positive");
    }
    else
    {
        std::tie(w, h) = paper_dimensions(config_.paper);
    }
    if (config_.landscape)
        std::swap(w, h);
    width_  = w;
    height_ = h;

    for (double m : {config_.left, config_.right, config_.top, config_.bottom})
    {
        if (!(m >= 0.0))
            fail("document", "document: margins must not be negative");
    }
    Box bbox = page_bounding_box();
    if (!(bbox.width() > 0.0) || !(bbox.height() > 0.0))
        fail("document", "document: margins leave no printable area");

    pages_.push_back({"1", std::string()});
}

void PostScriptFile::add_function(const std::string& name, const std::string& code)
{
    if (has_function(name))
        return;
    functions_.push_back({name, code});
    PSGRAPH_LOG_DEBUG("document", "added procedure set {}", name);
}

bool PostScriptFile::has_function(const std::string& name) const
{
    return std::any_of(functions_.begin(), functions_.end(),
                       [&](const Function& f) { return f.name == name; });
}

void PostScriptFile::add_to_page(const std::string& code)
{
    auto& page = pages_.back();
    page.code += code;
    if (!code.empty() && code.back() != '\n')
        page.code += '\n';
}

Box PostScriptFile::page_bounding_box() const
{
    return {config_.left, config_.bottom, width_ - config_.right, height_ - config_.top};
}

void PostScriptFile::new_page(const std::string& label)
{
    std::string l = label.empty() ? std::to_string(pages_.size() + 1) : label;
    pages_.push_back({l, std::string()});
}

std::string PostScriptFile::to_string() const
{
    Box bbox = page_bounding_box();
    // DSC bounding boxes are in the unrotated device space
    Box device = bbox;
    if (config_.landscape)
        device = {height_ - bbox.top, bbox.left, height_ - bbox.bottom, bbox.right};

    auto whole = [](double v, bool up) {
        return static_cast<long>(up ? std::ceil(v) : std::floor(v));
    };

    std::ostringstream ps;
    ps << "%!PS-Adobe-3.0\n";
    ps << "%%Title: " << (config_.title.empty() ? "psgraph" : config_.title) << "\n";
    ps << "%%Creator: psgraph\n";
    ps << "%%BoundingBox: " << whole(device.left, false) << " " << whole(device.bottom, false)
       << " " << whole(device.right, true) << " " << whole(device.top, true) << "\n";
    ps << "%%Orientation: " << (config_.landscape ? "Landscape" : "Portrait") << "\n";
    ps << "%%Pages: " << pages_.size() << "\n";
    ps << "%%DocumentData: Clean7Bit\n";
    ps << "%%EndComments\n";

    ps << "%%BeginProlog\n";
    for (const auto& f : functions_)
    {
        ps << "%%BeginResource: procset " << f.name << "\n";
        ps << f.code;
        if (!f.code.empty() && f.code.back() != '\n')
            ps << "\n";
        ps << "%%EndResource\n";
    }
    ps << "%%EndProlog\n";

    for (size_t i = 0; i < pages_.size(); ++i)
    {
        const auto& page = pages_[i];
        ps << "%%Page: " << page.label << " " << (i + 1) << "\n";
        ps << "%%BeginPageSetup\n";
        ps << "gsave\n";
        if (config_.landscape)
            ps << "90 rotate 0 " << format_number(-height_) << " translate\n";
        ps << "%%EndPageSetup\n";
        ps << page.code;
        ps << "grestore\n";
        ps << "showpage\n";
    }

    ps << "%%Trailer\n";
    ps << "%%EOF\n";
    return ps.str();
}

bool PostScriptFile::write(const std::string& path) const
{
    std::string content = to_string();

    std::ofstream file(path);
    if (!file.is_open())
    {
        PSGRAPH_LOG_ERROR("document", "cannot open '{}' for writing", path);
        return false;
    }

    file << content;
    if (!file.good())
    {
        PSGRAPH_LOG_ERROR("document", "failed writing '{}'", path);
        return false;
    }
    PSGRAPH_LOG_INFO("document", "wrote {} page(s) to '{}'", pages_.size(), path);
    return true;
}

}   // namespace psgraph
