#pragma once

#include <psgraph/geometry.hpp>
#include <string>
#include <utility>
#include <vector>

namespace psgraph
{

// Receives drawing code. Named procedure sets are stored once; page code is
// appended to the current page in order.
class DocumentSink
{
   public:
    virtual ~DocumentSink() = default;

    // Adding a name that is already present does nothing.
    virtual void add_function(const std::string& name, const std::string& code) = 0;
    virtual bool has_function(const std::string& name) const                  = 0;
    virtual void add_to_page(const std::string& code)                          = 0;

    // Printable area of the current page, (left, bottom, right, top).
    virtual Box page_bounding_box() const = 0;
};

enum class PaperSize
{
    A4,
    Letter,
    Legal,
    A3,
    A5,
    Custom
};

struct DocumentConfig
{
    PaperSize   paper         = PaperSize::A4;
    double      custom_width  = 0.0;   // used with PaperSize::Custom
    double      custom_height = 0.0;
    bool        landscape     = false;
    double      left          = 0.0;
    double      right         = 0.0;
    double      top           = 0.0;
    double      bottom        = 0.0;
    std::string title;
};

// Margins of 36 (half an inch) on every side, used for charts that create
// their own document.
DocumentConfig chart_document_config();

// Portrait width and height of a paper size. Throws ConfigurationError for
// PaperSize::Custom, whose size lives in DocumentConfig.
std::pair<double, double> paper_dimensions(PaperSize paper);

// In-memory DSC 3.0 PostScript document.
class PostScriptFile : public DocumentSink
{
   public:
    // Throws ConfigurationError when the margins leave no printable area.
    explicit PostScriptFile(const DocumentConfig& config = {});

    void add_function(const std::string& name, const std::string& code) override;
    bool has_function(const std::string& name) const override;
    void add_to_page(const std::string& code) override;
    Box  page_bounding_box() const override;

    // Starts a new page; an empty label numbers the page.
    void new_page(const std::string& label = "");

    size_t             page_count() const { return pages_.size(); }
    const std::string& page_code(size_t index) const { return pages_.at(index).code; }

    // Width and height of the page as drawn, after any landscape swap.
    double page_width() const { return width_; }
    double page_height() const { return height_; }

    const DocumentConfig& config() const { return config_; }

    std::string to_string() const;

    // Returns false and logs when the file cannot be written.
    bool write(const std::string& path) const;

   private:
    struct Function
    {
        std::string name;
        std::string code;
    };

    struct Page
    {
        std::string label;
        std::string code;
    };

    DocumentConfig        config_;
    double                width_  = 0.0;
    double                height_ = 0.0;
    std::vector<Function> functions_;
    std::vector<Page>     pages_;
};

}   // namespace psgraph
