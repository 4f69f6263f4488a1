#pragma once

#include <memory>
#include <psgraph/data_table.hpp>
#include <psgraph/document.hpp>
#include <psgraph/key.hpp>
#include <psgraph/layout.hpp>
#include <psgraph/paper.hpp>
#include <psgraph/style.hpp>
#include <string>
#include <vector>

namespace psgraph
{

struct ChartOptions
{
    PaperOptions   paper;
    StyleOptions   style;   // the chart supplies a sequence and parts left unset
    KeyOptions     key;     // num_items and max_height are filled in when absent
    bool           show_key = true;
    DocumentConfig document = chart_document_config();   // used when the chart owns its file
};

// Shared plumbing of the chart builders: the target document, the style
// sequence and the paper, key and styles of the last build.
class Chart
{
   public:
    virtual ~Chart()               = default;
    Chart(const Chart&)            = delete;
    Chart& operator=(const Chart&) = delete;

    // Draws `data`, on a fresh page when this chart has drawn before.
    // Throws DataShapeError for unusable data.
    void build(const DataTable& data);
    void build_csv(const std::string& path) { build(read_csv(path)); }

    PostScriptFile&       file() { return *file_; }
    const PostScriptFile& file() const { return *file_; }

    // Throws ResourceError before the first build.
    const GraphPaper& paper() const;
    const GraphKey*   key() const { return key_.get(); }

    const std::vector<Style>& styles() const { return styles_; }
    SequenceGenerator&        sequence() { return sequence_; }

    bool write(const std::string& path) const { return file_->write(path); }

   protected:
    explicit Chart(const ChartOptions& options);
    Chart(PostScriptFile& file, const ChartOptions& options);

    virtual void check_shape(const DataTable& data) const = 0;
    // Axis ranges and labels derived from the data, on top of the caller's options.
    virtual PaperOptions paper_options(const DataTable& data) const = 0;
    virtual StyleOptions default_style() const = 0;
    // Throws ConfigurationError when the style lacks the parts the chart draws.
    virtual void         check_style(const StyleOptions& style) const = 0;
    virtual bool         wants_key(size_t series) const = 0;
    virtual void         draw(const DataTable& data) = 0;
    virtual std::string  key_icon(const Style& style) const = 0;

    const ChartOptions& options() const { return opt_; }
    const Layout&       layout() const { return paper_->layout(); }
    std::vector<Style>& mutable_styles() { return styles_; }

   private:
    StyleOptions style_options();
    void         make_key(const DataTable& data, PaperOptions& paper);

    ChartOptions                    opt_;
    std::unique_ptr<PostScriptFile> own_file_;
    PostScriptFile*                 file_ = nullptr;
    SequenceGenerator               sequence_;
    std::unique_ptr<GraphPaper>     paper_;
    std::unique_ptr<GraphKey>       key_;
    std::vector<Style>              styles_;
};

// Vertical bar chart. Column 0 holds the category labels; every further
// column is a series, and each category slot is shared evenly between them.
class BarChart : public Chart
{
   public:
    explicit BarChart(const ChartOptions& options = {}) : Chart(options) {}
    BarChart(PostScriptFile& file, const ChartOptions& options = {}) : Chart(file, options) {}

   protected:
    void         check_shape(const DataTable& data) const override;
    PaperOptions paper_options(const DataTable& data) const override;
    StyleOptions default_style() const override;
    void         check_style(const StyleOptions& style) const override;
    bool         wants_key(size_t series) const override { return series > 1; }
    void         draw(const DataTable& data) override;
    std::string  key_icon(const Style& style) const override;
};

// Line and point chart. Column 0 holds x; every further column is a y series.
class XYChart : public Chart
{
   public:
    explicit XYChart(const ChartOptions& options = {}) : Chart(options) {}
    XYChart(PostScriptFile& file, const ChartOptions& options = {}) : Chart(file, options) {}

   protected:
    void         check_shape(const DataTable& data) const override;
    PaperOptions paper_options(const DataTable& data) const override;
    StyleOptions default_style() const override;
    void         check_style(const StyleOptions& style) const override;
    bool         wants_key(size_t) const override { return true; }
    void         draw(const DataTable& data) override;
    std::string  key_icon(const Style& style) const override;
};

}   // namespace psgraph
