#pragma once

#include <psgraph/document.hpp>
#include <psgraph/layout.hpp>

namespace psgraph
{

// Graph paper drawn into a document: computes the Layout for the sink's page
// and writes the grid, axes, labels and heading. The layout is complete
// before anything is written, so a failed construction leaves the sink untouched.
class GraphPaper
{
   public:
    // Throws ResourceError when `sink` is null, ConfigurationError for bad options.
    GraphPaper(DocumentSink* sink, const PaperOptions& options = {});

    const Layout& layout() const { return layout_; }
    DocumentSink& file() const { return *sink_; }

    Box key_area() const { return layout_.key_area(); }
    Box graph_area() const { return layout_.graph_area(); }

   private:
    static Layout make_layout(DocumentSink* sink, const PaperOptions& options);
    void          write_procedures();
    void          write_scales();

    DocumentSink* sink_;
    Layout        layout_;
};

}   // namespace psgraph
