#pragma once

#include <string_view>

namespace psgraph::ps
{

// Names under which each procedure set is stored in the document prolog.
inline constexpr std::string_view kGraphPaperName = "GraphPaper";
inline constexpr std::string_view kGraphKeyName   = "GraphKey";
inline constexpr std::string_view kGraphStyleName = "GraphStyle";
inline constexpr std::string_view kGraphChartName = "GraphChart";

// gpaperdict: colour and font helpers, justified text, nested mark drawing,
// boxes, and the px/py conversion constants.
std::string_view graph_paper_procedures();

// graphkeydict: key box and the icon/text position of each key item.
std::string_view graph_key_procedures();

// gstyledict: line, point and bar style setters and the point shapes.
std::string_view graph_style_procedures();

// gchartdict: bars, poly-lines and point markers drawn with the current style.
std::string_view graph_chart_procedures();

}   // namespace psgraph::ps
