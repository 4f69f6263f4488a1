#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace psgraph
{

// A tick label: numeric on a scaled axis, text on a categorical one.
using AxisLabel = std::variant<double, std::string>;

// Input to the "nice numbers" scale search for one axis.
struct ScaleRequest
{
    std::string axis            = "axis";   // used to name the axis in error messages
    double      low             = 0.0;
    double      high            = 100.0;
    double      extent          = 0.0;   // physical length of the axis
    int         labels_required = 1;     // values below 1 are treated as 1
    double      smallest        = 0.72;  // minimum physical gap between marks
};

// Resolved axis scale.
//
// factors[d] is how many marks depth d splits each depth d-1 mark into
// (factors[0] counts the major divisions), spreads[d] is the logical size of
// one depth d division. The innermost marks are mark_gap apart, so
// product(factors) * mark_gap spans the whole physical extent.
struct ResolvedScale
{
    double                 low             = 0.0;
    double                 high            = 0.0;
    std::vector<int>       factors;
    std::vector<double>    spreads;
    double                 mark_gap        = 0.0;
    int                    label_depth     = 0;
    int                    labels_required = 1;
    std::vector<AxisLabel> labels;
    bool                   categorical     = false;

    // Number of innermost divisions across the axis.
    long total_marks() const;
};

// Picks a rounded range and nested subdivisions for [low, high] spread over
// `extent` physical units. Throws ConfigurationError on an empty range, a
// non-positive extent or a non-positive mark gap.
ResolvedScale compute_numeric_scale(const ScaleRequest& request);

// One slot per label, plus an empty fencepost label closing the last slot.
// Throws ConfigurationError when `labels` is empty or `extent` is not positive.
ResolvedScale compute_categorical_scale(std::string_view                axis,
                                        const std::vector<std::string>& labels,
                                        double                          extent);

std::string label_text(const AxisLabel& label);

}   // namespace psgraph
