#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <psgraph/number_format.hpp>
#include <psgraph/scale.hpp>

#include "core/fail.hpp"

namespace psgraph
{

namespace
{

constexpr double kSnapTolerance = 1e-9;
constexpr double kNoiseTolerance = 1e-12;

// Candidate multipliers of the decade, each with the subdivision that follows it.
struct Candidate
{
    double scale;
    int    subdivision;
};

constexpr std::array<Candidate, 5> kCandidates = {{
    {0.2, 2},
    {0.5, 5},
    {1.0, 2},
    {2.0, 5},
    {5.0, 2},
}};

// Pulls values that are integral up to rounding noise onto the integer.
double snap(double v)
{
    double r = std::round(v);
    if (std::abs(v - r) <= kSnapTolerance * std::max(1.0, std::abs(v)))
        return r;
    return v;
}

std::string axis_field(std::string_view axis, std::string_view field)
{
    std::string s(axis);
    s += ": ";
    s += field;
    return s;
}

void validate(const ScaleRequest& req)
{
    if (!std::isfinite(req.low) || !std::isfinite(req.high))
        fail("scale", axis_field(req.axis, "low and high must be finite"));
    if (!(req.low < req.high))
        fail("scale",
             axis_field(req.axis, "low (" + format_number(req.low) + ") must be below high ("
                                      + format_number(req.high) + ")"));
    if (!(req.extent > 0.0) || !std::isfinite(req.extent))
        fail("scale",
             axis_field(req.axis,
                        "physical extent (" + format_number(req.extent) + ") must be positive"));
    if (!(req.smallest > 0.0) || !std::isfinite(req.smallest))
        fail("scale",
             axis_field(req.axis,
                        "smallest (" + format_number(req.smallest) + ") must be positive"));
}

struct MajorDivision
{
    double step        = 0.0;
    int    subdivision = 2;
    double low         = 0.0;
    double high        = 0.0;
    int    marks       = 0;
};

MajorDivision choose_major(const ScaleRequest& req, int wanted)
{
    double range     = req.high - req.low;
    double magnitude = std::pow(10.0, std::floor(std::log10(range)));
    double mantissa  = range / magnitude;

    MajorDivision best;
    double        best_score = std::numeric_limits<double>::infinity();
    for (const auto& c : kCandidates)
    {
        double marks = mantissa * c.scale;
        double score = std::abs(marks - wanted);
        if (score < best_score)
        {
            best_score       = score;
            best.step        = magnitude / c.scale;
            best.subdivision = c.subdivision;
        }
    }

    double step = best.step;
    double marks;
    if (req.low >= 0.0)
    {
        best.low = std::floor(snap(req.low / step)) * step;
        marks    = range / step;
        if (best.low < req.low)
            marks += 1.0;
        marks = std::ceil(snap(marks));
    }
    else
    {
        // One extra step below so the mark at or beyond the data minimum survives
        best.low = std::trunc(snap(req.low / step)) * step - step;
        marks    = std::ceil(snap(range / step)) + 1.0;
    }

    // Snapping may have moved a bound inside the data by more than rounding noise
    double noise = kNoiseTolerance * step;
    if (best.low > req.low)
    {
        if (best.low - req.low <= noise)
        {
            best.low = req.low;
        }
        else
        {
            best.low -= step;
            marks += 1.0;
        }
    }
    best.high = best.low + marks * step;
    if (best.high < req.high)
    {
        if (req.high - best.high > noise)
        {
            marks += 1.0;
            best.high = best.low + marks * step;
        }
        best.high = std::max(best.high, req.high);
    }

    if (marks > static_cast<double>(std::numeric_limits<int>::max() / 10))
        fail("scale", axis_field(req.axis, "range is too large for the requested label count"));
    best.marks = static_cast<int>(marks);
    return best;
}

int choose_label_depth(const std::vector<int>& factors, int wanted)
{
    long nlabels = 1;
    for (size_t depth = 0; depth < factors.size(); ++depth)
    {
        long last = nlabels;
        nlabels *= factors[depth];
        if (nlabels >= wanted)
        {
            // <= on purpose: ties go to the shallower depth, not the deeper one
            if (std::labs(last - wanted) <= std::labs(nlabels - wanted))
                return std::max(0, static_cast<int>(depth) - 1);
            return static_cast<int>(depth);
        }
    }
    return std::max(0, static_cast<int>(factors.size()) - 1);
}

}   // anonymous namespace

long ResolvedScale::total_marks() const
{
    long total = 1;
    for (int f : factors)
    {
        if (f > 0 && total > std::numeric_limits<long>::max() / f)
            fail("scale", "scale: mark count overflows");
        total *= f;
    }
    return total;
}

ResolvedScale compute_numeric_scale(const ScaleRequest& request)
{
    validate(request);

    ResolvedScale rs;
    rs.labels_required = std::max(1, request.labels_required);

    MajorDivision major = choose_major(request, rs.labels_required);
    rs.low              = major.low;
    rs.high             = major.high;

    // Subdivide while the marks stay further apart than `smallest`
    double total       = major.marks;
    double step        = major.step;
    int    subdivision = major.subdivision;
    rs.factors.push_back(major.marks);
    rs.spreads.push_back(step);

    // Bounded so the mark count always fits an int
    double physical_marks = std::min(std::floor(request.extent / request.smallest),
                                     static_cast<double>(std::numeric_limits<int>::max()));
    double remaining      = physical_marks / major.marks;
    while (remaining > subdivision)
    {
        remaining /= subdivision;
        total *= subdivision;
        step /= subdivision;
        rs.factors.push_back(subdivision);
        rs.spreads.push_back(step);
        subdivision = (subdivision == 2) ? 5 : 2;
    }
    for (int last : {5, 2})
    {
        if (remaining / last > 1.0)
        {
            total *= last;
            step /= last;
            rs.factors.push_back(last);
            rs.spreads.push_back(step);
            break;
        }
    }
    rs.mark_gap = request.extent / total;

    rs.label_depth = choose_label_depth(rs.factors, rs.labels_required);

    // Multi-radix counter over the labelled depths
    std::vector<int> count(static_cast<size_t>(rs.label_depth) + 1, 0);
    for (;;)
    {
        double value = rs.low;
        for (size_t i = 0; i < count.size(); ++i)
            value += count[i] * rs.spreads[i];
        rs.labels.emplace_back(value);

        int depth = rs.label_depth;
        for (; depth >= 0; --depth)
        {
            if (++count[static_cast<size_t>(depth)] < rs.factors[static_cast<size_t>(depth)])
                break;
            count[static_cast<size_t>(depth)] = 0;
        }
        if (depth < 0)
            break;
    }
    rs.labels.emplace_back(rs.high);

    PSGRAPH_LOG_DEBUG("scale", "{}: {} to {} step {} in {} marks, gap {}", request.axis, rs.low,
                      rs.high, major.step, static_cast<long>(total), rs.mark_gap);
    return rs;
}

ResolvedScale compute_categorical_scale(std::string_view                axis,
                                        const std::vector<std::string>& labels,
                                        double                          extent)
{
    if (labels.empty())
        fail("scale", axis_field(axis, "labels must not be empty"));
    if (!(extent > 0.0) || !std::isfinite(extent))
        fail("scale",
             axis_field(axis, "physical extent (" + format_number(extent) + ") must be positive"));

    int           n = static_cast<int>(labels.size());
    ResolvedScale rs;
    rs.categorical     = true;
    rs.low             = 0.0;
    rs.high            = n;
    rs.factors         = {n};
    rs.spreads         = {1.0};
    rs.mark_gap        = extent / n;
    rs.label_depth     = 0;
    rs.labels_required = n;
    rs.labels.reserve(labels.size() + 1);
    for (const auto& l : labels)
        rs.labels.emplace_back(l);
    rs.labels.emplace_back(std::string());
    return rs;
}

std::string label_text(const AxisLabel& label)
{
    if (const auto* s = std::get_if<std::string>(&label))
        return *s;
    return format_number(std::get<double>(label));
}

}   // namespace psgraph
