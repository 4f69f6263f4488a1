#include <cmath>
#include <psgraph/number_format.hpp>
#include <psgraph/transform.hpp>
#include <string>

#include "core/fail.hpp"

namespace psgraph
{

AxisTransform::AxisTransform(std::string_view axis,
                             double           logical_low,
                             double           logical_high,
                             double           physical_low,
                             double           physical_high)
{
    std::string prefix = std::string(axis) + ": ";
    if (logical_high == logical_low)
        fail("layout",
             prefix + "logical bounds are equal (" + format_number(logical_low) + "), transform is degenerate");
    if (physical_high == physical_low)
        fail("layout",
             prefix + "physical bounds are equal (" + format_number(physical_low) + "), transform is degenerate");

    l2p_m_ = (physical_high - physical_low) / (logical_high - logical_low);
    l2p_c_ = physical_low - l2p_m_ * logical_low;
    p2l_m_ = 1.0 / l2p_m_;
    p2l_c_ = -l2p_c_ / l2p_m_;

    if (!std::isfinite(l2p_m_) || !std::isfinite(p2l_m_))
        fail("layout", prefix + "transform coefficients are not finite");
}

}   // namespace psgraph
