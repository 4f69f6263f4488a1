#pragma once

#include <psgraph/geometry.hpp>
#include <string_view>

namespace psgraph
{

// Affine logical <-> physical mapping along one axis.
class AxisTransform
{
   public:
    AxisTransform() = default;

    // Throws ConfigurationError when either pair of bounds is degenerate.
    AxisTransform(std::string_view axis,
                  double           logical_low,
                  double           logical_high,
                  double           physical_low,
                  double           physical_high);

    double to_physical(double logical) const { return logical * l2p_m_ + l2p_c_; }
    double to_logical(double physical) const { return physical * p2l_m_ + p2l_c_; }

    double multiplier() const { return l2p_m_; }
    double constant() const { return l2p_c_; }
    double inverse_multiplier() const { return p2l_m_; }
    double inverse_constant() const { return p2l_c_; }

   private:
    double l2p_m_ = 1.0;
    double l2p_c_ = 0.0;
    double p2l_m_ = 1.0;
    double p2l_c_ = 0.0;
};

// Independent x and y axis transforms.
struct CoordinateTransform
{
    AxisTransform x;
    AxisTransform y;

    Point to_physical(const Point& logical) const
    {
        return {x.to_physical(logical.x), y.to_physical(logical.y)};
    }

    Point to_logical(const Point& physical) const
    {
        return {x.to_logical(physical.x), y.to_logical(physical.y)};
    }
};

}   // namespace psgraph
