#pragma once

#include <stdexcept>
#include <string>

namespace psgraph
{

// Base of every exception thrown by psgraph.
class Error : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

// Invalid or contradictory numeric options: zero ranges, non-positive
// extents, degenerate transforms, a plot area squeezed to nothing.
class ConfigurationError : public Error
{
   public:
    using Error::Error;
};

// A required collaborator (document sink, graph paper) is missing.
class ResourceError : public Error
{
   public:
    using Error::Error;
};

// Malformed delimited input handed to the chart builders.
class DataShapeError : public Error
{
   public:
    using Error::Error;
};

}   // namespace psgraph
