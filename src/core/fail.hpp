#pragma once

#include <psgraph/errors.hpp>
#include <psgraph/logger.hpp>
#include <string>
#include <string_view>

namespace psgraph
{

// Logs `message` under `category` and throws it as an E.
template <typename E = ConfigurationError>
[[noreturn]] void fail(std::string_view category, const std::string& message)
{
    PSGRAPH_LOG_ERROR(category, "{}", message);
    throw E(message);
}

}   // namespace psgraph
