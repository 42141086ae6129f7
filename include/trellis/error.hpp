#pragma once

#include <stdexcept>
#include <string>

namespace trellis
{

// Raised for invalid user-facing facet configuration: no facet variables,
// unknown scales/space/labeller names, malformed formulas, facet variables
// that no data layer provides.
class ConfigurationError : public std::runtime_error
{
   public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

}   // namespace trellis
