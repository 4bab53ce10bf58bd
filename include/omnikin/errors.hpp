#pragma once
#include <stdexcept>
#include <string>

namespace omnikin {

// Rejected robot or application setup (wheel count, non-positive constants,
// malformed command line). Thrown before any simulation starts.
class InvalidConfiguration : public std::invalid_argument {
public:
  explicit InvalidConfiguration(const std::string& what)
    : std::invalid_argument(what) {}
};

// Jacobian and velocity vector of mismatched size were combined.
// Wiring error; cannot happen with a Jacobian built from a GeometryModel.
class DimensionError : public std::logic_error {
public:
  explicit DimensionError(const std::string& what)
    : std::logic_error(what) {}
};

} // namespace omnikin
