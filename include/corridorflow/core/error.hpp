#pragma once

#include <stdexcept>
#include <string>

namespace corridorflow::core {

// Raised for malformed matrices and terminal sets before any computation.
// Surfaces as ValueError in the Python bindings.
struct InvalidInput : public std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

} // namespace corridorflow::core
