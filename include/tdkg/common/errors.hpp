#pragma once

#include <stdexcept>
#include <string>

namespace tdkg {

// Secure randomness was unavailable. Never retried: a key derived from
// degraded entropy must not be used.
class GenerationError : public std::runtime_error {
 public:
  explicit GenerationError(const std::string& what) : std::runtime_error(what) {}
};

// Invalid field or group element: non-canonical encoding, point not on the
// curve, inversion of zero, or a result at the point at infinity.
class ArithmeticError : public std::invalid_argument {
 public:
  explicit ArithmeticError(const std::string& what) : std::invalid_argument(what) {}
};

// Lagrange reconstruction cannot produce a correct value for the given input.
class ReconstructionError : public std::invalid_argument {
 public:
  explicit ReconstructionError(const std::string& what) : std::invalid_argument(what) {}
};

}  // namespace tdkg
