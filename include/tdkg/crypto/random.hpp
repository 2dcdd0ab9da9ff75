#pragma once

#include <cstddef>

#include "tdkg/common/bytes.hpp"
#include "tdkg/crypto/scalar.hpp"

namespace tdkg {

// All draws go straight to the OpenSSL CSPRNG. A failed draw throws
// GenerationError and is never retried.
class Csprng {
 public:
  static Bytes RandomBytes(size_t size);
  static Scalar RandomScalar();
  static Scalar RandomNonZeroScalar();
};

}  // namespace tdkg
