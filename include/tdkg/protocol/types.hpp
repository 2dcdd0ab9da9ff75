#pragma once

#include <cstdint>

#include "tdkg/crypto/scalar.hpp"

namespace tdkg {

using PartyIndex = uint32_t;

// Field element a party's polynomial is evaluated at.
inline Scalar IndexScalar(PartyIndex id) {
  return Scalar::FromUint64(id);
}

}  // namespace tdkg
