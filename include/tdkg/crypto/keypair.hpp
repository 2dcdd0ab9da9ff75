#pragma once

#include <span>

#include "tdkg/crypto/ec_point.hpp"
#include "tdkg/crypto/scalar.hpp"

namespace tdkg {

struct KeyPair {
  Scalar secret;
  ECPoint public_key;
};

// Draws a fresh 32-byte seed from the CSPRNG and derives the key pair from it.
KeyPair GenerateKeyPair();

// SHA-512 of the 32-byte seed, lower half clamped (clear the low 3 bits and
// the top bit, set bit 254) and read little-endian. The result lies in
// [2^254, 2^255), below q, so no reduction is needed.
KeyPair DeriveKeyPair(std::span<const uint8_t> seed);

}  // namespace tdkg
