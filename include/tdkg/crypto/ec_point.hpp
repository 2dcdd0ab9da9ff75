#pragma once

#include <array>
#include <cstdint>
#include <span>

#include "tdkg/common/bytes.hpp"
#include "tdkg/crypto/scalar.hpp"

namespace tdkg {

// secp256k1 group element held in compressed form. The point at infinity is
// not representable: operations that would produce it throw ArithmeticError.
class ECPoint {
 public:
  ECPoint();

  static ECPoint FromCompressed(std::span<const uint8_t> compressed_bytes);
  static ECPoint Generator();
  static ECPoint GeneratorMultiply(const Scalar& scalar);

  ECPoint Add(const ECPoint& other) const;
  ECPoint Sub(const ECPoint& other) const;
  ECPoint Negate() const;
  ECPoint Mul(const Scalar& scalar) const;

  Bytes ToCompressedBytes() const;

  bool operator==(const ECPoint& other) const;
  bool operator!=(const ECPoint& other) const;

 private:
  std::array<uint8_t, 33> compressed_{};
};

}  // namespace tdkg
