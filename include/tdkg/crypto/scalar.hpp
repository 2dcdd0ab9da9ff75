#pragma once

#include <array>
#include <cstdint>
#include <span>

#include <gmpxx.h>

namespace tdkg {

// Element of Z_q, q the secp256k1 group order. Always held reduced.
class Scalar {
 public:
  Scalar();
  explicit Scalar(const mpz_class& value);

  static Scalar FromUint64(uint64_t value);
  // Rejects anything that is not exactly 32 bytes encoding a value below q.
  static Scalar FromCanonicalBytes(std::span<const uint8_t> bytes);
  // Same range check, least significant byte first.
  static Scalar FromLittleEndianBytes(std::span<const uint8_t> bytes);

  std::array<uint8_t, 32> ToCanonicalBytes() const;

  const mpz_class& value() const;
  bool IsZero() const;

  Scalar operator+(const Scalar& other) const;
  Scalar operator-(const Scalar& other) const;
  Scalar operator*(const Scalar& other) const;
  Scalar operator-() const;

  Scalar& operator+=(const Scalar& other);
  Scalar& operator*=(const Scalar& other);

  Scalar Pow(uint64_t exponent) const;
  // Throws ArithmeticError on zero.
  Scalar Inverse() const;

  // Overwrites the limbs in place before dropping the value to zero.
  void Wipe() noexcept;

  bool operator==(const Scalar& other) const;
  bool operator!=(const Scalar& other) const;

  static const mpz_class& ModulusQ();

 private:
  mpz_class value_;
};

}  // namespace tdkg
