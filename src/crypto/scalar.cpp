#include "tdkg/crypto/scalar.hpp"

#include <algorithm>

#include "tdkg/common/errors.hpp"

namespace tdkg {
namespace {

const mpz_class kSecp256k1Order(
    "0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141");

mpz_class NormalizeToQ(const mpz_class& input) {
  mpz_class normalized = input % kSecp256k1Order;
  if (normalized < 0) {
    normalized += kSecp256k1Order;
  }
  return normalized;
}

mpz_class ImportBigEndian(std::span<const uint8_t> bytes) {
  if (bytes.empty()) {
    throw ArithmeticError("Big-endian input must not be empty");
  }

  mpz_class out;
  mpz_import(out.get_mpz_t(), bytes.size(), 1, sizeof(uint8_t), 1, 0, bytes.data());
  return out;
}

}  // namespace

Scalar::Scalar() : value_(0) {}

Scalar::Scalar(const mpz_class& value) : value_(NormalizeToQ(value)) {}

Scalar Scalar::FromUint64(uint64_t value) {
  return Scalar(mpz_class(value));
}

Scalar Scalar::FromCanonicalBytes(std::span<const uint8_t> bytes) {
  if (bytes.size() != 32) {
    throw ArithmeticError("Canonical scalar must be exactly 32 bytes");
  }

  mpz_class imported = ImportBigEndian(bytes);
  if (imported >= kSecp256k1Order) {
    throw ArithmeticError("Canonical scalar is out of range");
  }
  return Scalar(imported);
}

Scalar Scalar::FromLittleEndianBytes(std::span<const uint8_t> bytes) {
  if (bytes.size() != 32) {
    throw ArithmeticError("Little-endian scalar must be exactly 32 bytes");
  }

  mpz_class imported;
  mpz_import(imported.get_mpz_t(), bytes.size(), -1, sizeof(uint8_t), 1, 0, bytes.data());
  if (imported >= kSecp256k1Order) {
    throw ArithmeticError("Little-endian scalar is out of range");
  }
  return Scalar(imported);
}

std::array<uint8_t, 32> Scalar::ToCanonicalBytes() const {
  std::array<uint8_t, 32> out{};

  if (value_ == 0) {
    return out;
  }

  size_t count = 0;
  mpz_export(out.data(), &count, 1, sizeof(uint8_t), 1, 0, value_.get_mpz_t());
  if (count > out.size()) {
    throw ArithmeticError("Scalar is larger than 32 bytes");
  }

  const size_t offset = out.size() - count;
  std::rotate(out.begin(), out.begin() + count, out.end());
  std::fill(out.begin(), out.begin() + offset, 0);
  return out;
}

const mpz_class& Scalar::value() const {
  return value_;
}

bool Scalar::IsZero() const {
  return value_ == 0;
}

Scalar Scalar::operator+(const Scalar& other) const {
  return Scalar(value_ + other.value_);
}

Scalar Scalar::operator-(const Scalar& other) const {
  return Scalar(value_ - other.value_);
}

Scalar Scalar::operator*(const Scalar& other) const {
  return Scalar(value_ * other.value_);
}

Scalar Scalar::operator-() const {
  return Scalar(-value_);
}

Scalar& Scalar::operator+=(const Scalar& other) {
  value_ = NormalizeToQ(value_ + other.value_);
  return *this;
}

Scalar& Scalar::operator*=(const Scalar& other) {
  value_ = NormalizeToQ(value_ * other.value_);
  return *this;
}

Scalar Scalar::Pow(uint64_t exponent) const {
  mpz_class out;
  const mpz_class e(exponent);
  mpz_powm(out.get_mpz_t(), value_.get_mpz_t(), e.get_mpz_t(), kSecp256k1Order.get_mpz_t());
  return Scalar(out);
}

Scalar Scalar::Inverse() const {
  if (value_ == 0) {
    throw ArithmeticError("Cannot invert zero scalar");
  }

  mpz_class inv;
  if (mpz_invert(inv.get_mpz_t(), value_.get_mpz_t(), kSecp256k1Order.get_mpz_t()) == 0) {
    throw ArithmeticError("Scalar has no inverse mod q");
  }
  return Scalar(inv);
}

void Scalar::Wipe() noexcept {
  mpz_ptr raw = value_.get_mpz_t();
  const size_t limbs = mpz_size(raw);
  if (limbs > 0) {
    volatile mp_limb_t* data = mpz_limbs_modify(raw, static_cast<mp_size_t>(limbs));
    for (size_t i = 0; i < limbs; ++i) {
      data[i] = 0;
    }
    mpz_limbs_finish(raw, 0);
  }
}

bool Scalar::operator==(const Scalar& other) const {
  return value_ == other.value_;
}

bool Scalar::operator!=(const Scalar& other) const {
  return !(*this == other);
}

const mpz_class& Scalar::ModulusQ() {
  return kSecp256k1Order;
}

}  // namespace tdkg
