#include "tdkg/crypto/feldman.hpp"

#include <stdexcept>

#include "tdkg/common/errors.hpp"

namespace tdkg {

VerificationVector BuildVerificationVector(const Polynomial& polynomial) {
  VerificationVector out;
  out.reserve(polynomial.coefficients().size());
  for (const Scalar& coefficient : polynomial.coefficients()) {
    out.push_back(ECPoint::GeneratorMultiply(coefficient));
  }
  return out;
}

ECPoint EvaluateVerificationVector(const VerificationVector& vector, const Scalar& x) {
  if (vector.empty()) {
    throw std::invalid_argument("verification vector must not be empty");
  }
  if (x.IsZero()) {
    return vector.front();
  }

  // Horner over the group: ((F[d] x + F[d-1]) x + ...) x + F[0]
  ECPoint acc = vector.back();
  for (auto it = vector.rbegin() + 1; it != vector.rend(); ++it) {
    acc = acc.Mul(x).Add(*it);
  }
  return acc;
}

// ECPoint cannot hold the identity, so a zero share or a Horner step that
// lands on the identity reads as a failed check even when the equation holds.
// Both happen with probability about 2^-256 per evaluation for honest dealers.
bool VerifyShare(const VerificationVector& vector, const Scalar& share, const Scalar& x) {
  if (vector.empty() || share.IsZero()) {
    return false;
  }

  try {
    const ECPoint lhs = ECPoint::GeneratorMultiply(share);
    const ECPoint rhs = EvaluateVerificationVector(vector, x);
    return lhs == rhs;
  } catch (const ArithmeticError&) {
    return false;
  }
}

bool VerifyShare(const VerificationVector& vector,
                 const Scalar& share,
                 const Scalar& x,
                 size_t expected_size) {
  if (vector.size() != expected_size) {
    return false;
  }
  return VerifyShare(vector, share, x);
}

bool ComplaintUpheld(const VerificationVector& dealer_vector,
                     const Complaint& complaint,
                     size_t expected_size) {
  if (complaint.receiver == 0) {
    throw std::invalid_argument("complaint receiver index must be non-zero");
  }
  const Scalar x = Scalar::FromUint64(complaint.receiver);
  return !VerifyShare(dealer_vector, complaint.share, x, expected_size);
}

}  // namespace tdkg
