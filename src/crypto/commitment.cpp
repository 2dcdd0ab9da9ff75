#include "tdkg/crypto/commitment.hpp"

#include <cstdint>
#include <stdexcept>

#include "tdkg/common/errors.hpp"
#include "tdkg/crypto/encoding.hpp"
#include "tdkg/crypto/hash.hpp"

namespace tdkg {
namespace {

constexpr char kPedersenBaseSeed[] = "tdkg/pedersen/H/v1";
constexpr uint32_t kMaxHashToCurveAttempts = 1024;

// Try-and-increment: SHA-256(seed || counter) as the x-coordinate of a point
// with even y. Roughly half of all x values lie on the curve.
ECPoint DerivePedersenBasePoint() {
  const Bytes seed(kPedersenBaseSeed, kPedersenBaseSeed + sizeof(kPedersenBaseSeed) - 1);

  for (uint32_t counter = 0; counter < kMaxHashToCurveAttempts; ++counter) {
    Bytes preimage;
    AppendSizedField(seed, &preimage);
    AppendU32Be(counter, &preimage);
    const Bytes x = Sha256(preimage);

    Bytes candidate;
    candidate.reserve(kPointCompressedLen);
    candidate.push_back(0x02);
    candidate.insert(candidate.end(), x.begin(), x.end());
    try {
      return ECPoint::FromCompressed(candidate);
    } catch (const ArithmeticError&) {
      continue;
    }
  }
  throw std::runtime_error("failed to hash Pedersen seed into secp256k1");
}

}  // namespace

const ECPoint& PedersenBasePoint() {
  static const ECPoint h = DerivePedersenBasePoint();
  return h;
}

ECPoint Blind(const ECPoint& public_point, const Scalar& blinder) {
  return public_point.Add(PedersenBasePoint().Mul(blinder));
}

ECPoint Unblind(const ECPoint& commitment, const Scalar& blinder) {
  return commitment.Sub(PedersenBasePoint().Mul(blinder));
}

ECPoint AggregateUnblinded(std::span<const ECPoint> commitments,
                           std::span<const Scalar> blinders) {
  if (commitments.empty()) {
    throw std::invalid_argument("AggregateUnblinded requires at least one commitment");
  }
  if (commitments.size() != blinders.size()) {
    throw std::invalid_argument("commitment and blinder counts differ");
  }

  ECPoint sum = Unblind(commitments[0], blinders[0]);
  for (size_t i = 1; i < commitments.size(); ++i) {
    sum = sum.Add(Unblind(commitments[i], blinders[i]));
  }
  return sum;
}

}  // namespace tdkg
