#include "tdkg/crypto/shamir.hpp"

#include <stdexcept>
#include <string>

#include "tdkg/common/errors.hpp"

namespace tdkg {

std::vector<Scalar> LagrangeCoefficientsAtZero(std::span<const Scalar> indices) {
  if (indices.empty()) {
    throw ReconstructionError("lagrange coefficient set must not be empty");
  }

  std::vector<Scalar> out;
  out.reserve(indices.size());

  for (size_t i = 0; i < indices.size(); ++i) {
    if (indices[i].IsZero()) {
      throw ReconstructionError("lagrange index must be non-zero");
    }

    Scalar numerator = Scalar::FromUint64(1);
    Scalar denominator = Scalar::FromUint64(1);
    for (size_t j = 0; j < indices.size(); ++j) {
      if (j == i) {
        continue;
      }

      const Scalar diff = indices[j] - indices[i];
      if (diff.IsZero()) {
        throw ReconstructionError("duplicate index in lagrange coefficient set at position " +
                                  std::to_string(j));
      }
      numerator *= indices[j];
      denominator *= diff;
    }

    Scalar denominator_inv;
    try {
      denominator_inv = denominator.Inverse();
    } catch (const ArithmeticError& ex) {
      throw ReconstructionError(std::string("failed to invert lagrange denominator: ") + ex.what());
    }
    out.push_back(numerator * denominator_inv);
  }

  return out;
}

Scalar Reconstruct(std::span<const Scalar> indices, std::span<const Scalar> shares) {
  if (indices.size() != shares.size()) {
    throw ReconstructionError("index and share counts differ");
  }

  const std::vector<Scalar> coefficients = LagrangeCoefficientsAtZero(indices);

  Scalar secret;
  for (size_t i = 0; i < coefficients.size(); ++i) {
    secret += coefficients[i] * shares[i];
  }
  return secret;
}

Scalar Reconstruct(std::span<const Scalar> indices,
                   std::span<const Scalar> shares,
                   size_t threshold) {
  if (threshold == 0) {
    throw std::invalid_argument("threshold must be positive");
  }
  if (indices.size() < threshold) {
    throw ReconstructionError("need at least " + std::to_string(threshold) + " shares, got " +
                              std::to_string(indices.size()));
  }
  return Reconstruct(indices, shares);
}

Scalar AggregateShares(std::span<const Scalar> shares) {
  if (shares.empty()) {
    throw std::invalid_argument("AggregateShares requires at least one share");
  }

  Scalar sum;
  for (const Scalar& share : shares) {
    sum += share;
  }
  return sum;
}

}  // namespace tdkg
