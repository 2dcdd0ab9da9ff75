#pragma once

#include <cstddef>
#include <vector>

#include "tdkg/crypto/ec_point.hpp"
#include "tdkg/crypto/polynomial.hpp"
#include "tdkg/crypto/scalar.hpp"
#include "tdkg/protocol/types.hpp"

namespace tdkg {

// F[k] = coeff[k] * G, one entry per coefficient.
using VerificationVector = std::vector<ECPoint>;

VerificationVector BuildVerificationVector(const Polynomial& polynomial);

// sum_k x^k * F[k], i.e. f(x) * G for the committed f.
ECPoint EvaluateVerificationVector(const VerificationVector& vector, const Scalar& x);

// share * G == sum_k x^k * F[k]. Returns false instead of throwing on
// malformed input (empty vector, zero share).
bool VerifyShare(const VerificationVector& vector, const Scalar& share, const Scalar& x);

// As above, and additionally requires exactly `expected_size` entries so a
// truncated vector cannot skip the top-degree coefficient.
bool VerifyShare(const VerificationVector& vector,
                 const Scalar& share,
                 const Scalar& x,
                 size_t expected_size);

// Published by `receiver` when the share from `dealer` fails VerifyShare. The
// disputed share becomes public so that any party can repeat the check.
struct Complaint {
  PartyIndex dealer = 0;
  PartyIndex receiver = 0;
  Scalar share;
};

// True when the dealer is at fault: the published share does not satisfy
// the dealer's verification vector at the receiver's index.
bool ComplaintUpheld(const VerificationVector& dealer_vector,
                     const Complaint& complaint,
                     size_t expected_size);

}  // namespace tdkg
