#pragma once

#include <span>

#include "tdkg/crypto/ec_point.hpp"
#include "tdkg/crypto/scalar.hpp"

namespace tdkg {

// Second Pedersen base point H. Hashed into the group from a fixed public
// seed, so nobody knows log_G(H).
const ECPoint& PedersenBasePoint();

// public + blinder * H
ECPoint Blind(const ECPoint& public_point, const Scalar& blinder);

// commitment - blinder * H
ECPoint Unblind(const ECPoint& commitment, const Scalar& blinder);

// Sum of Unblind(commitments[i], blinders[i]), i.e. the joint public key.
ECPoint AggregateUnblinded(std::span<const ECPoint> commitments,
                           std::span<const Scalar> blinders);

}  // namespace tdkg
