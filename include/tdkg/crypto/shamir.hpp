#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "tdkg/crypto/scalar.hpp"

namespace tdkg {

// c_i = prod_{j != i} x_j / (x_j - x_i). Throws ReconstructionError on a
// zero or repeated index.
std::vector<Scalar> LagrangeCoefficientsAtZero(std::span<const Scalar> indices);

// f(0) from samples (indices[i], shares[i]). Any set of at least t genuine
// samples of a degree t-1 polynomial yields the same value.
Scalar Reconstruct(std::span<const Scalar> indices, std::span<const Scalar> shares);

// As above, rejecting fewer than `threshold` samples.
Scalar Reconstruct(std::span<const Scalar> indices,
                   std::span<const Scalar> shares,
                   size_t threshold);

// Sum of the shares one party received from every dealer.
Scalar AggregateShares(std::span<const Scalar> shares);

}  // namespace tdkg
