#pragma once

#include <cstdint>
#include <vector>

#include "tdkg/crypto/scalar.hpp"

namespace tdkg {

// f(x) = coeff[0] + coeff[1] x + ... + coeff[d] x^d over Z_q.
// Coefficients are wiped on destruction.
class Polynomial {
 public:
  explicit Polynomial(std::vector<Scalar> coefficients);
  ~Polynomial();

  Polynomial(const Polynomial& other) = default;
  Polynomial& operator=(const Polynomial& other) = default;
  Polynomial(Polynomial&& other) noexcept = default;
  Polynomial& operator=(Polynomial&& other) noexcept = default;

  // coeff[0] = constant_term, coeff[1..degree] uniform from the CSPRNG.
  static Polynomial Random(const Scalar& constant_term, uint32_t degree);

  Scalar Evaluate(const Scalar& x) const;

  uint32_t degree() const;
  const Scalar& constant_term() const;
  const std::vector<Scalar>& coefficients() const;

 private:
  std::vector<Scalar> coefficients_;
};

}  // namespace tdkg
