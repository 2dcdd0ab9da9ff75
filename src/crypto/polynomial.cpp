#include "tdkg/crypto/polynomial.hpp"

#include <stdexcept>
#include <utility>

#include "tdkg/common/secure_zeroize.hpp"
#include "tdkg/crypto/random.hpp"

namespace tdkg {

Polynomial::Polynomial(std::vector<Scalar> coefficients)
    : coefficients_(std::move(coefficients)) {
  if (coefficients_.empty()) {
    throw std::invalid_argument("Polynomial coefficients must not be empty");
  }
}

Polynomial::~Polynomial() {
  SecureZeroize(&coefficients_);
}

Polynomial Polynomial::Random(const Scalar& constant_term, uint32_t degree) {
  std::vector<Scalar> coefficients;
  coefficients.reserve(static_cast<size_t>(degree) + 1);
  coefficients.push_back(constant_term);
  for (uint32_t i = 0; i < degree; ++i) {
    coefficients.push_back(Csprng::RandomScalar());
  }
  return Polynomial(std::move(coefficients));
}

Scalar Polynomial::Evaluate(const Scalar& x) const {
  // Horner: ((c_d x + c_{d-1}) x + ...) x + c_0
  Scalar acc = coefficients_.back();
  for (auto it = coefficients_.rbegin() + 1; it != coefficients_.rend(); ++it) {
    acc = acc * x + *it;
  }
  return acc;
}

uint32_t Polynomial::degree() const {
  return static_cast<uint32_t>(coefficients_.size() - 1);
}

const Scalar& Polynomial::constant_term() const {
  return coefficients_.front();
}

const std::vector<Scalar>& Polynomial::coefficients() const {
  return coefficients_;
}

}  // namespace tdkg
