#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "tdkg/common/errors.hpp"
#include "tdkg/crypto/ec_point.hpp"
#include "tdkg/crypto/feldman.hpp"
#include "tdkg/crypto/polynomial.hpp"
#include "tdkg/crypto/random.hpp"
#include "tdkg/crypto/scalar.hpp"
#include "tdkg/crypto/shamir.hpp"

namespace {

using tdkg::AggregateShares;
using tdkg::BuildVerificationVector;
using tdkg::Complaint;
using tdkg::ComplaintUpheld;
using tdkg::Csprng;
using tdkg::ECPoint;
using tdkg::EvaluateVerificationVector;
using tdkg::LagrangeCoefficientsAtZero;
using tdkg::Polynomial;
using tdkg::Reconstruct;
using tdkg::ReconstructionError;
using tdkg::Scalar;
using tdkg::VerificationVector;
using tdkg::VerifyShare;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

template <typename E>
void ExpectThrowAs(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const E&) {
    return;
  } catch (const std::exception& ex) {
    throw std::runtime_error("Wrong exception type for " + message + ": " + ex.what());
  }
  throw std::runtime_error("Expected exception: " + message);
}

Scalar S(uint64_t value) {
  return Scalar::FromUint64(value);
}

std::vector<Scalar> ToScalars(const std::vector<uint64_t>& values) {
  std::vector<Scalar> out;
  out.reserve(values.size());
  for (uint64_t v : values) {
    out.push_back(S(v));
  }
  return out;
}

void TestPolynomialEvaluation() {
  const Polynomial poly({S(1234), S(7), S(13)});
  Expect(poly.degree() == 2, "Three coefficients make a degree 2 polynomial");
  Expect(poly.Evaluate(Scalar()) == S(1234), "f(0) must be the constant term");
  for (uint64_t x = 1; x <= 6; ++x) {
    Expect(poly.Evaluate(S(x)) == S(1234 + 7 * x + 13 * x * x),
           "Horner evaluation must match 1234 + 7x + 13x^2 at x=" + std::to_string(x));
  }

  const Scalar secret = Csprng::RandomNonZeroScalar();
  const Polynomial random_poly = Polynomial::Random(secret, 4);
  Expect(random_poly.degree() == 4, "Random polynomial must have the requested degree");
  Expect(random_poly.constant_term() == secret, "Random polynomial keeps the secret as constant term");
  Expect(random_poly.Evaluate(Scalar()) == secret, "Random polynomial evaluates to the secret at 0");

  const Scalar x = Csprng::RandomScalar();
  Scalar expected;
  for (uint32_t k = 0; k <= random_poly.degree(); ++k) {
    expected += random_poly.coefficients()[k] * x.Pow(k);
  }
  Expect(random_poly.Evaluate(x) == expected, "Horner must agree with the power-sum form");

  const Polynomial constant = Polynomial::Random(secret, 0);
  Expect(constant.Evaluate(x) == secret, "Degree 0 polynomial is constant");

  ExpectThrowAs<std::invalid_argument>([]() { Polynomial empty(std::vector<Scalar>{}); },
                                       "Polynomial rejects an empty coefficient list");
}

void TestFeldmanEquationHolds() {
  constexpr uint32_t kThreshold = 3;
  const Polynomial poly = Polynomial::Random(Csprng::RandomNonZeroScalar(), kThreshold - 1);
  const VerificationVector vector = BuildVerificationVector(poly);
  Expect(vector.size() == kThreshold, "Verification vector covers every coefficient");
  for (uint32_t k = 0; k < kThreshold; ++k) {
    Expect(vector[k] == ECPoint::GeneratorMultiply(poly.coefficients()[k]),
           "F[k] must equal coeff[k] * G");
  }

  std::vector<Scalar> points = ToScalars({1, 2, 3, 4, 5, 1000000});
  points.push_back(Csprng::RandomNonZeroScalar());
  for (const Scalar& x : points) {
    const Scalar share = poly.Evaluate(x);
    Expect(ECPoint::GeneratorMultiply(share) == EvaluateVerificationVector(vector, x),
           "f(x) * G must equal sum_k x^k F[k]");
    Expect(VerifyShare(vector, share, x, kThreshold), "Genuine share must verify");
  }

  Expect(EvaluateVerificationVector(vector, Scalar()) == vector.front(),
         "Evaluating the vector at 0 yields the committed secret");
}

void TestFeldmanRejectsBadInput() {
  constexpr uint32_t kThreshold = 3;
  const Polynomial poly = Polynomial::Random(Csprng::RandomNonZeroScalar(), kThreshold - 1);
  const VerificationVector vector = BuildVerificationVector(poly);
  const Scalar x = S(4);
  const Scalar share = poly.Evaluate(x);

  Expect(!VerifyShare(vector, share + S(1), x, kThreshold), "Tampered share must not verify");
  Expect(!VerifyShare(vector, share, S(5), kThreshold), "Share must not verify at another index");
  Expect(!VerifyShare(vector, Scalar(), x), "Zero share must not verify");
  Expect(!VerifyShare(VerificationVector{}, share, x), "Empty vector must not verify");

  VerificationVector truncated(vector.begin(), vector.end() - 1);
  Expect(!VerifyShare(truncated, share, x, kThreshold),
         "Vector missing the top coefficient must be rejected by size");
  Expect(!VerifyShare(truncated, share, x),
         "Vector missing the top coefficient cannot vouch for the share");

  VerificationVector swapped = vector;
  std::swap(swapped[1], swapped[2]);
  Expect(!VerifyShare(swapped, share, x, kThreshold), "Reordered vector must not verify");
}

void TestComplaintVerdicts() {
  constexpr uint32_t kThreshold = 2;
  const Polynomial poly = Polynomial::Random(Csprng::RandomNonZeroScalar(), kThreshold - 1);
  const VerificationVector vector = BuildVerificationVector(poly);

  const Complaint genuine{.dealer = 1, .receiver = 3, .share = poly.Evaluate(S(3))};
  Expect(!ComplaintUpheld(vector, genuine, kThreshold),
         "Complaint about a genuine share clears the dealer");

  const Complaint bad{.dealer = 1, .receiver = 3, .share = poly.Evaluate(S(3)) + S(1)};
  Expect(ComplaintUpheld(vector, bad, kThreshold),
         "Complaint about an inconsistent share is upheld");

  const Complaint no_receiver{.dealer = 1, .receiver = 0, .share = poly.Evaluate(S(3))};
  ExpectThrowAs<std::invalid_argument>([&]() { (void)ComplaintUpheld(vector, no_receiver, kThreshold); },
                                       "Complaint with receiver 0 is malformed");
}

void TestThresholdReconstructionSmallSecret() {
  // f(x) = 1234 + 7x + 13x^2, t = 3.
  const std::vector<uint64_t> xs = {1, 2, 3, 4, 5, 6};
  std::vector<Scalar> shares;
  for (uint64_t x : xs) {
    shares.push_back(S(1234 + 7 * x + 13 * x * x));
  }

  Expect(Reconstruct(ToScalars({1, 2, 3}), std::vector<Scalar>{shares[0], shares[1], shares[2]}, 3) == S(1234),
         "Reconstruction from indices {1,2,3} yields 1234");
  Expect(Reconstruct(ToScalars({2, 4, 6}), std::vector<Scalar>{shares[1], shares[3], shares[5]}, 3) == S(1234),
         "Reconstruction from indices {2,4,6} yields 1234");

  // Every 3-subset of the six samples agrees.
  for (size_t a = 0; a < xs.size(); ++a) {
    for (size_t b = a + 1; b < xs.size(); ++b) {
      for (size_t c = b + 1; c < xs.size(); ++c) {
        const Scalar secret = Reconstruct(ToScalars({xs[a], xs[b], xs[c]}),
                                          std::vector<Scalar>{shares[a], shares[b], shares[c]}, 3);
        Expect(secret == S(1234), "Reconstruction must be independent of the chosen subset");
      }
    }
  }

  Expect(Reconstruct(ToScalars(xs), shares, 3) == S(1234),
         "More than t genuine samples still reconstruct the secret");
  Expect(Reconstruct(ToScalars({5, 1, 3}), std::vector<Scalar>{shares[4], shares[0], shares[2]}) == S(1234),
         "Sample order does not matter");
}

void TestReconstructionFromRandomPolynomial() {
  constexpr uint32_t kThreshold = 4;
  const Scalar secret = Csprng::RandomNonZeroScalar();
  const Polynomial poly = Polynomial::Random(secret, kThreshold - 1);

  const std::vector<std::vector<uint64_t>> subsets = {
      {1, 2, 3, 4}, {4, 5, 6, 7}, {1, 3, 5, 7}, {2, 3, 6, 7, 1}};
  for (const auto& subset : subsets) {
    std::vector<Scalar> indices = ToScalars(subset);
    std::vector<Scalar> values;
    for (const Scalar& x : indices) {
      values.push_back(poly.Evaluate(x));
    }
    Expect(Reconstruct(indices, values, kThreshold) == secret,
           "Any qualifying subset reconstructs the random secret");
  }

  std::vector<Scalar> short_indices = ToScalars({1, 2, 3});
  std::vector<Scalar> short_values;
  for (const Scalar& x : short_indices) {
    short_values.push_back(poly.Evaluate(x));
  }
  Expect(Reconstruct(short_indices, short_values) != secret,
         "t-1 samples interpolate a different constant term");
}

void TestReconstructionFailures() {
  const std::vector<Scalar> shares = {S(10), S(20), S(30)};

  ExpectThrowAs<ReconstructionError>([&]() { (void)Reconstruct(ToScalars({1, 1, 2}), shares); },
                                     "Duplicate indices must fail");
  ExpectThrowAs<ReconstructionError>([&]() { (void)LagrangeCoefficientsAtZero(ToScalars({3, 2, 3})); },
                                     "Duplicate indices must fail in coefficient computation");
  ExpectThrowAs<ReconstructionError>([&]() { (void)Reconstruct(ToScalars({0, 1, 2}), shares); },
                                     "Index zero must be rejected");
  ExpectThrowAs<ReconstructionError>(
      [&]() { (void)Reconstruct(ToScalars({1, 2}), std::vector<Scalar>{shares[0], shares[1]}, 3); },
      "Fewer than t shares must fail");
  ExpectThrowAs<ReconstructionError>([&]() { (void)Reconstruct(ToScalars({1, 2, 3}), std::vector<Scalar>{shares[0]}); },
                                     "Index and share counts must match");
  ExpectThrowAs<ReconstructionError>([]() { (void)Reconstruct({}, {}); },
                                     "Empty reconstruction must fail");
}

void TestLagrangeCoefficients() {
  const std::vector<Scalar> indices = ToScalars({1, 2, 3});
  const std::vector<Scalar> coefficients = LagrangeCoefficientsAtZero(indices);
  Expect(coefficients.size() == 3, "One coefficient per index");
  // For {1,2,3}: c = (3, -3, 1).
  Expect(coefficients[0] == S(3), "c_1 must be 3");
  Expect(coefficients[1] == -S(3), "c_2 must be -3");
  Expect(coefficients[2] == S(1), "c_3 must be 1");

  const std::vector<Scalar> random_indices = {Csprng::RandomNonZeroScalar(),
                                              Csprng::RandomNonZeroScalar(),
                                              Csprng::RandomNonZeroScalar(),
                                              Csprng::RandomNonZeroScalar()};
  Scalar sum;
  for (const Scalar& c : LagrangeCoefficientsAtZero(random_indices)) {
    sum += c;
  }
  Expect(sum == S(1), "Lagrange coefficients at zero sum to one");
}

void TestAggregateShares() {
  Expect(AggregateShares(ToScalars({5, 6, 7})) == S(18), "Shares add up");
  Expect(AggregateShares(std::vector<Scalar>{-S(1), S(1)}).IsZero(), "Aggregation wraps modulo q");
  ExpectThrowAs<std::invalid_argument>([]() { (void)AggregateShares({}); },
                                       "Aggregating nothing must fail");
}

}  // namespace

int main() {
  try {
    TestPolynomialEvaluation();
    TestFeldmanEquationHolds();
    TestFeldmanRejectsBadInput();
    TestComplaintVerdicts();
    TestThresholdReconstructionSmallSecret();
    TestReconstructionFromRandomPolynomial();
    TestReconstructionFailures();
    TestLagrangeCoefficients();
    TestAggregateShares();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "VSS tests passed" << '\n';
  return 0;
}
