#include "tdkg/crypto/keypair.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

#include "tdkg/common/secure_zeroize.hpp"
#include "tdkg/crypto/hash.hpp"
#include "tdkg/crypto/random.hpp"

namespace tdkg {
namespace {

constexpr size_t kSeedLen = 32;

}  // namespace

KeyPair GenerateKeyPair() {
  Bytes seed = Csprng::RandomBytes(kSeedLen);
  KeyPair out = DeriveKeyPair(seed);
  SecureZeroize(&seed);
  return out;
}

KeyPair DeriveKeyPair(std::span<const uint8_t> seed) {
  if (seed.size() != kSeedLen) {
    throw std::invalid_argument("key pair seed must be exactly 32 bytes");
  }

  Bytes digest = Sha512(seed);
  std::array<uint8_t, kSeedLen> clamped{};
  std::copy(digest.begin(), digest.begin() + kSeedLen, clamped.begin());
  SecureZeroize(&digest);

  clamped[0] &= 248;
  clamped[31] &= 127;
  clamped[31] |= 64;

  KeyPair out;
  out.secret = Scalar::FromLittleEndianBytes(clamped);
  SecureZeroizeMemory(clamped.data(), clamped.size());
  out.public_key = ECPoint::GeneratorMultiply(out.secret);
  return out;
}

}  // namespace tdkg
