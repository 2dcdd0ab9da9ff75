#pragma once

#include <unordered_map>
#include <vector>

#include "tdkg/crypto/ec_point.hpp"
#include "tdkg/crypto/feldman.hpp"
#include "tdkg/crypto/keypair.hpp"
#include "tdkg/crypto/polynomial.hpp"
#include "tdkg/crypto/scalar.hpp"
#include "tdkg/protocol/types.hpp"

namespace tdkg {

struct DkgPartyConfig {
  PartyIndex self_id = 0;
  std::vector<PartyIndex> participants;
  uint32_t threshold = 1;
};

// Throws std::invalid_argument unless 1 <= threshold <= n, ids are non-zero
// and unique, and self_id is one of them.
void ValidateDkgParameters(const std::vector<PartyIndex>& participants,
                           PartyIndex self_id,
                           uint32_t threshold);

// One DKG participant. Owns its key pair, blinder and degree t-1 polynomial;
// only derived public artifacts and per-recipient shares leave the object.
class DkgParty {
 public:
  explicit DkgParty(DkgPartyConfig cfg);
  ~DkgParty();

  DkgParty(const DkgParty&) = delete;
  DkgParty& operator=(const DkgParty&) = delete;

  PartyIndex self_id() const;
  uint32_t threshold() const;
  const std::vector<PartyIndex>& participants() const;

  const ECPoint& public_key() const;
  const ECPoint& commitment() const;
  const VerificationVector& verification_vector() const;

  // f_self(x_recipient), to be delivered privately to `recipient`.
  const Scalar& ShareFor(PartyIndex recipient) const;

  // Only to be published once every party's commitment has been collected.
  const Scalar& RevealBlinder() const;

 private:
  PartyIndex self_id_;
  std::vector<PartyIndex> participants_;
  uint32_t threshold_;

  KeyPair key_pair_;
  Scalar blinder_;
  Polynomial polynomial_;
  ECPoint commitment_;
  VerificationVector verification_vector_;
  std::unordered_map<PartyIndex, Scalar> shares_;
};

}  // namespace tdkg
