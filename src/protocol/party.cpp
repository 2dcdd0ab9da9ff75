#include "tdkg/protocol/party.hpp"

#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

#include "tdkg/common/secure_zeroize.hpp"
#include "tdkg/crypto/commitment.hpp"
#include "tdkg/crypto/random.hpp"

namespace tdkg {
namespace {

const DkgPartyConfig& ValidatedOrThrow(const DkgPartyConfig& cfg) {
  ValidateDkgParameters(cfg.participants, cfg.self_id, cfg.threshold);
  return cfg;
}

}  // namespace

void ValidateDkgParameters(const std::vector<PartyIndex>& participants,
                           PartyIndex self_id,
                           uint32_t threshold) {
  if (participants.empty()) {
    throw std::invalid_argument("DKG requires at least 1 participant");
  }
  if (threshold == 0) {
    throw std::invalid_argument("threshold must be >= 1");
  }
  if (threshold > participants.size()) {
    throw std::invalid_argument("threshold must not exceed participant count");
  }

  std::unordered_set<PartyIndex> dedup;
  bool self_present = false;
  for (PartyIndex id : participants) {
    if (id == 0) {
      throw std::invalid_argument("participants must not contain 0");
    }
    if (!dedup.insert(id).second) {
      throw std::invalid_argument("participants must be unique");
    }
    if (id == self_id) {
      self_present = true;
    }
  }

  if (!self_present) {
    throw std::invalid_argument("self_id must be in participants");
  }
}

DkgParty::DkgParty(DkgPartyConfig cfg)
    : self_id_(ValidatedOrThrow(cfg).self_id),
      participants_(std::move(cfg.participants)),
      threshold_(cfg.threshold),
      key_pair_(GenerateKeyPair()),
      blinder_(Csprng::RandomNonZeroScalar()),
      polynomial_(Polynomial::Random(key_pair_.secret, threshold_ - 1)),
      commitment_(Blind(key_pair_.public_key, blinder_)),
      verification_vector_(BuildVerificationVector(polynomial_)) {
  shares_.reserve(participants_.size());
  for (PartyIndex id : participants_) {
    shares_.emplace(id, polynomial_.Evaluate(IndexScalar(id)));
  }
}

DkgParty::~DkgParty() {
  SecureZeroize(&key_pair_.secret);
  SecureZeroize(&blinder_);
  SecureZeroize(&shares_);
}

PartyIndex DkgParty::self_id() const {
  return self_id_;
}

uint32_t DkgParty::threshold() const {
  return threshold_;
}

const std::vector<PartyIndex>& DkgParty::participants() const {
  return participants_;
}

const ECPoint& DkgParty::public_key() const {
  return key_pair_.public_key;
}

const ECPoint& DkgParty::commitment() const {
  return commitment_;
}

const VerificationVector& DkgParty::verification_vector() const {
  return verification_vector_;
}

const Scalar& DkgParty::ShareFor(PartyIndex recipient) const {
  const auto it = shares_.find(recipient);
  if (it == shares_.end()) {
    throw std::invalid_argument("no share for party " + std::to_string(recipient));
  }
  return it->second;
}

const Scalar& DkgParty::RevealBlinder() const {
  return blinder_;
}

}  // namespace tdkg
