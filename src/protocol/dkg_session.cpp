#include "tdkg/protocol/dkg_session.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "tdkg/common/secure_zeroize.hpp"
#include "tdkg/crypto/commitment.hpp"
#include "tdkg/crypto/encoding.hpp"
#include "tdkg/crypto/shamir.hpp"

namespace tdkg {
namespace {

std::unordered_set<PartyIndex> BuildPeerSet(const std::vector<PartyIndex>& participants,
                                            PartyIndex self_id) {
  std::unordered_set<PartyIndex> peers;
  for (PartyIndex id : participants) {
    if (id != self_id) {
      peers.insert(id);
    }
  }
  return peers;
}

void EnsureNoTrailingBytes(const Bytes& payload, size_t offset, const char* what) {
  if (offset != payload.size()) {
    throw std::invalid_argument(std::string(what) + " payload has trailing bytes");
  }
}

}  // namespace

Bytes EncodeComplaintPayload(const Complaint& complaint) {
  Bytes out;
  out.reserve(4 + 4 + kScalarLen);
  AppendU32Be(complaint.dealer, &out);
  AppendU32Be(complaint.receiver, &out);
  AppendScalar(complaint.share, &out);
  return out;
}

Complaint DecodeComplaintPayload(std::span<const uint8_t> payload) {
  size_t offset = 0;
  Complaint out;
  out.dealer = ReadU32Be(payload, &offset);
  out.receiver = ReadU32Be(payload, &offset);
  out.share = ReadScalar(payload, &offset);
  if (offset != payload.size()) {
    throw std::invalid_argument("complaint payload has trailing bytes");
  }
  return out;
}

DkgSession::DkgSession(DkgSessionConfig cfg)
    : session_id_(std::move(cfg.session_id)),
      self_id_(cfg.self_id),
      timeout_(cfg.timeout),
      last_activity_(std::chrono::steady_clock::now()),
      participants_(std::move(cfg.participants)),
      threshold_(cfg.threshold),
      peers_(BuildPeerSet(participants_, cfg.self_id)) {
  if (session_id_.empty()) {
    throw std::invalid_argument("Session ID must not be empty");
  }
  if (self_id_ == 0) {
    throw std::invalid_argument("self_id must be non-zero");
  }
  if (timeout_.count() <= 0) {
    throw std::invalid_argument("timeout must be positive");
  }
  if (participants_.size() < 2) {
    throw std::invalid_argument("DkgSession requires at least 2 participants");
  }

  party_ = std::make_unique<DkgParty>(DkgPartyConfig{
      .self_id = self_id_,
      .participants = participants_,
      .threshold = threshold_,
  });
}

DkgSession::~DkgSession() {
  for (Envelope& envelope : early_envelopes_) {
    SecureZeroize(&envelope.payload);
  }
  SecureZeroize(&pending_shares_);
  SecureZeroize(&verified_shares_);
  SecureZeroize(&result_.share);
}

const Bytes& DkgSession::session_id() const {
  return session_id_;
}

PartyIndex DkgSession::self_id() const {
  return self_id_;
}

uint32_t DkgSession::threshold() const {
  return threshold_;
}

SessionStatus DkgSession::status() const {
  return status_;
}

bool DkgSession::IsTerminal() const {
  return status_ == SessionStatus::kCompleted ||
         status_ == SessionStatus::kAborted ||
         status_ == SessionStatus::kTimedOut;
}

const std::string& DkgSession::abort_reason() const {
  return abort_reason_;
}

bool DkgSession::PollTimeout(std::chrono::steady_clock::time_point now) {
  if (IsTerminal()) {
    return status_ == SessionStatus::kTimedOut;
  }

  if (now - last_activity_ > timeout_) {
    status_ = SessionStatus::kTimedOut;
    abort_reason_ = "session timed out";
    return true;
  }
  return false;
}

DkgPhase DkgSession::phase() const {
  return phase_;
}

size_t DkgSession::received_peer_count_in_phase() const {
  switch (phase_) {
    case DkgPhase::kCommit:
      return seen_commits_.size();
    case DkgPhase::kOpen: {
      size_t complete = 0;
      for (PartyIndex peer : peers_) {
        if (seen_opens_.contains(peer) && seen_shares_.contains(peer)) {
          ++complete;
        }
      }
      return complete;
    }
    case DkgPhase::kCompleted:
      return peers_.size();
  }
  throw std::invalid_argument("invalid dkg phase");
}

const ECPoint& DkgSession::public_key() const {
  return party_->public_key();
}

const ECPoint& DkgSession::commitment() const {
  return party_->commitment();
}

bool DkgSession::HandleEnvelope(const Envelope& envelope) {
  if (PollTimeout()) {
    return false;
  }
  if (IsTerminal()) {
    return false;
  }

  std::string error;
  if (!ValidateSessionBinding(envelope.session_id, envelope.to, &error)) {
    return false;
  }

  if (!peers_.contains(envelope.from)) {
    return false;
  }

  if (envelope.type == ComplaintMessageType()) {
    return HandleComplaintEnvelope(envelope);
  }

  switch (phase_) {
    case DkgPhase::kCommit:
      if (envelope.type == MessageTypeForPhase(DkgPhase::kCommit)) {
        return HandleCommitEnvelope(envelope);
      }
      if (envelope.type == MessageTypeForPhase(DkgPhase::kOpen) ||
          envelope.type == ShareMessageType()) {
        return QueueEarlyEnvelope(envelope);
      }
      Abort("unexpected envelope type for dkg commit phase");
      return false;
    case DkgPhase::kOpen:
      if (envelope.type == MessageTypeForPhase(DkgPhase::kCommit) &&
          seen_commits_.contains(envelope.from)) {
        return true;
      }
      if (envelope.type == MessageTypeForPhase(DkgPhase::kOpen)) {
        return HandleOpenEnvelope(envelope);
      }
      if (envelope.type == ShareMessageType()) {
        return HandleShareEnvelope(envelope);
      }
      Abort("unexpected envelope type for dkg open phase");
      return false;
    case DkgPhase::kCompleted:
      return false;
  }
  throw std::invalid_argument("invalid dkg phase");
}

Envelope DkgSession::BuildPhase1CommitEnvelope() {
  if (IsTerminal()) {
    throw std::logic_error("cannot build commit envelope for terminal dkg session");
  }
  if (phase_ != DkgPhase::kCommit) {
    throw std::logic_error("BuildPhase1CommitEnvelope must be called in dkg commit phase");
  }

  local_commit_published_ = true;
  commitments_[self_id_] = party_->commitment();

  Envelope out;
  out.session_id = session_id_;
  out.from = self_id_;
  out.to = kBroadcastPartyId;
  out.type = MessageTypeForPhase(DkgPhase::kCommit);
  AppendPoint(party_->commitment(), &out.payload);

  MaybeAdvanceAfterCommit();
  return out;
}

std::vector<Envelope> DkgSession::BuildPhase2OpenAndShareEnvelopes() {
  if (IsTerminal()) {
    throw std::logic_error("cannot build open envelopes for terminal dkg session");
  }
  // Reaching the open phase implies every commitment has been collected, so
  // revealing the blinder can no longer help anyone choose theirs.
  if (phase_ != DkgPhase::kOpen) {
    throw std::logic_error("BuildPhase2OpenAndShareEnvelopes must be called in dkg open phase");
  }

  const Scalar& blinder = party_->RevealBlinder();
  const VerificationVector& vector = party_->verification_vector();
  open_data_[self_id_] = OpenData{blinder, vector};
  verified_shares_[self_id_] = party_->ShareFor(self_id_);
  local_open_published_ = true;

  Bytes open_payload;
  open_payload.reserve(kScalarLen + 4 + kPointCompressedLen * vector.size());
  AppendScalar(blinder, &open_payload);
  AppendPointVector(vector, &open_payload);

  std::vector<Envelope> out;
  out.reserve(1 + peers_.size());

  Envelope open_msg;
  open_msg.session_id = session_id_;
  open_msg.from = self_id_;
  open_msg.to = kBroadcastPartyId;
  open_msg.type = MessageTypeForPhase(DkgPhase::kOpen);
  open_msg.payload = std::move(open_payload);
  out.push_back(std::move(open_msg));

  for (PartyIndex peer : participants_) {
    if (peer == self_id_) {
      continue;
    }
    Envelope share_msg;
    share_msg.session_id = session_id_;
    share_msg.from = self_id_;
    share_msg.to = peer;
    share_msg.type = ShareMessageType();
    AppendScalar(party_->ShareFor(peer), &share_msg.payload);
    out.push_back(std::move(share_msg));
  }

  MaybeAdvanceAfterOpen();
  return out;
}

const std::vector<Complaint>& DkgSession::complaints() const {
  return complaints_;
}

Envelope DkgSession::BuildComplaintEnvelope(const Complaint& complaint) const {
  if (complaint.receiver != self_id_) {
    throw std::invalid_argument("a party may only complain about its own share");
  }
  if (!peers_.contains(complaint.dealer)) {
    throw std::invalid_argument("complaint dealer is not a peer");
  }

  Envelope out;
  out.session_id = session_id_;
  out.from = self_id_;
  out.to = kBroadcastPartyId;
  out.type = ComplaintMessageType();
  out.payload = EncodeComplaintPayload(complaint);
  return out;
}

const std::vector<ComplaintVerdict>& DkgSession::complaint_verdicts() const {
  return complaint_verdicts_;
}

bool DkgSession::HasResult() const {
  return status_ == SessionStatus::kCompleted && phase_ == DkgPhase::kCompleted;
}

const DkgResult& DkgSession::result() const {
  if (!HasResult()) {
    throw std::logic_error("dkg result is not ready");
  }
  return result_;
}

uint32_t DkgSession::MessageTypeForPhase(DkgPhase phase) {
  switch (phase) {
    case DkgPhase::kCommit:
      return static_cast<uint32_t>(DkgMessageType::kCommit);
    case DkgPhase::kOpen:
      return static_cast<uint32_t>(DkgMessageType::kOpen);
    case DkgPhase::kCompleted:
      return static_cast<uint32_t>(DkgMessageType::kComplaint);
  }
  throw std::invalid_argument("invalid dkg phase");
}

uint32_t DkgSession::ShareMessageType() {
  return static_cast<uint32_t>(DkgMessageType::kShare);
}

uint32_t DkgSession::ComplaintMessageType() {
  return static_cast<uint32_t>(DkgMessageType::kComplaint);
}

bool DkgSession::ValidateSessionBinding(const Bytes& msg_session_id,
                                        PartyIndex to,
                                        std::string* error) const {
  if (msg_session_id != session_id_) {
    if (error != nullptr) {
      *error = "session_id mismatch";
    }
    return false;
  }

  if (to != self_id_ && to != kBroadcastPartyId) {
    if (error != nullptr) {
      *error = "message recipient mismatch";
    }
    return false;
  }

  return true;
}

void DkgSession::Touch(std::chrono::steady_clock::time_point now) {
  last_activity_ = now;
}

void DkgSession::Abort(const std::string& reason) {
  if (IsTerminal()) {
    return;
  }
  status_ = SessionStatus::kAborted;
  abort_reason_ = reason;
}

void DkgSession::Complete() {
  if (IsTerminal()) {
    return;
  }
  status_ = SessionStatus::kCompleted;
  abort_reason_.clear();
}

bool DkgSession::HandleCommitEnvelope(const Envelope& envelope) {
  if (envelope.to != kBroadcastPartyId) {
    Abort("dkg commit message must be broadcast");
    return false;
  }

  const bool inserted = seen_commits_.insert(envelope.from).second;
  if (!inserted) {
    return true;
  }

  try {
    size_t offset = 0;
    const ECPoint commitment = ReadPoint(envelope.payload, &offset);
    EnsureNoTrailingBytes(envelope.payload, offset, "dkg commit");
    commitments_[envelope.from] = commitment;
  } catch (const std::exception& ex) {
    Abort(std::string("invalid dkg commit payload: ") + ex.what());
    return false;
  }

  Touch();
  MaybeAdvanceAfterCommit();
  return !IsTerminal();
}

bool DkgSession::HandleOpenEnvelope(const Envelope& envelope) {
  if (envelope.to != kBroadcastPartyId) {
    Abort("dkg open message must be broadcast");
    return false;
  }

  const bool inserted = seen_opens_.insert(envelope.from).second;
  if (!inserted) {
    return true;
  }

  try {
    size_t offset = 0;
    const Scalar blinder = ReadScalar(envelope.payload, &offset);
    VerificationVector vector = ReadPointVector(envelope.payload, &offset, threshold_);
    EnsureNoTrailingBytes(envelope.payload, offset, "dkg open");

    if (vector.size() != threshold_) {
      throw std::invalid_argument("verification vector size does not match threshold");
    }

    const auto commitment_it = commitments_.find(envelope.from);
    if (commitment_it == commitments_.end()) {
      throw std::invalid_argument("missing commitment for dealer");
    }
    if (Unblind(commitment_it->second, blinder) != vector.front()) {
      throw std::invalid_argument("unblinded commitment does not match verification vector");
    }

    open_data_[envelope.from] = OpenData{blinder, std::move(vector)};
  } catch (const std::exception& ex) {
    Abort(std::string("invalid dkg open: ") + ex.what());
    return false;
  }

  const auto pending_it = pending_shares_.find(envelope.from);
  if (pending_it != pending_shares_.end()) {
    const Scalar share = pending_it->second;
    pending_shares_.erase(pending_it);
    if (!AcceptShareOrComplain(envelope.from, share)) {
      return false;
    }
  }

  ResolvePendingComplaints(envelope.from);
  if (IsTerminal()) {
    return false;
  }

  Touch();
  MaybeAdvanceAfterOpen();
  return true;
}

bool DkgSession::HandleShareEnvelope(const Envelope& envelope) {
  if (envelope.to != self_id_) {
    Abort("dkg share message must target receiver directly");
    return false;
  }

  const bool inserted = seen_shares_.insert(envelope.from).second;
  if (!inserted) {
    return true;
  }

  Scalar share;
  try {
    size_t offset = 0;
    share = ReadScalar(envelope.payload, &offset);
    EnsureNoTrailingBytes(envelope.payload, offset, "dkg share");
  } catch (const std::exception& ex) {
    Abort(std::string("invalid dkg share: ") + ex.what());
    return false;
  }

  if (open_data_.contains(envelope.from)) {
    if (!AcceptShareOrComplain(envelope.from, share)) {
      return false;
    }
  } else {
    pending_shares_[envelope.from] = share;
  }

  Touch();
  MaybeAdvanceAfterOpen();
  return true;
}

bool DkgSession::HandleComplaintEnvelope(const Envelope& envelope) {
  if (envelope.to != kBroadcastPartyId) {
    Abort("dkg complaint message must be broadcast");
    return false;
  }

  Complaint complaint;
  try {
    complaint = DecodeComplaintPayload(envelope.payload);
  } catch (const std::exception& ex) {
    Abort(std::string("invalid dkg complaint: ") + ex.what());
    return false;
  }

  if (complaint.receiver != envelope.from) {
    Abort("dkg complaint must concern the sender's own share");
    return false;
  }
  if (complaint.dealer != self_id_ && !peers_.contains(complaint.dealer)) {
    Abort("dkg complaint names an unknown dealer");
    return false;
  }

  Touch();
  pending_complaints_.push_back(complaint);
  ResolvePendingComplaints(complaint.dealer);
  return !IsTerminal();
}

bool DkgSession::AcceptShareOrComplain(PartyIndex dealer, const Scalar& share) {
  const OpenData& open = open_data_.at(dealer);
  if (VerifyShare(open.vector, share, IndexScalar(self_id_), threshold_)) {
    verified_shares_[dealer] = share;
    return true;
  }

  complaints_.push_back(Complaint{.dealer = dealer, .receiver = self_id_, .share = share});
  Abort("feldman verification failed for share from dealer " + std::to_string(dealer));
  return false;
}

void DkgSession::ResolvePendingComplaints(PartyIndex dealer) {
  const VerificationVector* vector = nullptr;
  if (dealer == self_id_) {
    // Our own vector is authoritative even before it has been published.
    vector = &party_->verification_vector();
  } else {
    const auto open_it = open_data_.find(dealer);
    if (open_it == open_data_.end()) {
      return;
    }
    vector = &open_it->second.vector;
  }

  for (auto it = pending_complaints_.begin(); it != pending_complaints_.end();) {
    if (it->dealer != dealer) {
      ++it;
      continue;
    }

    const bool upheld = ComplaintUpheld(*vector, *it, threshold_);
    complaint_verdicts_.push_back(ComplaintVerdict{.complaint = *it, .upheld = upheld});
    if (upheld) {
      Abort("dealer " + std::to_string(dealer) + " excluded: complaint from party " +
            std::to_string(it->receiver) + " upheld");
    }
    it = pending_complaints_.erase(it);
  }
}

void DkgSession::MaybeAdvanceAfterCommit() {
  if (phase_ != DkgPhase::kCommit) {
    return;
  }
  if (!local_commit_published_) {
    return;
  }
  if (seen_commits_.size() != peers_.size()) {
    return;
  }
  if (commitments_.size() != participants_.size()) {
    return;
  }

  phase_ = DkgPhase::kOpen;
  ReplayEarlyEnvelopes();
}

// A peer that already holds every commitment may open before we do. Its
// open and share wait here until our own commit phase is over.
bool DkgSession::QueueEarlyEnvelope(const Envelope& envelope) {
  for (const Envelope& queued : early_envelopes_) {
    if (queued.from == envelope.from && queued.type == envelope.type) {
      return true;
    }
  }
  early_envelopes_.push_back(envelope);
  Touch();
  return true;
}

void DkgSession::ReplayEarlyEnvelopes() {
  std::vector<Envelope> queued = std::move(early_envelopes_);
  early_envelopes_.clear();
  for (Envelope& envelope : queued) {
    if (!IsTerminal()) {
      if (envelope.type == MessageTypeForPhase(DkgPhase::kOpen)) {
        (void)HandleOpenEnvelope(envelope);
      } else {
        (void)HandleShareEnvelope(envelope);
      }
    }
    SecureZeroize(&envelope.payload);
  }
}

void DkgSession::MaybeAdvanceAfterOpen() {
  if (phase_ != DkgPhase::kOpen || IsTerminal()) {
    return;
  }
  if (!local_open_published_) {
    return;
  }
  if (open_data_.size() != participants_.size()) {
    return;
  }
  if (verified_shares_.size() != participants_.size()) {
    return;
  }

  ComputeAggregates();
}

void DkgSession::ComputeAggregates() {
  try {
    std::vector<Scalar> shares;
    std::vector<ECPoint> commitments;
    std::vector<Scalar> blinders;
    shares.reserve(participants_.size());
    commitments.reserve(participants_.size());
    blinders.reserve(participants_.size());
    for (PartyIndex dealer : participants_) {
      shares.push_back(verified_shares_.at(dealer));
      commitments.push_back(commitments_.at(dealer));
      blinders.push_back(open_data_.at(dealer).blinder);
    }

    result_.share = AggregateShares(shares);
    SecureZeroize(&shares);
    result_.public_key = AggregateUnblinded(commitments, blinders);

    // X_j = sum_i F_i(x_j): the public image of every party's final share.
    for (PartyIndex receiver : participants_) {
      const Scalar x = IndexScalar(receiver);
      std::optional<ECPoint> sum;
      for (PartyIndex dealer : participants_) {
        const ECPoint term = EvaluateVerificationVector(open_data_.at(dealer).vector, x);
        sum = sum.has_value() ? sum->Add(term) : term;
      }
      result_.all_share_publics[receiver] = *sum;
    }

    result_.share_public = ECPoint::GeneratorMultiply(result_.share);
    if (result_.share_public != result_.all_share_publics.at(self_id_)) {
      throw std::runtime_error("aggregated share does not match aggregated verification vectors");
    }

    for (PartyIndex dealer : participants_) {
      result_.commitments[dealer] = commitments_.at(dealer);
      result_.verification_vectors[dealer] = open_data_.at(dealer).vector;
    }
  } catch (const std::exception& ex) {
    Abort(std::string("failed to aggregate dkg result: ") + ex.what());
    return;
  }

  phase_ = DkgPhase::kCompleted;
  Complete();
}

}  // namespace tdkg
