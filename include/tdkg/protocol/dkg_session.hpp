#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "tdkg/crypto/ec_point.hpp"
#include "tdkg/crypto/feldman.hpp"
#include "tdkg/crypto/scalar.hpp"
#include "tdkg/net/envelope.hpp"
#include "tdkg/protocol/party.hpp"

namespace tdkg {

enum class SessionStatus {
  kRunning = 0,
  kCompleted = 1,
  kAborted = 2,
  kTimedOut = 3,
};

enum class DkgPhase : uint32_t {
  kCommit = 1,
  kOpen = 2,
  kCompleted = 3,
};

enum class DkgMessageType : uint32_t {
  kCommit = 2001,
  kOpen = 2002,
  kShare = 2003,
  kComplaint = 2099,
};

struct DkgSessionConfig {
  Bytes session_id;
  PartyIndex self_id = 0;
  std::vector<PartyIndex> participants;
  uint32_t threshold = 1;
  std::chrono::milliseconds timeout = std::chrono::seconds(30);
};

struct DkgResult {
  Scalar share;
  ECPoint share_public;
  ECPoint public_key;
  std::unordered_map<PartyIndex, ECPoint> all_share_publics;
  std::unordered_map<PartyIndex, ECPoint> commitments;
  std::unordered_map<PartyIndex, VerificationVector> verification_vectors;
};

// Outcome of re-checking a complaint published by another party.
struct ComplaintVerdict {
  Complaint complaint;
  bool upheld = false;
};

Bytes EncodeComplaintPayload(const Complaint& complaint);
Complaint DecodeComplaintPayload(std::span<const uint8_t> payload);

// Drives one party through the DKG over addressed envelopes:
//   phase 1: broadcast the Pedersen commitment to the party's public key;
//   phase 2: once every commitment is in, broadcast the blinder and the
//            verification vector, and send each peer its share directly.
// Phase 2 messages that arrive while this party is still collecting
// commitments are held and replayed once it reaches phase 2.
// A share failing the Feldman check aborts the session and leaves a
// Complaint for the surrounding system to broadcast.
class DkgSession {
 public:
  explicit DkgSession(DkgSessionConfig cfg);
  ~DkgSession();

  const Bytes& session_id() const;
  PartyIndex self_id() const;
  uint32_t threshold() const;

  SessionStatus status() const;
  bool IsTerminal() const;
  const std::string& abort_reason() const;

  bool PollTimeout(std::chrono::steady_clock::time_point now =
                       std::chrono::steady_clock::now());

  DkgPhase phase() const;
  size_t received_peer_count_in_phase() const;

  const ECPoint& public_key() const;
  const ECPoint& commitment() const;

  bool HandleEnvelope(const Envelope& envelope);
  Envelope BuildPhase1CommitEnvelope();
  std::vector<Envelope> BuildPhase2OpenAndShareEnvelopes();

  // Complaints raised by this party against dealers whose share failed.
  const std::vector<Complaint>& complaints() const;
  Envelope BuildComplaintEnvelope(const Complaint& complaint) const;

  // Verdicts on complaints received from other parties.
  const std::vector<ComplaintVerdict>& complaint_verdicts() const;

  bool HasResult() const;
  const DkgResult& result() const;

  static uint32_t MessageTypeForPhase(DkgPhase phase);
  static uint32_t ShareMessageType();
  static uint32_t ComplaintMessageType();

 private:
  struct OpenData {
    Scalar blinder;
    VerificationVector vector;
  };

  bool ValidateSessionBinding(const Bytes& msg_session_id,
                              PartyIndex to,
                              std::string* error) const;
  void Touch(std::chrono::steady_clock::time_point now =
                 std::chrono::steady_clock::now());
  void Abort(const std::string& reason);
  void Complete();

  bool HandleCommitEnvelope(const Envelope& envelope);
  bool HandleOpenEnvelope(const Envelope& envelope);
  bool HandleShareEnvelope(const Envelope& envelope);
  bool HandleComplaintEnvelope(const Envelope& envelope);
  bool QueueEarlyEnvelope(const Envelope& envelope);
  void ReplayEarlyEnvelopes();

  bool AcceptShareOrComplain(PartyIndex dealer, const Scalar& share);
  void ResolvePendingComplaints(PartyIndex dealer);
  void MaybeAdvanceAfterCommit();
  void MaybeAdvanceAfterOpen();
  void ComputeAggregates();

  Bytes session_id_;
  PartyIndex self_id_;
  std::chrono::milliseconds timeout_;
  std::chrono::steady_clock::time_point last_activity_;
  SessionStatus status_ = SessionStatus::kRunning;
  std::string abort_reason_;

  std::vector<PartyIndex> participants_;
  uint32_t threshold_ = 1;
  std::unordered_set<PartyIndex> peers_;
  std::unique_ptr<DkgParty> party_;

  std::unordered_set<PartyIndex> seen_commits_;
  std::unordered_set<PartyIndex> seen_opens_;
  std::unordered_set<PartyIndex> seen_shares_;

  bool local_commit_published_ = false;
  bool local_open_published_ = false;

  std::unordered_map<PartyIndex, ECPoint> commitments_;
  std::unordered_map<PartyIndex, OpenData> open_data_;
  std::unordered_map<PartyIndex, Scalar> pending_shares_;
  std::unordered_map<PartyIndex, Scalar> verified_shares_;
  std::vector<Envelope> early_envelopes_;

  std::vector<Complaint> complaints_;
  std::vector<Complaint> pending_complaints_;
  std::vector<ComplaintVerdict> complaint_verdicts_;

  DkgResult result_;
  DkgPhase phase_ = DkgPhase::kCommit;
};

}  // namespace tdkg
