#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "tdkg/crypto/ec_point.hpp"
#include "tdkg/crypto/random.hpp"
#include "tdkg/crypto/shamir.hpp"
#include "tdkg/net/envelope.hpp"
#include "tdkg/protocol/dkg_session.hpp"

namespace {

using tdkg::Bytes;
using tdkg::DkgPhase;
using tdkg::DkgSession;
using tdkg::DkgSessionConfig;
using tdkg::Envelope;
using tdkg::PartyIndex;
using tdkg::Scalar;
using tdkg::SessionStatus;

struct BenchArgs {
  uint32_t n = 5;
  uint32_t t = 3;
  uint32_t iters = 10;
};

struct PhaseMetric {
  double total_ms = 0.0;
  uint64_t total_bytes = 0;
  uint64_t samples = 0;
};

struct DkgMetrics {
  PhaseMetric setup;
  PhaseMetric commit;
  PhaseMetric open;
  PhaseMetric reconstruct;
};

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

uint32_t ParsePositiveU32(const char* value, const char* flag) {
  try {
    const unsigned long parsed = std::stoul(value);
    if (parsed == 0 || parsed > UINT32_MAX) {
      throw std::out_of_range("out of range");
    }
    return static_cast<uint32_t>(parsed);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string("invalid value for ") + flag + ": " + value);
  }
}

BenchArgs ParseArgs(int argc, char** argv) {
  BenchArgs args;
  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];
    if (flag == "--n" && i + 1 < argc) {
      args.n = ParsePositiveU32(argv[++i], "--n");
    } else if (flag == "--t" && i + 1 < argc) {
      args.t = ParsePositiveU32(argv[++i], "--t");
    } else if (flag == "--iters" && i + 1 < argc) {
      args.iters = ParsePositiveU32(argv[++i], "--iters");
    } else if (flag == "--help") {
      std::cout << "Usage: dkg_bench [--n N] [--t T] [--iters K]\n";
      std::exit(0);
    } else {
      throw std::invalid_argument("unknown argument: " + flag);
    }
  }

  if (args.n < 2) {
    throw std::invalid_argument("--n must be >= 2");
  }
  if (args.t > args.n) {
    throw std::invalid_argument("--t must be <= n");
  }

  return args;
}

std::vector<PartyIndex> BuildParticipants(uint32_t n) {
  std::vector<PartyIndex> out;
  out.reserve(n);
  for (PartyIndex id = 1; id <= n; ++id) {
    out.push_back(id);
  }
  return out;
}

Bytes MakeSessionId(uint32_t iteration) {
  Bytes out(8, 0);
  out[0] = 0x44;
  out[1] = static_cast<uint8_t>((iteration >> 24) & 0xFF);
  out[2] = static_cast<uint8_t>((iteration >> 16) & 0xFF);
  out[3] = static_cast<uint8_t>((iteration >> 8) & 0xFF);
  out[4] = static_cast<uint8_t>(iteration & 0xFF);
  const Bytes salt = tdkg::Csprng::RandomBytes(3);
  out[5] = salt[0];
  out[6] = salt[1];
  out[7] = salt[2];
  return out;
}

uint64_t MeasureEnvelopeBytes(const std::vector<Envelope>& envelopes) {
  uint64_t total = 0;
  for (const Envelope& envelope : envelopes) {
    total += tdkg::EncodeEnvelope(envelope).size();
  }
  return total;
}

void RecordMetric(PhaseMetric* metric,
                  std::chrono::steady_clock::time_point start,
                  std::chrono::steady_clock::time_point end,
                  uint64_t bytes) {
  metric->total_ms += std::chrono::duration<double, std::milli>(end - start).count();
  metric->total_bytes += bytes;
  metric->samples += 1;
}

bool DeliverEnvelope(const Envelope& envelope,
                     std::vector<std::unique_ptr<DkgSession>>* sessions) {
  bool ok = true;
  if (envelope.to == tdkg::kBroadcastPartyId) {
    for (size_t idx = 0; idx < sessions->size(); ++idx) {
      const PartyIndex receiver = static_cast<PartyIndex>(idx + 1);
      if (receiver == envelope.from) {
        continue;
      }
      if (!(*sessions)[idx]->HandleEnvelope(envelope)) {
        ok = false;
      }
    }
    return ok;
  }

  if (envelope.to > sessions->size()) {
    throw std::runtime_error("dkg recipient out of range");
  }
  return (*sessions)[envelope.to - 1]->HandleEnvelope(envelope);
}

void DeliverOrThrow(const std::vector<Envelope>& envelopes,
                    std::vector<std::unique_ptr<DkgSession>>* sessions) {
  for (const Envelope& envelope : envelopes) {
    if (!DeliverEnvelope(envelope, sessions)) {
      throw std::runtime_error("dkg envelope delivery failed");
    }
  }
}

bool AllSessionsInPhase(const std::vector<std::unique_ptr<DkgSession>>& sessions, DkgPhase phase) {
  for (const auto& session : sessions) {
    if (session->phase() != phase) {
      return false;
    }
  }
  return true;
}

void RunDkgRound(const BenchArgs& args, uint32_t iteration, DkgMetrics* metrics) {
  const std::vector<PartyIndex> participants = BuildParticipants(args.n);
  const Bytes session_id = MakeSessionId(iteration);

  std::vector<std::unique_ptr<DkgSession>> sessions;
  {
    const auto start = std::chrono::steady_clock::now();
    sessions.reserve(args.n);
    for (PartyIndex self_id : participants) {
      DkgSessionConfig cfg;
      cfg.session_id = session_id;
      cfg.self_id = self_id;
      cfg.participants = participants;
      cfg.threshold = args.t;
      cfg.timeout = std::chrono::seconds(60);
      sessions.push_back(std::make_unique<DkgSession>(std::move(cfg)));
    }
    const auto end = std::chrono::steady_clock::now();
    RecordMetric(&metrics->setup, start, end, 0);
  }

  {
    const auto start = std::chrono::steady_clock::now();
    std::vector<Envelope> commits;
    commits.reserve(sessions.size());
    for (auto& session : sessions) {
      commits.push_back(session->BuildPhase1CommitEnvelope());
    }
    const uint64_t bytes = MeasureEnvelopeBytes(commits);
    DeliverOrThrow(commits, &sessions);
    Expect(AllSessionsInPhase(sessions, DkgPhase::kOpen), "dkg did not advance to open phase");
    const auto end = std::chrono::steady_clock::now();
    RecordMetric(&metrics->commit, start, end, bytes);
  }

  {
    const auto start = std::chrono::steady_clock::now();
    std::vector<Envelope> opens;
    for (auto& session : sessions) {
      std::vector<Envelope> batch = session->BuildPhase2OpenAndShareEnvelopes();
      opens.insert(opens.end(), batch.begin(), batch.end());
    }
    const uint64_t bytes = MeasureEnvelopeBytes(opens);
    DeliverOrThrow(opens, &sessions);
    const auto end = std::chrono::steady_clock::now();
    RecordMetric(&metrics->open, start, end, bytes);
  }

  for (const auto& session : sessions) {
    Expect(session->status() == SessionStatus::kCompleted, "dkg session did not complete");
    Expect(session->HasResult(), "completed dkg session has no result");
  }

  {
    const auto start = std::chrono::steady_clock::now();
    std::vector<Scalar> indices;
    std::vector<Scalar> shares;
    for (uint32_t i = 0; i < args.t; ++i) {
      indices.push_back(tdkg::IndexScalar(participants[i]));
      shares.push_back(sessions[i]->result().share);
    }
    const Scalar secret = tdkg::Reconstruct(indices, shares, args.t);
    Expect(tdkg::ECPoint::GeneratorMultiply(secret) == sessions.front()->result().public_key,
           "reconstructed secret does not match joint public key");
    const auto end = std::chrono::steady_clock::now();
    RecordMetric(&metrics->reconstruct, start, end, 0);
  }
}

void PrintMetricLine(const std::string& name, const PhaseMetric& metric) {
  const double avg_ms = metric.total_ms / static_cast<double>(metric.samples);
  const double avg_bytes = static_cast<double>(metric.total_bytes) / static_cast<double>(metric.samples);
  std::cout << std::left << std::setw(14) << name << "  "
            << std::right << std::setw(12) << std::fixed << std::setprecision(3) << avg_ms << "  "
            << std::setw(14) << std::fixed << std::setprecision(1) << avg_bytes << '\n';
}

void PrintSummary(const DkgMetrics& metrics) {
  std::cout << "\n[DKG]\n";
  std::cout << std::left << std::setw(14) << "Phase"
            << "  " << std::right << std::setw(12) << "Avg ms"
            << "  " << std::setw(14) << "Avg bytes\n";
  PrintMetricLine("setup", metrics.setup);
  PrintMetricLine("commit", metrics.commit);
  PrintMetricLine("open+share", metrics.open);
  PrintMetricLine("reconstruct", metrics.reconstruct);
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const BenchArgs args = ParseArgs(argc, argv);
    std::cout << "DKG benchmark config: n=" << args.n
              << ", t=" << args.t
              << ", iters=" << args.iters << '\n';

    DkgMetrics metrics;
    for (uint32_t i = 0; i < args.iters; ++i) {
      RunDkgRound(args, i, &metrics);
    }

    PrintSummary(metrics);
  } catch (const std::exception& ex) {
    std::cerr << "benchmark failed: " << ex.what() << '\n';
    return 1;
  }
  return 0;
}
