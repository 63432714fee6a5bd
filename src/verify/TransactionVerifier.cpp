#include "verify/TransactionVerifier.h"
#include "hashing/canonical_hasher.h"
#include "ledger/errors.h"
#include "merkle/merkle_proof.h"
#include "search/HintResolver.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include <limits>
#include <stdexcept>

namespace ledgerproof {

struct TransactionVerifier::Progress {
  State state = State::Start;
  std::optional<Digest> digest;
  std::vector<std::string> candidates;
  bool searchIncomplete = false;
  std::optional<std::string> batchId;
};

namespace {

std::optional<uint64_t> findLeaf(const BatchContents &contents,
                                 const Digest &digest,
                                 const std::optional<OperationKind> &op) {
  for (std::size_t i = 0; i < contents.leaves.size(); ++i) {
    const BatchLeaf &leaf = contents.leaves[i];
    if (leaf.digest != digest)
      continue;
    if (op && leaf.operation && *leaf.operation != *op)
      continue;
    return static_cast<uint64_t>(i);
  }
  return std::nullopt;
}

} // namespace

TransactionVerifier::TransactionVerifier(const CandidateSearch &search,
                                         StorageClient &storage,
                                         RetryPolicy &retry, Options opts)
    : search_(search), storage_(storage), retry_(retry), opts_(std::move(opts)) {
  if (opts_.tieMargin < 0.0)
    opts_.tieMargin = 0.0;
}

const char *TransactionVerifier::stateName(State s) {
  switch (s) {
  case State::Start:
    return "Start";
  case State::HintsResolved:
    return "HintsResolved";
  case State::CandidatesFound:
    return "CandidatesFound";
  case State::BatchFetched:
    return "BatchFetched";
  case State::ProofChecked:
    return "ProofChecked";
  case State::Done:
    return "Done";
  }
  return "Unknown";
}

void TransactionVerifier::advance(Progress &p, State next) const {
  if (next <= p.state) {
    throw std::logic_error(std::string("illegal verifier transition ") +
                           stateName(p.state) + " -> " + stateName(next));
  }
  p.state = next;
  if (opts_.onTransition)
    opts_.onTransition(next);
}

VerificationVerdict TransactionVerifier::errorVerdict(const Progress &p,
                                                      std::string reason,
                                                      bool retryable,
                                                      bool cancelled) const {
  VerificationVerdict v;
  v.kind = VerdictKind::Error;
  v.leafDigest = p.digest;
  v.candidates = p.candidates;
  v.searchIncomplete = p.searchIncomplete;
  v.batchId = p.batchId;
  v.reason = std::move(reason);
  v.retryable = retryable;
  v.cancelled = cancelled;
  return v;
}

VerificationVerdict
TransactionVerifier::verify(const TransactionRecord &record,
                            const VerificationHint &hint,
                            const CancellationToken &cancel) const {
  return verify(record, hint, cancel, opts_.timeout);
}

VerificationVerdict
TransactionVerifier::verify(const TransactionRecord &record,
                            const VerificationHint &hint,
                            const CancellationToken &cancel,
                            std::chrono::milliseconds timeout) const {
  const auto started = std::chrono::steady_clock::now();
  ResolvedConstraint constraint =
      HintResolver::merge(HintResolver::resolve(hint), record);

  Progress p;
  advance(p, State::HintsResolved);

  CancellationSource source(cancel);
  source.setTimeout(timeout);
  const CancellationToken token = source.token();

  VerificationVerdict verdict;
  try {
    verdict = run(record, constraint, token, p);
  } catch (const Cancelled &) {
    verdict = errorVerdict(p, "cancelled", true, true);
  } catch (const CollaboratorError &e) {
    if (token.cancelled()) {
      verdict = errorVerdict(p, "cancelled", true, true);
    } else {
      bool transient = dynamic_cast<const TransientCollaboratorError *>(&e);
      verdict = errorVerdict(p, e.what(), transient, false);
    }
  } catch (const EncodingError &e) {
    verdict = errorVerdict(p, e.what(), false, false);
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, "Verification failed internally",
                              {{"error", e.what()}});
    verdict = errorVerdict(p, std::string("internal error: ") + e.what(), false,
                           false);
  }
  if (p.state != State::Done)
    advance(p, State::Done);

  verdict.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  const std::string outcome = toString(verdict.kind);
  MetricsRegistry::instance().incrementCounter("ledgerproof_verdicts_total", 1.0,
                                               {{"outcome", outcome}});
  MetricsRegistry::instance().observe(
      "ledgerproof_verification_ms",
      static_cast<double>(verdict.elapsed.count()));

  nlohmann::json fields = {{"outcome", outcome},
                           {"reason", verdict.reason},
                           {"candidates", verdict.candidates.size()},
                           {"elapsed_ms", verdict.elapsed.count()}};
  if (verdict.batchId)
    fields["batch_id"] = *verdict.batchId;
  Logger::getInstance().log(verdict.kind == VerdictKind::Error ? LogLevel::WARN
                                                               : LogLevel::INFO,
                            "Verification finished", fields);
  return verdict;
}

VerificationVerdict
TransactionVerifier::run(const TransactionRecord &record,
                         const ResolvedConstraint &constraint,
                         const CancellationToken &token, Progress &p) const {
  const Digest digest = CanonicalHasher::digest(record);
  p.digest = digest;

  SearchResult found = search_.search(constraint, token);
  p.candidates = found.ids();
  p.searchIncomplete = found.possiblyIncomplete;
  advance(p, State::CandidatesFound);

  VerificationVerdict v;
  v.leafDigest = digest;
  v.candidates = p.candidates;
  v.searchIncomplete = p.searchIncomplete;

  if (found.candidates.empty()) {
    v.kind = VerdictKind::NotFound;
    v.reason = "no candidate batches matched the search constraint";
    advance(p, State::Done);
    return v;
  }

  struct Match {
    const ScoredCandidate *candidate;
    BatchContents contents;
    uint64_t index;
  };
  std::vector<Match> matches;
  double best = -std::numeric_limits<double>::infinity();
  std::size_t examined = 0;

  for (const auto &cand : found.candidates) {
    if (!matches.empty() && cand.score < best - opts_.tieMargin)
      break;
    token.throwIfCancelled("candidate walk");
    if (cand.descriptor.transactionCount == 0)
      continue;
    BatchContents contents =
        retry_.run("fetch_batch_contents", token, [&] {
          return storage_.fetchBatchContents(cand.descriptor.storageRef, token);
        });
    ++examined;
    if (auto index = findLeaf(contents, digest, constraint.operation)) {
      if (matches.empty())
        best = cand.score;
      matches.push_back({&cand, std::move(contents), *index});
    }
  }
  if (examined > 0)
    advance(p, State::BatchFetched);

  if (matches.empty()) {
    v.kind = VerdictKind::NotFound;
    v.reason = "no leaf matching digest " + toHex(digest) + " in " +
               std::to_string(examined) + " candidate batch(es)";
    if (found.possiblyIncomplete)
      v.reason += "; search was truncated, narrow the hints";
    advance(p, State::Done);
    return v;
  }

  if (matches.size() > 1 && !constraint.batchId) {
    v.kind = VerdictKind::Ambiguous;
    v.candidates.clear();
    for (const auto &m : matches)
      v.candidates.push_back(m.candidate->descriptor.batchId);
    v.reason = std::to_string(matches.size()) +
               " batches contain a matching leaf with equal relevance; supply "
               "batch_id or narrow the time range";
    advance(p, State::Done);
    return v;
  }

  const Match &chosen = matches.front();
  const BatchDescriptor &batch = chosen.candidate->descriptor;
  p.batchId = batch.batchId;

  MerkleProof proof;
  auto stored = chosen.contents.proofs.find(chosen.index);
  if (stored != chosen.contents.proofs.end()) {
    proof = stored->second;
  } else {
    std::vector<Digest> leaves;
    leaves.reserve(chosen.contents.leaves.size());
    for (const auto &leaf : chosen.contents.leaves)
      leaves.push_back(leaf.digest);
    proof = MerkleTree::buildProof(leaves, chosen.index);
  }
  const bool ok = MerkleProofVerifier::verify(digest, proof, batch.merkleRoot);
  advance(p, State::ProofChecked);

  v.kind = ok ? VerdictKind::Verified : VerdictKind::Tampered;
  v.batchId = batch.batchId;
  v.expectedRoot = batch.merkleRoot;
  v.proof = std::move(proof);
  v.position = chosen.index;
  v.operation = chosen.contents.leaves[chosen.index].operation
                    ? chosen.contents.leaves[chosen.index].operation
                    : constraint.operation;
  v.blockchainTimestamp = batch.createdAt;
  v.reason = ok ? "leaf " + std::to_string(chosen.index) + " of " +
                      batch.batchId + " reproduces the anchored root"
                : "leaf present in " + batch.batchId +
                      " but its proof does not reproduce the anchored root";
  if (!ok) {
    Logger::getInstance().log(LogLevel::WARN, "Tampering detected",
                              {{"batch_id", batch.batchId},
                               {"leaf_index", chosen.index},
                               {"digest", toHex(digest)}});
  }
  advance(p, State::Done);
  return v;
}

} // namespace ledgerproof
