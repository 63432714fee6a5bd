#include "merkle/merkle_proof.h"
#include "utilities/hash_stream.hpp"
#include <exception>
#include <stdexcept>

namespace ledgerproof {

namespace {

std::vector<Digest> nextLevel(const std::vector<Digest> &level) {
  std::vector<Digest> parents;
  parents.reserve((level.size() + 1) / 2);
  for (std::size_t i = 0; i < level.size(); i += 2) {
    const Digest &left = level[i];
    const Digest &right = i + 1 < level.size() ? level[i + 1] : level[i];
    parents.push_back(HashStream::combine(left.data(), right.data()));
  }
  return parents;
}

} // namespace

Digest MerkleTree::computeRoot(const std::vector<Digest> &leaves) {
  if (leaves.empty())
    throw std::invalid_argument("cannot build a Merkle tree with no leaves");
  std::vector<Digest> level = leaves;
  while (level.size() > 1)
    level = nextLevel(level);
  return level.front();
}

MerkleProof MerkleTree::buildProof(const std::vector<Digest> &leaves,
                                   uint64_t index) {
  if (index >= leaves.size())
    throw std::out_of_range("leaf index " + std::to_string(index) +
                            " outside tree of " +
                            std::to_string(leaves.size()) + " leaves");
  MerkleProof proof;
  proof.leafIndex = index;
  std::vector<Digest> level = leaves;
  uint64_t pos = index;
  while (level.size() > 1) {
    ProofStep step;
    if (pos % 2 == 0) {
      const Digest &sib = pos + 1 < level.size() ? level[pos + 1] : level[pos];
      step.sibling.assign(sib.begin(), sib.end());
      step.side = ProofSide::Right;
    } else {
      step.sibling.assign(level[pos - 1].begin(), level[pos - 1].end());
      step.side = ProofSide::Left;
    }
    proof.steps.push_back(std::move(step));
    level = nextLevel(level);
    pos /= 2;
  }
  return proof;
}

std::optional<Digest>
MerkleProofVerifier::recomputeRoot(const Digest &leaf,
                                   const MerkleProof &proof) noexcept {
  const auto depth = proof.steps.size();
  if (depth > MAX_DEPTH)
    return std::nullopt;
  if (depth == 0)
    return proof.leafIndex == 0 ? std::optional<Digest>(leaf) : std::nullopt;
  // The index must fit in the tree the proof describes.
  if ((proof.leafIndex >> depth) != 0)
    return std::nullopt;

  try {
    Digest running = leaf;
    for (std::size_t k = 0; k < depth; ++k) {
      const ProofStep &step = proof.steps[k];
      if (step.sibling.size() != DIGEST_SIZE)
        return std::nullopt;
      bool indexSaysLeft = ((proof.leafIndex >> k) & 1U) != 0;
      bool siblingLeft = step.side == ProofSide::Left;
      if (indexSaysLeft != siblingLeft)
        return std::nullopt;
      running = siblingLeft
                    ? HashStream::combine(step.sibling.data(), running.data())
                    : HashStream::combine(running.data(), step.sibling.data());
    }
    return running;
  } catch (const std::exception &) {
    // libsodium initialisation failure; treat as unverifiable.
    return std::nullopt;
  }
}

bool MerkleProofVerifier::verify(const Digest &leaf, const MerkleProof &proof,
                                 const Digest &expectedRoot) noexcept {
  auto root = recomputeRoot(leaf, proof);
  if (!root)
    return false;
  try {
    return constantTimeEquals(*root, expectedRoot);
  } catch (const std::exception &) {
    return false;
  }
}

} // namespace ledgerproof
