#ifndef LEDGERPROOF_MERKLE_PROOF_H
#define LEDGERPROOF_MERKLE_PROOF_H

#include "ledger/types.h"
#include "utilities/digest.hpp"
#include <optional>
#include <vector>

namespace ledgerproof {

/**
 * @brief Binary SHA-256 Merkle tree over an ordered leaf list.
 *
 * Parent = SHA-256(left || right). An odd node at any level is paired with
 * itself. A single leaf is its own root and has an empty proof.
 */
class MerkleTree {
public:
  /// Throws std::invalid_argument for an empty leaf list.
  static Digest computeRoot(const std::vector<Digest> &leaves);

  /// Throws std::out_of_range when @p index is not a leaf position.
  static MerkleProof buildProof(const std::vector<Digest> &leaves,
                                uint64_t index);
};

/**
 * @brief Checks inclusion proofs against a trusted root.
 *
 * Never throws. Any structural defect in the proof yields false.
 */
class MerkleProofVerifier {
public:
  /// Deepest proof accepted; leaf indices are 64-bit.
  static constexpr std::size_t MAX_DEPTH = 63;

  static bool verify(const Digest &leaf, const MerkleProof &proof,
                     const Digest &expectedRoot) noexcept;

  /// Root implied by @p proof, or std::nullopt when the proof is malformed.
  static std::optional<Digest> recomputeRoot(const Digest &leaf,
                                             const MerkleProof &proof) noexcept;
};

} // namespace ledgerproof

#endif // LEDGERPROOF_MERKLE_PROOF_H
