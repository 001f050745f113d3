#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "quarry/types.h"

struct MerkleStep {
  Bytes sibling;
  bool siblingOnLeft = false;
};

// Inclusion proof of a transaction id in a block, optionally anchored to the
// newest checkpoint at or below the block.
struct MerkleProof {
  Bytes txid;
  Bytes blockHash;
  int64_t height = 0;
  Bytes merkleRoot;
  std::vector<MerkleStep> path;
  int64_t checkpointHeight = -1;
  Bytes checkpointHash;
};

Bytes ComputeMerkleRoot(const std::vector<Bytes>& leaves);
bool BuildMerkleBranch(const std::vector<Bytes>& leaves, size_t index,
                       std::vector<MerkleStep>& out);
Bytes MerkleRootFromBranch(const Bytes& leaf, const std::vector<MerkleStep>& path);
bool VerifyMerkleProof(const MerkleProof& proof);
