#include "quarry/merkle.h"

#include "quarry/crypto.h"

Bytes ComputeMerkleRoot(const std::vector<Bytes>& leaves) {
  if (leaves.empty()) {
    return Bytes{};
  }
  std::vector<Bytes> level = leaves;
  while (level.size() > 1) {
    if (level.size() % 2 == 1) {
      level.push_back(level.back());
    }
    std::vector<Bytes> next;
    next.reserve(level.size() / 2);
    for (size_t i = 0; i < level.size(); i += 2) {
      next.push_back(HashPair(level[i], level[i + 1]));
    }
    level.swap(next);
  }
  return level.front();
}

bool BuildMerkleBranch(const std::vector<Bytes>& leaves, size_t index,
                       std::vector<MerkleStep>& out) {
  if (index >= leaves.size()) {
    return false;
  }
  out.clear();
  std::vector<Bytes> level = leaves;
  size_t pos = index;
  while (level.size() > 1) {
    if (level.size() % 2 == 1) {
      level.push_back(level.back());
    }
    MerkleStep step;
    if (pos % 2 == 0) {
      step.sibling = level[pos + 1];
      step.siblingOnLeft = false;
    } else {
      step.sibling = level[pos - 1];
      step.siblingOnLeft = true;
    }
    out.push_back(step);

    std::vector<Bytes> next;
    next.reserve(level.size() / 2);
    for (size_t i = 0; i < level.size(); i += 2) {
      next.push_back(HashPair(level[i], level[i + 1]));
    }
    level.swap(next);
    pos /= 2;
  }
  return true;
}

Bytes MerkleRootFromBranch(const Bytes& leaf, const std::vector<MerkleStep>& path) {
  Bytes node = leaf;
  for (const auto& step : path) {
    node = step.siblingOnLeft ? HashPair(step.sibling, node)
                              : HashPair(node, step.sibling);
  }
  return node;
}

bool VerifyMerkleProof(const MerkleProof& proof) {
  if (proof.txid.empty() || proof.merkleRoot.empty()) {
    return false;
  }
  return MerkleRootFromBranch(proof.txid, proof.path) == proof.merkleRoot;
}
