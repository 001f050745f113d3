#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "quarry/block.h"

struct BlockIndexEntry {
  Bytes hash;
  Bytes prevHash;
  int64_t height = 0;
  uint64_t chainWork = 0;
  BlockHeader header;
  std::vector<std::string> children;
  bool invalid = false;
};

// Arena of every known block keyed by hash. Parent links are hashes, never
// pointers; the active chain is a height-ordered list of hashes.
class BlockIndex {
 public:
  bool Add(const Block& block);
  bool Contains(const Bytes& hash) const;
  const BlockIndexEntry* Find(const Bytes& hash) const;
  const Block* GetBlock(const Bytes& hash) const;
  size_t Size() const;

  void MarkInvalid(const Bytes& hash);
  bool IsInvalid(const Bytes& hash) const;

  static bool IsBetterTip(const BlockIndexEntry& a, const BlockIndexEntry& b);
  const BlockIndexEntry* BestTip() const;
  std::vector<const BlockIndexEntry*> Tips() const;

  const BlockIndexEntry* FindFork(const Bytes& a, const Bytes& b) const;
  const BlockIndexEntry* AncestorAt(const Bytes& hash, int64_t height) const;
  // Up to count headers ending at hash, oldest first.
  std::vector<BlockHeader> Ancestors(const Bytes& hash, size_t count) const;
  // Blocks after ancestor up to and including tip, oldest first.
  std::vector<const Block*> Branch(const Bytes& ancestor, const Bytes& tip) const;

  void SetActiveTip(const Bytes& hash);
  const BlockIndexEntry* ActiveTip() const;
  int64_t ActiveHeight() const;
  const BlockIndexEntry* ActiveAt(int64_t height) const;
  bool IsActive(const Bytes& hash) const;

 private:
  std::unordered_map<std::string, BlockIndexEntry> entries;
  std::unordered_map<std::string, Block> blocks;
  std::unordered_set<std::string> tips;
  std::vector<std::string> active;
};
