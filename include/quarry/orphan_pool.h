#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "quarry/block.h"
#include "quarry/error.h"

struct Settings;

struct OrphanEntry {
  Block block;
  std::string peer;
  int64_t received = 0;
};

// Blocks waiting for their parent, indexed by their parent's hash.
class OrphanPool {
 public:
  explicit OrphanPool(const Settings& s);

  // kOrphanBlock when stored; kDuplicateBlock if already held. A full pool
  // drops its oldest entry to make room.
  Error Add(const Block& block, const std::string& peer, int64_t now);
  std::vector<OrphanEntry> TakeChildren(const Bytes& parentHash);
  std::vector<OrphanEntry> Expire(int64_t now);

  // True if this hash expired here before; a peer that keeps sending it is
  // feeding blocks that never connect.
  bool WasExpired(const Bytes& hash) const;
  bool Contains(const Bytes& hash) const;
  size_t Size() const;
  uint64_t Evicted() const;

 private:
  const Settings& settings;
  std::unordered_map<std::string, OrphanEntry> orphans;
  std::unordered_map<std::string, std::vector<std::string>> byParent;
  std::unordered_map<std::string, int64_t> expired;
  uint64_t evicted = 0;

  void Erase(const std::string& key);
};
