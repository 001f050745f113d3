#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "quarry/block.h"
#include "quarry/ledger.h"
#include "quarry/merkle.h"

struct Settings;

struct Checkpoint {
  int64_t height = 0;
  Bytes blockHash;
  Bytes utxoDigest;
  Bytes snapshot;
  Amount issued = 0;
  int64_t createdAt = 0;
  Bytes integrity;

  Bytes ComputeIntegrity() const;
  Bytes Serialize() const;
  static bool Deserialize(const Bytes& data, Checkpoint& out);
};

class CheckpointManager {
 public:
  explicit CheckpointManager(const Settings& s);

  // An empty dataDir keeps checkpoints in memory only.
  bool Open(const std::string& dataDir);

  // Records a checkpoint when block sits on an interval boundary. Returns
  // false only on a storage failure.
  bool MaybeCreate(const Block& block, const UtxoLedger& ledger, int64_t now,
                   bool* created = nullptr);
  // Split form of MaybeCreate for callers that must snapshot the ledger before
  // they know the block will stay connected. Prepare requires the ledger tip
  // to be block.
  bool Prepare(const Block& block, const UtxoLedger& ledger, int64_t now,
               Checkpoint& out) const;
  bool Commit(Checkpoint checkpoint);
  // Drops checkpoints above height, used when the blocks they cover are no
  // longer canonical.
  void DropAbove(int64_t height);

  int64_t LatestHeight() const;
  const Checkpoint* Latest() const;
  const Checkpoint* Get(int64_t height) const;
  // Newest checkpoint at or below height.
  const Checkpoint* AnchorFor(int64_t height) const;
  std::vector<int64_t> Heights() const;

  bool Verify(const Checkpoint& checkpoint) const;
  bool Restore(const Checkpoint& checkpoint, UtxoLedger& ledger) const;
  bool BuildMerkleProof(const Block& block, const Bytes& txid, MerkleProof& out) const;

 private:
  const Settings& settings;
  std::string dir;
  std::map<int64_t, Checkpoint> checkpoints;

  std::string PathFor(int64_t height) const;
  bool Prune();
};
