#include "quarry/checkpoint.h"

#include <filesystem>
#include <iostream>
#include <system_error>

#include "quarry/crypto.h"
#include "quarry/serialize.h"
#include "quarry/settings.h"
#include "quarry/storage.h"

static const char* kCheckpointSuffix = ".chk";

Bytes Checkpoint::ComputeIntegrity() const {
  ByteWriter w;
  w.WriteI64(height);
  w.WriteBytes(blockHash);
  w.WriteBytes(utxoDigest);
  w.WriteI64(issued);
  w.WriteI64(createdAt);
  w.WriteBytes(Sha256(snapshot));
  return DoubleSha256(w.data);
}

Bytes Checkpoint::Serialize() const {
  ByteWriter w;
  w.WriteI64(height);
  w.WriteBytes(blockHash);
  w.WriteBytes(utxoDigest);
  w.WriteI64(issued);
  w.WriteI64(createdAt);
  w.WriteBytes(snapshot);
  w.WriteBytes(integrity);
  return w.data;
}

bool Checkpoint::Deserialize(const Bytes& data, Checkpoint& out) {
  ByteReader r{data};
  Checkpoint c;
  if (!r.ReadI64(c.height) || !r.ReadBytes(c.blockHash, kHashSize) ||
      !r.ReadBytes(c.utxoDigest, kHashSize) || !r.ReadI64(c.issued) ||
      !r.ReadI64(c.createdAt) || !r.ReadBytes(c.snapshot) ||
      !r.ReadBytes(c.integrity, kHashSize) || !r.AtEnd()) {
    return false;
  }
  out = std::move(c);
  return true;
}

CheckpointManager::CheckpointManager(const Settings& s) : settings(s) {}

bool CheckpointManager::Open(const std::string& dataDir) {
  checkpoints.clear();
  if (dataDir.empty()) {
    dir.clear();
    return true;
  }
  dir = JoinPath(dataDir, "checkpoints");
  if (!EnsureDirectory(dir)) {
    return false;
  }
  std::error_code ec;
  for (const auto& file : std::filesystem::directory_iterator(dir, ec)) {
    if (file.path().extension() != kCheckpointSuffix) {
      continue;
    }
    Bytes data;
    if (!ReadFileBytes(file.path().string(), data)) {
      return false;
    }
    Checkpoint c;
    if (!Checkpoint::Deserialize(data, c) || !Verify(c)) {
      std::cerr << "Ignoring corrupt checkpoint " << file.path().string() << "\n";
      continue;
    }
    checkpoints[c.height] = std::move(c);
  }
  return !ec;
}

bool CheckpointManager::MaybeCreate(const Block& block, const UtxoLedger& ledger,
                                    int64_t now, bool* created) {
  if (created) {
    *created = false;
  }
  Checkpoint c;
  if (!Prepare(block, ledger, now, c)) {
    return true;
  }
  if (!Commit(std::move(c))) {
    return false;
  }
  if (created) {
    *created = true;
  }
  return true;
}

bool CheckpointManager::Prepare(const Block& block, const UtxoLedger& ledger,
                                int64_t now, Checkpoint& out) const {
  if (settings.checkpointInterval <= 0 || block.height == 0 ||
      block.height % settings.checkpointInterval != 0) {
    return false;
  }
  if (ledger.TipHash() != block.hash) {
    return false;
  }
  const Checkpoint* existing = Get(block.height);
  if (existing && existing->blockHash == block.hash) {
    return false;
  }
  Checkpoint c;
  c.height = block.height;
  c.blockHash = block.hash;
  c.snapshot = ledger.Serialize(false);
  c.utxoDigest = DoubleSha256(c.snapshot);
  c.issued = ledger.Issued();
  c.createdAt = now;
  c.integrity = c.ComputeIntegrity();
  out = std::move(c);
  return true;
}

bool CheckpointManager::Commit(Checkpoint checkpoint) {
  if (!dir.empty() && !WriteFileBytes(PathFor(checkpoint.height), checkpoint.Serialize())) {
    return false;
  }
  std::cout << "Checkpoint at height " << checkpoint.height << " "
            << BytesToHex(checkpoint.blockHash) << "\n";
  int64_t height = checkpoint.height;
  checkpoints[height] = std::move(checkpoint);
  return Prune();
}

void CheckpointManager::DropAbove(int64_t height) {
  for (auto it = checkpoints.upper_bound(height); it != checkpoints.end();) {
    if (!dir.empty()) {
      RemoveFile(PathFor(it->first));
    }
    it = checkpoints.erase(it);
  }
}

int64_t CheckpointManager::LatestHeight() const {
  if (checkpoints.empty()) {
    return -1;
  }
  return checkpoints.rbegin()->first;
}

const Checkpoint* CheckpointManager::Latest() const {
  if (checkpoints.empty()) {
    return nullptr;
  }
  return &checkpoints.rbegin()->second;
}

const Checkpoint* CheckpointManager::Get(int64_t height) const {
  auto it = checkpoints.find(height);
  return it == checkpoints.end() ? nullptr : &it->second;
}

const Checkpoint* CheckpointManager::AnchorFor(int64_t height) const {
  auto it = checkpoints.upper_bound(height);
  if (it == checkpoints.begin()) {
    return nullptr;
  }
  --it;
  return &it->second;
}

std::vector<int64_t> CheckpointManager::Heights() const {
  std::vector<int64_t> out;
  for (const auto& [height, c] : checkpoints) {
    out.push_back(height);
  }
  return out;
}

bool CheckpointManager::Verify(const Checkpoint& checkpoint) const {
  if (checkpoint.integrity != checkpoint.ComputeIntegrity()) {
    return false;
  }
  if (checkpoint.utxoDigest != DoubleSha256(checkpoint.snapshot)) {
    return false;
  }
  auto trusted = settings.trustedCheckpoints.find(checkpoint.height);
  if (trusted != settings.trustedCheckpoints.end() &&
      trusted->second != BytesToHex(checkpoint.blockHash)) {
    return false;
  }
  return true;
}

bool CheckpointManager::Restore(const Checkpoint& checkpoint, UtxoLedger& ledger) const {
  if (!Verify(checkpoint)) {
    return false;
  }
  UtxoLedger restored;
  restored.undoRetention = ledger.undoRetention;
  if (!UtxoLedger::Deserialize(checkpoint.snapshot, restored)) {
    return false;
  }
  if (restored.TipHash() != checkpoint.blockHash ||
      restored.Height() != checkpoint.height) {
    return false;
  }
  ledger = std::move(restored);
  return true;
}

bool CheckpointManager::BuildMerkleProof(const Block& block, const Bytes& txid,
                                         MerkleProof& out) const {
  std::vector<Bytes> ids = block.TransactionIds();
  size_t index = ids.size();
  for (size_t i = 0; i < ids.size(); ++i) {
    if (ids[i] == txid) {
      index = i;
      break;
    }
  }
  if (index == ids.size()) {
    return false;
  }
  MerkleProof proof;
  proof.txid = txid;
  proof.blockHash = block.hash;
  proof.height = block.height;
  proof.merkleRoot = block.merkleRoot;
  if (!BuildMerkleBranch(ids, index, proof.path)) {
    return false;
  }
  if (const Checkpoint* anchor = AnchorFor(block.height)) {
    proof.checkpointHeight = anchor->height;
    proof.checkpointHash = anchor->blockHash;
  }
  out = std::move(proof);
  return true;
}

std::string CheckpointManager::PathFor(int64_t height) const {
  return JoinPath(dir, std::to_string(height) + kCheckpointSuffix);
}

bool CheckpointManager::Prune() {
  while (checkpoints.size() > settings.checkpointRetention) {
    auto oldest = checkpoints.begin();
    if (!dir.empty() && !RemoveFile(PathFor(oldest->first))) {
      return false;
    }
    checkpoints.erase(oldest);
  }
  return true;
}
