#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "quarry/block.h"
#include "quarry/block_index.h"
#include "quarry/block_validator.h"
#include "quarry/checkpoint.h"
#include "quarry/difficulty.h"
#include "quarry/error.h"
#include "quarry/events.h"
#include "quarry/ledger.h"
#include "quarry/mempool.h"
#include "quarry/merkle.h"
#include "quarry/orphan_pool.h"
#include "quarry/pow.h"
#include "quarry/settings.h"
#include "quarry/storage.h"

enum class TipChangeKind {
  kNone,
  kExtended,
  kCompeting,
  kReorg,
  kOrphaned,
};

struct TipChange {
  TipChangeKind kind = TipChangeKind::kNone;
  Bytes tipHash;
  int64_t height = 0;
  Bytes forkPoint;
  size_t disconnected = 0;
  size_t connected = 0;
};

struct BlockTemplate {
  Bytes parentHash;
  int64_t height = 0;
  uint32_t targetBits = 0;
  int64_t timestamp = 0;
  int64_t medianTimePast = 0;
  std::vector<Transaction> transactions;
  Amount fees = 0;
  Amount subsidy = 0;
  // Earliest time the local miner may start on this template.
  int64_t notBefore = 0;
  CancellationToken abort;

  Block Build(const Bytes& pubKeyHash, const std::string& data) const;
};

struct EngineStatus {
  int64_t height = -1;
  Bytes tipHash;
  uint64_t chainWork = 0;
  uint32_t nextTargetBits = 0;
  int64_t medianTimePast = 0;
  size_t knownBlocks = 0;
  size_t tips = 0;
  size_t orphans = 0;
  size_t mempool = 0;
  int64_t latestCheckpoint = -1;
  Amount issued = 0;
  uint64_t stateVersion = 0;
  bool halted = false;
};

int64_t SystemClock();

// Peer name used for blocks produced by the local miner.
inline const char* const kLocalPeer = "local";

// Owns the ledger, mempool, block index, orphan pool and checkpoints. Every
// change to the canonical chain happens under the chain lock; the mempool
// has its own lock, always taken after the chain lock.
class ConsensusEngine {
 public:
  using Clock = std::function<int64_t()>;

  explicit ConsensusEngine(const Settings& s, Clock clock = SystemClock);

  // Loads stored blocks and state from settings.dataDir, or starts from
  // genesis. Must be called once before anything else.
  Error Open();
  bool Flush();

  void AddListener(ConsensusListener* listener);
  void RemoveListener(ConsensusListener* listener);

  Error ApplyExternalBlock(const Block& block, TipChange* change = nullptr,
                           const std::string& peer = "");
  Error SubmitTransaction(const Transaction& tx);
  Error OnBlockReceived(const Bytes& data, const std::string& peer);
  Error OnTransactionReceived(const Bytes& data, const std::string& peer);

  bool GetBlock(const Bytes& hash, Block& out) const;
  bool GetBlockAt(int64_t height, Block& out) const;
  std::vector<BlockHeader> GetHeaders(int64_t fromHeight, size_t count) const;
  Error GetMerkleProof(const Bytes& txid, MerkleProof& out) const;

  Error GetBlockTemplate(BlockTemplate& out);
  Error SubmitMinedBlock(const Block& block, TipChange* change = nullptr);
  // Aborts in-flight mining work and hands out a fresh token.
  void CancelMining();
  // Expires stale orphans and pool entries.
  void Maintain();

  Amount GetBalance(const Bytes& pubKeyHash) const;
  std::vector<UtxoRecord> ListUnspent(const Bytes& pubKeyHash) const;
  uint64_t NextNonce(const Bytes& sender) const;
  MempoolInfo GetMempoolInfo() const;
  bool GetMempoolEntry(const Bytes& txid, MempoolEntry& out) const;
  bool IsTransactionQueued(const Bytes& txid) const;
  EngineStatus GetStatus() const;
  bool CheckSupplyInvariant() const;
  Bytes LedgerDigest() const;
  bool IsHalted() const;

  const Settings& GetSettings() const;
  int64_t Now() const;

 private:
  Settings settings;
  Clock clock;
  mutable std::recursive_mutex chainMutex;

  UtxoLedger ledger;
  Mempool mempool;
  BlockIndex index;
  OrphanPool orphans;
  CheckpointManager checkpoints;
  BlockValidator validator;
  DifficultyAdjuster difficulty;
  BlockStore store;
  ReorgJournal journal;
  bool persistent = false;
  bool halted = false;
  std::unordered_map<std::string, Bytes> txIndex;
  std::vector<ConsensusListener*> listeners;
  CancellationToken miningToken;
  int64_t lastPeerBlockTime = 0;

  Error ProcessBlock(const Block& block, const std::string& peer, TipChange& change);
  Error ValidateAgainstParent(const Block& block);
  Error CheckReorgDepth(const Bytes& parentHash) const;
  Error ConnectTip(const Block& block, TipChange& change);
  Error Reorganize(const Bytes& newTip, TipChange& change);
  bool BuildBranchView(const Bytes& parentHash, UtxoView& view) const;
  void ProcessOrphans(const Bytes& parentHash);
  Error AfterConnect(const Block& block);
  void IndexTransactions(const Block& block, bool connect);

  Error LoadFromStore();
  Error InitGenesis();
  Error Halt(const std::string& what);
  ChainContext Context() const;
  std::vector<BlockHeader> AncestorsOf(const Bytes& hash) const;
  void NotifyTip(const Block& tip);
  void ReportPeer(const std::string& peer, Error error);
  void ReportRejected(const Transaction& tx, Error error);
};
