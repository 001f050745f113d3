#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "quarry/block.h"
#include "quarry/error.h"
#include "quarry/transaction.h"
#include "quarry/tx_validator.h"
#include "quarry/utxo_view.h"

struct Settings;

// The chain state a transaction is validated against.
struct ChainContext {
  int64_t height = 0;  // height of the next block
  Bytes tipHash;
  uint64_t stateVersion = 0;
};

struct MempoolEntry {
  Transaction tx;
  std::string txid;
  std::string sender;
  bool hasNonce = false;
  uint64_t nonce = 0;
  Amount fee = 0;
  size_t size = 0;
  Amount feeRate = 0;
  int64_t time = 0;
  uint64_t sequence = 0;
  int64_t validHeight = 0;
  Bytes validTip;
  uint64_t validVersion = 0;
  std::vector<std::string> inputs;
};

struct MempoolInfo {
  size_t count = 0;
  size_t bytes = 0;
  size_t futureCount = 0;
  Amount minFeeRate = 0;
  Amount medianFeeRate = 0;
  Amount maxFeeRate = 0;
  Amount totalFees = 0;
  size_t bannedSenders = 0;
  uint64_t accepted = 0;
  uint64_t rejected = 0;
  uint64_t evicted = 0;
  uint64_t expired = 0;
  uint64_t replaced = 0;
  uint64_t promoted = 0;
};

struct BlockSelection {
  std::vector<Transaction> transactions;
  Amount fees = 0;
  size_t bytes = 0;
};

class Mempool {
 public:
  explicit Mempool(const Settings& s);

  // Admits tx against ledger plus the pending pool. Returns kOk when pooled,
  // kFutureNonce when queued behind a nonce gap, otherwise the rejection.
  Error Add(const Transaction& tx, const UtxoSource& ledger, const ChainContext& ctx,
            int64_t now);
  bool Remove(const Bytes& txid);
  void OnBlockConnected(const Block& block, const UtxoSource& ledger,
                        const ChainContext& ctx, int64_t now);
  // Re-admits transactions from disconnected blocks, then revalidates the pool.
  size_t Reinject(const std::vector<Transaction>& txs, const UtxoSource& ledger,
                  const ChainContext& ctx, int64_t now);
  BlockSelection SelectForBlock(const UtxoSource& ledger, const ChainContext& ctx,
                                size_t maxBytes) const;
  size_t Expire(int64_t now);

  bool Get(const Bytes& txid, MempoolEntry& out) const;
  bool Contains(const Bytes& txid) const;
  bool IsQueued(const Bytes& txid) const;
  bool IsBanned(const Bytes& sender, int64_t now) const;
  size_t Size() const;
  size_t TotalBytes() const;
  size_t FutureCount() const;
  std::vector<MempoolEntry> Entries() const;
  MempoolInfo Info(int64_t now) const;

 private:
  struct FeeKey {
    Amount feeRate = 0;
    uint64_t sequence = 0;
    std::string txid;

    bool operator<(const FeeKey& other) const;
  };

  struct SenderRecord {
    std::deque<int64_t> invalidTimes;
    int64_t bannedUntil = 0;
  };

  struct FutureEntry {
    Transaction tx;
    int64_t time = 0;
  };

  const Settings& settings;
  TxValidator validator;
  mutable std::mutex mutex;

  std::unordered_map<std::string, MempoolEntry> entries;
  std::set<FeeKey> byFee;
  std::unordered_map<std::string, std::string> spentBy;
  std::unordered_map<std::string, std::map<uint64_t, std::string>> senderNonces;
  std::unordered_map<std::string, size_t> senderCount;
  std::unordered_map<std::string, std::map<uint64_t, FutureEntry>> future;
  std::unordered_map<std::string, SenderRecord> senders;
  size_t totalBytes = 0;
  size_t futureCount = 0;
  uint64_t nextSequence = 0;

  uint64_t accepted = 0;
  uint64_t rejected = 0;
  uint64_t evicted = 0;
  uint64_t expired = 0;
  uint64_t replaced = 0;
  uint64_t promoted = 0;

  Error AddLocked(const Transaction& tx, const UtxoSource& ledger,
                  const ChainContext& ctx, int64_t now, bool untrusted,
                  int64_t entryTime);
  Error QueueFuture(const Transaction& tx, const std::string& sender, int64_t now);
  void PromoteFuture(const std::string& sender, const UtxoSource& ledger,
                     const ChainContext& ctx, int64_t now);
  void PromoteAll(const UtxoSource& ledger, const ChainContext& ctx, int64_t now);
  void RevalidateLocked(std::vector<Transaction> extra, const UtxoSource& ledger,
                        const ChainContext& ctx, int64_t now);

  uint64_t ExpectedNonce(const std::string& sender, const Bytes& senderBytes,
                         const UtxoSource& ledger,
                         const std::unordered_set<std::string>& excluded) const;
  std::vector<std::string> WithDependents(const std::string& txid) const;
  void Insert(MempoolEntry entry);
  void Erase(const std::string& txid);
  void EraseWithDependents(const std::string& txid, uint64_t& counter);
  size_t ExpireLocked(int64_t now);
  void RecordInvalid(const std::string& sender, int64_t now);
  bool IsBannedLocked(const std::string& sender, int64_t now) const;
};
