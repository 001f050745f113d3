#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "quarry/error.h"
#include "quarry/transaction.h"
#include "quarry/types.h"

struct Block;

struct UtxoEntry {
  TXOutput output;
  int64_t height = 0;
  bool coinbase = false;
};

struct UtxoRecord {
  Outpoint outpoint;
  UtxoEntry entry;
};

// Everything needed to undo one connected block.
struct LedgerDelta {
  Bytes blockHash;
  int64_t height = 0;
  std::vector<UtxoRecord> spent;
  std::vector<Outpoint> created;
  std::map<std::string, uint64_t> previousNonces;
  Amount issuedBefore = 0;
  Amount minted = 0;
  Amount fees = 0;
};

class UtxoSource {
 public:
  virtual ~UtxoSource() = default;

  virtual bool GetUnspent(const Outpoint& outpoint, UtxoEntry& out) const = 0;
  virtual uint64_t NextNonce(const Bytes& sender) const = 0;
  virtual Amount Issued() const = 0;
};

// Copy-on-write overlay. Reads fall through to the base unless the outpoint
// was added or spent in this view. The base must outlive the view.
class UtxoView : public UtxoSource {
 public:
  struct Change {
    Outpoint outpoint;
    UtxoEntry entry;
    bool spent = false;
  };

  explicit UtxoView(const UtxoSource& base);

  bool GetUnspent(const Outpoint& outpoint, UtxoEntry& out) const override;
  uint64_t NextNonce(const Bytes& sender) const override;
  Amount Issued() const override;

  bool Spend(const Outpoint& outpoint, UtxoEntry* spent = nullptr);
  void Add(const Outpoint& outpoint, const UtxoEntry& entry);
  bool Remove(const Outpoint& outpoint);
  void SetNextNonce(const Bytes& sender, uint64_t next);
  void SetIssued(Amount issued);

  // Spends inputs, creates outputs and advances the sender nonce. Checks only
  // what the ledger itself must guarantee: existence and amount arithmetic.
  Error ApplyTransaction(const Transaction& tx, int64_t height, Amount& fee,
                         LedgerDelta* delta = nullptr);
  Error ApplyBlock(const Block& block, LedgerDelta& delta);
  Error UndoBlock(const LedgerDelta& delta);

  const std::unordered_map<std::string, Change>& Changes() const;
  const std::unordered_map<std::string, uint64_t>& NonceChanges() const;
  bool IssuedChanged() const;

 private:
  const UtxoSource& base;
  std::unordered_map<std::string, Change> changes;
  std::unordered_map<std::string, uint64_t> nonces;
  std::optional<Amount> issued;
};
