#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "quarry/block.h"
#include "quarry/error.h"
#include "quarry/utxo_view.h"

// Authoritative UTXO set of the canonical chain. Blocks are applied and
// reverted strictly at the tip; undo data for the newest blocks is retained.
class UtxoLedger : public UtxoSource {
 public:
  size_t undoRetention = 128;

  bool GetUnspent(const Outpoint& outpoint, UtxoEntry& out) const override;
  uint64_t NextNonce(const Bytes& sender) const override;
  Amount Issued() const override;

  Error ApplyBlock(const Block& block, LedgerDelta& delta);
  Error RevertBlock(const Block& block);
  const LedgerDelta* Undo(const Bytes& blockHash) const;

  Amount GetBalance(const Bytes& pubKeyHash) const;
  std::vector<UtxoRecord> ListUnspent(const Bytes& pubKeyHash) const;
  bool SumUnspent(Amount& out) const;
  size_t Size() const;
  uint64_t StateVersion() const;
  const Bytes& TipHash() const;
  int64_t Height() const;
  Bytes Digest() const;

  Bytes Serialize(bool withUndo) const;
  static bool Deserialize(const Bytes& data, UtxoLedger& out);
  void Reset();

 private:
  std::map<std::string, UtxoRecord> utxos;
  std::map<std::string, uint64_t> nonces;
  Amount issued = 0;
  uint64_t stateVersion = 0;
  Bytes tipHash;
  int64_t height = -1;
  std::unordered_map<std::string, LedgerDelta> undo;
  std::deque<std::string> undoOrder;

  void Commit(const UtxoView& view);
  void RememberUndo(const LedgerDelta& delta);
};
