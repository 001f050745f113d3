#include "quarry/utxo_view.h"

#include "quarry/block.h"
#include "quarry/crypto.h"

UtxoView::UtxoView(const UtxoSource& base_) : base(base_) {}

bool UtxoView::GetUnspent(const Outpoint& outpoint, UtxoEntry& out) const {
  auto it = changes.find(outpoint.Key());
  if (it != changes.end()) {
    if (it->second.spent) {
      return false;
    }
    out = it->second.entry;
    return true;
  }
  return base.GetUnspent(outpoint, out);
}

uint64_t UtxoView::NextNonce(const Bytes& sender) const {
  auto it = nonces.find(BytesToHex(sender));
  if (it != nonces.end()) {
    return it->second;
  }
  return base.NextNonce(sender);
}

Amount UtxoView::Issued() const {
  return issued ? *issued : base.Issued();
}

bool UtxoView::Spend(const Outpoint& outpoint, UtxoEntry* spent) {
  UtxoEntry entry;
  if (!GetUnspent(outpoint, entry)) {
    return false;
  }
  if (spent) {
    *spent = entry;
  }
  Change& c = changes[outpoint.Key()];
  c.outpoint = outpoint;
  c.entry = entry;
  c.spent = true;
  return true;
}

void UtxoView::Add(const Outpoint& outpoint, const UtxoEntry& entry) {
  Change& c = changes[outpoint.Key()];
  c.outpoint = outpoint;
  c.entry = entry;
  c.spent = false;
}

bool UtxoView::Remove(const Outpoint& outpoint) {
  return Spend(outpoint);
}

void UtxoView::SetNextNonce(const Bytes& sender, uint64_t next) {
  nonces[BytesToHex(sender)] = next;
}

void UtxoView::SetIssued(Amount value) {
  issued = value;
}

Error UtxoView::ApplyTransaction(const Transaction& tx, int64_t height, Amount& fee,
                                 LedgerDelta* delta) {
  Amount in = 0;
  if (!tx.IsCoinbase()) {
    for (const auto& input : tx.vin) {
      UtxoEntry spent;
      if (!Spend(input.prevout, &spent)) {
        return Error::kMissingOutpoint;
      }
      if (!CheckedAdd(in, spent.output.value, in)) {
        return Error::kAmountOverflow;
      }
      if (delta) {
        delta->spent.push_back(UtxoRecord{input.prevout, spent});
      }
    }
  }

  Amount out = 0;
  if (!tx.ValueOut(out)) {
    return Error::kAmountOverflow;
  }
  if (tx.IsCoinbase()) {
    fee = 0;
  } else {
    if (in < out) {
      return Error::kInsufficientInputs;
    }
    fee = in - out;
  }

  if (const AccountTransfer* account = tx.Account()) {
    if (delta) {
      std::string key = BytesToHex(account->sender);
      if (delta->previousNonces.find(key) == delta->previousNonces.end()) {
        delta->previousNonces[key] = NextNonce(account->sender);
      }
    }
    SetNextNonce(account->sender, account->nonce + 1);
  }

  for (size_t i = 0; i < tx.vout.size(); ++i) {
    Outpoint op{tx.id, static_cast<uint32_t>(i)};
    UtxoEntry entry;
    entry.output = tx.vout[i];
    entry.height = height;
    entry.coinbase = tx.IsCoinbase();
    Add(op, entry);
    if (delta) {
      delta->created.push_back(op);
    }
  }
  return Error::kOk;
}

Error UtxoView::ApplyBlock(const Block& block, LedgerDelta& delta) {
  delta = LedgerDelta{};
  delta.blockHash = block.hash;
  delta.height = block.height;
  delta.issuedBefore = Issued();

  Amount coinbaseOut = 0;
  Amount fees = 0;
  for (const auto& tx : block.transactions) {
    Amount fee = 0;
    Error err = ApplyTransaction(tx, block.height, fee, &delta);
    if (err != Error::kOk) {
      return err;
    }
    if (tx.IsCoinbase()) {
      if (!tx.ValueOut(coinbaseOut)) {
        return Error::kAmountOverflow;
      }
    } else if (!CheckedAdd(fees, fee, fees)) {
      return Error::kAmountOverflow;
    }
  }

  // Fees move existing coins; only the excess of the coinbase is new supply.
  delta.fees = fees;
  delta.minted = coinbaseOut - fees;
  Amount after = delta.issuedBefore + delta.minted;
  if (after < 0) {
    return Error::kAmountOverflow;
  }
  SetIssued(after);
  return Error::kOk;
}

Error UtxoView::UndoBlock(const LedgerDelta& delta) {
  // Outputs created and spent inside the same block are neither restored nor
  // removed.
  std::unordered_map<std::string, bool> internal;
  for (const auto& op : delta.created) {
    internal[op.Key()] = false;
  }
  for (const auto& record : delta.spent) {
    auto it = internal.find(record.outpoint.Key());
    if (it != internal.end()) {
      it->second = true;
    }
  }
  for (auto it = delta.created.rbegin(); it != delta.created.rend(); ++it) {
    if (internal[it->Key()]) {
      continue;
    }
    if (!Spend(*it)) {
      return Error::kMissingOutpoint;
    }
  }
  for (auto it = delta.spent.rbegin(); it != delta.spent.rend(); ++it) {
    if (internal.count(it->outpoint.Key()) != 0) {
      continue;
    }
    Add(it->outpoint, it->entry);
  }
  for (const auto& [sender, nonce] : delta.previousNonces) {
    nonces[sender] = nonce;
  }
  SetIssued(delta.issuedBefore);
  return Error::kOk;
}

const std::unordered_map<std::string, UtxoView::Change>& UtxoView::Changes() const {
  return changes;
}

const std::unordered_map<std::string, uint64_t>& UtxoView::NonceChanges() const {
  return nonces;
}

bool UtxoView::IssuedChanged() const {
  return issued.has_value();
}
