#include "quarry/ledger.h"

#include "quarry/crypto.h"
#include "quarry/serialize.h"

static void WriteOutpoint(ByteWriter& w, const Outpoint& op) {
  w.WriteBytes(op.txid);
  w.WriteU32(op.index);
}

static bool ReadOutpoint(ByteReader& r, Outpoint& op) {
  return r.ReadBytes(op.txid, kHashSize) && r.ReadU32(op.index);
}

static void WriteRecord(ByteWriter& w, const UtxoRecord& record) {
  WriteOutpoint(w, record.outpoint);
  w.WriteI64(record.entry.output.value);
  w.WriteBytes(record.entry.output.pubKeyHash);
  w.WriteI64(record.entry.output.lockHeight);
  w.WriteI64(record.entry.height);
  w.WriteU8(record.entry.coinbase ? 1 : 0);
}

static bool ReadRecord(ByteReader& r, UtxoRecord& record) {
  uint8_t coinbase = 0;
  if (!ReadOutpoint(r, record.outpoint) || !r.ReadI64(record.entry.output.value) ||
      !r.ReadBytes(record.entry.output.pubKeyHash, kPubKeyHashSize) ||
      !r.ReadI64(record.entry.output.lockHeight) || !r.ReadI64(record.entry.height) ||
      !r.ReadU8(coinbase)) {
    return false;
  }
  record.entry.coinbase = coinbase != 0;
  return true;
}

static void WriteDelta(ByteWriter& w, const LedgerDelta& delta) {
  w.WriteBytes(delta.blockHash);
  w.WriteI64(delta.height);
  w.WriteU32(static_cast<uint32_t>(delta.spent.size()));
  for (const auto& record : delta.spent) {
    WriteRecord(w, record);
  }
  w.WriteU32(static_cast<uint32_t>(delta.created.size()));
  for (const auto& op : delta.created) {
    WriteOutpoint(w, op);
  }
  w.WriteU32(static_cast<uint32_t>(delta.previousNonces.size()));
  for (const auto& [sender, nonce] : delta.previousNonces) {
    w.WriteString(sender);
    w.WriteU64(nonce);
  }
  w.WriteI64(delta.issuedBefore);
  w.WriteI64(delta.minted);
  w.WriteI64(delta.fees);
}

static bool ReadDelta(ByteReader& r, LedgerDelta& delta) {
  uint32_t n = 0;
  if (!r.ReadBytes(delta.blockHash, kHashSize) || !r.ReadI64(delta.height) ||
      !r.ReadU32(n) || n > r.Remaining()) {
    return false;
  }
  for (uint32_t i = 0; i < n; ++i) {
    UtxoRecord record;
    if (!ReadRecord(r, record)) {
      return false;
    }
    delta.spent.push_back(record);
  }
  if (!r.ReadU32(n) || n > r.Remaining()) {
    return false;
  }
  for (uint32_t i = 0; i < n; ++i) {
    Outpoint op;
    if (!ReadOutpoint(r, op)) {
      return false;
    }
    delta.created.push_back(op);
  }
  if (!r.ReadU32(n) || n > r.Remaining()) {
    return false;
  }
  for (uint32_t i = 0; i < n; ++i) {
    std::string sender;
    uint64_t nonce = 0;
    if (!r.ReadString(sender) || !r.ReadU64(nonce)) {
      return false;
    }
    delta.previousNonces[sender] = nonce;
  }
  return r.ReadI64(delta.issuedBefore) && r.ReadI64(delta.minted) &&
         r.ReadI64(delta.fees);
}

bool UtxoLedger::GetUnspent(const Outpoint& outpoint, UtxoEntry& out) const {
  auto it = utxos.find(outpoint.Key());
  if (it == utxos.end()) {
    return false;
  }
  out = it->second.entry;
  return true;
}

uint64_t UtxoLedger::NextNonce(const Bytes& sender) const {
  auto it = nonces.find(BytesToHex(sender));
  return it == nonces.end() ? 0 : it->second;
}

Amount UtxoLedger::Issued() const {
  return issued;
}

Error UtxoLedger::ApplyBlock(const Block& block, LedgerDelta& delta) {
  if (height >= 0 && block.prevBlockHash != tipHash) {
    return Error::kInvalidAncestor;
  }
  if (block.height != height + 1) {
    return Error::kBadHeight;
  }
  UtxoView view(*this);
  Error err = view.ApplyBlock(block, delta);
  if (err != Error::kOk) {
    return err;
  }
  Commit(view);
  tipHash = block.hash;
  height = block.height;
  RememberUndo(delta);
  ++stateVersion;
  return Error::kOk;
}

Error UtxoLedger::RevertBlock(const Block& block) {
  if (block.hash != tipHash) {
    return Error::kInvalidAncestor;
  }
  auto it = undo.find(BytesToHex(block.hash));
  if (it == undo.end()) {
    return Error::kNotFound;
  }
  UtxoView view(*this);
  Error err = view.UndoBlock(it->second);
  if (err != Error::kOk) {
    return err;
  }
  Commit(view);
  undo.erase(it);
  for (auto o = undoOrder.begin(); o != undoOrder.end(); ++o) {
    if (*o == BytesToHex(block.hash)) {
      undoOrder.erase(o);
      break;
    }
  }
  tipHash = block.prevBlockHash;
  height = block.height - 1;
  ++stateVersion;
  return Error::kOk;
}

const LedgerDelta* UtxoLedger::Undo(const Bytes& blockHash) const {
  auto it = undo.find(BytesToHex(blockHash));
  return it == undo.end() ? nullptr : &it->second;
}

Amount UtxoLedger::GetBalance(const Bytes& pubKeyHash) const {
  Amount total = 0;
  for (const auto& [key, record] : utxos) {
    if (record.entry.output.IsLockedWithKey(pubKeyHash)) {
      if (!CheckedAdd(total, record.entry.output.value, total)) {
        return kMaxAmount;
      }
    }
  }
  return total;
}

std::vector<UtxoRecord> UtxoLedger::ListUnspent(const Bytes& pubKeyHash) const {
  std::vector<UtxoRecord> out;
  for (const auto& [key, record] : utxos) {
    if (record.entry.output.IsLockedWithKey(pubKeyHash)) {
      out.push_back(record);
    }
  }
  return out;
}

bool UtxoLedger::SumUnspent(Amount& out) const {
  Amount total = 0;
  for (const auto& [key, record] : utxos) {
    if (!CheckedAdd(total, record.entry.output.value, total)) {
      return false;
    }
  }
  out = total;
  return true;
}

size_t UtxoLedger::Size() const {
  return utxos.size();
}

uint64_t UtxoLedger::StateVersion() const {
  return stateVersion;
}

const Bytes& UtxoLedger::TipHash() const {
  return tipHash;
}

int64_t UtxoLedger::Height() const {
  return height;
}

Bytes UtxoLedger::Digest() const {
  return DoubleSha256(Serialize(false));
}

Bytes UtxoLedger::Serialize(bool withUndo) const {
  ByteWriter w;
  w.WriteBytes(tipHash);
  w.WriteI64(height);
  w.WriteU32(static_cast<uint32_t>(utxos.size()));
  for (const auto& [key, record] : utxos) {
    WriteRecord(w, record);
  }
  w.WriteU32(static_cast<uint32_t>(nonces.size()));
  for (const auto& [sender, nonce] : nonces) {
    w.WriteString(sender);
    w.WriteU64(nonce);
  }
  w.WriteI64(issued);
  if (!withUndo) {
    w.WriteU32(0);
    return w.data;
  }
  w.WriteU32(static_cast<uint32_t>(undoOrder.size()));
  for (const auto& hash : undoOrder) {
    WriteDelta(w, undo.at(hash));
  }
  return w.data;
}

bool UtxoLedger::Deserialize(const Bytes& data, UtxoLedger& out) {
  ByteReader r{data};
  UtxoLedger ledger;
  ledger.undoRetention = out.undoRetention;
  uint32_t n = 0;
  if (!r.ReadBytes(ledger.tipHash, kHashSize) || !r.ReadI64(ledger.height) ||
      !r.ReadU32(n) || n > r.Remaining()) {
    return false;
  }
  for (uint32_t i = 0; i < n; ++i) {
    UtxoRecord record;
    if (!ReadRecord(r, record)) {
      return false;
    }
    ledger.utxos[record.outpoint.Key()] = record;
  }
  if (!r.ReadU32(n) || n > r.Remaining()) {
    return false;
  }
  for (uint32_t i = 0; i < n; ++i) {
    std::string sender;
    uint64_t nonce = 0;
    if (!r.ReadString(sender) || !r.ReadU64(nonce)) {
      return false;
    }
    ledger.nonces[sender] = nonce;
  }
  if (!r.ReadI64(ledger.issued) || !r.ReadU32(n) || n > r.Remaining()) {
    return false;
  }
  for (uint32_t i = 0; i < n; ++i) {
    LedgerDelta delta;
    if (!ReadDelta(r, delta)) {
      return false;
    }
    std::string key = BytesToHex(delta.blockHash);
    ledger.undo[key] = delta;
    ledger.undoOrder.push_back(key);
  }
  if (!r.AtEnd()) {
    return false;
  }
  ledger.stateVersion = out.stateVersion + 1;
  out = std::move(ledger);
  return true;
}

void UtxoLedger::Reset() {
  utxos.clear();
  nonces.clear();
  issued = 0;
  tipHash.clear();
  height = -1;
  undo.clear();
  undoOrder.clear();
  ++stateVersion;
}

void UtxoLedger::Commit(const UtxoView& view) {
  for (const auto& [key, change] : view.Changes()) {
    if (change.spent) {
      utxos.erase(key);
    } else {
      utxos[key] = UtxoRecord{change.outpoint, change.entry};
    }
  }
  for (const auto& [sender, nonce] : view.NonceChanges()) {
    if (nonce == 0) {
      nonces.erase(sender);
    } else {
      nonces[sender] = nonce;
    }
  }
  if (view.IssuedChanged()) {
    issued = view.Issued();
  }
}

void UtxoLedger::RememberUndo(const LedgerDelta& delta) {
  std::string key = BytesToHex(delta.blockHash);
  undo[key] = delta;
  undoOrder.push_back(key);
  while (undoOrder.size() > undoRetention) {
    undo.erase(undoOrder.front());
    undoOrder.pop_front();
  }
}
