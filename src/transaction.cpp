#include "quarry/transaction.h"

#include <tuple>

#include "quarry/crypto.h"
#include "quarry/keys.h"

static constexpr uint8_t kKindUtxo = 0;
static constexpr uint8_t kKindAccount = 1;

bool Outpoint::IsNull() const {
  return txid.empty() && index == kNullIndex;
}

std::string Outpoint::Key() const {
  return BytesToHex(txid) + ":" + std::to_string(index);
}

bool Outpoint::operator==(const Outpoint& other) const {
  return index == other.index && txid == other.txid;
}

bool Outpoint::operator<(const Outpoint& other) const {
  return std::tie(txid, index) < std::tie(other.txid, other.index);
}

bool TXInput::UsesKey(const Bytes& pubKeyHash) const {
  return Hash160(pubKey) == pubKeyHash;
}

bool TXOutput::IsLockedWithKey(const Bytes& pubKeyHash_) const {
  return pubKeyHash == pubKeyHash_;
}

bool TXOutput::IsSpendableAt(int64_t height) const {
  return height >= lockHeight;
}

bool Transaction::IsCoinbase() const {
  return vin.size() == 1 && vin[0].prevout.IsNull();
}

const AccountTransfer* Transaction::Account() const {
  return std::get_if<AccountTransfer>(&kind);
}

Bytes Transaction::Sender() const {
  if (const AccountTransfer* account = Account()) {
    return account->sender;
  }
  if (vin.empty() || IsCoinbase()) {
    return Bytes{};
  }
  return Hash160(vin[0].pubKey);
}

bool Transaction::ValueOut(Amount& out) const {
  Amount total = 0;
  for (const auto& o : vout) {
    if (!CheckedAdd(total, o.value, total)) {
      return false;
    }
  }
  out = total;
  return true;
}

Bytes Transaction::Serialize() const {
  ByteWriter w;
  std::visit(
      [&w](const auto& k) {
        using K = std::decay_t<decltype(k)>;
        if constexpr (std::is_same_v<K, AccountTransfer>) {
          w.WriteU8(kKindAccount);
          w.WriteBytes(k.sender);
          w.WriteU64(k.nonce);
        } else {
          w.WriteU8(kKindUtxo);
        }
      },
      kind);
  w.WriteI64(timestamp);

  w.WriteU32(static_cast<uint32_t>(vin.size()));
  for (const auto& in : vin) {
    w.WriteBytes(in.prevout.txid);
    w.WriteU32(in.prevout.index);
    w.WriteBytes(in.signature);
    w.WriteBytes(in.pubKey);
  }

  w.WriteU32(static_cast<uint32_t>(vout.size()));
  for (const auto& out : vout) {
    w.WriteI64(out.value);
    w.WriteBytes(out.pubKeyHash);
    w.WriteI64(out.lockHeight);
  }

  return w.data;
}

bool Transaction::Deserialize(ByteReader& r, Transaction& out) {
  Transaction tx;
  uint8_t tag = 0;
  if (!r.ReadU8(tag)) {
    return false;
  }
  if (tag == kKindAccount) {
    AccountTransfer account;
    if (!r.ReadBytes(account.sender, kPubKeyHashSize) || !r.ReadU64(account.nonce)) {
      return false;
    }
    tx.kind = account;
  } else if (tag == kKindUtxo) {
    tx.kind = UtxoTransfer{};
  } else {
    return false;
  }
  if (!r.ReadI64(tx.timestamp)) {
    return false;
  }

  uint32_t vinCount = 0;
  if (!r.ReadU32(vinCount) || vinCount > r.Remaining()) {
    return false;
  }
  tx.vin.reserve(vinCount);
  for (uint32_t i = 0; i < vinCount; ++i) {
    TXInput in;
    if (!r.ReadBytes(in.prevout.txid, kHashSize) || !r.ReadU32(in.prevout.index) ||
        !r.ReadBytes(in.signature) || !r.ReadBytes(in.pubKey)) {
      return false;
    }
    tx.vin.push_back(std::move(in));
  }

  uint32_t voutCount = 0;
  if (!r.ReadU32(voutCount) || voutCount > r.Remaining()) {
    return false;
  }
  tx.vout.reserve(voutCount);
  for (uint32_t i = 0; i < voutCount; ++i) {
    TXOutput o;
    if (!r.ReadI64(o.value) || !r.ReadBytes(o.pubKeyHash, kPubKeyHashSize) ||
        !r.ReadI64(o.lockHeight)) {
      return false;
    }
    tx.vout.push_back(std::move(o));
  }

  tx.UpdateId();
  out = std::move(tx);
  return true;
}

bool Transaction::FromBytes(const Bytes& data, Transaction& out) {
  ByteReader r{data};
  if (!Deserialize(r, out)) {
    return false;
  }
  return r.AtEnd();
}

Bytes Transaction::Hash() const {
  return DoubleSha256(Serialize());
}

void Transaction::UpdateId() {
  id = Hash();
}

size_t Transaction::Size() const {
  return Serialize().size();
}

Transaction Transaction::TrimmedCopy() const {
  Transaction copy;
  copy.kind = kind;
  copy.timestamp = timestamp;
  for (const auto& in : vin) {
    TXInput input;
    input.prevout = in.prevout;
    copy.vin.push_back(input);
  }
  copy.vout = vout;
  return copy;
}

Bytes Transaction::SignatureHash(size_t index, const Bytes& prevPubKeyHash) const {
  Transaction txCopy = TrimmedCopy();
  if (index < txCopy.vin.size()) {
    txCopy.vin[index].pubKey = prevPubKeyHash;
  }
  return txCopy.Hash();
}

bool Transaction::SignInput(size_t index, const KeyPair& key,
                            const Bytes& prevPubKeyHash) {
  if (index >= vin.size()) {
    return false;
  }
  Bytes hash = SignatureHash(index, prevPubKeyHash);
  Bytes sig;
  if (!key.Sign(hash, sig)) {
    return false;
  }
  vin[index].signature = sig;
  vin[index].pubKey = key.PublicKey();
  UpdateId();
  return true;
}

TXOutput NewTXOutput(Amount value, const Bytes& pubKeyHash, int64_t lockHeight) {
  TXOutput out;
  out.value = value;
  out.pubKeyHash = pubKeyHash;
  out.lockHeight = lockHeight;
  return out;
}

Transaction NewCoinbaseTX(const Bytes& pubKeyHash, Amount value, int64_t height,
                          const std::string& data) {
  Transaction tx;
  TXInput in;
  in.prevout.index = kNullIndex;
  ByteWriter w;
  w.WriteI64(height);
  in.pubKey = w.data;
  in.pubKey.insert(in.pubKey.end(), data.begin(), data.end());
  tx.vin.push_back(in);
  tx.vout.push_back(NewTXOutput(value, pubKeyHash));
  tx.UpdateId();
  return tx;
}

int64_t CoinbaseHeight(const Transaction& coinbase) {
  if (!coinbase.IsCoinbase()) {
    return -1;
  }
  ByteReader r{coinbase.vin[0].pubKey};
  int64_t height = -1;
  if (!r.ReadI64(height)) {
    return -1;
  }
  return height;
}
