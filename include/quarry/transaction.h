#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "quarry/serialize.h"
#include "quarry/types.h"

struct KeyPair;

inline constexpr uint32_t kNullIndex = 0xFFFFFFFF;

struct Outpoint {
  Bytes txid;
  uint32_t index = 0;

  bool IsNull() const;
  std::string Key() const;
  bool operator==(const Outpoint& other) const;
  bool operator<(const Outpoint& other) const;
};

struct TXInput {
  Outpoint prevout;
  Bytes signature;
  Bytes pubKey;

  bool UsesKey(const Bytes& pubKeyHash) const;
};

struct TXOutput {
  Amount value = 0;
  Bytes pubKeyHash;
  int64_t lockHeight = 0;

  bool IsLockedWithKey(const Bytes& pubKeyHash_) const;
  bool IsSpendableAt(int64_t height) const;
};

// Plain UTXO spend, no sequencing.
struct UtxoTransfer {};

// Spend on behalf of an account; nonces must be consumed in order.
struct AccountTransfer {
  Bytes sender;
  uint64_t nonce = 0;
};

using TransactionKind = std::variant<UtxoTransfer, AccountTransfer>;

struct Transaction {
  TransactionKind kind;
  int64_t timestamp = 0;
  std::vector<TXInput> vin;
  std::vector<TXOutput> vout;
  Bytes id;

  bool IsCoinbase() const;
  const AccountTransfer* Account() const;
  Bytes Sender() const;
  bool ValueOut(Amount& out) const;

  Bytes Serialize() const;
  static bool Deserialize(ByteReader& r, Transaction& out);
  static bool FromBytes(const Bytes& data, Transaction& out);
  Bytes Hash() const;
  void UpdateId();
  size_t Size() const;

  Transaction TrimmedCopy() const;
  Bytes SignatureHash(size_t index, const Bytes& prevPubKeyHash) const;
  bool SignInput(size_t index, const KeyPair& key, const Bytes& prevPubKeyHash);
};

TXOutput NewTXOutput(Amount value, const Bytes& pubKeyHash, int64_t lockHeight = 0);
Transaction NewCoinbaseTX(const Bytes& pubKeyHash, Amount value, int64_t height,
                          const std::string& data);
int64_t CoinbaseHeight(const Transaction& coinbase);
