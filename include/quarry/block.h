#pragma once

#include <cstdint>
#include <vector>

#include "quarry/serialize.h"
#include "quarry/transaction.h"
#include "quarry/types.h"

struct Settings;

struct BlockHeader {
  int64_t height = 0;
  int64_t timestamp = 0;
  Bytes prevBlockHash;
  Bytes merkleRoot;
  uint32_t targetBits = 0;
  uint64_t nonce = 0;

  Bytes SerializeHeader() const;
  static bool DeserializeHeader(ByteReader& r, BlockHeader& out);
  Bytes Hash() const;
};

struct Block : BlockHeader {
  std::vector<Transaction> transactions;
  Bytes hash;

  Bytes HashTransactions() const;
  std::vector<Bytes> TransactionIds() const;
  void UpdateHash();
  BlockHeader Header() const;
  size_t Size() const;

  Bytes Serialize() const;
  static bool Deserialize(const Bytes& data, Block& out);
};

// Builds a block on top of prevHash with a fresh merkle root; the caller mines it.
Block NewBlock(const std::vector<Transaction>& txs, const Bytes& prevHash,
               int64_t height, int64_t timestamp, uint32_t targetBits);

// Deterministic for a given Settings: fixed timestamp, nonce searched from zero.
Block MakeGenesisBlock(const Settings& settings);
