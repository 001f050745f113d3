#include "quarry/block.h"

#include "quarry/crypto.h"
#include "quarry/merkle.h"
#include "quarry/pow.h"
#include "quarry/settings.h"

Bytes BlockHeader::SerializeHeader() const {
  ByteWriter w;
  w.WriteI64(height);
  w.WriteI64(timestamp);
  w.WriteBytes(prevBlockHash);
  w.WriteBytes(merkleRoot);
  w.WriteU32(targetBits);
  w.WriteU64(nonce);
  return w.data;
}

bool BlockHeader::DeserializeHeader(ByteReader& r, BlockHeader& out) {
  BlockHeader h;
  if (!r.ReadI64(h.height) || !r.ReadI64(h.timestamp) ||
      !r.ReadBytes(h.prevBlockHash, kHashSize) || !r.ReadBytes(h.merkleRoot, kHashSize) ||
      !r.ReadU32(h.targetBits) || !r.ReadU64(h.nonce)) {
    return false;
  }
  out = h;
  return true;
}

Bytes BlockHeader::Hash() const {
  return DoubleSha256(SerializeHeader());
}

Bytes Block::HashTransactions() const {
  return ComputeMerkleRoot(TransactionIds());
}

std::vector<Bytes> Block::TransactionIds() const {
  std::vector<Bytes> ids;
  ids.reserve(transactions.size());
  for (const auto& tx : transactions) {
    ids.push_back(tx.id);
  }
  return ids;
}

void Block::UpdateHash() {
  hash = BlockHeader::Hash();
}

BlockHeader Block::Header() const {
  return static_cast<const BlockHeader&>(*this);
}

size_t Block::Size() const {
  return Serialize().size();
}

Bytes Block::Serialize() const {
  ByteWriter w;
  w.WriteRaw(SerializeHeader());
  w.WriteU32(static_cast<uint32_t>(transactions.size()));
  for (const auto& tx : transactions) {
    w.WriteBytes(tx.Serialize());
  }
  return w.data;
}

bool Block::Deserialize(const Bytes& data, Block& out) {
  ByteReader r{data};
  Block b;
  if (!BlockHeader::DeserializeHeader(r, b)) {
    return false;
  }
  uint32_t txCount = 0;
  if (!r.ReadU32(txCount) || txCount > r.Remaining()) {
    return false;
  }
  b.transactions.reserve(txCount);
  for (uint32_t i = 0; i < txCount; ++i) {
    Bytes tbytes;
    if (!r.ReadBytes(tbytes)) {
      return false;
    }
    Transaction tx;
    if (!Transaction::FromBytes(tbytes, tx)) {
      return false;
    }
    b.transactions.push_back(std::move(tx));
  }
  if (!r.AtEnd()) {
    return false;
  }
  b.UpdateHash();
  out = std::move(b);
  return true;
}

Block NewBlock(const std::vector<Transaction>& txs, const Bytes& prevHash,
               int64_t height, int64_t timestamp, uint32_t targetBits) {
  Block b;
  b.height = height;
  b.timestamp = timestamp;
  b.prevBlockHash = prevHash;
  b.targetBits = targetBits;
  b.transactions = txs;
  b.merkleRoot = b.HashTransactions();
  b.UpdateHash();
  return b;
}

Block MakeGenesisBlock(const Settings& settings) {
  Transaction coinbase = NewCoinbaseTX(settings.genesisPubKeyHash,
                                       BlockSubsidy(settings, 0), 0,
                                       settings.genesisData);
  Block genesis = NewBlock({coinbase}, Bytes{}, 0, settings.genesisTimestamp,
                           settings.powLimitBits);
  ProofOfWork pow(&genesis);
  pow.Run();
  return genesis;
}
