#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "quarry/block.h"
#include "quarry/consensus_engine.h"
#include "quarry/crypto.h"
#include "quarry/keys.h"
#include "quarry/ledger.h"
#include "quarry/mempool.h"
#include "quarry/pow.h"
#include "quarry/settings.h"
#include "quarry/transaction.h"

inline Settings TestSettings() {
  return RegtestSettings();
}

// Far enough past genesis that test blocks spaced one second apart never
// run ahead of the clock.
inline int64_t TestStart(const Settings& settings) {
  return settings.genesisTimestamp + 100000;
}

// Copies share the same time, so a test can move the engine's clock.
struct FakeClock {
  std::shared_ptr<std::atomic<int64_t>> now;

  explicit FakeClock(int64_t start)
      : now(std::make_shared<std::atomic<int64_t>>(start)) {}

  int64_t operator()() const { return now->load(); }
  void Advance(int64_t seconds) { now->fetch_add(seconds); }
  void Set(int64_t t) { now->store(t); }
};

inline std::unique_ptr<KeyPair> NewKey() {
  std::unique_ptr<KeyPair> key = KeyPair::Generate();
  REQUIRE(key);
  return key;
}

inline Outpoint CoinbaseOutpoint(const Block& block) {
  return Outpoint{block.transactions.front().id, 0};
}

// A child of parent one targetBlockTime later, paying subsidy plus fees to
// minerPkh. The tag makes otherwise identical siblings distinct.
inline Block MineChild(const Settings& settings, const Block& parent, const Bytes& minerPkh,
                       const std::vector<Transaction>& txs = {}, Amount fees = 0,
                       const std::string& tag = "") {
  int64_t height = parent.height + 1;
  std::vector<Transaction> all;
  all.push_back(NewCoinbaseTX(minerPkh, BlockSubsidy(settings, height) + fees, height, tag));
  all.insert(all.end(), txs.begin(), txs.end());
  Block block = NewBlock(all, parent.hash, height, parent.timestamp + settings.targetBlockTime,
                         parent.targetBits);
  ProofOfWork pow(&block, settings.minerCheckInterval);
  REQUIRE(pow.Run());
  return block;
}

// Same as MineChild, but ground until the hash sorts above other's, so it
// never wins an equal-work tie against it.
inline Block MineChildAbove(const Settings& settings, const Block& parent, const Bytes& minerPkh,
                            const Block& other, const std::string& tag,
                            const std::vector<Transaction>& txs = {}, Amount fees = 0) {
  for (int i = 0;; ++i) {
    Block block = MineChild(settings, parent, minerPkh, txs, fees, tag + std::to_string(i));
    if (block.hash > other.hash) {
      return block;
    }
  }
}

inline Transaction MakeSpend(const KeyPair& key, const std::vector<Outpoint>& prevouts,
                             const std::vector<TXOutput>& outputs) {
  Transaction tx;
  for (const auto& op : prevouts) {
    TXInput in;
    in.prevout = op;
    tx.vin.push_back(in);
  }
  tx.vout = outputs;
  for (size_t i = 0; i < tx.vin.size(); ++i) {
    REQUIRE(tx.SignInput(i, key, key.PubKeyHash()));
  }
  tx.UpdateId();
  return tx;
}

inline Transaction MakeAccountSpend(const KeyPair& key, uint64_t nonce,
                                    const std::vector<Outpoint>& prevouts,
                                    const std::vector<TXOutput>& outputs) {
  Transaction tx;
  tx.kind = AccountTransfer{key.PubKeyHash(), nonce};
  for (const auto& op : prevouts) {
    TXInput in;
    in.prevout = op;
    tx.vin.push_back(in);
  }
  tx.vout = outputs;
  for (size_t i = 0; i < tx.vin.size(); ++i) {
    REQUIRE(tx.SignInput(i, key, key.PubKeyHash()));
  }
  tx.UpdateId();
  return tx;
}

// Spends one coinbase output back to the same key, leaving fee behind.
inline Transaction PayBack(const KeyPair& key, const Block& funding, Amount fee,
                           const Settings& settings) {
  Amount value = BlockSubsidy(settings, funding.height) - fee;
  return MakeSpend(key, {CoinbaseOutpoint(funding)}, {NewTXOutput(value, key.PubKeyHash())});
}

// Genesis plus blocks whose coinbases pay key, applied straight to a ledger.
struct ChainFixture {
  Settings settings;
  std::unique_ptr<KeyPair> key;
  UtxoLedger ledger;
  std::vector<Block> blocks;

  explicit ChainFixture(size_t count = 5, Settings s = TestSettings())
      : settings(std::move(s)), key(NewKey()) {
    Block genesis = MakeGenesisBlock(settings);
    LedgerDelta delta;
    REQUIRE(ledger.ApplyBlock(genesis, delta) == Error::kOk);
    blocks.push_back(genesis);
    for (size_t i = 0; i < count; ++i) {
      Extend();
    }
  }

  const Block& Extend(const std::vector<Transaction>& txs = {}, Amount fees = 0) {
    Block block = MineChild(settings, blocks.back(), key->PubKeyHash(), txs, fees);
    LedgerDelta delta;
    REQUIRE(ledger.ApplyBlock(block, delta) == Error::kOk);
    blocks.push_back(block);
    return blocks.back();
  }

  ChainContext Context() const {
    ChainContext ctx;
    ctx.height = ledger.Height() + 1;
    ctx.tipHash = ledger.TipHash();
    ctx.stateVersion = ledger.StateVersion();
    return ctx;
  }
};

// Directory under the system temp dir, removed with everything in it.
struct TempDir {
  std::string path;

  explicit TempDir(const std::string& name) {
    static std::atomic<int> counter{0};
    std::filesystem::path p = std::filesystem::temp_directory_path() /
                              ("quarry-" + name + "-" + std::to_string(counter++) + "-" +
                               std::to_string(SystemClock()));
    std::filesystem::remove_all(p);
    path = p.string();
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
};

// Records every signal the engine emits.
struct RecordingListener : ConsensusListener {
  std::vector<Bytes> tips;
  struct Reorg {
    Bytes forkPoint;
    size_t disconnected = 0;
    size_t connected = 0;
  };
  std::vector<Reorg> reorgs;
  std::vector<Error> rejected;
  std::vector<std::pair<std::string, Error>> misbehavior;
  std::vector<int64_t> checkpoints;

  void OnNewTip(const Block& tip) override { tips.push_back(tip.hash); }
  void OnReorg(const Bytes& forkPoint, size_t disconnected, size_t connected) override {
    reorgs.push_back(Reorg{forkPoint, disconnected, connected});
  }
  void OnTransactionRejected(const Transaction&, Error error) override {
    rejected.push_back(error);
  }
  void OnPeerMisbehavior(const std::string& peer, Error error) override {
    misbehavior.emplace_back(peer, error);
  }
  void OnCheckpoint(int64_t height, const Bytes&) override { checkpoints.push_back(height); }
};
