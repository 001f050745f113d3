#include <catch2/catch.hpp>

#include <filesystem>
#include <functional>
#include <thread>

#include "quarry/consensus_engine.h"
#include "quarry/storage.h"
#include "test_helpers.h"

namespace {

struct EngineFixture {
  Settings settings;
  FakeClock clock;
  std::shared_ptr<ConsensusEngine> engine;
  std::unique_ptr<KeyPair> key = NewKey();
  RecordingListener listener;
  std::vector<Block> blocks;

  explicit EngineFixture(Settings s = TestSettings())
      : settings(std::move(s)), clock(TestStart(settings)) {
    engine = std::make_shared<ConsensusEngine>(settings, clock);
    REQUIRE(engine->Open() == Error::kOk);
    engine->AddListener(&listener);
    blocks.push_back(MakeGenesisBlock(settings));
  }

  const Block& Extend(const std::vector<Transaction>& txs = {}, Amount fees = 0) {
    Block block = MineChild(settings, blocks.back(), key->PubKeyHash(), txs, fees);
    REQUIRE(engine->ApplyExternalBlock(block, nullptr, "peer1") == Error::kOk);
    blocks.push_back(block);
    return blocks.back();
  }

  Transaction Spend(size_t height, Amount fee) {
    return PayBack(*key, blocks[height], fee, settings);
  }

  Transaction Account(uint64_t nonce, size_t height, Amount fee) {
    Amount value = BlockSubsidy(settings, static_cast<int64_t>(height)) - fee;
    return MakeAccountSpend(*key, nonce, {CoinbaseOutpoint(blocks[height])},
                            {NewTXOutput(value, key->PubKeyHash())});
  }
};

}  // namespace

// Start Test Suite: consensus engine tests

TEST_CASE("consensus engine  open  starts at genesis", "[consensus engine tests]") {
  EngineFixture f;
  EngineStatus status = f.engine->GetStatus();
  REQUIRE(status.height == 0);
  REQUIRE(status.tipHash == f.blocks[0].hash);
  REQUIRE(status.knownBlocks == 1);
  REQUIRE(status.nextTargetBits == f.settings.powLimitBits);
  REQUIRE_FALSE(status.halted);
  REQUIRE(f.engine->CheckSupplyInvariant());
}

TEST_CASE("consensus engine  extend  updates tip and balance", "[consensus engine tests]") {
  EngineFixture f;
  TipChange change;
  Block block = MineChild(f.settings, f.blocks.back(), f.key->PubKeyHash());
  REQUIRE(f.engine->ApplyExternalBlock(block, &change, "peer1") == Error::kOk);
  REQUIRE(change.kind == TipChangeKind::kExtended);
  REQUIRE(change.height == 1);
  REQUIRE(f.listener.tips.back() == block.hash);

  REQUIRE(f.engine->GetBalance(f.key->PubKeyHash()) == BlockSubsidy(f.settings, 1));
  REQUIRE(f.engine->ListUnspent(f.key->PubKeyHash()).size() == 1);
  REQUIRE(f.engine->ApplyExternalBlock(block, nullptr, "peer1") == Error::kDuplicateBlock);

  Block at;
  REQUIRE(f.engine->GetBlockAt(1, at));
  REQUIRE(at.hash == block.hash);
  REQUIRE(f.engine->GetHeaders(0, 10).size() == 2);
  REQUIRE(f.engine->CheckSupplyInvariant());
}

TEST_CASE("consensus engine  double spend  second rejected", "[consensus engine tests]") {
  EngineFixture f;
  f.Extend();
  f.Extend();
  Transaction first = f.Spend(1, 1000);
  Transaction second = f.Spend(1, 1050);
  REQUIRE(f.engine->SubmitTransaction(first) == Error::kOk);
  REQUIRE(f.engine->SubmitTransaction(second) == Error::kMissingOutpoint);
  REQUIRE(f.listener.rejected == std::vector<Error>{Error::kMissingOutpoint});

  SECTION("inside one block") {
    Block block = MineChild(f.settings, f.blocks.back(), f.key->PubKeyHash(), {first, second},
                            2050);
    REQUIRE(f.engine->ApplyExternalBlock(block, nullptr, "peer2") == Error::kMissingOutpoint);
    REQUIRE(f.engine->GetStatus().height == 2);
    REQUIRE(f.listener.misbehavior.back().first == "peer2");
  }

  SECTION("confirmed then replayed") {
    f.Extend({first}, 1000);
    REQUIRE(f.engine->GetMempoolInfo().count == 0);
    REQUIRE(f.engine->SubmitTransaction(first) == Error::kMissingOutpoint);
  }
}

TEST_CASE("consensus engine  block from the future  rejected not queued",
          "[consensus engine tests]") {
  EngineFixture f;
  const Block& parent = f.blocks.back();
  Block block = NewBlock({NewCoinbaseTX(f.key->PubKeyHash(), BlockSubsidy(f.settings, 1), 1, "")},
                         parent.hash, 1, f.clock() + f.settings.maxFutureDrift + 1,
                         parent.targetBits);
  ProofOfWork pow(&block, f.settings.minerCheckInterval);
  REQUIRE(pow.Run());

  REQUIRE(f.engine->ApplyExternalBlock(block, nullptr, "peer1") == Error::kTimestampTooNew);
  EngineStatus status = f.engine->GetStatus();
  REQUIRE(status.height == 0);
  REQUIRE(status.orphans == 0);
  REQUIRE(status.knownBlocks == 1);

  // Acceptable once the clock catches up.
  f.clock.Advance(1);
  REQUIRE(f.engine->ApplyExternalBlock(block, nullptr, "peer1") == Error::kOk);
}

TEST_CASE("consensus engine  coinbase reusing a live txid  rejected",
          "[consensus engine tests]") {
  EngineFixture f;
  Amount genesisBalance = f.engine->GetBalance(f.settings.genesisPubKeyHash);
  REQUIRE(genesisBalance == BlockSubsidy(f.settings, 0));

  const Block& parent = f.blocks.back();
  Transaction coinbase =
      NewCoinbaseTX(f.key->PubKeyHash(), BlockSubsidy(f.settings, 1), 1, "");
  coinbase.id = parent.transactions.front().id;
  Block block = NewBlock({coinbase}, parent.hash, 1, parent.timestamp + 1, parent.targetBits);
  ProofOfWork pow(&block, f.settings.minerCheckInterval);
  REQUIRE(pow.Run());

  REQUIRE(f.engine->SubmitMinedBlock(block) == Error::kBadTxId);
  REQUIRE(f.engine->ApplyExternalBlock(block, nullptr, "peer1") == Error::kBadTxId);
  REQUIRE(f.listener.misbehavior.back() == std::make_pair(std::string("peer1"), Error::kBadTxId));
  REQUIRE(f.engine->GetStatus().height == 0);
  REQUIRE(f.engine->GetBalance(f.settings.genesisPubKeyHash) == genesisBalance);
  REQUIRE(f.engine->CheckSupplyInvariant());
}

TEST_CASE("consensus engine  heavier branch  reorganizes once", "[consensus engine tests]") {
  EngineFixture f;
  f.Extend();
  Transaction onA = f.Spend(1, 1000);
  const Block a2 = f.Extend({onA}, 1000);
  REQUIRE(f.engine->GetMempoolInfo().count == 0);

  Block b2 = MineChildAbove(f.settings, f.blocks[1], f.key->PubKeyHash(), a2, "b");
  TipChange change;
  REQUIRE(f.engine->ApplyExternalBlock(b2, &change, "peer2") == Error::kOk);
  REQUIRE(change.kind == TipChangeKind::kCompeting);
  REQUIRE(f.engine->GetStatus().tipHash == a2.hash);
  REQUIRE(f.listener.reorgs.empty());

  Block b3 = MineChild(f.settings, b2, f.key->PubKeyHash());
  REQUIRE(f.engine->ApplyExternalBlock(b3, &change, "peer2") == Error::kOk);
  REQUIRE(change.kind == TipChangeKind::kReorg);
  REQUIRE(change.forkPoint == f.blocks[1].hash);

  REQUIRE(f.listener.reorgs.size() == 1);
  REQUIRE(f.listener.reorgs[0].forkPoint == f.blocks[1].hash);
  REQUIRE(f.listener.reorgs[0].disconnected == 1);
  REQUIRE(f.listener.reorgs[0].connected == 2);
  REQUIRE(f.listener.tips.back() == b3.hash);

  EngineStatus status = f.engine->GetStatus();
  REQUIRE(status.tipHash == b3.hash);
  REQUIRE(status.tips == 2);
  MempoolEntry entry;
  REQUIRE(f.engine->GetMempoolEntry(onA.id, entry));
  REQUIRE(f.engine->CheckSupplyInvariant());

  MerkleProof proof;
  REQUIRE(f.engine->GetMerkleProof(onA.id, proof) == Error::kNotFound);
}

TEST_CASE("consensus engine  reorg  drops transactions the new branch conflicts with",
          "[consensus engine tests]") {
  EngineFixture f;
  f.Extend();
  Transaction onA = f.Spend(1, 1000);
  const Block a2 = f.Extend({onA}, 1000);

  Transaction onB = f.Spend(1, 3000);
  Block b2 = MineChildAbove(f.settings, f.blocks[1], f.key->PubKeyHash(), a2, "b", {onB}, 3000);
  REQUIRE(f.engine->ApplyExternalBlock(b2, nullptr, "peer2") == Error::kOk);
  Block b3 = MineChild(f.settings, b2, f.key->PubKeyHash());
  REQUIRE(f.engine->ApplyExternalBlock(b3, nullptr, "peer2") == Error::kOk);

  REQUIRE(f.engine->GetStatus().tipHash == b3.hash);
  REQUIRE(f.engine->GetMempoolInfo().count == 0);
  MerkleProof proof;
  REQUIRE(f.engine->GetMerkleProof(onB.id, proof) == Error::kOk);
  REQUIRE(proof.blockHash == b2.hash);
}

TEST_CASE("consensus engine  invalid side branch  never becomes tip",
          "[consensus engine tests]") {
  EngineFixture f;
  f.Extend();
  f.Extend();
  Block greedy = MineChild(f.settings, f.blocks[1], f.key->PubKeyHash(), {}, 1, "greedy");
  REQUIRE(f.engine->ApplyExternalBlock(greedy, nullptr, "peer3") == Error::kBadCoinbaseReward);
  REQUIRE(f.listener.misbehavior.back() ==
          std::make_pair(std::string("peer3"), Error::kBadCoinbaseReward));

  Block child = MineChild(f.settings, greedy, f.key->PubKeyHash());
  REQUIRE(f.engine->ApplyExternalBlock(child, nullptr, "peer3") == Error::kOrphanBlock);
  REQUIRE(f.engine->GetStatus().tipHash == f.blocks[2].hash);
}

TEST_CASE("consensus engine  nonce gap  queued until sequence fills",
          "[consensus engine tests]") {
  EngineFixture f;
  f.Extend();
  f.Extend();
  Transaction later = f.Account(1, 2, 1000);
  REQUIRE(f.engine->SubmitTransaction(later) == Error::kFutureNonce);
  REQUIRE(f.engine->IsTransactionQueued(later.id));
  REQUIRE(f.listener.rejected.empty());

  f.Extend({f.Account(0, 1, 1000)}, 1000);
  REQUIRE(f.engine->NextNonce(f.key->PubKeyHash()) == 1);
  MempoolEntry entry;
  REQUIRE(f.engine->GetMempoolEntry(later.id, entry));
  REQUIRE_FALSE(f.engine->IsTransactionQueued(later.id));
}

TEST_CASE("consensus engine  orphan  connects when parent arrives", "[consensus engine tests]") {
  EngineFixture f;
  Block b1 = MineChild(f.settings, f.blocks.back(), f.key->PubKeyHash());
  Block b2 = MineChild(f.settings, b1, f.key->PubKeyHash());

  TipChange change;
  REQUIRE(f.engine->ApplyExternalBlock(b2, &change, "peer1") == Error::kOrphanBlock);
  REQUIRE(change.kind == TipChangeKind::kOrphaned);
  REQUIRE(f.engine->GetStatus().orphans == 1);
  REQUIRE(f.engine->ApplyExternalBlock(b2, nullptr, "peer1") == Error::kDuplicateBlock);

  REQUIRE(f.engine->ApplyExternalBlock(b1, nullptr, "peer1") == Error::kOk);
  EngineStatus status = f.engine->GetStatus();
  REQUIRE(status.height == 2);
  REQUIRE(status.tipHash == b2.hash);
  REQUIRE(status.orphans == 0);
}

TEST_CASE("consensus engine  orphan  expires and resend is reported",
          "[consensus engine tests]") {
  EngineFixture f;
  Block b1 = MineChild(f.settings, f.blocks.back(), f.key->PubKeyHash());
  Block b2 = MineChild(f.settings, b1, f.key->PubKeyHash());
  REQUIRE(f.engine->ApplyExternalBlock(b2, nullptr, "peer4") == Error::kOrphanBlock);

  f.clock.Advance(f.settings.orphanTtl);
  f.engine->Maintain();
  REQUIRE(f.engine->GetStatus().orphans == 0);
  REQUIRE(f.listener.misbehavior.empty());

  REQUIRE(f.engine->ApplyExternalBlock(b2, nullptr, "peer4") == Error::kOrphanBlock);
  REQUIRE(f.listener.misbehavior.size() == 1);
  REQUIRE(f.listener.misbehavior[0].second == Error::kOrphanBlock);
}

TEST_CASE("consensus engine  fork deeper than limit  refused", "[consensus engine tests]") {
  Settings settings = TestSettings();
  settings.maxReorgDepth = 2;
  EngineFixture f(settings);
  for (int i = 0; i < 4; ++i) {
    f.Extend();
  }
  Block deep = MineChild(f.settings, f.blocks[1], f.key->PubKeyHash(), {}, 0, "deep");
  REQUIRE(f.engine->ApplyExternalBlock(deep, nullptr, "peer5") == Error::kReorgTooDeep);
  REQUIRE(f.listener.misbehavior.empty());

  Block shallow = MineChild(f.settings, f.blocks[2], f.key->PubKeyHash(), {}, 0, "shallow");
  REQUIRE(f.engine->ApplyExternalBlock(shallow, nullptr, "peer5") == Error::kOk);
  REQUIRE(f.engine->GetStatus().tipHash == f.blocks[4].hash);
}

TEST_CASE("consensus engine  fork below checkpoint  refused", "[consensus engine tests]") {
  Settings settings = TestSettings();
  settings.checkpointInterval = 2;
  EngineFixture f(settings);
  for (int i = 0; i < 3; ++i) {
    f.Extend();
  }
  REQUIRE(f.listener.checkpoints == std::vector<int64_t>{2});
  REQUIRE(f.engine->GetStatus().latestCheckpoint == 2);

  Block fork = MineChild(f.settings, f.blocks[1], f.key->PubKeyHash(), {}, 0, "fork");
  REQUIRE(f.engine->ApplyExternalBlock(fork, nullptr, "peer6") == Error::kReorgTooDeep);

  MerkleProof proof;
  REQUIRE(f.engine->GetMerkleProof(f.blocks[3].transactions[0].id, proof) == Error::kOk);
  REQUIRE(proof.checkpointHeight == 2);
  REQUIRE(VerifyMerkleProof(proof));
}

TEST_CASE("consensus engine  received bytes  malformed reported", "[consensus engine tests]") {
  EngineFixture f;
  REQUIRE(f.engine->OnBlockReceived(Bytes{1, 2, 3}, "peer7") == Error::kMalformed);
  REQUIRE(f.engine->OnTransactionReceived(Bytes{4, 5}, "peer7") == Error::kMalformed);
  REQUIRE(f.listener.misbehavior.size() == 2);

  f.Extend();
  Block block = MineChild(f.settings, f.blocks.back(), f.key->PubKeyHash());
  REQUIRE(f.engine->OnBlockReceived(block.Serialize(), "peer7") == Error::kOk);
  Transaction tx = f.Spend(1, 1000);
  REQUIRE(f.engine->OnTransactionReceived(tx.Serialize(), "peer7") == Error::kOk);
  REQUIRE(f.listener.misbehavior.size() == 2);
}

TEST_CASE("consensus engine  block template  carries pool and subsidy",
          "[consensus engine tests]") {
  EngineFixture f;
  f.Extend();
  Transaction tx = f.Spend(1, 1000);
  REQUIRE(f.engine->SubmitTransaction(tx) == Error::kOk);

  BlockTemplate tmpl;
  REQUIRE(f.engine->GetBlockTemplate(tmpl) == Error::kOk);
  REQUIRE(tmpl.parentHash == f.blocks[1].hash);
  REQUIRE(tmpl.height == 2);
  REQUIRE(tmpl.transactions.size() == 1);
  REQUIRE(tmpl.fees == 1000);
  REQUIRE(tmpl.subsidy == BlockSubsidy(f.settings, 2));
  REQUIRE(tmpl.timestamp == f.clock());

  Block block = tmpl.Build(f.key->PubKeyHash(), "test");
  ProofOfWork pow(&block, f.settings.minerCheckInterval);
  REQUIRE(pow.Run(tmpl.abort));
  REQUIRE(f.engine->SubmitMinedBlock(block) == Error::kOk);
  REQUIRE(f.engine->GetMempoolInfo().count == 0);
  REQUIRE(IsCancelled(tmpl.abort));
}

TEST_CASE("consensus engine  persistence  reopen restores state", "[consensus engine tests]") {
  TempDir dir("engine");
  Settings settings = TestSettings();
  settings.dataDir = dir.path;
  Bytes digest;
  Bytes tip;
  Transaction tx;
  {
    EngineFixture f(settings);
    f.Extend();
    tx = f.Spend(1, 1000);
    f.Extend({tx}, 1000);
    f.Extend();
    REQUIRE(f.engine->Flush());
    digest = f.engine->LedgerDigest();
    tip = f.blocks.back().hash;
  }

  SECTION("from the saved ledger") {
    EngineFixture f(settings);
    REQUIRE(f.engine->GetStatus().tipHash == tip);
    REQUIRE(f.engine->LedgerDigest() == digest);
    MerkleProof proof;
    REQUIRE(f.engine->GetMerkleProof(tx.id, proof) == Error::kOk);
  }

  SECTION("replaying blocks without a saved ledger") {
    REQUIRE(RemoveFile(JoinPath(dir.path, "utxo.dat")));
    EngineFixture f(settings);
    REQUIRE(f.engine->GetStatus().tipHash == tip);
    REQUIRE(f.engine->LedgerDigest() == digest);
  }

  SECTION("interrupted reorg journal is cleared") {
    ReorgJournal journal;
    journal.Open(dir.path);
    REQUIRE(journal.Begin(ReorgJournalEntry{tip, Bytes(32, 1), Bytes(32, 2), 0}));
    EngineFixture f(settings);
    REQUIRE(f.engine->GetStatus().tipHash == tip);
    ReorgJournalEntry pending;
    REQUIRE_FALSE(journal.Pending(pending));
  }
}

TEST_CASE("consensus engine  storage failure  halts", "[consensus engine tests]") {
  TempDir dir("halt");
  Settings settings = TestSettings();
  settings.dataDir = dir.path;
  EngineFixture f(settings);
  f.Extend();

  std::filesystem::remove_all(dir.path);
  REQUIRE(WriteFileBytes(dir.path, Bytes{1}));

  Block block = MineChild(f.settings, f.blocks.back(), f.key->PubKeyHash());
  REQUIRE(f.engine->ApplyExternalBlock(block, nullptr, "peer1") == Error::kStorageFailure);
  REQUIRE(f.engine->IsHalted());
  REQUIRE(f.engine->GetStatus().halted);
  REQUIRE(f.engine->GetStatus().height == 1);

  REQUIRE(f.engine->ApplyExternalBlock(block, nullptr, "peer1") == Error::kStorageFailure);
  REQUIRE(f.engine->SubmitTransaction(f.Spend(1, 1000)) == Error::kStorageFailure);
  BlockTemplate tmpl;
  REQUIRE(f.engine->GetBlockTemplate(tmpl) == Error::kStorageFailure);
}

TEST_CASE("consensus engine  concurrent blocks transactions and templates  consistent",
          "[consensus engine tests]") {
  EngineFixture f;
  for (int i = 0; i < 4; ++i) {
    f.Extend();
  }
  std::vector<Transaction> spends;
  for (size_t h = 1; h <= 4; ++h) {
    spends.push_back(f.Spend(h, 1000 * static_cast<Amount>(h)));
  }
  std::vector<Block> incoming;
  Block parent = f.blocks.back();
  for (int i = 0; i < 12; ++i) {
    incoming.push_back(MineChild(f.settings, parent, f.key->PubKeyHash()));
    parent = incoming.back();
  }

  // Catch2 assertions are not thread safe, so workers only record.
  std::vector<Error> firstResults(incoming.size());
  std::vector<Error> secondResults(incoming.size());
  std::vector<Error> txResults(spends.size());
  std::vector<int64_t> templateHeights;
  std::atomic<bool> done{false};

  auto deliver = [&](std::vector<Error>& results, const std::string& peer) {
    for (size_t i = 0; i < incoming.size(); ++i) {
      results[i] = f.engine->ApplyExternalBlock(incoming[i], nullptr, peer);
    }
  };
  std::thread first(deliver, std::ref(firstResults), "peer1");
  std::thread second(deliver, std::ref(secondResults), "peer2");
  std::thread submitter([&] {
    for (size_t i = 0; i < spends.size(); ++i) {
      txResults[i] = f.engine->SubmitTransaction(spends[i]);
    }
  });
  std::thread templater([&] {
    while (!done.load()) {
      BlockTemplate tmpl;
      if (f.engine->GetBlockTemplate(tmpl) == Error::kOk) {
        templateHeights.push_back(tmpl.height);
      }
    }
  });
  first.join();
  second.join();
  submitter.join();
  done.store(true);
  templater.join();

  for (size_t i = 0; i < incoming.size(); ++i) {
    int accepted = (firstResults[i] == Error::kOk) + (secondResults[i] == Error::kOk);
    REQUIRE(accepted == 1);
    REQUIRE((firstResults[i] == Error::kOk || firstResults[i] == Error::kDuplicateBlock));
    REQUIRE((secondResults[i] == Error::kOk || secondResults[i] == Error::kDuplicateBlock));
  }
  for (Error err : txResults) {
    REQUIRE(err == Error::kOk);
  }
  for (size_t i = 1; i < templateHeights.size(); ++i) {
    REQUIRE(templateHeights[i] >= templateHeights[i - 1]);
  }

  EngineStatus status = f.engine->GetStatus();
  REQUIRE(status.height == 16);
  REQUIRE(status.tipHash == incoming.back().hash);
  REQUIRE(status.mempool == spends.size());
  REQUIRE(f.listener.tips.size() == 4 + incoming.size());
  REQUIRE(f.listener.reorgs.empty());
  REQUIRE(f.engine->CheckSupplyInvariant());

  BlockTemplate tmpl;
  REQUIRE(f.engine->GetBlockTemplate(tmpl) == Error::kOk);
  REQUIRE(tmpl.height == 17);
  REQUIRE(tmpl.transactions.size() == spends.size());
}
