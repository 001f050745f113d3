#include <catch2/catch.hpp>

#include <filesystem>

#include "quarry/checkpoint.h"
#include "quarry/storage.h"
#include "test_helpers.h"

namespace {

Settings CheckpointSettings() {
  Settings s = TestSettings();
  s.checkpointInterval = 2;
  return s;
}

}  // namespace

// Start Test Suite: checkpoint tests

TEST_CASE("checkpoint  maybe create  only on interval boundary", "[checkpoint tests]") {
  ChainFixture chain(0, CheckpointSettings());
  CheckpointManager manager(chain.settings);
  REQUIRE(manager.Open(""));
  int64_t now = TestStart(chain.settings);

  bool created = true;
  REQUIRE(manager.MaybeCreate(chain.Extend(), chain.ledger, now, &created));
  REQUIRE_FALSE(created);
  REQUIRE(manager.MaybeCreate(chain.Extend(), chain.ledger, now, &created));
  REQUIRE(created);
  REQUIRE(manager.LatestHeight() == 2);

  // Same block again is a no-op.
  REQUIRE(manager.MaybeCreate(chain.blocks[2], chain.ledger, now, &created));
  REQUIRE_FALSE(created);

  const Checkpoint* c = manager.Latest();
  REQUIRE(c->blockHash == chain.blocks[2].hash);
  REQUIRE(c->utxoDigest == chain.ledger.Digest());
  REQUIRE(c->issued == chain.ledger.Issued());
  REQUIRE(manager.Verify(*c));
}

TEST_CASE("checkpoint  prepare  ledger not at block  refused", "[checkpoint tests]") {
  ChainFixture chain(3, CheckpointSettings());
  CheckpointManager manager(chain.settings);
  Checkpoint out;
  REQUIRE_FALSE(manager.Prepare(chain.blocks[2], chain.ledger, 0, out));
  REQUIRE_FALSE(manager.Prepare(chain.blocks[0], chain.ledger, 0, out));

  chain.Extend();
  REQUIRE(manager.Prepare(chain.blocks[4], chain.ledger, 0, out));
  REQUIRE(manager.LatestHeight() == -1);
  REQUIRE(manager.Commit(out));
  REQUIRE(manager.LatestHeight() == 4);
}

TEST_CASE("checkpoint  restore  rebuilds ledger", "[checkpoint tests]") {
  ChainFixture chain(4, CheckpointSettings());
  CheckpointManager manager(chain.settings);
  REQUIRE(manager.MaybeCreate(chain.blocks[4], chain.ledger, 0));
  Bytes digest = chain.ledger.Digest();

  chain.Extend();
  UtxoLedger restored;
  REQUIRE(manager.Restore(*manager.Latest(), restored));
  REQUIRE(restored.Height() == 4);
  REQUIRE(restored.TipHash() == chain.blocks[4].hash);
  REQUIRE(restored.Digest() == digest);
}

TEST_CASE("checkpoint  verify  detects tampering", "[checkpoint tests]") {
  ChainFixture chain(2, CheckpointSettings());
  CheckpointManager manager(chain.settings);
  REQUIRE(manager.MaybeCreate(chain.blocks[2], chain.ledger, 0));
  Checkpoint c = *manager.Latest();

  SECTION("snapshot altered") {
    c.snapshot.back() ^= 0x01;
    REQUIRE_FALSE(manager.Verify(c));
    UtxoLedger ledger;
    REQUIRE_FALSE(manager.Restore(c, ledger));
  }

  SECTION("issued altered") {
    c.issued += 1;
    REQUIRE_FALSE(manager.Verify(c));
  }

  SECTION("disagrees with trusted hash") {
    chain.settings.trustedCheckpoints[2] = std::string(64, 'f');
    REQUIRE_FALSE(manager.Verify(c));
  }
}

TEST_CASE("checkpoint  retention and drop above", "[checkpoint tests]") {
  Settings settings = CheckpointSettings();
  settings.checkpointInterval = 1;
  settings.checkpointRetention = 2;
  ChainFixture chain(0, settings);
  CheckpointManager manager(chain.settings);
  for (int i = 0; i < 4; ++i) {
    REQUIRE(manager.MaybeCreate(chain.Extend(), chain.ledger, 0));
  }
  REQUIRE(manager.Heights() == std::vector<int64_t>{3, 4});

  REQUIRE(manager.AnchorFor(2) == nullptr);
  REQUIRE(manager.AnchorFor(3)->height == 3);
  REQUIRE(manager.AnchorFor(10)->height == 4);

  manager.DropAbove(3);
  REQUIRE(manager.Heights() == std::vector<int64_t>{3});
}

TEST_CASE("checkpoint  open  reloads from disk and skips corrupt files",
          "[checkpoint tests]") {
  TempDir dir("checkpoints");
  ChainFixture chain(4, CheckpointSettings());
  {
    CheckpointManager manager(chain.settings);
    REQUIRE(manager.Open(dir.path));
    REQUIRE(manager.MaybeCreate(chain.blocks[4], chain.ledger, 0));
  }
  REQUIRE(WriteFileBytes(JoinPath(JoinPath(dir.path, "checkpoints"), "6.chk"), Bytes(40, 7)));

  CheckpointManager reopened(chain.settings);
  REQUIRE(reopened.Open(dir.path));
  REQUIRE(reopened.Heights() == std::vector<int64_t>{4});
  REQUIRE(reopened.Latest()->utxoDigest == chain.ledger.Digest());

  reopened.DropAbove(0);
  REQUIRE_FALSE(FileExists(JoinPath(JoinPath(dir.path, "checkpoints"), "4.chk")));
}

TEST_CASE("checkpoint  merkle proof  anchored to checkpoint", "[checkpoint tests]") {
  ChainFixture chain(2, CheckpointSettings());
  CheckpointManager manager(chain.settings);
  REQUIRE(manager.MaybeCreate(chain.blocks[2], chain.ledger, 0));

  Transaction a = PayBack(*chain.key, chain.blocks[1], 1000, chain.settings);
  Transaction b = PayBack(*chain.key, chain.blocks[2], 1000, chain.settings);
  const Block& block = chain.Extend({a, b}, 2000);

  MerkleProof proof;
  REQUIRE(manager.BuildMerkleProof(block, b.id, proof));
  REQUIRE(proof.height == 3);
  REQUIRE(proof.merkleRoot == block.merkleRoot);
  REQUIRE(proof.checkpointHeight == 2);
  REQUIRE(proof.checkpointHash == chain.blocks[2].hash);
  REQUIRE(VerifyMerkleProof(proof));

  REQUIRE_FALSE(manager.BuildMerkleProof(block, Bytes(32, 3), proof));
}
