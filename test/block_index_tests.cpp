#include <catch2/catch.hpp>

#include "quarry/block_index.h"
#include "test_helpers.h"

namespace {

// Two branches off a1: a2 - a3 and b2 - b3 - b4.
struct ForkFixture {
  Settings settings = TestSettings();
  std::unique_ptr<KeyPair> key = NewKey();
  BlockIndex index;
  Block genesis = MakeGenesisBlock(settings);
  std::vector<Block> a;
  std::vector<Block> b;

  ForkFixture() {
    REQUIRE(index.Add(genesis));
    Block parent = genesis;
    for (int i = 0; i < 3; ++i) {
      parent = MineChild(settings, parent, key->PubKeyHash(), {}, 0, "a");
      REQUIRE(index.Add(parent));
      a.push_back(parent);
    }
    parent = a[0];
    for (int i = 0; i < 3; ++i) {
      parent = MineChild(settings, parent, key->PubKeyHash(), {}, 0, "b");
      REQUIRE(index.Add(parent));
      b.push_back(parent);
    }
  }
};

}  // namespace

// Start Test Suite: block index tests

TEST_CASE("block index  add  accumulates chain work", "[block index tests]") {
  ForkFixture f;
  uint64_t work = BlockWork(f.settings.powLimitBits);
  REQUIRE(f.index.Size() == 7);
  REQUIRE(f.index.Find(f.genesis.hash)->chainWork == work);
  REQUIRE(f.index.Find(f.a[2].hash)->chainWork == 4 * work);
  REQUIRE(f.index.Find(f.b[2].hash)->chainWork == 5 * work);
  REQUIRE(f.index.GetBlock(f.b[1].hash)->hash == f.b[1].hash);
}

TEST_CASE("block index  add  rejects duplicates and unknown parents", "[block index tests]") {
  ForkFixture f;
  REQUIRE_FALSE(f.index.Add(f.a[0]));
  Block stray = f.a[1];
  stray.prevBlockHash = Bytes(32, 9);
  stray.UpdateHash();
  REQUIRE_FALSE(f.index.Add(stray));
  REQUIRE_FALSE(f.index.Contains(stray.hash));
}

TEST_CASE("block index  best tip  most work wins", "[block index tests]") {
  ForkFixture f;
  REQUIRE(f.index.BestTip()->hash == f.b[2].hash);
  std::vector<const BlockIndexEntry*> tips = f.index.Tips();
  REQUIRE(tips.size() == 2);
  REQUIRE(tips.front()->hash == f.b[2].hash);
}

TEST_CASE("block index  best tip  equal work  lower hash wins", "[block index tests]") {
  BlockIndexEntry x;
  BlockIndexEntry y;
  x.chainWork = y.chainWork = 10;
  x.hash = Bytes(32, 1);
  y.hash = Bytes(32, 2);
  REQUIRE(BlockIndex::IsBetterTip(x, y));
  REQUIRE_FALSE(BlockIndex::IsBetterTip(y, x));
  y.chainWork = 11;
  REQUIRE(BlockIndex::IsBetterTip(y, x));
}

TEST_CASE("block index  mark invalid  taints descendants", "[block index tests]") {
  ForkFixture f;
  f.index.MarkInvalid(f.b[0].hash);
  REQUIRE(f.index.IsInvalid(f.b[0].hash));
  REQUIRE(f.index.IsInvalid(f.b[2].hash));
  REQUIRE_FALSE(f.index.IsInvalid(f.a[0].hash));
  REQUIRE(f.index.BestTip()->hash == f.a[2].hash);

  Block late = MineChild(f.settings, f.b[2], f.key->PubKeyHash());
  REQUIRE(f.index.Add(late));
  REQUIRE(f.index.IsInvalid(late.hash));
}

TEST_CASE("block index  find fork  common ancestor", "[block index tests]") {
  ForkFixture f;
  REQUIRE(f.index.FindFork(f.a[2].hash, f.b[2].hash)->hash == f.a[0].hash);
  REQUIRE(f.index.FindFork(f.a[2].hash, f.a[1].hash)->hash == f.a[1].hash);
  REQUIRE(f.index.FindFork(f.a[2].hash, Bytes(32, 7)) == nullptr);
}

TEST_CASE("block index  branch and ancestors  oldest first", "[block index tests]") {
  ForkFixture f;
  std::vector<const Block*> branch = f.index.Branch(f.a[0].hash, f.b[2].hash);
  REQUIRE(branch.size() == 3);
  REQUIRE(branch[0]->hash == f.b[0].hash);
  REQUIRE(branch[2]->hash == f.b[2].hash);
  REQUIRE(f.index.Branch(f.a[1].hash, f.b[2].hash).empty());

  std::vector<BlockHeader> headers = f.index.Ancestors(f.b[2].hash, 3);
  REQUIRE(headers.size() == 3);
  REQUIRE(headers.front().height == 2);
  REQUIRE(headers.back().height == 4);
  REQUIRE(f.index.Ancestors(f.b[2].hash, 100).size() == 5);
}

TEST_CASE("block index  active chain  switches with tip", "[block index tests]") {
  ForkFixture f;
  f.index.SetActiveTip(f.a[2].hash);
  REQUIRE(f.index.ActiveHeight() == 3);
  REQUIRE(f.index.IsActive(f.a[1].hash));
  REQUIRE_FALSE(f.index.IsActive(f.b[0].hash));
  REQUIRE(f.index.AncestorAt(f.a[2].hash, 1)->hash == f.a[0].hash);

  f.index.SetActiveTip(f.b[2].hash);
  REQUIRE(f.index.ActiveTip()->hash == f.b[2].hash);
  REQUIRE(f.index.ActiveHeight() == 4);
  REQUIRE(f.index.ActiveAt(2)->hash == f.b[0].hash);
  REQUIRE(f.index.ActiveAt(1)->hash == f.a[0].hash);
  REQUIRE_FALSE(f.index.IsActive(f.a[1].hash));
  REQUIRE(f.index.AncestorAt(f.a[2].hash, 2)->hash == f.a[1].hash);
  REQUIRE(f.index.ActiveAt(5) == nullptr);
}
