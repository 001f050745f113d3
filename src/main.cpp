#include <iostream>
#include <memory>
#include <string>

#include "quarry/consensus_engine.h"
#include "quarry/crypto.h"
#include "quarry/merkle.h"
#include "quarry/miner.h"
#include "quarry/pow.h"
#include "quarry/settings.h"

static void PrintUsage() {
  std::cout << "quarryd - proof-of-work consensus node\n\n";
  std::cout << "Usage:\n";
  std::cout << "  [global] -datadir DIR -conf FILE -regtest\n";
  std::cout << "  status\n";
  std::cout << "  mine -address PUBKEYHASH [-count N]\n";
  std::cout << "  getbalance -address PUBKEYHASH\n";
  std::cout << "  listunspent -address PUBKEYHASH\n";
  std::cout << "  getproof -txid TXID\n";
  std::cout << "  mempool\n";
  std::cout << "  verifychain\n";
  std::cout << "  printchain [-from HEIGHT] [-count N]\n";
}

static std::string GetArgValue(int argc, char** argv, const std::string& flag) {
  for (int i = 2; i < argc; ++i) {
    if (flag == argv[i] && i + 1 < argc) {
      return argv[i + 1];
    }
  }
  return "";
}

static bool HasFlag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (flag == argv[i]) {
      return true;
    }
  }
  return false;
}

static bool ParseCount(const std::string& text, int64_t def, int64_t& out) {
  if (text.empty()) {
    out = def;
    return true;
  }
  try {
    out = std::stoll(text);
  } catch (const std::exception&) {
    return false;
  }
  return out >= 0;
}

static bool ParsePubKeyHash(const std::string& text, Bytes& out) {
  out = HexToBytes(text);
  return out.size() == 20;
}

static std::string FormatAmount(Amount value) {
  std::string frac = std::to_string(value % kCoin);
  frac.insert(0, 8 - frac.size(), '0');
  return std::to_string(value / kCoin) + "." + frac;
}

static void PrintStatus(const EngineStatus& s) {
  std::cout << "Height: " << s.height << "\n";
  std::cout << "Tip: " << BytesToHex(s.tipHash) << "\n";
  std::cout << "Chain work: " << s.chainWork << "\n";
  std::cout << "Next target bits: " << s.nextTargetBits << "\n";
  std::cout << "Median time past: " << s.medianTimePast << "\n";
  std::cout << "Known blocks: " << s.knownBlocks << " (" << s.tips << " tips)\n";
  std::cout << "Orphans: " << s.orphans << "\n";
  std::cout << "Mempool: " << s.mempool << "\n";
  std::cout << "Latest checkpoint: " << s.latestCheckpoint << "\n";
  std::cout << "Issued: " << FormatAmount(s.issued) << "\n";
}

static int Run(ConsensusEngine& engine, std::shared_ptr<ConsensusEngine> shared,
               const std::string& command, int argc, char** argv) {
  if (command == "status") {
    PrintStatus(engine.GetStatus());
    return 0;
  }

  if (command == "mine") {
    Bytes pkh;
    int64_t count = 0;
    if (!ParsePubKeyHash(GetArgValue(argc, argv, "-address"), pkh)) {
      std::cerr << "-address must be a 20-byte hex public key hash\n";
      return 1;
    }
    if (!ParseCount(GetArgValue(argc, argv, "-count"), 1, count) || count == 0) {
      std::cerr << "-count must be > 0\n";
      return 1;
    }
    Miner miner(shared, pkh, "quarryd");
    for (int64_t i = 0; i < count; ++i) {
      Error err = miner.MineOne();
      if (err != Error::kOk) {
        std::cerr << "Mining failed at block " << i << ": " << DescribeError(err) << "\n";
        return 1;
      }
    }
    return 0;
  }

  if (command == "getbalance") {
    Bytes pkh;
    if (!ParsePubKeyHash(GetArgValue(argc, argv, "-address"), pkh)) {
      std::cerr << "-address must be a 20-byte hex public key hash\n";
      return 1;
    }
    std::cout << "Balance: " << FormatAmount(engine.GetBalance(pkh)) << "\n";
    return 0;
  }

  if (command == "listunspent") {
    Bytes pkh;
    if (!ParsePubKeyHash(GetArgValue(argc, argv, "-address"), pkh)) {
      std::cerr << "-address must be a 20-byte hex public key hash\n";
      return 1;
    }
    for (const auto& u : engine.ListUnspent(pkh)) {
      std::cout << u.outpoint.Key() << " " << FormatAmount(u.entry.output.value)
                << " height " << u.entry.height << (u.entry.coinbase ? " coinbase" : "")
                << "\n";
    }
    return 0;
  }

  if (command == "getproof") {
    Bytes txid = HexToBytes(GetArgValue(argc, argv, "-txid"));
    MerkleProof proof;
    Error err = engine.GetMerkleProof(txid, proof);
    if (err != Error::kOk) {
      std::cerr << DescribeError(err) << "\n";
      return 1;
    }
    std::cout << "Block: " << proof.height << " " << BytesToHex(proof.blockHash) << "\n";
    std::cout << "Merkle root: " << BytesToHex(proof.merkleRoot) << "\n";
    for (const auto& step : proof.path) {
      std::cout << "  " << (step.siblingOnLeft ? "L " : "R ") << BytesToHex(step.sibling)
                << "\n";
    }
    if (proof.checkpointHeight >= 0) {
      std::cout << "Anchored at checkpoint " << proof.checkpointHeight << " "
                << BytesToHex(proof.checkpointHash) << "\n";
    }
    std::cout << "Valid: " << (VerifyMerkleProof(proof) ? "true" : "false") << "\n";
    return 0;
  }

  if (command == "mempool") {
    MempoolInfo info = engine.GetMempoolInfo();
    std::cout << "Transactions: " << info.count << " (" << info.bytes << " bytes)\n";
    std::cout << "Queued future nonces: " << info.futureCount << "\n";
    std::cout << "Fee rate min/median/max: " << info.minFeeRate << "/" << info.medianFeeRate
              << "/" << info.maxFeeRate << "\n";
    std::cout << "Total fees: " << FormatAmount(info.totalFees) << "\n";
    std::cout << "Banned senders: " << info.bannedSenders << "\n";
    std::cout << "Accepted " << info.accepted << ", rejected " << info.rejected
              << ", evicted " << info.evicted << ", expired " << info.expired
              << ", replaced " << info.replaced << "\n";
    return 0;
  }

  if (command == "verifychain") {
    bool ok = engine.CheckSupplyInvariant();
    std::cout << "Supply invariant: " << (ok ? "ok" : "VIOLATED") << "\n";
    std::cout << "Ledger digest: " << BytesToHex(engine.LedgerDigest()) << "\n";
    return ok ? 0 : 1;
  }

  if (command == "printchain") {
    int64_t from = 0;
    int64_t count = 0;
    if (!ParseCount(GetArgValue(argc, argv, "-from"), 0, from) ||
        !ParseCount(GetArgValue(argc, argv, "-count"), 20, count)) {
      std::cerr << "-from and -count must be non-negative\n";
      return 1;
    }
    for (const auto& header : engine.GetHeaders(from, static_cast<size_t>(count))) {
      Block block;
      if (!engine.GetBlockAt(header.height, block)) {
        continue;
      }
      std::cout << "--- Block " << block.height << " ---\n";
      std::cout << "Hash: " << BytesToHex(block.hash) << "\n";
      std::cout << "Prev: " << BytesToHex(block.prevBlockHash) << "\n";
      std::cout << "Time: " << block.timestamp << "\n";
      std::cout << "Target bits: " << block.targetBits << "\n";
      ProofOfWork pow(&block);
      std::cout << "PoW valid: " << (pow.Validate() ? "true" : "false") << "\n";
      for (const auto& tx : block.transactions) {
        std::cout << "  TX " << BytesToHex(tx.id) << "\n";
      }
      std::cout << "\n";
    }
    return 0;
  }

  PrintUsage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage();
    return 1;
  }

  std::string command = argv[1];
  Settings settings = HasFlag(argc, argv, "-regtest") ? RegtestSettings() : MainnetSettings();
  std::string conf = GetArgValue(argc, argv, "-conf");
  if (!conf.empty() && !LoadSettingsFile(conf, settings)) {
    std::cerr << "Failed to load " << conf << "\n";
    return 1;
  }
  std::string dataDir = GetArgValue(argc, argv, "-datadir");
  if (!dataDir.empty()) {
    settings.dataDir = dataDir;
  }
  if (settings.dataDir.empty()) {
    settings.dataDir = "quarry-data";
  }

  auto engine = std::make_shared<ConsensusEngine>(settings);
  Error err = engine->Open();
  if (err != Error::kOk) {
    std::cerr << "Failed to open chain: " << DescribeError(err) << "\n";
    return 1;
  }

  int rc = Run(*engine, engine, command, argc, argv);
  if (!engine->Flush() || engine->IsHalted()) {
    std::cerr << "Engine halted after a storage failure\n";
    return 2;
  }
  return rc;
}
