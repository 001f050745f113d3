#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "quarry/block.h"
#include "quarry/error.h"
#include "quarry/types.h"

class ConsensusEngine;

// Builds templates from the engine and searches nonces on a background
// thread. Work on a template stops as soon as the engine cancels it.
class Miner {
 public:
  Miner(std::shared_ptr<ConsensusEngine> engine, const Bytes& pubKeyHash,
        const std::string& coinbaseData = "");
  ~Miner();

  void Start();
  void Stop();
  bool IsRunning() const;

  // One template, one search. kOk with out filled when a block was found and
  // accepted; kNotFound when the search was cancelled or exhausted.
  Error MineOne(Block* out = nullptr);
  uint64_t BlocksMined() const;

 private:
  std::shared_ptr<ConsensusEngine> engine;
  Bytes pubKeyHash;
  std::string coinbaseData;
  std::atomic<bool> running{false};
  std::atomic<uint64_t> mined{0};
  std::thread worker;

  void Loop();
};
