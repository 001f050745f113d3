#include "quarry/miner.h"

#include <chrono>
#include <iostream>

#include "quarry/consensus_engine.h"
#include "quarry/crypto.h"
#include "quarry/pow.h"

Miner::Miner(std::shared_ptr<ConsensusEngine> e, const Bytes& pkh,
             const std::string& data)
    : engine(std::move(e)), pubKeyHash(pkh), coinbaseData(data) {}

Miner::~Miner() {
  Stop();
}

void Miner::Start() {
  if (running.exchange(true)) {
    return;
  }
  if (worker.joinable()) {
    worker.join();
  }
  worker = std::thread([this]() { Loop(); });
}

void Miner::Stop() {
  running.store(false);
  engine->CancelMining();
  if (worker.joinable()) {
    worker.join();
  }
}

bool Miner::IsRunning() const {
  return running.load();
}

uint64_t Miner::BlocksMined() const {
  return mined.load();
}

Error Miner::MineOne(Block* out) {
  BlockTemplate tmpl;
  Error err = engine->GetBlockTemplate(tmpl);
  if (err != Error::kOk) {
    return err;
  }
  if (engine->Now() < tmpl.notBefore) {
    return Error::kNotFound;
  }

  Block block = tmpl.Build(pubKeyHash, coinbaseData);
  ProofOfWork pow(&block, engine->GetSettings().minerCheckInterval);
  if (!pow.Run(tmpl.abort)) {
    return Error::kNotFound;
  }
  err = engine->SubmitMinedBlock(block);
  if (err != Error::kOk) {
    std::cerr << "Mined block " << block.height << " rejected: " << DescribeError(err) << "\n";
    return err;
  }
  ++mined;
  if (out) {
    *out = block;
  }
  return Error::kOk;
}

void Miner::Loop() {
  while (running.load()) {
    if (engine->IsHalted()) {
      std::cerr << "Miner stopping, engine halted\n";
      running.store(false);
      return;
    }
    engine->Maintain();
    Error err = MineOne();
    if (err == Error::kNotFound) {
      std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
  }
}
