#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include <openssl/bn.h>

#include "quarry/types.h"

struct Block;

// Shared between a miner and whoever may invalidate its work.
using CancellationToken = std::shared_ptr<std::atomic<bool>>;

CancellationToken NewCancellationToken();
bool IsCancelled(const CancellationToken& token);

bool CompactToTarget(uint32_t bits, BIGNUM* outTarget);
uint32_t TargetToCompact(const BIGNUM* target);
bool CheckTargetBits(uint32_t bits, uint32_t powLimitBits);
bool IsPowHashValid(const Bytes& hash, uint32_t targetBits);
uint64_t BlockWork(uint32_t targetBits);
uint64_t AddWork(uint64_t total, uint64_t work);

struct ProofOfWork {
  Block* block;
  uint64_t checkInterval;

  explicit ProofOfWork(Block* b, uint64_t checkInterval_ = 4096);

  bool Run(const CancellationToken& abort = nullptr);
  bool Validate() const;
};
