#include "quarry/pow.h"

#include <limits>

#include "quarry/block.h"

CancellationToken NewCancellationToken() {
  return std::make_shared<std::atomic<bool>>(false);
}

bool IsCancelled(const CancellationToken& token) {
  return token && token->load();
}

bool CompactToTarget(uint32_t bits, BIGNUM* outTarget) {
  if (!outTarget) {
    return false;
  }
  BN_zero(outTarget);
  uint32_t exponent = bits >> 24;
  uint32_t mantissa = bits & 0x007fffff;
  if (mantissa == 0) {
    return false;
  }
  if (bits & 0x00800000) {
    return false;
  }
  if (!BN_set_word(outTarget, mantissa)) {
    return false;
  }
  if (exponent <= 3) {
    BN_rshift(outTarget, outTarget, 8 * static_cast<int>(3 - exponent));
  } else {
    BN_lshift(outTarget, outTarget, 8 * static_cast<int>(exponent - 3));
  }
  if (BN_num_bits(outTarget) > 256) {
    return false;
  }
  return BN_cmp(outTarget, BN_value_one()) >= 0;
}

uint32_t TargetToCompact(const BIGNUM* target) {
  if (!target || BN_is_zero(target) || BN_is_negative(target)) {
    return 0;
  }
  int size = BN_num_bytes(target);
  if (size <= 0) {
    return 0;
  }
  Bytes buf(static_cast<size_t>(size));
  BN_bn2bin(target, buf.data());

  uint32_t compact = 0;
  if (size <= 3) {
    uint32_t value = 0;
    for (int i = 0; i < size; ++i) {
      value = (value << 8) | buf[static_cast<size_t>(i)];
    }
    compact = value << (8 * (3 - size));
  } else {
    compact = (static_cast<uint32_t>(buf[0]) << 16) |
              (static_cast<uint32_t>(buf[1]) << 8) |
              static_cast<uint32_t>(buf[2]);
  }

  if (compact & 0x00800000) {
    compact >>= 8;
    size += 1;
  }
  compact |= static_cast<uint32_t>(size) << 24;
  return compact;
}

bool CheckTargetBits(uint32_t bits, uint32_t powLimitBits) {
  BIGNUM* target = BN_new();
  BIGNUM* limit = BN_new();
  if (!target || !limit) {
    BN_free(target);
    BN_free(limit);
    return false;
  }
  bool ok = CompactToTarget(bits, target) && CompactToTarget(powLimitBits, limit) &&
            BN_cmp(target, limit) <= 0;
  BN_free(target);
  BN_free(limit);
  return ok;
}

bool IsPowHashValid(const Bytes& hash, uint32_t targetBits) {
  if (hash.empty()) {
    return false;
  }
  BIGNUM* target = BN_new();
  BIGNUM* hashNum = BN_new();
  if (!target || !hashNum) {
    BN_free(target);
    BN_free(hashNum);
    return false;
  }
  bool ok = false;
  if (CompactToTarget(targetBits, target)) {
    BN_bin2bn(hash.data(), static_cast<int>(hash.size()), hashNum);
    ok = BN_cmp(hashNum, target) <= 0;
  }
  BN_free(target);
  BN_free(hashNum);
  return ok;
}

uint64_t BlockWork(uint32_t targetBits) {
  BIGNUM* target = BN_new();
  if (!target) {
    return 0;
  }
  if (!CompactToTarget(targetBits, target)) {
    BN_free(target);
    return 0;
  }

  BN_CTX* ctx = BN_CTX_new();
  BIGNUM* num = BN_new();
  BIGNUM* den = BN_new();
  BIGNUM* work = BN_new();
  if (!ctx || !num || !den || !work) {
    BN_free(target);
    BN_CTX_free(ctx);
    BN_free(num);
    BN_free(den);
    BN_free(work);
    return 0;
  }

  // 2^256 / (target + 1)
  BN_one(num);
  BN_lshift(num, num, 256);
  BN_copy(den, target);
  BN_add_word(den, 1);
  BN_div(work, nullptr, num, den, ctx);

  uint64_t out = 0;
  int bytes = BN_num_bytes(work);
  if (bytes > 8) {
    out = std::numeric_limits<uint64_t>::max();
  } else if (bytes > 0) {
    Bytes buf(static_cast<size_t>(bytes));
    BN_bn2bin(work, buf.data());
    for (unsigned char b : buf) {
      out = (out << 8) | static_cast<uint64_t>(b);
    }
  }

  BN_free(target);
  BN_CTX_free(ctx);
  BN_free(num);
  BN_free(den);
  BN_free(work);
  return out;
}

uint64_t AddWork(uint64_t total, uint64_t work) {
  if (std::numeric_limits<uint64_t>::max() - total < work) {
    return std::numeric_limits<uint64_t>::max();
  }
  return total + work;
}

ProofOfWork::ProofOfWork(Block* b, uint64_t checkInterval_)
    : block(b), checkInterval(checkInterval_ == 0 ? 1 : checkInterval_) {}

bool ProofOfWork::Run(const CancellationToken& abort) {
  const uint64_t maxNonce = std::numeric_limits<uint64_t>::max();
  for (uint64_t nonce = 0; nonce < maxNonce; ++nonce) {
    if (nonce % checkInterval == 0 && IsCancelled(abort)) {
      return false;
    }
    block->nonce = nonce;
    Bytes hash = block->BlockHeader::Hash();
    if (IsPowHashValid(hash, block->targetBits)) {
      block->hash = hash;
      return true;
    }
  }
  return false;
}

bool ProofOfWork::Validate() const {
  return IsPowHashValid(block->BlockHeader::Hash(), block->targetBits);
}
