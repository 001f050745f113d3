#include "quarry/difficulty.h"

#include <algorithm>

#include <openssl/bn.h>

#include "quarry/pow.h"
#include "quarry/settings.h"

DifficultyAdjuster::DifficultyAdjuster(const Settings& s) : settings(s) {}

size_t DifficultyAdjuster::WindowSize() const {
  size_t retarget = static_cast<size_t>(settings.retargetInterval) + 1;
  return std::max(retarget, settings.medianTimeSpan);
}

uint32_t DifficultyAdjuster::NextTargetBits(
    const std::vector<BlockHeader>& ancestors) const {
  if (ancestors.empty()) {
    return settings.powLimitBits;
  }
  const BlockHeader& last = ancestors.back();
  uint32_t lastBits = last.targetBits == 0 ? settings.powLimitBits : last.targetBits;
  int64_t interval = settings.retargetInterval <= 0 ? 1 : settings.retargetInterval;
  if ((last.height + 1) % interval != 0) {
    return lastBits;
  }

  int64_t firstHeight = std::max<int64_t>(0, last.height - interval);
  const BlockHeader* first = &ancestors.front();
  for (const auto& h : ancestors) {
    if (h.height == firstHeight) {
      first = &h;
      break;
    }
  }
  int64_t span = last.height - first->height;
  if (span <= 0) {
    return lastBits;
  }
  int64_t expected = span * settings.targetBlockTime;
  int64_t actual = last.timestamp - first->timestamp;

  int64_t factor = std::max<int64_t>(1, settings.maxAdjustmentFactor);
  int64_t minActual = std::max<int64_t>(1, expected / factor);
  int64_t maxActual = expected * factor;
  if (actual < minActual) {
    actual = minActual;
  }
  if (actual > maxActual) {
    actual = maxActual;
  }

  BN_CTX* ctx = BN_CTX_new();
  BIGNUM* target = BN_new();
  BIGNUM* limit = BN_new();
  BIGNUM* mul = BN_new();
  BIGNUM* div = BN_new();
  if (!ctx || !target || !limit || !mul || !div) {
    BN_CTX_free(ctx);
    BN_free(target);
    BN_free(limit);
    BN_free(mul);
    BN_free(div);
    return lastBits;
  }

  uint32_t next = lastBits;
  if (CompactToTarget(lastBits, target) &&
      CompactToTarget(settings.powLimitBits, limit) &&
      BN_set_word(mul, static_cast<BN_ULONG>(actual)) &&
      BN_set_word(div, static_cast<BN_ULONG>(expected)) &&
      BN_mul(target, target, mul, ctx) &&
      BN_div(target, nullptr, target, div, ctx)) {
    if (BN_cmp(target, limit) > 0) {
      BN_copy(target, limit);
    }
    if (BN_is_zero(target)) {
      BN_one(target);
    }
    next = TargetToCompact(target);
  }

  BN_CTX_free(ctx);
  BN_free(target);
  BN_free(limit);
  BN_free(mul);
  BN_free(div);
  return next;
}

int64_t DifficultyAdjuster::MedianTimePast(
    const std::vector<BlockHeader>& ancestors) const {
  if (ancestors.empty()) {
    return 0;
  }
  size_t span = std::min(settings.medianTimeSpan, ancestors.size());
  std::vector<int64_t> times;
  times.reserve(span);
  for (size_t i = ancestors.size() - span; i < ancestors.size(); ++i) {
    times.push_back(ancestors[i].timestamp);
  }
  std::sort(times.begin(), times.end());
  return times[times.size() / 2];
}
