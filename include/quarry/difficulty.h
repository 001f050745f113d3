#pragma once

#include <cstdint>
#include <vector>

#include "quarry/block.h"

struct Settings;

// Both functions take the chain ending at the parent of the block being
// built or checked, oldest first. They are pure over that history.
struct DifficultyAdjuster {
  const Settings& settings;

  explicit DifficultyAdjuster(const Settings& s);

  // Number of trailing ancestors NextTargetBits and MedianTimePast need.
  size_t WindowSize() const;

  uint32_t NextTargetBits(const std::vector<BlockHeader>& ancestors) const;
  int64_t MedianTimePast(const std::vector<BlockHeader>& ancestors) const;
};
