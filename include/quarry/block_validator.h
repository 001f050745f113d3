#pragma once

#include <cstdint>
#include <vector>

#include "quarry/block.h"
#include "quarry/difficulty.h"
#include "quarry/error.h"
#include "quarry/tx_validator.h"
#include "quarry/utxo_view.h"

struct Settings;

// Three stages, each assuming the previous one passed:
//   Check   - context free: structure, proof of work, clock drift, merkle root
//   Accept  - against the parent header chain: height, median time, target
//   Connect - every transaction in block order against the parent's state
class BlockValidator {
 public:
  const Settings& settings;

  explicit BlockValidator(const Settings& s);

  Error Check(const Block& block, int64_t now) const;
  Error Accept(const Block& block, const std::vector<BlockHeader>& ancestors) const;
  Error Connect(const Block& block, UtxoView& view, Amount* feesOut = nullptr) const;

  // Subsidy for height, clipped to what is left under the supply cap.
  Amount AllowedSubsidy(int64_t height, Amount issued) const;

 private:
  TxValidator txValidator;
  DifficultyAdjuster difficulty;
};
