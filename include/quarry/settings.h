#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

#include "quarry/types.h"

struct Settings {
  // Proof of work.
  uint32_t powLimitBits = 0x1f00ffff;
  int64_t targetBlockTime = 120;
  int64_t retargetInterval = 10;
  int64_t maxAdjustmentFactor = 4;
  size_t medianTimeSpan = 11;
  int64_t maxFutureDrift = 2 * 60 * 60;

  // Genesis.
  int64_t genesisTimestamp = 1704067200;
  std::string genesisData = "quarry genesis";
  Bytes genesisPubKeyHash = Bytes(20, 0);

  // Issuance.
  Amount initialReward = 12 * kCoin;
  int64_t halvingInterval = 262800;
  Amount supplyCap = 121000000 * kCoin;
  int64_t coinbaseMaturity = 100;

  // Structure limits.
  size_t maxBlockBytes = 1000000;
  size_t maxTxBytes = 100000;
  int64_t maxTxFutureSeconds = 300;

  // Mempool policy.
  size_t mempoolMaxEntries = 10000;
  size_t mempoolMaxBytes = 32 * 1000 * 1000;
  size_t mempoolMaxPerSender = 100;
  Amount minFeeRatePerKb = 1000;
  uint64_t futureNonceWindow = 16;
  size_t futureNonceMaxEntries = 1000;
  int64_t mempoolMaxAge = 24 * 60 * 60;
  int invalidTxThreshold = 3;
  int64_t invalidWindowSeconds = 900;
  int64_t invalidBanSeconds = 900;
  int64_t replacementBumpPercent = 10;

  // Orphan blocks.
  size_t orphanMaxEntries = 100;
  int64_t orphanTtl = 20 * 60;

  // Fork choice.
  int64_t maxReorgDepth = 100;

  // Checkpoints.
  int64_t checkpointInterval = 1000;
  size_t checkpointRetention = 10;
  std::map<int64_t, std::string> trustedCheckpoints;

  // Mining.
  int64_t miningCooldown = 5;
  uint64_t minerCheckInterval = 4096;

  std::string dataDir;
};

Settings MainnetSettings();
Settings RegtestSettings();

Amount BlockSubsidy(const Settings& settings, int64_t height);

bool LoadSettingsFile(const std::string& path, Settings& settings);
bool ApplySetting(Settings& settings, const std::string& key,
                  const std::string& value);
