#include "quarry/settings.h"

#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "quarry/crypto.h"
#include "quarry/storage.h"

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(start, end - start);
}

static bool ParseI64(const std::string& text, int64_t& out) {
  try {
    size_t used = 0;
    out = std::stoll(text, &used, 0);
    return used == text.size();
  } catch (const std::exception&) {
    return false;
  }
}

static bool ParseSize(const std::string& text, size_t& out) {
  int64_t v = 0;
  if (!ParseI64(text, v) || v < 0) {
    return false;
  }
  out = static_cast<size_t>(v);
  return true;
}

Settings MainnetSettings() {
  return Settings{};
}

Settings RegtestSettings() {
  Settings s;
  s.powLimitBits = 0x207fffff;
  s.targetBlockTime = 1;
  s.retargetInterval = 10;
  s.coinbaseMaturity = 0;
  s.minFeeRatePerKb = 100;
  s.checkpointInterval = 10;
  s.miningCooldown = 0;
  s.minerCheckInterval = 64;
  return s;
}

Amount BlockSubsidy(const Settings& settings, int64_t height) {
  if (height < 0 || settings.halvingInterval <= 0) {
    return 0;
  }
  int64_t halvings = height / settings.halvingInterval;
  if (halvings >= 63) {
    return 0;
  }
  return settings.initialReward >> halvings;
}

bool ApplySetting(Settings& settings, const std::string& key,
                  const std::string& value) {
  int64_t i = 0;
  size_t z = 0;
  if (key == "powlimitbits") {
    if (!ParseI64(value, i) || i <= 0 || i > 0xffffffffLL) {
      return false;
    }
    settings.powLimitBits = static_cast<uint32_t>(i);
    return true;
  }
  if (key == "targetblocktime") {
    return ParseI64(value, settings.targetBlockTime) && settings.targetBlockTime > 0;
  }
  if (key == "retargetinterval") {
    return ParseI64(value, settings.retargetInterval) && settings.retargetInterval > 0;
  }
  if (key == "maxadjustmentfactor") {
    return ParseI64(value, settings.maxAdjustmentFactor) &&
           settings.maxAdjustmentFactor >= 1;
  }
  if (key == "mediantimespan") {
    return ParseSize(value, settings.medianTimeSpan) && settings.medianTimeSpan > 0;
  }
  if (key == "maxfuturedrift") {
    return ParseI64(value, settings.maxFutureDrift) && settings.maxFutureDrift >= 0;
  }
  if (key == "genesistimestamp") {
    return ParseI64(value, settings.genesisTimestamp);
  }
  if (key == "genesisdata") {
    settings.genesisData = value;
    return true;
  }
  if (key == "genesispubkeyhash") {
    Bytes pkh = HexToBytes(value);
    if (pkh.size() != 20) {
      return false;
    }
    settings.genesisPubKeyHash = pkh;
    return true;
  }
  if (key == "initialreward") {
    return ParseI64(value, settings.initialReward) && settings.initialReward >= 0;
  }
  if (key == "halvinginterval") {
    return ParseI64(value, settings.halvingInterval) && settings.halvingInterval > 0;
  }
  if (key == "supplycap") {
    return ParseI64(value, settings.supplyCap) && settings.supplyCap >= 0;
  }
  if (key == "coinbasematurity") {
    return ParseI64(value, settings.coinbaseMaturity) && settings.coinbaseMaturity >= 0;
  }
  if (key == "maxblockbytes") {
    return ParseSize(value, settings.maxBlockBytes);
  }
  if (key == "maxtxbytes") {
    return ParseSize(value, settings.maxTxBytes);
  }
  if (key == "mempoolmaxentries") {
    return ParseSize(value, settings.mempoolMaxEntries);
  }
  if (key == "mempoolmaxbytes") {
    return ParseSize(value, settings.mempoolMaxBytes);
  }
  if (key == "mempoolmaxpersender") {
    return ParseSize(value, settings.mempoolMaxPerSender);
  }
  if (key == "minfeerate") {
    return ParseI64(value, settings.minFeeRatePerKb) && settings.minFeeRatePerKb >= 0;
  }
  if (key == "futurenoncewindow") {
    if (!ParseSize(value, z)) {
      return false;
    }
    settings.futureNonceWindow = z;
    return true;
  }
  if (key == "mempoolmaxage") {
    return ParseI64(value, settings.mempoolMaxAge) && settings.mempoolMaxAge > 0;
  }
  if (key == "invalidtxthreshold") {
    if (!ParseI64(value, i) || i <= 0) {
      return false;
    }
    settings.invalidTxThreshold = static_cast<int>(i);
    return true;
  }
  if (key == "invalidwindow") {
    return ParseI64(value, settings.invalidWindowSeconds);
  }
  if (key == "invalidban") {
    return ParseI64(value, settings.invalidBanSeconds);
  }
  if (key == "orphanmaxentries") {
    return ParseSize(value, settings.orphanMaxEntries);
  }
  if (key == "orphanttl") {
    return ParseI64(value, settings.orphanTtl) && settings.orphanTtl > 0;
  }
  if (key == "maxreorgdepth") {
    return ParseI64(value, settings.maxReorgDepth) && settings.maxReorgDepth >= 0;
  }
  if (key == "checkpointinterval") {
    return ParseI64(value, settings.checkpointInterval) &&
           settings.checkpointInterval > 0;
  }
  if (key == "checkpointretention") {
    return ParseSize(value, settings.checkpointRetention) &&
           settings.checkpointRetention > 0;
  }
  if (key == "checkpoint") {
    // height:blockhash
    size_t colon = value.find(':');
    if (colon == std::string::npos) {
      return false;
    }
    if (!ParseI64(value.substr(0, colon), i) || i < 0) {
      return false;
    }
    std::string hash = value.substr(colon + 1);
    if (HexToBytes(hash).size() != 32) {
      return false;
    }
    settings.trustedCheckpoints[i] = hash;
    return true;
  }
  if (key == "miningcooldown") {
    return ParseI64(value, settings.miningCooldown) && settings.miningCooldown >= 0;
  }
  if (key == "datadir") {
    settings.dataDir = value;
    return true;
  }
  return false;
}

bool LoadSettingsFile(const std::string& path, Settings& settings) {
  Bytes data;
  if (!ReadFileBytes(path, data)) {
    std::cerr << "Cannot read config file " << path << "\n";
    return false;
  }
  std::string text(data.begin(), data.end());
  std::istringstream in(text);
  std::string line;
  int lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;
    line = Trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    size_t eq = line.find('=');
    if (eq == std::string::npos) {
      std::cerr << path << ":" << lineNo << ": expected key=value\n";
      return false;
    }
    std::string key = Trim(line.substr(0, eq));
    std::string value = Trim(line.substr(eq + 1));
    if (!ApplySetting(settings, key, value)) {
      std::cerr << path << ":" << lineNo << ": bad setting '" << key << "'\n";
      return false;
    }
  }
  return true;
}
