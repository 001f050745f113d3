#include "quarry/block_validator.h"

#include <algorithm>

#include "quarry/crypto.h"
#include "quarry/pow.h"
#include "quarry/settings.h"

BlockValidator::BlockValidator(const Settings& s)
    : settings(s), txValidator(s), difficulty(s) {}

Error BlockValidator::Check(const Block& block, int64_t now) const {
  if (block.transactions.empty()) {
    return Error::kEmptyBlock;
  }
  if (block.Size() > settings.maxBlockBytes) {
    return Error::kBlockTooLarge;
  }
  if (block.prevBlockHash.size() != kHashSize) {
    return Error::kMalformed;
  }
  if (!block.transactions.front().IsCoinbase()) {
    return Error::kMissingCoinbase;
  }
  for (size_t i = 1; i < block.transactions.size(); ++i) {
    if (block.transactions[i].IsCoinbase()) {
      return Error::kExtraCoinbase;
    }
  }
  for (const auto& tx : block.transactions) {
    Error err = txValidator.CheckTransaction(tx);
    if (err != Error::kOk) {
      return err;
    }
  }
  if (CoinbaseHeight(block.transactions.front()) != block.height) {
    return Error::kBadHeight;
  }

  if (!CheckTargetBits(block.targetBits, settings.powLimitBits)) {
    return Error::kBadTargetBits;
  }
  Bytes hash = block.BlockHeader::Hash();
  if (!block.hash.empty() && block.hash != hash) {
    return Error::kBadProofOfWork;
  }
  if (!IsPowHashValid(hash, block.targetBits)) {
    return Error::kBadProofOfWork;
  }

  if (block.timestamp > now + settings.maxFutureDrift) {
    return Error::kTimestampTooNew;
  }

  if (block.HashTransactions() != block.merkleRoot) {
    return Error::kBadMerkleRoot;
  }
  return Error::kOk;
}

Error BlockValidator::Accept(const Block& block,
                             const std::vector<BlockHeader>& ancestors) const {
  if (ancestors.empty()) {
    return Error::kInvalidAncestor;
  }
  const BlockHeader& parent = ancestors.back();
  if (block.height != parent.height + 1) {
    return Error::kBadHeight;
  }
  if (block.timestamp < difficulty.MedianTimePast(ancestors)) {
    return Error::kTimestampTooOld;
  }
  if (block.targetBits != difficulty.NextTargetBits(ancestors)) {
    return Error::kBadTargetBits;
  }
  auto trusted = settings.trustedCheckpoints.find(block.height);
  if (trusted != settings.trustedCheckpoints.end() &&
      BytesToHex(block.BlockHeader::Hash()) != trusted->second) {
    return Error::kCheckpointMismatch;
  }
  return Error::kOk;
}

Error BlockValidator::Connect(const Block& block, UtxoView& view,
                              Amount* feesOut) const {
  UtxoView scratch(static_cast<const UtxoSource&>(view));
  Amount fees = 0;
  Amount unused = 0;
  Error cbErr = scratch.ApplyTransaction(block.transactions.front(), block.height, unused);
  if (cbErr != Error::kOk) {
    return cbErr;
  }
  for (size_t i = 1; i < block.transactions.size(); ++i) {
    const Transaction& tx = block.transactions[i];
    TxCheck check = txValidator.ValidateTransaction(tx, scratch, block.height, false);
    if (!check.IsValid()) {
      return check.error;
    }
    Amount fee = 0;
    Error err = scratch.ApplyTransaction(tx, block.height, fee);
    if (err != Error::kOk) {
      return err;
    }
    if (!CheckedAdd(fees, fee, fees)) {
      return Error::kAmountOverflow;
    }
  }

  Amount coinbaseOut = 0;
  if (!block.transactions.front().ValueOut(coinbaseOut)) {
    return Error::kAmountOverflow;
  }
  Amount remaining = std::max<Amount>(0, settings.supplyCap - view.Issued());
  if (coinbaseOut > fees && coinbaseOut - fees > remaining) {
    return Error::kSupplyCapExceeded;
  }
  Amount allowed = 0;
  if (!CheckedAdd(AllowedSubsidy(block.height, view.Issued()), fees, allowed)) {
    return Error::kAmountOverflow;
  }
  if (coinbaseOut > allowed) {
    return Error::kBadCoinbaseReward;
  }

  LedgerDelta delta;
  Error err = view.ApplyBlock(block, delta);
  if (err != Error::kOk) {
    return err;
  }
  if (feesOut) {
    *feesOut = fees;
  }
  return Error::kOk;
}

Amount BlockValidator::AllowedSubsidy(int64_t height, Amount issued) const {
  Amount subsidy = BlockSubsidy(settings, height);
  Amount remaining = std::max<Amount>(0, settings.supplyCap - issued);
  return std::min(subsidy, remaining);
}
