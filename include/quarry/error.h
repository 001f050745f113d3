#pragma once

#include <string>

enum class Error {
  kOk = 0,

  // Malformed input.
  kMalformed,
  kEmptyInputs,
  kEmptyOutputs,
  kDuplicateInput,
  kTxTooLarge,
  kBadSignatureFormat,
  kBadPublicKey,
  kNegativeOutput,
  kUnexpectedCoinbase,
  kSenderMismatch,
  kBadTxId,
  kTxTimestampTooNew,
  kEmptyBlock,
  kBlockTooLarge,
  kMissingCoinbase,
  kExtraCoinbase,
  kBadMerkleRoot,

  // Consensus violations.
  kMissingOutpoint,
  kAmountOverflow,
  kBadSignature,
  kInsufficientInputs,
  kNonceReused,
  kNonceGap,
  kImmatureCoinbase,
  kLockedOutput,
  kBadProofOfWork,
  kBadTargetBits,
  kTimestampTooNew,
  kTimestampTooOld,
  kBadHeight,
  kBadCoinbaseReward,
  kCheckpointMismatch,
  kInvalidAncestor,
  kSupplyCapExceeded,

  // Mempool policy.
  kFeeTooLow,
  kSenderCapExceeded,
  kSenderBanned,
  kDuplicateTransaction,
  kMempoolConflict,
  kInsufficientReplacementFee,

  // Resource exhaustion.
  kMempoolFull,
  kOrphanPoolFull,

  // Recoverable, queued.
  kFutureNonce,
  kOrphanBlock,

  kDuplicateBlock,
  kReorgTooDeep,
  kStorageFailure,
  kNotFound,
};

enum class ErrorClass {
  kNone,
  kValidation,
  kConsensus,
  kPolicy,
  kResourceExhausted,
  kRecoverable,
  kReorgTooDeep,
  kStorage,
};

ErrorClass ClassifyError(Error error);
const char* ErrorMessage(Error error);
const char* ErrorClassName(ErrorClass cls);

// Consensus violations may be attributed to the peer that relayed the data.
bool IsPeerPenalizable(Error error);
std::string DescribeError(Error error);
