#include "quarry/error.h"

ErrorClass ClassifyError(Error error) {
  switch (error) {
    case Error::kOk:
      return ErrorClass::kNone;
    case Error::kMalformed:
    case Error::kEmptyInputs:
    case Error::kEmptyOutputs:
    case Error::kDuplicateInput:
    case Error::kTxTooLarge:
    case Error::kBadSignatureFormat:
    case Error::kBadPublicKey:
    case Error::kNegativeOutput:
    case Error::kUnexpectedCoinbase:
    case Error::kSenderMismatch:
    case Error::kBadTxId:
    case Error::kTxTimestampTooNew:
    case Error::kEmptyBlock:
    case Error::kBlockTooLarge:
    case Error::kMissingCoinbase:
    case Error::kExtraCoinbase:
    case Error::kBadMerkleRoot:
    case Error::kNotFound:
      return ErrorClass::kValidation;
    case Error::kMissingOutpoint:
    case Error::kAmountOverflow:
    case Error::kBadSignature:
    case Error::kInsufficientInputs:
    case Error::kNonceReused:
    case Error::kNonceGap:
    case Error::kImmatureCoinbase:
    case Error::kLockedOutput:
    case Error::kBadProofOfWork:
    case Error::kBadTargetBits:
    case Error::kTimestampTooNew:
    case Error::kTimestampTooOld:
    case Error::kBadHeight:
    case Error::kBadCoinbaseReward:
    case Error::kCheckpointMismatch:
    case Error::kInvalidAncestor:
    case Error::kSupplyCapExceeded:
      return ErrorClass::kConsensus;
    case Error::kFeeTooLow:
    case Error::kSenderCapExceeded:
    case Error::kSenderBanned:
    case Error::kDuplicateTransaction:
    case Error::kMempoolConflict:
    case Error::kInsufficientReplacementFee:
    case Error::kDuplicateBlock:
      return ErrorClass::kPolicy;
    case Error::kMempoolFull:
    case Error::kOrphanPoolFull:
      return ErrorClass::kResourceExhausted;
    case Error::kFutureNonce:
    case Error::kOrphanBlock:
      return ErrorClass::kRecoverable;
    case Error::kReorgTooDeep:
      return ErrorClass::kReorgTooDeep;
    case Error::kStorageFailure:
      return ErrorClass::kStorage;
  }
  return ErrorClass::kValidation;
}

const char* ErrorMessage(Error error) {
  switch (error) {
    case Error::kOk:
      return "ok";
    case Error::kMalformed:
      return "malformed encoding";
    case Error::kEmptyInputs:
      return "transaction has no inputs";
    case Error::kEmptyOutputs:
      return "transaction has no outputs";
    case Error::kDuplicateInput:
      return "transaction spends the same outpoint twice";
    case Error::kTxTooLarge:
      return "transaction exceeds size limit";
    case Error::kBadSignatureFormat:
      return "signature is not a valid DER encoding";
    case Error::kBadPublicKey:
      return "public key is not a valid curve point";
    case Error::kNegativeOutput:
      return "output value is negative";
    case Error::kUnexpectedCoinbase:
      return "coinbase transaction outside block position zero";
    case Error::kSenderMismatch:
      return "input key does not belong to the declared sender";
    case Error::kBadTxId:
      return "transaction id does not match its contents";
    case Error::kTxTimestampTooNew:
      return "transaction timestamp too far in the future";
    case Error::kEmptyBlock:
      return "block has no transactions";
    case Error::kBlockTooLarge:
      return "block exceeds size limit";
    case Error::kMissingCoinbase:
      return "first transaction is not a coinbase";
    case Error::kExtraCoinbase:
      return "block contains more than one coinbase";
    case Error::kBadMerkleRoot:
      return "merkle root mismatch";
    case Error::kMissingOutpoint:
      return "spent outpoint does not exist or is already spent";
    case Error::kAmountOverflow:
      return "amount arithmetic overflow";
    case Error::kBadSignature:
      return "signature verification failed";
    case Error::kInsufficientInputs:
      return "outputs exceed inputs";
    case Error::kNonceReused:
      return "sender nonce already used";
    case Error::kNonceGap:
      return "sender nonce out of sequence";
    case Error::kImmatureCoinbase:
      return "coinbase output spent before maturity";
    case Error::kLockedOutput:
      return "output is locked until a later height";
    case Error::kBadProofOfWork:
      return "block hash does not satisfy target";
    case Error::kBadTargetBits:
      return "unexpected difficulty target";
    case Error::kTimestampTooNew:
      return "block timestamp too far in the future";
    case Error::kTimestampTooOld:
      return "block timestamp before median time past";
    case Error::kBadHeight:
      return "block height does not follow parent";
    case Error::kBadCoinbaseReward:
      return "coinbase pays more than reward plus fees";
    case Error::kCheckpointMismatch:
      return "block conflicts with a checkpoint";
    case Error::kInvalidAncestor:
      return "block descends from an invalid block";
    case Error::kSupplyCapExceeded:
      return "issuance would exceed the supply cap";
    case Error::kFeeTooLow:
      return "fee rate below relay floor";
    case Error::kSenderCapExceeded:
      return "too many pending transactions from sender";
    case Error::kSenderBanned:
      return "sender is cooling down after invalid submissions";
    case Error::kDuplicateTransaction:
      return "transaction already known";
    case Error::kMempoolConflict:
      return "transaction conflicts with a pending transaction";
    case Error::kInsufficientReplacementFee:
      return "replacement does not pay enough to evict conflicts";
    case Error::kMempoolFull:
      return "mempool full";
    case Error::kOrphanPoolFull:
      return "orphan pool full";
    case Error::kFutureNonce:
      return "nonce ahead of sender sequence, queued";
    case Error::kOrphanBlock:
      return "parent unknown, queued as orphan";
    case Error::kDuplicateBlock:
      return "block already known";
    case Error::kReorgTooDeep:
      return "reorganization deeper than allowed";
    case Error::kStorageFailure:
      return "storage failure";
    case Error::kNotFound:
      return "not found";
  }
  return "unknown error";
}

const char* ErrorClassName(ErrorClass cls) {
  switch (cls) {
    case ErrorClass::kNone:
      return "none";
    case ErrorClass::kValidation:
      return "ValidationError";
    case ErrorClass::kConsensus:
      return "ConsensusViolation";
    case ErrorClass::kPolicy:
      return "PolicyRejection";
    case ErrorClass::kResourceExhausted:
      return "ResourceExhausted";
    case ErrorClass::kRecoverable:
      return "Recoverable";
    case ErrorClass::kReorgTooDeep:
      return "ReorgTooDeep";
    case ErrorClass::kStorage:
      return "StorageFailure";
  }
  return "unknown";
}

bool IsPeerPenalizable(Error error) {
  ErrorClass cls = ClassifyError(error);
  return cls == ErrorClass::kConsensus || cls == ErrorClass::kValidation;
}

std::string DescribeError(Error error) {
  return std::string(ErrorClassName(ClassifyError(error))) + ": " +
         ErrorMessage(error);
}
