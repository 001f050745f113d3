#pragma once

#include <cstdint>

#include "quarry/error.h"
#include "quarry/transaction.h"
#include "quarry/utxo_view.h"

struct Settings;

enum class TxStatus {
  kValid,
  kInvalid,
  kFutureNonce,
};

struct TxCheck {
  TxStatus status = TxStatus::kInvalid;
  Amount fee = 0;
  Error error = Error::kOk;

  static TxCheck Valid(Amount fee);
  static TxCheck Invalid(Error error);
  static TxCheck FutureNonce();
  bool IsValid() const;
};

class TxValidator {
 public:
  const Settings& settings;

  explicit TxValidator(const Settings& s);

  // Context-free checks. Safe to run without any lock.
  Error CheckTransaction(const Transaction& tx) const;

  // Checks against the state in view as of a block at height. Nonces ahead of
  // the sender's sequence are reported as FutureNonce only when
  // allowFutureNonce is set; blocks must never contain gaps.
  TxCheck ValidateTransaction(const Transaction& tx, const UtxoSource& view,
                              int64_t height, bool allowFutureNonce) const;

 private:
  TxCheck CheckInputs(const Transaction& tx, const UtxoSource& view,
                      int64_t height) const;
};
