#include "quarry/tx_validator.h"

#include <unordered_set>

#include "quarry/crypto.h"
#include "quarry/keys.h"
#include "quarry/settings.h"

TxCheck TxCheck::Valid(Amount fee) {
  TxCheck c;
  c.status = TxStatus::kValid;
  c.fee = fee;
  return c;
}

TxCheck TxCheck::Invalid(Error error) {
  TxCheck c;
  c.status = TxStatus::kInvalid;
  c.error = error;
  return c;
}

TxCheck TxCheck::FutureNonce() {
  TxCheck c;
  c.status = TxStatus::kFutureNonce;
  c.error = Error::kFutureNonce;
  return c;
}

bool TxCheck::IsValid() const {
  return status == TxStatus::kValid;
}

namespace {

// Kind-specific sequencing rules.
struct SequenceRules {
  const Transaction& tx;
  const UtxoSource& view;
  uint64_t window;
  bool allowFutureNonce;

  TxCheck operator()(const UtxoTransfer&) const { return TxCheck::Valid(0); }

  TxCheck operator()(const AccountTransfer& account) const {
    uint64_t expected = view.NextNonce(account.sender);
    if (account.nonce < expected) {
      return TxCheck::Invalid(Error::kNonceReused);
    }
    if (account.nonce > expected) {
      if (allowFutureNonce && account.nonce - expected <= window) {
        // Queued before its inputs can be looked up, so the sender's
        // signatures are the only thing that can be checked now.
        for (size_t i = 0; i < tx.vin.size(); ++i) {
          Bytes hash = tx.SignatureHash(i, account.sender);
          if (!VerifySignature(tx.vin[i].pubKey, hash, tx.vin[i].signature)) {
            return TxCheck::Invalid(Error::kBadSignature);
          }
        }
        return TxCheck::FutureNonce();
      }
      return TxCheck::Invalid(Error::kNonceGap);
    }
    return TxCheck::Valid(0);
  }
};

}  // namespace

TxValidator::TxValidator(const Settings& s) : settings(s) {}

Error TxValidator::CheckTransaction(const Transaction& tx) const {
  if (tx.vin.empty()) {
    return Error::kEmptyInputs;
  }
  if (tx.vout.empty()) {
    return Error::kEmptyOutputs;
  }
  if (tx.Size() > settings.maxTxBytes) {
    return Error::kTxTooLarge;
  }
  for (const auto& out : tx.vout) {
    if (out.value < 0) {
      return Error::kNegativeOutput;
    }
    if (out.pubKeyHash.size() != kPubKeyHashSize) {
      return Error::kMalformed;
    }
  }
  Amount total = 0;
  if (!tx.ValueOut(total)) {
    return Error::kAmountOverflow;
  }

  if (tx.IsCoinbase()) {
    if (tx.Account()) {
      return Error::kMalformed;
    }
    return tx.id == tx.Hash() ? Error::kOk : Error::kBadTxId;
  }

  std::unordered_set<std::string> seen;
  for (const auto& in : tx.vin) {
    if (in.prevout.IsNull() || in.prevout.txid.size() != kHashSize) {
      return Error::kMalformed;
    }
    if (!seen.insert(in.prevout.Key()).second) {
      return Error::kDuplicateInput;
    }
    if (!IsValidSignatureEncoding(in.signature)) {
      return Error::kBadSignatureFormat;
    }
    if (!IsValidPublicKey(in.pubKey)) {
      return Error::kBadPublicKey;
    }
  }

  if (const AccountTransfer* account = tx.Account()) {
    if (account->sender.size() != kPubKeyHashSize) {
      return Error::kMalformed;
    }
    for (const auto& in : tx.vin) {
      if (!in.UsesKey(account->sender)) {
        return Error::kSenderMismatch;
      }
    }
  }
  // Outpoints and the merkle root are built from ids, never trust a stale one.
  if (tx.id != tx.Hash()) {
    return Error::kBadTxId;
  }
  return Error::kOk;
}

TxCheck TxValidator::ValidateTransaction(const Transaction& tx, const UtxoSource& view,
                                         int64_t height, bool allowFutureNonce) const {
  Error err = CheckTransaction(tx);
  if (err != Error::kOk) {
    return TxCheck::Invalid(err);
  }
  if (tx.IsCoinbase()) {
    return TxCheck::Invalid(Error::kUnexpectedCoinbase);
  }

  TxCheck sequence =
      std::visit(SequenceRules{tx, view, settings.futureNonceWindow, allowFutureNonce},
                 tx.kind);
  if (!sequence.IsValid()) {
    return sequence;
  }
  return CheckInputs(tx, view, height);
}

TxCheck TxValidator::CheckInputs(const Transaction& tx, const UtxoSource& view,
                                 int64_t height) const {
  Amount in = 0;
  for (size_t i = 0; i < tx.vin.size(); ++i) {
    const TXInput& input = tx.vin[i];
    UtxoEntry entry;
    if (!view.GetUnspent(input.prevout, entry)) {
      return TxCheck::Invalid(Error::kMissingOutpoint);
    }
    if (entry.coinbase && height - entry.height < settings.coinbaseMaturity) {
      return TxCheck::Invalid(Error::kImmatureCoinbase);
    }
    if (!entry.output.IsSpendableAt(height)) {
      return TxCheck::Invalid(Error::kLockedOutput);
    }
    if (!input.UsesKey(entry.output.pubKeyHash)) {
      return TxCheck::Invalid(Error::kBadSignature);
    }
    Bytes hash = tx.SignatureHash(i, entry.output.pubKeyHash);
    if (!VerifySignature(input.pubKey, hash, input.signature)) {
      return TxCheck::Invalid(Error::kBadSignature);
    }
    if (!CheckedAdd(in, entry.output.value, in)) {
      return TxCheck::Invalid(Error::kAmountOverflow);
    }
  }

  Amount out = 0;
  if (!tx.ValueOut(out)) {
    return TxCheck::Invalid(Error::kAmountOverflow);
  }
  if (in < out) {
    return TxCheck::Invalid(Error::kInsufficientInputs);
  }
  return TxCheck::Valid(in - out);
}
