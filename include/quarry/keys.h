#pragma once

#include <memory>

#include <openssl/ec.h>

#include "quarry/types.h"

struct ECKeyDeleter {
  void operator()(EC_KEY* key) const;
};

using ECKeyPtr = std::unique_ptr<EC_KEY, ECKeyDeleter>;

struct KeyPair {
  ECKeyPtr key;

  static std::unique_ptr<KeyPair> Generate();
  Bytes PublicKey() const;
  Bytes PubKeyHash() const;
  bool Sign(const Bytes& hash, Bytes& signature) const;
};

bool IsValidSignatureEncoding(const Bytes& signature);
bool IsValidPublicKey(const Bytes& pubKey);
bool VerifySignature(const Bytes& pubKey, const Bytes& hash,
                     const Bytes& signature);
