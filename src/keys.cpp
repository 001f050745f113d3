#include "quarry/keys.h"

#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>

#include "quarry/crypto.h"

void ECKeyDeleter::operator()(EC_KEY* key) const {
  if (key) {
    EC_KEY_free(key);
  }
}

std::unique_ptr<KeyPair> KeyPair::Generate() {
  EC_KEY* k = EC_KEY_new_by_curve_name(NID_secp256k1);
  if (!k) {
    return nullptr;
  }
  EC_KEY_set_conv_form(k, POINT_CONVERSION_UNCOMPRESSED);
  if (EC_KEY_generate_key(k) != 1) {
    EC_KEY_free(k);
    return nullptr;
  }
  auto pair = std::make_unique<KeyPair>();
  pair->key.reset(k);
  return pair;
}

Bytes KeyPair::PublicKey() const {
  int len = i2o_ECPublicKey(key.get(), nullptr);
  if (len <= 0) {
    return Bytes{};
  }
  Bytes out(static_cast<size_t>(len));
  unsigned char* p = out.data();
  if (i2o_ECPublicKey(key.get(), &p) != len) {
    return Bytes{};
  }
  return out;
}

Bytes KeyPair::PubKeyHash() const {
  return Hash160(PublicKey());
}

bool KeyPair::Sign(const Bytes& hash, Bytes& signature) const {
  unsigned int sigLen = static_cast<unsigned int>(ECDSA_size(key.get()));
  Bytes sig(sigLen);
  if (ECDSA_sign(0, hash.data(), static_cast<int>(hash.size()), sig.data(),
                 &sigLen, key.get()) != 1) {
    return false;
  }
  sig.resize(sigLen);
  signature = sig;
  return true;
}

bool IsValidSignatureEncoding(const Bytes& signature) {
  if (signature.empty() || signature.size() > 72) {
    return false;
  }
  const unsigned char* p = signature.data();
  ECDSA_SIG* sig = d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(signature.size()));
  if (!sig) {
    return false;
  }
  bool consumed = p == signature.data() + signature.size();
  ECDSA_SIG_free(sig);
  return consumed;
}

static ECKeyPtr ParsePublicKey(const Bytes& pubKey) {
  EC_KEY* key = EC_KEY_new_by_curve_name(NID_secp256k1);
  if (!key) {
    return ECKeyPtr{};
  }
  const unsigned char* p = pubKey.data();
  if (!o2i_ECPublicKey(&key, &p, static_cast<long>(pubKey.size()))) {
    EC_KEY_free(key);
    return ECKeyPtr{};
  }
  return ECKeyPtr(key);
}

bool IsValidPublicKey(const Bytes& pubKey) {
  if (pubKey.empty()) {
    return false;
  }
  return static_cast<bool>(ParsePublicKey(pubKey));
}

bool VerifySignature(const Bytes& pubKey, const Bytes& hash,
                     const Bytes& signature) {
  ECKeyPtr key = ParsePublicKey(pubKey);
  if (!key) {
    return false;
  }
  int ok = ECDSA_verify(0, hash.data(), static_cast<int>(hash.size()),
                        signature.data(), static_cast<int>(signature.size()),
                        key.get());
  return ok == 1;
}
