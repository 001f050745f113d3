#include "quarry/crypto.h"

#include <openssl/ripemd.h>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

Bytes Sha256(const Bytes& data) {
  Bytes out(SHA256_DIGEST_LENGTH);
  SHA256(data.data(), data.size(), out.data());
  return out;
}

Bytes DoubleSha256(const Bytes& data) {
  return Sha256(Sha256(data));
}

Bytes Hash160(const Bytes& data) {
  Bytes sha = Sha256(data);
  Bytes out(RIPEMD160_DIGEST_LENGTH);
  RIPEMD160(sha.data(), sha.size(), out.data());
  return out;
}

Bytes HashPair(const Bytes& left, const Bytes& right) {
  Bytes concat;
  concat.reserve(left.size() + right.size());
  concat.insert(concat.end(), left.begin(), left.end());
  concat.insert(concat.end(), right.begin(), right.end());
  return Sha256(concat);
}

std::string BytesToHex(const Bytes& data) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (unsigned char b : data) {
    oss << std::setw(2) << static_cast<int>(b);
  }
  return oss.str();
}

static int HexDigit(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

Bytes HexToBytes(const std::string& hex) {
  Bytes out;
  if (hex.size() % 2 != 0) {
    return out;
  }
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = HexDigit(hex[i]);
    int lo = HexDigit(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return Bytes{};
    }
    out.push_back(static_cast<unsigned char>((hi << 4) | lo));
  }
  return out;
}
