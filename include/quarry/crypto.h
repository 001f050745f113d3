#pragma once

#include <string>

#include "quarry/types.h"

inline constexpr size_t kHashSize = 32;
inline constexpr size_t kPubKeyHashSize = 20;

Bytes Sha256(const Bytes& data);
Bytes DoubleSha256(const Bytes& data);
Bytes Hash160(const Bytes& data);
Bytes HashPair(const Bytes& left, const Bytes& right);
std::string BytesToHex(const Bytes& data);
Bytes HexToBytes(const std::string& hex);
