#pragma once

#include <cstdint>
#include <string>

#include "quarry/types.h"

struct ByteWriter {
  Bytes data;

  void WriteU8(uint8_t v);
  void WriteU32(uint32_t v);
  void WriteU64(uint64_t v);
  void WriteI64(int64_t v);
  void WriteBytes(const Bytes& b);
  void WriteString(const std::string& s);
  void WriteRaw(const Bytes& b);
};

struct ByteReader {
  const Bytes& data;
  size_t pos = 0;

  bool ReadU8(uint8_t& out);
  bool ReadU32(uint32_t& out);
  bool ReadU64(uint64_t& out);
  bool ReadI64(int64_t& out);
  bool ReadBytes(Bytes& out);
  bool ReadBytes(Bytes& out, size_t maxLen);
  bool ReadString(std::string& out);
  bool AtEnd() const;
  size_t Remaining() const;
};
