#include "quarry/serialize.h"

void ByteWriter::WriteU8(uint8_t v) {
  data.push_back(v);
}

void ByteWriter::WriteU32(uint32_t v) {
  for (int i = 0; i < 4; ++i) {
    data.push_back(static_cast<unsigned char>(v & 0xFF));
    v >>= 8;
  }
}

void ByteWriter::WriteU64(uint64_t v) {
  for (int i = 0; i < 8; ++i) {
    data.push_back(static_cast<unsigned char>(v & 0xFF));
    v >>= 8;
  }
}

void ByteWriter::WriteI64(int64_t v) {
  WriteU64(static_cast<uint64_t>(v));
}

void ByteWriter::WriteBytes(const Bytes& b) {
  WriteU32(static_cast<uint32_t>(b.size()));
  data.insert(data.end(), b.begin(), b.end());
}

void ByteWriter::WriteString(const std::string& s) {
  WriteU32(static_cast<uint32_t>(s.size()));
  data.insert(data.end(), s.begin(), s.end());
}

void ByteWriter::WriteRaw(const Bytes& b) {
  data.insert(data.end(), b.begin(), b.end());
}

bool ByteReader::ReadU8(uint8_t& out) {
  if (pos + 1 > data.size()) {
    return false;
  }
  out = data[pos++];
  return true;
}

bool ByteReader::ReadU32(uint32_t& out) {
  if (pos + 4 > data.size()) {
    return false;
  }
  out = 0;
  for (int i = 0; i < 4; ++i) {
    out |= static_cast<uint32_t>(data[pos++]) << (8 * i);
  }
  return true;
}

bool ByteReader::ReadU64(uint64_t& out) {
  if (pos + 8 > data.size()) {
    return false;
  }
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i) {
    v |= static_cast<uint64_t>(data[pos++]) << (8 * i);
  }
  out = v;
  return true;
}

bool ByteReader::ReadI64(int64_t& out) {
  uint64_t v = 0;
  if (!ReadU64(v)) {
    return false;
  }
  out = static_cast<int64_t>(v);
  return true;
}

bool ByteReader::ReadBytes(Bytes& out) {
  return ReadBytes(out, data.size());
}

bool ByteReader::ReadBytes(Bytes& out, size_t maxLen) {
  uint32_t len = 0;
  if (!ReadU32(len)) {
    return false;
  }
  if (len > maxLen || len > data.size() - pos) {
    return false;
  }
  out.assign(data.begin() + pos, data.begin() + pos + len);
  pos += len;
  return true;
}

bool ByteReader::ReadString(std::string& out) {
  Bytes b;
  if (!ReadBytes(b)) {
    return false;
  }
  out.assign(b.begin(), b.end());
  return true;
}

bool ByteReader::AtEnd() const {
  return pos == data.size();
}

size_t ByteReader::Remaining() const {
  return data.size() - pos;
}
