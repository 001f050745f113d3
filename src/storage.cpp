#include "quarry/storage.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

#include "quarry/crypto.h"
#include "quarry/serialize.h"

static constexpr uint32_t kMaxRecordBytes = 64 * 1000 * 1000;

std::string JoinPath(const std::string& dir, const std::string& name) {
  if (dir.empty()) {
    return name;
  }
  if (dir.back() == '/') {
    return dir + name;
  }
  return dir + "/" + name;
}

bool EnsureDirectory(const std::string& dir) {
  if (dir.empty()) {
    return false;
  }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec && std::filesystem::is_directory(dir, ec);
}

bool FileExists(const std::string& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

bool RemoveFile(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  return !ec;
}

bool ReadFileBytes(const std::string& path, Bytes& out) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return false;
  }
  file.seekg(0, std::ios::end);
  std::streamsize size = file.tellg();
  file.seekg(0, std::ios::beg);
  if (size < 0) {
    return false;
  }
  out.resize(static_cast<size_t>(size));
  if (size > 0) {
    file.read(reinterpret_cast<char*>(out.data()), size);
  }
  return static_cast<bool>(file);
}

bool WriteFileBytes(const std::string& path, const Bytes& data) {
  std::string tmp = path + ".tmp";
  {
    std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
    if (!file) {
      return false;
    }
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file) {
      return false;
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  return !ec;
}

bool BlockStore::Open(const std::string& dataDir) {
  if (!EnsureDirectory(dataDir)) {
    return false;
  }
  path = JoinPath(dataDir, "blocks.dat");
  count = 0;
  return true;
}

bool BlockStore::LoadAll(std::vector<Block>& out) {
  out.clear();
  count = 0;
  if (!FileExists(path)) {
    return true;
  }
  Bytes data;
  if (!ReadFileBytes(path, data)) {
    return false;
  }
  ByteReader r{data};
  size_t good = 0;
  while (!r.AtEnd()) {
    Bytes record;
    if (!r.ReadBytes(record, kMaxRecordBytes)) {
      break;
    }
    Block block;
    if (!Block::Deserialize(record, block)) {
      std::cerr << "blocks.dat: corrupt record at offset " << good << "\n";
      return false;
    }
    out.push_back(std::move(block));
    good = r.pos;
  }
  if (good != data.size()) {
    // A crash mid-append leaves a partial tail record.
    std::cerr << "blocks.dat: dropping " << (data.size() - good)
              << " bytes of truncated tail\n";
    std::error_code ec;
    std::filesystem::resize_file(path, good, ec);
    if (ec) {
      return false;
    }
  }
  count = out.size();
  return true;
}

bool BlockStore::Append(const Block& block) {
  ByteWriter w;
  w.WriteBytes(block.Serialize());
  std::ofstream file(path, std::ios::binary | std::ios::app);
  if (!file) {
    return false;
  }
  file.write(reinterpret_cast<const char*>(w.data.data()),
             static_cast<std::streamsize>(w.data.size()));
  file.flush();
  if (!file) {
    return false;
  }
  ++count;
  return true;
}

size_t BlockStore::Count() const {
  return count;
}

void ReorgJournal::Open(const std::string& dataDir) {
  path = JoinPath(dataDir, "reorg.journal");
}

bool ReorgJournal::Begin(const ReorgJournalEntry& entry) {
  ByteWriter w;
  w.WriteBytes(entry.oldTip);
  w.WriteBytes(entry.newTip);
  w.WriteBytes(entry.forkPoint);
  w.WriteI64(entry.startedAt);
  return WriteFileBytes(path, w.data);
}

bool ReorgJournal::Clear() {
  return RemoveFile(path);
}

bool ReorgJournal::Pending(ReorgJournalEntry& out) const {
  if (path.empty() || !FileExists(path)) {
    return false;
  }
  Bytes data;
  if (!ReadFileBytes(path, data)) {
    return false;
  }
  ByteReader r{data};
  ReorgJournalEntry entry;
  if (!r.ReadBytes(entry.oldTip, kHashSize) || !r.ReadBytes(entry.newTip, kHashSize) ||
      !r.ReadBytes(entry.forkPoint, kHashSize) || !r.ReadI64(entry.startedAt)) {
    return false;
  }
  out = entry;
  return true;
}
