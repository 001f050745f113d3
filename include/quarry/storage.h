#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "quarry/block.h"
#include "quarry/types.h"

std::string JoinPath(const std::string& dir, const std::string& name);
bool EnsureDirectory(const std::string& dir);
bool FileExists(const std::string& path);
bool RemoveFile(const std::string& path);
bool ReadFileBytes(const std::string& path, Bytes& out);
// Writes to <path>.tmp and renames over path.
bool WriteFileBytes(const std::string& path, const Bytes& data);

// Append-only file of [U32 length][block] records.
class BlockStore {
 public:
  std::string path;

  bool Open(const std::string& dataDir);
  bool LoadAll(std::vector<Block>& out);
  bool Append(const Block& block);
  size_t Count() const;

 private:
  size_t count = 0;
};

struct ReorgJournalEntry {
  Bytes oldTip;
  Bytes newTip;
  Bytes forkPoint;
  int64_t startedAt = 0;
};

// Write-ahead record of a reorganization in progress; cleared once the new
// branch is fully connected.
class ReorgJournal {
 public:
  std::string path;

  void Open(const std::string& dataDir);
  bool Begin(const ReorgJournalEntry& entry);
  bool Clear();
  bool Pending(ReorgJournalEntry& out) const;
};
