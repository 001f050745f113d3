#include "quarry/block_index.h"

#include <algorithm>

#include "quarry/crypto.h"
#include "quarry/pow.h"

bool BlockIndex::Add(const Block& block) {
  std::string key = BytesToHex(block.hash);
  if (entries.count(key) != 0) {
    return false;
  }
  BlockIndexEntry entry;
  entry.hash = block.hash;
  entry.prevHash = block.prevBlockHash;
  entry.height = block.height;
  entry.header = block.Header();

  uint64_t work = BlockWork(block.targetBits);
  if (block.height == 0 && entries.empty()) {
    entry.chainWork = work;
  } else {
    std::string parentKey = BytesToHex(block.prevBlockHash);
    auto parent = entries.find(parentKey);
    if (parent == entries.end()) {
      return false;
    }
    entry.chainWork = AddWork(parent->second.chainWork, work);
    entry.invalid = parent->second.invalid;
    parent->second.children.push_back(key);
    tips.erase(parentKey);
  }
  tips.insert(key);
  entries[key] = std::move(entry);
  blocks[key] = block;
  return true;
}

bool BlockIndex::Contains(const Bytes& hash) const {
  return entries.count(BytesToHex(hash)) != 0;
}

const BlockIndexEntry* BlockIndex::Find(const Bytes& hash) const {
  auto it = entries.find(BytesToHex(hash));
  return it == entries.end() ? nullptr : &it->second;
}

const Block* BlockIndex::GetBlock(const Bytes& hash) const {
  auto it = blocks.find(BytesToHex(hash));
  return it == blocks.end() ? nullptr : &it->second;
}

size_t BlockIndex::Size() const {
  return entries.size();
}

void BlockIndex::MarkInvalid(const Bytes& hash) {
  std::vector<std::string> stack{BytesToHex(hash)};
  while (!stack.empty()) {
    std::string key = stack.back();
    stack.pop_back();
    auto it = entries.find(key);
    if (it == entries.end()) {
      continue;
    }
    it->second.invalid = true;
    for (const auto& child : it->second.children) {
      stack.push_back(child);
    }
  }
}

bool BlockIndex::IsInvalid(const Bytes& hash) const {
  const BlockIndexEntry* entry = Find(hash);
  return entry && entry->invalid;
}

bool BlockIndex::IsBetterTip(const BlockIndexEntry& a, const BlockIndexEntry& b) {
  if (a.chainWork != b.chainWork) {
    return a.chainWork > b.chainWork;
  }
  return a.hash < b.hash;
}

const BlockIndexEntry* BlockIndex::BestTip() const {
  const BlockIndexEntry* best = nullptr;
  for (const auto& key : tips) {
    const BlockIndexEntry* entry = &entries.at(key);
    while (entry && entry->invalid) {
      entry = Find(entry->prevHash);
    }
    if (entry && (!best || IsBetterTip(*entry, *best))) {
      best = entry;
    }
  }
  return best;
}

std::vector<const BlockIndexEntry*> BlockIndex::Tips() const {
  std::vector<const BlockIndexEntry*> out;
  for (const auto& key : tips) {
    out.push_back(&entries.at(key));
  }
  std::sort(out.begin(), out.end(),
            [](const BlockIndexEntry* a, const BlockIndexEntry* b) {
              return IsBetterTip(*a, *b);
            });
  return out;
}

const BlockIndexEntry* BlockIndex::FindFork(const Bytes& a, const Bytes& b) const {
  const BlockIndexEntry* x = Find(a);
  const BlockIndexEntry* y = Find(b);
  while (x && y && x->hash != y->hash) {
    if (x->height >= y->height) {
      x = Find(x->prevHash);
    } else {
      y = Find(y->prevHash);
    }
  }
  return (x && y) ? x : nullptr;
}

const BlockIndexEntry* BlockIndex::AncestorAt(const Bytes& hash, int64_t height) const {
  const BlockIndexEntry* entry = Find(hash);
  if (entry && IsActive(hash)) {
    return ActiveAt(height);
  }
  while (entry && entry->height > height) {
    entry = Find(entry->prevHash);
  }
  return (entry && entry->height == height) ? entry : nullptr;
}

std::vector<BlockHeader> BlockIndex::Ancestors(const Bytes& hash, size_t count) const {
  std::vector<BlockHeader> out;
  const BlockIndexEntry* entry = Find(hash);
  while (entry && out.size() < count) {
    out.push_back(entry->header);
    if (entry->height == 0) {
      break;
    }
    entry = Find(entry->prevHash);
  }
  std::reverse(out.begin(), out.end());
  return out;
}

std::vector<const Block*> BlockIndex::Branch(const Bytes& ancestor, const Bytes& tip) const {
  std::vector<const Block*> out;
  const BlockIndexEntry* entry = Find(tip);
  while (entry && entry->hash != ancestor) {
    out.push_back(GetBlock(entry->hash));
    if (entry->height == 0) {
      return {};
    }
    entry = Find(entry->prevHash);
  }
  if (!entry) {
    return {};
  }
  std::reverse(out.begin(), out.end());
  return out;
}

void BlockIndex::SetActiveTip(const Bytes& hash) {
  const BlockIndexEntry* entry = Find(hash);
  if (!entry) {
    return;
  }
  active.resize(static_cast<size_t>(entry->height) + 1);
  while (entry) {
    std::string key = BytesToHex(entry->hash);
    size_t h = static_cast<size_t>(entry->height);
    if (active[h] == key) {
      break;
    }
    active[h] = key;
    if (entry->height == 0) {
      break;
    }
    entry = Find(entry->prevHash);
  }
}

const BlockIndexEntry* BlockIndex::ActiveTip() const {
  if (active.empty()) {
    return nullptr;
  }
  return &entries.at(active.back());
}

int64_t BlockIndex::ActiveHeight() const {
  return static_cast<int64_t>(active.size()) - 1;
}

const BlockIndexEntry* BlockIndex::ActiveAt(int64_t height) const {
  if (height < 0 || height >= static_cast<int64_t>(active.size())) {
    return nullptr;
  }
  return &entries.at(active[static_cast<size_t>(height)]);
}

bool BlockIndex::IsActive(const Bytes& hash) const {
  const BlockIndexEntry* entry = Find(hash);
  if (!entry) {
    return false;
  }
  const BlockIndexEntry* at = ActiveAt(entry->height);
  return at && at->hash == hash;
}
