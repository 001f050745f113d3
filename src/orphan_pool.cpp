#include "quarry/orphan_pool.h"

#include <algorithm>
#include <iostream>

#include "quarry/crypto.h"
#include "quarry/settings.h"

OrphanPool::OrphanPool(const Settings& s) : settings(s) {}

Error OrphanPool::Add(const Block& block, const std::string& peer, int64_t now) {
  std::string key = BytesToHex(block.hash);
  if (orphans.count(key) != 0) {
    return Error::kDuplicateBlock;
  }
  Expire(now);
  if (settings.orphanMaxEntries == 0) {
    return Error::kOrphanPoolFull;
  }
  while (orphans.size() >= settings.orphanMaxEntries) {
    auto oldest = std::min_element(
        orphans.begin(), orphans.end(), [](const auto& a, const auto& b) {
          return a.second.received < b.second.received;
        });
    std::cerr << "Orphan pool full, dropping " << oldest->first << "\n";
    Erase(oldest->first);
    ++evicted;
  }
  OrphanEntry entry;
  entry.block = block;
  entry.peer = peer;
  entry.received = now;
  byParent[BytesToHex(block.prevBlockHash)].push_back(key);
  orphans[key] = std::move(entry);
  return Error::kOrphanBlock;
}

std::vector<OrphanEntry> OrphanPool::TakeChildren(const Bytes& parentHash) {
  std::vector<OrphanEntry> out;
  auto it = byParent.find(BytesToHex(parentHash));
  if (it == byParent.end()) {
    return out;
  }
  std::vector<std::string> keys = it->second;
  for (const auto& key : keys) {
    auto o = orphans.find(key);
    if (o != orphans.end()) {
      out.push_back(o->second);
      Erase(key);
    }
  }
  return out;
}

std::vector<OrphanEntry> OrphanPool::Expire(int64_t now) {
  std::vector<OrphanEntry> out;
  std::vector<std::string> keys;
  for (const auto& [key, entry] : orphans) {
    if (entry.received + settings.orphanTtl <= now) {
      keys.push_back(key);
    }
  }
  for (const auto& key : keys) {
    out.push_back(orphans.at(key));
    expired[key] = now;
    Erase(key);
  }
  // Remember expired hashes for a few TTLs only.
  for (auto it = expired.begin(); it != expired.end();) {
    if (it->second + 3 * settings.orphanTtl <= now) {
      it = expired.erase(it);
    } else {
      ++it;
    }
  }
  return out;
}

bool OrphanPool::WasExpired(const Bytes& hash) const {
  return expired.count(BytesToHex(hash)) != 0;
}

bool OrphanPool::Contains(const Bytes& hash) const {
  return orphans.count(BytesToHex(hash)) != 0;
}

size_t OrphanPool::Size() const {
  return orphans.size();
}

uint64_t OrphanPool::Evicted() const {
  return evicted;
}

void OrphanPool::Erase(const std::string& key) {
  auto it = orphans.find(key);
  if (it == orphans.end()) {
    return;
  }
  std::string parent = BytesToHex(it->second.block.prevBlockHash);
  auto p = byParent.find(parent);
  if (p != byParent.end()) {
    auto& list = p->second;
    list.erase(std::remove(list.begin(), list.end(), key), list.end());
    if (list.empty()) {
      byParent.erase(p);
    }
  }
  orphans.erase(it);
}
