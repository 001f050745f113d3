#include "quarry/mempool.h"

#include <algorithm>
#include <iostream>
#include <tuple>

#include "quarry/crypto.h"
#include "quarry/settings.h"

namespace {

// Ledger as seen by a new transaction: outpoints spent by pending entries are
// hidden unless those entries are being replaced, and the sender's next nonce
// accounts for its pending sequence.
class PoolView : public UtxoSource {
 public:
  PoolView(const UtxoSource& ledger_,
           const std::unordered_map<std::string, std::string>& spentBy_,
           const std::unordered_set<std::string>& excluded_, const Bytes& sender_,
           uint64_t senderNext_)
      : ledger(ledger_),
        spentBy(spentBy_),
        excluded(excluded_),
        sender(sender_),
        senderNext(senderNext_) {}

  bool GetUnspent(const Outpoint& outpoint, UtxoEntry& out) const override {
    auto it = spentBy.find(outpoint.Key());
    if (it != spentBy.end() && excluded.count(it->second) == 0) {
      return false;
    }
    return ledger.GetUnspent(outpoint, out);
  }

  uint64_t NextNonce(const Bytes& who) const override {
    if (!sender.empty() && who == sender) {
      return senderNext;
    }
    return ledger.NextNonce(who);
  }

  Amount Issued() const override { return ledger.Issued(); }

 private:
  const UtxoSource& ledger;
  const std::unordered_map<std::string, std::string>& spentBy;
  const std::unordered_set<std::string>& excluded;
  Bytes sender;
  uint64_t senderNext;
};

// fee * 1000 / size, split so the product cannot overflow. Saturates.
Amount FeeRate(Amount fee, size_t size) {
  if (size == 0) {
    return 0;
  }
  Amount bytes = static_cast<Amount>(size);
  Amount whole = 0;
  Amount rate = 0;
  if (!CheckedMul(fee / bytes, 1000, whole) ||
      !CheckedAdd(whole, (fee % bytes) * 1000 / bytes, rate)) {
    return kMaxAmount;
  }
  return rate;
}

Amount SaturatingMul(Amount a, Amount b) {
  Amount out = 0;
  return CheckedMul(a, b, out) ? out : kMaxAmount;
}

}  // namespace

bool Mempool::FeeKey::operator<(const FeeKey& other) const {
  if (feeRate != other.feeRate) {
    return feeRate > other.feeRate;
  }
  if (sequence != other.sequence) {
    return sequence < other.sequence;
  }
  return txid < other.txid;
}

Mempool::Mempool(const Settings& s) : settings(s), validator(s) {}

Error Mempool::Add(const Transaction& tx, const UtxoSource& ledger,
                   const ChainContext& ctx, int64_t now) {
  std::lock_guard<std::mutex> lock(mutex);
  ExpireLocked(now);
  Error err = AddLocked(tx, ledger, ctx, now, true, now);
  if (err != Error::kOk && err != Error::kFutureNonce) {
    ++rejected;
  }
  return err;
}

bool Mempool::Remove(const Bytes& txid) {
  std::lock_guard<std::mutex> lock(mutex);
  std::string key = BytesToHex(txid);
  if (entries.find(key) == entries.end()) {
    return false;
  }
  uint64_t removed = 0;
  EraseWithDependents(key, removed);
  return true;
}

void Mempool::OnBlockConnected(const Block& block, const UtxoSource& ledger,
                               const ChainContext& ctx, int64_t now) {
  std::lock_guard<std::mutex> lock(mutex);
  std::unordered_set<std::string> dirty;

  for (const auto& tx : block.transactions) {
    std::string txid = BytesToHex(tx.id);
    auto it = entries.find(txid);
    if (it != entries.end()) {
      dirty.insert(it->second.sender);
      Erase(txid);
    }
    if (const AccountTransfer* account = tx.Account()) {
      dirty.insert(BytesToHex(account->sender));
    }
  }

  // Entries whose inputs the block consumed can never confirm.
  std::vector<std::string> stale;
  for (const auto& [txid, entry] : entries) {
    for (const auto& in : entry.tx.vin) {
      UtxoEntry unused;
      if (!ledger.GetUnspent(in.prevout, unused)) {
        stale.push_back(txid);
        break;
      }
    }
  }
  for (const auto& txid : stale) {
    auto it = entries.find(txid);
    if (it == entries.end()) {
      continue;
    }
    dirty.insert(it->second.sender);
    Erase(txid);
    ++evicted;
  }

  // Re-admit everything pending from senders whose sequence moved.
  std::vector<MempoolEntry> readmit;
  for (const auto& sender : dirty) {
    std::vector<std::string> ids;
    for (const auto& [txid, entry] : entries) {
      if (entry.sender == sender) {
        ids.push_back(txid);
      }
    }
    for (const auto& txid : ids) {
      readmit.push_back(entries.at(txid));
      Erase(txid);
    }
  }
  std::sort(readmit.begin(), readmit.end(),
            [](const MempoolEntry& a, const MempoolEntry& b) {
              return std::tie(a.sender, a.hasNonce, a.nonce, a.sequence) <
                     std::tie(b.sender, b.hasNonce, b.nonce, b.sequence);
            });
  for (const auto& entry : readmit) {
    AddLocked(entry.tx, ledger, ctx, now, false, entry.time);
  }

  for (auto& [txid, entry] : entries) {
    entry.validHeight = ctx.height;
    entry.validTip = ctx.tipHash;
    entry.validVersion = ctx.stateVersion;
  }
  ExpireLocked(now);
  PromoteAll(ledger, ctx, now);
}

size_t Mempool::Reinject(const std::vector<Transaction>& txs, const UtxoSource& ledger,
                         const ChainContext& ctx, int64_t now) {
  std::lock_guard<std::mutex> lock(mutex);
  std::vector<Transaction> extra;
  for (const auto& tx : txs) {
    if (!tx.IsCoinbase()) {
      extra.push_back(tx);
    }
  }
  RevalidateLocked(extra, ledger, ctx, now);
  size_t readmitted = 0;
  for (const auto& tx : extra) {
    if (entries.count(BytesToHex(tx.id)) != 0) {
      ++readmitted;
    }
  }
  return readmitted;
}

BlockSelection Mempool::SelectForBlock(const UtxoSource& ledger, const ChainContext& ctx,
                                       size_t maxBytes) const {
  std::lock_guard<std::mutex> lock(mutex);
  BlockSelection selection;
  UtxoView view(ledger);
  std::unordered_map<std::string, std::map<uint64_t, const MempoolEntry*>> deferred;

  auto take = [&](const MempoolEntry& entry) {
    if (selection.bytes + entry.size > maxBytes) {
      return false;
    }
    TxCheck check = validator.ValidateTransaction(entry.tx, view, ctx.height, false);
    if (!check.IsValid()) {
      return false;
    }
    Amount fee = 0;
    if (view.ApplyTransaction(entry.tx, ctx.height, fee) != Error::kOk) {
      return false;
    }
    selection.transactions.push_back(entry.tx);
    selection.bytes += entry.size;
    selection.fees += fee;
    return true;
  };

  for (const auto& key : byFee) {
    const MempoolEntry& entry = entries.at(key.txid);
    if (!entry.hasNonce) {
      take(entry);
      continue;
    }
    Bytes sender = HexToBytes(entry.sender);
    if (entry.nonce != view.NextNonce(sender)) {
      deferred[entry.sender][entry.nonce] = &entry;
      continue;
    }
    if (!take(entry)) {
      continue;
    }
    auto& waiting = deferred[entry.sender];
    while (!waiting.empty()) {
      auto next = waiting.begin();
      if (next->first != view.NextNonce(sender)) {
        break;
      }
      const MempoolEntry* queued = next->second;
      waiting.erase(next);
      if (!take(*queued)) {
        break;
      }
    }
  }
  return selection;
}

size_t Mempool::Expire(int64_t now) {
  std::lock_guard<std::mutex> lock(mutex);
  return ExpireLocked(now);
}

bool Mempool::Get(const Bytes& txid, MempoolEntry& out) const {
  std::lock_guard<std::mutex> lock(mutex);
  auto it = entries.find(BytesToHex(txid));
  if (it == entries.end()) {
    return false;
  }
  out = it->second;
  return true;
}

bool Mempool::Contains(const Bytes& txid) const {
  std::lock_guard<std::mutex> lock(mutex);
  return entries.count(BytesToHex(txid)) != 0;
}

bool Mempool::IsQueued(const Bytes& txid) const {
  std::lock_guard<std::mutex> lock(mutex);
  for (const auto& [sender, queue] : future) {
    for (const auto& [nonce, entry] : queue) {
      if (entry.tx.id == txid) {
        return true;
      }
    }
  }
  return false;
}

bool Mempool::IsBanned(const Bytes& sender, int64_t now) const {
  std::lock_guard<std::mutex> lock(mutex);
  return IsBannedLocked(BytesToHex(sender), now);
}

size_t Mempool::Size() const {
  std::lock_guard<std::mutex> lock(mutex);
  return entries.size();
}

size_t Mempool::TotalBytes() const {
  std::lock_guard<std::mutex> lock(mutex);
  return totalBytes;
}

size_t Mempool::FutureCount() const {
  std::lock_guard<std::mutex> lock(mutex);
  return futureCount;
}

std::vector<MempoolEntry> Mempool::Entries() const {
  std::lock_guard<std::mutex> lock(mutex);
  std::vector<MempoolEntry> out;
  out.reserve(entries.size());
  for (const auto& key : byFee) {
    out.push_back(entries.at(key.txid));
  }
  return out;
}

MempoolInfo Mempool::Info(int64_t now) const {
  std::lock_guard<std::mutex> lock(mutex);
  MempoolInfo info;
  info.count = entries.size();
  info.bytes = totalBytes;
  info.futureCount = futureCount;
  std::vector<Amount> rates;
  rates.reserve(entries.size());
  for (const auto& [txid, entry] : entries) {
    rates.push_back(entry.feeRate);
    info.totalFees += entry.fee;
  }
  if (!rates.empty()) {
    std::sort(rates.begin(), rates.end());
    info.minFeeRate = rates.front();
    info.maxFeeRate = rates.back();
    info.medianFeeRate = rates[rates.size() / 2];
  }
  for (const auto& [sender, record] : senders) {
    if (record.bannedUntil > now) {
      ++info.bannedSenders;
    }
  }
  info.accepted = accepted;
  info.rejected = rejected;
  info.evicted = evicted;
  info.expired = expired;
  info.replaced = replaced;
  info.promoted = promoted;
  return info;
}

Error Mempool::AddLocked(const Transaction& tx, const UtxoSource& ledger,
                         const ChainContext& ctx, int64_t now, bool untrusted,
                         int64_t entryTime) {
  std::string txid = BytesToHex(tx.id);
  if (tx.id.empty()) {
    return Error::kMalformed;
  }
  if (entries.count(txid) != 0) {
    return Error::kDuplicateTransaction;
  }
  Bytes senderBytes = tx.Sender();
  std::string sender = BytesToHex(senderBytes);
  const AccountTransfer* account = tx.Account();
  if (account) {
    auto fq = future.find(sender);
    if (fq != future.end()) {
      auto fe = fq->second.find(account->nonce);
      if (fe != fq->second.end() && fe->second.tx.id == tx.id) {
        return Error::kDuplicateTransaction;
      }
    }
  }
  if (untrusted && IsBannedLocked(sender, now)) {
    return Error::kSenderBanned;
  }

  Error err = validator.CheckTransaction(tx);
  if (err == Error::kOk && tx.IsCoinbase()) {
    err = Error::kUnexpectedCoinbase;
  }
  if (err == Error::kOk && tx.timestamp > now + settings.maxTxFutureSeconds) {
    err = Error::kTxTimestampTooNew;
  }
  if (err != Error::kOk) {
    if (untrusted) {
      RecordInvalid(sender, now);
    }
    return err;
  }

  // Pending entries this transaction would displace.
  std::unordered_set<std::string> direct;
  for (const auto& in : tx.vin) {
    auto it = spentBy.find(in.prevout.Key());
    if (it != spentBy.end()) {
      direct.insert(it->second);
    }
  }
  if (account) {
    auto sn = senderNonces.find(sender);
    if (sn != senderNonces.end()) {
      auto it = sn->second.find(account->nonce);
      if (it != sn->second.end()) {
        direct.insert(it->second);
      }
    }
  }
  std::unordered_set<std::string> displaced;
  for (const auto& id : direct) {
    for (const auto& dep : WithDependents(id)) {
      displaced.insert(dep);
    }
  }

  const std::unordered_set<std::string> none;
  TxCheck check;
  bool replacing = false;
  if (!displaced.empty()) {
    uint64_t next = account ? ExpectedNonce(sender, senderBytes, ledger, displaced) : 0;
    PoolView view(ledger, spentBy, displaced, account ? senderBytes : Bytes{}, next);
    check = validator.ValidateTransaction(tx, view, ctx.height, true);
    if (check.IsValid()) {
      Amount rate = FeeRate(check.fee, tx.Size());
      bool rateOk = true;
      for (const auto& id : direct) {
        const MempoolEntry& old = entries.at(id);
        if (rate <= old.feeRate ||
            SaturatingMul(rate, 100) <
                SaturatingMul(old.feeRate, 100 + settings.replacementBumpPercent)) {
          rateOk = false;
        }
      }
      Amount displacedFees = 0;
      for (const auto& id : displaced) {
        displacedFees += entries.at(id).fee;
      }
      if (rateOk && check.fee <= displacedFees) {
        return Error::kInsufficientReplacementFee;
      }
      replacing = rateOk;
    }
  }
  if (!replacing) {
    displaced.clear();
    uint64_t next = account ? ExpectedNonce(sender, senderBytes, ledger, none) : 0;
    PoolView view(ledger, spentBy, none, account ? senderBytes : Bytes{}, next);
    check = validator.ValidateTransaction(tx, view, ctx.height, true);
    if (check.IsValid() && !direct.empty()) {
      check = TxCheck::Invalid(Error::kMempoolConflict);
    }
  }

  if (check.status == TxStatus::kFutureNonce) {
    return QueueFuture(tx, sender, entryTime);
  }
  if (!check.IsValid()) {
    if (untrusted && IsPeerPenalizable(check.error)) {
      RecordInvalid(sender, now);
    }
    return check.error;
  }

  MempoolEntry entry;
  entry.tx = tx;
  entry.txid = txid;
  entry.sender = sender;
  entry.hasNonce = account != nullptr;
  entry.nonce = account ? account->nonce : 0;
  entry.fee = check.fee;
  entry.size = tx.Size();
  entry.feeRate = FeeRate(entry.fee, entry.size);
  entry.time = entryTime;
  entry.validHeight = ctx.height;
  entry.validTip = ctx.tipHash;
  entry.validVersion = ctx.stateVersion;
  for (const auto& in : tx.vin) {
    entry.inputs.push_back(in.prevout.Key());
  }

  if (entry.feeRate < settings.minFeeRatePerKb) {
    return Error::kFeeTooLow;
  }

  size_t senderPending = 0;
  auto sc = senderCount.find(sender);
  if (sc != senderCount.end()) {
    senderPending = sc->second;
  }
  size_t displacedBytes = 0;
  for (const auto& id : displaced) {
    const MempoolEntry& old = entries.at(id);
    displacedBytes += old.size;
    if (old.sender == sender && senderPending > 0) {
      --senderPending;
    }
  }
  if (senderPending >= settings.mempoolMaxPerSender) {
    return Error::kSenderCapExceeded;
  }

  // Pick capacity victims before touching anything, lowest fee rate first.
  size_t count = entries.size() - displaced.size() + 1;
  size_t bytes = totalBytes - displacedBytes + entry.size;
  std::unordered_set<std::string> victims;
  for (auto it = byFee.rbegin(); it != byFee.rend(); ++it) {
    if (count <= settings.mempoolMaxEntries && bytes <= settings.mempoolMaxBytes) {
      break;
    }
    if (displaced.count(it->txid) != 0 || victims.count(it->txid) != 0) {
      continue;
    }
    const MempoolEntry& worst = entries.at(it->txid);
    if (worst.feeRate >= entry.feeRate) {
      return Error::kMempoolFull;
    }
    if (entry.hasNonce && worst.hasNonce && worst.sender == sender &&
        worst.nonce < entry.nonce) {
      return Error::kMempoolFull;
    }
    for (const auto& dep : WithDependents(it->txid)) {
      if (displaced.count(dep) != 0 || !victims.insert(dep).second) {
        continue;
      }
      const MempoolEntry& gone = entries.at(dep);
      --count;
      bytes -= gone.size;
    }
  }
  if (count > settings.mempoolMaxEntries || bytes > settings.mempoolMaxBytes) {
    return Error::kMempoolFull;
  }

  for (const auto& id : displaced) {
    Erase(id);
    ++replaced;
  }
  for (const auto& id : victims) {
    if (entries.count(id) != 0) {
      Erase(id);
      ++evicted;
    }
  }
  if (replacing) {
    std::cout << "Mempool: " << txid << " replaced " << direct.size()
              << " pending transaction(s)\n";
  }

  Insert(std::move(entry));
  ++accepted;
  if (account) {
    PromoteFuture(sender, ledger, ctx, now);
  }
  return Error::kOk;
}

Error Mempool::QueueFuture(const Transaction& tx, const std::string& sender,
                           int64_t time) {
  const AccountTransfer* account = tx.Account();
  if (!account) {
    return Error::kNonceGap;
  }
  auto& queue = future[sender];
  auto queued = queue.find(account->nonce);
  if (queued != queue.end()) {
    // Both are signed by the sender and neither has been priced yet, so the
    // newer one takes the slot.
    queued->second.tx = tx;
    queued->second.time = time;
    return Error::kFutureNonce;
  }
  if (futureCount >= settings.futureNonceMaxEntries) {
    return Error::kMempoolFull;
  }
  size_t pending = queue.size();
  auto sc = senderCount.find(sender);
  if (sc != senderCount.end()) {
    pending += sc->second;
  }
  if (pending >= settings.mempoolMaxPerSender) {
    return Error::kSenderCapExceeded;
  }
  FutureEntry fe;
  fe.tx = tx;
  fe.time = time;
  queue[account->nonce] = fe;
  ++futureCount;
  return Error::kFutureNonce;
}

void Mempool::PromoteFuture(const std::string& sender, const UtxoSource& ledger,
                            const ChainContext& ctx, int64_t now) {
  const std::unordered_set<std::string> none;
  Bytes senderBytes = HexToBytes(sender);
  while (true) {
    auto fq = future.find(sender);
    if (fq == future.end()) {
      return;
    }
    auto& queue = fq->second;
    uint64_t expected = ExpectedNonce(sender, senderBytes, ledger, none);
    while (!queue.empty() && queue.begin()->first < expected) {
      queue.erase(queue.begin());
      --futureCount;
    }
    if (queue.empty()) {
      future.erase(fq);
      return;
    }
    if (queue.begin()->first != expected) {
      return;
    }
    FutureEntry fe = queue.begin()->second;
    queue.erase(queue.begin());
    --futureCount;
    if (queue.empty()) {
      future.erase(fq);
    }
    // Re-entrant through AddLocked, which promotes the next nonce on success.
    if (AddLocked(fe.tx, ledger, ctx, now, false, fe.time) == Error::kOk) {
      ++promoted;
      return;
    }
  }
}

void Mempool::PromoteAll(const UtxoSource& ledger, const ChainContext& ctx,
                         int64_t now) {
  std::vector<std::string> waiting;
  for (const auto& [sender, queue] : future) {
    waiting.push_back(sender);
  }
  for (const auto& sender : waiting) {
    PromoteFuture(sender, ledger, ctx, now);
  }
}

void Mempool::RevalidateLocked(std::vector<Transaction> extra, const UtxoSource& ledger,
                               const ChainContext& ctx, int64_t now) {
  struct Candidate {
    Transaction tx;
    int64_t time = 0;
    uint64_t order = 0;
  };
  std::vector<Candidate> candidates;
  for (auto& tx : extra) {
    candidates.push_back(Candidate{std::move(tx), now, 0});
  }
  for (const auto& [txid, entry] : entries) {
    candidates.push_back(Candidate{entry.tx, entry.time, entry.sequence + 1});
  }
  for (const auto& [sender, queue] : future) {
    for (const auto& [nonce, fe] : queue) {
      candidates.push_back(Candidate{fe.tx, fe.time, nextSequence + 1});
    }
  }
  // Disconnected transactions first, they were confirmed before anything pending.
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const Candidate& a, const Candidate& b) { return a.order < b.order; });

  entries.clear();
  byFee.clear();
  spentBy.clear();
  senderNonces.clear();
  senderCount.clear();
  future.clear();
  totalBytes = 0;
  futureCount = 0;

  for (const auto& c : candidates) {
    AddLocked(c.tx, ledger, ctx, now, false, c.time);
  }
  ExpireLocked(now);
  PromoteAll(ledger, ctx, now);
}

uint64_t Mempool::ExpectedNonce(const std::string& sender, const Bytes& senderBytes,
                                const UtxoSource& ledger,
                                const std::unordered_set<std::string>& excluded) const {
  uint64_t expected = ledger.NextNonce(senderBytes);
  auto sn = senderNonces.find(sender);
  if (sn == senderNonces.end()) {
    return expected;
  }
  while (true) {
    auto it = sn->second.find(expected);
    if (it == sn->second.end() || excluded.count(it->second) != 0) {
      return expected;
    }
    ++expected;
  }
}

std::vector<std::string> Mempool::WithDependents(const std::string& txid) const {
  std::vector<std::string> out{txid};
  auto it = entries.find(txid);
  if (it == entries.end() || !it->second.hasNonce) {
    return out;
  }
  auto sn = senderNonces.find(it->second.sender);
  if (sn == senderNonces.end()) {
    return out;
  }
  for (auto dep = sn->second.upper_bound(it->second.nonce); dep != sn->second.end();
       ++dep) {
    out.push_back(dep->second);
  }
  return out;
}

void Mempool::Insert(MempoolEntry entry) {
  entry.sequence = nextSequence++;
  byFee.insert(FeeKey{entry.feeRate, entry.sequence, entry.txid});
  for (const auto& in : entry.inputs) {
    spentBy[in] = entry.txid;
  }
  if (entry.hasNonce) {
    senderNonces[entry.sender][entry.nonce] = entry.txid;
  }
  ++senderCount[entry.sender];
  totalBytes += entry.size;
  std::string txid = entry.txid;
  entries[txid] = std::move(entry);
}

void Mempool::Erase(const std::string& txid) {
  auto it = entries.find(txid);
  if (it == entries.end()) {
    return;
  }
  const MempoolEntry& entry = it->second;
  byFee.erase(FeeKey{entry.feeRate, entry.sequence, entry.txid});
  for (const auto& in : entry.inputs) {
    auto sp = spentBy.find(in);
    if (sp != spentBy.end() && sp->second == txid) {
      spentBy.erase(sp);
    }
  }
  if (entry.hasNonce) {
    auto sn = senderNonces.find(entry.sender);
    if (sn != senderNonces.end()) {
      sn->second.erase(entry.nonce);
      if (sn->second.empty()) {
        senderNonces.erase(sn);
      }
    }
  }
  auto sc = senderCount.find(entry.sender);
  if (sc != senderCount.end() && --sc->second == 0) {
    senderCount.erase(sc);
  }
  totalBytes -= entry.size;
  entries.erase(it);
}

void Mempool::EraseWithDependents(const std::string& txid, uint64_t& counter) {
  for (const auto& id : WithDependents(txid)) {
    if (entries.count(id) != 0) {
      Erase(id);
      ++counter;
    }
  }
}

size_t Mempool::ExpireLocked(int64_t now) {
  size_t removed = 0;
  std::vector<std::string> old;
  for (const auto& [txid, entry] : entries) {
    if (entry.time + settings.mempoolMaxAge <= now) {
      old.push_back(txid);
    }
  }
  for (const auto& txid : old) {
    if (entries.count(txid) == 0) {
      continue;
    }
    uint64_t before = expired;
    EraseWithDependents(txid, expired);
    removed += static_cast<size_t>(expired - before);
  }

  for (auto fq = future.begin(); fq != future.end();) {
    auto& queue = fq->second;
    for (auto it = queue.begin(); it != queue.end();) {
      if (it->second.time + settings.mempoolMaxAge <= now) {
        it = queue.erase(it);
        --futureCount;
        ++expired;
        ++removed;
      } else {
        ++it;
      }
    }
    if (queue.empty()) {
      fq = future.erase(fq);
    } else {
      ++fq;
    }
  }

  for (auto it = senders.begin(); it != senders.end();) {
    SenderRecord& record = it->second;
    while (!record.invalidTimes.empty() &&
           record.invalidTimes.front() + settings.invalidWindowSeconds <= now) {
      record.invalidTimes.pop_front();
    }
    if (record.bannedUntil <= now && record.invalidTimes.empty()) {
      it = senders.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}

void Mempool::RecordInvalid(const std::string& sender, int64_t now) {
  if (sender.empty()) {
    return;
  }
  SenderRecord& record = senders[sender];
  while (!record.invalidTimes.empty() &&
         record.invalidTimes.front() + settings.invalidWindowSeconds <= now) {
    record.invalidTimes.pop_front();
  }
  record.invalidTimes.push_back(now);
  if (static_cast<int>(record.invalidTimes.size()) >= settings.invalidTxThreshold) {
    record.bannedUntil = now + settings.invalidBanSeconds;
    record.invalidTimes.clear();
    std::cerr << "Mempool: sender " << sender << " banned until " << record.bannedUntil
              << " after repeated invalid transactions\n";
  }
}

bool Mempool::IsBannedLocked(const std::string& sender, int64_t now) const {
  auto it = senders.find(sender);
  return it != senders.end() && it->second.bannedUntil > now;
}
