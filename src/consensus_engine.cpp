#include "quarry/consensus_engine.h"

#include <algorithm>
#include <ctime>
#include <iostream>

#include "quarry/crypto.h"

int64_t SystemClock() {
  return static_cast<int64_t>(std::time(nullptr));
}

Block BlockTemplate::Build(const Bytes& pubKeyHash, const std::string& data) const {
  std::vector<Transaction> txs;
  txs.reserve(transactions.size() + 1);
  txs.push_back(NewCoinbaseTX(pubKeyHash, subsidy + fees, height, data));
  txs.insert(txs.end(), transactions.begin(), transactions.end());
  return NewBlock(txs, parentHash, height, timestamp, targetBits);
}

ConsensusEngine::ConsensusEngine(const Settings& s, Clock c)
    : settings(s),
      clock(c ? std::move(c) : Clock(SystemClock)),
      mempool(settings),
      orphans(settings),
      checkpoints(settings),
      validator(settings),
      difficulty(settings),
      miningToken(NewCancellationToken()) {
  ledger.undoRetention =
      static_cast<size_t>(std::max<int64_t>(settings.maxReorgDepth, 0)) + 1;
}

Error ConsensusEngine::Open() {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  persistent = !settings.dataDir.empty();
  if (!persistent) {
    return InitGenesis();
  }
  if (!store.Open(settings.dataDir) || !checkpoints.Open(settings.dataDir)) {
    return Halt("cannot open data directory " + settings.dataDir);
  }
  journal.Open(settings.dataDir);
  return LoadFromStore();
}

bool ConsensusEngine::Flush() {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  if (!persistent) {
    return true;
  }
  if (!WriteFileBytes(JoinPath(settings.dataDir, "utxo.dat"), ledger.Serialize(true))) {
    Halt("cannot write utxo.dat");
    return false;
  }
  return true;
}

void ConsensusEngine::AddListener(ConsensusListener* listener) {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  listeners.push_back(listener);
}

void ConsensusEngine::RemoveListener(ConsensusListener* listener) {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  listeners.erase(std::remove(listeners.begin(), listeners.end(), listener),
                  listeners.end());
}

Error ConsensusEngine::InitGenesis() {
  Block genesis = MakeGenesisBlock(settings);
  ledger.Reset();
  LedgerDelta delta;
  Error err = ledger.ApplyBlock(genesis, delta);
  if (err != Error::kOk) {
    std::cerr << "Genesis block does not connect: " << DescribeError(err) << "\n";
    return err;
  }
  index.Add(genesis);
  index.SetActiveTip(genesis.hash);
  IndexTransactions(genesis, true);
  if (persistent && !store.Append(genesis)) {
    return Halt("cannot write genesis block");
  }
  std::cout << "Genesis block " << BytesToHex(genesis.hash) << "\n";
  return Error::kOk;
}

Error ConsensusEngine::LoadFromStore() {
  std::vector<Block> blocks;
  if (!store.LoadAll(blocks)) {
    return Halt("cannot read " + store.path);
  }
  if (blocks.empty()) {
    return InitGenesis();
  }

  Block genesis = MakeGenesisBlock(settings);
  if (blocks.front().hash != genesis.hash) {
    return Halt("block store does not start with this network's genesis block");
  }
  for (const auto& block : blocks) {
    if (!index.Add(block)) {
      std::cerr << "Skipping stored block " << BytesToHex(block.hash)
                << " with unknown parent\n";
    }
  }
  const BlockIndexEntry* best = index.BestTip();

  bool restored = false;
  std::string utxoPath = JoinPath(settings.dataDir, "utxo.dat");
  Bytes utxoData;
  if (FileExists(utxoPath) && ReadFileBytes(utxoPath, utxoData)) {
    UtxoLedger snapshot;
    snapshot.undoRetention = ledger.undoRetention;
    if (UtxoLedger::Deserialize(utxoData, snapshot)) {
      const BlockIndexEntry* at = index.AncestorAt(best->hash, snapshot.Height());
      if (at && at->hash == snapshot.TipHash()) {
        ledger = std::move(snapshot);
        restored = true;
      }
    }
    if (!restored) {
      std::cerr << "utxo.dat is not on the best chain, rebuilding\n";
    }
  }
  if (!restored) {
    std::vector<int64_t> heights = checkpoints.Heights();
    for (auto it = heights.rbegin(); it != heights.rend(); ++it) {
      const Checkpoint* c = checkpoints.Get(*it);
      const BlockIndexEntry* at = index.AncestorAt(best->hash, *it);
      if (c && at && at->hash == c->blockHash && checkpoints.Restore(*c, ledger)) {
        std::cout << "Restored ledger from checkpoint at height " << *it << "\n";
        restored = true;
        break;
      }
    }
  }
  if (!restored) {
    ledger.Reset();
    LedgerDelta delta;
    Error err = ledger.ApplyBlock(genesis, delta);
    if (err != Error::kOk) {
      return err;
    }
  }

  for (const Block* block : index.Branch(ledger.TipHash(), best->hash)) {
    LedgerDelta delta;
    Error err = ledger.ApplyBlock(*block, delta);
    if (err != Error::kOk) {
      std::cerr << "Stored block " << block->height << " " << BytesToHex(block->hash)
                << " does not connect: " << DescribeError(err) << "\n";
      index.MarkInvalid(block->hash);
      break;
    }
  }
  index.SetActiveTip(ledger.TipHash());

  txIndex.clear();
  for (int64_t h = 0; h <= index.ActiveHeight(); ++h) {
    const BlockIndexEntry* entry = index.ActiveAt(h);
    if (const Block* block = entry ? index.GetBlock(entry->hash) : nullptr) {
      IndexTransactions(*block, true);
    }
  }

  for (int64_t h : checkpoints.Heights()) {
    const BlockIndexEntry* at = index.ActiveAt(h);
    if (!at || at->hash != checkpoints.Get(h)->blockHash) {
      std::cerr << "Dropping checkpoints from height " << h << ", not on the active chain\n";
      checkpoints.DropAbove(h - 1);
      break;
    }
  }

  ReorgJournalEntry pending;
  if (journal.Pending(pending)) {
    std::cerr << "Found unfinished reorg from " << BytesToHex(pending.oldTip) << " to "
              << BytesToHex(pending.newTip) << "; state rebuilt from stored blocks\n";
    if (!journal.Clear()) {
      return Halt("cannot clear reorg journal");
    }
  }

  std::cout << "Loaded " << blocks.size() << " blocks, tip " << index.ActiveHeight() << " "
            << BytesToHex(ledger.TipHash()) << "\n";
  return Error::kOk;
}

Error ConsensusEngine::ApplyExternalBlock(const Block& block, TipChange* change,
                                          const std::string& peer) {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  TipChange local;
  TipChange& out = change ? *change : local;
  out = TipChange{};
  if (halted) {
    return Error::kStorageFailure;
  }

  Bytes hash = block.BlockHeader::Hash();
  if (index.Contains(hash)) {
    return index.IsInvalid(hash) ? Error::kInvalidAncestor : Error::kDuplicateBlock;
  }
  if (orphans.Contains(hash)) {
    return Error::kDuplicateBlock;
  }

  Error err = validator.Check(block, Now());
  if (err != Error::kOk) {
    std::cerr << "Rejected block " << BytesToHex(hash) << ": " << DescribeError(err) << "\n";
    if (IsPeerPenalizable(err)) {
      ReportPeer(peer, err);
    }
    return err;
  }

  Block b = block;
  b.hash = hash;
  err = ProcessBlock(b, peer, out);
  if (err == Error::kOk) {
    ProcessOrphans(b.hash);
  }
  return err;
}

Error ConsensusEngine::ProcessBlock(const Block& block, const std::string& peer,
                                    TipChange& change) {
  if (!index.Contains(block.prevBlockHash)) {
    if (orphans.WasExpired(block.hash)) {
      ReportPeer(peer, Error::kOrphanBlock);
    }
    change.kind = TipChangeKind::kOrphaned;
    return orphans.Add(block, peer, Now());
  }
  if (index.IsInvalid(block.prevBlockHash)) {
    ReportPeer(peer, Error::kInvalidAncestor);
    return Error::kInvalidAncestor;
  }

  Error err = ValidateAgainstParent(block);
  if (err != Error::kOk) {
    if (err != Error::kReorgTooDeep) {
      std::cerr << "Rejected block " << block.height << " " << BytesToHex(block.hash) << ": "
                << DescribeError(err) << "\n";
      if (IsPeerPenalizable(err)) {
        ReportPeer(peer, err);
      }
    }
    return err;
  }

  if (persistent && !store.Append(block)) {
    return Halt("cannot append block " + BytesToHex(block.hash));
  }
  index.Add(block);

  const BlockIndexEntry* entry = index.Find(block.hash);
  const BlockIndexEntry* tip = index.ActiveTip();
  if (!BlockIndex::IsBetterTip(*entry, *tip)) {
    change.kind = TipChangeKind::kCompeting;
    change.tipHash = tip->hash;
    change.height = tip->height;
    std::cout << "Stored side-branch block " << block.height << " "
              << BytesToHex(block.hash) << "\n";
    return Error::kOk;
  }

  if (peer != kLocalPeer) {
    lastPeerBlockTime = Now();
  }
  if (block.prevBlockHash == tip->hash) {
    return ConnectTip(block, change);
  }
  return Reorganize(block.hash, change);
}

Error ConsensusEngine::ValidateAgainstParent(const Block& block) {
  Error err = validator.Accept(block, AncestorsOf(block.prevBlockHash));
  if (err != Error::kOk) {
    return err;
  }
  err = CheckReorgDepth(block.prevBlockHash);
  if (err != Error::kOk) {
    return err;
  }
  UtxoView view(ledger);
  if (!BuildBranchView(block.prevBlockHash, view)) {
    return Error::kReorgTooDeep;
  }
  return validator.Connect(block, view);
}

Error ConsensusEngine::CheckReorgDepth(const Bytes& parentHash) const {
  const BlockIndexEntry* tip = index.ActiveTip();
  const BlockIndexEntry* fork = index.FindFork(parentHash, tip->hash);
  if (!fork) {
    return Error::kInvalidAncestor;
  }
  int64_t depth = tip->height - fork->height;
  if (depth > settings.maxReorgDepth || fork->height < checkpoints.LatestHeight()) {
    std::cerr << "Suspicious fork at height " << fork->height << " would disconnect "
              << depth << " blocks (max " << settings.maxReorgDepth
              << ", last checkpoint " << checkpoints.LatestHeight() << "), refused\n";
    return Error::kReorgTooDeep;
  }
  return Error::kOk;
}

// Rewinds the canonical tip to the fork with retained undo data, then applies
// the side branch up to parentHash.
bool ConsensusEngine::BuildBranchView(const Bytes& parentHash, UtxoView& view) const {
  const BlockIndexEntry* tip = index.ActiveTip();
  const BlockIndexEntry* fork = index.FindFork(parentHash, tip->hash);
  if (!fork) {
    return false;
  }
  for (const BlockIndexEntry* e = tip; e && e->hash != fork->hash;
       e = index.Find(e->prevHash)) {
    const LedgerDelta* delta = ledger.Undo(e->hash);
    if (!delta || view.UndoBlock(*delta) != Error::kOk) {
      return false;
    }
  }
  for (const Block* block : index.Branch(fork->hash, parentHash)) {
    LedgerDelta delta;
    if (view.ApplyBlock(*block, delta) != Error::kOk) {
      return false;
    }
  }
  return true;
}

Error ConsensusEngine::ConnectTip(const Block& block, TipChange& change) {
  LedgerDelta delta;
  Error err = ledger.ApplyBlock(block, delta);
  if (err != Error::kOk) {
    index.MarkInvalid(block.hash);
    return err;
  }
  index.SetActiveTip(block.hash);
  IndexTransactions(block, true);
  mempool.OnBlockConnected(block, ledger, Context(), Now());

  change.kind = TipChangeKind::kExtended;
  change.tipHash = block.hash;
  change.height = block.height;
  std::cout << "Connected block " << block.height << " " << BytesToHex(block.hash) << " ("
            << block.transactions.size() << " txs)\n";

  err = AfterConnect(block);
  if (err != Error::kOk) {
    return err;
  }
  NotifyTip(block);
  CancelMining();
  return Error::kOk;
}

Error ConsensusEngine::Reorganize(const Bytes& newTip, TipChange& change) {
  Bytes oldTip = index.ActiveTip()->hash;
  const BlockIndexEntry* fork = index.FindFork(newTip, oldTip);
  if (!fork) {
    return Error::kInvalidAncestor;
  }
  Bytes forkHash = fork->hash;
  int64_t forkHeight = fork->height;
  std::vector<const Block*> disconnect = index.Branch(forkHash, oldTip);
  std::vector<const Block*> connect = index.Branch(forkHash, newTip);
  if (connect.empty()) {
    return Error::kInvalidAncestor;
  }
  if (static_cast<int64_t>(disconnect.size()) > settings.maxReorgDepth ||
      forkHeight < checkpoints.LatestHeight()) {
    std::cerr << "Suspicious reorg at height " << forkHeight << " of "
              << disconnect.size() << " blocks refused\n";
    return Error::kReorgTooDeep;
  }

  if (persistent) {
    ReorgJournalEntry entry{oldTip, newTip, forkHash, Now()};
    if (!journal.Begin(entry)) {
      return Halt("cannot write reorg journal");
    }
  }

  Error err = Error::kOk;
  size_t reverted = 0;
  for (auto it = disconnect.rbegin(); it != disconnect.rend(); ++it) {
    err = ledger.RevertBlock(**it);
    if (err != Error::kOk) {
      break;
    }
    IndexTransactions(**it, false);
    ++reverted;
  }

  size_t applied = 0;
  std::vector<Checkpoint> pending;
  const Block* failed = nullptr;
  if (err == Error::kOk) {
    for (const Block* block : connect) {
      LedgerDelta delta;
      err = ledger.ApplyBlock(*block, delta);
      if (err != Error::kOk) {
        failed = block;
        break;
      }
      IndexTransactions(*block, true);
      ++applied;
      Checkpoint c;
      if (checkpoints.Prepare(*block, ledger, Now(), c)) {
        pending.push_back(std::move(c));
      }
    }
  }

  if (err != Error::kOk) {
    for (size_t i = applied; i > 0; --i) {
      if (ledger.RevertBlock(*connect[i - 1]) != Error::kOk) {
        return Halt("reorg rollback failed");
      }
      IndexTransactions(*connect[i - 1], false);
    }
    for (size_t i = disconnect.size() - reverted; i < disconnect.size(); ++i) {
      LedgerDelta delta;
      if (ledger.ApplyBlock(*disconnect[i], delta) != Error::kOk) {
        return Halt("reorg rollback failed");
      }
      IndexTransactions(*disconnect[i], true);
    }
    if (failed) {
      index.MarkInvalid(failed->hash);
    }
    if (persistent && !journal.Clear()) {
      return Halt("cannot clear reorg journal");
    }
    std::cerr << "Reorg to " << BytesToHex(newTip) << " failed: " << DescribeError(err)
              << ", keeping current chain\n";
    return err;
  }

  index.SetActiveTip(newTip);
  if (persistent && !journal.Clear()) {
    return Halt("cannot clear reorg journal");
  }

  std::vector<Transaction> returned;
  for (const Block* block : disconnect) {
    for (const auto& tx : block->transactions) {
      if (!tx.IsCoinbase()) {
        returned.push_back(tx);
      }
    }
  }
  size_t readmitted = mempool.Reinject(returned, ledger, Context(), Now());

  checkpoints.DropAbove(forkHeight);
  for (auto& c : pending) {
    int64_t height = c.height;
    Bytes hash = c.blockHash;
    if (!checkpoints.Commit(std::move(c))) {
      return Halt("cannot write checkpoint");
    }
    for (auto* l : listeners) {
      l->OnCheckpoint(height, hash);
    }
  }
  if (!pending.empty() && !Flush()) {
    return Error::kStorageFailure;
  }

  const Block& tip = *connect.back();
  change.kind = TipChangeKind::kReorg;
  change.tipHash = tip.hash;
  change.height = tip.height;
  change.forkPoint = forkHash;
  change.disconnected = disconnect.size();
  change.connected = connect.size();
  std::cout << "Reorg at height " << forkHeight << ": disconnected " << disconnect.size()
            << ", connected " << connect.size() << ", readmitted " << readmitted
            << " txs, new tip " << tip.height << " " << BytesToHex(tip.hash) << "\n";

  for (auto* l : listeners) {
    l->OnReorg(forkHash, disconnect.size(), connect.size());
  }
  NotifyTip(tip);
  CancelMining();
  return Error::kOk;
}

Error ConsensusEngine::AfterConnect(const Block& block) {
  bool created = false;
  if (!checkpoints.MaybeCreate(block, ledger, Now(), &created)) {
    return Halt("cannot write checkpoint");
  }
  if (created) {
    for (auto* l : listeners) {
      l->OnCheckpoint(block.height, block.hash);
    }
    if (!Flush()) {
      return Error::kStorageFailure;
    }
  }
  return Error::kOk;
}

void ConsensusEngine::ProcessOrphans(const Bytes& parentHash) {
  std::vector<Bytes> queue{parentHash};
  while (!queue.empty()) {
    Bytes parent = queue.back();
    queue.pop_back();
    for (auto& orphan : orphans.TakeChildren(parent)) {
      TipChange change;
      Error err = ProcessBlock(orphan.block, orphan.peer, change);
      if (halted) {
        return;
      }
      if (err == Error::kOk) {
        queue.push_back(orphan.block.hash);
      }
    }
  }
}

void ConsensusEngine::IndexTransactions(const Block& block, bool connect) {
  for (const auto& tx : block.transactions) {
    std::string key = BytesToHex(tx.id);
    if (connect) {
      txIndex[key] = block.hash;
    } else {
      auto it = txIndex.find(key);
      if (it != txIndex.end() && it->second == block.hash) {
        txIndex.erase(it);
      }
    }
  }
}

Error ConsensusEngine::SubmitTransaction(const Transaction& tx) {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  if (halted) {
    return Error::kStorageFailure;
  }
  Transaction t = tx;
  t.UpdateId();
  Error err = mempool.Add(t, ledger, Context(), Now());
  if (err != Error::kOk && err != Error::kFutureNonce) {
    ReportRejected(t, err);
  }
  return err;
}

Error ConsensusEngine::OnBlockReceived(const Bytes& data, const std::string& peer) {
  Block block;
  if (!Block::Deserialize(data, block)) {
    std::lock_guard<std::recursive_mutex> lock(chainMutex);
    ReportPeer(peer, Error::kMalformed);
    return Error::kMalformed;
  }
  return ApplyExternalBlock(block, nullptr, peer);
}

Error ConsensusEngine::OnTransactionReceived(const Bytes& data, const std::string& peer) {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  Transaction tx;
  if (!Transaction::FromBytes(data, tx)) {
    ReportPeer(peer, Error::kMalformed);
    return Error::kMalformed;
  }
  Error err = SubmitTransaction(tx);
  if (IsPeerPenalizable(err)) {
    ReportPeer(peer, err);
  }
  return err;
}

bool ConsensusEngine::GetBlock(const Bytes& hash, Block& out) const {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  const Block* block = index.GetBlock(hash);
  if (!block) {
    return false;
  }
  out = *block;
  return true;
}

bool ConsensusEngine::GetBlockAt(int64_t height, Block& out) const {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  const BlockIndexEntry* entry = index.ActiveAt(height);
  return entry && GetBlock(entry->hash, out);
}

std::vector<BlockHeader> ConsensusEngine::GetHeaders(int64_t fromHeight, size_t count) const {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  std::vector<BlockHeader> out;
  for (int64_t h = std::max<int64_t>(fromHeight, 0);
       h <= index.ActiveHeight() && out.size() < count; ++h) {
    out.push_back(index.ActiveAt(h)->header);
  }
  return out;
}

Error ConsensusEngine::GetMerkleProof(const Bytes& txid, MerkleProof& out) const {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  auto it = txIndex.find(BytesToHex(txid));
  if (it == txIndex.end()) {
    return Error::kNotFound;
  }
  const Block* block = index.GetBlock(it->second);
  if (!block || !checkpoints.BuildMerkleProof(*block, txid, out)) {
    return Error::kNotFound;
  }
  return Error::kOk;
}

Error ConsensusEngine::GetBlockTemplate(BlockTemplate& out) {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  if (halted) {
    return Error::kStorageFailure;
  }
  const BlockIndexEntry* tip = index.ActiveTip();
  std::vector<BlockHeader> ancestors = AncestorsOf(tip->hash);

  out = BlockTemplate{};
  out.parentHash = tip->hash;
  out.height = tip->height + 1;
  out.targetBits = difficulty.NextTargetBits(ancestors);
  out.medianTimePast = difficulty.MedianTimePast(ancestors);
  out.timestamp = std::max(Now(), out.medianTimePast);

  // Room for the coinbase and header.
  const size_t reserve = 1000;
  size_t budget = settings.maxBlockBytes > reserve ? settings.maxBlockBytes - reserve : 0;
  BlockSelection selection = mempool.SelectForBlock(ledger, Context(), budget);
  out.transactions = std::move(selection.transactions);
  out.fees = selection.fees;
  out.subsidy = validator.AllowedSubsidy(out.height, ledger.Issued());
  out.notBefore = lastPeerBlockTime > 0 ? lastPeerBlockTime + settings.miningCooldown : 0;
  out.abort = miningToken;
  return Error::kOk;
}

Error ConsensusEngine::SubmitMinedBlock(const Block& block, TipChange* change) {
  Error err = ApplyExternalBlock(block, change, kLocalPeer);
  if (err == Error::kOk) {
    std::cout << "Mined block " << block.height << " " << BytesToHex(block.BlockHeader::Hash())
              << "\n";
  }
  return err;
}

void ConsensusEngine::CancelMining() {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  miningToken->store(true);
  miningToken = NewCancellationToken();
}

void ConsensusEngine::Maintain() {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  int64_t now = Now();
  for (const auto& expired : orphans.Expire(now)) {
    std::cerr << "Orphan block " << BytesToHex(expired.block.hash) << " from "
              << (expired.peer.empty() ? "unknown" : expired.peer) << " expired\n";
  }
  mempool.Expire(now);
}

Amount ConsensusEngine::GetBalance(const Bytes& pubKeyHash) const {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  return ledger.GetBalance(pubKeyHash);
}

std::vector<UtxoRecord> ConsensusEngine::ListUnspent(const Bytes& pubKeyHash) const {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  return ledger.ListUnspent(pubKeyHash);
}

uint64_t ConsensusEngine::NextNonce(const Bytes& sender) const {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  return ledger.NextNonce(sender);
}

MempoolInfo ConsensusEngine::GetMempoolInfo() const {
  return mempool.Info(Now());
}

bool ConsensusEngine::GetMempoolEntry(const Bytes& txid, MempoolEntry& out) const {
  return mempool.Get(txid, out);
}

bool ConsensusEngine::IsTransactionQueued(const Bytes& txid) const {
  return mempool.IsQueued(txid);
}

EngineStatus ConsensusEngine::GetStatus() const {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  EngineStatus status;
  const BlockIndexEntry* tip = index.ActiveTip();
  if (tip) {
    std::vector<BlockHeader> ancestors = AncestorsOf(tip->hash);
    status.height = tip->height;
    status.tipHash = tip->hash;
    status.chainWork = tip->chainWork;
    status.nextTargetBits = difficulty.NextTargetBits(ancestors);
    status.medianTimePast = difficulty.MedianTimePast(ancestors);
  }
  status.knownBlocks = index.Size();
  status.tips = index.Tips().size();
  status.orphans = orphans.Size();
  status.mempool = mempool.Size();
  status.latestCheckpoint = checkpoints.LatestHeight();
  status.issued = ledger.Issued();
  status.stateVersion = ledger.StateVersion();
  status.halted = halted;
  return status;
}

bool ConsensusEngine::CheckSupplyInvariant() const {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  Amount unspent = 0;
  if (!ledger.SumUnspent(unspent)) {
    return false;
  }
  return unspent == ledger.Issued() && ledger.Issued() <= settings.supplyCap;
}

Bytes ConsensusEngine::LedgerDigest() const {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  return ledger.Digest();
}

bool ConsensusEngine::IsHalted() const {
  std::lock_guard<std::recursive_mutex> lock(chainMutex);
  return halted;
}

const Settings& ConsensusEngine::GetSettings() const {
  return settings;
}

int64_t ConsensusEngine::Now() const {
  return clock();
}

Error ConsensusEngine::Halt(const std::string& what) {
  std::cerr << "FATAL: " << what << "; consensus engine halted\n";
  halted = true;
  return Error::kStorageFailure;
}

ChainContext ConsensusEngine::Context() const {
  ChainContext ctx;
  ctx.height = ledger.Height() + 1;
  ctx.tipHash = ledger.TipHash();
  ctx.stateVersion = ledger.StateVersion();
  return ctx;
}

std::vector<BlockHeader> ConsensusEngine::AncestorsOf(const Bytes& hash) const {
  return index.Ancestors(hash, difficulty.WindowSize());
}

void ConsensusEngine::NotifyTip(const Block& tip) {
  for (auto* l : listeners) {
    l->OnNewTip(tip);
  }
}

void ConsensusEngine::ReportPeer(const std::string& peer, Error error) {
  if (peer.empty() || peer == kLocalPeer) {
    return;
  }
  std::cerr << "Peer " << peer << " misbehaved: " << DescribeError(error) << "\n";
  for (auto* l : listeners) {
    l->OnPeerMisbehavior(peer, error);
  }
}

void ConsensusEngine::ReportRejected(const Transaction& tx, Error error) {
  for (auto* l : listeners) {
    l->OnTransactionRejected(tx, error);
  }
}
