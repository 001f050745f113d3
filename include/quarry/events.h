#pragma once

#include <cstddef>
#include <string>

#include "quarry/block.h"
#include "quarry/error.h"
#include "quarry/transaction.h"

// Signals the consensus core reports upward. Called with the chain lock
// held, so implementations must not call back into the engine synchronously.
class ConsensusListener {
 public:
  virtual ~ConsensusListener() = default;

  virtual void OnNewTip(const Block& tip) {}
  virtual void OnReorg(const Bytes& forkPoint, size_t disconnected, size_t connected) {}
  virtual void OnTransactionRejected(const Transaction& tx, Error error) {}
  // The network layer scores the peer; the core never bans peers itself.
  virtual void OnPeerMisbehavior(const std::string& peer, Error error) {}
  virtual void OnCheckpoint(int64_t height, const Bytes& blockHash) {}
};
