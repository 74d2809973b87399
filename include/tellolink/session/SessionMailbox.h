// Repository: TelloLink
// Component: Session Mailbox
// Purpose: FIFO event queue funnelling every asynchronous signal into the orchestrator thread.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_SESSION_SESSION_MAILBOX_H_
#define TELLOLINK_SESSION_SESSION_MAILBOX_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "tellolink/net/ICommandChannel.h"
#include "tellolink/pipeline/TranscodeSupervisor.hpp"

namespace tellolink::session {

enum class SessionEventType {
  kConnectRequested,
  kDisconnectRequested,
  kCommandReply,
  kTransportError,
  kPipelineTerminal,
  kPlaybackReady,
  kPlaybackError,
  kShutdown,
};

const char* SessionEventTypeName(SessionEventType type);

struct SessionEvent {
  SessionEventType type = SessionEventType::kShutdown;

  // Attempt generation the event belongs to. 0 = not attempt-scoped
  // (operator requests, shutdown); always accepted.
  uint64_t generation = 0;

  net::CommandReply reply;                  // kCommandReply
  std::string message;                      // kTransportError, kPlaybackError
  pipeline::TranscodeCompletion completion; // kPipelineTerminal

  static SessionEvent Of(SessionEventType type, uint64_t generation = 0) {
    SessionEvent event;
    event.type = type;
    event.generation = generation;
    return event;
  }
};

// SessionMailbox is shared (by shared_ptr) between the orchestrator and every
// callback it hands out, so a callback outliving the orchestrator posts into
// a closed mailbox instead of a dangling object.
class SessionMailbox {
 public:
  SessionMailbox() = default;

  SessionMailbox(const SessionMailbox&) = delete;
  SessionMailbox& operator=(const SessionMailbox&) = delete;

  // Returns false (event dropped) once closed.
  bool Post(SessionEvent event);

  // Pops the oldest event. Waits until one arrives, the deadline passes, or
  // the mailbox closes; nullopt in the latter two cases. No deadline waits
  // indefinitely.
  std::optional<SessionEvent> WaitPop(
      std::optional<std::chrono::steady_clock::time_point> deadline);

  void Close();
  bool IsClosed() const;
  size_t Size() const;

  uint64_t CurrentGeneration() const { return generation_.load(std::memory_order_acquire); }
  uint64_t AdvanceGeneration() { return generation_.fetch_add(1, std::memory_order_acq_rel) + 1; }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<SessionEvent> queue_;
  bool closed_ = false;
  std::atomic<uint64_t> generation_{1};
};

}  // namespace tellolink::session

#endif  // TELLOLINK_SESSION_SESSION_MAILBOX_H_
