// Repository: TelloLink
// Component: Session Mailbox
// Purpose: FIFO event queue funnelling every asynchronous signal into the orchestrator thread.
// Copyright (c) 2026 TelloLink

#include "tellolink/session/SessionMailbox.h"

namespace tellolink::session {

const char* SessionEventTypeName(SessionEventType type) {
  switch (type) {
    case SessionEventType::kConnectRequested:
      return "connect_requested";
    case SessionEventType::kDisconnectRequested:
      return "disconnect_requested";
    case SessionEventType::kCommandReply:
      return "command_reply";
    case SessionEventType::kTransportError:
      return "transport_error";
    case SessionEventType::kPipelineTerminal:
      return "pipeline_terminal";
    case SessionEventType::kPlaybackReady:
      return "playback_ready";
    case SessionEventType::kPlaybackError:
      return "playback_error";
    case SessionEventType::kShutdown:
      return "shutdown";
  }
  return "unknown";
}

bool SessionMailbox::Post(SessionEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return false;
    queue_.push_back(std::move(event));
  }
  cv_.notify_one();
  return true;
}

std::optional<SessionEvent> SessionMailbox::WaitPop(
    std::optional<std::chrono::steady_clock::time_point> deadline) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto ready = [this] { return !queue_.empty() || closed_; };
  if (deadline) {
    if (!cv_.wait_until(lock, *deadline, ready)) return std::nullopt;
  } else {
    cv_.wait(lock, ready);
  }
  if (queue_.empty()) return std::nullopt;
  SessionEvent event = std::move(queue_.front());
  queue_.pop_front();
  return event;
}

void SessionMailbox::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    queue_.clear();
  }
  cv_.notify_all();
}

bool SessionMailbox::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t SessionMailbox::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

}  // namespace tellolink::session
