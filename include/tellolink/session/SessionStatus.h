// Repository: TelloLink
// Component: Session Status
// Purpose: The single connection status value and the snapshot read by observers.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_SESSION_SESSION_STATUS_H_
#define TELLOLINK_SESSION_SESSION_STATUS_H_

#include <cstdint>
#include <optional>
#include <string>

#include "tellolink/core/Failure.h"

namespace tellolink::session {

enum class SessionStatus {
  kDisconnected = 0,
  kConnecting = 1,
  kConnected = 2,
  kStreaming = 3,
  kError = 4,
};

const char* SessionStatusName(SessionStatus status);

// Everything an observer may inspect, read together under one lock.
// error_message is set in kError, and in kConnected when an advisory
// (playback failure, stream ended, pipeline restart) is attached.
struct SessionSnapshot {
  SessionStatus status = SessionStatus::kDisconnected;
  std::string error_message;
  core::FailureSource error_source = core::FailureSource::kNone;
  bool channel_open = false;
  std::optional<uint64_t> pipeline_session;
};

}  // namespace tellolink::session

#endif  // TELLOLINK_SESSION_SESSION_STATUS_H_
