// Repository: TelloLink
// Component: Stream Player Interface
// Purpose: Consumer of the re-muxed stream, attached and detached by the orchestrator.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_PLAYBACK_I_STREAM_PLAYER_H_
#define TELLOLINK_PLAYBACK_I_STREAM_PLAYER_H_

#include <string>

namespace tellolink::playback {

// Players report readiness and errors through a PlaybackBridge, never to the
// orchestrator directly.
class IStreamPlayer {
 public:
  virtual ~IStreamPlayer() = default;

  // Starts consuming `url`. Returns false if the player could not start;
  // later failures go to the bridge.
  virtual bool Attach(const std::string& url) = 0;

  // Stops consuming. Idempotent. No bridge notification after return.
  virtual void Detach() = 0;
};

}  // namespace tellolink::playback

#endif  // TELLOLINK_PLAYBACK_I_STREAM_PLAYER_H_
