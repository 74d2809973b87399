// Repository: TelloLink
// Component: Playback Bridge
// Purpose: Fan-out of renderer ready/error signals to the session orchestrator.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_PLAYBACK_PLAYBACK_BRIDGE_H_
#define TELLOLINK_PLAYBACK_PLAYBACK_BRIDGE_H_

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace tellolink::playback {

using ReadyHandler = std::function<void()>;
using PlaybackErrorHandler = std::function<void(const std::string& detail)>;

// PlaybackBridge is the only path by which rendering reaches the session.
// Players (or a UI) call NotifyReady() when the first frame of the stream was
// rendered and NotifyPlaybackError() on load or decode errors. Handlers run
// on the notifying thread, outside the bridge lock.
class PlaybackBridge {
 public:
  using SubscriptionToken = uint64_t;

  explicit PlaybackBridge(std::string stream_url);

  const std::string& stream_url() const { return stream_url_; }

  SubscriptionToken Subscribe(ReadyHandler on_ready, PlaybackErrorHandler on_error);
  void Unsubscribe(SubscriptionToken token);

  void NotifyReady();
  void NotifyPlaybackError(const std::string& detail);

 private:
  struct Subscription {
    ReadyHandler on_ready;
    PlaybackErrorHandler on_error;
  };

  const std::string stream_url_;

  std::mutex mutex_;
  std::map<SubscriptionToken, Subscription> subscriptions_;
  SubscriptionToken next_token_ = 1;
};

}  // namespace tellolink::playback

#endif  // TELLOLINK_PLAYBACK_PLAYBACK_BRIDGE_H_
