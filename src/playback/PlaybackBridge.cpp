// Repository: TelloLink
// Component: Playback Bridge
// Purpose: Fan-out of renderer ready/error signals to the session orchestrator.
// Copyright (c) 2026 TelloLink

#include "tellolink/playback/PlaybackBridge.h"

#include <vector>

#include "tellolink/util/Logger.hpp"

namespace tellolink::playback {

using util::Logger;

PlaybackBridge::PlaybackBridge(std::string stream_url) : stream_url_(std::move(stream_url)) {}

PlaybackBridge::SubscriptionToken PlaybackBridge::Subscribe(ReadyHandler on_ready,
                                                            PlaybackErrorHandler on_error) {
  std::lock_guard<std::mutex> lock(mutex_);
  const SubscriptionToken token = next_token_++;
  subscriptions_[token] = Subscription{std::move(on_ready), std::move(on_error)};
  return token;
}

void PlaybackBridge::Unsubscribe(SubscriptionToken token) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscriptions_.erase(token);
}

void PlaybackBridge::NotifyReady() {
  std::vector<ReadyHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [token, sub] : subscriptions_) {
      if (sub.on_ready) handlers.push_back(sub.on_ready);
    }
  }
  Logger::Info("[PlaybackBridge] Ready: " + stream_url_);
  for (const auto& handler : handlers) handler();
}

void PlaybackBridge::NotifyPlaybackError(const std::string& detail) {
  std::vector<PlaybackErrorHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [token, sub] : subscriptions_) {
      if (sub.on_error) handlers.push_back(sub.on_error);
    }
  }
  Logger::Warn("[PlaybackBridge] Playback error: " + detail);
  for (const auto& handler : handlers) handler(detail);
}

}  // namespace tellolink::playback
