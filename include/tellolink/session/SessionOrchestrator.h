// Repository: TelloLink
// Component: Session Orchestrator
// Purpose: Serialized state machine driving preflight, handshake, pipeline and playback.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_SESSION_SESSION_ORCHESTRATOR_H_
#define TELLOLINK_SESSION_SESSION_ORCHESTRATOR_H_

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "tellolink/core/SessionConfig.h"
#include "tellolink/net/ICommandChannel.h"
#include "tellolink/pipeline/TranscodeSupervisor.hpp"
#include "tellolink/playback/IStreamPlayer.h"
#include "tellolink/playback/PlaybackBridge.h"
#include "tellolink/preflight/NetworkPreflight.h"
#include "tellolink/preflight/PermissionGate.h"
#include "tellolink/session/SessionMailbox.h"
#include "tellolink/session/SessionStatus.h"

namespace tellolink::session {

// Collaborators. Everything except `player` is required.
struct SessionDependencies {
  std::shared_ptr<preflight::IPermissionProvider> permission_provider;
  std::shared_ptr<preflight::INetworkStatusProvider> network_provider;
  net::CommandChannelFactory channel_factory;
  std::shared_ptr<pipeline::TranscodeSupervisor> supervisor;
  std::shared_ptr<playback::PlaybackBridge> bridge;
  std::shared_ptr<playback::IStreamPlayer> player;
};

// SessionOrchestrator owns the session status and the live command channel /
// transcode session pair.
//
//   Disconnected -> Connecting -> Connected -> Streaming
//   Error from any active state; Disconnected from any state on request.
//
// All state mutation happens on one dispatch thread. Connect() and
// Disconnect() only post to the mailbox; channel replies, pipeline outcomes
// and playback signals are posted by the threads that produce them. The
// handshake settle delay, acknowledgment timeout and player attach delay are
// deadlines kept by the dispatch loop, so a teardown cancels them.
//
// Resource invariant: at most one command channel and one active transcode
// session exist. Every transition into Disconnected or Error releases both
// before the status is published.
class SessionOrchestrator {
 public:
  using StatusListener = std::function<void(SessionStatus from, SessionStatus to,
                                            const std::string& message)>;

  SessionOrchestrator(core::SessionConfig config, SessionDependencies deps);

  // Tears down any live session and joins the dispatch thread.
  ~SessionOrchestrator();

  SessionOrchestrator(const SessionOrchestrator&) = delete;
  SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

  // Ignored unless the status is Disconnected or Error.
  void Connect();
  void Disconnect();

  [[nodiscard]] SessionSnapshot Snapshot() const;
  [[nodiscard]] SessionStatus status() const;

  // Called on the dispatch thread for every transition. Set before Connect().
  void SetStatusListener(StatusListener listener);

  // Blocks until the status equals `target` or the timeout passes.
  bool WaitForStatus(SessionStatus target, std::chrono::milliseconds timeout) const;

  const core::SessionConfig& config() const { return config_; }

 private:
  enum class TimerKind {
    kSettle,
    kAckTimeout,
    kPlayerAttach,
  };

  using Clock = std::chrono::steady_clock;

  void DispatchLoop();
  void Handle(const SessionEvent& event);
  void FireDueTimers();
  void OnTimer(TimerKind kind);

  void BeginAttempt();
  void SendHandshakeCommand();
  void OnCommandReply(const net::CommandReply& reply);
  void OnHandshakeComplete();
  bool StartPipeline();
  void OnPipelineTerminal(const pipeline::TranscodeCompletion& completion);
  void OnPlaybackReady();
  void OnPlaybackError(const std::string& detail);
  void OnTransportError(const std::string& message);

  // Detaches the player and schedules a re-attach while the retry budget
  // lasts. No-op without a player or an active pipeline.
  void RetryPlayerAttach();

  // Waits (bounded) for a pipeline that outlived the previous teardown.
  // False if it is still running.
  bool AwaitStoppingPipeline();

  void Schedule(TimerKind kind, int delay_ms);
  void CancelTimers(TimerKind kind);
  void DetachPlayer();

  // Releases timers, player, pipeline and channel, in that order, and makes
  // every event of the current attempt stale.
  void Teardown();
  void Fail(core::FailureSource source, const std::string& message);
  void Transition(SessionStatus to, const std::string& message = "",
                  core::FailureSource source = core::FailureSource::kNone);
  void PublishResources();

  const core::SessionConfig config_;
  SessionDependencies deps_;
  preflight::PermissionGate permission_gate_;
  preflight::NetworkPreflight preflight_;
  std::shared_ptr<SessionMailbox> mailbox_;
  playback::PlaybackBridge::SubscriptionToken bridge_token_ = 0;

  // Dispatch-thread state.
  std::unique_ptr<net::ICommandChannel> channel_;
  pipeline::TranscodeSessionId pipeline_session_ = pipeline::kInvalidSessionId;
  size_t handshake_step_ = 0;
  bool awaiting_ack_ = false;
  int pipeline_restarts_ = 0;
  int player_retries_ = 0;
  // Cancelled by a teardown but not terminated within the stop timeout.
  pipeline::TranscodeSessionId stopping_pipeline_ = pipeline::kInvalidSessionId;
  std::multimap<Clock::time_point, TimerKind> timers_;

  // Observer-visible state.
  mutable std::mutex state_mutex_;
  mutable std::condition_variable state_cv_;
  SessionSnapshot snapshot_;

  std::mutex listener_mutex_;
  StatusListener listener_;

  std::thread dispatch_thread_;
};

}  // namespace tellolink::session

#endif  // TELLOLINK_SESSION_SESSION_ORCHESTRATOR_H_
