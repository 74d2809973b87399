// Repository: TelloLink
// Component: Session Orchestrator
// Purpose: Serialized state machine driving preflight, handshake, pipeline and playback.
// Copyright (c) 2026 TelloLink

#include "tellolink/session/SessionOrchestrator.h"

#include <iterator>

#include "tellolink/util/Logger.hpp"

namespace tellolink::session {

using core::FailureSource;
using util::Logger;

namespace {

// Activation, then stream enable. Fixed order, one in flight at a time.
constexpr const char* kHandshake[] = {"command", "streamon"};
constexpr size_t kHandshakeLength = sizeof(kHandshake) / sizeof(kHandshake[0]);

}  // namespace

const char* SessionStatusName(SessionStatus status) {
  switch (status) {
    case SessionStatus::kDisconnected:
      return "Disconnected";
    case SessionStatus::kConnecting:
      return "Connecting";
    case SessionStatus::kConnected:
      return "Connected";
    case SessionStatus::kStreaming:
      return "Streaming";
    case SessionStatus::kError:
      return "Error";
  }
  return "Unknown";
}

SessionOrchestrator::SessionOrchestrator(core::SessionConfig config, SessionDependencies deps)
    : config_(std::move(config)),
      deps_(std::move(deps)),
      permission_gate_(deps_.permission_provider),
      preflight_(deps_.network_provider, config_.network_prefix),
      mailbox_(std::make_shared<SessionMailbox>()) {
  if (deps_.bridge) {
    std::shared_ptr<SessionMailbox> mailbox = mailbox_;
    bridge_token_ = deps_.bridge->Subscribe(
        [mailbox] {
          mailbox->Post(SessionEvent::Of(SessionEventType::kPlaybackReady,
                                         mailbox->CurrentGeneration()));
        },
        [mailbox](const std::string& detail) {
          SessionEvent event = SessionEvent::Of(SessionEventType::kPlaybackError,
                                                mailbox->CurrentGeneration());
          event.message = detail;
          mailbox->Post(std::move(event));
        });
  }
  dispatch_thread_ = std::thread(&SessionOrchestrator::DispatchLoop, this);
}

SessionOrchestrator::~SessionOrchestrator() {
  if (deps_.bridge) {
    deps_.bridge->Unsubscribe(bridge_token_);
  }
  mailbox_->Post(SessionEvent::Of(SessionEventType::kShutdown));
  if (dispatch_thread_.joinable()) {
    dispatch_thread_.join();
  }
  mailbox_->Close();
}

void SessionOrchestrator::Connect() {
  mailbox_->Post(SessionEvent::Of(SessionEventType::kConnectRequested));
}

void SessionOrchestrator::Disconnect() {
  mailbox_->Post(SessionEvent::Of(SessionEventType::kDisconnectRequested));
}

SessionSnapshot SessionOrchestrator::Snapshot() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return snapshot_;
}

SessionStatus SessionOrchestrator::status() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return snapshot_.status;
}

void SessionOrchestrator::SetStatusListener(StatusListener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listener_ = std::move(listener);
}

bool SessionOrchestrator::WaitForStatus(SessionStatus target,
                                        std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(state_mutex_);
  return state_cv_.wait_for(lock, timeout, [&] { return snapshot_.status == target; });
}

// ---------------------------------------------------------------------------
// Dispatch loop
// ---------------------------------------------------------------------------

void SessionOrchestrator::DispatchLoop() {
  while (true) {
    std::optional<Clock::time_point> deadline;
    if (!timers_.empty()) deadline = timers_.begin()->first;

    std::optional<SessionEvent> event = mailbox_->WaitPop(deadline);
    if (event) {
      if (event->type == SessionEventType::kShutdown) {
        if (status() != SessionStatus::kDisconnected) {
          Teardown();
          Transition(SessionStatus::kDisconnected);
        }
        return;
      }
      if (event->generation != 0 && event->generation != mailbox_->CurrentGeneration()) {
        Logger::Debug(std::string("[SessionOrchestrator] Dropping stale ") +
                      SessionEventTypeName(event->type) + " from attempt " +
                      std::to_string(event->generation));
      } else {
        Handle(*event);
      }
    } else if (mailbox_->IsClosed()) {
      return;
    }
    FireDueTimers();
  }
}

void SessionOrchestrator::FireDueTimers() {
  // A handler may schedule or clear timers; re-read begin() every round.
  while (!timers_.empty() && timers_.begin()->first <= Clock::now()) {
    const TimerKind kind = timers_.begin()->second;
    timers_.erase(timers_.begin());
    OnTimer(kind);
  }
}

void SessionOrchestrator::Handle(const SessionEvent& event) {
  switch (event.type) {
    case SessionEventType::kConnectRequested: {
      const SessionStatus current = status();
      if (current != SessionStatus::kDisconnected && current != SessionStatus::kError) {
        Logger::Debug(std::string("[SessionOrchestrator] Connect ignored while ") +
                      SessionStatusName(current));
        return;
      }
      BeginAttempt();
      return;
    }
    case SessionEventType::kDisconnectRequested:
      if (status() == SessionStatus::kDisconnected) {
        Logger::Debug("[SessionOrchestrator] Disconnect ignored: already disconnected");
        return;
      }
      Teardown();
      Transition(SessionStatus::kDisconnected);
      return;
    case SessionEventType::kCommandReply:
      OnCommandReply(event.reply);
      return;
    case SessionEventType::kTransportError:
      OnTransportError(event.message);
      return;
    case SessionEventType::kPipelineTerminal:
      OnPipelineTerminal(event.completion);
      return;
    case SessionEventType::kPlaybackReady:
      OnPlaybackReady();
      return;
    case SessionEventType::kPlaybackError:
      OnPlaybackError(event.message);
      return;
    case SessionEventType::kShutdown:
      return;
  }
}

void SessionOrchestrator::OnTimer(TimerKind kind) {
  switch (kind) {
    case TimerKind::kSettle:
      ++handshake_step_;
      if (handshake_step_ < kHandshakeLength) {
        SendHandshakeCommand();
      } else {
        OnHandshakeComplete();
      }
      return;
    case TimerKind::kAckTimeout:
      awaiting_ack_ = false;
      Fail(FailureSource::kTransport,
           std::string("Failed to initialize drone: no reply to '") + kHandshake[handshake_step_] +
               "' within " + std::to_string(config_.command_ack_timeout_ms) + "ms");
      return;
    case TimerKind::kPlayerAttach: {
      const SessionStatus current = status();
      if (!deps_.player || pipeline_session_ == pipeline::kInvalidSessionId ||
          (current != SessionStatus::kConnected && current != SessionStatus::kStreaming)) {
        return;
      }
      const std::string url = config_.StreamUrl();
      Logger::Info("[SessionOrchestrator] Attaching player to " + url);
      if (!deps_.player->Attach(url)) {
        Transition(SessionStatus::kConnected, "Video playback failed: player could not attach",
                   FailureSource::kPlayback);
        RetryPlayerAttach();
      }
      return;
    }
  }
}

// ---------------------------------------------------------------------------
// Connect attempt
// ---------------------------------------------------------------------------

void SessionOrchestrator::BeginAttempt() {
  pipeline_restarts_ = 0;
  player_retries_ = 0;
  handshake_step_ = 0;
  awaiting_ack_ = false;
  Transition(SessionStatus::kConnecting);

  if (!AwaitStoppingPipeline()) {
    Fail(FailureSource::kPipeline,
         "Previous video pipeline is still stopping; try again shortly");
    return;
  }

  preflight::PermissionResult permission = permission_gate_.Ensure();
  if (!permission.granted) {
    Fail(FailureSource::kPermission, permission.message);
    return;
  }

  preflight::PreflightResult network = preflight_.Check();
  if (!network.ok()) {
    Fail(FailureSource::kNetwork, network.message);
    return;
  }

  channel_ = deps_.channel_factory ? deps_.channel_factory() : nullptr;
  if (!channel_) {
    Fail(FailureSource::kTransport, "Failed to initialize drone: no command channel available");
    return;
  }

  const uint64_t generation = mailbox_->CurrentGeneration();
  std::shared_ptr<SessionMailbox> mailbox = mailbox_;
  channel_->SetReplyListener([mailbox, generation](const net::CommandReply& reply) {
    SessionEvent event = SessionEvent::Of(SessionEventType::kCommandReply, generation);
    event.reply = reply;
    mailbox->Post(std::move(event));
  });
  channel_->SetErrorListener([mailbox, generation](const std::string& message) {
    SessionEvent event = SessionEvent::Of(SessionEventType::kTransportError, generation);
    event.message = message;
    mailbox->Post(std::move(event));
  });

  net::ChannelResult opened = channel_->Open(static_cast<uint16_t>(config_.local_command_port));
  if (!opened.success) {
    Fail(FailureSource::kTransport, "Failed to initialize drone: " + opened.message);
    return;
  }
  PublishResources();

  SendHandshakeCommand();
}

void SessionOrchestrator::SendHandshakeCommand() {
  const std::string command = kHandshake[handshake_step_];
  net::ChannelResult sent = channel_->Send(command);
  if (!sent.success) {
    Fail(FailureSource::kTransport, "Failed to initialize drone: " + sent.message);
    return;
  }
  if (config_.require_command_ack) {
    awaiting_ack_ = true;
    Schedule(TimerKind::kAckTimeout, config_.command_ack_timeout_ms);
  } else {
    Schedule(TimerKind::kSettle, config_.settle_delay_ms);
  }
}

void SessionOrchestrator::OnCommandReply(const net::CommandReply& reply) {
  const SessionStatus current = status();
  if (current == SessionStatus::kConnecting && handshake_step_ < kHandshakeLength) {
    Logger::Info(std::string("[SessionOrchestrator] Reply to '") + kHandshake[handshake_step_] +
                 "': '" + reply.text + "'");
  } else {
    Logger::Info("[SessionOrchestrator] Reply: '" + reply.text + "'");
  }

  if (!awaiting_ack_ || current != SessionStatus::kConnecting) return;

  awaiting_ack_ = false;
  CancelTimers(TimerKind::kAckTimeout);
  if (reply.text != "ok") {
    Fail(FailureSource::kTransport, std::string("Failed to initialize drone: '") +
                                        kHandshake[handshake_step_] + "' answered '" +
                                        reply.text + "'");
    return;
  }
  Schedule(TimerKind::kSettle, config_.settle_delay_ms);
}

void SessionOrchestrator::OnHandshakeComplete() {
  Transition(SessionStatus::kConnected);
  StartPipeline();
}

bool SessionOrchestrator::StartPipeline() {
  if (!deps_.supervisor) {
    Fail(FailureSource::kPipeline, "Failed to start video stream: no transcode supervisor");
    return false;
  }

  const uint64_t generation = mailbox_->CurrentGeneration();
  std::shared_ptr<SessionMailbox> mailbox = mailbox_;
  pipeline::LaunchResult launch = deps_.supervisor->Start(
      config_.video_port, config_.stream_port,
      [mailbox, generation](const pipeline::TranscodeCompletion& completion) {
        SessionEvent event = SessionEvent::Of(SessionEventType::kPipelineTerminal, generation);
        event.completion = completion;
        mailbox->Post(std::move(event));
      });
  if (!launch.success) {
    Fail(FailureSource::kPipeline, "Failed to start video stream: " + launch.message);
    return false;
  }

  pipeline_session_ = launch.session_id;
  player_retries_ = 0;
  PublishResources();
  if (deps_.player) {
    Schedule(TimerKind::kPlayerAttach, config_.player_attach_delay_ms);
  }
  return true;
}

// ---------------------------------------------------------------------------
// Asynchronous signals
// ---------------------------------------------------------------------------

void SessionOrchestrator::OnPipelineTerminal(const pipeline::TranscodeCompletion& completion) {
  if (completion.session_id != pipeline_session_) {
    Logger::Debug("[SessionOrchestrator] Suppressing outcome of inactive pipeline session " +
                  std::to_string(completion.session_id));
    return;
  }
  pipeline_session_ = pipeline::kInvalidSessionId;
  PublishResources();

  if (completion.outcome == pipeline::TerminalOutcome::kFailed) {
    Logger::Error("[SessionOrchestrator] Pipeline session " +
                  std::to_string(completion.session_id) + " failed. Log:\n" + completion.log);

    if (config_.pipeline_failure_policy == core::PipelineFailurePolicy::kRestart &&
        pipeline_restarts_ < config_.max_pipeline_restarts) {
      ++pipeline_restarts_;
      DetachPlayer();
      Transition(SessionStatus::kConnected,
                 "Video pipeline failed; restarting (" + std::to_string(pipeline_restarts_) + "/" +
                     std::to_string(config_.max_pipeline_restarts) + ")",
                 FailureSource::kPipeline);
      StartPipeline();
      return;
    }
    Fail(FailureSource::kPipeline, "FFmpeg process failed. Check logs for details.");
    return;
  }

  // Success, or a cancellation this orchestrator did not request.
  DetachPlayer();
  Transition(SessionStatus::kConnected,
             completion.outcome == pipeline::TerminalOutcome::kSuccess ? "Video stream ended"
                                                                       : "Video stream stopped",
             FailureSource::kPipeline);
}

void SessionOrchestrator::OnPlaybackReady() {
  if (status() != SessionStatus::kConnected || pipeline_session_ == pipeline::kInvalidSessionId) {
    Logger::Debug(std::string("[SessionOrchestrator] Ignoring playback ready while ") +
                  SessionStatusName(status()));
    return;
  }
  player_retries_ = 0;
  Transition(SessionStatus::kStreaming);
}

void SessionOrchestrator::OnPlaybackError(const std::string& detail) {
  const SessionStatus current = status();
  if (current != SessionStatus::kConnected && current != SessionStatus::kStreaming) {
    Logger::Debug(std::string("[SessionOrchestrator] Ignoring playback error while ") +
                  SessionStatusName(current) + ": " + detail);
    return;
  }
  Transition(SessionStatus::kConnected, "Video playback failed: " + detail,
             FailureSource::kPlayback);
  RetryPlayerAttach();
}

void SessionOrchestrator::OnTransportError(const std::string& message) {
  const SessionStatus current = status();
  if (current == SessionStatus::kDisconnected || current == SessionStatus::kError) return;
  Fail(FailureSource::kTransport,
       current == SessionStatus::kConnecting ? "Failed to initialize drone: " + message
                                             : "Lost connection to drone: " + message);
}

// ---------------------------------------------------------------------------
// Timers, teardown, status
// ---------------------------------------------------------------------------

void SessionOrchestrator::RetryPlayerAttach() {
  if (!deps_.player || pipeline_session_ == pipeline::kInvalidSessionId) return;
  DetachPlayer();
  if (player_retries_ >= config_.max_player_retries) {
    Logger::Warn("[SessionOrchestrator] Player retry budget spent (" +
                 std::to_string(config_.max_player_retries) + "); playback stays detached");
    return;
  }
  ++player_retries_;
  Logger::Info("[SessionOrchestrator] Re-attaching player in " +
               std::to_string(config_.player_retry_delay_ms) + "ms (" +
               std::to_string(player_retries_) + "/" +
               std::to_string(config_.max_player_retries) + ")");
  Schedule(TimerKind::kPlayerAttach, config_.player_retry_delay_ms);
}

bool SessionOrchestrator::AwaitStoppingPipeline() {
  if (stopping_pipeline_ == pipeline::kInvalidSessionId) return true;
  const pipeline::TranscodeSessionId id = stopping_pipeline_;
  if (!deps_.supervisor->WaitForTermination(
          id, std::chrono::milliseconds(config_.pipeline_stop_timeout_ms))) {
    Logger::Warn("[SessionOrchestrator] Pipeline session " + std::to_string(id) +
                 " from the previous attempt is still running");
    return false;
  }
  stopping_pipeline_ = pipeline::kInvalidSessionId;
  return true;
}

void SessionOrchestrator::Schedule(TimerKind kind, int delay_ms) {
  timers_.emplace(Clock::now() + std::chrono::milliseconds(delay_ms), kind);
}

void SessionOrchestrator::CancelTimers(TimerKind kind) {
  for (auto it = timers_.begin(); it != timers_.end();) {
    it = it->second == kind ? timers_.erase(it) : std::next(it);
  }
}

void SessionOrchestrator::DetachPlayer() {
  CancelTimers(TimerKind::kPlayerAttach);
  if (deps_.player) deps_.player->Detach();
}

void SessionOrchestrator::Teardown() {
  timers_.clear();
  mailbox_->AdvanceGeneration();
  handshake_step_ = 0;
  awaiting_ack_ = false;

  if (deps_.player) deps_.player->Detach();

  if (pipeline_session_ != pipeline::kInvalidSessionId) {
    const pipeline::TranscodeSessionId id = pipeline_session_;
    pipeline_session_ = pipeline::kInvalidSessionId;
    deps_.supervisor->Cancel(id);
    if (!deps_.supervisor->WaitForTermination(
            id, std::chrono::milliseconds(config_.pipeline_stop_timeout_ms))) {
      Logger::Warn("[SessionOrchestrator] Pipeline session " + std::to_string(id) +
                   " still running after teardown");
      stopping_pipeline_ = id;
    }
  }

  if (channel_) {
    channel_->Close();
    channel_.reset();
  }
  PublishResources();
}

void SessionOrchestrator::Fail(FailureSource source, const std::string& message) {
  Teardown();
  Transition(SessionStatus::kError, message, source);
}

void SessionOrchestrator::PublishResources() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  snapshot_.channel_open = channel_ && channel_->IsOpen();
  if (pipeline_session_ != pipeline::kInvalidSessionId) {
    snapshot_.pipeline_session = pipeline_session_;
  } else {
    snapshot_.pipeline_session.reset();
  }
}

void SessionOrchestrator::Transition(SessionStatus to, const std::string& message,
                                     FailureSource source) {
  SessionStatus from;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    from = snapshot_.status;
    snapshot_.status = to;
    snapshot_.error_message = message;
    snapshot_.error_source = source;
  }
  state_cv_.notify_all();

  std::string line = std::string("[SessionOrchestrator] ") + SessionStatusName(from) + " -> " +
                     SessionStatusName(to);
  if (!message.empty()) {
    line += ": " + message;
    if (source != FailureSource::kNone) line += std::string(" (") + core::FailureSourceName(source) + ")";
  }
  if (to == SessionStatus::kError) {
    Logger::Error(line);
  } else {
    Logger::Info(line);
  }

  StatusListener listener;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener = listener_;
  }
  if (listener) listener(from, to, message);
}

}  // namespace tellolink::session
