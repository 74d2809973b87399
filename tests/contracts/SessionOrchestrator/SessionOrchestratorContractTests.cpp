// Repository: TelloLink
// Component: Session Orchestrator Contract Tests
// Purpose: Status sequencing, teardown and resource exclusivity of the session state machine.
// Copyright (c) 2026 TelloLink

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "tellolink/pipeline/TranscodeSupervisor.hpp"
#include "tellolink/playback/PlaybackBridge.h"
#include "tellolink/session/SessionOrchestrator.h"
#include "tellolink/util/Logger.hpp"
#include "tests/fixtures/CommandChannelStub.h"
#include "tests/fixtures/NetworkStatusProviderStub.h"
#include "tests/fixtures/PermissionProviderStub.h"
#include "tests/fixtures/RemuxEngineStub.h"
#include "tests/fixtures/StreamPlayerStub.h"
#include "tests/support/WaitHelpers.hpp"

namespace tellolink::tests::contracts {

namespace {

using core::FailureSource;
using session::SessionStatus;
using support::WaitUntil;

constexpr std::chrono::milliseconds kTimeout{3000};

}  // namespace

class SessionOrchestratorContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.settle_delay_ms = 5;
    config_.player_attach_delay_ms = 5;
    config_.player_retry_delay_ms = 5;
    config_.command_ack_timeout_ms = 1000;
    config_.pipeline_stop_timeout_ms = 2000;

    network_ = std::make_shared<fixtures::NetworkStatusProviderStub>();
    permission_ = std::make_shared<fixtures::PermissionProviderStub>();
    engine_ = std::make_shared<fixtures::RemuxEngineStub>();
    supervisor_ = std::make_shared<pipeline::TranscodeSupervisor>(
        engine_, pipeline::TranscodeSupervisorConfig{});
    bridge_ = std::make_shared<playback::PlaybackBridge>(config_.StreamUrl());
    player_ = std::make_shared<fixtures::StreamPlayerStub>();
  }

  void TearDown() override {
    orchestrator_.reset();
    util::Logger::SetCaptureSink(nullptr);
  }

  session::SessionOrchestrator& Start() {
    session::SessionDependencies deps;
    deps.permission_provider = permission_;
    deps.network_provider = network_;
    deps.channel_factory = channels_.AsFactory();
    deps.supervisor = supervisor_;
    deps.bridge = bridge_;
    deps.player = player_;
    orchestrator_ = std::make_unique<session::SessionOrchestrator>(config_, deps);
    recorder_.Attach(*orchestrator_);
    return *orchestrator_;
  }

  bool PipelineActive() const {
    return orchestrator_->Snapshot().pipeline_session.has_value();
  }

  // Drives a fresh orchestrator to Streaming.
  void ConnectToStreaming() {
    session::SessionOrchestrator& orchestrator = Start();
    orchestrator.Connect();
    ASSERT_TRUE(WaitUntil([&] { return PipelineActive(); }));
    ASSERT_TRUE(engine_->WaitForRunning(1, kTimeout));
    bridge_->NotifyReady();
    ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kStreaming, kTimeout));
  }

  core::SessionConfig config_;
  std::shared_ptr<fixtures::NetworkStatusProviderStub> network_;
  std::shared_ptr<fixtures::PermissionProviderStub> permission_;
  std::shared_ptr<fixtures::RemuxEngineStub> engine_;
  std::shared_ptr<pipeline::TranscodeSupervisor> supervisor_;
  std::shared_ptr<playback::PlaybackBridge> bridge_;
  std::shared_ptr<fixtures::StreamPlayerStub> player_;
  fixtures::CommandChannelStubFactory channels_;
  support::TransitionRecorder recorder_;
  std::unique_ptr<session::SessionOrchestrator> orchestrator_;
};

// ---------------------------------------------------------------------------
// Happy path
// ---------------------------------------------------------------------------

TEST_F(SessionOrchestratorContractTest, HappyPathStatusSequenceIsExact) {
  ConnectToStreaming();

  const std::vector<SessionStatus> expected = {
      SessionStatus::kConnecting, SessionStatus::kConnected, SessionStatus::kStreaming};
  EXPECT_EQ(recorder_.Targets(), expected);
  EXPECT_EQ(recorder_.transitions().front().from, SessionStatus::kDisconnected);

  const std::vector<std::string> handshake = {"command", "streamon"};
  EXPECT_EQ(channels_.SentCommands(), handshake);

  const session::SessionSnapshot snapshot = orchestrator_->Snapshot();
  EXPECT_TRUE(snapshot.channel_open);
  EXPECT_TRUE(snapshot.pipeline_session.has_value());
  EXPECT_TRUE(snapshot.error_message.empty());
  EXPECT_EQ(channels_.open_now(), 1);
}

TEST_F(SessionOrchestratorContractTest, PipelineUsesConfiguredPortsAndLowLatencyTemplate) {
  config_.video_port = 11111;
  config_.stream_port = 11112;
  ConnectToStreaming();

  const std::vector<std::string> lines = engine_->command_lines();
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_NE(lines[0].find("-i udp://0.0.0.0:11111"), std::string::npos);
  EXPECT_NE(lines[0].find("-fflags +discardcorrupt+nobuffer"), std::string::npos);
  EXPECT_NE(lines[0].find("http://127.0.0.1:11112"), std::string::npos);
}

TEST_F(SessionOrchestratorContractTest, PlayerIsAttachedToStreamUrlAfterLaunch) {
  ConnectToStreaming();
  ASSERT_TRUE(WaitUntil([&] { return player_->AttachCount() == 1; }));
  EXPECT_EQ(player_->last_url(), "http://127.0.0.1:11112");
}

TEST_F(SessionOrchestratorContractTest, ConnectWhileConnectingIsIgnored) {
  config_.settle_delay_ms = 200;
  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  orchestrator.Connect();
  ASSERT_TRUE(WaitUntil([&] { return PipelineActive(); }));
  EXPECT_EQ(channels_.created(), 1);
  EXPECT_EQ(engine_->command_lines().size(), 1u);
}

// ---------------------------------------------------------------------------
// Preflight and permission
// ---------------------------------------------------------------------------

TEST_F(SessionOrchestratorContractTest, LinkDownEndsInNoNetworkConnectionError) {
  network_->SetLinkDown();
  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kError, kTimeout));

  const session::SessionSnapshot snapshot = orchestrator.Snapshot();
  EXPECT_EQ(snapshot.error_message, "No network connection");
  EXPECT_EQ(snapshot.error_source, FailureSource::kNetwork);
  EXPECT_EQ(channels_.created(), 0);
  EXPECT_FALSE(snapshot.channel_open);
}

TEST_F(SessionOrchestratorContractTest, WrongWirelessIdentityErrorNamesDetectedNetwork) {
  network_->SetWifi(std::string("HOME-WIFI"));
  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kError, kTimeout));

  const session::SessionSnapshot snapshot = orchestrator.Snapshot();
  EXPECT_NE(snapshot.error_message.find("HOME-WIFI"), std::string::npos);
  EXPECT_EQ(snapshot.error_source, FailureSource::kNetwork);
  EXPECT_EQ(channels_.created(), 0);
}

TEST_F(SessionOrchestratorContractTest, WiredLinkIsRejected) {
  network_->SetWired();
  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kError, kTimeout));
  EXPECT_EQ(orchestrator.Snapshot().error_message,
            "Please connect to the Tello drone's WiFi network");
}

TEST_F(SessionOrchestratorContractTest, UnreadableIdentityTrustsOperator) {
  network_->SetWifi(std::nullopt);
  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  ASSERT_TRUE(WaitUntil([&] { return PipelineActive(); }));
  EXPECT_EQ(orchestrator.status(), SessionStatus::kConnected);
}

TEST_F(SessionOrchestratorContractTest, PermissionDeniedStopsBeforePreflight) {
  permission_->SetState(preflight::PermissionState::kDenied);
  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kError, kTimeout));

  EXPECT_EQ(orchestrator.Snapshot().error_source, FailureSource::kPermission);
  EXPECT_EQ(network_->QueryCount(), 0);
  EXPECT_EQ(channels_.created(), 0);
}

TEST_F(SessionOrchestratorContractTest, PermissionIsRecheckedOnEveryAttempt) {
  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  ASSERT_TRUE(WaitUntil([&] { return PipelineActive(); }));
  orchestrator.Disconnect();
  ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kDisconnected, kTimeout));

  permission_->SetState(preflight::PermissionState::kDenied);
  orchestrator.Connect();
  ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kError, kTimeout));
  EXPECT_EQ(permission_->RequestCount(), 2);
}

// ---------------------------------------------------------------------------
// Command channel failures
// ---------------------------------------------------------------------------

TEST_F(SessionOrchestratorContractTest, BindFailureIsTransportErrorAndReleasesChannel) {
  fixtures::ChannelStubScript script;
  script.fail_open = true;
  channels_.SetScript(script);

  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kError, kTimeout));

  const session::SessionSnapshot snapshot = orchestrator.Snapshot();
  EXPECT_EQ(snapshot.error_source, FailureSource::kTransport);
  EXPECT_EQ(snapshot.error_message.rfind("Failed to initialize drone: bind port", 0), 0u)
      << snapshot.error_message;
  EXPECT_EQ(channels_.live(), 0);
}

TEST_F(SessionOrchestratorContractTest, SendFailureAbortsHandshake) {
  fixtures::ChannelStubScript script;
  script.fail_send_command = "streamon";
  channels_.SetScript(script);

  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kError, kTimeout));

  const std::vector<std::string> sent = {"command"};
  EXPECT_EQ(channels_.SentCommands(), sent);
  EXPECT_EQ(orchestrator.Snapshot().error_source, FailureSource::kTransport);
  EXPECT_EQ(channels_.live(), 0);
  EXPECT_EQ(engine_->runs(), 0);
}

TEST_F(SessionOrchestratorContractTest, AsyncTransportErrorWhileConnectedTearsDown) {
  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  ASSERT_TRUE(WaitUntil([&] { return PipelineActive(); }));

  ASSERT_TRUE(channels_.InjectError("recvfrom: Connection refused"));
  ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kError, kTimeout));

  const session::SessionSnapshot snapshot = orchestrator.Snapshot();
  EXPECT_EQ(snapshot.error_source, FailureSource::kTransport);
  EXPECT_NE(snapshot.error_message.find("Connection refused"), std::string::npos);
  EXPECT_FALSE(snapshot.pipeline_session.has_value());
  EXPECT_EQ(supervisor_->ActiveSessionCount(), 0u);
  EXPECT_EQ(channels_.live(), 0);
}

// ---------------------------------------------------------------------------
// Acknowledgment mode
// ---------------------------------------------------------------------------

TEST_F(SessionOrchestratorContractTest, AckModeAdvancesOnOkReplies) {
  config_.require_command_ack = true;
  fixtures::ChannelStubScript script;
  script.auto_reply = "ok";
  channels_.SetScript(script);

  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  ASSERT_TRUE(WaitUntil([&] { return PipelineActive(); }));
  EXPECT_EQ(channels_.SentCommands().size(), 2u);
}

TEST_F(SessionOrchestratorContractTest, AckModeFailsOnErrorReply) {
  config_.require_command_ack = true;
  fixtures::ChannelStubScript script;
  script.auto_reply = "error";
  channels_.SetScript(script);

  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kError, kTimeout));

  const session::SessionSnapshot snapshot = orchestrator.Snapshot();
  EXPECT_NE(snapshot.error_message.find("'command' answered 'error'"), std::string::npos)
      << snapshot.error_message;
  EXPECT_EQ(channels_.SentCommands().size(), 1u);
  EXPECT_EQ(channels_.live(), 0);
}

TEST_F(SessionOrchestratorContractTest, AckModeTimesOutWithoutReply) {
  config_.require_command_ack = true;
  config_.command_ack_timeout_ms = 50;

  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kError, kTimeout));

  const session::SessionSnapshot snapshot = orchestrator.Snapshot();
  EXPECT_NE(snapshot.error_message.find("no reply to 'command'"), std::string::npos)
      << snapshot.error_message;
  EXPECT_EQ(snapshot.error_source, FailureSource::kTransport);
}

TEST_F(SessionOrchestratorContractTest, AckModeAcceptsManuallyDeliveredReplies) {
  config_.require_command_ack = true;
  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();

  ASSERT_TRUE(WaitUntil([&] { return channels_.SentCommands().size() == 1; }));
  ASSERT_TRUE(channels_.InjectReply("ok"));
  ASSERT_TRUE(WaitUntil([&] { return channels_.SentCommands().size() == 2; }));
  EXPECT_EQ(orchestrator.status(), SessionStatus::kConnecting);
  ASSERT_TRUE(channels_.InjectReply("ok"));
  ASSERT_TRUE(WaitUntil([&] { return PipelineActive(); }));
}

// ---------------------------------------------------------------------------
// Pipeline outcomes
// ---------------------------------------------------------------------------

TEST_F(SessionOrchestratorContractTest, LaunchFailureIsPipelineErrorWithTeardown) {
  engine_->RejectLaunch("demuxer 'h264' is not available");
  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kError, kTimeout));

  const session::SessionSnapshot snapshot = orchestrator.Snapshot();
  EXPECT_EQ(snapshot.error_message,
            "Failed to start video stream: demuxer 'h264' is not available");
  EXPECT_EQ(snapshot.error_source, FailureSource::kPipeline);
  EXPECT_FALSE(snapshot.channel_open);
  EXPECT_EQ(channels_.live(), 0);

  const std::vector<SessionStatus> expected = {
      SessionStatus::kConnecting, SessionStatus::kConnected, SessionStatus::kError};
  EXPECT_EQ(recorder_.Targets(), expected);
}

TEST_F(SessionOrchestratorContractTest, PipelineFailureWhileStreamingIsErrorAndClosesChannel) {
  std::mutex log_mutex;
  std::vector<std::string> errors;
  util::Logger::SetCaptureSink([&](util::LogLevel level, const std::string& line) {
    if (level != util::LogLevel::kError) return;
    std::lock_guard<std::mutex> lock(log_mutex);
    errors.push_back(line);
  });

  ConnectToStreaming();
  engine_->Release(pipeline::RemuxOutcome::kFailed, "read packet failed: Connection reset");
  ASSERT_TRUE(orchestrator_->WaitForStatus(SessionStatus::kError, kTimeout));

  const session::SessionSnapshot snapshot = orchestrator_->Snapshot();
  EXPECT_EQ(snapshot.error_message, "FFmpeg process failed. Check logs for details.");
  EXPECT_EQ(snapshot.error_source, FailureSource::kPipeline);
  EXPECT_FALSE(snapshot.channel_open);
  EXPECT_FALSE(snapshot.pipeline_session.has_value());
  EXPECT_EQ(channels_.open_now(), 0);
  EXPECT_EQ(channels_.live(), 0);

  util::Logger::SetCaptureSink(nullptr);
  std::lock_guard<std::mutex> lock(log_mutex);
  bool pipeline_log_reported = false;
  for (const auto& line : errors) {
    if (line.find("Connection reset") != std::string::npos) pipeline_log_reported = true;
  }
  EXPECT_TRUE(pipeline_log_reported);
}

TEST_F(SessionOrchestratorContractTest, PipelineFailureBeforeReadyIsAlsoFatal) {
  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  ASSERT_TRUE(WaitUntil([&] { return PipelineActive(); }));
  ASSERT_TRUE(engine_->WaitForRunning(1, kTimeout));

  engine_->Release(pipeline::RemuxOutcome::kFailed, "open input failed");
  ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kError, kTimeout));
  EXPECT_EQ(channels_.live(), 0);
}

TEST_F(SessionOrchestratorContractTest, RestartPolicyRelaunchesWithinBudget) {
  config_.pipeline_failure_policy = core::PipelineFailurePolicy::kRestart;
  config_.max_pipeline_restarts = 1;
  ConnectToStreaming();

  engine_->Release(pipeline::RemuxOutcome::kFailed, "first failure");
  ASSERT_TRUE(engine_->WaitForRunning(2, kTimeout));
  ASSERT_TRUE(orchestrator_->WaitForStatus(SessionStatus::kConnected, kTimeout));

  session::SessionSnapshot snapshot = orchestrator_->Snapshot();
  EXPECT_NE(snapshot.error_message.find("restarting (1/1)"), std::string::npos)
      << snapshot.error_message;
  EXPECT_TRUE(snapshot.channel_open);
  ASSERT_TRUE(WaitUntil([&] { return PipelineActive(); }));

  bridge_->NotifyReady();
  ASSERT_TRUE(orchestrator_->WaitForStatus(SessionStatus::kStreaming, kTimeout));

  engine_->Release(pipeline::RemuxOutcome::kFailed, "second failure");
  ASSERT_TRUE(orchestrator_->WaitForStatus(SessionStatus::kError, kTimeout));
  snapshot = orchestrator_->Snapshot();
  EXPECT_EQ(snapshot.error_message, "FFmpeg process failed. Check logs for details.");
  EXPECT_EQ(engine_->runs(), 2);
}

TEST_F(SessionOrchestratorContractTest, PipelineSuccessDemotesToConnectedAndKeepsChannel) {
  ConnectToStreaming();
  const int detaches_before = player_->DetachCount();

  engine_->Release(pipeline::RemuxOutcome::kSuccess);
  ASSERT_TRUE(orchestrator_->WaitForStatus(SessionStatus::kConnected, kTimeout));

  const session::SessionSnapshot snapshot = orchestrator_->Snapshot();
  EXPECT_EQ(snapshot.error_message, "Video stream ended");
  EXPECT_TRUE(snapshot.channel_open);
  EXPECT_FALSE(snapshot.pipeline_session.has_value());
  EXPECT_GT(player_->DetachCount(), detaches_before);

  // Without a pipeline a late ready signal cannot promote to Streaming.
  bridge_->NotifyReady();
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_EQ(orchestrator_->status(), SessionStatus::kConnected);
}

// ---------------------------------------------------------------------------
// Playback signals
// ---------------------------------------------------------------------------

TEST_F(SessionOrchestratorContractTest, PlaybackErrorWhileStreamingDemotesToConnected) {
  ConnectToStreaming();
  bridge_->NotifyPlaybackError("decoder error");
  ASSERT_TRUE(orchestrator_->WaitForStatus(SessionStatus::kConnected, kTimeout));

  const session::SessionSnapshot snapshot = orchestrator_->Snapshot();
  EXPECT_EQ(snapshot.error_message, "Video playback failed: decoder error");
  EXPECT_EQ(snapshot.error_source, FailureSource::kPlayback);
  EXPECT_TRUE(snapshot.channel_open);
  EXPECT_TRUE(snapshot.pipeline_session.has_value());
  EXPECT_TRUE(engine_->running());
  EXPECT_EQ(channels_.open_now(), 1);

  // Playback may recover on the same pipeline.
  bridge_->NotifyReady();
  ASSERT_TRUE(orchestrator_->WaitForStatus(SessionStatus::kStreaming, kTimeout));
}

TEST_F(SessionOrchestratorContractTest, PlaybackErrorWhileConnectedKeepsSessionAndReattaches) {
  config_.max_player_retries = 2;
  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  ASSERT_TRUE(WaitUntil([&] { return PipelineActive(); }));
  ASSERT_TRUE(WaitUntil([&] { return player_->AttachCount() == 1; }));
  ASSERT_EQ(orchestrator.status(), SessionStatus::kConnected);

  bridge_->NotifyPlaybackError("no frames decoded");
  ASSERT_TRUE(WaitUntil([&] { return player_->AttachCount() == 2; }));

  const session::SessionSnapshot snapshot = orchestrator.Snapshot();
  EXPECT_EQ(snapshot.status, SessionStatus::kConnected);
  EXPECT_EQ(snapshot.error_message, "Video playback failed: no frames decoded");
  EXPECT_EQ(snapshot.error_source, FailureSource::kPlayback);
  EXPECT_TRUE(snapshot.channel_open);
  EXPECT_TRUE(snapshot.pipeline_session.has_value());
  EXPECT_TRUE(engine_->running());
  const support::RecordedTransition last = recorder_.transitions().back();
  EXPECT_EQ(last.from, SessionStatus::kConnected);
  EXPECT_EQ(last.to, SessionStatus::kConnected);
  EXPECT_EQ(last.message, "Video playback failed: no frames decoded");

  bridge_->NotifyPlaybackError("no frames decoded");
  ASSERT_TRUE(WaitUntil([&] { return player_->AttachCount() == 3; }));

  // Both re-attaches are spent: the player stays detached, the session stays up.
  bridge_->NotifyPlaybackError("no frames decoded");
  ASSERT_TRUE(WaitUntil([&] { return !player_->attached(); }));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(player_->AttachCount(), 3);
  EXPECT_EQ(orchestrator.status(), SessionStatus::kConnected);
  EXPECT_TRUE(PipelineActive());
  EXPECT_EQ(channels_.open_now(), 1);

  bridge_->NotifyReady();
  ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kStreaming, kTimeout));
}

TEST_F(SessionOrchestratorContractTest, ReadyRefillsPlayerRetryBudget) {
  config_.max_player_retries = 1;
  ConnectToStreaming();
  ASSERT_TRUE(WaitUntil([&] { return player_->AttachCount() == 1; }));

  bridge_->NotifyPlaybackError("decoder error");
  ASSERT_TRUE(WaitUntil([&] { return player_->AttachCount() == 2; }));
  bridge_->NotifyReady();
  ASSERT_TRUE(orchestrator_->WaitForStatus(SessionStatus::kStreaming, kTimeout));

  bridge_->NotifyPlaybackError("decoder error");
  ASSERT_TRUE(WaitUntil([&] { return player_->AttachCount() == 3; }));
  EXPECT_EQ(orchestrator_->status(), SessionStatus::kConnected);
}

TEST_F(SessionOrchestratorContractTest, FailedAttachIsRetriedWithinBudget) {
  config_.max_player_retries = 2;
  player_->SetAttachResult(false);
  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  ASSERT_TRUE(WaitUntil([&] { return player_->AttachCount() == 3; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  EXPECT_EQ(player_->AttachCount(), 3);
  const session::SessionSnapshot snapshot = orchestrator.Snapshot();
  EXPECT_EQ(snapshot.status, SessionStatus::kConnected);
  EXPECT_EQ(snapshot.error_message, "Video playback failed: player could not attach");
  EXPECT_EQ(snapshot.error_source, FailureSource::kPlayback);
  EXPECT_TRUE(snapshot.channel_open);
  EXPECT_TRUE(snapshot.pipeline_session.has_value());
}

TEST_F(SessionOrchestratorContractTest, ReadyWhileDisconnectedIsIgnored) {
  session::SessionOrchestrator& orchestrator = Start();
  bridge_->NotifyReady();
  bridge_->NotifyPlaybackError("late error");
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_EQ(orchestrator.status(), SessionStatus::kDisconnected);
  EXPECT_TRUE(recorder_.transitions().empty());
}

TEST_F(SessionOrchestratorContractTest, ReadyWhileConnectingIsIgnored) {
  config_.require_command_ack = true;
  config_.command_ack_timeout_ms = 2000;
  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  ASSERT_TRUE(WaitUntil([&] { return channels_.SentCommands().size() == 1; }));

  bridge_->NotifyReady();
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_EQ(orchestrator.status(), SessionStatus::kConnecting);

  orchestrator.Disconnect();
  ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kDisconnected, kTimeout));
}

// ---------------------------------------------------------------------------
// Teardown and resource exclusivity
// ---------------------------------------------------------------------------

TEST_F(SessionOrchestratorContractTest, DisconnectDuringSettleDelayCancelsHandshake) {
  config_.settle_delay_ms = 10000;
  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  ASSERT_TRUE(WaitUntil([&] { return channels_.SentCommands().size() == 1; }));

  orchestrator.Disconnect();
  ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kDisconnected, std::chrono::milliseconds(1000)));
  std::this_thread::sleep_for(std::chrono::milliseconds(30));

  const std::vector<std::string> sent = {"command"};
  EXPECT_EQ(channels_.SentCommands(), sent);
  EXPECT_EQ(channels_.live(), 0);
  EXPECT_EQ(engine_->runs(), 0);
}

TEST_F(SessionOrchestratorContractTest, DisconnectWhileStreamingReleasesEverything) {
  ConnectToStreaming();
  orchestrator_->Disconnect();
  ASSERT_TRUE(orchestrator_->WaitForStatus(SessionStatus::kDisconnected, kTimeout));

  const session::SessionSnapshot snapshot = orchestrator_->Snapshot();
  EXPECT_TRUE(snapshot.error_message.empty());
  EXPECT_EQ(snapshot.error_source, FailureSource::kNone);
  EXPECT_FALSE(snapshot.channel_open);
  EXPECT_FALSE(snapshot.pipeline_session.has_value());
  EXPECT_EQ(engine_->cancels_observed(), 1);
  EXPECT_EQ(supervisor_->ActiveSessionCount(), 0u);
  EXPECT_EQ(channels_.live(), 0);
  EXPECT_FALSE(player_->attached());

  // The cancelled session's completion must not disturb the new state.
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_EQ(orchestrator_->status(), SessionStatus::kDisconnected);
}

TEST_F(SessionOrchestratorContractTest, LateCompletionAfterStopTimeoutIsDropped) {
  config_.pipeline_stop_timeout_ms = 50;
  engine_->IgnoreCancel(true);
  ConnectToStreaming();

  orchestrator_->Disconnect();
  ASSERT_TRUE(orchestrator_->WaitForStatus(SessionStatus::kDisconnected, kTimeout));
  EXPECT_EQ(supervisor_->ActiveSessionCount(), 1u);
  EXPECT_FALSE(PipelineActive());
  EXPECT_EQ(channels_.live(), 0);
  const size_t recorded = recorder_.transitions().size();

  // The stuck session finally ends, long after teardown gave up on it.
  engine_->Release(pipeline::RemuxOutcome::kFailed, "av_interleaved_write_frame: Broken pipe");
  ASSERT_TRUE(WaitUntil([&] { return supervisor_->ActiveSessionCount() == 0; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(30));

  EXPECT_EQ(orchestrator_->status(), SessionStatus::kDisconnected);
  EXPECT_TRUE(orchestrator_->Snapshot().error_message.empty());
  EXPECT_EQ(recorder_.transitions().size(), recorded);
}

TEST_F(SessionOrchestratorContractTest, ConnectWhilePreviousPipelineIsStoppingFails) {
  config_.pipeline_stop_timeout_ms = 50;
  engine_->IgnoreCancel(true);
  ConnectToStreaming();
  orchestrator_->Disconnect();
  ASSERT_TRUE(orchestrator_->WaitForStatus(SessionStatus::kDisconnected, kTimeout));
  ASSERT_EQ(supervisor_->ActiveSessionCount(), 1u);

  orchestrator_->Connect();
  ASSERT_TRUE(orchestrator_->WaitForStatus(SessionStatus::kError, kTimeout));
  const session::SessionSnapshot snapshot = orchestrator_->Snapshot();
  EXPECT_EQ(snapshot.error_source, FailureSource::kPipeline);
  EXPECT_NE(snapshot.error_message.find("still stopping"), std::string::npos)
      << snapshot.error_message;
  EXPECT_EQ(channels_.created(), 1);
  EXPECT_EQ(channels_.live(), 0);
  EXPECT_EQ(engine_->runs(), 1);
  const size_t recorded = recorder_.transitions().size();

  // Once the old session stops, its completion is dropped and a retry works.
  engine_->IgnoreCancel(false);
  ASSERT_TRUE(WaitUntil([&] { return supervisor_->ActiveSessionCount() == 0; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_EQ(recorder_.transitions().size(), recorded);
  EXPECT_EQ(orchestrator_->status(), SessionStatus::kError);

  orchestrator_->Connect();
  ASSERT_TRUE(WaitUntil([&] { return PipelineActive(); }));
  ASSERT_TRUE(engine_->WaitForRunning(2, kTimeout));
  EXPECT_EQ(channels_.created(), 2);
  EXPECT_EQ(channels_.max_open(), 1);
  EXPECT_TRUE(orchestrator_->Snapshot().error_message.empty());
}

TEST_F(SessionOrchestratorContractTest, DisconnectClearsPreviousError) {
  network_->SetLinkDown();
  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kError, kTimeout));

  orchestrator.Disconnect();
  ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kDisconnected, kTimeout));
  EXPECT_TRUE(orchestrator.Snapshot().error_message.empty());
}

TEST_F(SessionOrchestratorContractTest, RetryFromErrorStartsFromScratch) {
  fixtures::ChannelStubScript failing;
  failing.fail_open = true;
  channels_.SetScript(failing);

  session::SessionOrchestrator& orchestrator = Start();
  orchestrator.Connect();
  ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kError, kTimeout));

  channels_.SetScript(fixtures::ChannelStubScript{});
  orchestrator.Connect();
  ASSERT_TRUE(WaitUntil([&] { return PipelineActive(); }));

  const std::vector<SessionStatus> expected = {SessionStatus::kConnecting, SessionStatus::kError,
                                               SessionStatus::kConnecting,
                                               SessionStatus::kConnected};
  EXPECT_EQ(recorder_.Targets(), expected);
  EXPECT_EQ(channels_.created(), 2);
  EXPECT_EQ(channels_.live(), 1);
  EXPECT_TRUE(orchestrator.Snapshot().error_message.empty());
}

TEST_F(SessionOrchestratorContractTest, AtMostOneChannelOpenAcrossConnectCycles) {
  session::SessionOrchestrator& orchestrator = Start();
  for (int i = 0; i < 5; ++i) {
    orchestrator.Connect();
    ASSERT_TRUE(WaitUntil([&] { return PipelineActive(); })) << "cycle " << i;
    orchestrator.Disconnect();
    ASSERT_TRUE(orchestrator.WaitForStatus(SessionStatus::kDisconnected, kTimeout)) << "cycle " << i;
    EXPECT_EQ(channels_.open_now(), 0) << "cycle " << i;
  }
  EXPECT_EQ(channels_.created(), 5);
  EXPECT_EQ(channels_.max_open(), 1);
  EXPECT_EQ(channels_.live(), 0);
  EXPECT_EQ(supervisor_->ActiveSessionCount(), 0u);
}

TEST_F(SessionOrchestratorContractTest, RapidConnectDisconnectNeverOverlapsChannels) {
  session::SessionOrchestrator& orchestrator = Start();
  for (int i = 0; i < 20; ++i) {
    orchestrator.Connect();
    orchestrator.Disconnect();
  }
  ASSERT_TRUE(WaitUntil([&] {
    return orchestrator.status() == SessionStatus::kDisconnected && channels_.live() == 0 &&
           supervisor_->ActiveSessionCount() == 0;
  }));
  EXPECT_LE(channels_.max_open(), 1);
}

TEST_F(SessionOrchestratorContractTest, DestroyingWhileStreamingCancelsPipeline) {
  ConnectToStreaming();
  orchestrator_.reset();

  EXPECT_EQ(engine_->cancels_observed(), 1);
  EXPECT_EQ(supervisor_->ActiveSessionCount(), 0u);
  EXPECT_EQ(channels_.live(), 0);
  EXPECT_EQ(recorder_.Targets().back(), SessionStatus::kDisconnected);
}

}  // namespace tellolink::tests::contracts
