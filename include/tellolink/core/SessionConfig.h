// Repository: TelloLink
// Component: Session Configuration
// Purpose: Device addressing, ports, timing and failure policy for one drone session.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_CORE_SESSION_CONFIG_H_
#define TELLOLINK_CORE_SESSION_CONFIG_H_

#include <cstdint>
#include <optional>
#include <string>

namespace tellolink::core {

// What the orchestrator does when the transcode pipeline reports Failed while
// the session is Connected or Streaming.
enum class PipelineFailurePolicy {
  kFatal,    // Error + full teardown (default)
  kRestart,  // start a fresh pipeline session, bounded by max_pipeline_restarts
};

const char* PipelineFailurePolicyName(PipelineFailurePolicy policy);
std::optional<PipelineFailurePolicy> ParsePipelineFailurePolicy(const std::string& name);

// Configuration for SessionOrchestrator and its components.
// POD struct - copied into the orchestrator at construction.
struct SessionConfig {
  std::string device_address = "192.168.10.1";  // Drone IPv4 address
  int command_port = 8889;                      // Drone command port
  int local_command_port = 0;                   // Local bind port, 0 = ephemeral
  int video_port = 11111;                       // Drone pushes raw H.264 here
  std::string stream_host = "127.0.0.1";        // Re-muxed HTTP stream host
  int stream_port = 11112;                      // Re-muxed HTTP stream port

  // Expected wireless identity prefix. Empty accepts any wireless network.
  std::string network_prefix = "TELLO-";

  int settle_delay_ms = 500;  // After each handshake command

  // Acknowledgment extension: wait for "ok" after each command.
  bool require_command_ack = false;
  int command_ack_timeout_ms = 1000;

  // Grace period between pipeline launch and player attach.
  int player_attach_delay_ms = 2000;

  // Re-attach after a playback error while the pipeline is alive. The budget
  // is refilled whenever the player reports ready.
  int player_retry_delay_ms = 1000;
  int max_player_retries = 5;

  // Input probing for the raw elementary stream.
  int64_t probe_size = 2000000;
  int64_t analyze_duration_us = 2000000;

  PipelineFailurePolicy pipeline_failure_policy = PipelineFailurePolicy::kFatal;
  int max_pipeline_restarts = 3;       // Only consulted with kRestart
  int pipeline_stop_timeout_ms = 3000; // Teardown wait for a cancelled pipeline

  // http://<stream_host>:<stream_port>
  std::string StreamUrl() const;
};

// Returns an error naming the offending key, or nullopt if the config is usable.
std::optional<std::string> ValidateSessionConfig(const SessionConfig& config);

}  // namespace tellolink::core

#endif  // TELLOLINK_CORE_SESSION_CONFIG_H_
