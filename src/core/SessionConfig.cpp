// Repository: TelloLink
// Component: Session Configuration
// Purpose: Device addressing, ports, timing and failure policy for one drone session.
// Copyright (c) 2026 TelloLink

#include "tellolink/core/SessionConfig.h"

#include <arpa/inet.h>

namespace tellolink::core {

namespace {

bool IsValidPort(int port) {
  return port > 0 && port <= 65535;
}

}  // namespace

const char* PipelineFailurePolicyName(PipelineFailurePolicy policy) {
  switch (policy) {
    case PipelineFailurePolicy::kFatal:
      return "fatal";
    case PipelineFailurePolicy::kRestart:
      return "restart";
  }
  return "unknown";
}

std::optional<PipelineFailurePolicy> ParsePipelineFailurePolicy(const std::string& name) {
  if (name == "fatal") return PipelineFailurePolicy::kFatal;
  if (name == "restart") return PipelineFailurePolicy::kRestart;
  return std::nullopt;
}

std::string SessionConfig::StreamUrl() const {
  return "http://" + stream_host + ":" + std::to_string(stream_port);
}

std::optional<std::string> ValidateSessionConfig(const SessionConfig& config) {
  in_addr addr{};
  if (inet_pton(AF_INET, config.device_address.c_str(), &addr) != 1) {
    return "device_address must be an IPv4 address, got '" + config.device_address + "'";
  }
  if (!IsValidPort(config.command_port)) {
    return "command_port out of range: " + std::to_string(config.command_port);
  }
  if (config.local_command_port < 0 || config.local_command_port > 65535) {
    return "local_command_port out of range: " + std::to_string(config.local_command_port);
  }
  if (!IsValidPort(config.video_port)) {
    return "video_port out of range: " + std::to_string(config.video_port);
  }
  if (!IsValidPort(config.stream_port)) {
    return "stream_port out of range: " + std::to_string(config.stream_port);
  }
  if (config.video_port == config.stream_port) {
    return "video_port and stream_port must differ (" + std::to_string(config.video_port) + ")";
  }
  if (config.stream_host.empty()) {
    return "stream_host must not be empty";
  }
  if (config.settle_delay_ms < 0) {
    return "settle_delay_ms must not be negative";
  }
  if (config.command_ack_timeout_ms <= 0) {
    return "command_ack_timeout_ms must be positive";
  }
  if (config.player_attach_delay_ms < 0) {
    return "player_attach_delay_ms must not be negative";
  }
  if (config.player_retry_delay_ms < 0) {
    return "player_retry_delay_ms must not be negative";
  }
  if (config.max_player_retries < 0) {
    return "max_player_retries must not be negative";
  }
  if (config.probe_size <= 0) {
    return "probe_size must be positive";
  }
  if (config.analyze_duration_us <= 0) {
    return "analyze_duration_us must be positive";
  }
  if (config.max_pipeline_restarts < 0) {
    return "max_pipeline_restarts must not be negative";
  }
  if (config.pipeline_stop_timeout_ms <= 0) {
    return "pipeline_stop_timeout_ms must be positive";
  }
  return std::nullopt;
}

}  // namespace tellolink::core
