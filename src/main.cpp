// Repository: TelloLink
// Component: Operator CLI
// Purpose: Connects to the drone, streams video until interrupted or the session fails.
// Copyright (c) 2026 TelloLink
//
// Usage:
//   tellolink [--config PATH] [--device-address IP] [--record out.ts] ...
//
// Exit status: 0 after SIGINT/SIGTERM and a clean disconnect, 1 when the
// session lands in Error or the configuration is invalid.

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "tellolink/core/SessionConfig.h"
#include "tellolink/core/SessionConfigLoader.h"
#include "tellolink/net/UdpCommandChannel.h"
#include "tellolink/pipeline/FFmpegRemuxEngine.hpp"
#include "tellolink/pipeline/TranscodeSupervisor.hpp"
#include "tellolink/playback/FFmpegStreamProbe.h"
#include "tellolink/playback/PlaybackBridge.h"
#include "tellolink/preflight/LinuxNetworkStatusProvider.h"
#include "tellolink/preflight/PermissionGate.h"
#include "tellolink/session/SessionOrchestrator.h"
#include "tellolink/util/Logger.hpp"

namespace {

using tellolink::util::Logger;

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  std::string config_path;
  // Flag overrides as config key/value pairs, applied after file and env.
  std::vector<std::pair<std::string, std::string>> overrides;
  bool player = true;
  std::optional<std::string> record_path;
  bool verbose = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Connects to a Tello drone, enables its video stream and serves it as\n"
            << "MPEG-TS over HTTP.\n"
            << "\n"
            << "Options:\n"
            << "  --config PATH             key = value config file\n"
            << "  --device-address IP       Drone address (default 192.168.10.1)\n"
            << "  --command-port N          Drone command port (default 8889)\n"
            << "  --local-command-port N    Local bind port, 0 = ephemeral (default 0)\n"
            << "  --video-port N            UDP port the drone streams to (default 11111)\n"
            << "  --stream-port N           HTTP port of the re-muxed stream (default 11112)\n"
            << "  --network-prefix P        Expected WiFi name prefix, '' accepts any (default TELLO-)\n"
            << "  --require-ack             Wait for 'ok' after each handshake command\n"
            << "  --ack-timeout-ms N        Acknowledgment timeout (default 1000)\n"
            << "  --pipeline-policy P       fatal | restart (default fatal)\n"
            << "  --max-restarts N          Pipeline restart budget (default 3)\n"
            << "  --player-retries N        Player re-attach budget after playback errors (default 5)\n"
            << "  --no-player               Do not attach the stream probe; Streaming is never reached\n"
            << "  --record PATH             Record the stream to an MPEG-TS file\n"
            << "  --verbose                 Debug logging\n"
            << "  --help                    Show this help message\n"
            << "\n"
            << "Every config key can also be set as TELLOLINK_<KEY> in the environment.\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  const std::vector<std::pair<std::string, std::string>> value_flags = {
      {"--device-address", "device_address"},
      {"--command-port", "command_port"},
      {"--local-command-port", "local_command_port"},
      {"--video-port", "video_port"},
      {"--stream-port", "stream_port"},
      {"--network-prefix", "network_prefix"},
      {"--ack-timeout-ms", "command_ack_timeout_ms"},
      {"--pipeline-policy", "pipeline_failure_policy"},
      {"--max-restarts", "max_pipeline_restarts"},
      {"--player-retries", "max_player_retries"},
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      return args;
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--require-ack") {
      args.overrides.emplace_back("require_command_ack", "true");
    } else if (arg == "--no-player") {
      args.player = false;
    } else if (arg == "--record" && i + 1 < argc) {
      args.record_path = argv[++i];
    } else if (arg == "--verbose" || arg == "-v") {
      args.verbose = true;
    } else {
      bool matched = false;
      for (const auto& [flag, key] : value_flags) {
        if (arg == flag && i + 1 < argc) {
          args.overrides.emplace_back(key, argv[++i]);
          matched = true;
          break;
        }
      }
      if (!matched) {
        args.error = "Unknown or incomplete option: " + arg;
        return args;
      }
    }
  }

  if (!args.player && args.record_path) {
    args.error = "--record needs the stream probe; drop --no-player";
    return args;
  }
  args.valid = true;
  return args;
}

// defaults -> file -> environment -> flags, then validation.
bool BuildConfig(const CliArgs& args, tellolink::core::SessionConfig* config, std::string* error) {
  using namespace tellolink::core;

  if (!args.config_path.empty()) {
    ConfigLoadResult loaded = LoadSessionConfigFile(args.config_path, config);
    if (!loaded.success) {
      *error = loaded.message;
      return false;
    }
  }
  ConfigLoadResult env = ApplyEnvironmentOverrides(config);
  if (!env.success) {
    *error = env.message;
    return false;
  }
  for (const auto& [key, value] : args.overrides) {
    ConfigLoadResult applied = ApplyConfigValue(key, value, config);
    if (!applied.success) {
      *error = applied.message;
      return false;
    }
  }
  if (std::optional<std::string> invalid = ValidateSessionConfig(*config)) {
    *error = *invalid;
    return false;
  }
  return true;
}

int Run(const CliArgs& args, const tellolink::core::SessionConfig& config) {
  using namespace tellolink;

  auto bridge = std::make_shared<playback::PlaybackBridge>(config.StreamUrl());

  session::SessionDependencies deps;
  deps.permission_provider = std::make_shared<preflight::PlatformPermissionProvider>();
  deps.network_provider = std::make_shared<preflight::LinuxNetworkStatusProvider>();
  const std::string device_address = config.device_address;
  const uint16_t command_port = static_cast<uint16_t>(config.command_port);
  deps.channel_factory = [device_address, command_port]() -> std::unique_ptr<net::ICommandChannel> {
    return std::make_unique<net::UdpCommandChannel>(device_address, command_port);
  };

  pipeline::TranscodeSupervisorConfig supervisor_config;
  supervisor_config.output_host = config.stream_host;
  supervisor_config.probe_size = config.probe_size;
  supervisor_config.analyze_duration_us = config.analyze_duration_us;
  deps.supervisor = std::make_shared<pipeline::TranscodeSupervisor>(
      std::make_shared<pipeline::FFmpegRemuxEngine>(), supervisor_config);
  deps.bridge = bridge;
  if (args.player) {
    deps.player = std::make_shared<playback::FFmpegStreamProbe>(*bridge, args.record_path);
  }

  session::SessionOrchestrator orchestrator(config, deps);
  orchestrator.SetStatusListener(
      [](session::SessionStatus from, session::SessionStatus to, const std::string& message) {
        std::cout << "STATUS " << session::SessionStatusName(from) << " -> "
                  << session::SessionStatusName(to);
        if (!message.empty()) std::cout << " (" << message << ")";
        std::cout << std::endl;
      });

  Logger::Info("[tellolink] Connecting to " + config.device_address + ":" +
               std::to_string(config.command_port) + ", stream at " + config.StreamUrl());
  orchestrator.Connect();

  int exit_code = 0;
  while (true) {
    if (g_termination_requested.load(std::memory_order_acquire)) {
      Logger::Info("[tellolink] Termination requested, disconnecting");
      orchestrator.Disconnect();
      if (!orchestrator.WaitForStatus(session::SessionStatus::kDisconnected,
                                      std::chrono::milliseconds(
                                          config.pipeline_stop_timeout_ms + 2000))) {
        Logger::Warn("[tellolink] Disconnect did not complete in time");
      }
      break;
    }
    const session::SessionSnapshot snapshot = orchestrator.Snapshot();
    if (snapshot.status == session::SessionStatus::kError) {
      std::cerr << "Error: " << snapshot.error_message << std::endl;
      exit_code = 1;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  return exit_code;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  if (args.verbose) {
    Logger::SetDebugEnabled(true);
  }

  tellolink::core::SessionConfig config;
  std::string error;
  if (!BuildConfig(args, &config, &error)) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  return Run(args, config);
}
