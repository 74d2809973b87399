// Repository: TelloLink
// Component: Transcode Pipeline Supervisor
// Purpose: Launches remux sessions on worker threads and reports one terminal outcome each.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_PIPELINE_TRANSCODE_SUPERVISOR_HPP_
#define TELLOLINK_PIPELINE_TRANSCODE_SUPERVISOR_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "tellolink/pipeline/IRemuxEngine.hpp"

namespace tellolink::pipeline {

using TranscodeSessionId = uint64_t;
constexpr TranscodeSessionId kInvalidSessionId = 0;

enum class TerminalOutcome {
  kSuccess,
  kCancelled,
  kFailed,
};

const char* TerminalOutcomeName(TerminalOutcome outcome);

struct TranscodeCompletion {
  TranscodeSessionId session_id = kInvalidSessionId;
  TerminalOutcome outcome = TerminalOutcome::kFailed;
  std::string log;  // populated for kFailed
};

using CompletionCallback = std::function<void(const TranscodeCompletion& completion)>;

struct LaunchResult {
  bool success;
  TranscodeSessionId session_id;
  std::string message;

  LaunchResult(bool s, TranscodeSessionId id, const std::string& msg)
      : success(s), session_id(id), message(msg) {}
};

struct TranscodeSupervisorConfig {
  std::string output_host = "127.0.0.1";
  int64_t probe_size = 2000000;
  int64_t analyze_duration_us = 2000000;
};

// TranscodeSupervisor owns every remux worker it starts.
//
// Delivery contract:
//   - Start() returns once the engine accepted the arguments and the worker
//     thread exists; the session runs concurrently from then on.
//   - The completion callback fires exactly once per successful Start(), on
//     the worker thread, after the session is marked terminal. It also fires
//     for sessions cancelled by Cancel() or by destruction.
//   - A failed Start() never invokes the callback.
//   - At most one session is non-terminal at a time.
class TranscodeSupervisor {
 public:
  TranscodeSupervisor(std::shared_ptr<IRemuxEngine> engine, TranscodeSupervisorConfig config);
  ~TranscodeSupervisor();

  TranscodeSupervisor(const TranscodeSupervisor&) = delete;
  TranscodeSupervisor& operator=(const TranscodeSupervisor&) = delete;

  LaunchResult Start(int input_port, int output_port, CompletionCallback on_complete);

  // Best effort. No-op for unknown or already terminal sessions.
  void Cancel(TranscodeSessionId id);

  // Blocks until the session's callback has returned (or the session is
  // unknown). Returns false on timeout.
  bool WaitForTermination(TranscodeSessionId id, std::chrono::milliseconds timeout);

  bool IsActive(TranscodeSessionId id) const;
  size_t ActiveSessionCount() const;

 private:
  struct Session {
    TranscodeSessionId id = kInvalidSessionId;
    std::atomic<bool> cancel{false};
    bool terminal = false;
    bool finished = false;  // callback returned
    std::thread worker;
  };

  void RunSession(Session* session, RemuxArguments args, CompletionCallback on_complete);
  void ReapFinished();

  std::shared_ptr<IRemuxEngine> engine_;
  TranscodeSupervisorConfig config_;

  mutable std::mutex mutex_;
  std::condition_variable state_cv_;
  std::map<TranscodeSessionId, std::unique_ptr<Session>> sessions_;
  TranscodeSessionId next_id_ = 1;
};

}  // namespace tellolink::pipeline

#endif  // TELLOLINK_PIPELINE_TRANSCODE_SUPERVISOR_HPP_
