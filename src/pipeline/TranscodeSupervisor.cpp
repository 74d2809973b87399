// Repository: TelloLink
// Component: Transcode Pipeline Supervisor
// Purpose: Launches remux sessions on worker threads and reports one terminal outcome each.
// Copyright (c) 2026 TelloLink

#include "tellolink/pipeline/TranscodeSupervisor.hpp"

#include <system_error>
#include <vector>

#include "tellolink/util/Logger.hpp"

namespace tellolink::pipeline {

using util::Logger;

const char* TerminalOutcomeName(TerminalOutcome outcome) {
  switch (outcome) {
    case TerminalOutcome::kSuccess:
      return "success";
    case TerminalOutcome::kCancelled:
      return "cancelled";
    case TerminalOutcome::kFailed:
      return "failed";
  }
  return "unknown";
}

TranscodeSupervisor::TranscodeSupervisor(std::shared_ptr<IRemuxEngine> engine,
                                         TranscodeSupervisorConfig config)
    : engine_(std::move(engine)), config_(std::move(config)) {}

TranscodeSupervisor::~TranscodeSupervisor() {
  std::vector<std::unique_ptr<Session>> remaining;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, session] : sessions_) {
      if (!session->terminal) {
        Logger::Info("[TranscodeSupervisor] Cancelling session " + std::to_string(id) +
                     " on shutdown");
      }
      session->cancel.store(true, std::memory_order_release);
    }
    for (auto& [id, session] : sessions_) {
      remaining.push_back(std::move(session));
    }
    sessions_.clear();
  }
  // Workers never touch sessions_ after finishing, only their own Session.
  for (auto& session : remaining) {
    if (session->worker.joinable()) session->worker.join();
  }
}

LaunchResult TranscodeSupervisor::Start(int input_port, int output_port,
                                        CompletionCallback on_complete) {
  ReapFinished();

  if (!engine_) {
    return LaunchResult(false, kInvalidSessionId, "no remux engine configured");
  }

  RemuxArguments args = BuildLowLatencyRemuxArguments(
      input_port, config_.output_host, output_port, config_.probe_size,
      config_.analyze_duration_us);

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, session] : sessions_) {
    if (!session->terminal) {
      return LaunchResult(false, kInvalidSessionId,
                          "transcode session " + std::to_string(id) + " is still active");
    }
  }

  std::string error;
  if (!engine_->Prepare(args, &error)) {
    Logger::Error("[TranscodeSupervisor] Launch rejected: " + error);
    return LaunchResult(false, kInvalidSessionId, error);
  }

  auto session = std::make_unique<Session>();
  session->id = next_id_++;
  Session* raw = session.get();
  try {
    session->worker = std::thread(&TranscodeSupervisor::RunSession, this, raw, args,
                                  std::move(on_complete));
  } catch (const std::system_error& e) {
    Logger::Error(std::string("[TranscodeSupervisor] Worker thread creation failed: ") + e.what());
    return LaunchResult(false, kInvalidSessionId,
                        std::string("cannot create pipeline thread: ") + e.what());
  }

  const TranscodeSessionId id = raw->id;
  sessions_[id] = std::move(session);
  Logger::Info("[TranscodeSupervisor] Session " + std::to_string(id) + " launched: ffmpeg " +
               args.ToCommandLine());
  return LaunchResult(true, id, "");
}

void TranscodeSupervisor::RunSession(Session* session, RemuxArguments args,
                                     CompletionCallback on_complete) {
  RemuxResult result = engine_->Run(args, session->cancel);

  TranscodeCompletion completion;
  completion.session_id = session->id;
  switch (result.outcome) {
    case RemuxOutcome::kSuccess:
      completion.outcome = TerminalOutcome::kSuccess;
      break;
    case RemuxOutcome::kCancelled:
      completion.outcome = TerminalOutcome::kCancelled;
      break;
    case RemuxOutcome::kFailed:
      completion.outcome = TerminalOutcome::kFailed;
      break;
  }
  // An I/O error raised by the interrupt is a cancellation, not a failure.
  if (session->cancel.load(std::memory_order_acquire) &&
      completion.outcome == TerminalOutcome::kFailed) {
    completion.outcome = TerminalOutcome::kCancelled;
  }
  if (completion.outcome == TerminalOutcome::kFailed) {
    completion.log = std::move(result.log);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    session->terminal = true;
  }
  state_cv_.notify_all();

  Logger::Info("[TranscodeSupervisor] Session " + std::to_string(completion.session_id) +
               " terminal: " + TerminalOutcomeName(completion.outcome));
  if (on_complete) {
    on_complete(completion);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    session->finished = true;
  }
  state_cv_.notify_all();
}

void TranscodeSupervisor::ReapFinished() {
  std::vector<std::unique_ptr<Session>> finished;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if (it->second->finished) {
        finished.push_back(std::move(it->second));
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& session : finished) {
    if (session->worker.joinable()) session->worker.join();
  }
}

void TranscodeSupervisor::Cancel(TranscodeSessionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(id);
  if (it == sessions_.end() || it->second->terminal) {
    Logger::Debug("[TranscodeSupervisor] Cancel " + std::to_string(id) + ": already terminal");
    return;
  }
  if (!it->second->cancel.exchange(true, std::memory_order_acq_rel)) {
    Logger::Info("[TranscodeSupervisor] Cancelling session " + std::to_string(id));
  }
}

bool TranscodeSupervisor::WaitForTermination(TranscodeSessionId id,
                                             std::chrono::milliseconds timeout) {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool done = state_cv_.wait_for(lock, timeout, [&] {
      auto it = sessions_.find(id);
      return it == sessions_.end() || it->second->finished;
    });
    if (!done) {
      Logger::Warn("[TranscodeSupervisor] Session " + std::to_string(id) +
                   " did not terminate within " + std::to_string(timeout.count()) + "ms");
      return false;
    }
  }
  ReapFinished();
  return true;
}

bool TranscodeSupervisor::IsActive(TranscodeSessionId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(id);
  return it != sessions_.end() && !it->second->terminal;
}

size_t TranscodeSupervisor::ActiveSessionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = 0;
  for (const auto& [id, session] : sessions_) {
    if (!session->terminal) ++count;
  }
  return count;
}

}  // namespace tellolink::pipeline
