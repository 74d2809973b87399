// Repository: TelloLink
// Component: Remux Engine Interface
// Purpose: Runs one remux session to completion on the calling thread.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_PIPELINE_I_REMUX_ENGINE_HPP_
#define TELLOLINK_PIPELINE_I_REMUX_ENGINE_HPP_

#include <atomic>
#include <string>

#include "tellolink/pipeline/RemuxArguments.hpp"

namespace tellolink::pipeline {

enum class RemuxOutcome {
  kSuccess,    // input ended and the trailer was written
  kCancelled,  // cancel flag observed
  kFailed,     // open, probe, mux or I/O error
};

struct RemuxResult {
  RemuxOutcome outcome;
  std::string log;  // accumulated diagnostic output for this session

  RemuxResult(RemuxOutcome o, const std::string& l) : outcome(o), log(l) {}
};

class IRemuxEngine {
 public:
  virtual ~IRemuxEngine() = default;

  // Synchronous launch check (demuxer/muxer available, URLs well formed).
  // Returns false with *error set when the session cannot start at all.
  virtual bool Prepare(const RemuxArguments& args, std::string* error) = 0;

  // Blocks until the session terminates. Must poll `cancel` at least as often
  // as it blocks on I/O.
  virtual RemuxResult Run(const RemuxArguments& args, const std::atomic<bool>& cancel) = 0;
};

}  // namespace tellolink::pipeline

#endif  // TELLOLINK_PIPELINE_I_REMUX_ENGINE_HPP_
