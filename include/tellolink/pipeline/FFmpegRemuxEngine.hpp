// Repository: TelloLink
// Component: FFmpeg Remux Engine
// Purpose: In-process libavformat stream copy from raw H.264 over UDP to MPEG-TS over HTTP.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_PIPELINE_FFMPEG_REMUX_ENGINE_HPP_
#define TELLOLINK_PIPELINE_FFMPEG_REMUX_ENGINE_HPP_

#include "tellolink/pipeline/IRemuxEngine.hpp"

namespace tellolink::pipeline {

// FFmpegRemuxEngine performs what
//   ffmpeg <RemuxArguments::ToCommandLine()>
// does, inside the process. Run() blocks in the HTTP accept until a player
// connects, then copies packets until the input ends or an error occurs.
// Every blocking libavformat call observes the cancel flag through the
// interrupt callback.
//
// Stateless; one instance may serve consecutive sessions.
class FFmpegRemuxEngine : public IRemuxEngine {
 public:
  FFmpegRemuxEngine() = default;

  bool Prepare(const RemuxArguments& args, std::string* error) override;
  RemuxResult Run(const RemuxArguments& args, const std::atomic<bool>& cancel) override;

  // Frame rate assumed when the elementary stream carries no timing.
  static constexpr int kFallbackFrameRate = 30;
};

}  // namespace tellolink::pipeline

#endif  // TELLOLINK_PIPELINE_FFMPEG_REMUX_ENGINE_HPP_
