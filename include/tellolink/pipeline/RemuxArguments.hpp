// Repository: TelloLink
// Component: Remux Arguments
// Purpose: Input/output parameters for the low-latency H.264 to MPEG-TS remux.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_PIPELINE_REMUX_ARGUMENTS_HPP_
#define TELLOLINK_PIPELINE_REMUX_ARGUMENTS_HPP_

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tellolink::pipeline {

using OptionList = std::vector<std::pair<std::string, std::string>>;

// RemuxArguments describes one pipeline session. Options are ordered; the
// engine feeds them to the demuxer/muxer as dictionaries and ToCommandLine()
// renders them as the equivalent ffmpeg invocation for logs.
struct RemuxArguments {
  std::string input_url;     // udp://0.0.0.0:<video_port>
  std::string input_format;  // raw elementary stream demuxer ("h264")
  OptionList input_options;

  std::string output_url;     // http://<host>:<stream_port>
  std::string output_format;  // "mpegts"
  OptionList output_options;  // protocol options, "listen" among them

  // Stream copy; no re-encode.
  bool copy_video = true;
  int64_t mux_delay = 0;
  int64_t mux_preload = 0;

  // ffmpeg-style argument string, e.g.
  //   -f h264 ... -i udp://0.0.0.0:11111 -c:v copy ... -f mpegts -listen 1 http://...
  std::string ToCommandLine() const;
};

// Arguments for the drone video path: raw H.264 in over UDP, stream copy,
// MPEG-TS served once over HTTP. Probe limits bound the startup analysis.
RemuxArguments BuildLowLatencyRemuxArguments(int input_port,
                                             const std::string& output_host,
                                             int output_port,
                                             int64_t probe_size,
                                             int64_t analyze_duration_us);

}  // namespace tellolink::pipeline

#endif  // TELLOLINK_PIPELINE_REMUX_ARGUMENTS_HPP_
