// Repository: TelloLink
// Component: Remux Arguments
// Purpose: Input/output parameters for the low-latency H.264 to MPEG-TS remux.
// Copyright (c) 2026 TelloLink

#include "tellolink/pipeline/RemuxArguments.hpp"

#include <sstream>

namespace tellolink::pipeline {

std::string RemuxArguments::ToCommandLine() const {
  std::ostringstream out;
  out << "-f " << input_format;
  for (const auto& [key, value] : input_options) {
    out << " -" << key << " " << value;
  }
  out << " -i " << input_url;
  if (copy_video) out << " -c:v copy";
  out << " -muxdelay " << mux_delay << " -muxpreload " << mux_preload;
  out << " -f " << output_format;
  for (const auto& [key, value] : output_options) {
    out << " -" << key << " " << value;
  }
  out << " " << output_url;
  return out.str();
}

RemuxArguments BuildLowLatencyRemuxArguments(int input_port,
                                             const std::string& output_host,
                                             int output_port,
                                             int64_t probe_size,
                                             int64_t analyze_duration_us) {
  RemuxArguments args;
  args.input_url = "udp://0.0.0.0:" + std::to_string(input_port);
  args.input_format = "h264";
  args.input_options = {
      {"analyzeduration", std::to_string(analyze_duration_us)},
      {"probesize", std::to_string(probe_size)},
      {"fflags", "+discardcorrupt+nobuffer"},
      {"flags", "low_delay"},
      {"avioflags", "direct"},
  };
  args.output_url = "http://" + output_host + ":" + std::to_string(output_port);
  args.output_format = "mpegts";
  args.output_options = {{"listen", "1"}};
  return args;
}

}  // namespace tellolink::pipeline
