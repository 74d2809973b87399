// Repository: TelloLink
// Component: FFmpeg Stream Probe
// Purpose: Headless player: reads the re-muxed stream, reports readiness, optionally records it.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_PLAYBACK_FFMPEG_STREAM_PROBE_H_
#define TELLOLINK_PLAYBACK_FFMPEG_STREAM_PROBE_H_

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "tellolink/playback/IStreamPlayer.h"
#include "tellolink/playback/PlaybackBridge.h"

namespace tellolink::playback {

// FFmpegStreamProbe stands in for a rendering widget on a headless host.
// "Ready" is the first video packet demuxed from the stream; any open or
// read error (including end of stream) is a playback error. With a record
// path the video packets are also stream-copied into an MPEG-TS file.
class FFmpegStreamProbe : public IStreamPlayer {
 public:
  explicit FFmpegStreamProbe(PlaybackBridge& bridge,
                             std::optional<std::string> record_path = std::nullopt);
  ~FFmpegStreamProbe() override;

  FFmpegStreamProbe(const FFmpegStreamProbe&) = delete;
  FFmpegStreamProbe& operator=(const FFmpegStreamProbe&) = delete;

  bool Attach(const std::string& url) override;
  void Detach() override;

 private:
  void ReadLoop(std::string url);

  PlaybackBridge& bridge_;
  std::optional<std::string> record_path_;

  std::mutex mutex_;  // serializes Attach/Detach
  std::atomic<bool> stop_{false};
  std::thread reader_;
};

}  // namespace tellolink::playback

#endif  // TELLOLINK_PLAYBACK_FFMPEG_STREAM_PROBE_H_
