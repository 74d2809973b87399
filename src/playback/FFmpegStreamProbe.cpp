// Repository: TelloLink
// Component: FFmpeg Stream Probe
// Purpose: Headless player: reads the re-muxed stream, reports readiness, optionally records it.
// Copyright (c) 2026 TelloLink

#include "tellolink/playback/FFmpegStreamProbe.h"

#include <system_error>

#include "tellolink/util/FFmpegSupport.hpp"
#include "tellolink/util/Logger.hpp"

namespace tellolink::playback {

using util::Logger;

namespace {

// Stream-copy writer for --record.
class Recorder {
 public:
  bool Open(const std::string& path, const AVStream* source, std::string* error) {
    AVFormatContext* raw = nullptr;
    int ret = avformat_alloc_output_context2(&raw, nullptr, "mpegts", path.c_str());
    ctx_.reset(raw);
    if (ret < 0 || !ctx_) {
      *error = "allocate recorder: " + util::AvErrorString(ret);
      return false;
    }
    stream_ = avformat_new_stream(ctx_.get(), nullptr);
    if (!stream_) {
      *error = "create recorder stream";
      return false;
    }
    ret = avcodec_parameters_copy(stream_->codecpar, source->codecpar);
    if (ret < 0) {
      *error = "copy codec parameters: " + util::AvErrorString(ret);
      return false;
    }
    stream_->codecpar->codec_tag = 0;
    stream_->time_base = source->time_base;
    source_time_base_ = source->time_base;

    ret = avio_open(&ctx_->pb, path.c_str(), AVIO_FLAG_WRITE);
    if (ret < 0) {
      *error = "open " + path + ": " + util::AvErrorString(ret);
      return false;
    }
    ret = avformat_write_header(ctx_.get(), nullptr);
    if (ret < 0) {
      *error = "write header: " + util::AvErrorString(ret);
      return false;
    }
    header_written_ = true;
    return true;
  }

  // Takes a reference to the packet; the caller keeps ownership.
  bool Write(const AVPacket* packet, std::string* error) {
    util::PacketPtr copy(av_packet_clone(packet));
    if (!copy) {
      *error = "clone packet";
      return false;
    }
    av_packet_rescale_ts(copy.get(), source_time_base_, stream_->time_base);
    copy->stream_index = stream_->index;
    copy->pos = -1;
    const int ret = av_interleaved_write_frame(ctx_.get(), copy.get());
    if (ret < 0) {
      *error = "write packet: " + util::AvErrorString(ret);
      return false;
    }
    return true;
  }

  void Close() {
    if (header_written_) {
      const int ret = av_write_trailer(ctx_.get());
      if (ret < 0) Logger::Warn("[FFmpegStreamProbe] Recorder trailer: " + util::AvErrorString(ret));
      header_written_ = false;
    }
    ctx_.reset();
  }

 private:
  util::OutputContextPtr ctx_;
  AVStream* stream_ = nullptr;
  AVRational source_time_base_{1, 90000};
  bool header_written_ = false;
};

}  // namespace

FFmpegStreamProbe::FFmpegStreamProbe(PlaybackBridge& bridge, std::optional<std::string> record_path)
    : bridge_(bridge), record_path_(std::move(record_path)) {}

FFmpegStreamProbe::~FFmpegStreamProbe() {
  Detach();
}

bool FFmpegStreamProbe::Attach(const std::string& url) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (reader_.joinable()) {
    stop_.store(true, std::memory_order_release);
    reader_.join();
  }
  stop_.store(false, std::memory_order_release);
  try {
    reader_ = std::thread(&FFmpegStreamProbe::ReadLoop, this, url);
  } catch (const std::system_error& e) {
    Logger::Error(std::string("[FFmpegStreamProbe] Cannot start reader: ") + e.what());
    return false;
  }
  Logger::Info("[FFmpegStreamProbe] Attached to " + url);
  return true;
}

void FFmpegStreamProbe::Detach() {
  std::lock_guard<std::mutex> lock(mutex_);
  stop_.store(true, std::memory_order_release);
  if (reader_.joinable()) {
    reader_.join();
    Logger::Info("[FFmpegStreamProbe] Detached");
  }
}

void FFmpegStreamProbe::ReadLoop(std::string url) {
  util::EnsureNetworkInitialized();

  auto report = [this](const std::string& detail) {
    if (!stop_.load(std::memory_order_acquire)) {
      bridge_.NotifyPlaybackError(detail);
    }
  };

  AVFormatContext* raw = avformat_alloc_context();
  if (!raw) {
    report("cannot allocate demuxer context");
    return;
  }
  util::InstallInterrupt(raw, &stop_);

  int ret = avformat_open_input(&raw, url.c_str(), nullptr, nullptr);
  util::InputContextPtr in(ret < 0 ? nullptr : raw);
  if (ret < 0) {
    report("open " + url + ": " + util::AvErrorString(ret));
    return;
  }
  ret = avformat_find_stream_info(in.get(), nullptr);
  if (ret < 0) {
    report("probe " + url + ": " + util::AvErrorString(ret));
    return;
  }
  const int video_index = av_find_best_stream(in.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_index < 0) {
    report("no video stream at " + url);
    return;
  }

  Recorder recorder;
  bool recording = false;
  if (record_path_) {
    std::string error;
    recording = recorder.Open(*record_path_, in->streams[video_index], &error);
    if (recording) {
      Logger::Info("[FFmpegStreamProbe] Recording to " + *record_path_);
    } else {
      Logger::Warn("[FFmpegStreamProbe] Recording disabled: " + error);
    }
  }

  util::PacketPtr packet(av_packet_alloc());
  if (!packet) {
    report("cannot allocate packet");
    return;
  }

  bool ready = false;
  int64_t packets = 0;
  while (!stop_.load(std::memory_order_acquire)) {
    ret = av_read_frame(in.get(), packet.get());
    if (ret == AVERROR(EAGAIN)) continue;
    if (ret < 0) {
      report(ret == AVERROR_EOF ? std::string("end of stream")
                                : "read " + url + ": " + util::AvErrorString(ret));
      break;
    }
    if (packet->stream_index == video_index) {
      ++packets;
      if (!ready) {
        ready = true;
        bridge_.NotifyReady();
      }
      if (recording) {
        std::string error;
        if (!recorder.Write(packet.get(), &error)) {
          Logger::Warn("[FFmpegStreamProbe] Recording stopped: " + error);
          recorder.Close();
          recording = false;
        }
      }
    }
    av_packet_unref(packet.get());
  }

  if (recording) recorder.Close();
  Logger::Debug("[FFmpegStreamProbe] Reader exiting after " + std::to_string(packets) +
                " video packets");
}

}  // namespace tellolink::playback
