// Repository: TelloLink
// Component: FFmpeg Remux Engine
// Purpose: In-process libavformat stream copy from raw H.264 over UDP to MPEG-TS over HTTP.
// Copyright (c) 2026 TelloLink

#include "tellolink/pipeline/FFmpegRemuxEngine.hpp"

#include <sstream>
#include <vector>

#include "tellolink/util/FFmpegSupport.hpp"
#include "tellolink/util/Logger.hpp"

namespace tellolink::pipeline {

using util::Logger;

namespace {

// Collects the session's diagnostic lines; mirrored to Debug.
class SessionLog {
 public:
  void Append(const std::string& line) {
    Logger::Debug("[FFmpegRemuxEngine] " + line);
    out_ << line << '\n';
  }
  std::string str() const { return out_.str(); }

 private:
  std::ostringstream out_;
};

RemuxResult Finish(RemuxOutcome outcome, SessionLog& log, const std::string& last) {
  log.Append(last);
  return RemuxResult(outcome, log.str());
}

}  // namespace

bool FFmpegRemuxEngine::Prepare(const RemuxArguments& args, std::string* error) {
  if (args.input_url.empty() || args.output_url.empty()) {
    if (error) *error = "input and output URLs are required";
    return false;
  }
  if (!av_find_input_format(args.input_format.c_str())) {
    if (error) *error = "demuxer '" + args.input_format + "' is not available";
    return false;
  }
  if (!av_guess_format(args.output_format.c_str(), nullptr, nullptr)) {
    if (error) *error = "muxer '" + args.output_format + "' is not available";
    return false;
  }
  return true;
}

RemuxResult FFmpegRemuxEngine::Run(const RemuxArguments& args, const std::atomic<bool>& cancel) {
  util::EnsureNetworkInitialized();
  SessionLog log;
  log.Append("ffmpeg " + args.ToCommandLine());

  auto cancelled_or_failed = [&](int ret, const std::string& step) {
    if (cancel.load(std::memory_order_acquire) || ret == AVERROR_EXIT) {
      return Finish(RemuxOutcome::kCancelled, log, step + " interrupted");
    }
    return Finish(RemuxOutcome::kFailed, log,
                  step + " failed: " + util::AvErrorString(ret) + " (" + std::to_string(ret) + ")");
  };

  // ---- input ---------------------------------------------------------------
  AVFormatContext* raw_in = avformat_alloc_context();
  if (!raw_in) {
    return Finish(RemuxOutcome::kFailed, log, "cannot allocate input context");
  }
  util::InstallInterrupt(raw_in, &cancel);

  auto input_format = av_find_input_format(args.input_format.c_str());
  OptionList format_options;
  OptionList codec_options;
  util::SplitInputOptions(args.input_options, &format_options, &codec_options);
  AVDictionary* in_opts = util::MakeDictionary(format_options);
  int ret = avformat_open_input(&raw_in, args.input_url.c_str(), input_format, &in_opts);
  // avformat_open_input frees the context on failure.
  util::InputContextPtr in(ret < 0 ? nullptr : raw_in);
  const std::string unused_in = util::DescribeDictionary(in_opts);
  av_dict_free(&in_opts);
  if (ret < 0) return cancelled_or_failed(ret, "open input " + args.input_url);
  if (!unused_in.empty()) log.Append("input options not consumed by demuxer: " + unused_in);

  // Codec options reach the decoders opened by stream info, one copy per stream.
  std::vector<AVDictionary*> stream_opts(in->nb_streams, nullptr);
  for (AVDictionary*& dict : stream_opts) dict = util::MakeDictionary(codec_options);
  ret = avformat_find_stream_info(in.get(), stream_opts.empty() ? nullptr : stream_opts.data());
  for (AVDictionary*& dict : stream_opts) av_dict_free(&dict);
  if (ret < 0) return cancelled_or_failed(ret, "probe input");

  const int video_index = av_find_best_stream(in.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_index < 0) return cancelled_or_failed(video_index, "find video stream");
  AVStream* in_stream = in->streams[video_index];
  log.Append("input video " + std::to_string(in_stream->codecpar->width) + "x" +
             std::to_string(in_stream->codecpar->height) + " codec=" +
             avcodec_get_name(in_stream->codecpar->codec_id));

  // ---- output --------------------------------------------------------------
  AVFormatContext* raw_out = nullptr;
  ret = avformat_alloc_output_context2(&raw_out, nullptr, args.output_format.c_str(),
                                       args.output_url.c_str());
  util::OutputContextPtr out(raw_out);
  if (ret < 0 || !out) return cancelled_or_failed(ret, "allocate muxer");
  util::InstallInterrupt(out.get(), &cancel);
  out->max_delay = static_cast<int>(args.mux_delay * AV_TIME_BASE);

  AVStream* out_stream = avformat_new_stream(out.get(), nullptr);
  if (!out_stream) {
    return Finish(RemuxOutcome::kFailed, log, "cannot create output stream");
  }
  ret = avcodec_parameters_copy(out_stream->codecpar, in_stream->codecpar);
  if (ret < 0) return cancelled_or_failed(ret, "copy codec parameters");
  out_stream->codecpar->codec_tag = 0;
  out_stream->time_base = in_stream->time_base;

  if (!(out->oformat->flags & AVFMT_NOFILE)) {
    log.Append("waiting for player on " + args.output_url);
    AVDictionary* out_opts = util::MakeDictionary(args.output_options);
    ret = avio_open2(&out->pb, args.output_url.c_str(), AVIO_FLAG_WRITE,
                     &out->interrupt_callback, &out_opts);
    av_dict_free(&out_opts);
    if (ret < 0) return cancelled_or_failed(ret, "open output " + args.output_url);
    log.Append("player connected");
  }

  AVDictionary* mux_opts = nullptr;
  if (args.mux_preload > 0) {
    av_dict_set_int(&mux_opts, "preload", args.mux_preload * AV_TIME_BASE, 0);
  }
  ret = avformat_write_header(out.get(), &mux_opts);
  av_dict_free(&mux_opts);
  if (ret < 0) return cancelled_or_failed(ret, "write header");

  // ---- copy ----------------------------------------------------------------
  AVRational frame_rate = in_stream->avg_frame_rate;
  if (frame_rate.num <= 0 || frame_rate.den <= 0) frame_rate = in_stream->r_frame_rate;
  if (frame_rate.num <= 0 || frame_rate.den <= 0) frame_rate = AVRational{kFallbackFrameRate, 1};
  const AVRational frame_duration = av_inv_q(frame_rate);

  util::PacketPtr packet(av_packet_alloc());
  if (!packet) {
    return Finish(RemuxOutcome::kFailed, log, "cannot allocate packet");
  }

  int64_t frame_index = 0;
  int64_t last_dts = AV_NOPTS_VALUE;
  int64_t packets_written = 0;

  while (true) {
    if (cancel.load(std::memory_order_acquire)) {
      return Finish(RemuxOutcome::kCancelled, log,
                    "cancelled after " + std::to_string(packets_written) + " packets");
    }

    ret = av_read_frame(in.get(), packet.get());
    if (ret == AVERROR(EAGAIN)) continue;
    if (ret == AVERROR_EOF) break;
    if (ret < 0) return cancelled_or_failed(ret, "read packet");

    if (packet->stream_index != video_index) {
      av_packet_unref(packet.get());
      continue;
    }

    // Raw elementary streams carry no container timing.
    if (packet->pts == AV_NOPTS_VALUE) {
      packet->pts = av_rescale_q(frame_index, frame_duration, in_stream->time_base);
    }
    if (packet->dts == AV_NOPTS_VALUE) {
      packet->dts = packet->pts;
    }
    if (last_dts != AV_NOPTS_VALUE && packet->dts <= last_dts) {
      packet->dts = last_dts + 1;
      if (packet->pts < packet->dts) packet->pts = packet->dts;
    }
    last_dts = packet->dts;
    ++frame_index;

    av_packet_rescale_ts(packet.get(), in_stream->time_base, out_stream->time_base);
    packet->stream_index = out_stream->index;
    packet->pos = -1;

    ret = av_interleaved_write_frame(out.get(), packet.get());
    av_packet_unref(packet.get());
    if (ret < 0) return cancelled_or_failed(ret, "write packet");
    ++packets_written;
  }

  ret = av_write_trailer(out.get());
  if (ret < 0) return cancelled_or_failed(ret, "write trailer");
  return Finish(RemuxOutcome::kSuccess, log,
                "input ended after " + std::to_string(packets_written) + " packets");
}

}  // namespace tellolink::pipeline
