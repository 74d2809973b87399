// Repository: TelloLink
// Component: FFmpeg Support
// Purpose: Shared libavformat plumbing: error strings, interrupt callback, context deleters.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_UTIL_FFMPEG_SUPPORT_HPP_
#define TELLOLINK_UTIL_FFMPEG_SUPPORT_HPP_

#include <atomic>
#include <memory>
#include <string>
#include <utility>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
#include <libavutil/opt.h>
}

namespace tellolink::util {

// av_strerror() wrapped into a std::string.
std::string AvErrorString(int errnum);

// avformat_network_init(), once per process.
void EnsureNetworkInitialized();

// AVIOInterruptCB callback; opaque is a const std::atomic<bool>*.
int AbortOnFlag(void* opaque);

// Installs AbortOnFlag on `ctx` observing `flag`.
void InstallInterrupt(AVFormatContext* ctx, const std::atomic<bool>* flag);

// Builds an AVDictionary from ordered key/value pairs. Caller frees.
AVDictionary* MakeDictionary(const std::vector<std::pair<std::string, std::string>>& options);

// Routes command-line style input options to the context that owns them.
// Keys known to the demuxer context go to `format_options`; keys known only
// to the codec context (e.g. "flags") go to `codec_options`. Anything else
// is left to the demuxer, which forwards protocol options itself.
void SplitInputOptions(const std::vector<std::pair<std::string, std::string>>& options,
                       std::vector<std::pair<std::string, std::string>>* format_options,
                       std::vector<std::pair<std::string, std::string>>* codec_options);

// Space-separated "key=value" of every entry left in a dictionary after an
// open call, i.e. options nobody consumed. Empty when dict is null.
std::string DescribeDictionary(const AVDictionary* dict);

struct InputContextDeleter {
  void operator()(AVFormatContext* ctx) const {
    if (ctx) avformat_close_input(&ctx);
  }
};

// For muxer contexts: closes the AVIO handle when the muxer does not own it.
struct OutputContextDeleter {
  void operator()(AVFormatContext* ctx) const {
    if (!ctx) return;
    if (ctx->oformat && !(ctx->oformat->flags & AVFMT_NOFILE) && ctx->pb) {
      avio_closep(&ctx->pb);
    }
    avformat_free_context(ctx);
  }
};

struct PacketDeleter {
  void operator()(AVPacket* packet) const { av_packet_free(&packet); }
};

using InputContextPtr = std::unique_ptr<AVFormatContext, InputContextDeleter>;
using OutputContextPtr = std::unique_ptr<AVFormatContext, OutputContextDeleter>;
using PacketPtr = std::unique_ptr<AVPacket, PacketDeleter>;

}  // namespace tellolink::util

#endif  // TELLOLINK_UTIL_FFMPEG_SUPPORT_HPP_
