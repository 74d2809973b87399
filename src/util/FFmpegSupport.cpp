// Repository: TelloLink
// Component: FFmpeg Support
// Purpose: Shared libavformat plumbing: error strings, interrupt callback, context deleters.
// Copyright (c) 2026 TelloLink

#include "tellolink/util/FFmpegSupport.hpp"

#include <mutex>

namespace tellolink::util {

namespace {

bool ClassHasOption(const AVClass* cls, const std::string& key) {
  return av_opt_find(&cls, key.c_str(), nullptr, 0, AV_OPT_SEARCH_FAKE_OBJ) != nullptr;
}

}  // namespace

std::string AvErrorString(int errnum) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(errnum, errbuf, sizeof(errbuf));
  return std::string(errbuf);
}

void EnsureNetworkInitialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    avformat_network_init();
    av_log_set_level(AV_LOG_ERROR);
  });
}

int AbortOnFlag(void* opaque) {
  const auto* flag = static_cast<const std::atomic<bool>*>(opaque);
  return (flag && flag->load(std::memory_order_acquire)) ? 1 : 0;
}

void InstallInterrupt(AVFormatContext* ctx, const std::atomic<bool>* flag) {
  if (!ctx) return;
  ctx->interrupt_callback.callback = AbortOnFlag;
  // The callback only reads through this pointer.
  ctx->interrupt_callback.opaque = const_cast<std::atomic<bool>*>(flag);
}

AVDictionary* MakeDictionary(const std::vector<std::pair<std::string, std::string>>& options) {
  AVDictionary* dict = nullptr;
  for (const auto& [key, value] : options) {
    av_dict_set(&dict, key.c_str(), value.c_str(), 0);
  }
  return dict;
}

void SplitInputOptions(const std::vector<std::pair<std::string, std::string>>& options,
                       std::vector<std::pair<std::string, std::string>>* format_options,
                       std::vector<std::pair<std::string, std::string>>* codec_options) {
  for (const auto& option : options) {
    if (!ClassHasOption(avformat_get_class(), option.first) &&
        ClassHasOption(avcodec_get_class(), option.first)) {
      codec_options->push_back(option);
    } else {
      format_options->push_back(option);
    }
  }
}

std::string DescribeDictionary(const AVDictionary* dict) {
  std::string out;
  const AVDictionaryEntry* entry = nullptr;
  while ((entry = av_dict_get(dict, "", entry, AV_DICT_IGNORE_SUFFIX)) != nullptr) {
    if (!out.empty()) out += ' ';
    out += entry->key;
    out += '=';
    out += entry->value;
  }
  return out;
}

}  // namespace tellolink::util
