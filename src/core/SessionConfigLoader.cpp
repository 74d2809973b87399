// Repository: TelloLink
// Component: Session Configuration Loader
// Purpose: Layer config file values and TELLOLINK_* environment overrides onto SessionConfig.
// Copyright (c) 2026 TelloLink

#include "tellolink/core/SessionConfigLoader.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace tellolink::core {

namespace {

std::string Trim(const std::string& s) {
  size_t begin = 0;
  while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  size_t end = s.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(begin, end - begin);
}

bool ParseInt64(const std::string& text, int64_t* out) {
  if (text.empty()) return false;
  try {
    size_t consumed = 0;
    long long v = std::stoll(text, &consumed, 10);
    if (consumed != text.size()) return false;
    *out = static_cast<int64_t>(v);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool ParseInt(const std::string& text, int* out) {
  int64_t v = 0;
  if (!ParseInt64(text, &v)) return false;
  if (v < -2147483647LL - 1 || v > 2147483647LL) return false;
  *out = static_cast<int>(v);
  return true;
}

bool ParseBool(const std::string& text, bool* out) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    *out = true;
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    *out = false;
    return true;
  }
  return false;
}

ConfigLoadResult BadValue(const std::string& key, const std::string& value, const char* expected) {
  return ConfigLoadResult(false, "invalid value '" + value + "' for " + key + " (expected " +
                                     expected + ")");
}

}  // namespace

const std::vector<std::string>& SessionConfigKeys() {
  static const std::vector<std::string> kKeys = {
      "device_address",
      "command_port",
      "local_command_port",
      "video_port",
      "stream_host",
      "stream_port",
      "network_prefix",
      "settle_delay_ms",
      "require_command_ack",
      "command_ack_timeout_ms",
      "player_attach_delay_ms",
      "player_retry_delay_ms",
      "max_player_retries",
      "probe_size",
      "analyze_duration_us",
      "pipeline_failure_policy",
      "max_pipeline_restarts",
      "pipeline_stop_timeout_ms",
  };
  return kKeys;
}

ConfigLoadResult ApplyConfigValue(const std::string& key,
                                  const std::string& value,
                                  SessionConfig* config) {
  int* int_field = nullptr;
  int64_t* int64_field = nullptr;
  std::string* string_field = nullptr;

  if (key == "device_address") {
    string_field = &config->device_address;
  } else if (key == "stream_host") {
    string_field = &config->stream_host;
  } else if (key == "network_prefix") {
    string_field = &config->network_prefix;
  } else if (key == "command_port") {
    int_field = &config->command_port;
  } else if (key == "local_command_port") {
    int_field = &config->local_command_port;
  } else if (key == "video_port") {
    int_field = &config->video_port;
  } else if (key == "stream_port") {
    int_field = &config->stream_port;
  } else if (key == "settle_delay_ms") {
    int_field = &config->settle_delay_ms;
  } else if (key == "command_ack_timeout_ms") {
    int_field = &config->command_ack_timeout_ms;
  } else if (key == "player_attach_delay_ms") {
    int_field = &config->player_attach_delay_ms;
  } else if (key == "player_retry_delay_ms") {
    int_field = &config->player_retry_delay_ms;
  } else if (key == "max_player_retries") {
    int_field = &config->max_player_retries;
  } else if (key == "max_pipeline_restarts") {
    int_field = &config->max_pipeline_restarts;
  } else if (key == "pipeline_stop_timeout_ms") {
    int_field = &config->pipeline_stop_timeout_ms;
  } else if (key == "probe_size") {
    int64_field = &config->probe_size;
  } else if (key == "analyze_duration_us") {
    int64_field = &config->analyze_duration_us;
  } else if (key == "require_command_ack") {
    if (!ParseBool(value, &config->require_command_ack)) {
      return BadValue(key, value, "true or false");
    }
    return ConfigLoadResult(true, "");
  } else if (key == "pipeline_failure_policy") {
    auto policy = ParsePipelineFailurePolicy(value);
    if (!policy) {
      return BadValue(key, value, "fatal or restart");
    }
    config->pipeline_failure_policy = *policy;
    return ConfigLoadResult(true, "");
  } else {
    return ConfigLoadResult(false, "unknown config key '" + key + "'");
  }

  if (string_field) {
    *string_field = value;
  } else if (int_field) {
    if (!ParseInt(value, int_field)) return BadValue(key, value, "an integer");
  } else if (int64_field) {
    if (!ParseInt64(value, int64_field)) return BadValue(key, value, "an integer");
  }
  return ConfigLoadResult(true, "");
}

ConfigLoadResult LoadSessionConfigStream(std::istream& in,
                                         const std::string& origin,
                                         SessionConfig* config) {
  std::string line;
  int line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    const size_t comment = line.find('#');
    if (comment != std::string::npos) line.erase(comment);
    line = Trim(line);
    if (line.empty()) continue;

    const size_t eq = line.find('=');
    if (eq == std::string::npos) {
      return ConfigLoadResult(false, origin + ":" + std::to_string(line_number) +
                                         ": expected 'key = value'");
    }
    const std::string key = Trim(line.substr(0, eq));
    const std::string value = Trim(line.substr(eq + 1));
    ConfigLoadResult result = ApplyConfigValue(key, value, config);
    if (!result.success) {
      return ConfigLoadResult(false, origin + ":" + std::to_string(line_number) + ": " +
                                         result.message);
    }
  }
  return ConfigLoadResult(true, "");
}

ConfigLoadResult LoadSessionConfigFile(const std::string& path, SessionConfig* config) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return ConfigLoadResult(false, "cannot open config file " + path);
  }
  return LoadSessionConfigStream(file, path, config);
}

ConfigLoadResult ApplyEnvironmentOverrides(SessionConfig* config, const EnvLookup& lookup) {
  for (const std::string& key : SessionConfigKeys()) {
    std::string name = "TELLOLINK_" + key;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    const char* value = lookup(name);
    if (value == nullptr) continue;
    ConfigLoadResult result = ApplyConfigValue(key, Trim(value), config);
    if (!result.success) {
      return ConfigLoadResult(false, name + ": " + result.message);
    }
  }
  return ConfigLoadResult(true, "");
}

ConfigLoadResult ApplyEnvironmentOverrides(SessionConfig* config) {
  return ApplyEnvironmentOverrides(
      config, [](const std::string& name) { return std::getenv(name.c_str()); });
}

}  // namespace tellolink::core
