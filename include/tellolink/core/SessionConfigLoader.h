// Repository: TelloLink
// Component: Session Configuration Loader
// Purpose: Layer config file values and TELLOLINK_* environment overrides onto SessionConfig.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_CORE_SESSION_CONFIG_LOADER_H_
#define TELLOLINK_CORE_SESSION_CONFIG_LOADER_H_

#include <functional>
#include <istream>
#include <string>
#include <vector>

#include "tellolink/core/SessionConfig.h"

namespace tellolink::core {

struct ConfigLoadResult {
  bool success;
  std::string message;

  ConfigLoadResult(bool s, const std::string& msg) : success(s), message(msg) {}
};

// Sets one key. Keys are the SessionConfig field names.
ConfigLoadResult ApplyConfigValue(const std::string& key,
                                  const std::string& value,
                                  SessionConfig* config);

// Reads "key = value" lines. Blank lines and '#' comments are skipped.
// The first bad line aborts the load; the message carries origin:line.
ConfigLoadResult LoadSessionConfigStream(std::istream& in,
                                         const std::string& origin,
                                         SessionConfig* config);

ConfigLoadResult LoadSessionConfigFile(const std::string& path, SessionConfig* config);

// Looks up TELLOLINK_<KEY> (upper-cased field name) for every known key.
using EnvLookup = std::function<const char*(const std::string& name)>;
ConfigLoadResult ApplyEnvironmentOverrides(SessionConfig* config, const EnvLookup& lookup);
ConfigLoadResult ApplyEnvironmentOverrides(SessionConfig* config);

// Every key accepted by ApplyConfigValue, in declaration order.
const std::vector<std::string>& SessionConfigKeys();

}  // namespace tellolink::core

#endif  // TELLOLINK_CORE_SESSION_CONFIG_LOADER_H_
