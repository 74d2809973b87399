// Repository: TelloLink
// Component: Network Preflight
// Purpose: Rejects a connect attempt unless the active link is the drone's WiFi network.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_PREFLIGHT_NETWORK_PREFLIGHT_H_
#define TELLOLINK_PREFLIGHT_NETWORK_PREFLIGHT_H_

#include <memory>
#include <string>

#include "tellolink/preflight/INetworkStatusProvider.h"

namespace tellolink::preflight {

enum class PreflightOutcome {
  kOk,
  kNoConnection,
  kWrongLinkType,
  kWrongNetwork,
  kQueryFailed,
};

const char* PreflightOutcomeName(PreflightOutcome outcome);

struct PreflightResult {
  PreflightOutcome outcome = PreflightOutcome::kOk;
  std::string message;
  std::string detected_network;  // wireless identity when one was read

  bool ok() const { return outcome == PreflightOutcome::kOk; }
};

// NetworkPreflight checks ambient link state before the command channel is
// opened. The identity check is a prefix match because the suffix varies per
// unit ("TELLO-A1B2C3"). When the provider cannot read the identity the check
// degrades to link type only and trusts the operator.
//
// No side effects beyond the provider query.
class NetworkPreflight {
 public:
  NetworkPreflight(std::shared_ptr<INetworkStatusProvider> provider,
                   std::string expected_prefix);

  PreflightResult Check();

  const std::string& expected_prefix() const { return expected_prefix_; }

 private:
  std::shared_ptr<INetworkStatusProvider> provider_;
  std::string expected_prefix_;
};

}  // namespace tellolink::preflight

#endif  // TELLOLINK_PREFLIGHT_NETWORK_PREFLIGHT_H_
