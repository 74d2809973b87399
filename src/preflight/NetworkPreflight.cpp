// Repository: TelloLink
// Component: Network Preflight
// Purpose: Rejects a connect attempt unless the active link is the drone's WiFi network.
// Copyright (c) 2026 TelloLink

#include "tellolink/preflight/NetworkPreflight.h"

#include "tellolink/util/Logger.hpp"

namespace tellolink::preflight {

using util::Logger;

const char* LinkTypeName(LinkType type) {
  switch (type) {
    case LinkType::kNone:
      return "none";
    case LinkType::kWifi:
      return "wifi";
    case LinkType::kEthernet:
      return "ethernet";
    case LinkType::kCellular:
      return "cellular";
    case LinkType::kOther:
      return "other";
  }
  return "unknown";
}

const char* PreflightOutcomeName(PreflightOutcome outcome) {
  switch (outcome) {
    case PreflightOutcome::kOk:
      return "ok";
    case PreflightOutcome::kNoConnection:
      return "no_connection";
    case PreflightOutcome::kWrongLinkType:
      return "wrong_link_type";
    case PreflightOutcome::kWrongNetwork:
      return "wrong_network";
    case PreflightOutcome::kQueryFailed:
      return "query_failed";
  }
  return "unknown";
}

NetworkPreflight::NetworkPreflight(std::shared_ptr<INetworkStatusProvider> provider,
                                   std::string expected_prefix)
    : provider_(std::move(provider)), expected_prefix_(std::move(expected_prefix)) {}

PreflightResult NetworkPreflight::Check() {
  PreflightResult result;
  NetworkSnapshot snapshot;
  std::string error;

  if (!provider_ || !provider_->Query(&snapshot, &error)) {
    result.outcome = PreflightOutcome::kQueryFailed;
    result.message = "Failed to check network status: " +
                     (provider_ ? error : std::string("no network status provider"));
    return result;
  }

  Logger::Debug("[NetworkPreflight] connected=" + std::string(snapshot.connected ? "yes" : "no") +
                " type=" + LinkTypeName(snapshot.link_type) +
                " interface=" + snapshot.interface_name +
                " identity=" + snapshot.wireless_identity.value_or("<unavailable>"));

  if (!snapshot.connected) {
    result.outcome = PreflightOutcome::kNoConnection;
    result.message = "No network connection";
    return result;
  }

  if (snapshot.link_type != LinkType::kWifi) {
    result.outcome = PreflightOutcome::kWrongLinkType;
    result.message = "Please connect to the Tello drone's WiFi network";
    return result;
  }

  if (!snapshot.wireless_identity) {
    Logger::Info("[NetworkPreflight] Wireless identity unavailable on " + snapshot.interface_name +
                 "; trusting operator");
    return result;
  }

  result.detected_network = *snapshot.wireless_identity;
  if (!expected_prefix_.empty() &&
      result.detected_network.compare(0, expected_prefix_.size(), expected_prefix_) != 0) {
    result.outcome = PreflightOutcome::kWrongNetwork;
    result.message = "Please connect to the Tello drone's WiFi network (" + expected_prefix_ +
                     "*); currently on '" + result.detected_network + "'";
    return result;
  }

  Logger::Info("[NetworkPreflight] On drone network '" + result.detected_network + "'");
  return result;
}

}  // namespace tellolink::preflight
