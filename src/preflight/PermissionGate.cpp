// Repository: TelloLink
// Component: Permission Gate
// Purpose: Ensures the process may read the wireless network identity before preflight.
// Copyright (c) 2026 TelloLink

#include "tellolink/preflight/PermissionGate.h"

#include "tellolink/util/Logger.hpp"

namespace tellolink::preflight {

using util::Logger;

PermissionGate::PermissionGate(std::shared_ptr<IPermissionProvider> provider)
    : provider_(std::move(provider)) {}

PermissionResult PermissionGate::Ensure() {
  if (!provider_) {
    return PermissionResult(true, "");
  }

  switch (provider_->RequestWirelessIdentityAccess()) {
    case PermissionState::kNotRequired:
      Logger::Debug("[PermissionGate] No grant required on this platform");
      return PermissionResult(true, "");
    case PermissionState::kGranted:
      Logger::Info("[PermissionGate] Wireless identity access granted");
      return PermissionResult(true, "");
    case PermissionState::kDenied:
      break;
  }
  return PermissionResult(false,
                          "Permission to read the WiFi network name was denied; "
                          "grant it to verify the drone network");
}

}  // namespace tellolink::preflight
