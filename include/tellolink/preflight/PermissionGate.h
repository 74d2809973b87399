// Repository: TelloLink
// Component: Permission Gate
// Purpose: Ensures the process may read the wireless network identity before preflight.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_PREFLIGHT_PERMISSION_GATE_H_
#define TELLOLINK_PREFLIGHT_PERMISSION_GATE_H_

#include <memory>
#include <string>

namespace tellolink::preflight {

enum class PermissionState {
  kGranted,
  kDenied,
  kNotRequired,
};

// Platform seam for the capability-grant prompt.
class IPermissionProvider {
 public:
  virtual ~IPermissionProvider() = default;

  // Prompts (or checks) for wireless-identity read access. Platforms that
  // need no grant return kNotRequired without prompting.
  virtual PermissionState RequestWirelessIdentityAccess() = 0;
};

// Linux exposes the SSID to unprivileged processes; nothing to request.
class PlatformPermissionProvider : public IPermissionProvider {
 public:
  PermissionState RequestWirelessIdentityAccess() override { return PermissionState::kNotRequired; }
};

struct PermissionResult {
  bool granted;
  std::string message;

  PermissionResult(bool g, const std::string& msg) : granted(g), message(msg) {}
};

// PermissionGate consults the provider on every call. Grants can be revoked
// outside the process, so nothing is cached between connect attempts.
class PermissionGate {
 public:
  explicit PermissionGate(std::shared_ptr<IPermissionProvider> provider);

  PermissionResult Ensure();

 private:
  std::shared_ptr<IPermissionProvider> provider_;
};

}  // namespace tellolink::preflight

#endif  // TELLOLINK_PREFLIGHT_PERMISSION_GATE_H_
