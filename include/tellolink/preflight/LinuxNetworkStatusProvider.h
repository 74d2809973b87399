// Repository: TelloLink
// Component: Linux Network Status Provider
// Purpose: Link state from /sys/class/net, SSID through the wireless extensions ioctl.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_PREFLIGHT_LINUX_NETWORK_STATUS_PROVIDER_H_
#define TELLOLINK_PREFLIGHT_LINUX_NETWORK_STATUS_PROVIDER_H_

#include <functional>
#include <optional>
#include <string>

#include "tellolink/preflight/INetworkStatusProvider.h"

namespace tellolink::preflight {

// Reads the SSID an interface is associated with; nullopt if unknown.
using SsidReader = std::function<std::optional<std::string>(const std::string& interface_name)>;

// SSID via SIOCGIWESSID. Drivers without wireless-extensions compatibility
// return nullopt, which makes the preflight fall back to the link-type check.
std::optional<std::string> ReadSsidWithIoctl(const std::string& interface_name);

// LinuxNetworkStatusProvider picks the active link from sysfs:
//   - an interface is up when operstate is "up", or "unknown" with carrier 1
//   - loopback is ignored
//   - an up wireless interface (wireless/ or phy80211/ present) wins over
//     any wired one; among equals the first in name order wins
class LinuxNetworkStatusProvider : public INetworkStatusProvider {
 public:
  explicit LinuxNetworkStatusProvider(std::string sysfs_root = "/sys/class/net",
                                      SsidReader ssid_reader = ReadSsidWithIoctl);

  bool Query(NetworkSnapshot* out, std::string* error) override;

 private:
  std::string sysfs_root_;
  SsidReader ssid_reader_;
};

}  // namespace tellolink::preflight

#endif  // TELLOLINK_PREFLIGHT_LINUX_NETWORK_STATUS_PROVIDER_H_
