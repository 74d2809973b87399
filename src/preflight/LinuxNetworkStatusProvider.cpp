// Repository: TelloLink
// Component: Linux Network Status Provider
// Purpose: Link state from /sys/class/net, SSID through the wireless extensions ioctl.
// Copyright (c) 2026 TelloLink

#include "tellolink/preflight/LinuxNetworkStatusProvider.h"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <vector>

#include <linux/wireless.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace tellolink::preflight {

namespace fs = std::filesystem;

namespace {

constexpr int kArphrdEther = 1;
constexpr int kArphrdLoopback = 772;

std::string ReadFirstLine(const fs::path& path) {
  std::ifstream in(path);
  std::string line;
  if (in.is_open()) std::getline(in, line);
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r' || line.back() == ' ')) {
    line.pop_back();
  }
  return line;
}

int ReadInt(const fs::path& path, int fallback) {
  const std::string text = ReadFirstLine(path);
  if (text.empty()) return fallback;
  try {
    return std::stoi(text);
  } catch (const std::exception&) {
    return fallback;
  }
}

struct InterfaceInfo {
  std::string name;
  bool up = false;
  bool wireless = false;
  LinkType type = LinkType::kOther;
};

InterfaceInfo Inspect(const fs::path& dir) {
  InterfaceInfo info;
  info.name = dir.filename().string();

  const std::string operstate = ReadFirstLine(dir / "operstate");
  if (operstate == "up") {
    info.up = true;
  } else if (operstate == "unknown") {
    info.up = ReadInt(dir / "carrier", 0) == 1;
  }

  std::error_code ec;
  info.wireless = fs::exists(dir / "wireless", ec) || fs::exists(dir / "phy80211", ec);

  const int arp_type = ReadInt(dir / "type", -1);
  if (info.wireless) {
    info.type = LinkType::kWifi;
  } else if (info.name.rfind("wwan", 0) == 0) {
    info.type = LinkType::kCellular;
  } else if (arp_type == kArphrdEther) {
    info.type = LinkType::kEthernet;
  } else if (arp_type == kArphrdLoopback || info.name == "lo") {
    info.type = LinkType::kNone;
  }
  return info;
}

}  // namespace

std::optional<std::string> ReadSsidWithIoctl(const std::string& interface_name) {
  if (interface_name.empty() || interface_name.size() >= IFNAMSIZ) return std::nullopt;

  const int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (fd < 0) return std::nullopt;

  char essid[IW_ESSID_MAX_SIZE + 1];
  std::memset(essid, 0, sizeof(essid));

  struct iwreq request;
  std::memset(&request, 0, sizeof(request));
  std::strncpy(request.ifr_name, interface_name.c_str(), IFNAMSIZ - 1);
  request.u.essid.pointer = essid;
  request.u.essid.length = IW_ESSID_MAX_SIZE;

  const int rc = ::ioctl(fd, SIOCGIWESSID, &request);
  ::close(fd);
  if (rc < 0 || request.u.essid.length == 0) return std::nullopt;

  const size_t length = std::min<size_t>(request.u.essid.length, IW_ESSID_MAX_SIZE);
  return std::string(essid, strnlen(essid, length));
}

LinuxNetworkStatusProvider::LinuxNetworkStatusProvider(std::string sysfs_root,
                                                       SsidReader ssid_reader)
    : sysfs_root_(std::move(sysfs_root)), ssid_reader_(std::move(ssid_reader)) {}

bool LinuxNetworkStatusProvider::Query(NetworkSnapshot* out, std::string* error) {
  std::error_code ec;
  fs::directory_iterator it(sysfs_root_, ec);
  if (ec) {
    if (error) *error = "cannot read " + sysfs_root_ + ": " + ec.message();
    return false;
  }

  std::vector<InterfaceInfo> interfaces;
  // Non-throwing iteration: sysfs entries may vanish while we walk them.
  for (const fs::directory_iterator end{}; !ec && it != end; it.increment(ec)) {
    InterfaceInfo info = Inspect(it->path());
    if (info.type == LinkType::kNone) continue;
    interfaces.push_back(std::move(info));
  }
  if (ec) {
    if (error) *error = "cannot read " + sysfs_root_ + ": " + ec.message();
    return false;
  }
  std::sort(interfaces.begin(), interfaces.end(),
            [](const InterfaceInfo& a, const InterfaceInfo& b) { return a.name < b.name; });

  const InterfaceInfo* active = nullptr;
  for (const InterfaceInfo& info : interfaces) {
    if (!info.up) continue;
    if (info.wireless) {
      active = &info;
      break;
    }
    if (!active) active = &info;
  }

  *out = NetworkSnapshot{};
  if (!active) return true;

  out->connected = true;
  out->link_type = active->type;
  out->interface_name = active->name;
  if (active->wireless && ssid_reader_) {
    out->wireless_identity = ssid_reader_(active->name);
  }
  return true;
}

}  // namespace tellolink::preflight
