// Repository: TelloLink
// Component: Network Status Provider Interface
// Purpose: Platform seam for link state, link type and wireless identity.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_PREFLIGHT_I_NETWORK_STATUS_PROVIDER_H_
#define TELLOLINK_PREFLIGHT_I_NETWORK_STATUS_PROVIDER_H_

#include <optional>
#include <string>

namespace tellolink::preflight {

enum class LinkType {
  kNone,
  kWifi,
  kEthernet,
  kCellular,
  kOther,
};

const char* LinkTypeName(LinkType type);

// Point-in-time view of the active link.
struct NetworkSnapshot {
  bool connected = false;
  LinkType link_type = LinkType::kNone;
  std::string interface_name;

  // nullopt when the platform does not expose the identity (privacy
  // restriction, driver without the query, no wireless link).
  std::optional<std::string> wireless_identity;
};

class INetworkStatusProvider {
 public:
  virtual ~INetworkStatusProvider() = default;

  // Fills *out. Returns false with *error set when the query itself failed.
  virtual bool Query(NetworkSnapshot* out, std::string* error) = 0;
};

}  // namespace tellolink::preflight

#endif  // TELLOLINK_PREFLIGHT_I_NETWORK_STATUS_PROVIDER_H_
