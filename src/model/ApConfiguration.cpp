/* @file ApConfiguration.cpp
 * @brief helpers on desired/active configuration values
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "model/ApConfiguration.hpp"

namespace apctl::model {

  const char* toString(SecurityType type) {
    switch (type) {
    case SecurityType::Open:
      return "open";
    case SecurityType::Wpa2Psk:
      return "wpa2-psk";
    case SecurityType::Wpa3SaeTransition:
      return "wpa3-sae-transition";
    case SecurityType::Wpa3Sae:
      return "wpa3-sae";
    case SecurityType::Wpa3OweTransition:
      return "wpa3-owe-transition";
    case SecurityType::Wpa3Owe:
      return "wpa3-owe";
    default:
      return "unknown";
    }
  }

  Band DesiredConfiguration::bandUnion() const {
    Band out = Band::None;
    for (const auto& request : bands)
      out |= request.band;
    return out;
  }

  Band ActiveConfiguration::band() const {
    Band out = Band::None;
    for (const auto& entry : plan)
      out |= entry.band;
    return out;
  }

  bool requiresRestart(const DesiredConfiguration& current, const DesiredConfiguration& next) {
    // Client lists, client limit and shutdown policy are the only in-place fields.
    return current.ssid != next.ssid || current.bssid != next.bssid ||
           current.passphrase != next.passphrase || current.securityType != next.securityType ||
           current.hiddenSsid != next.hiddenSsid || current.bands != next.bands ||
           current.ieee80211beEnabled != next.ieee80211beEnabled ||
           current.vendorData != next.vendorData;
  }

} // namespace apctl::model
