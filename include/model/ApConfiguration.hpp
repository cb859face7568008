#pragma once
/** @file  ApConfiguration.hpp
 *  @brief Desired (operator-requested) and active (resolved) soft AP settings.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "model/Band.hpp"
#include "model/MacAddress.hpp"

namespace apctl::model {

  enum class SecurityType : std::uint8_t {
    Open,
    Wpa2Psk,
    Wpa3SaeTransition,
    Wpa3Sae,
    Wpa3OweTransition,
    Wpa3Owe,
  };

  const char* toString(SecurityType type);

  /// One requested AP leg: a band bitmask and an optional fixed channel (0 = any).
  struct BandRequest {
    Band band{ Band::Ghz2 };
    int channel{ 0 };

    bool operator==(const BandRequest&) const = default;
  };

  /// Vendor-specific element keyed by OUI, passed through to the driver untouched.
  struct VendorElement {
    std::uint32_t oui{ 0 };
    std::string payload;

    bool operator==(const VendorElement&) const = default;
  };

  using VendorData = std::vector<VendorElement>;

  /**
 * @struct DesiredConfiguration
 * @brief Operator-requested settings. Immutable per update; replaced wholesale.
 *
 *  * More than one `bands` entry requests a bridged (dual instance) AP.
 *  * Zero timeouts mean "use the device default".
 */
  struct DesiredConfiguration {
    std::string ssid;
    std::optional<MacAddress> bssid;
    std::string passphrase;
    SecurityType securityType{ SecurityType::Wpa2Psk };
    bool hiddenSsid{ false };
    std::vector<BandRequest> bands{ BandRequest{} };

    int maxClients{ 0 }; ///< 0 = hardware limit only
    std::set<MacAddress> allowedClients;
    std::set<MacAddress> blockedClients;
    bool clientControlByUser{ false };

    bool autoShutdownEnabled{ true };
    std::chrono::milliseconds shutdownTimeout{ 0 };
    bool bridgedOpportunisticShutdownEnabled{ true };
    std::chrono::milliseconds bridgedOpportunisticShutdownTimeout{ 0 };

    bool ieee80211beEnabled{ true };
    VendorData vendorData;

    bool isBridged() const { return bands.size() > 1; }

    /// Union of every requested leg's band bits.
    Band bandUnion() const;

    bool operator==(const DesiredConfiguration&) const = default;
  };

  /// True when moving from \p current to \p next cannot be applied in place.
  bool requiresRestart(const DesiredConfiguration& current, const DesiredConfiguration& next);

  /// A concrete leg of the channel plan handed to the driver.
  struct ChannelPlanEntry {
    Band band{ Band::Ghz2 };
    int channel{ 0 }; ///< 0 = driver (ACS) chooses

    bool operator==(const ChannelPlanEntry&) const = default;
  };

  /**
 * @struct ActiveConfiguration
 * @brief Configuration actually in effect after band/channel resolution.
 */
  struct ActiveConfiguration {
    DesiredConfiguration settings;       ///< desired config with resolved bands
    std::vector<ChannelPlanEntry> plan;  ///< one entry per AP leg
    Band requestedBands{ Band::None };   ///< union of the originally requested bands
    bool fellBackToSingle{ false };

    bool isBridged() const { return plan.size() > 1; }

    /// Bridge interface needed for multi-leg plans and OWE transition networks.
    bool isBridgeRequired() const {
      return isBridged() || settings.securityType == SecurityType::Wpa3OweTransition;
    }

    /// Union of the plan's band bits.
    Band band() const;

    bool operator==(const ActiveConfiguration&) const = default;
  };

} // namespace apctl::model
