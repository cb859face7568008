#pragma once
/** @file  Capability.hpp
 *  @brief Immutable snapshot of what hardware + regulatory domain allow.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "model/Band.hpp"

namespace apctl::model {

  /**
 * @enum Feature
 * @brief Soft AP feature flags reported by the driver / carrier config.
 */
  enum class Feature : std::uint32_t {
    AcsOffload = 1u << 0,
    ClientForceDisconnect = 1u << 1,
    WpaSae = 1u << 2,
    MacAddressCustomization = 1u << 3,
    Ieee80211Ax = 1u << 4,
    Ieee80211Be = 1u << 5,
    CountryCodeOffload = 1u << 6,
    Band24GSupported = 1u << 7,
    Band5GSupported = 1u << 8,
    Band6GSupported = 1u << 9,
    Band60GSupported = 1u << 10,
  };

  constexpr std::uint32_t featureMask(Feature f) { return static_cast<std::uint32_t>(f); }

  /**
 * @struct CapabilitySnapshot
 * @brief Value type; replaced wholesale on every capability update.
 *
 *  * A band counts as supported only when its feature flag is set *and* the
 *    regulatory channel list for it is non-empty.
 */
  struct CapabilitySnapshot {
    int maxSupportedClients{ 0 };
    std::uint32_t features{ 0 };
    std::map<Band, std::vector<int>> supportedChannels; ///< single-bit band -> channels
    std::string countryCode;

    bool hasFeature(Feature f) const { return (features & featureMask(f)) != 0; }
    void setFeature(Feature f, bool on) {
      if (on)
        features |= featureMask(f);
      else
        features &= ~featureMask(f);
    }

    /// Channels for one single-bit band (empty when unknown).
    const std::vector<int>& channelsFor(Band band) const;

    /// True when every single band in \p mask is supported.
    bool supportsBand(Band mask) const;

    /// Union of the supported single bands.
    Band supportedBands() const;

    bool operator==(const CapabilitySnapshot&) const = default;
  };

  /// Feature flag guarding a single-bit band.
  Feature bandFeature(Band band);

} // namespace apctl::model
