#pragma once
/** @file  ChannelResolver.hpp
 *  @brief Pure decision logic: desired config + capability -> channel plan.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <set>
#include <string>
#include <vector>

#include "core/DeviceOverlay.hpp"
#include "model/ApConfiguration.hpp"
#include "model/ApTypes.hpp"
#include "model/Capability.hpp"

namespace apctl::core {

  /// Frequencies (MHz) not excluded by coexistence restrictions.
  using SafeChannelSet = std::set<int>;

  /// Facts about other interfaces on the chip, sampled at start time.
  struct ConcurrencyContext {
    bool bridgedIfacePossible{ true };
    bool bridgedWouldDestroyExisting{ false }; ///< ...while a single AP would not
    bool staApConcurrencySupported{ false };
    std::vector<int> stationFrequencies;       ///< connected STA frequencies (MHz)
  };

  struct ResolveInputs {
    model::DesiredConfiguration desired;
    model::CapabilitySnapshot capability;
    SafeChannelSet safeChannels;
    std::string countryCode;            ///< code the AP will run with
    bool countryCodeChangePending{ false };
    ConcurrencyContext concurrency;
  };

  struct Resolution {
    model::StartResult result{ model::StartResult::Unknown };
    model::ActiveConfiguration config;

    bool ok() const { return result == model::StartResult::Success; }
  };

  /**
 * @class ChannelResolver
 * @brief Turns a desired configuration into a hardware-legal ActiveConfiguration.
 *
 *  * Stateless apart from the overlay; deterministic and idempotent.
 *  * Decides single vs bridged operation and picks concrete channels.
 */
  class ChannelResolver {
  public:
    explicit ChannelResolver(DeviceOverlay overlay);

    Resolution resolve(const ResolveInputs& in) const;

    /// Supported channel frequencies of \p bands minus coexistence-unsafe ones.
    static SafeChannelSet computeSafeChannels(model::Band bands,
                                              const model::CapabilitySnapshot& capability,
                                              const std::set<int>& coexUnsafe,
                                              bool coexRestrictsSoftAp);

    /// A single band is available when supported and at least one channel is safe.
    static bool isBandAvailable(model::Band band, const model::CapabilitySnapshot& capability,
                                const SafeChannelSet& safeChannels);

    /// False when the configuration asks for something the capability lacks.
    static bool isConfigurationSupported(const model::DesiredConfiguration& config,
                                         const model::CapabilitySnapshot& capability);

  private:
    bool removeRestrictedBands(model::DesiredConfiguration& config) const;
    bool shouldFallBackToSingle(const ResolveInputs& in) const;
    model::StartResult buildPlan(const ResolveInputs& in, model::ActiveConfiguration& out) const;

    DeviceOverlay overlay_;
  };

} // namespace apctl::core
