#pragma once
/** @file  DeviceOverlay.hpp
 *  @brief Static per-device tunables (loaded once from the overlay JSON).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <set>
#include <string>

#include "model/ApConfiguration.hpp"

namespace apctl::core {

  /**
 * @struct DeviceOverlay
 * @brief Board/vendor defaults the state machine falls back on.
 *
 *  * Read-only after construction of the state machine.
 *  * Defaults match a stock handset build.
 */
  struct DeviceOverlay {
    std::chrono::milliseconds defaultShutdownTimeout{ 600'000 };
    std::chrono::milliseconds defaultBridgedInstanceShutdownTimeout{ 300'000 };
    bool disableBridgedIdleShutdownWhenPlugged{ false };
    bool staWithBridgedApSupported{ false };
    bool dynamicCountryCodeSupported{ false };
    bool appendLowerBandOnFallback{ false }; ///< add 2.4 GHz to a single-AP fallback band
    std::string worldModeCountryCode{ "00" };
    std::set<model::SecurityType> securityTypesRestrictedOn6g{
      model::SecurityType::Open, model::SecurityType::Wpa2Psk,
      model::SecurityType::Wpa3SaeTransition, model::SecurityType::Wpa3OweTransition
    };
  };

} // namespace apctl::core
