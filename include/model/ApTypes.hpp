#pragma once
/** @file  ApTypes.hpp
 *  @brief Runtime facts (instances, clients) and the result/state taxonomy.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "model/MacAddress.hpp"

namespace apctl::model {

  /// Externally visible AP state (values follow the platform's AP state codes).
  enum class ApState : std::uint8_t {
    Disabling = 10,
    Disabled = 11,
    Enabling = 12,
    Enabled = 13,
    Failed = 14,
  };

  /// Failure reason attached to ApState::Failed.
  enum class FailureReason : std::uint8_t {
    None,
    General,
    NoChannel,
    UnsupportedConfiguration,
    UserRejected,
  };

  /// Outcome of one start attempt. Exactly one is reported per attempt.
  enum class StartResult : std::uint8_t {
    Unknown,
    Success,
    FailureGeneral,
    FailureNoChannel,
    FailureUnsupportedConfig,
    FailureStartHal,
    FailureStartHostapd,
    FailureInterfaceConflictUserRejected,
    FailureInterfaceConflict,
    FailureCreateInterface,
    FailureSetCountryCode,
    FailureSetMacAddress,
    FailureRegisterApCallbackHostapd,
    FailureRegisterApCallbackWificond,
    FailureAddApHostapd,
  };

  /// Why a running AP stopped.
  enum class StopEvent : std::uint8_t {
    Unknown,
    Stopped,
    InterfaceDown,
    InterfaceDestroyed,
    HostapdFailure,
    NoUsageTimeout,
  };

  /// Reason code sent with a forced client disconnect.
  enum class BlockReason : std::uint8_t {
    Unspecified = 0,
    BlockedByUser = 1,
    NoMoreStations = 2,
  };

  enum class Bandwidth : std::uint8_t { Invalid, Mhz20NoHt, Mhz20, Mhz40, Mhz80, Mhz80Plus80, Mhz160, Mhz320 };

  enum class WifiStandard : std::uint8_t { Unknown, Legacy, N11, Ac11, Ax11, Ad11, Be11 };

  /// Where an AP is used: shared with a tethering upstream or local only.
  enum class TargetMode : std::uint8_t { Tethered, LocalOnly };

  /**
 * @struct InstanceInfo
 * @brief Facts about one single-band leg reported by the driver.
 */
  struct InstanceInfo {
    std::string instance;
    int frequencyMhz{ 0 };
    Bandwidth bandwidth{ Bandwidth::Invalid };
    WifiStandard standard{ WifiStandard::Unknown };
    std::optional<MacAddress> bssid;
    std::chrono::milliseconds autoShutdownTimeout{ 0 }; ///< advertised to owner

    bool operator==(const InstanceInfo&) const = default;
  };

  /// An associated station: MAC plus the instance it joined.
  struct ConnectedClient {
    MacAddress mac;
    std::string instance;

    auto operator<=>(const ConnectedClient&) const = default;
  };

  using InstanceInfoMap = std::map<std::string, InstanceInfo>;
  using ClientMap = std::map<std::string, std::vector<ConnectedClient>>;

  inline const char* toString(ApState s) {
    switch (s) {
    case ApState::Disabling:
      return "DISABLING";
    case ApState::Disabled:
      return "DISABLED";
    case ApState::Enabling:
      return "ENABLING";
    case ApState::Enabled:
      return "ENABLED";
    case ApState::Failed:
      return "FAILED";
    default:
      return "Unknown";
    }
  }

  inline const char* toString(StartResult r) {
    switch (r) {
    case StartResult::Success:
      return "SUCCESS";
    case StartResult::FailureGeneral:
      return "FAILURE_GENERAL";
    case StartResult::FailureNoChannel:
      return "FAILURE_NO_CHANNEL";
    case StartResult::FailureUnsupportedConfig:
      return "FAILURE_UNSUPPORTED_CONFIG";
    case StartResult::FailureStartHal:
      return "FAILURE_START_HAL";
    case StartResult::FailureStartHostapd:
      return "FAILURE_START_HOSTAPD";
    case StartResult::FailureInterfaceConflictUserRejected:
      return "FAILURE_INTERFACE_CONFLICT_USER_REJECTED";
    case StartResult::FailureInterfaceConflict:
      return "FAILURE_INTERFACE_CONFLICT";
    case StartResult::FailureCreateInterface:
      return "FAILURE_CREATE_INTERFACE";
    case StartResult::FailureSetCountryCode:
      return "FAILURE_SET_COUNTRY_CODE";
    case StartResult::FailureSetMacAddress:
      return "FAILURE_SET_MAC_ADDRESS";
    case StartResult::FailureRegisterApCallbackHostapd:
      return "FAILURE_REGISTER_AP_CALLBACK_HOSTAPD";
    case StartResult::FailureRegisterApCallbackWificond:
      return "FAILURE_REGISTER_AP_CALLBACK_WIFICOND";
    case StartResult::FailureAddApHostapd:
      return "FAILURE_ADD_AP_HOSTAPD";
    default:
      return "UNKNOWN";
    }
  }

  inline const char* toString(StopEvent e) {
    switch (e) {
    case StopEvent::Stopped:
      return "STOPPED";
    case StopEvent::InterfaceDown:
      return "INTERFACE_DOWN";
    case StopEvent::InterfaceDestroyed:
      return "INTERFACE_DESTROYED";
    case StopEvent::HostapdFailure:
      return "HOSTAPD_FAILURE";
    case StopEvent::NoUsageTimeout:
      return "NO_USAGE_TIMEOUT";
    default:
      return "UNKNOWN";
    }
  }

  /// Owner-facing failure reason for a start result.
  inline FailureReason toFailureReason(StartResult r) {
    switch (r) {
    case StartResult::FailureNoChannel:
      return FailureReason::NoChannel;
    case StartResult::FailureUnsupportedConfig:
      return FailureReason::UnsupportedConfiguration;
    case StartResult::FailureInterfaceConflictUserRejected:
      return FailureReason::UserRejected;
    default:
      return FailureReason::General;
    }
  }

} // namespace apctl::model
