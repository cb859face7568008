#pragma once
/** @file  Commands.hpp
 *  @brief Immutable command values consumed by SoftApStateMachine.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "model/ApConfiguration.hpp"
#include "model/ApTypes.hpp"
#include "model/Capability.hpp"

namespace apctl::core {

  /// Everything the owner supplies for one start attempt.
  struct StartRequest {
    model::DesiredConfiguration config;
    model::CapabilitySnapshot capability;
    std::string countryCode;          ///< regulatory code to run with (may be empty)
    std::string requestor;            ///< attribution for arbitration / metrics
    model::TargetMode mode{ model::TargetMode::Tethered };
    std::vector<int> stationFrequencies; ///< connected STA frequencies (MHz)
  };

  namespace cmd {
    struct Start {
      StartRequest request;
    };
    struct Stop {};
    struct Failure {
      std::optional<std::string> instance; ///< empty = whole interface
    };
    struct InterfaceStatusChanged {
      std::string iface;
      bool up{ false };
    };
    struct InterfaceDestroyed {
      std::string iface;
    };
    struct InterfaceDown {};
    struct ClientChanged {
      model::ConnectedClient client;
      bool connected{ false };
    };
    struct ApInfoChanged {
      model::InstanceInfo info;
    };
    struct UpdateCapability {
      model::CapabilitySnapshot capability;
    };
    struct UpdateConfig {
      model::DesiredConfiguration config;
    };
    struct ForceDisconnectPending {};
    struct IdleTimeout {
      std::string key;
    };
    struct InstanceIdleTimeout {
      std::string instance;
    };
    struct SafeChannelsChanged {
      std::set<int> unsafeFrequencies;
      bool restrictsSoftAp{ true };
    };
    struct StationConnected {
      int frequencyMhz{ 0 };
    };
    struct UpdateCountryCode {
      std::string code;
    };
    struct DriverCountryCodeChanged {
      std::string code;
    };
    struct CountryCodeWaitTimedOut {};
    struct PluggedStateChanged {
      bool plugged{ false };
    };
  } // namespace cmd

  using Command =
      std::variant<cmd::Start, cmd::Stop, cmd::Failure, cmd::InterfaceStatusChanged,
                   cmd::InterfaceDestroyed, cmd::InterfaceDown, cmd::ClientChanged,
                   cmd::ApInfoChanged, cmd::UpdateCapability, cmd::UpdateConfig,
                   cmd::ForceDisconnectPending, cmd::IdleTimeout, cmd::InstanceIdleTimeout,
                   cmd::SafeChannelsChanged, cmd::StationConnected, cmd::UpdateCountryCode,
                   cmd::DriverCountryCodeChanged, cmd::CountryCodeWaitTimedOut,
                   cmd::PluggedStateChanged>;

  /// "CMD_START" style name for logs.
  const char* commandName(const Command& command);

} // namespace apctl::core
