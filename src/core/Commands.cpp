/* @file Commands.cpp
 * @brief log names for command values
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>

// apctl headers
#include "core/Commands.hpp"

namespace {
  // same order as the Command alternatives
  constexpr std::array<const char*, std::variant_size_v<apctl::core::Command>> kCommandNames{
    "CMD_START",
    "CMD_STOP",
    "CMD_FAILURE",
    "CMD_INTERFACE_STATUS_CHANGED",
    "CMD_INTERFACE_DESTROYED",
    "CMD_INTERFACE_DOWN",
    "CMD_ASSOCIATED_STATIONS_CHANGED",
    "CMD_AP_INFO_CHANGED",
    "CMD_UPDATE_CAPABILITY",
    "CMD_UPDATE_CONFIG",
    "CMD_FORCE_DISCONNECT_PENDING_CLIENTS",
    "CMD_NO_ASSOCIATED_STATIONS_TIMEOUT",
    "CMD_NO_ASSOCIATED_STATIONS_TIMEOUT_ON_ONE_INSTANCE",
    "CMD_SAFE_CHANNEL_FREQUENCY_CHANGED",
    "CMD_HANDLE_WIFI_CONNECTED",
    "CMD_UPDATE_COUNTRY_CODE",
    "CMD_DRIVER_COUNTRY_CODE_CHANGED",
    "CMD_DRIVER_COUNTRY_CODE_CHANGE_TIMED_OUT",
    "CMD_PLUGGED_STATE_CHANGED",
  };
} // namespace

const char* apctl::core::commandName(const Command& command) {
  return kCommandNames[command.index()];
}
