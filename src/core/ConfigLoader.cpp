/* @file ConfigLoader.cpp
 * @brief JSON -> model mapping for configuration, capability and overlay files
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <chrono>
#include <fstream>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

// nlohmann headers
#include <nlohmann/json.hpp>

// apctl headers
#include "core/ConfigLoader.hpp"

using namespace apctl::core;
using apctl::model::Band;
using apctl::model::CapabilitySnapshot;
using apctl::model::DesiredConfiguration;
using apctl::model::Feature;
using apctl::model::MacAddress;
using apctl::model::SecurityType;
using json = nlohmann::json;

namespace {

  struct FeatureName {
    const char* name;
    Feature feature;
  };

  constexpr std::array<FeatureName, 11> kFeatureNames{ {
      { "ACS_OFFLOAD", Feature::AcsOffload },
      { "CLIENT_FORCE_DISCONNECT", Feature::ClientForceDisconnect },
      { "WPA3_SAE", Feature::WpaSae },
      { "MAC_ADDRESS_CUSTOMIZATION", Feature::MacAddressCustomization },
      { "IEEE80211_AX", Feature::Ieee80211Ax },
      { "IEEE80211_BE", Feature::Ieee80211Be },
      { "COUNTRY_CODE_OFFLOAD", Feature::CountryCodeOffload },
      { "BAND_24G_SUPPORTED", Feature::Band24GSupported },
      { "BAND_5G_SUPPORTED", Feature::Band5GSupported },
      { "BAND_6G_SUPPORTED", Feature::Band6GSupported },
      { "BAND_60G_SUPPORTED", Feature::Band60GSupported },
  } };

  MacAddress parseMac(const std::string& text) {
    auto mac = MacAddress::parse(text);
    if (!mac)
      throw std::runtime_error("[ConfigLoader] malformed MAC address: " + text);
    return *mac;
  }

  std::set<MacAddress> parseMacList(const json& list) {
    std::set<MacAddress> out;
    for (const auto& entry : list)
      out.insert(parseMac(entry.get<std::string>()));
    return out;
  }

  std::chrono::milliseconds millis(const json& j, const char* key,
                                   std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds{ j.value(key, static_cast<long long>(fallback.count())) };
  }

  /// Run \p fn and re-throw library errors with the loader's prefix.
  template <typename Fn> auto guarded(const char* what, Fn&& fn) -> decltype(fn()) {
    try {
      return fn();
    } catch (const json::exception& e) {
      throw std::runtime_error(std::string("[ConfigLoader] invalid ") + what + ": " + e.what());
    }
  }

} // namespace

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);
  try {
    return json::parse(in);
  } catch (const json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] parse error in " + path_ + ": " + e.what());
  }
}

DesiredConfiguration ConfigLoader::loadDesiredConfiguration() const {
  return parseDesiredConfiguration(load());
}

CapabilitySnapshot ConfigLoader::loadCapability() const { return parseCapability(load()); }

DeviceOverlay ConfigLoader::loadOverlay() const { return parseOverlay(load()); }

//---enum parsing--------------------------------------------------------------

Band ConfigLoader::parseBand(const std::string& text) {
  Band out = Band::None;
  std::size_t begin = 0;
  while (begin <= text.size()) {
    std::size_t end = text.find('|', begin);
    if (end == std::string::npos)
      end = text.size();
    const std::string token = text.substr(begin, end - begin);
    if (token == "2g")
      out |= Band::Ghz2;
    else if (token == "5g")
      out |= Band::Ghz5;
    else if (token == "6g")
      out |= Band::Ghz6;
    else if (token == "60g")
      out |= Band::Ghz60;
    else
      throw std::runtime_error("[ConfigLoader] unknown band: " + text);
    begin = end + 1;
  }
  return out;
}

SecurityType ConfigLoader::parseSecurityType(const std::string& text) {
  for (auto type : { SecurityType::Open, SecurityType::Wpa2Psk, SecurityType::Wpa3SaeTransition,
                     SecurityType::Wpa3Sae, SecurityType::Wpa3OweTransition,
                     SecurityType::Wpa3Owe }) {
    if (text == model::toString(type))
      return type;
  }
  throw std::runtime_error("[ConfigLoader] unknown security type: " + text);
}

Feature ConfigLoader::parseFeature(const std::string& text) {
  for (const auto& entry : kFeatureNames) {
    if (text == entry.name)
      return entry.feature;
  }
  throw std::runtime_error("[ConfigLoader] unknown feature: " + text);
}

//---documents-----------------------------------------------------------------

DesiredConfiguration ConfigLoader::parseDesiredConfiguration(const json& j) {
  return guarded("soft AP configuration", [&j] {
    DesiredConfiguration config;
    config.ssid = j.value("ssid", config.ssid);
    if (j.contains("bssid") && !j.at("bssid").is_null())
      config.bssid = parseMac(j.at("bssid").get<std::string>());
    config.passphrase = j.value("passphrase", config.passphrase);
    if (j.contains("securityType"))
      config.securityType = parseSecurityType(j.at("securityType").get<std::string>());
    config.hiddenSsid = j.value("hiddenSsid", config.hiddenSsid);

    if (j.contains("bands")) {
      config.bands.clear();
      for (const auto& entry : j.at("bands")) {
        model::BandRequest request;
        request.band = parseBand(entry.at("band").get<std::string>());
        request.channel = entry.value("channel", 0);
        config.bands.push_back(request);
      }
      if (config.bands.empty())
        throw std::runtime_error("[ConfigLoader] bands must not be empty");
    }

    config.maxClients = j.value("maxClients", config.maxClients);
    if (j.contains("allowedClients"))
      config.allowedClients = parseMacList(j.at("allowedClients"));
    if (j.contains("blockedClients"))
      config.blockedClients = parseMacList(j.at("blockedClients"));
    config.clientControlByUser = j.value("clientControlByUser", config.clientControlByUser);

    config.autoShutdownEnabled = j.value("autoShutdownEnabled", config.autoShutdownEnabled);
    config.shutdownTimeout = millis(j, "shutdownTimeoutMs", config.shutdownTimeout);
    config.bridgedOpportunisticShutdownEnabled = j.value(
        "bridgedOpportunisticShutdownEnabled", config.bridgedOpportunisticShutdownEnabled);
    config.bridgedOpportunisticShutdownTimeout = millis(
        j, "bridgedOpportunisticShutdownTimeoutMs", config.bridgedOpportunisticShutdownTimeout);
    config.ieee80211beEnabled = j.value("ieee80211beEnabled", config.ieee80211beEnabled);

    if (j.contains("vendorData")) {
      for (const auto& entry : j.at("vendorData")) {
        model::VendorElement element;
        element.oui = entry.at("oui").get<std::uint32_t>();
        element.payload = entry.value("payload", std::string{});
        config.vendorData.push_back(std::move(element));
      }
    }
    return config;
  });
}

CapabilitySnapshot ConfigLoader::parseCapability(const json& j) {
  return guarded("capability", [&j] {
    CapabilitySnapshot capability;
    capability.maxSupportedClients = j.value("maxSupportedClients", 0);
    capability.countryCode = j.value("countryCode", std::string{});
    if (j.contains("features")) {
      for (const auto& name : j.at("features"))
        capability.setFeature(parseFeature(name.get<std::string>()), true);
    }
    if (j.contains("channels")) {
      for (const auto& item : j.at("channels").items()) {
        const std::string bandName = item.key();
        const Band band = parseBand(bandName);
        if (model::bandCount(band) != 1)
          throw std::runtime_error("[ConfigLoader] channel list needs a single band: " +
                                   bandName);
        capability.supportedChannels[band] = item.value().get<std::vector<int>>();
      }
    }
    return capability;
  });
}

DeviceOverlay ConfigLoader::parseOverlay(const json& j) {
  return guarded("device overlay", [&j] {
    DeviceOverlay overlay;
    overlay.defaultShutdownTimeout =
        millis(j, "defaultShutdownTimeoutMs", overlay.defaultShutdownTimeout);
    overlay.defaultBridgedInstanceShutdownTimeout = millis(
        j, "defaultBridgedInstanceShutdownTimeoutMs", overlay.defaultBridgedInstanceShutdownTimeout);
    overlay.disableBridgedIdleShutdownWhenPlugged = j.value(
        "disableBridgedIdleShutdownWhenPlugged", overlay.disableBridgedIdleShutdownWhenPlugged);
    overlay.staWithBridgedApSupported =
        j.value("staWithBridgedApSupported", overlay.staWithBridgedApSupported);
    overlay.dynamicCountryCodeSupported =
        j.value("dynamicCountryCodeSupported", overlay.dynamicCountryCodeSupported);
    overlay.appendLowerBandOnFallback =
        j.value("appendLowerBandOnFallback", overlay.appendLowerBandOnFallback);
    overlay.worldModeCountryCode = j.value("worldModeCountryCode", overlay.worldModeCountryCode);
    if (j.contains("securityTypesRestrictedOn6g")) {
      overlay.securityTypesRestrictedOn6g.clear();
      for (const auto& name : j.at("securityTypesRestrictedOn6g"))
        overlay.securityTypesRestrictedOn6g.insert(parseSecurityType(name.get<std::string>()));
    }
    return overlay;
  });
}
