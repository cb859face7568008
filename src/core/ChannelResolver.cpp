/* @file ChannelResolver.cpp
 * @brief band exclusion, single/bridged fallback and channel selection
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <optional>

// apctl headers
#include "core/ChannelResolver.hpp"

using namespace apctl::core;
using apctl::model::ActiveConfiguration;
using apctl::model::Band;
using apctl::model::BandRequest;
using apctl::model::CapabilitySnapshot;
using apctl::model::ChannelPlanEntry;
using apctl::model::DesiredConfiguration;
using apctl::model::Feature;
using apctl::model::SecurityType;
using apctl::model::StartResult;

ChannelResolver::ChannelResolver(DeviceOverlay overlay) : overlay_(std::move(overlay)) {}

SafeChannelSet ChannelResolver::computeSafeChannels(Band bands,
                                                    const CapabilitySnapshot& capability,
                                                    const std::set<int>& coexUnsafe,
                                                    bool coexRestrictsSoftAp) {
  SafeChannelSet safe;
  for (Band band : model::kBandTypes) {
    if (!model::containsBand(bands, band))
      continue;
    for (int channel : capability.channelsFor(band)) {
      int freq = model::channelToFrequency(channel, band);
      if (freq > 0)
        safe.insert(freq);
    }
  }
  if (coexRestrictsSoftAp) {
    for (int freq : coexUnsafe)
      safe.erase(freq);
  }
  return safe;
}

bool ChannelResolver::isBandAvailable(Band band, const CapabilitySnapshot& capability,
                                      const SafeChannelSet& safeChannels) {
  if (!capability.supportsBand(band))
    return false;
  const auto& channels = capability.channelsFor(band);
  return std::any_of(channels.begin(), channels.end(), [&](int channel) {
    return safeChannels.count(model::channelToFrequency(channel, band)) != 0;
  });
}

bool ChannelResolver::isConfigurationSupported(const DesiredConfiguration& config,
                                               const CapabilitySnapshot& capability) {
  if (!capability.hasFeature(Feature::ClientForceDisconnect) &&
      (config.maxClients != 0 || config.clientControlByUser || !config.blockedClients.empty()))
    return false;

  if ((config.securityType == SecurityType::Wpa3Sae ||
       config.securityType == SecurityType::Wpa3SaeTransition) &&
      !capability.hasFeature(Feature::WpaSae))
    return false;

  Band requested = config.bandUnion();
  if (model::containsBand(requested, Band::Ghz6) &&
      !capability.hasFeature(Feature::Band6GSupported))
    return false;
  if (model::containsBand(requested, Band::Ghz60) &&
      !capability.hasFeature(Feature::Band60GSupported))
    return false;
  return true;
}

bool ChannelResolver::removeRestrictedBands(DesiredConfiguration& config) const {
  if (overlay_.securityTypesRestrictedOn6g.count(config.securityType) == 0)
    return true;

  std::vector<BandRequest> kept;
  for (auto request : config.bands) {
    request.band &= ~Band::Ghz6;
    if (request.band != Band::None)
      kept.push_back(request);
  }
  config.bands = std::move(kept);
  return !config.bands.empty();
}

bool ChannelResolver::shouldFallBackToSingle(const ResolveInputs& in) const {
  const auto& cc = in.concurrency;
  if (!cc.stationFrequencies.empty() && cc.staApConcurrencySupported) {
    if (!overlay_.staWithBridgedApSupported)
      return true;
    for (int freq : cc.stationFrequencies) {
      if (freq > 0 && in.safeChannels.count(freq) == 0)
        return true;
    }
  }
  if (in.countryCodeChangePending && in.countryCode == overlay_.worldModeCountryCode)
    return true;
  if (!cc.bridgedIfacePossible)
    return true;
  return cc.bridgedWouldDestroyExisting;
}

StartResult ChannelResolver::buildPlan(const ResolveInputs& in, ActiveConfiguration& out) const {
  const auto& capability = in.capability;
  const bool acsOffload = capability.hasFeature(Feature::AcsOffload);

  out.plan.clear();
  for (const auto& request : out.settings.bands) {
    if (request.channel != 0) {
      // fixed channel: must be legal on one of the leg's bands
      Band match = Band::None;
      for (Band band : model::kBandTypes) {
        if (!model::containsBand(request.band, band) || !capability.supportsBand(band))
          continue;
        const auto& channels = capability.channelsFor(band);
        if (std::find(channels.begin(), channels.end(), request.channel) != channels.end()) {
          match = band;
          break;
        }
      }
      if (match == Band::None)
        return StartResult::FailureNoChannel;
      out.plan.push_back(ChannelPlanEntry{ match, request.channel });
      continue;
    }

    if (acsOffload) {
      // the driver picks the channel, but only among bands the radio supports
      const Band usable = request.band & capability.supportedBands();
      if (usable == Band::None)
        return StartResult::FailureNoChannel;
      out.plan.push_back(ChannelPlanEntry{ usable, 0 });
      continue;
    }

    std::optional<ChannelPlanEntry> chosen;
    for (Band band : model::kBandTypes) {
      if (chosen || !model::containsBand(request.band, band) || !capability.supportsBand(band))
        continue;
      auto channels = capability.channelsFor(band);
      std::sort(channels.begin(), channels.end());
      for (int channel : channels) {
        if (in.safeChannels.count(model::channelToFrequency(channel, band)) != 0) {
          chosen = ChannelPlanEntry{ band, channel };
          break;
        }
      }
    }
    if (!chosen)
      return StartResult::FailureNoChannel;
    out.plan.push_back(*chosen);
  }
  return StartResult::Success;
}

Resolution ChannelResolver::resolve(const ResolveInputs& in) const {
  Resolution out;
  out.config.settings = in.desired;
  out.config.requestedBands = in.desired.bandUnion();
  auto& settings = out.config.settings;

  if (!isConfigurationSupported(settings, in.capability)) {
    out.result = StartResult::FailureUnsupportedConfig;
    return out;
  }

  // (1) security driven exclusions
  if (!removeRestrictedBands(settings)) {
    out.result = StartResult::FailureUnsupportedConfig;
    return out;
  }

  // (2)/(3) bridged feasibility
  if (settings.isBridged()) {
    bool fallback = shouldFallBackToSingle(in);

    std::vector<BandRequest> available;
    for (auto request : settings.bands) {
      Band usable = Band::None;
      for (Band band : model::kBandTypes) {
        if (model::containsBand(request.band, band) &&
            isBandAvailable(band, in.capability, in.safeChannels))
          usable |= band;
      }
      if (usable == Band::None)
        continue;
      request.band = usable;
      available.push_back(request);
    }
    if (available.empty()) {
      out.result = StartResult::FailureUnsupportedConfig;
      return out;
    }
    settings.bands = std::move(available);
    if (settings.bands.size() == 1)
      fallback = true;

    if (fallback) {
      Band single = settings.bandUnion();
      if (overlay_.appendLowerBandOnFallback && in.capability.supportsBand(Band::Ghz2))
        single |= Band::Ghz2;
      settings.bands = { BandRequest{ single, 0 } };
      out.config.fellBackToSingle = true;
    }
  }

  if (settings.ieee80211beEnabled && !in.capability.hasFeature(Feature::Ieee80211Be))
    settings.ieee80211beEnabled = false;

  // (4) channel plan honouring the (possibly fallen back) band preference
  out.result = buildPlan(in, out.config);
  return out;
}
