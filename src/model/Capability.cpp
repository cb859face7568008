/* @file Capability.cpp
 * @brief band support queries on the capability snapshot
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "model/Capability.hpp"

namespace apctl::model {

  Feature bandFeature(Band band) {
    switch (band) {
    case Band::Ghz5:
      return Feature::Band5GSupported;
    case Band::Ghz6:
      return Feature::Band6GSupported;
    case Band::Ghz60:
      return Feature::Band60GSupported;
    case Band::Ghz2:
    default:
      return Feature::Band24GSupported;
    }
  }

  const std::vector<int>& CapabilitySnapshot::channelsFor(Band band) const {
    static const std::vector<int> kEmpty;
    auto it = supportedChannels.find(band);
    return it == supportedChannels.end() ? kEmpty : it->second;
  }

  bool CapabilitySnapshot::supportsBand(Band mask) const {
    if (mask == Band::None)
      return false;
    for (Band band : kBandTypes) {
      if (!containsBand(mask, band))
        continue;
      if (!hasFeature(bandFeature(band)) || channelsFor(band).empty())
        return false;
    }
    return true;
  }

  Band CapabilitySnapshot::supportedBands() const {
    Band out = Band::None;
    for (Band band : kBandTypes) {
      if (supportsBand(band))
        out |= band;
    }
    return out;
  }

} // namespace apctl::model
