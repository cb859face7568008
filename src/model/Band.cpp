/* @file Band.cpp
 * @brief channel/frequency arithmetic for 2.4, 5, 6 and 60 GHz
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "model/Band.hpp"

namespace apctl::model {

  namespace {
    constexpr int k24GhzChannel14Freq = 2484;
    constexpr int k24GhzStartFreq = 2407;
    constexpr int k5GhzStartFreq = 5000;
    constexpr int k6GhzChannel2Freq = 5935;
    constexpr int k6GhzStartFreq = 5950;
    constexpr int k60GhzStartFreq = 58320;
    constexpr int k60GhzChannelSpacing = 2160;
  } // namespace

  int bandCount(Band mask) {
    int count = 0;
    for (Band band : kBandTypes) {
      if (containsBand(mask, band))
        ++count;
    }
    return count;
  }

  Band lowestBand(Band mask) {
    for (Band band : kBandTypes) {
      if (containsBand(mask, band))
        return band;
    }
    return Band::None;
  }

  int channelToFrequency(int channel, Band band) {
    switch (band) {
    case Band::Ghz2:
      if (channel == 14)
        return k24GhzChannel14Freq;
      if (channel >= 1 && channel <= 13)
        return k24GhzStartFreq + 5 * channel;
      return -1;
    case Band::Ghz5:
      if (channel >= 32 && channel <= 177)
        return k5GhzStartFreq + 5 * channel;
      return -1;
    case Band::Ghz6:
      if (channel == 2)
        return k6GhzChannel2Freq;
      if (channel >= 1 && channel <= 233)
        return k6GhzStartFreq + 5 * channel;
      return -1;
    case Band::Ghz60:
      if (channel >= 1 && channel <= 6)
        return k60GhzStartFreq + k60GhzChannelSpacing * (channel - 1);
      return -1;
    default:
      return -1;
    }
  }

  Band frequencyToBand(int frequencyMhz) {
    if (frequencyMhz >= 2412 && frequencyMhz <= k24GhzChannel14Freq)
      return Band::Ghz2;
    if (frequencyMhz >= 5160 && frequencyMhz <= 5885)
      return Band::Ghz5;
    if (frequencyMhz >= k6GhzChannel2Freq && frequencyMhz <= 7115)
      return Band::Ghz6;
    if (frequencyMhz >= k60GhzStartFreq && frequencyMhz <= 70200)
      return Band::Ghz60;
    return Band::None;
  }

  int frequencyToChannel(int frequencyMhz) {
    switch (frequencyToBand(frequencyMhz)) {
    case Band::Ghz2:
      if (frequencyMhz == k24GhzChannel14Freq)
        return 14;
      return (frequencyMhz - k24GhzStartFreq) / 5;
    case Band::Ghz5:
      return (frequencyMhz - k5GhzStartFreq) / 5;
    case Band::Ghz6:
      if (frequencyMhz == k6GhzChannel2Freq)
        return 2;
      return (frequencyMhz - k6GhzStartFreq) / 5;
    case Band::Ghz60:
      return (frequencyMhz - k60GhzStartFreq) / k60GhzChannelSpacing + 1;
    default:
      return -1;
    }
  }

  std::string toString(Band band) {
    if (band == Band::None)
      return "none";
    std::string out;
    auto append = [&out](const char* name) {
      if (!out.empty())
        out += '|';
      out += name;
    };
    if (containsBand(band, Band::Ghz2))
      append("2g");
    if (containsBand(band, Band::Ghz5))
      append("5g");
    if (containsBand(band, Band::Ghz6))
      append("6g");
    if (containsBand(band, Band::Ghz60))
      append("60g");
    return out;
  }

} // namespace apctl::model
