#pragma once
/** @file  Band.hpp
 *  @brief Radio band bitmask plus channel <-> frequency conversion helpers.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <cstdint>
#include <string>

namespace apctl::model {

  /**
 * @enum Band
 * @brief Bitmask of radio bands. A single soft AP leg may carry more than one
 *        bit (e.g. 2.4 GHz | 5 GHz lets the driver choose).
 */
  enum class Band : std::uint8_t {
    None = 0,
    Ghz2 = 1 << 0,
    Ghz5 = 1 << 1,
    Ghz6 = 1 << 2,
    Ghz60 = 1 << 3,
  };

  /// Single-bit bands in ascending frequency order.
  inline constexpr std::array<Band, 4> kBandTypes{ Band::Ghz2, Band::Ghz5, Band::Ghz6,
                                                   Band::Ghz60 };

  constexpr Band operator|(Band a, Band b) {
    return static_cast<Band>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
  }
  constexpr Band operator&(Band a, Band b) {
    return static_cast<Band>(static_cast<std::uint8_t>(a) & static_cast<std::uint8_t>(b));
  }
  constexpr Band operator~(Band a) {
    return static_cast<Band>(~static_cast<std::uint8_t>(a) & 0x0F);
  }
  inline Band& operator|=(Band& a, Band b) { return a = a | b; }
  inline Band& operator&=(Band& a, Band b) { return a = a & b; }

  /// True when \p mask has any bit of \p band set.
  constexpr bool containsBand(Band mask, Band band) { return (mask & band) != Band::None; }

  /// Number of single bands set in \p mask.
  int bandCount(Band mask);

  /// Lowest single band in \p mask (Band::None if empty).
  Band lowestBand(Band mask);

  /// Convert a channel number to its centre frequency in MHz (-1 if invalid).
  int channelToFrequency(int channel, Band band);

  /// Convert a centre frequency in MHz to a channel number (-1 if unknown).
  int frequencyToChannel(int frequencyMhz);

  /// Band containing \p frequencyMhz (Band::None if out of every band).
  Band frequencyToBand(int frequencyMhz);

  /// "2g|5g" style representation for logs.
  std::string toString(Band band);

} // namespace apctl::model
