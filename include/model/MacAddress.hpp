#pragma once
/** @file  MacAddress.hpp
 *  @brief 48-bit IEEE 802 MAC address value type.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace apctl::model {

  class MacAddress {
  public:
    MacAddress() = default;
    explicit MacAddress(const std::array<std::uint8_t, 6>& octets) : octets_{ octets } {}

    /// Parse "aa:bb:cc:dd:ee:ff" (case-insensitive); std::nullopt if malformed.
    static std::optional<MacAddress> parse(const std::string& text);

    /// Lower-case colon separated form.
    std::string toString() const;

    const std::array<std::uint8_t, 6>& octets() const { return octets_; }

    auto operator<=>(const MacAddress&) const = default;

  private:
    std::array<std::uint8_t, 6> octets_{};
  };

} // namespace apctl::model

template <> struct std::hash<apctl::model::MacAddress> {
  std::size_t operator()(const apctl::model::MacAddress& mac) const noexcept {
    std::uint64_t packed = 0;
    for (auto octet : mac.octets())
      packed = (packed << 8) | octet;
    return std::hash<std::uint64_t>{}(packed);
  }
};
