/* @file MacAddress.cpp
 * @brief text <-> octet conversion for MAC addresses
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <cstdio>

// apctl headers
#include "model/MacAddress.hpp"

using namespace apctl::model;

namespace {
  int hexValue(char c) {
    if (c >= '0' && c <= '9')
      return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    return -1;
  }
} // namespace

std::optional<MacAddress> MacAddress::parse(const std::string& text) {
  // 6 octets * 2 hex digits + 5 separators
  if (text.size() != 17)
    return std::nullopt;

  std::array<std::uint8_t, 6> octets{};
  for (std::size_t i = 0; i < octets.size(); ++i) {
    const std::size_t pos = i * 3;
    if (i > 0 && text[pos - 1] != ':')
      return std::nullopt;
    int hi = hexValue(text[pos]);
    int lo = hexValue(text[pos + 1]);
    if (hi < 0 || lo < 0)
      return std::nullopt;
    octets[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return MacAddress{ octets };
}

std::string MacAddress::toString() const {
  char buf[18];
  std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x", octets_[0], octets_[1],
                octets_[2], octets_[3], octets_[4], octets_[5]);
  return std::string(buf);
}
