#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace storyflow {

// Raw 20-byte SHA-1 digest (binary, not hex)
using digest = std::array<std::uint8_t, 20>;

/**
 * Compute SHA-1 of arbitrary bytes.
 * Used to derive stable, filesystem-safe names from arbitrary paths
 * (e.g. the provisioning lock of a workspace directory).
 */
digest sha1(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline digest sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Convert a binary digest to 40-char lowercase hex. */
std::string to_hex(const digest &d);

/** CRC-32 of a byte string, as 8 lowercase hex chars. */
std::string crc32_hex(std::string_view data);

} // namespace storyflow
