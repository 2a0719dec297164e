#ifndef LITTLE_ENDIAN_H
#define LITTLE_ENDIAN_H

#include <cstddef>
#include <cstdint>
#include <span>

namespace fatVolume {

// All multi-byte FAT fields are little-endian on disk, independent of the
// host byte order. These helpers assemble them byte by byte so that no
// unaligned or aliased access is ever made.

inline uint16_t readLe16(std::span<const std::byte> bytes, size_t offset) {
  return static_cast<uint16_t>(
      std::to_integer<uint16_t>(bytes[offset]) |
      (std::to_integer<uint16_t>(bytes[offset + 1]) << 8));
}

inline uint32_t readLe32(std::span<const std::byte> bytes, size_t offset) {
  return std::to_integer<uint32_t>(bytes[offset]) |
         (std::to_integer<uint32_t>(bytes[offset + 1]) << 8) |
         (std::to_integer<uint32_t>(bytes[offset + 2]) << 16) |
         (std::to_integer<uint32_t>(bytes[offset + 3]) << 24);
}

inline void writeLe16(std::span<std::byte> bytes, size_t offset,
                      uint16_t value) {
  bytes[offset] = static_cast<std::byte>(value & 0xFF);
  bytes[offset + 1] = static_cast<std::byte>(value >> 8);
}

inline void writeLe32(std::span<std::byte> bytes, size_t offset,
                      uint32_t value) {
  bytes[offset] = static_cast<std::byte>(value & 0xFF);
  bytes[offset + 1] = static_cast<std::byte>((value >> 8) & 0xFF);
  bytes[offset + 2] = static_cast<std::byte>((value >> 16) & 0xFF);
  bytes[offset + 3] = static_cast<std::byte>(value >> 24);
}

}  // namespace fatVolume

#endif  // LITTLE_ENDIAN_H
