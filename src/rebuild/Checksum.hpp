#pragma once

#include <cstddef>
#include <cstdint>

namespace rebuild {

// CRC32 (IEEE 802.3 polynomial 0xEDB88320) used by the ZIP archive writer.
//
// Typical usage:
//   std::uint32_t crc = 0xFFFFFFFFu;
//   crc = Crc32Update(crc, data, size);
//   ...
//   crc ^= 0xFFFFFFFFu;
std::uint32_t Crc32Update(std::uint32_t crc, const std::uint8_t* data, std::size_t size);

// Convenience: compute a finalized CRC32 for a single buffer.
inline std::uint32_t Crc32(const std::uint8_t* data, std::size_t size)
{
  std::uint32_t crc = 0xFFFFFFFFu;
  crc = Crc32Update(crc, data, size);
  return crc ^ 0xFFFFFFFFu;
}

} // namespace rebuild
