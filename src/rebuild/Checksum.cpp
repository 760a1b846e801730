#include "rebuild/Checksum.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace rebuild {

namespace {

std::array<std::uint32_t, 256> BuildCrc32Table()
{
  std::array<std::uint32_t, 256> table{};
  for (std::uint32_t i = 0; i < 256; ++i) {
    std::uint32_t c = i;
    for (int bit = 0; bit < 8; ++bit) {
      c = (c & 1u) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
    }
    table[i] = c;
  }
  return table;
}

// Function-local static: initialization is thread-safe, pipelines may export
// archives from worker threads.
const std::array<std::uint32_t, 256>& Crc32Table()
{
  static const std::array<std::uint32_t, 256> table = BuildCrc32Table();
  return table;
}

} // namespace

std::uint32_t Crc32Update(std::uint32_t crc, const std::uint8_t* data, std::size_t size)
{
  if (!data || size == 0) return crc;
  const std::array<std::uint32_t, 256>& table = Crc32Table();
  for (std::size_t i = 0; i < size; ++i) {
    crc = table[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
  }
  return crc;
}

} // namespace rebuild
