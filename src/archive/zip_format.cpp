#include "archive/zip_format.hpp"

#include <array>

namespace modforge::archive {

namespace {

const std::array<std::uint32_t, 256>& Crc32Table() {
  static const std::array<std::uint32_t, 256> table = [] {
    std::array<std::uint32_t, 256> generated{};
    for (std::uint32_t i = 0; i < 256U; ++i) {
      std::uint32_t c = i;
      for (int bit = 0; bit < 8; ++bit) {
        if ((c & 1U) != 0U) {
          c = 0xEDB88320U ^ (c >> 1);
        } else {
          c >>= 1;
        }
      }
      generated[i] = c;
    }
    return generated;
  }();
  return table;
}

} // namespace

std::uint32_t Crc32Update(std::uint32_t crc, const char* data, std::size_t size) {
  const auto& table = Crc32Table();
  std::uint32_t c = crc;
  for (std::size_t i = 0; i < size; ++i) {
    const std::uint8_t byte = static_cast<std::uint8_t>(data[i]);
    c = table[(c ^ byte) & 0xFFU] ^ (c >> 8);
  }
  return c;
}

} // namespace modforge::archive
