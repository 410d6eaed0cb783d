#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace modforge::archive {

constexpr std::uint32_t kLocalFileHeaderSignature = 0x04034b50U;
constexpr std::uint32_t kCentralDirectoryHeaderSignature = 0x02014b50U;
constexpr std::uint32_t kEndOfCentralDirectorySignature = 0x06054b50U;
constexpr std::uint32_t kZip64EndLocatorSignature = 0x07064b50U;

constexpr std::size_t kLocalFileHeaderSize = 30;
constexpr std::size_t kCentralDirectoryHeaderSize = 46;
constexpr std::size_t kEndOfCentralDirectorySize = 22;
constexpr std::size_t kZip64EndLocatorSize = 20;
constexpr std::size_t kMaxZipCommentSize = 0xFFFF;

constexpr std::uint16_t kZipVersion = 20; // 2.0
constexpr std::uint16_t kCompressionMethodStore = 0;
constexpr std::uint16_t kCompressionMethodDeflate = 8;

constexpr std::uint16_t kFlagEncrypted = 0x0001U;
constexpr std::uint16_t kFlagDataDescriptor = 0x0008U;

constexpr std::uint16_t kZip32MaxEntries = 0xFFFFU;
constexpr std::uint32_t kZip32Overflow = 0xFFFFFFFFU;

constexpr std::uint32_t kCrc32Init = 0xFFFFFFFFU;
constexpr std::uint32_t kCrc32FinalXor = 0xFFFFFFFFU;

constexpr std::string_view kClassSuffix = ".class";

// One archive member as described by the central directory. Sizes refer to
// the payload exactly as stored, so a record can be re-emitted without ever
// inflating the data.
struct ZipEntryRecord {
  std::string name;
  std::uint16_t version_needed = kZipVersion;
  std::uint16_t flags = 0;
  std::uint16_t method = kCompressionMethodStore;
  std::uint16_t mod_time = 0;
  std::uint16_t mod_date = 0;
  std::uint32_t crc32 = 0;
  std::uint32_t compressed_size = 0;
  std::uint32_t uncompressed_size = 0;
  std::uint32_t local_header_offset = 0;
};

inline bool IsClassEntryName(std::string_view name) {
  return name.size() >= kClassSuffix.size() &&
         name.compare(name.size() - kClassSuffix.size(), kClassSuffix.size(), kClassSuffix) == 0;
}

inline std::uint16_t ReadU16(const char* data) {
  const auto* bytes = reinterpret_cast<const unsigned char*>(data);
  return static_cast<std::uint16_t>(bytes[0] | (bytes[1] << 8));
}

inline std::uint32_t ReadU32(const char* data) {
  const auto* bytes = reinterpret_cast<const unsigned char*>(data);
  return static_cast<std::uint32_t>(bytes[0]) | (static_cast<std::uint32_t>(bytes[1]) << 8) |
         (static_cast<std::uint32_t>(bytes[2]) << 16) |
         (static_cast<std::uint32_t>(bytes[3]) << 24);
}

std::uint32_t Crc32Update(std::uint32_t crc, const char* data, std::size_t size);

inline std::uint32_t Crc32(std::string_view data) {
  return Crc32Update(kCrc32Init, data.data(), data.size()) ^ kCrc32FinalXor;
}

} // namespace modforge::archive
