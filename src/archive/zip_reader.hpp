#pragma once

#include "archive/zip_format.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <string>
#include <vector>

namespace modforge::archive {

// Random-access reader over a zip32 archive.
//
// Contract:
// - `Open` parses the whole central directory up front; entries are exposed in
//   central-directory order, which is the order the archive was written in.
// - Payloads are handed out exactly as stored (no inflation), so callers can
//   copy members into another archive byte-for-byte.
// - Zip64, multi-disk, encrypted and truncated archives are rejected with an error.
class ZipReader {
public:
  bool Open(const std::filesystem::path& path, std::string& error);

  const std::vector<ZipEntryRecord>& Entries() const {
    return entries_;
  }

  // Streams the stored payload of `entry` into `out`.
  bool CopyRawPayload(const ZipEntryRecord& entry, std::ostream& out, std::string& error);

  // Reads the stored payload of `entry` into memory.
  bool ReadRawPayload(const ZipEntryRecord& entry, std::string& payload, std::string& error);

private:
  bool LocateEndRecord(std::uint64_t& end_record_offset, std::uint32_t& central_dir_offset,
                       std::uint32_t& central_dir_size, std::uint16_t& entry_count,
                       std::string& error);
  bool ParseCentralDirectory(std::uint32_t central_dir_offset, std::uint32_t central_dir_size,
                             std::uint16_t entry_count, std::string& error);
  bool SeekPayload(const ZipEntryRecord& entry, std::string& error);

  std::filesystem::path path_;
  std::ifstream in_;
  std::uint64_t file_size_ = 0;
  std::uint32_t central_dir_offset_ = 0;
  std::vector<ZipEntryRecord> entries_;
};

} // namespace modforge::archive
