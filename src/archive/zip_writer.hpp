#pragma once

#include "archive/zip_format.hpp"
#include "archive/zip_reader.hpp"

#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace modforge::archive {

// Streaming zip32 writer.
//
// Contract:
// - Bytes go to a temporary sibling of the output path; `Finish` writes the
//   central directory and end record, then renames the file into place.
// - A writer destroyed (or `Abandon`ed) before `Finish` removes its temporary
//   file, so a failed write never leaves an archive at the output path.
// - Stored entries carry zero timestamps for reproducible output. Raw entries
//   keep the source member's method, CRC, sizes and timestamps.
// - Duplicate entry names are rejected.
class ZipWriter {
public:
  ZipWriter() = default;
  ZipWriter(const ZipWriter&) = delete;
  ZipWriter& operator=(const ZipWriter&) = delete;
  ~ZipWriter();

  bool Open(const std::filesystem::path& output_path, std::string& error);

  // Adds `data` uncompressed under `name`.
  bool AddStoredEntry(const std::string& name, std::string_view data, std::string& error);

  // Adds an already-encoded payload described by `entry`. `raw_payload` must be
  // exactly `entry.compressed_size` bytes.
  bool AddRawEntry(const ZipEntryRecord& entry, std::string_view raw_payload, std::string& error);

  // Streams a member of `source` into this archive without decoding it.
  bool CopyEntryFrom(ZipReader& source, const ZipEntryRecord& entry, std::string& error);

  bool Finish(std::string& error);

  void Abandon();

private:
  bool BeginEntry(const ZipEntryRecord& source, std::string& error);
  void WriteU16(std::uint16_t value);
  void WriteU32(std::uint32_t value);

  std::filesystem::path output_path_;
  std::filesystem::path temp_path_;
  std::ofstream out_;
  std::vector<ZipEntryRecord> entries_;
  std::set<std::string> names_;
  bool open_ = false;
};

} // namespace modforge::archive
