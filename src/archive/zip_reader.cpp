#include "archive/zip_reader.hpp"

#include <algorithm>
#include <array>
#include <system_error>

namespace fs = std::filesystem;

namespace modforge::archive {

namespace {

bool ReadExact(std::ifstream& in, std::uint64_t offset, std::size_t size, std::string& buffer) {
  buffer.assign(size, '\0');
  in.clear();
  in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (!in) {
    return false;
  }
  in.read(buffer.data(), static_cast<std::streamsize>(size));
  return in.gcount() == static_cast<std::streamsize>(size);
}

} // namespace

bool ZipReader::Open(const fs::path& path, std::string& error) {
  path_ = path;
  entries_.clear();
  file_size_ = 0;
  if (in_.is_open()) {
    in_.close();
  }

  std::error_code ec;
  if (!fs::is_regular_file(path, ec) || ec) {
    error = "archive not found or not a regular file: " + path.string();
    return false;
  }
  file_size_ = static_cast<std::uint64_t>(fs::file_size(path, ec));
  if (ec) {
    error = "failed to stat archive '" + path.string() + "': " + ec.message();
    return false;
  }

  in_.open(path, std::ios::binary);
  if (!in_) {
    error = "failed to open archive: " + path.string();
    return false;
  }

  std::uint64_t end_record_offset = 0;
  std::uint32_t central_dir_offset = 0;
  std::uint32_t central_dir_size = 0;
  std::uint16_t entry_count = 0;
  if (!LocateEndRecord(end_record_offset, central_dir_offset, central_dir_size, entry_count,
                       error)) {
    return false;
  }
  if (static_cast<std::uint64_t>(central_dir_offset) + central_dir_size > end_record_offset) {
    error = "corrupt archive (central directory overlaps end record): " + path.string();
    return false;
  }
  central_dir_offset_ = central_dir_offset;

  return ParseCentralDirectory(central_dir_offset, central_dir_size, entry_count, error);
}

bool ZipReader::LocateEndRecord(std::uint64_t& end_record_offset,
                                std::uint32_t& central_dir_offset,
                                std::uint32_t& central_dir_size, std::uint16_t& entry_count,
                                std::string& error) {
  if (file_size_ < kEndOfCentralDirectorySize) {
    error = "corrupt archive (too short for a zip end record): " + path_.string();
    return false;
  }

  // The end record sits in the last 22 bytes unless a trailing comment follows it.
  const std::uint64_t tail_size =
      std::min<std::uint64_t>(file_size_, kEndOfCentralDirectorySize + kMaxZipCommentSize);
  const std::uint64_t tail_offset = file_size_ - tail_size;
  std::string tail;
  if (!ReadExact(in_, tail_offset, static_cast<std::size_t>(tail_size), tail)) {
    error = "failed while reading archive tail: " + path_.string();
    return false;
  }

  std::size_t pos = tail.size() - kEndOfCentralDirectorySize;
  while (true) {
    if (ReadU32(tail.data() + pos) == kEndOfCentralDirectorySignature) {
      const std::uint16_t comment_size = ReadU16(tail.data() + pos + 20);
      if (pos + kEndOfCentralDirectorySize + comment_size <= tail.size()) {
        break;
      }
    }
    if (pos == 0) {
      error = "corrupt archive (end of central directory not found): " + path_.string();
      return false;
    }
    --pos;
  }

  const char* record = tail.data() + pos;
  end_record_offset = tail_offset + pos;

  const std::uint16_t disk_number = ReadU16(record + 4);
  const std::uint16_t central_dir_disk = ReadU16(record + 6);
  const std::uint16_t entries_on_disk = ReadU16(record + 8);
  entry_count = ReadU16(record + 10);
  central_dir_size = ReadU32(record + 12);
  central_dir_offset = ReadU32(record + 16);

  if (disk_number != 0 || central_dir_disk != 0 || entries_on_disk != entry_count) {
    error = "multi-disk archives are not supported: " + path_.string();
    return false;
  }

  const bool has_zip64_locator =
      pos >= kZip64EndLocatorSize &&
      ReadU32(tail.data() + pos - kZip64EndLocatorSize) == kZip64EndLocatorSignature;
  if (has_zip64_locator || entry_count == kZip32MaxEntries ||
      central_dir_offset == kZip32Overflow || central_dir_size == kZip32Overflow) {
    error = "zip64 archives are not supported: " + path_.string();
    return false;
  }

  return true;
}

bool ZipReader::ParseCentralDirectory(std::uint32_t central_dir_offset,
                                      std::uint32_t central_dir_size, std::uint16_t entry_count,
                                      std::string& error) {
  std::string directory;
  if (!ReadExact(in_, central_dir_offset, central_dir_size, directory)) {
    error = "failed while reading central directory: " + path_.string();
    return false;
  }

  entries_.reserve(entry_count);
  std::size_t pos = 0;
  for (std::uint16_t index = 0; index < entry_count; ++index) {
    if (pos + kCentralDirectoryHeaderSize > directory.size()) {
      error = "corrupt archive (truncated central directory entry " + std::to_string(index) +
              "): " + path_.string();
      return false;
    }

    const char* header = directory.data() + pos;
    if (ReadU32(header) != kCentralDirectoryHeaderSignature) {
      error = "corrupt archive (bad central directory signature at entry " +
              std::to_string(index) + "): " + path_.string();
      return false;
    }

    ZipEntryRecord entry;
    entry.version_needed = ReadU16(header + 6);
    entry.flags = ReadU16(header + 8);
    entry.method = ReadU16(header + 10);
    entry.mod_time = ReadU16(header + 12);
    entry.mod_date = ReadU16(header + 14);
    entry.crc32 = ReadU32(header + 16);
    entry.compressed_size = ReadU32(header + 20);
    entry.uncompressed_size = ReadU32(header + 24);
    const std::uint16_t name_size = ReadU16(header + 28);
    const std::uint16_t extra_size = ReadU16(header + 30);
    const std::uint16_t comment_size = ReadU16(header + 32);
    entry.local_header_offset = ReadU32(header + 42);

    const std::size_t record_size =
        kCentralDirectoryHeaderSize + name_size + extra_size + comment_size;
    if (pos + record_size > directory.size()) {
      error = "corrupt archive (truncated central directory entry " + std::to_string(index) +
              "): " + path_.string();
      return false;
    }
    entry.name.assign(header + kCentralDirectoryHeaderSize, name_size);

    if (entry.compressed_size == kZip32Overflow || entry.uncompressed_size == kZip32Overflow ||
        entry.local_header_offset == kZip32Overflow) {
      error = "zip64 entries are not supported: " + entry.name;
      return false;
    }
    if ((entry.flags & kFlagEncrypted) != 0U) {
      error = "encrypted entries are not supported: " + entry.name;
      return false;
    }
    if (static_cast<std::uint64_t>(entry.local_header_offset) >= central_dir_offset) {
      error = "corrupt archive (entry offset past central directory): " + entry.name;
      return false;
    }

    entries_.push_back(std::move(entry));
    pos += record_size;
  }

  return true;
}

bool ZipReader::SeekPayload(const ZipEntryRecord& entry, std::string& error) {
  std::string header;
  if (!ReadExact(in_, entry.local_header_offset, kLocalFileHeaderSize, header)) {
    error = "failed while reading local header for entry: " + entry.name;
    return false;
  }
  if (ReadU32(header.data()) != kLocalFileHeaderSignature) {
    error = "corrupt archive (bad local header signature) for entry: " + entry.name;
    return false;
  }

  const std::uint16_t name_size = ReadU16(header.data() + 26);
  const std::uint16_t extra_size = ReadU16(header.data() + 28);
  const std::uint64_t payload_offset =
      static_cast<std::uint64_t>(entry.local_header_offset) + kLocalFileHeaderSize + name_size +
      extra_size;
  if (payload_offset + entry.compressed_size > central_dir_offset_) {
    error = "corrupt archive (payload runs into central directory) for entry: " + entry.name;
    return false;
  }

  in_.clear();
  in_.seekg(static_cast<std::streamoff>(payload_offset), std::ios::beg);
  if (!in_) {
    error = "failed to seek payload for entry: " + entry.name;
    return false;
  }
  return true;
}

bool ZipReader::CopyRawPayload(const ZipEntryRecord& entry, std::ostream& out,
                               std::string& error) {
  if (!SeekPayload(entry, error)) {
    return false;
  }

  std::array<char, 8192> buffer{};
  std::uint64_t remaining = entry.compressed_size;
  while (remaining > 0) {
    const std::size_t chunk =
        static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
    in_.read(buffer.data(), static_cast<std::streamsize>(chunk));
    if (in_.gcount() != static_cast<std::streamsize>(chunk)) {
      error = "failed while reading payload for entry: " + entry.name;
      return false;
    }
    out.write(buffer.data(), static_cast<std::streamsize>(chunk));
    if (!out) {
      error = "failed while writing payload for entry: " + entry.name;
      return false;
    }
    remaining -= chunk;
  }

  return true;
}

bool ZipReader::ReadRawPayload(const ZipEntryRecord& entry, std::string& payload,
                               std::string& error) {
  if (!SeekPayload(entry, error)) {
    return false;
  }

  payload.assign(entry.compressed_size, '\0');
  in_.read(payload.data(), static_cast<std::streamsize>(payload.size()));
  if (in_.gcount() != static_cast<std::streamsize>(payload.size())) {
    error = "failed while reading payload for entry: " + entry.name;
    return false;
  }
  return true;
}

} // namespace modforge::archive
