#include "archive/zip_writer.hpp"

#include "core/fs_utils.hpp"

#include <array>
#include <cstdint>
#include <system_error>

namespace fs = std::filesystem;

namespace modforge::archive {

ZipWriter::~ZipWriter() {
  Abandon();
}

void ZipWriter::Abandon() {
  if (!open_) {
    return;
  }
  out_.close();
  std::error_code ec;
  (void)fs::remove(temp_path_, ec);
  open_ = false;
}

bool ZipWriter::Open(const fs::path& output_path, std::string& error) {
  Abandon();
  entries_.clear();
  names_.clear();

  if (!core::EnsureParentDirectory(output_path, error)) {
    return false;
  }

  output_path_ = output_path;
  temp_path_ = core::detail::BuildTempSiblingPath(output_path);
  out_.open(temp_path_, std::ios::binary | std::ios::trunc);
  if (!out_) {
    error = "failed to open zip output: " + temp_path_.string();
    return false;
  }
  open_ = true;
  return true;
}

void ZipWriter::WriteU16(std::uint16_t value) {
  const std::array<char, 2> bytes = {
      static_cast<char>(value & 0xFFU),
      static_cast<char>((value >> 8) & 0xFFU),
  };
  out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

void ZipWriter::WriteU32(std::uint32_t value) {
  const std::array<char, 4> bytes = {
      static_cast<char>(value & 0xFFU),
      static_cast<char>((value >> 8) & 0xFFU),
      static_cast<char>((value >> 16) & 0xFFU),
      static_cast<char>((value >> 24) & 0xFFU),
  };
  out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

bool ZipWriter::BeginEntry(const ZipEntryRecord& source, std::string& error) {
  if (!open_) {
    error = "zip writer is not open";
    return false;
  }
  if (source.name.empty()) {
    error = "zip entry name cannot be empty";
    return false;
  }
  if (source.name.size() > 0xFFFFU) {
    error = "zip entry name too long: " + source.name;
    return false;
  }
  if (entries_.size() >= kZip32MaxEntries) {
    error = "too many entries for zip32 support";
    return false;
  }
  if (!names_.insert(source.name).second) {
    error = "duplicate zip entry: " + source.name;
    return false;
  }

  const std::streamoff offset = out_.tellp();
  if (offset < 0 || static_cast<std::uint64_t>(offset) >= kZip32Overflow) {
    error = "zip offset overflow while writing entry: " + source.name;
    return false;
  }

  ZipEntryRecord entry = source;
  entry.local_header_offset = static_cast<std::uint32_t>(offset);
  // Sizes and CRC are known up front, so no trailing data descriptor is written.
  entry.flags = static_cast<std::uint16_t>(entry.flags & ~kFlagDataDescriptor);
  if (entry.version_needed < kZipVersion) {
    entry.version_needed = kZipVersion;
  }

  WriteU32(kLocalFileHeaderSignature);
  WriteU16(entry.version_needed);
  WriteU16(entry.flags);
  WriteU16(entry.method);
  WriteU16(entry.mod_time);
  WriteU16(entry.mod_date);
  WriteU32(entry.crc32);
  WriteU32(entry.compressed_size);
  WriteU32(entry.uncompressed_size);
  WriteU16(static_cast<std::uint16_t>(entry.name.size()));
  WriteU16(0); // extra field length
  out_.write(entry.name.data(), static_cast<std::streamsize>(entry.name.size()));
  if (!out_) {
    error = "failed while writing zip local file header: " + entry.name;
    return false;
  }

  entries_.push_back(std::move(entry));
  return true;
}

bool ZipWriter::AddStoredEntry(const std::string& name, std::string_view data,
                               std::string& error) {
  if (data.size() >= kZip32Overflow) {
    error = "entry too large for zip32 support: " + name;
    return false;
  }

  ZipEntryRecord entry;
  entry.name = name;
  entry.method = kCompressionMethodStore;
  entry.crc32 = Crc32(data);
  entry.compressed_size = static_cast<std::uint32_t>(data.size());
  entry.uncompressed_size = static_cast<std::uint32_t>(data.size());
  return AddRawEntry(entry, data, error);
}

bool ZipWriter::AddRawEntry(const ZipEntryRecord& entry, std::string_view raw_payload,
                            std::string& error) {
  if (raw_payload.size() != entry.compressed_size) {
    error = "payload size does not match entry record: " + entry.name;
    return false;
  }
  if (!BeginEntry(entry, error)) {
    return false;
  }

  out_.write(raw_payload.data(), static_cast<std::streamsize>(raw_payload.size()));
  if (!out_) {
    error = "failed while writing zip payload: " + entry.name;
    return false;
  }
  return true;
}

bool ZipWriter::CopyEntryFrom(ZipReader& source, const ZipEntryRecord& entry,
                              std::string& error) {
  if (!BeginEntry(entry, error)) {
    return false;
  }
  return source.CopyRawPayload(entry, out_, error);
}

bool ZipWriter::Finish(std::string& error) {
  if (!open_) {
    error = "zip writer is not open";
    return false;
  }

  const std::streamoff central_dir_offset_stream = out_.tellp();
  if (central_dir_offset_stream < 0 ||
      static_cast<std::uint64_t>(central_dir_offset_stream) >= kZip32Overflow) {
    error = "zip central directory offset overflow";
    return false;
  }
  const std::uint32_t central_dir_offset = static_cast<std::uint32_t>(central_dir_offset_stream);

  for (const auto& entry : entries_) {
    WriteU32(kCentralDirectoryHeaderSignature);
    WriteU16(kZipVersion); // version made by
    WriteU16(entry.version_needed);
    WriteU16(entry.flags);
    WriteU16(entry.method);
    WriteU16(entry.mod_time);
    WriteU16(entry.mod_date);
    WriteU32(entry.crc32);
    WriteU32(entry.compressed_size);
    WriteU32(entry.uncompressed_size);
    WriteU16(static_cast<std::uint16_t>(entry.name.size()));
    WriteU16(0); // extra field length
    WriteU16(0); // file comment length
    WriteU16(0); // disk number start
    WriteU16(0); // internal file attributes
    WriteU32(0); // external file attributes
    WriteU32(entry.local_header_offset);
    out_.write(entry.name.data(), static_cast<std::streamsize>(entry.name.size()));
    if (!out_) {
      error = "failed while writing zip central directory";
      return false;
    }
  }

  const std::streamoff central_dir_end_stream = out_.tellp();
  if (central_dir_end_stream < central_dir_offset_stream ||
      static_cast<std::uint64_t>(central_dir_end_stream) >= kZip32Overflow) {
    error = "zip central directory size overflow";
    return false;
  }
  const std::uint32_t central_dir_size =
      static_cast<std::uint32_t>(central_dir_end_stream - central_dir_offset_stream);

  WriteU32(kEndOfCentralDirectorySignature);
  WriteU16(0); // number of this disk
  WriteU16(0); // number of the disk with the start of the central directory
  WriteU16(static_cast<std::uint16_t>(entries_.size()));
  WriteU16(static_cast<std::uint16_t>(entries_.size()));
  WriteU32(central_dir_size);
  WriteU32(central_dir_offset);
  WriteU16(0); // zip file comment length

  out_.flush();
  if (!out_) {
    error = "failed while finalizing zip file: " + temp_path_.string();
    return false;
  }
  out_.close();
  if (out_.fail()) {
    error = "failed to close zip file: " + temp_path_.string();
    return false;
  }

  std::error_code ec;
  (void)fs::remove(output_path_, ec);
  ec.clear();
  fs::rename(temp_path_, output_path_, ec);
  if (ec) {
    error = "failed to publish zip file '" + output_path_.string() + "': " + ec.message();
    return false;
  }

  open_ = false;
  return true;
}

} // namespace modforge::archive
