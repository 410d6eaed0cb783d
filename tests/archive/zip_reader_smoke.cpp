#include "archive/zip_reader.hpp"
#include "archive/zip_writer.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "../common/zip_fixtures.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using modforge::tests::common::AssertContains;
using modforge::tests::common::Fail;

int main() {
  const fs::path root = modforge::tests::common::CreateUniqueTempDir("modforge-zip-reader-smoke");

  // Entries come back in written order with stored payloads intact.
  const fs::path stored = root / "stored.jar";
  modforge::tests::common::WriteStoredArchive(stored, {
                                                          {"META-INF/MANIFEST.MF", "Manifest-Version: 1.0\n"},
                                                          {"a/b/C.class", "class-c"},
                                                          {"E.class", "class-e"},
                                                      });
  modforge::archive::ZipReader reader;
  std::string error;
  if (!reader.Open(stored, error)) {
    Fail("open stored archive failed: " + error);
  }
  if (reader.Entries().size() != 3U) {
    Fail("expected 3 entries in stored archive");
  }
  if (reader.Entries()[1].name != "a/b/C.class") {
    Fail("entry order not preserved by reader");
  }
  std::string payload;
  if (!reader.ReadRawPayload(reader.Entries()[1], payload, error)) {
    Fail("read payload failed: " + error);
  }
  if (payload != "class-c") {
    Fail("unexpected stored payload: " + payload);
  }
  if (reader.Entries()[1].crc32 != modforge::archive::Crc32("class-c")) {
    Fail("stored entry crc mismatch");
  }

  // Raw payloads of compressed members are handed out without inflation.
  const fs::path deflated = root / "deflated.jar";
  {
    modforge::archive::ZipWriter writer;
    if (!writer.Open(deflated, error) ||
        !writer.AddRawEntry(modforge::tests::common::EmptyDeflatedRecord("p/Empty.class"),
                            modforge::tests::common::EmptyDeflatePayload(), error) ||
        !writer.Finish(error)) {
      Fail("failed to write deflated fixture: " + error);
    }
  }
  if (!reader.Open(deflated, error)) {
    Fail("open deflated archive failed: " + error);
  }
  const auto& entry = reader.Entries().front();
  if (entry.method != modforge::archive::kCompressionMethodDeflate || entry.compressed_size != 2U) {
    Fail("deflated entry metadata not preserved");
  }
  std::ostringstream streamed;
  if (!reader.CopyRawPayload(entry, streamed, error)) {
    Fail("copy raw payload failed: " + error);
  }
  if (streamed.str() != modforge::tests::common::EmptyDeflatePayload()) {
    Fail("raw deflate payload altered");
  }

  // An archive with zero entries is valid.
  const fs::path empty = root / "empty.jar";
  modforge::tests::common::WriteStoredArchive(empty, {});
  if (!reader.Open(empty, error) || !reader.Entries().empty()) {
    Fail("empty archive should open with no entries: " + error);
  }

  // Garbage is rejected as corrupt.
  const fs::path garbage = root / "garbage.jar";
  modforge::tests::common::WriteFileOrFail(garbage, std::string(64, 'x'));
  if (reader.Open(garbage, error)) {
    Fail("expected garbage archive to be rejected");
  }
  AssertContains(error, "end of central directory not found");

  // Truncated central directory is rejected.
  const std::string full = modforge::tests::common::ReadFileToString(stored);
  const fs::path truncated = root / "truncated.jar";
  modforge::tests::common::WriteFileOrFail(truncated, full.substr(0, full.size() - 30));
  if (reader.Open(truncated, error)) {
    Fail("expected truncated archive to be rejected");
  }

  if (reader.Open(root / "missing.jar", error)) {
    Fail("expected missing archive to be rejected");
  }
  AssertContains(error, "archive not found");

  // Encrypted members cannot be copied into a module archive.
  const fs::path encrypted = root / "encrypted.jar";
  {
    auto record = modforge::tests::common::EmptyDeflatedRecord("p/Secret.class");
    record.flags = modforge::archive::kFlagEncrypted;
    modforge::archive::ZipWriter encrypted_writer;
    if (!encrypted_writer.Open(encrypted, error) ||
        !encrypted_writer.AddRawEntry(record, modforge::tests::common::EmptyDeflatePayload(),
                                      error) ||
        !encrypted_writer.Finish(error)) {
      Fail("failed to write encrypted fixture: " + error);
    }
  }
  if (reader.Open(encrypted, error)) {
    Fail("expected encrypted archive to be rejected");
  }
  AssertContains(error, "encrypted entries are not supported: p/Secret.class");

  // Duplicate names cannot be written.
  modforge::archive::ZipWriter writer;
  if (!writer.Open(root / "dup.jar", error)) {
    Fail("open dup writer failed: " + error);
  }
  if (!writer.AddStoredEntry("x/A.class", "1", error)) {
    Fail("first entry failed: " + error);
  }
  if (writer.AddStoredEntry("x/A.class", "2", error)) {
    Fail("expected duplicate entry to be rejected");
  }
  AssertContains(error, "duplicate zip entry");
  writer.Abandon();
  if (fs::exists(root / "dup.jar")) {
    Fail("abandoned writer must not publish an archive");
  }

  modforge::tests::common::RemovePathBestEffort(root);
  std::cout << "zip_reader_smoke: ok\n";
  return 0;
}
