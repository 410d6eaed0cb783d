#ifndef MODFORGE_TESTS_COMMON_FAKE_TOOLCHAIN_HPP_
#define MODFORGE_TESTS_COMMON_FAKE_TOOLCHAIN_HPP_

#include "assertions.hpp"

#include <filesystem>
#include <string>
#include <system_error>

namespace modforge::tests::common {

inline void WriteExecutableScript(const std::filesystem::path& path, const std::string& body) {
  WriteFileOrFail(path, "#!/bin/sh\n" + body);
  std::error_code ec;
  std::filesystem::permissions(path,
                               std::filesystem::perms::owner_all |
                                   std::filesystem::perms::group_read |
                                   std::filesystem::perms::group_exec |
                                   std::filesystem::perms::others_read |
                                   std::filesystem::perms::others_exec,
                               ec);
  if (ec) {
    Fail("failed to mark script executable: " + path.string());
  }
}

// Lays out <home>/bin/{javac,jmod,jlink} as shell scripts that create the
// artifacts the real tools would. jmod also records its argument list next to
// its output as `<output>.args`. When `link_exit_code` is non-zero, jlink
// prints an error and exits with it instead of linking.
inline std::filesystem::path CreateFakeJavaHome(const std::filesystem::path& root,
                                                const std::string& version = "17.0.99",
                                                int link_exit_code = 0) {
  const std::filesystem::path home = root / "fake-jdk";
  const std::filesystem::path bin = home / "bin";

  WriteExecutableScript(bin / "javac",
                        "out=\"\"\n"
                        "while [ $# -gt 0 ]; do\n"
                        "  if [ \"$1\" = \"-d\" ]; then out=\"$2\"; shift; fi\n"
                        "  shift\n"
                        "done\n"
                        "echo \"fake javac: writing $out/module-info.class\"\n"
                        "printf 'CAFEBABE' > \"$out/module-info.class\"\n");

  WriteExecutableScript(bin / "jmod",
                        "for last; do :; done\n"
                        "echo \"$@\" > \"$last.args\"\n"
                        "echo \"fake jmod: writing $last\" 1>&2\n"
                        "printf 'JM' > \"$last\"\n");

  std::string link_body = "if [ \"$1\" = \"--version\" ]; then echo \"" + version +
                          "\"; exit 0; fi\n";
  if (link_exit_code != 0) {
    link_body += "echo \"Error: fake link failure\"\nexit " + std::to_string(link_exit_code) +
                 "\n";
  } else {
    link_body += "out=\"\"\n"
                 "while [ $# -gt 0 ]; do\n"
                 "  if [ \"$1\" = \"--output\" ]; then out=\"$2\"; shift; fi\n"
                 "  shift\n"
                 "done\n"
                 "mkdir -p \"$out/lib\" && printf 'modules' > \"$out/lib/modules\"\n";
  }
  WriteExecutableScript(bin / "jlink", link_body);

  return home;
}

} // namespace modforge::tests::common

#endif // MODFORGE_TESTS_COMMON_FAKE_TOOLCHAIN_HPP_
