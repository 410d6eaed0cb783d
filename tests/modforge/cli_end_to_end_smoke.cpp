#include "modforge/cli/router.hpp"

#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/fake_toolchain.hpp"
#include "../common/temp_dir.hpp"
#include "../common/zip_fixtures.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using modforge::tests::common::AssertContains;
using modforge::tests::common::AssertNotContains;
using modforge::tests::common::Fail;

int main() {
  const fs::path root = modforge::tests::common::CreateUniqueTempDir("modforge-cli-e2e-smoke");
  const fs::path jar = root / "android.jar";
  modforge::tests::common::WriteStoredArchive(jar, {
                                                       {"x/y/A.class", "a"},
                                                       {"x/y/B.class", "b"},
                                                       {"META-INF/MANIFEST.MF", "m"},
                                                   });
  const fs::path java_home = modforge::tests::common::CreateFakeJavaHome(root / "ok");
  const fs::path output_dir = root / "compiler_module";
  const fs::path scratch_dir = root / "temp";
  modforge::tests::common::WriteFileOrFail(output_dir / "leftover", "x");

  std::string stderr_text;
  const int exit_code = modforge::tests::common::DispatchWithCapturedStderr(
      {"modforge", "-a", jar.string(), "-o", output_dir.string(), "--java-home",
       java_home.string(), "--scratch-dir", scratch_dir.string()},
      stderr_text);
  if (exit_code != 0) {
    Fail("expected successful run, stderr:\n" + stderr_text);
  }
  if (!fs::exists(output_dir / "lib" / "modules") || fs::exists(output_dir / "leftover")) {
    Fail("linked image missing or output directory not cleared");
  }
  AssertContains(stderr_text, "jlink_version=\"17.0.99\"");
  AssertContains(stderr_text, "line=\"fake javac: writing");
  AssertContains(stderr_text, "line=\"fake jmod: writing");
  AssertNotContains(stderr_text, "usage:");

  const std::string jmod_args =
      modforge::tests::common::ReadFileToString(scratch_dir / "java.base.jmod.args");
  AssertContains(jmod_args, "--module-version 17.0.99");
  AssertContains(jmod_args, "--target-platform android");
  if (modforge::tests::common::ReadFileToString(scratch_dir / "module-info.java") !=
      "module java.base {\n    exports x.y;\n}") {
    Fail("unexpected descriptor written by CLI run");
  }

  // A failing link tool surfaces as LinkFailed with usage text and exit 1.
  const fs::path broken_home =
      modforge::tests::common::CreateFakeJavaHome(root / "broken", "17.0.99", 3);
  const int link_exit = modforge::tests::common::DispatchWithCapturedStderr(
      {"modforge", "--android-jar", jar.string(), "--output-dir", output_dir.string(),
       "--java-home", broken_home.string(), "--scratch-dir", scratch_dir.string()},
      stderr_text);
  if (link_exit != 1) {
    Fail("expected exit code 1 for link failure");
  }
  AssertContains(stderr_text, "LinkFailed (stage link)");
  AssertContains(stderr_text, "exited with code 3");
  AssertContains(stderr_text, "Error: fake link failure");
  AssertContains(stderr_text, "usage:");
  if (fs::exists(output_dir / "lib" / "modules")) {
    Fail("failed link must not leave the previous image in place");
  }

  // Argument errors.
  if (modforge::tests::common::DispatchWithCapturedStderr({"modforge"}, stderr_text) != 1) {
    Fail("expected exit code 1 without arguments");
  }
  AssertContains(stderr_text, "ArgumentError: android.jar file must be specified!");
  AssertContains(stderr_text, "DELETED");

  if (modforge::tests::common::DispatchWithCapturedStderr(
          {"modforge", "-a", (root / "missing.jar").string()}, stderr_text) != 1) {
    Fail("expected exit code 1 for a missing archive");
  }
  AssertContains(stderr_text, "does not exist");

  if (modforge::tests::common::DispatchWithCapturedStderr(
          {"modforge", "-a", jar.string(), "--java-home", (root / "nowhere").string()},
          stderr_text) != 1) {
    Fail("expected exit code 1 for a missing runtime home");
  }
  AssertContains(stderr_text, "ToolchainNotFoundError");

  const fs::path no_tools = root / "empty-jdk";
  fs::create_directories(no_tools);
  if (modforge::tests::common::DispatchWithCapturedStderr(
          {"modforge", "-a", jar.string(), "--java-home", no_tools.string()}, stderr_text) != 1) {
    Fail("expected exit code 1 when jlink is absent");
  }
  AssertContains(stderr_text, "ProcessLaunchError");

  if (modforge::tests::common::DispatchArgs({"modforge", "--help"}) != 0) {
    Fail("expected --help to succeed");
  }

  modforge::tests::common::RemovePathBestEffort(root);
  std::cout << "cli_end_to_end_smoke: ok\n";
  return 0;
}
