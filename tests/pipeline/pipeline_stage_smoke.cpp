#include "pipeline/pipeline_stage.hpp"

#include "../common/assertions.hpp"
#include "../common/fake_process_runner.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using modforge::core::errors::ErrorKind;
using modforge::pipeline::PipelineStage;
using modforge::pipeline::PipelineState;
using modforge::tests::common::AssertContains;
using modforge::tests::common::Fail;

namespace {

PipelineStage PackageStage(const fs::path& root) {
  PipelineStage stage;
  stage.state = PipelineState::kPackagingModule;
  stage.name = "package";
  stage.failure_kind = ErrorKind::kPackagingFailed;
  stage.required_inputs = {root / "module.jar"};
  modforge::process::ProcessRequest request;
  request.executable = root / "bin" / "jmod";
  request.arguments = {"create", (root / "out.jmod").string()};
  stage.command = request;
  stage.required_output = root / "out.jmod";
  return stage;
}

} // namespace

int main() {
  const fs::path root = modforge::tests::common::CreateUniqueTempDir("modforge-stage-smoke");
  modforge::tests::common::FakeProcessRunner runner;
  modforge::pipeline::StageOutcome outcome;
  modforge::core::errors::Error error;

  // Missing input: nothing runs.
  const PipelineStage stage = PackageStage(root);
  if (modforge::pipeline::ExecuteStage(stage, runner, outcome, error)) {
    Fail("expected stage with missing input to fail");
  }
  if (error.kind != ErrorKind::kStageSequence || error.stage != "package" ||
      !runner.requests.empty()) {
    Fail("missing input must fail before the tool runs");
  }

  modforge::tests::common::WriteFileOrFail(root / "module.jar", "jar");

  // Happy path.
  if (!modforge::pipeline::ExecuteStage(stage, runner, outcome, error)) {
    Fail("stage failed: " + error.message);
  }
  if (!outcome.ran_tool || runner.requests.size() != 1U) {
    Fail("expected exactly one tool invocation");
  }

  // Non-zero exit carries the stage error, command line and output tail.
  fs::remove(root / "out.jmod");
  runner.behaviors["jmod"].exit_code = 4;
  runner.behaviors["jmod"].output_lines = {"Error: bad class path"};
  if (modforge::pipeline::ExecuteStage(stage, runner, outcome, error)) {
    Fail("expected non-zero exit to fail the stage");
  }
  if (error.kind != ErrorKind::kPackagingFailed) {
    Fail("expected PackagingFailed for non-zero exit");
  }
  AssertContains(error.message, "exited with code 4");
  AssertContains(error.message, "jmod create");
  AssertContains(error.tool_output, "Error: bad class path");

  // Exit zero without the artifact is still a failure.
  fs::remove(root / "out.jmod");
  runner.behaviors["jmod"] = modforge::tests::common::FakeToolBehavior{};
  runner.behaviors["jmod"].produce_output = false;
  if (modforge::pipeline::ExecuteStage(stage, runner, outcome, error)) {
    Fail("expected missing output to fail the stage");
  }
  if (error.kind != ErrorKind::kPackagingFailed) {
    Fail("expected PackagingFailed for missing output");
  }
  AssertContains(error.message, "did not produce");

  // Launch failures keep their own kind but name the stage.
  runner.behaviors["jmod"].fail_launch = true;
  if (modforge::pipeline::ExecuteStage(stage, runner, outcome, error) ||
      error.kind != ErrorKind::kProcessLaunch || error.stage != "package") {
    Fail("expected ProcessLaunchError tagged with the stage");
  }

  // In-process action stages share the same contract.
  PipelineStage action_stage;
  action_stage.name = "assemble";
  action_stage.failure_kind = ErrorKind::kAssemblyWrite;
  action_stage.required_inputs = {root / "module.jar"};
  action_stage.required_output = root / "assembled.jar";
  bool action_ran = false;
  action_stage.action = [&](modforge::core::errors::Error&) {
    action_ran = true;
    return true;
  };
  if (modforge::pipeline::ExecuteStage(action_stage, runner, outcome, error)) {
    Fail("expected action without output to fail");
  }
  if (!action_ran || error.kind != ErrorKind::kAssemblyWrite || outcome.ran_tool) {
    Fail("unexpected action stage failure shape");
  }

  action_stage.action = [&](modforge::core::errors::Error&) {
    modforge::tests::common::WriteFileOrFail(root / "assembled.jar", "jar");
    return true;
  };
  if (!modforge::pipeline::ExecuteStage(action_stage, runner, outcome, error)) {
    Fail("action stage failed: " + error.message);
  }

  // A stage must define exactly one body.
  PipelineStage malformed = PackageStage(root);
  malformed.action = action_stage.action;
  if (modforge::pipeline::ExecuteStage(malformed, runner, outcome, error) ||
      error.kind != ErrorKind::kStageSequence) {
    Fail("expected StageSequenceError for a stage with two bodies");
  }

  modforge::tests::common::RemovePathBestEffort(root);
  std::cout << "pipeline_stage_smoke: ok\n";
  return 0;
}
