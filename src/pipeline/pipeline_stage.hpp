#pragma once

#include "core/errors/error.hpp"
#include "process/process_runner.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace modforge::pipeline {

// Linear state machine of one run. kFailed is absorbing and reachable from
// every other state; there is no retry and no rollback.
enum class PipelineState {
  kIdle = 0,
  kDescribing,
  kCompilingDescriptor,
  kAssemblingModuleArchive,
  kPackagingModule,
  kLinkingImage,
  kDone,
  kFailed,
};

const char* ToString(PipelineState state);

// In-process body for stages that do not shell out to a tool.
using StageAction = std::function<bool(core::errors::Error& error)>;

// One step of the pipeline: inputs that must already exist, exactly one of
// an external `command` or an in-process `action`, and the artifact that must
// exist afterwards. Built by the sequencer right before it runs.
struct PipelineStage {
  PipelineState state = PipelineState::kIdle;
  std::string name;
  core::errors::ErrorKind failure_kind = core::errors::ErrorKind::kNone;
  std::vector<std::filesystem::path> required_inputs;
  std::optional<process::ProcessRequest> command;
  StageAction action;
  std::filesystem::path required_output;
};

struct StageOutcome {
  bool ran_tool = false;
  process::ProcessResult process;
};

// validate inputs -> run tool or action -> check exit code -> check output.
//
// Missing inputs are sequencing bugs (StageSequenceError). A tool that cannot
// be launched is a ProcessLaunchError. A non-zero exit, a timeout, or a
// missing output artifact after a zero exit all fail with the stage's own
// `failure_kind`, with the command line and output tail attached.
bool ExecuteStage(const PipelineStage& stage, process::IProcessRunner& runner,
                  StageOutcome& outcome, core::errors::Error& error);

} // namespace modforge::pipeline
