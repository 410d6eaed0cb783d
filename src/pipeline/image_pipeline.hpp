#pragma once

#include "archive/archive_scanner.hpp"
#include "core/errors/error.hpp"
#include "core/logging/logger.hpp"
#include "pipeline/pipeline_stage.hpp"
#include "process/process_runner.hpp"
#include "toolchain/toolchain.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace modforge::pipeline {

inline constexpr std::string_view kDefaultModuleName = "java.base";
inline constexpr std::string_view kDefaultTargetPlatform = "android";

// Immutable inputs of one run, built once by the caller.
//
// `scratch_dir` and `output_dir` are owned by the run: both are force-cleared
// before anything is written into them. Two runs sharing either directory
// corrupt each other; concurrent runs against the same paths are unsupported.
struct PipelineConfig {
  std::filesystem::path archive_path;
  std::filesystem::path output_dir = "compiler_module";
  std::filesystem::path scratch_dir = "temp";
  std::string module_name = std::string(kDefaultModuleName);
  std::string target_platform = std::string(kDefaultTargetPlatform);
  std::string module_version;
  std::chrono::seconds tool_timeout{0};
  toolchain::ToolchainHandle toolchain;
};

struct PipelineResult {
  archive::PackageSet packages;
  std::filesystem::path descriptor_source;
  std::filesystem::path compiled_descriptor;
  std::filesystem::path module_archive;
  std::filesystem::path module_unit;
  std::filesystem::path image_modules_file;
  std::vector<std::string> completed_stages;
};

// Artifact locations derived from a config. Every path is absolute.
struct StageArtifacts {
  std::filesystem::path descriptor_source;
  std::filesystem::path compiled_descriptor;
  std::filesystem::path module_archive;
  std::filesystem::path module_unit;
  std::filesystem::path image_modules_file;
};

StageArtifacts ResolveArtifacts(const PipelineConfig& config);

process::ProcessRequest BuildCompileCommand(const PipelineConfig& config,
                                            const StageArtifacts& artifacts);
process::ProcessRequest BuildPackageCommand(const PipelineConfig& config,
                                            const StageArtifacts& artifacts);
process::ProcessRequest BuildLinkCommand(const PipelineConfig& config,
                                         const StageArtifacts& artifacts);

// Sequences scan -> describe -> compile -> assemble -> package -> link.
// Each step's output is the hard precondition of the next, and the first
// failure aborts the run. Success means the linked image's modules file
// exists.
class ImagePipeline {
public:
  ImagePipeline(PipelineConfig config, process::IProcessRunner& runner,
                core::logging::Logger& logger);

  bool Run(PipelineResult& result, core::errors::Error& error);

  PipelineState State() const {
    return state_;
  }

  const PipelineConfig& Config() const {
    return config_;
  }

private:
  void Transition(PipelineState next);
  bool Fail(core::errors::Error& error);
  bool Describe(PipelineResult& result, core::errors::Error& error);
  bool RunStage(PipelineStage stage, PipelineResult& result, core::errors::Error& error);
  process::LineSink ToolLineSink(const std::filesystem::path& executable);

  PipelineConfig config_;
  StageArtifacts artifacts_;
  process::IProcessRunner& runner_;
  core::logging::Logger& logger_;
  PipelineState state_ = PipelineState::kIdle;
};

} // namespace modforge::pipeline
