#pragma once

#include "core/logging/logger.hpp"
#include "pack/pack_writer.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace packforge::cli {

// Options shared by `packforge compile` and `packforge action`. Both commands
// resolve their inputs into this one struct before running the same compile.
struct CompileCommandOptions {
  pack::CompileOptions compile;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Parses `compile` arguments: <src-dir> <dest-pack> plus optional flags.
bool ParseCompileArgs(const std::vector<std::string_view>& args, CompileCommandOptions& options,
                      std::string& error);

// Reads CI action inputs from the environment: INPUT_SRC and INPUT_DEST are
// required; INPUT_RECURSIVE, INPUT_VERBOSE, INPUT_KEY_FIELD, INPUT_ID_FIELD
// and INPUT_LOG_LEVEL are optional.
bool LoadActionInputs(CompileCommandOptions& options, std::string& error);

// Routes `packforge` subcommands and returns process exit codes with a stable
// contract for scripts and CI:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10+ => compile failure class, see core/errors/exit_codes.hpp
int Dispatch(int argc, char** argv);

} // namespace packforge::cli
