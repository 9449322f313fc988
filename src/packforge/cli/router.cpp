#include "packforge/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "pack/pack_error.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace packforge::cli {

namespace {

constexpr std::string_view kVersion = "packforge 0.1.0";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  packforge compile <src-dir> <dest-pack> [--recursive] [--verbose] "
         "[--key-field <name>] [--id-field <name>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  packforge action\n"
      << "  packforge version\n";
}

std::optional<std::string> ReadEnv(const char* name) {
  const char* raw = std::getenv(name);
  if (raw == nullptr) {
    return std::nullopt;
  }
  return std::string(raw);
}

std::string Trim(std::string_view text) {
  const auto is_space = [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return std::string(text);
}

// Action inputs arrive as strings; an unset or blank input keeps the default.
bool ParseBoolInput(const char* name, bool& value, std::string& error) {
  const std::optional<std::string> raw = ReadEnv(name);
  if (!raw.has_value()) {
    return true;
  }

  std::string normalized = Trim(*raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (normalized.empty()) {
    return true;
  }
  if (normalized == "true") {
    value = true;
    return true;
  }
  if (normalized == "false") {
    value = false;
    return true;
  }

  error = std::string("invalid value for ") + name + ": '" + *raw + "' (expected true|false)";
  return false;
}

// Escapes a message for the runner's `::error::` workflow command, which
// treats '%', CR and LF as control characters.
std::string EscapeWorkflowCommand(std::string_view message) {
  std::string escaped;
  escaped.reserve(message.size());
  for (const char c : message) {
    switch (c) {
    case '%':
      escaped += "%25";
      break;
    case '\r':
      escaped += "%0D";
      break;
    case '\n':
      escaped += "%0A";
      break;
    default:
      escaped.push_back(c);
      break;
    }
  }
  return escaped;
}

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view flag,
               std::string& value, std::string& error) {
  if (i + 1 >= args.size() || args[i + 1].empty()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = std::string(args[i + 1]);
  ++i;
  return true;
}

int RunCompile(const CompileCommandOptions& options, pack::CompileSummary& summary,
               pack::PackError& error) {
  core::logging::Logger logger(options.log_level);
  logger.SetPack(options.compile.pack_path.string());
  if (!pack::CompilePack(options.compile, logger, summary, error)) {
    return core::errors::ToInt(pack::ToExitCode(error.kind));
  }
  return kExitSuccess;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << kVersion << '\n';
  return kExitSuccess;
}

int CommandCompile(const std::vector<std::string_view>& args) {
  CompileCommandOptions options;
  std::string error;
  if (!ParseCompileArgs(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  pack::CompileSummary summary;
  pack::PackError pack_error;
  const int exit_code = RunCompile(options, summary, pack_error);
  if (exit_code != kExitSuccess) {
    std::cerr << "error: " << pack_error.message << '\n';
    return exit_code;
  }

  std::cout << "compiled: " << options.compile.pack_path.string() << " ("
            << summary.entries_written << " entries, " << summary.entries_pruned << " pruned)\n";
  return kExitSuccess;
}

// CI entrypoint: inputs come from the environment and every failure is
// surfaced as a fatal `::error::` status line on stdout.
int CommandAction(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: action does not accept arguments\n";
    return kExitUsage;
  }

  CompileCommandOptions options;
  std::string error;
  if (!LoadActionInputs(options, error)) {
    std::cout << "::error::" << EscapeWorkflowCommand(error) << '\n';
    return kExitUsage;
  }

  std::cout << "Compiling " << options.compile.source_dir.string() << " to "
            << options.compile.pack_path.string() << "!\n";

  pack::CompileSummary summary;
  pack::PackError pack_error;
  const int exit_code = RunCompile(options, summary, pack_error);
  if (exit_code != kExitSuccess) {
    std::cout << "::error::" << EscapeWorkflowCommand(pack_error.message) << '\n';
  }
  return exit_code;
}

} // namespace

bool ParseCompileArgs(const std::vector<std::string_view>& args, CompileCommandOptions& options,
                      std::string& error) {
  std::vector<std::string_view> positionals;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--recursive") {
      options.compile.recursive = true;
      continue;
    }
    if (token == "--verbose") {
      options.compile.verbose = true;
      continue;
    }
    if (token == "--key-field") {
      if (!TakeValue(args, i, token, options.compile.fields.key_field, error)) {
        return false;
      }
      continue;
    }
    if (token == "--id-field") {
      if (!TakeValue(args, i, token, options.compile.fields.id_field, error)) {
        return false;
      }
      continue;
    }
    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level";
        return false;
      }
      if (!core::logging::ParseLogLevel(args[i + 1], options.log_level, error)) {
        return false;
      }
      ++i;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    positionals.push_back(token);
  }

  if (positionals.size() != 2U) {
    error = "compile requires exactly 2 arguments: <src-dir> <dest-pack>";
    return false;
  }
  if (positionals[0].empty() || positionals[1].empty()) {
    error = "source and destination paths cannot be empty";
    return false;
  }

  options.compile.source_dir = fs::path(positionals[0]);
  options.compile.pack_path = fs::path(positionals[1]);
  return true;
}

bool LoadActionInputs(CompileCommandOptions& options, std::string& error) {
  const std::string src = Trim(ReadEnv("INPUT_SRC").value_or(""));
  const std::string dest = Trim(ReadEnv("INPUT_DEST").value_or(""));
  if (src.empty()) {
    error = "Input required and not supplied: src";
    return false;
  }
  if (dest.empty()) {
    error = "Input required and not supplied: dest";
    return false;
  }
  options.compile.source_dir = fs::path(src);
  options.compile.pack_path = fs::path(dest);

  if (!ParseBoolInput("INPUT_RECURSIVE", options.compile.recursive, error) ||
      !ParseBoolInput("INPUT_VERBOSE", options.compile.verbose, error)) {
    return false;
  }

  const std::string key_field = Trim(ReadEnv("INPUT_KEY_FIELD").value_or(""));
  if (!key_field.empty()) {
    options.compile.fields.key_field = key_field;
  }
  const std::string id_field = Trim(ReadEnv("INPUT_ID_FIELD").value_or(""));
  if (!id_field.empty()) {
    options.compile.fields.id_field = id_field;
  }

  const std::string log_level = Trim(ReadEnv("INPUT_LOG_LEVEL").value_or(""));
  if (!log_level.empty() &&
      !core::logging::ParseLogLevel(log_level, options.log_level, error)) {
    return false;
  }
  return true;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "compile") {
    return CommandCompile(args);
  }

  if (command == "action") {
    return CommandAction(args);
  }

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace packforge::cli
