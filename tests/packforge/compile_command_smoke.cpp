#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/pack_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "core/errors/exit_codes.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using namespace packforge::tests::common;
using packforge::core::errors::ExitCode;
using packforge::core::errors::ToInt;

int main() {
  const fs::path root = CreateUniqueTempDir("packforge-compile-command");
  const fs::path src = root / "src";
  const fs::path pack_path = root / "pack";

  WriteSourceFile(src / "hero.json", R"({"_key":"!actors!A1","_id":"A1","name":"Hero"})");
  WriteSourceFile(src / "nested" / "sword.yaml", "_key: '!items!I1'\n_id: I1\nname: Sword\n");

  // Flat compile with custom field names only sees the top-level file.
  DispatchResult flat = DispatchCaptured({"packforge", "compile", src.string(), pack_path.string(),
                                          "--key-field", "_key", "--id-field", "_id"});
  Assert(flat.exit_code == ToInt(ExitCode::kSuccess), "flat compile should succeed");
  AssertContains(flat.stdout_text, "compiled: " + pack_path.string() + " (1 entries, 0 pruned)");
  AssertEntry(ReadPackEntries(pack_path), "!actors!A1",
              R"({"_id":"A1","effects":[],"items":[],"name":"Hero"})");

  DispatchResult recursive =
      DispatchCaptured({"packforge", "compile", src.string(), pack_path.string(), "--recursive",
                        "--key-field", "_key", "--id-field", "_id", "--log-level", "warn"});
  Assert(recursive.exit_code == ToInt(ExitCode::kSuccess), "recursive compile should succeed");
  AssertContains(recursive.stdout_text, "(2 entries, 0 pruned)");
  AssertNotContains(recursive.stderr_text, "compile finished");
  Assert(ReadPackEntries(pack_path).size() == 2U, "recursive compile should pack both files");

  // Default field names do not match these documents.
  DispatchResult schema_failure =
      DispatchCaptured({"packforge", "compile", src.string(), pack_path.string()});
  Assert(schema_failure.exit_code == ToInt(ExitCode::kSchemaInvalid),
         "missing key field should map to the schema exit code");
  AssertContains(schema_failure.stderr_text, "error: failed to pack");
  Assert(ReadPackEntries(pack_path).size() == 2U, "failed compile must not change the pack");

  DispatchResult missing_source = DispatchCaptured(
      {"packforge", "compile", (root / "nope").string(), pack_path.string()});
  Assert(missing_source.exit_code == ToInt(ExitCode::kSourceUnavailable),
         "missing source directory should map to the source exit code");

  DispatchResult too_few = DispatchCaptured({"packforge", "compile", src.string()});
  Assert(too_few.exit_code == ToInt(ExitCode::kUsage), "one positional should be a usage error");
  AssertContains(too_few.stderr_text, "exactly 2 arguments");
  AssertContains(too_few.stderr_text, "usage:");

  DispatchResult unknown_flag =
      DispatchCaptured({"packforge", "compile", src.string(), pack_path.string(), "--fast"});
  Assert(unknown_flag.exit_code == ToInt(ExitCode::kUsage), "unknown flag should be rejected");
  AssertContains(unknown_flag.stderr_text, "unknown option: --fast");

  DispatchResult bad_level = DispatchCaptured(
      {"packforge", "compile", src.string(), pack_path.string(), "--log-level", "loud"});
  Assert(bad_level.exit_code == ToInt(ExitCode::kUsage), "invalid log level should be rejected");

  DispatchResult version = DispatchCaptured({"packforge", "version"});
  Assert(version.exit_code == ToInt(ExitCode::kSuccess), "version should succeed");
  AssertContains(version.stdout_text, "packforge ");

  DispatchResult unknown = DispatchCaptured({"packforge", "explode"});
  Assert(unknown.exit_code == ToInt(ExitCode::kUsage), "unknown subcommand is a usage error");
  AssertContains(unknown.stderr_text, "unknown subcommand: explode");

  RemovePathBestEffort(root);
  return 0;
}
