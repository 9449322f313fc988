#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/pack_fixtures.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using namespace packforge::tests::common;

int main() {
  const fs::path root = CreateUniqueTempDir("packforge-logging-contract");
  const fs::path src = root / "src";
  const fs::path pack_path = root / "pack";
  WriteSourceFile(src / "hero.json", R"({"key":"w!actors!A1","id":"A1"})");

  DispatchResult debug = DispatchCaptured({"packforge", "compile", src.string(),
                                           pack_path.string(), "--log-level", "debug"});
  if (debug.exit_code != 0) {
    Fail("debug compile failed: " + debug.stderr_text);
  }

  // Every line is key=value with timestamp, level, pack and message first.
  AssertContains(debug.stderr_text, "ts_utc=");
  AssertContains(debug.stderr_text, "level=DEBUG");
  AssertContains(debug.stderr_text, "level=INFO");
  AssertContains(debug.stderr_text, "pack=\"" + pack_path.string() + "\"");
  AssertContains(debug.stderr_text, "msg=\"source files enumerated\"");
  AssertContains(debug.stderr_text, "msg=\"compile started\"");
  AssertContains(debug.stderr_text, "msg=\"compile finished\"");
  AssertContains(debug.stderr_text, "duration_ms=");

  DispatchResult quiet = DispatchCaptured({"packforge", "compile", src.string(),
                                           pack_path.string(), "--log-level", "error"});
  if (quiet.exit_code != 0) {
    Fail("error-level compile failed: " + quiet.stderr_text);
  }
  AssertNotContains(quiet.stderr_text, "level=INFO");
  AssertNotContains(quiet.stderr_text, "level=DEBUG");

  WriteSourceFile(src / "broken.json", "not json");
  DispatchResult failed = DispatchCaptured({"packforge", "compile", src.string(),
                                            pack_path.string(), "--log-level", "error"});
  if (failed.exit_code == 0) {
    Fail("compile of malformed source should fail");
  }
  AssertContains(failed.stderr_text, "level=ERROR");
  AssertContains(failed.stderr_text, "msg=\"failed to pack source file\"");
  AssertContains(failed.stderr_text, "kind=\"decode_error\"");
  AssertContains(failed.stderr_text, "error: failed to pack '");

  RemovePathBestEffort(root);
  return 0;
}
