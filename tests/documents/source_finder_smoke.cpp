#include "../common/assertions.hpp"
#include "../common/pack_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "documents/source_finder.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace packforge::tests::common;

namespace {

std::vector<std::string> RelativeNames(const fs::path& root, const std::vector<fs::path>& files) {
  std::vector<std::string> names;
  for (const fs::path& file : files) {
    names.push_back(fs::relative(file, root).generic_string());
  }
  return names;
}

} // namespace

int main() {
  const fs::path root = CreateUniqueTempDir("packforge-source-finder");
  const fs::path src = root / "src";

  WriteSourceFile(src / "b_hero.json", "{}");
  WriteSourceFile(src / "a_villain.yml", "{}");
  WriteSourceFile(src / "notes.txt", "{}");
  WriteSourceFile(src / "nested" / "c_sword.json", "{}");
  WriteSourceFile(src / "nested" / "deeper" / "d_shield.yaml", "{}");

  std::vector<fs::path> files;
  std::string error;

  // Top level only: nested directories are ignored and every file is returned
  // regardless of extension.
  if (!packforge::documents::FindSourceFiles(src, false, files, error)) {
    Fail("non-recursive enumeration failed: " + error);
  }
  const std::vector<std::string> flat = RelativeNames(src, files);
  Assert(flat == std::vector<std::string>{"a_villain.yml", "b_hero.json", "notes.txt"},
         "non-recursive enumeration returned unexpected files");

  if (!packforge::documents::FindSourceFiles(src, true, files, error)) {
    Fail("recursive enumeration failed: " + error);
  }
  const std::vector<std::string> deep = RelativeNames(src, files);
  Assert(deep == std::vector<std::string>{"a_villain.yml", "b_hero.json",
                                          "nested/c_sword.json", "nested/deeper/d_shield.yaml",
                                          "notes.txt"},
         "recursive enumeration returned unexpected files");

  // An empty directory is valid and yields no files.
  const fs::path empty = root / "empty";
  fs::create_directories(empty);
  if (!packforge::documents::FindSourceFiles(empty, true, files, error)) {
    Fail("empty directory enumeration failed: " + error);
  }
  Assert(files.empty(), "empty directory should yield no files");

  error.clear();
  if (packforge::documents::FindSourceFiles(root / "missing", false, files, error)) {
    Fail("missing source directory should fail");
  }
  AssertContains(error, "not found");

  error.clear();
  if (packforge::documents::FindSourceFiles(src / "b_hero.json", false, files, error)) {
    Fail("file passed as source directory should fail");
  }
  AssertContains(error, "directory");

  RemovePathBestEffort(root);
  return 0;
}
