#include "documents/source_finder.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace packforge::documents {

namespace {

bool CollectDirectory(const fs::path& dir, bool recursive, std::vector<fs::path>& files,
                      std::string& error) {
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    error = "unable to list source directory '" + dir.string() + "': " + ec.message();
    return false;
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    const fs::directory_entry& entry = *it;
    std::error_code type_ec;
    if (entry.is_directory(type_ec)) {
      // Symlinked directories are not followed; they can loop back on root.
      if (recursive && !entry.is_symlink(type_ec) &&
          !CollectDirectory(entry.path(), recursive, files, error)) {
        return false;
      }
      continue;
    }
    if (entry.is_regular_file(type_ec)) {
      files.push_back(entry.path());
    }
  }

  if (ec) {
    error = "failed while listing source directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

} // namespace

bool FindSourceFiles(const fs::path& root, bool recursive, std::vector<fs::path>& files,
                     std::string& error) {
  files.clear();
  if (root.empty()) {
    error = "source directory path cannot be empty";
    return false;
  }

  std::error_code ec;
  if (!fs::exists(root, ec) || ec) {
    error = "source directory not found: " + root.string();
    return false;
  }
  if (!fs::is_directory(root, ec) || ec) {
    error = "source path must point to a directory: " + root.string();
    return false;
  }

  if (!CollectDirectory(root, recursive, files, error)) {
    files.clear();
    return false;
  }

  std::sort(files.begin(), files.end());
  return true;
}

} // namespace packforge::documents
