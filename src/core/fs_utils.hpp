#ifndef PACKFORGE_CORE_FS_UTILS_HPP_
#define PACKFORGE_CORE_FS_UTILS_HPP_

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace packforge::core {

// Creates `dir` and any missing parents. An existing directory is success; an
// existing non-directory at that path is not.
inline bool EnsureDirectory(const std::filesystem::path& dir, std::string& error) {
  if (dir.empty()) {
    error = "directory path cannot be empty";
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create directory '" + dir.string() + "': " + ec.message();
    return false;
  }

  if (!std::filesystem::is_directory(dir, ec) || ec) {
    error = "path exists but is not a directory: " + dir.string();
    return false;
  }

  return true;
}

// Reads a whole file as raw bytes. Source documents are UTF-8 and decoded
// later, so no newline translation happens here.
inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read file: " + path.string();
    return false;
  }

  contents.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    error = "failed while reading file: " + path.string();
    return false;
  }
  return true;
}

} // namespace packforge::core

#endif // PACKFORGE_CORE_FS_UTILS_HPP_
