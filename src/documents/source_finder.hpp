#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace packforge::documents {

// Collects every regular file directly under `root`, and under its
// subdirectories when `recursive` is set. The result is sorted by path so
// compile order, and therefore duplicate-key attribution, does not depend on
// directory iteration order.
bool FindSourceFiles(const std::filesystem::path& root, bool recursive,
                     std::vector<std::filesystem::path>& files, std::string& error);

} // namespace packforge::documents
