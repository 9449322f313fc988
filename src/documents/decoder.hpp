#pragma once

#include "core/json_dom.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace packforge::documents {

enum class SourceFormat {
  kJson,
  kYaml,
};

const char* ToString(SourceFormat format);

// `.yml` and `.yaml` (any case) are YAML; every other file is read as JSON.
SourceFormat DetectSourceFormat(const std::filesystem::path& path);

// Parses one source document. The top-level value must be a mapping/object.
bool DecodeDocumentText(std::string_view text, SourceFormat format, core::json::Value& document,
                        std::string& error);

bool DecodeDocumentFile(const std::filesystem::path& path, core::json::Value& document,
                        std::string& error);

} // namespace packforge::documents
