#include "hierarchy/document_key.hpp"

namespace packforge::hierarchy {

bool ReadDocumentKey(const core::json::Value& node, const DocumentFields& fields, std::string& key,
                     std::string& error) {
  if (!node.IsObject()) {
    error = "embedded document must be an object";
    return false;
  }

  const core::json::Value* field = core::json::FindMember(node, fields.key_field);
  if (field == nullptr) {
    error = "document is missing required field '" + fields.key_field + "'";
    return false;
  }
  if (!field->IsString() || field->string_value.empty()) {
    error = "document field '" + fields.key_field + "' must be a non-empty string";
    return false;
  }

  key = field->string_value;
  return true;
}

bool CollectionFromKey(std::string_view key, std::string& collection, std::string& error) {
  const std::size_t first = key.find(kKeySegmentDelimiter);
  if (first == std::string_view::npos) {
    error = "document key '" + std::string(key) + "' has no '" + kKeySegmentDelimiter +
            "'-delimited collection segment";
    return false;
  }

  const std::size_t second = key.find(kKeySegmentDelimiter, first + 1U);
  const std::string_view segment =
      second == std::string_view::npos ? key.substr(first + 1U)
                                       : key.substr(first + 1U, second - first - 1U);
  collection.assign(segment);
  return true;
}

} // namespace packforge::hierarchy
