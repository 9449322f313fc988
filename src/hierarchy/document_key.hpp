#pragma once

#include "core/json_dom.hpp"

#include <string>
#include <string_view>

namespace packforge::hierarchy {

inline constexpr char kKeySegmentDelimiter = '!';

// Field names that carry a node's store key and its identifier. The content
// system this tool feeds spells them `_key`/`_id`; plain `key`/`id` is the
// default.
struct DocumentFields {
  std::string key_field = "key";
  std::string id_field = "id";
};

// Reads the compound store key of `node`. Fails when the node is not an
// object or the key field is missing, non-string or empty.
bool ReadDocumentKey(const core::json::Value& node, const DocumentFields& fields, std::string& key,
                     std::string& error);

// Collection named by the second `!` segment of `key`, e.g. "actors" for
// "world!actors!A1". Fails when the key has no `!` at all. An empty segment,
// as in "w!!A1", names a collection without embedded fields.
bool CollectionFromKey(std::string_view key, std::string& collection, std::string& error);

} // namespace packforge::hierarchy
