#pragma once

#include "core/json_dom.hpp"
#include "hierarchy/schema_registry.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace packforge::hierarchy {

// Matches the decoder's nesting limit, so every document that decodes can be
// traversed; the check only guards trees built in memory.
inline constexpr std::size_t kMaxTraversalDepth = core::json::kMaxNestingDepth;

namespace detail {

template <typename Context, typename Visit>
bool TraverseNode(const core::json::Value& node, std::string_view collection,
                  const Context& context, const SchemaRegistry& schema, Visit& visit,
                  std::vector<const core::json::Value*>& path, std::string& error) {
  if (std::find(path.begin(), path.end(), &node) != path.end()) {
    error = "cyclic embedding detected while entering collection '" + std::string(collection) +
            "'";
    return false;
  }
  if (path.size() >= kMaxTraversalDepth) {
    error = "document hierarchy exceeds maximum depth of " + std::to_string(kMaxTraversalDepth) +
            " at collection '" + std::string(collection) + "'";
    return false;
  }

  Context next = context;
  if (!visit(node, collection, context, next, error)) {
    return false;
  }

  path.push_back(&node);
  for (const EmbeddedField& field : schema.EmbeddedFields(collection)) {
    const core::json::Value* embedded = core::json::FindMember(node, field.name);
    if (embedded == nullptr) {
      continue;
    }

    if (field.kind == EmbedKind::kSequence) {
      if (!embedded->IsArray()) {
        continue;
      }
      for (const core::json::Value& child : embedded->array_value) {
        if (!TraverseNode(child, field.name, next, schema, visit, path, error)) {
          return false;
        }
      }
    } else if (!embedded->IsNull()) {
      if (!TraverseNode(*embedded, field.name, next, schema, visit, path, error)) {
        return false;
      }
    }
  }
  path.pop_back();

  return true;
}

} // namespace detail

// Walks `root` and every embedded descendant depth-first, pre-order.
//
// `visit` has the shape
//   bool(const core::json::Value& node, std::string_view collection,
//        const Context& context, Context& next, std::string& error)
// and runs on a node before any of its children. `next` starts as a copy of
// `context`; whatever the visitor leaves in it is handed to every child of the
// node. Children of a Sequence field are visited in source order, each with
// the field name as its collection. Absent, null and non-array Sequence values
// produce no visits. The first failing visit stops the walk.
template <typename Context, typename Visit>
bool Traverse(const core::json::Value& root, std::string_view collection, const Context& context,
              const SchemaRegistry& schema, Visit&& visit, std::string& error) {
  std::vector<const core::json::Value*> path;
  return detail::TraverseNode(root, collection, context, schema, visit, path, error);
}

} // namespace packforge::hierarchy
