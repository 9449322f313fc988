#pragma once

#include "core/json_dom.hpp"
#include "hierarchy/document_key.hpp"
#include "hierarchy/schema_registry.hpp"

#include <string>
#include <string_view>

namespace packforge::hierarchy {

// Identifier used to reference `child` from its parent: the child's id field,
// or null when the child has none.
core::json::Value ChildIdentifier(const core::json::Value& child, const DocumentFields& fields);

// Builds the persisted value of one node of `collection`.
//
// The result is a copy of `document` without its key field, where every
// embedded field declared for the collection is replaced by references:
//   - Sequence: array of ChildIdentifier(child) in source order; an empty
//     array when the field is absent, null or not an array.
//   - Singleton: ChildIdentifier(child), or null when absent or null.
// Only direct embedded fields are rewritten. Children are persisted as their
// own entries by the caller.
bool NormalizeEntry(const core::json::Value& document, std::string_view collection,
                    const SchemaRegistry& schema, const DocumentFields& fields,
                    core::json::Value& normalized, std::string& error);

} // namespace packforge::hierarchy
