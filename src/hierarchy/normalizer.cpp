#include "hierarchy/normalizer.hpp"

#include <utility>
#include <vector>

namespace packforge::hierarchy {

using core::json::Value;

namespace {

bool IsEmbeddedField(const std::vector<EmbeddedField>& embedded_fields, std::string_view name) {
  for (const EmbeddedField& field : embedded_fields) {
    if (field.name == name) {
      return true;
    }
  }
  return false;
}

} // namespace

Value ChildIdentifier(const Value& child, const DocumentFields& fields) {
  const Value* id = core::json::FindMember(child, fields.id_field);
  if (id == nullptr) {
    return core::json::MakeNull();
  }
  return *id;
}

bool NormalizeEntry(const Value& document, std::string_view collection,
                    const SchemaRegistry& schema, const DocumentFields& fields,
                    Value& normalized, std::string& error) {
  if (!document.IsObject()) {
    error = "cannot normalize a non-object document of collection '" + std::string(collection) +
            "'";
    return false;
  }

  const std::vector<EmbeddedField>& embedded_fields = schema.EmbeddedFields(collection);

  // Embedded subtrees are replaced by references below, so they are never
  // copied into the parent's value.
  Value entry = core::json::MakeObject();
  for (const auto& [name, member] : document.object_value) {
    if (name == fields.key_field || IsEmbeddedField(embedded_fields, name)) {
      continue;
    }
    entry.object_value.emplace(name, member);
  }

  for (const EmbeddedField& field : embedded_fields) {
    const Value* embedded = core::json::FindMember(document, field.name);

    if (field.kind == EmbedKind::kSequence) {
      Value references = core::json::MakeArray();
      if (embedded != nullptr && embedded->IsArray()) {
        references.array_value.reserve(embedded->array_value.size());
        for (const Value& child : embedded->array_value) {
          references.array_value.push_back(ChildIdentifier(child, fields));
        }
      }
      entry.object_value[field.name] = std::move(references);
    } else {
      entry.object_value[field.name] = (embedded != nullptr && !embedded->IsNull())
                                           ? ChildIdentifier(*embedded, fields)
                                           : core::json::MakeNull();
    }
  }

  normalized = std::move(entry);
  return true;
}

} // namespace packforge::hierarchy
