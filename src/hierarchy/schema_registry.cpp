#include "hierarchy/schema_registry.hpp"

#include <set>
#include <utility>

namespace packforge::hierarchy {

namespace {

EmbeddedField Sequence(std::string name) {
  return EmbeddedField{std::move(name), EmbedKind::kSequence};
}

EmbeddedField Singleton(std::string name) {
  return EmbeddedField{std::move(name), EmbedKind::kSingleton};
}

SchemaRegistry BuildDefaultRegistry() {
  std::vector<CollectionDescriptor> descriptors;
  descriptors.reserve(kAllDocumentCollections.size());
  for (const DocumentCollection collection : kAllDocumentCollections) {
    descriptors.push_back(DescribeCollection(collection));
  }

  SchemaRegistry registry;
  std::string error;
  // The built-in table is fixed at compile time; Create only fails on
  // duplicate or empty names, which the table does not contain.
  (void)SchemaRegistry::Create(std::move(descriptors), registry, error);
  return registry;
}

} // namespace

const char* ToString(EmbedKind kind) {
  switch (kind) {
  case EmbedKind::kSequence:
    return "sequence";
  case EmbedKind::kSingleton:
    return "singleton";
  }
  return "sequence";
}

const char* ToString(DocumentCollection collection) {
  switch (collection) {
  case DocumentCollection::kActors:
    return "actors";
  case DocumentCollection::kCards:
    return "cards";
  case DocumentCollection::kCombats:
    return "combats";
  case DocumentCollection::kDelta:
    return "delta";
  case DocumentCollection::kItems:
    return "items";
  case DocumentCollection::kJournal:
    return "journal";
  case DocumentCollection::kPlaylists:
    return "playlists";
  case DocumentCollection::kRegions:
    return "regions";
  case DocumentCollection::kTables:
    return "tables";
  case DocumentCollection::kTokens:
    return "tokens";
  case DocumentCollection::kScenes:
    return "scenes";
  }
  return "actors";
}

std::optional<DocumentCollection> ParseDocumentCollection(std::string_view name) {
  for (const DocumentCollection collection : kAllDocumentCollections) {
    if (name == ToString(collection)) {
      return collection;
    }
  }
  return std::nullopt;
}

CollectionDescriptor DescribeCollection(DocumentCollection collection) {
  CollectionDescriptor descriptor;
  descriptor.name = ToString(collection);

  switch (collection) {
  case DocumentCollection::kActors:
  case DocumentCollection::kDelta:
    descriptor.fields = {Sequence("items"), Sequence("effects")};
    break;
  case DocumentCollection::kCards:
    descriptor.fields = {Sequence("cards")};
    break;
  case DocumentCollection::kCombats:
    descriptor.fields = {Sequence("combatants")};
    break;
  case DocumentCollection::kItems:
    descriptor.fields = {Sequence("effects")};
    break;
  case DocumentCollection::kJournal:
    descriptor.fields = {Sequence("pages")};
    break;
  case DocumentCollection::kPlaylists:
    descriptor.fields = {Sequence("sounds")};
    break;
  case DocumentCollection::kRegions:
    descriptor.fields = {Sequence("behaviors")};
    break;
  case DocumentCollection::kTables:
    descriptor.fields = {Sequence("results")};
    break;
  case DocumentCollection::kTokens:
    descriptor.fields = {Singleton("delta")};
    break;
  case DocumentCollection::kScenes:
    descriptor.fields = {Sequence("drawings"), Sequence("tokens"),    Sequence("lights"),
                         Sequence("notes"),    Sequence("regions"),   Sequence("sounds"),
                         Sequence("templates"), Sequence("tiles"),    Sequence("walls")};
    break;
  }

  return descriptor;
}

bool SchemaRegistry::Create(std::vector<CollectionDescriptor> descriptors, SchemaRegistry& registry,
                            std::string& error) {
  SchemaRegistry built;
  for (std::size_t i = 0; i < descriptors.size(); ++i) {
    const CollectionDescriptor& descriptor = descriptors[i];
    if (descriptor.name.empty()) {
      error = "collection descriptor at index " + std::to_string(i) + " has an empty name";
      return false;
    }
    if (!built.index_.emplace(descriptor.name, i).second) {
      error = "collection '" + descriptor.name + "' is described more than once";
      return false;
    }

    std::set<std::string_view> field_names;
    for (const EmbeddedField& field : descriptor.fields) {
      if (field.name.empty()) {
        error = "collection '" + descriptor.name + "' declares an embedded field with no name";
        return false;
      }
      if (!field_names.insert(field.name).second) {
        error = "collection '" + descriptor.name + "' declares embedded field '" + field.name +
                "' more than once";
        return false;
      }
    }
  }

  built.descriptors_ = std::move(descriptors);
  registry = std::move(built);
  return true;
}

const SchemaRegistry& SchemaRegistry::Default() {
  static const SchemaRegistry registry = BuildDefaultRegistry();
  return registry;
}

const CollectionDescriptor* SchemaRegistry::Find(std::string_view collection) const {
  const auto it = index_.find(collection);
  if (it == index_.end()) {
    return nullptr;
  }
  return &descriptors_[it->second];
}

const std::vector<EmbeddedField>& SchemaRegistry::EmbeddedFields(
    std::string_view collection) const {
  static const std::vector<EmbeddedField> kNoFields;
  const CollectionDescriptor* descriptor = Find(collection);
  return descriptor == nullptr ? kNoFields : descriptor->fields;
}

} // namespace packforge::hierarchy
