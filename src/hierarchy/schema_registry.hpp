#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace packforge::hierarchy {

// How an embedded field holds its children.
enum class EmbedKind {
  kSequence,
  kSingleton,
};

const char* ToString(EmbedKind kind);

// Collections of the built-in content hierarchy. The embedded field that holds
// children of a collection is named after that child collection.
enum class DocumentCollection {
  kActors,
  kCards,
  kCombats,
  kDelta,
  kItems,
  kJournal,
  kPlaylists,
  kRegions,
  kTables,
  kTokens,
  kScenes,
};

inline constexpr std::array<DocumentCollection, 11> kAllDocumentCollections = {
    DocumentCollection::kActors,   DocumentCollection::kCards,   DocumentCollection::kCombats,
    DocumentCollection::kDelta,    DocumentCollection::kItems,   DocumentCollection::kJournal,
    DocumentCollection::kPlaylists, DocumentCollection::kRegions, DocumentCollection::kTables,
    DocumentCollection::kTokens,   DocumentCollection::kScenes,
};

const char* ToString(DocumentCollection collection);
std::optional<DocumentCollection> ParseDocumentCollection(std::string_view name);

struct EmbeddedField {
  std::string name;
  EmbedKind kind = EmbedKind::kSequence;
};

struct CollectionDescriptor {
  std::string name;
  std::vector<EmbeddedField> fields;
};

// Built-in descriptor for one collection of the default hierarchy.
CollectionDescriptor DescribeCollection(DocumentCollection collection);

// Immutable lookup from collection name to its embedded fields. Field order is
// the declaration order of the descriptor and drives traversal order.
class SchemaRegistry {
public:
  SchemaRegistry() = default;

  // Validates and indexes `descriptors`: names must be non-empty, collections
  // unique, and field names unique within a collection.
  static bool Create(std::vector<CollectionDescriptor> descriptors, SchemaRegistry& registry,
                     std::string& error);

  // Process-wide registry built from every DocumentCollection.
  static const SchemaRegistry& Default();

  const CollectionDescriptor* Find(std::string_view collection) const;

  // Embedded fields of `collection`; empty for collections without a
  // descriptor, which therefore have no embedded children.
  const std::vector<EmbeddedField>& EmbeddedFields(std::string_view collection) const;

  const std::vector<CollectionDescriptor>& Collections() const {
    return descriptors_;
  }

private:
  std::vector<CollectionDescriptor> descriptors_;
  std::map<std::string, std::size_t, std::less<>> index_;
};

} // namespace packforge::hierarchy
