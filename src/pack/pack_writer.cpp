#include "pack/pack_writer.hpp"

#include "core/time_utils.hpp"
#include "documents/decoder.hpp"
#include "documents/source_finder.hpp"
#include "hierarchy/normalizer.hpp"
#include "hierarchy/traversal.hpp"
#include "store/pack_store.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;

namespace packforge::pack {

namespace {

using core::json::Value;

// Everything one run accumulates before the commit. Owned by CompileFiles and
// handed to the traversal through PackContext.
struct PackState {
  // Key -> source file that produced it first.
  std::map<std::string, fs::path> seen_keys;
  store::StagedBatch batch;
  ErrorKind failure = ErrorKind::kNone;
};

// Threaded node-to-node by the traversal. `parent_key` is the key of the node
// whose embedded field holds the current node; empty at a document root.
struct PackContext {
  PackState* state = nullptr;
  const fs::path* source = nullptr;
  std::string parent_key;
};

std::string DescribeNode(std::string_view collection, const PackContext& context) {
  std::string where = "collection '" + std::string(collection) + "'";
  if (!context.parent_key.empty()) {
    where += " under '" + context.parent_key + "'";
  }
  return where;
}

std::string StringMember(const Value& document, std::string_view field) {
  const Value* member = core::json::FindMember(document, field);
  if (member == nullptr || !member->IsString()) {
    return "";
  }
  return member->string_value;
}

// Normalizes every node of one document into `state.batch`.
bool PackDocument(const Value& document, const std::string& collection, const fs::path& source,
                  const hierarchy::SchemaRegistry& schema, const hierarchy::DocumentFields& fields,
                  PackState& state, std::uint64_t& entries, std::string& error) {
  auto visit = [&](const Value& node, std::string_view node_collection,
                   const PackContext& context, PackContext& next, std::string& visit_error) {
    std::string key;
    if (!hierarchy::ReadDocumentKey(node, fields, key, visit_error)) {
      context.state->failure = ErrorKind::kSchema;
      visit_error += " (" + DescribeNode(node_collection, context) + ")";
      return false;
    }

    const auto [seen, inserted] = context.state->seen_keys.emplace(key, *context.source);
    if (!inserted) {
      context.state->failure = ErrorKind::kDuplicateKey;
      visit_error = "an entry with key '" + key + "' was already packed from '" +
                    seen->second.string() + "' and would be overwritten by this entry";
      return false;
    }

    Value normalized;
    if (!hierarchy::NormalizeEntry(node, node_collection, schema, fields, normalized,
                                   visit_error)) {
      context.state->failure = ErrorKind::kSchema;
      return false;
    }

    context.state->batch.Put(key, core::json::Serialize(normalized));
    ++entries;
    next.parent_key = std::move(key);
    return true;
  };

  PackContext root_context;
  root_context.state = &state;
  root_context.source = &source;

  if (!hierarchy::Traverse(document, collection, root_context, schema, visit, error)) {
    if (state.failure == ErrorKind::kNone) {
      state.failure = ErrorKind::kSchema;
    }
    return false;
  }
  return true;
}

// Logs the failing file and fills `error` with a file-attributed message.
bool FailFile(ErrorKind kind, const fs::path& file, const std::string& message,
              core::logging::Logger& logger, PackError& error) {
  const std::string path = file.string();
  logger.Error("failed to pack source file",
               {{"file", path}, {"kind", ToString(kind)}, {"error", message}});
  error.Set(kind, "failed to pack '" + path + "': " + message);
  return false;
}

bool FailStore(const std::string& message, core::logging::Logger& logger, PackError& error) {
  logger.Error("pack store operation failed", {{"error", message}});
  error.Set(ErrorKind::kStore, message);
  return false;
}

} // namespace

bool CompilePack(const CompileOptions& options, core::logging::Logger& logger,
                 CompileSummary& summary, PackError& error) {
  std::vector<fs::path> files;
  std::string find_error;
  if (!documents::FindSourceFiles(options.source_dir, options.recursive, files, find_error)) {
    logger.Error("source enumeration failed", {{"error", find_error}});
    error.Set(ErrorKind::kSource, find_error);
    return false;
  }

  logger.Debug("source files enumerated", {{"src", options.source_dir.string()},
                                           {"files", std::to_string(files.size())}});
  return CompileFiles(files, options, logger, summary, error);
}

bool CompileFiles(const std::vector<fs::path>& files, const CompileOptions& options,
                  core::logging::Logger& logger, CompileSummary& summary, PackError& error) {
  error.Clear();
  summary = CompileSummary{};
  const auto started = std::chrono::steady_clock::now();
  const hierarchy::SchemaRegistry& schema =
      options.schema != nullptr ? *options.schema : hierarchy::SchemaRegistry::Default();
  const std::string pack_path = options.pack_path.string();

  logger.Info("compile started", {{"src", options.source_dir.string()},
                                  {"dest", pack_path},
                                  {"files", std::to_string(files.size())}});

  std::unique_ptr<store::PackStore> pack;
  std::string store_error;
  if (!store::PackStore::Open(options.pack_path, pack, store_error)) {
    return FailStore(store_error, logger, error);
  }

  PackState state;
  for (const fs::path& file : files) {
    Value document;
    std::string file_error;
    if (!documents::DecodeDocumentFile(file, document, file_error)) {
      return FailFile(ErrorKind::kDecode, file, file_error, logger, error);
    }
    ++summary.files_read;

    std::string key;
    std::string collection;
    if (!hierarchy::ReadDocumentKey(document, options.fields, key, file_error) ||
        !hierarchy::CollectionFromKey(key, collection, file_error)) {
      return FailFile(ErrorKind::kSchema, file, file_error, logger, error);
    }

    if (options.inclusion_hook && !options.inclusion_hook(document)) {
      ++summary.documents_excluded;
      logger.Debug("document excluded by inclusion hook", {{"key", key}, {"file", file.string()}});
      continue;
    }

    if (!PackDocument(document, collection, file, schema, options.fields, state,
                      summary.entries_written, file_error)) {
      return FailFile(state.failure, file, file_error, logger, error);
    }
    ++summary.documents_packed;

    if (options.verbose) {
      const std::string id = StringMember(document, options.fields.id_field);
      const std::string name = StringMember(document, "name");
      logger.Info("packed document", {{"key", key}, {"id", id}, {"name", name}});
    }
  }

  std::vector<std::string> existing_keys;
  if (!pack->ListKeys(existing_keys, store_error)) {
    return FailStore(store_error, logger, error);
  }
  for (std::string& existing : existing_keys) {
    if (state.seen_keys.count(existing) != 0U) {
      continue;
    }
    if (options.verbose) {
      logger.Info("removed stale entry", {{"key", existing}});
    }
    state.batch.Delete(std::move(existing));
    ++summary.entries_pruned;
  }

  if (!pack->Commit(state.batch, store_error) || !pack->CompactAll(store_error) ||
      !pack->Close(store_error)) {
    return FailStore(store_error, logger, error);
  }

  logger.Info("compile finished",
              {{"dest", pack_path},
               {"documents", std::to_string(summary.documents_packed)},
               {"excluded", std::to_string(summary.documents_excluded)},
               {"entries", std::to_string(summary.entries_written)},
               {"pruned", std::to_string(summary.entries_pruned)},
               {"duration_ms", std::to_string(core::ElapsedMilliseconds(started))}});
  return true;
}

} // namespace packforge::pack
