#pragma once

#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "hierarchy/document_key.hpp"
#include "hierarchy/schema_registry.hpp"
#include "pack/pack_error.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

namespace packforge::pack {

// Called once per source document before it is traversed. The hook may edit
// the document in place; returning false drops the document and its whole
// hierarchy from this run, which also leaves any copy already in the pack
// unprotected from pruning.
using InclusionHook = std::function<bool(core::json::Value& document)>;

struct CompileOptions {
  std::filesystem::path source_dir;
  std::filesystem::path pack_path;
  bool recursive = false;
  // Per-document pack/prune notifications at info level.
  bool verbose = false;
  hierarchy::DocumentFields fields;
  InclusionHook inclusion_hook;
  // nullptr selects SchemaRegistry::Default().
  const hierarchy::SchemaRegistry* schema = nullptr;
};

struct CompileSummary {
  std::uint64_t files_read = 0;
  std::uint64_t documents_packed = 0;
  std::uint64_t documents_excluded = 0;
  std::uint64_t entries_written = 0;
  std::uint64_t entries_pruned = 0;
};

// Enumerates `options.source_dir` and compiles every file found into
// `options.pack_path`. See CompileFiles for the write contract.
bool CompilePack(const CompileOptions& options, core::logging::Logger& logger,
                 CompileSummary& summary, PackError& error);

// Compiles `files`, in the given order, into `options.pack_path`.
//
// Every node of every included document becomes one entry keyed by its key
// field. Pack keys not produced by this run are deleted. Puts and deletes are
// committed in a single atomic batch after all files succeed, then the pack is
// compacted. On any failure nothing is written and the pack is left exactly as
// it was.
bool CompileFiles(const std::vector<std::filesystem::path>& files, const CompileOptions& options,
                  core::logging::Logger& logger, CompileSummary& summary, PackError& error);

} // namespace packforge::pack
