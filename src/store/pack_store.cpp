#include "store/pack_store.hpp"

#include "core/fs_utils.hpp"

#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/status.h>
#include <rocksdb/write_batch.h>

namespace fs = std::filesystem;

namespace packforge::store {

namespace {

std::string StatusError(std::string_view operation, const rocksdb::Status& status) {
  return "pack store " + std::string(operation) + " failed: " + status.ToString();
}

rocksdb::ReadOptions ScanReadOptions() {
  rocksdb::ReadOptions options;
  // Full-range scans during prune and compaction must not evict hot blocks.
  options.fill_cache = false;
  return options;
}

} // namespace

PackStore::PackStore(fs::path path, std::unique_ptr<rocksdb::DB> db)
    : path_(std::move(path)), db_(std::move(db)) {}

PackStore::~PackStore() {
  std::string ignored;
  // Failures here have no caller to report to; callers that care use Close().
  (void)Close(ignored);
}

bool PackStore::Open(const fs::path& path, std::unique_ptr<PackStore>& store, std::string& error) {
  if (path.empty()) {
    error = "pack path cannot be empty";
    return false;
  }
  if (!core::EnsureDirectory(path, error)) {
    return false;
  }

  rocksdb::Options options;
  options.create_if_missing = true;

  rocksdb::DB* raw_db = nullptr;
  const rocksdb::Status status = rocksdb::DB::Open(options, path.string(), &raw_db);
  std::unique_ptr<rocksdb::DB> db(raw_db);
  if (!status.ok()) {
    error = StatusError("open of '" + path.string() + "'", status);
    return false;
  }

  store = std::make_unique<PackStore>(path, std::move(db));
  return true;
}

bool PackStore::RequireOpen(std::string_view operation, std::string& error) const {
  if (db_ != nullptr) {
    return true;
  }
  error = "pack store " + std::string(operation) + " failed: store is closed";
  return false;
}

bool PackStore::Get(std::string_view key, std::optional<std::string>& value,
                    std::string& error) const {
  value.reset();
  if (!RequireOpen("get", error)) {
    return false;
  }

  std::string bytes;
  const rocksdb::Status status =
      db_->Get(rocksdb::ReadOptions(), rocksdb::Slice(key.data(), key.size()), &bytes);
  if (status.IsNotFound()) {
    return true;
  }
  if (!status.ok()) {
    error = StatusError("get", status);
    return false;
  }
  value = std::move(bytes);
  return true;
}

bool PackStore::ListKeys(std::vector<std::string>& keys, std::string& error) const {
  keys.clear();
  if (!RequireOpen("key enumeration", error)) {
    return false;
  }

  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ScanReadOptions()));
  for (it->SeekToFirst(); it->Valid(); it->Next()) {
    keys.push_back(it->key().ToString());
  }
  if (!it->status().ok()) {
    error = StatusError("key enumeration", it->status());
    keys.clear();
    return false;
  }
  return true;
}

bool PackStore::FirstKey(std::optional<std::string>& key, std::string& error) const {
  key.reset();
  if (!RequireOpen("forward seek", error)) {
    return false;
  }

  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ScanReadOptions()));
  it->SeekToFirst();
  if (!it->status().ok()) {
    error = StatusError("forward seek", it->status());
    return false;
  }
  if (it->Valid()) {
    key = it->key().ToString();
  }
  return true;
}

bool PackStore::LastKey(std::optional<std::string>& key, std::string& error) const {
  key.reset();
  if (!RequireOpen("backward seek", error)) {
    return false;
  }

  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ScanReadOptions()));
  it->SeekToLast();
  if (!it->status().ok()) {
    error = StatusError("backward seek", it->status());
    return false;
  }
  if (it->Valid()) {
    key = it->key().ToString();
  }
  return true;
}

bool PackStore::Commit(const StagedBatch& batch, std::string& error) {
  if (!RequireOpen("commit", error)) {
    return false;
  }

  rocksdb::WriteBatch write_batch;
  for (const auto& [key, value] : batch.puts) {
    const rocksdb::Status status = write_batch.Put(key, value);
    if (!status.ok()) {
      error = StatusError("batch staging of '" + key + "'", status);
      return false;
    }
  }
  for (const std::string& key : batch.deletes) {
    const rocksdb::Status status = write_batch.Delete(key);
    if (!status.ok()) {
      error = StatusError("batch staging of delete '" + key + "'", status);
      return false;
    }
  }

  rocksdb::WriteOptions options;
  options.sync = true;
  const rocksdb::Status status = db_->Write(options, &write_batch);
  if (!status.ok()) {
    error = StatusError("commit", status);
    return false;
  }
  return true;
}

bool PackStore::CompactAll(std::string& error) {
  std::optional<std::string> first;
  std::optional<std::string> last;
  if (!FirstKey(first, error) || !LastKey(last, error)) {
    return false;
  }
  if (!first.has_value() || !last.has_value()) {
    return true;
  }

  const rocksdb::Slice begin(*first);
  const rocksdb::Slice end(*last);
  const rocksdb::Status status = db_->CompactRange(rocksdb::CompactRangeOptions(), &begin, &end);
  if (!status.ok()) {
    error = StatusError("compaction", status);
    return false;
  }
  return true;
}

bool PackStore::Close(std::string& error) {
  if (db_ == nullptr) {
    return true;
  }

  const rocksdb::Status status = db_->Close();
  db_.reset();
  if (!status.ok()) {
    error = StatusError("close", status);
    return false;
  }
  return true;
}

} // namespace packforge::store
