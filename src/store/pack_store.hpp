#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rocksdb {
class DB;
} // namespace rocksdb

namespace packforge::store {

// Writes accumulated in memory during a compile and applied in one atomic
// commit. Puts keep staging order; deletes are applied after puts.
struct StagedBatch {
  std::vector<std::pair<std::string, std::string>> puts;
  std::vector<std::string> deletes;

  void Put(std::string key, std::string value) {
    puts.emplace_back(std::move(key), std::move(value));
  }

  void Delete(std::string key) {
    deletes.push_back(std::move(key));
  }

  bool Empty() const {
    return puts.empty() && deletes.empty();
  }
};

// Ordered key-value pack backed by one RocksDB database directory. Keys are
// UTF-8 strings compared bytewise; values are serialized JSON.
//
// The handle owns the database: it is closed by Close() or, on any early exit,
// by the destructor.
class PackStore {
public:
  // Takes ownership of an already opened database; use Open() to create one.
  PackStore(std::filesystem::path path, std::unique_ptr<rocksdb::DB> db);
  ~PackStore();

  PackStore(const PackStore&) = delete;
  PackStore& operator=(const PackStore&) = delete;

  // Opens the pack at `path`, creating the directory (and parents) and an
  // empty database when absent.
  static bool Open(const std::filesystem::path& path, std::unique_ptr<PackStore>& store,
                   std::string& error);

  bool Get(std::string_view key, std::optional<std::string>& value, std::string& error) const;

  // All keys in ascending order.
  bool ListKeys(std::vector<std::string>& keys, std::string& error) const;

  // Smallest/largest key, or nullopt for an empty pack.
  bool FirstKey(std::optional<std::string>& key, std::string& error) const;
  bool LastKey(std::optional<std::string>& key, std::string& error) const;

  bool Commit(const StagedBatch& batch, std::string& error);

  // Compacts [first key, last key]. No-op on an empty pack.
  bool CompactAll(std::string& error);

  bool Close(std::string& error);

  bool IsOpen() const {
    return db_ != nullptr;
  }

  const std::filesystem::path& Path() const {
    return path_;
  }

private:
  bool RequireOpen(std::string_view operation, std::string& error) const;

  std::filesystem::path path_;
  std::unique_ptr<rocksdb::DB> db_;
};

} // namespace packforge::store
