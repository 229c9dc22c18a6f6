#include <warden/common/critical.hpp>
#include <warden/storage/rocksdb/storage.hpp>

namespace warden::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    warden::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

bool storage<rocksdb_storage_tag>::contains(
    const warden::schema::bytes_view_t& key) const {
  if (!database) {
    warden::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return false;
  }
  if (!status.ok()) {
    spdlog::error("Failed to query RocksDB: {}", status.ToString());
    warden::common::critical("Failed to query RocksDB");
  }
  return true;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const warden::schema::bytes_view_t& prefix) const {
  if (!database) {
    warden::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = detail::to_slice(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_slice);
       iterator->Valid() && iterator->key().starts_with(prefix_slice);
       iterator->Next()) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB prefix scan failed: {}",
                  iterator->status().ToString());
    warden::common::critical("RocksDB prefix scan failed");
  }
  return entries;
}

void storage<rocksdb_storage_tag>::commit(const write_batch_t& batch) {
  if (!database) {
    warden::common::critical("RocksDB database is not initialized");
  }

  auto write_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : batch.deletes) {
    if (!write_batch.Delete(detail::to_slice(key)).ok()) {
      warden::common::critical("failed staging delete in write batch");
    }
  }
  for (const auto& [key, value] : batch.puts) {
    if (!write_batch.Put(detail::to_slice(key), detail::to_slice(value)).ok()) {
      warden::common::critical("failed staging put in write batch");
    }
  }

  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &write_batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit write batch: {}", status.ToString());
    warden::common::critical("Failed to commit write batch");
  }
}

}  // namespace warden::storage
