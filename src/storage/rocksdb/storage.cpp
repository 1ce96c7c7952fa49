#include <domp/common/critical.hpp>
#include <domp/storage/rocksdb/storage.hpp>

namespace domp::storage {
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
    domp::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened event store at {}", path);
  store.database.reset(database);

  return store;
}
}  // namespace domp::storage
