#include <kraken/common/critical.hpp>
#include <kraken/schema/encoding/scale/encoder.hpp>
#include <kraken/storage/rocksdb/storage.hpp>

#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>

#include <string>
#include <tuple>

namespace kraken::storage {

namespace {

using encoder_t = kraken::schema::encoding::encoder<
    kraken::schema::encoding::scale_encoder_tag>;

// Outside every account prefix, so prefix scans never return it.
constexpr auto kCheckpointKey = std::string_view{"SYS|ENGINE|CHECKPOINT"};

kraken::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

ROCKSDB_NAMESPACE::Slice to_slice(const kraken::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

ROCKSDB_NAMESPACE::DB& open_database(
    const std::unique_ptr<ROCKSDB_NAMESPACE::DB>& database) {
  if (!database) {
    kraken::common::critical("account store used before make_storage");
  }
  return *database;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  const auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    kraken::common::critical("cannot open account store at {}: {}", path,
                             status.ToString());
  }

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  spdlog::info("Opened account store at {}", path);
  return store;
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto& db = open_database(database);
  auto raw = std::string{};
  const auto status = db.Get(ROCKSDB_NAMESPACE::ReadOptions{},
                             std::string{kCheckpointKey}, &raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    kraken::common::critical("cannot read checkpoint: {}", status.ToString());
  }

  auto encoder = encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, kraken::schema::hash32_t>>(
          kraken::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(raw.data()), raw.size()});
  if (!decoded.has_value()) {
    kraken::common::critical("checkpoint of {} byte(s) does not decode",
                             raw.size());
  }
  return committed_state{.height = std::get<0>(*decoded),
                         .state_root = std::get<1>(*decoded)};
}

void storage<rocksdb_storage_tag>::commit(
    const committed_state& state,
    const std::vector<key_value_entry_t>& entries) const {
  auto& db = open_database(database);
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    const auto status = batch.Put(to_slice(key), to_slice(value));
    if (!status.ok()) {
      kraken::common::critical("cannot stage account record: {}",
                               status.ToString());
    }
  }

  auto encoder = encoder_t{};
  const auto checkpoint =
      encoder.encode(std::tuple{state.height, state.state_root});
  const auto checkpoint_status =
      batch.Put(std::string{kCheckpointKey}, to_slice(checkpoint));
  if (!checkpoint_status.ok()) {
    kraken::common::critical("cannot stage checkpoint: {}",
                             checkpoint_status.ToString());
  }

  const auto status = db.Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    kraken::common::critical("commit of height {} failed: {}", state.height,
                             status.ToString());
  }
  spdlog::debug("Wrote {} record(s) and checkpoint {}", entries.size(),
                state.height);
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const kraken::schema::bytes_view_t& prefix) const {
  auto& db = open_database(database);
  auto entries = std::vector<key_value_entry_t>{};
  const auto start = to_slice(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      db.NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(start);
       iterator->Valid() && iterator->key().starts_with(start);
       iterator->Next()) {
    entries.push_back(
        key_value_entry_t{to_bytes(iterator->key()), to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    kraken::common::critical("prefix scan failed: {}",
                             iterator->status().ToString());
  }
  return entries;
}

}  // namespace kraken::storage
