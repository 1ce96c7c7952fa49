#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <domp/common/critical.hpp>
#include <domp/schema/encoding/scale/encoder.hpp>
#include <domp/storage/storage.hpp>
#include <algorithm>
#include <iterator>
#include <memory>
#include <scale/scale.hpp>
#include <string_view>
#include <tuple>

namespace domp::storage {

namespace detail {

using encoder_t = domp::schema::encoding::encoder<
    domp::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|STATE|DIGEST"};
inline constexpr auto kEventPrefix = std::string_view{"EVT|"};
inline constexpr auto kPreimagePrefix = std::string_view{"SEC|"};

using event_record_t = std::tuple<domp::schema::event_id_t,
                                  domp::schema::public_key_t,
                                  domp::schema::timestamp_seconds_t,
                                  uint16_t,
                                  domp::schema::tags_t,
                                  std::string,
                                  domp::schema::signature_t>;

template <typename T>
std::string make_key(const std::string_view prefix, const T& value) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(value);
  auto key = std::string{prefix};
  key.append(reinterpret_cast<const char*>(encoded.data()), encoded.size());
  return key;
}

inline std::optional<uint64_t> parse_event_key(std::string_view key) {
  if (!key.starts_with(kEventPrefix)) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto bytes = domp::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(key.data() + kEventPrefix.size()),
      key.size() - kEventPrefix.size()};
  return encoder.try_decode<uint64_t>(bytes);
}

inline domp::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(const domp::schema::bytes_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  void append_event(uint64_t sequence, const domp::schema::event_t& event) const;
  std::vector<stored_event> load_events() const;
  void save_preimage(const domp::schema::hash32_t& transaction_id,
                     const domp::schema::preimage_t& preimage) const;
  std::optional<domp::schema::preimage_t> load_preimage(
      const domp::schema::hash32_t& transaction_id) const;
  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline void storage<rocksdb_storage_tag>::append_event(
    const uint64_t sequence,
    const domp::schema::event_t& event) const {
  if (!database) {
    domp::common::critical("RocksDB database is not initialized");
  }
  auto encoder = detail::encoder_t{};
  auto key = detail::make_key(detail::kEventPrefix, sequence);
  auto value = encoder.encode(
      detail::event_record_t{event.id, event.author_key, event.created_at,
                             event.kind, event.tags, event.content,
                             event.signature});
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Put(write_options, key, detail::to_slice(value));
  if (!status.ok()) {
    spdlog::error("Failed to append event {}: {}", sequence, status.ToString());
    domp::common::critical("failed to persist accepted event");
  }
}

inline std::vector<stored_event> storage<rocksdb_storage_tag>::load_events()
    const {
  if (!database) {
    domp::common::critical("RocksDB database is not initialized");
  }
  auto events = std::vector<stored_event>{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(std::string{detail::kEventPrefix});
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(detail::kEventPrefix)) {
      break;
    }
    auto sequence = detail::parse_event_key(key_view);
    auto value = detail::to_bytes(iterator->value());
    auto encoder = detail::encoder_t{};
    auto decoded = encoder.try_decode<detail::event_record_t>(
        domp::schema::bytes_view_t{value.data(), value.size()});
    if (!sequence || !decoded) {
      domp::common::critical("event log entry cannot be decoded");
    }
    auto& [id, author, created_at, kind, tags, content, signature] = *decoded;
    events.push_back(stored_event{
        .sequence = *sequence,
        .event = domp::schema::event_t{.id = id,
                                       .author_key = author,
                                       .created_at = created_at,
                                       .kind = kind,
                                       .tags = std::move(tags),
                                       .content = std::move(content),
                                       .signature = signature}});
    iterator->Next();
  }
  // SCALE keys are little-endian, so byte order is not log order.
  std::sort(events.begin(), events.end(),
            [](const stored_event& lhs, const stored_event& rhs) {
              return lhs.sequence < rhs.sequence;
            });
  return events;
}

inline void storage<rocksdb_storage_tag>::save_preimage(
    const domp::schema::hash32_t& transaction_id,
    const domp::schema::preimage_t& preimage) const {
  if (!database) {
    domp::common::critical("RocksDB database is not initialized");
  }
  auto key = detail::make_key(detail::kPreimagePrefix, transaction_id);
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Put(
      write_options, key,
      ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(preimage.data()),
                               preimage.size()});
  if (!status.ok()) {
    domp::common::critical("failed to persist escrow preimage");
  }
}

inline std::optional<domp::schema::preimage_t>
storage<rocksdb_storage_tag>::load_preimage(
    const domp::schema::hash32_t& transaction_id) const {
  if (!database) {
    domp::common::critical("RocksDB database is not initialized");
  }
  auto raw = std::string{};
  auto status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    detail::make_key(detail::kPreimagePrefix, transaction_id),
                    &raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    domp::common::critical("failed to load escrow preimage");
  }
  auto preimage = domp::schema::preimage_t{};
  if (raw.size() != preimage.size()) {
    domp::common::critical("stored escrow preimage has the wrong length");
  }
  std::copy(raw.begin(), raw.end(), preimage.begin());
  return preimage;
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    domp::common::critical("RocksDB database is not initialized");
  }
  auto raw = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              std::string{detail::kCommittedStateKey}, &raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    domp::common::critical("failed to load committed state");
  }
  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, domp::schema::hash32_t,
                                    domp::schema::timestamp_seconds_t>>(
          domp::schema::bytes_view_t{reinterpret_cast<const uint8_t*>(raw.data()),
                                     raw.size()});
  if (!decoded.has_value()) {
    domp::common::critical("failed to decode committed state");
  }
  return committed_state{.event_count = std::get<0>(decoded.value()),
                         .state_digest = std::get<1>(decoded.value()),
                         .committed_at = std::get<2>(decoded.value())};
}

inline void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  if (!database) {
    domp::common::critical("RocksDB database is not initialized");
  }
  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(
      std::tuple{state.event_count, state.state_digest, state.committed_at});
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              std::string{detail::kCommittedStateKey},
                              detail::to_slice(encoded));
  if (!status.ok()) {
    domp::common::critical("failed to persist committed state");
  }
}

}  // namespace domp::storage
