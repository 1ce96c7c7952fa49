#pragma once
#include <domp/schema/event.hpp>
#include <domp/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace domp::storage {

/// Digest of the derived state after the last persisted event. Timeouts are
/// evaluated at `committed_at` before the digest is taken.
struct committed_state final {
  uint64_t event_count{};
  domp::schema::hash32_t state_digest{};
  domp::schema::timestamp_seconds_t committed_at{};
};

/// Accepted event together with its position in the log.
struct stored_event final {
  uint64_t sequence{};
  domp::schema::event_t event;
};

template <typename Library>
struct storage {
  /// Append an accepted event at `sequence`.
  void append_event(uint64_t sequence, const domp::schema::event_t& event) const;

  /// Every accepted event in log order.
  std::vector<stored_event> load_events() const;

  /// Escrow preimage generated by this node, by transaction id.
  void save_preimage(const domp::schema::hash32_t& transaction_id,
                     const domp::schema::preimage_t& preimage) const;
  std::optional<domp::schema::preimage_t> load_preimage(
      const domp::schema::hash32_t& transaction_id) const;

  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace domp::storage
