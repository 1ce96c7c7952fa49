#pragma once

#include <domp/antispam/validator.hpp>
#include <domp/common/clock.hpp>
#include <domp/escrow/manager.hpp>
#include <domp/market/state_machine.hpp>
#include <domp/payment/gateway.hpp>
#include <domp/reputation/engine.hpp>
#include <domp/schema/content.hpp>
#include <domp/schema/escrow.hpp>
#include <domp/schema/event.hpp>
#include <domp/schema/market_policy.hpp>
#include <domp/schema/notification.hpp>
#include <domp/schema/primitives.hpp>
#include <domp/schema/replay_result.hpp>
#include <domp/schema/result.hpp>
#include <domp/schema/transaction.hpp>
#include <domp/storage/rocksdb/storage.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace domp::execution {

struct engine_options_t final {
  domp::schema::market_policy_t policy;
  /// RocksDB directory for the event log. Empty keeps everything in memory.
  std::string db_path;
  domp::common::clock_fn_t clock{domp::common::make_system_clock()};
};

/// Event-sourced marketplace node.
///
/// Every inbound event runs verify -> timestamp check -> content schema ->
/// anti-spam proof -> transaction state machine -> escrow -> reputation, and
/// is stored and announced to observers only when every step accepted it.
/// A rejected event leaves no trace apart from its result.
///
/// Ingestion is idempotent on the event id and may be called from several
/// threads. Each transaction has its own single-writer lock; the event index,
/// the transaction map, the escrow manager and the reputation engine carry
/// their own locks.
class engine final {
 public:
  engine(domp::payment::gateway& gateway, engine_options_t options = {});

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  domp::schema::ingest_result_t ingest(const domp::schema::event_t& event);

  /// Parse the wire form and ingest it.
  domp::schema::ingest_result_t ingest_json(std::string_view raw);

  /// Apply a batch in (created_at, id) order. Results follow that order.
  std::vector<domp::schema::ingest_result_t> ingest_batch(
      std::vector<domp::schema::event_t> events);

  /// Expire every transaction whose escrow timeout is behind the clock.
  /// Returns the transactions that moved to expired.
  std::vector<domp::schema::hash32_t> check_timeouts();

  /// Rebuild derived state from the event log of an engine that has not
  /// ingested anything yet, then compare with the last committed digest.
  domp::schema::replay_result_t replay();

  /// Persist the current state digest as the committed checkpoint.
  domp::schema::hash32_t commit();

  /// BLAKE3 digest over transactions, escrows and reputation records.
  domp::schema::hash32_t state_digest() const;

  void subscribe(domp::schema::notification_observer_t observer);

  std::optional<domp::schema::transaction_t> find_transaction(
      const domp::schema::hash32_t& transaction_id) const;
  std::vector<domp::schema::transaction_t> list_transactions() const;
  std::optional<domp::schema::escrow_t> find_escrow(
      const domp::schema::hash32_t& transaction_id) const;
  std::optional<domp::schema::event_t> find_event(
      const domp::schema::event_id_t& event_id) const;
  bool contains(const domp::schema::event_id_t& event_id) const;
  std::size_t event_count() const;

  const domp::reputation::engine& reputation() const { return reputation_; }
  const domp::schema::market_policy_t& policy() const { return policy_; }

 private:
  struct transaction_slot_t final {
    std::mutex mutex;
    std::optional<domp::schema::transaction_t> transaction;
  };

  struct accepted_event_t final {
    domp::schema::event_t event;
    domp::schema::event_index_entry_t entry;
  };

  domp::schema::ingest_result_t process(const domp::schema::event_t& event);

  domp::schema::ingest_result_t apply_to_transaction(
      const domp::schema::event_t& event,
      const domp::schema::content_t& content,
      const domp::schema::hash32_t& transaction_id,
      const domp::antispam::proof_result_t& proof,
      std::vector<domp::schema::notification_t>& notifications);

  domp::schema::ingest_result_t record_message(
      const domp::schema::event_t& event,
      const domp::schema::communication_message_t& message);

  /// Run the escrow step of a transition. Nothing is changed on failure.
  domp::schema::escrow_result_t execute_escrow(
      const domp::schema::hash32_t& transaction_id,
      const domp::market::escrow_action_t& action);

  /// Expire the transaction held in `slot` if it is overdue at `now`.
  /// The slot lock must be held.
  std::optional<domp::schema::notification_t> expire_locked(
      transaction_slot_t& slot,
      domp::schema::timestamp_seconds_t now);

  std::shared_ptr<transaction_slot_t> find_slot(
      const domp::schema::hash32_t& transaction_id) const;
  std::shared_ptr<transaction_slot_t> find_or_create_slot(
      const domp::schema::hash32_t& transaction_id);

  std::optional<domp::schema::event_index_entry_t> lookup_entry(
      const domp::schema::event_id_t& event_id) const;

  /// Claim an id for processing; false when it is stored or in flight.
  bool claim(const domp::schema::event_id_t& event_id);
  void unclaim(const domp::schema::event_id_t& event_id);
  /// Store and index an event whose transition was accepted.
  void commit_event(const domp::schema::event_t& event,
                    const std::optional<domp::schema::hash32_t>& transaction_id);

  void notify(const std::vector<domp::schema::notification_t>& notifications);

  domp::schema::market_policy_t policy_;
  domp::common::clock_fn_t clock_;
  domp::payment::gateway& gateway_;
  std::optional<domp::storage::storage<domp::storage::rocksdb_storage_tag>>
      storage_;

  domp::escrow::manager escrows_;
  domp::reputation::engine reputation_;
  domp::antispam::validator validator_;

  mutable std::shared_mutex events_mutex_;
  std::map<domp::schema::event_id_t, accepted_event_t> events_;
  std::set<domp::schema::event_id_t> in_flight_;
  uint64_t next_sequence_{0};

  mutable std::shared_mutex transactions_mutex_;
  std::map<domp::schema::hash32_t, std::shared_ptr<transaction_slot_t>>
      transactions_;

  std::mutex observers_mutex_;
  std::vector<domp::schema::notification_observer_t> observers_;

  std::atomic<bool> replaying_{false};
};

}  // namespace domp::execution
