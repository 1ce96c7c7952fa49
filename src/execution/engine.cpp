#include <spdlog/spdlog.h>
#include <algorithm>
#include <domp/blake3/hash.hpp>
#include <domp/codec/content_codec.hpp>
#include <domp/codec/event_codec.hpp>
#include <domp/execution/engine.hpp>
#include <domp/schema/encoding/scale/encoder.hpp>
#include <iterator>
#include <spdlog/fmt/fmt.h>
#include <tuple>
#include <utility>

using namespace domp::schema;

namespace {

using encoder_t = domp::schema::encoding::encoder<
    domp::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCodespace = std::string_view{"domp"};

ingest_result_t make_result(const event_id_t& event_id,
                            const error_code code,
                            std::string log) {
  auto result = ingest_result_t{};
  result.code = code;
  result.log = std::move(log);
  result.codespace = std::string{kCodespace};
  result.event_id = event_id;
  if (code != error_code::ok) {
    result.info = std::string{to_string(code)};
  }
  return result;
}

ingest_result_t make_duplicate(const event_id_t& event_id) {
  auto result = make_result(event_id, error_code::ok, "duplicate event");
  result.duplicate = true;
  return result;
}

hash32_t or_zero(const std::optional<hash32_t>& value) {
  return value.value_or(make_zero_hash());
}

template <typename T>
void fold(domp::blake3::hasher& hasher, const T& value) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(value);
  hasher.update(bytes_view_t{encoded.data(), encoded.size()});
}

}  // namespace

namespace domp::execution {

engine::engine(domp::payment::gateway& gateway, engine_options_t options)
    : policy_(options.policy),
      clock_(std::move(options.clock)),
      gateway_(gateway),
      escrows_(gateway),
      validator_(options.policy.anti_spam,
                 &gateway,
                 [this](const event_id_t& event_id) {
                   return lookup_entry(event_id);
                 }) {
  if (!options.db_path.empty()) {
    storage_ = domp::storage::make_storage<domp::storage::rocksdb_storage_tag>(
        options.db_path);
  }
  spdlog::info(
      "Marketplace engine ready (pow >= {} bits, ln proof >= {} sats, "
      "buyer collateral ratio {}, store '{}')",
      policy_.anti_spam.min_pow_difficulty, policy_.anti_spam.min_payment_sats,
      policy_.min_buyer_collateral_ratio,
      options.db_path.empty() ? std::string{"memory"} : options.db_path);
}

ingest_result_t engine::ingest(const event_t& event) {
  auto result = process(event);
  if (result.duplicate) {
    spdlog::debug("event {} already applied", short_hex(event.id));
  } else if (result.ok()) {
    spdlog::info("event {} kind {} applied{}", short_hex(event.id), event.kind,
                 result.status ? fmt::format(", transaction now {}",
                                             to_string(*result.status))
                               : std::string{});
  } else {
    spdlog::warn("event {} kind {} rejected: {} ({})", short_hex(event.id),
                 event.kind, to_string(result.code), result.log);
  }
  return result;
}

ingest_result_t engine::ingest_json(const std::string_view raw) {
  auto error = std::string{};
  auto event = domp::codec::try_from_json(raw, error);
  if (!event) {
    spdlog::warn("dropping unparsable event: {}", error);
    return make_result(make_zero_hash(), error_code::malformed_event,
                       std::move(error));
  }
  return ingest(*event);
}

std::vector<ingest_result_t> engine::ingest_batch(std::vector<event_t> events) {
  std::sort(events.begin(), events.end(),
            [](const event_t& lhs, const event_t& rhs) {
              return std::tie(lhs.created_at, lhs.id) <
                     std::tie(rhs.created_at, rhs.id);
            });
  auto results = std::vector<ingest_result_t>{};
  results.reserve(events.size());
  for (const auto& event : events) {
    results.push_back(ingest(event));
  }
  return results;
}

ingest_result_t engine::process(const event_t& event) {
  auto verified = domp::codec::verify(event);
  if (!verified.ok()) {
    return make_result(event.id, verified.code, std::move(verified.log));
  }
  if (contains(event.id)) {
    return make_duplicate(event.id);
  }
  if (!replaying_ &&
      event.created_at > clock_() + policy_.max_future_skew_seconds) {
    return make_result(
        event.id, error_code::timestamp_in_future,
        fmt::format("created_at {} is more than {}s ahead", event.created_at,
                    policy_.max_future_skew_seconds));
  }
  if (!try_make_event_kind(event.kind)) {
    return make_result(event.id, error_code::unsupported_kind,
                       fmt::format("kind {} is not a marketplace kind",
                                   event.kind));
  }
  auto error = std::string{};
  auto content = domp::codec::try_parse_content(event.kind, event.content, error);
  if (!content) {
    return make_result(event.id, error_code::malformed_content,
                       std::move(error));
  }

  if (!claim(event.id)) {
    return make_duplicate(event.id);
  }
  auto proof = validator_.validate(event);
  if (!proof.ok()) {
    unclaim(event.id);
    return make_result(event.id, proof.code, std::move(proof.log));
  }

  auto notifications = std::vector<notification_t>{};
  auto result = [&]() -> ingest_result_t {
    if (proof.proof && std::holds_alternative<reference_proof_t>(*proof.proof)) {
      auto referenced =
          lookup_entry(std::get<reference_proof_t>(*proof.proof).event_id);
      if (referenced && referenced->created_at > event.created_at) {
        return make_result(event.id, error_code::causality_violation,
                           "reference proof post-dates the event");
      }
    }
    if (auto message = std::get_if<communication_message_t>(&*content)) {
      return record_message(event, *message);
    }
    if (std::holds_alternative<product_listing_t>(*content)) {
      return apply_to_transaction(event, *content, event.id, proof,
                                  notifications);
    }

    auto anchor = domp::market::anchor_of(*content);
    auto entry = anchor ? lookup_entry(*anchor) : std::nullopt;
    if (!entry || !entry->transaction_id) {
      return make_result(event.id, error_code::unknown_reference,
                         "referenced event has not been accepted");
    }
    if (entry->created_at > event.created_at) {
      return make_result(event.id, error_code::causality_violation,
                         "referenced event post-dates the event");
    }
    if (auto payment = std::get_if<payment_confirmation_t>(&*content);
        payment && payment->acceptance_ref) {
      auto acceptance = lookup_entry(*payment->acceptance_ref);
      if (acceptance && acceptance->created_at > event.created_at) {
        return make_result(event.id, error_code::causality_violation,
                           "acceptance post-dates the payment");
      }
    }
    return apply_to_transaction(event, *content, *entry->transaction_id,
                                proof, notifications);
  }();

  if (!result.ok()) {
    validator_.release(proof.reservation);
    unclaim(event.id);
    return result;
  }
  notify(notifications);
  return result;
}

ingest_result_t engine::apply_to_transaction(
    const event_t& event,
    const content_t& content,
    const hash32_t& transaction_id,
    const domp::antispam::proof_result_t& proof,
    std::vector<notification_t>& notifications) {
  auto is_listing = std::holds_alternative<product_listing_t>(content);
  auto slot = is_listing ? find_or_create_slot(transaction_id)
                         : find_slot(transaction_id);
  if (!slot) {
    return make_result(event.id, error_code::unknown_reference,
                       "transaction does not exist");
  }

  auto lock = std::scoped_lock{slot->mutex};
  if (slot->transaction) {
    // A backdated event cannot slip in under an escrow the clock has already
    // run past. Replay has no clock to compare against.
    auto at = replaying_ ? event.created_at
                         : std::max(event.created_at, clock_());
    if (auto expired = expire_locked(*slot, at)) {
      notifications.push_back(*expired);
    }
  }

  auto proof_reference = std::optional<event_id_t>{};
  if (proof.proof && std::holds_alternative<reference_proof_t>(*proof.proof)) {
    proof_reference = std::get<reference_proof_t>(*proof.proof).event_id;
  }
  const auto* current = slot->transaction ? &*slot->transaction : nullptr;
  auto transition =
      domp::market::apply(current, event, content, policy_, proof_reference);

  auto reject = [&](const error_code code, std::string log) {
    auto result = make_result(event.id, code, std::move(log));
    if (current != nullptr) {
      result.transaction_id = transaction_id;
      result.status = current->status;
    }
    return result;
  };
  if (!transition.ok()) {
    return reject(transition.code, std::move(transition.log));
  }
  if (transition.rating) {
    if (transition.rating->rater == transition.rating->rated) {
      return reject(error_code::invalid_rating,
                    "participants cannot rate themselves");
    }
    if (reputation_.seen(transition.rating->rater,
                         transition.rating->referenced_event_id)) {
      return reject(error_code::duplicate_reference,
                    "rater already rated this reference");
    }
  }

  auto escrow = execute_escrow(transaction_id, transition.escrow);
  if (!escrow.ok()) {
    return reject(escrow.code, std::move(escrow.log));
  }

  auto previous_status = current != nullptr
                             ? std::optional{current->status}
                             : std::nullopt;
  slot->transaction = std::move(transition.transaction);
  commit_event(event, transaction_id);

  if (transition.rating) {
    auto recorded = reputation_.record(*transition.rating);
    if (!recorded.ok()) {
      spdlog::warn("rating from event {} not recorded: {}",
                   short_hex(event.id), recorded.log);
    }
  }

  auto notification = notification_t{.event_id = event.id,
                                      .kind = event.kind,
                                      .author = event.author_key,
                                      .transaction_id = transaction_id,
                                      .previous_status = previous_status,
                                      .status = slot->transaction->status};
  if (!std::holds_alternative<std::monostate>(transition.escrow)) {
    notification.escrow_state = escrow.state;
    notification.distribution = escrow.distribution;
  }
  notifications.push_back(std::move(notification));

  auto result = make_result(event.id, error_code::ok, {});
  result.transaction_id = transaction_id;
  result.status = slot->transaction->status;
  return result;
}

ingest_result_t engine::record_message(const event_t& event,
                                       const communication_message_t& message) {
  auto transaction_id = std::optional<hash32_t>{};
  if (message.transaction_ref) {
    auto entry = lookup_entry(*message.transaction_ref);
    if (!entry || !entry->transaction_id) {
      return make_result(event.id, error_code::unknown_reference,
                         "message references an unknown transaction");
    }
    transaction_id = entry->transaction_id;
  }
  commit_event(event, transaction_id);
  spdlog::info("message {} from {} to {}", short_hex(event.id),
               short_hex(event.author_key), short_hex(message.recipient_pubkey));
  auto result = make_result(event.id, error_code::ok, {});
  result.transaction_id = transaction_id;
  return result;
}

escrow_result_t engine::execute_escrow(
    const hash32_t& transaction_id,
    const domp::market::escrow_action_t& action) {
  return std::visit(
      overloaded{
          [&](const std::monostate&) { return escrow_result_t{}; },
          [&](const domp::market::escrow_create_t& create) {
            auto preimage = std::optional<preimage_t>{};
            if (storage_) {
              preimage = storage_->load_preimage(transaction_id);
            }
            auto result = escrows_.create(create.terms, preimage);
            if (result.ok() && storage_ && !preimage) {
              auto created = escrows_.find(transaction_id);
              storage_->save_preimage(transaction_id, created->preimage);
            }
            return result;
          },
          [&](const domp::market::escrow_fund_t& fund) {
            return escrows_.fund(transaction_id, fund.proofs);
          },
          [&](const domp::market::escrow_release_t& release) {
            if (release.preimage) {
              return escrows_.release(transaction_id, *release.preimage);
            }
            auto held = escrows_.find(transaction_id);
            if (!held) {
              return escrow_result_t{.code = error_code::escrow_not_found,
                                     .log = "no escrow to release"};
            }
            return escrows_.release(transaction_id, held->preimage);
          },
          [&](const domp::market::escrow_refund_t&) {
            return escrows_.refund(transaction_id);
          },
          [&](const domp::market::escrow_expire_t& expire) {
            return escrows_.expire(transaction_id, expire.now);
          }},
      action);
}

std::optional<notification_t> engine::expire_locked(
    transaction_slot_t& slot,
    const timestamp_seconds_t now) {
  const auto& transaction = *slot.transaction;
  auto escrow = escrows_.find(transaction.id);
  if (!escrow) {
    return std::nullopt;
  }
  auto transition = domp::market::check_timeout(transaction, *escrow, now);
  if (!transition) {
    return std::nullopt;
  }
  auto expired = escrows_.expire(transaction.id, now);
  if (!expired.ok()) {
    spdlog::warn("transaction {} overdue but escrow refused expiry: {}",
                 short_hex(transaction.id), expired.log);
    return std::nullopt;
  }
  auto previous_status = transaction.status;
  slot.transaction = std::move(transition->transaction);
  spdlog::info("transaction {} expired at {}", short_hex(slot.transaction->id),
               now);
  return notification_t{.transaction_id = slot.transaction->id,
                        .previous_status = previous_status,
                        .status = slot.transaction->status,
                        .escrow_state = expired.state,
                        .distribution = expired.distribution};
}

std::vector<hash32_t> engine::check_timeouts() {
  auto now = clock_();
  auto slots = std::vector<std::shared_ptr<transaction_slot_t>>{};
  {
    auto lock = std::shared_lock{transactions_mutex_};
    slots.reserve(transactions_.size());
    for (const auto& [id, slot] : transactions_) {
      slots.push_back(slot);
    }
  }

  auto expired = std::vector<hash32_t>{};
  auto notifications = std::vector<notification_t>{};
  for (const auto& slot : slots) {
    auto lock = std::scoped_lock{slot->mutex};
    if (!slot->transaction) {
      continue;
    }
    if (auto notification = expire_locked(*slot, now)) {
      expired.push_back(slot->transaction->id);
      notifications.push_back(std::move(*notification));
    }
  }
  notify(notifications);
  return expired;
}

replay_result_t engine::replay() {
  auto result = replay_result_t{};
  if (!storage_) {
    result.error = "no event store configured";
    return result;
  }
  if (event_count() != 0) {
    result.error = "replay requires an engine without applied events";
    return result;
  }

  auto committed = storage_->load_committed_state();
  auto events = storage_->load_events();
  spdlog::info("Replaying {} stored event(s)", events.size());

  replaying_ = true;
  for (const auto& stored : events) {
    ++result.event_count;
    auto applied = process(stored.event);
    if (applied.ok() && !applied.duplicate) {
      ++result.applied_count;
    } else {
      spdlog::error("stored event {} (sequence {}) did not replay: {}",
                    short_hex(stored.event.id), stored.sequence, applied.log);
    }
  }
  replaying_ = false;

  {
    auto lock = std::unique_lock{events_mutex_};
    next_sequence_ = events.empty() ? 0 : events.back().sequence + 1;
  }

  if (committed) {
    result.committed_digest = committed->state_digest;
    auto slots = std::vector<std::shared_ptr<transaction_slot_t>>{};
    {
      auto lock = std::shared_lock{transactions_mutex_};
      for (const auto& [id, slot] : transactions_) {
        slots.push_back(slot);
      }
    }
    for (const auto& slot : slots) {
      auto lock = std::scoped_lock{slot->mutex};
      if (slot->transaction) {
        static_cast<void>(expire_locked(*slot, committed->committed_at));
      }
    }
  }

  result.state_digest = state_digest();
  result.ok = result.applied_count == result.event_count &&
              (!committed || committed->state_digest == result.state_digest);
  if (!result.ok) {
    result.error = result.applied_count != result.event_count
                       ? "stored events were rejected on replay"
                       : "replayed state digest differs from committed digest";
  }
  spdlog::info("Replay {}: {}/{} event(s), digest {}",
               result.ok ? "succeeded" : "failed", result.applied_count,
               result.event_count, to_hex(result.state_digest));
  return result;
}

hash32_t engine::commit() {
  auto now = clock_();
  auto slots = std::vector<std::shared_ptr<transaction_slot_t>>{};
  {
    auto lock = std::shared_lock{transactions_mutex_};
    for (const auto& [id, slot] : transactions_) {
      slots.push_back(slot);
    }
  }
  auto notifications = std::vector<notification_t>{};
  for (const auto& slot : slots) {
    auto lock = std::scoped_lock{slot->mutex};
    if (!slot->transaction) {
      continue;
    }
    if (auto notification = expire_locked(*slot, now)) {
      notifications.push_back(std::move(*notification));
    }
  }
  notify(notifications);

  auto digest = state_digest();
  if (storage_) {
    storage_->save_committed_state(
        domp::storage::committed_state{.event_count = event_count(),
                                       .state_digest = digest,
                                       .committed_at = now});
  }
  spdlog::info("Committed {} event(s), digest {}", event_count(),
               to_hex(digest));
  return digest;
}

hash32_t engine::state_digest() const {
  auto hasher = domp::blake3::hasher{};
  {
    auto lock = std::shared_lock{events_mutex_};
    fold(hasher, static_cast<uint64_t>(events_.size()));
    for (const auto& [id, accepted] : events_) {
      fold(hasher, std::tuple{id, or_zero(accepted.entry.transaction_id)});
    }
  }

  for (const auto& transaction : list_transactions()) {
    auto bids = std::vector<std::tuple<event_id_t, uint8_t>>{};
    for (const auto& bid : transaction.bids) {
      bids.emplace_back(bid.id, static_cast<uint8_t>(bid.status));
    }
    fold(hasher,
         std::tuple{transaction.id, static_cast<uint8_t>(transaction.status),
                    transaction.chain, bids, or_zero(transaction.accepted_bid),
                    or_zero(transaction.payment_id),
                    or_zero(transaction.arbitrator), transaction.updated_at});
  }

  for (const auto& escrow : escrows_.list()) {
    auto distribution = escrow.distribution.value_or(fund_distribution_t{});
    fold(hasher,
         std::tuple{escrow.transaction_id, escrow.payment_hash,
                    static_cast<uint8_t>(escrow.state), escrow.purchase_amount,
                    escrow.buyer_collateral, escrow.seller_collateral,
                    escrow.timeout, distribution.to_seller,
                    distribution.to_buyer});
  }

  for (const auto& record : reputation_.all_records()) {
    fold(hasher,
         std::tuple{record.rater, record.rated, record.referenced_event_id,
                    record.source_event_id, record.rating, record.amount_sats,
                    record.created_at});
  }
  return hasher.finalize();
}

void engine::subscribe(notification_observer_t observer) {
  auto lock = std::scoped_lock{observers_mutex_};
  observers_.push_back(std::move(observer));
}

std::optional<transaction_t> engine::find_transaction(
    const hash32_t& transaction_id) const {
  auto slot = find_slot(transaction_id);
  if (!slot) {
    return std::nullopt;
  }
  auto lock = std::scoped_lock{slot->mutex};
  return slot->transaction;
}

std::vector<transaction_t> engine::list_transactions() const {
  auto slots = std::vector<std::shared_ptr<transaction_slot_t>>{};
  {
    auto lock = std::shared_lock{transactions_mutex_};
    for (const auto& [id, slot] : transactions_) {
      slots.push_back(slot);
    }
  }
  auto out = std::vector<transaction_t>{};
  out.reserve(slots.size());
  for (const auto& slot : slots) {
    auto lock = std::scoped_lock{slot->mutex};
    if (slot->transaction) {
      out.push_back(*slot->transaction);
    }
  }
  return out;
}

std::optional<escrow_t> engine::find_escrow(
    const hash32_t& transaction_id) const {
  return escrows_.find(transaction_id);
}

std::optional<event_t> engine::find_event(const event_id_t& event_id) const {
  auto lock = std::shared_lock{events_mutex_};
  auto it = events_.find(event_id);
  if (it == events_.end()) {
    return std::nullopt;
  }
  return it->second.event;
}

bool engine::contains(const event_id_t& event_id) const {
  auto lock = std::shared_lock{events_mutex_};
  return events_.contains(event_id);
}

std::size_t engine::event_count() const {
  auto lock = std::shared_lock{events_mutex_};
  return events_.size();
}

std::shared_ptr<engine::transaction_slot_t> engine::find_slot(
    const hash32_t& transaction_id) const {
  auto lock = std::shared_lock{transactions_mutex_};
  auto it = transactions_.find(transaction_id);
  if (it == transactions_.end()) {
    return nullptr;
  }
  return it->second;
}

std::shared_ptr<engine::transaction_slot_t> engine::find_or_create_slot(
    const hash32_t& transaction_id) {
  auto lock = std::unique_lock{transactions_mutex_};
  auto& slot = transactions_[transaction_id];
  if (!slot) {
    slot = std::make_shared<transaction_slot_t>();
  }
  return slot;
}

std::optional<event_index_entry_t> engine::lookup_entry(
    const event_id_t& event_id) const {
  auto lock = std::shared_lock{events_mutex_};
  auto it = events_.find(event_id);
  if (it == events_.end()) {
    return std::nullopt;
  }
  return it->second.entry;
}

bool engine::claim(const event_id_t& event_id) {
  auto lock = std::unique_lock{events_mutex_};
  if (events_.contains(event_id)) {
    return false;
  }
  return in_flight_.insert(event_id).second;
}

void engine::unclaim(const event_id_t& event_id) {
  auto lock = std::unique_lock{events_mutex_};
  in_flight_.erase(event_id);
}

void engine::commit_event(const event_t& event,
                          const std::optional<hash32_t>& transaction_id) {
  auto lock = std::unique_lock{events_mutex_};
  in_flight_.erase(event.id);
  auto entry = event_index_entry_t{.id = event.id,
                                   .author_key = event.author_key,
                                   .kind = event.kind,
                                   .created_at = event.created_at,
                                   .transaction_id = transaction_id};
  events_.emplace(event.id, accepted_event_t{.event = event, .entry = entry});
  auto sequence = next_sequence_++;
  if (storage_ && !replaying_) {
    storage_->append_event(sequence, event);
  }
}

void engine::notify(const std::vector<notification_t>& notifications) {
  if (notifications.empty()) {
    return;
  }
  auto observers = std::vector<notification_observer_t>{};
  {
    auto lock = std::scoped_lock{observers_mutex_};
    observers = observers_;
  }
  for (const auto& notification : notifications) {
    for (const auto& observer : observers) {
      try {
        observer(notification);
      } catch (const std::exception& ex) {
        spdlog::warn("notification observer failed: {}", ex.what());
      }
    }
  }
}

}  // namespace domp::execution
