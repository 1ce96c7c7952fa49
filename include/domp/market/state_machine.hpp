#pragma once

#include <domp/escrow/manager.hpp>
#include <domp/schema/content.hpp>
#include <domp/schema/error_code.hpp>
#include <domp/schema/escrow.hpp>
#include <domp/schema/event.hpp>
#include <domp/schema/market_policy.hpp>
#include <domp/schema/reputation.hpp>
#include <domp/schema/transaction.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

// Pure transition rules of the marketplace lifecycle. Nothing here touches
// the escrow manager or the stores; a transition describes the next
// transaction state together with the escrow step that must succeed before
// it may be committed.
namespace domp::market {

struct escrow_create_t final {
  domp::escrow::escrow_terms_t terms;
};

struct escrow_fund_t final {
  std::vector<domp::schema::funding_proof_t> proofs;
};

/// Release with the buyer's preimage, or with the escrow-held preimage when
/// the release was agreed or arbitrated.
struct escrow_release_t final {
  std::optional<domp::schema::preimage_t> preimage;
};

struct escrow_refund_t final {};

struct escrow_expire_t final {
  domp::schema::timestamp_seconds_t now{};
};

using escrow_action_t = std::variant<std::monostate,
                                     escrow_create_t,
                                     escrow_fund_t,
                                     escrow_release_t,
                                     escrow_refund_t,
                                     escrow_expire_t>;

struct transition_t final {
  domp::schema::error_code code{domp::schema::error_code::ok};
  std::string log;
  /// State after the event. Only meaningful when ok().
  domp::schema::transaction_t transaction;
  escrow_action_t escrow;
  std::optional<domp::schema::reputation_record_t> rating;

  bool ok() const { return code == domp::schema::error_code::ok; }
};

/// Event id a content payload hangs off; the transaction is found through
/// it. Listings and communication messages without a transaction have none.
std::optional<domp::schema::event_id_t> anchor_of(
    const domp::schema::content_t& content);

/// Apply one verified, schema-checked event.
///
/// `current` is null only for a listing, which opens a new transaction.
/// `proof_reference` is the event named by the anti-spam reference proof,
/// when the event carried one.
transition_t apply(
    const domp::schema::transaction_t* current,
    const domp::schema::event_t& event,
    const domp::schema::content_t& content,
    const domp::schema::market_policy_t& policy,
    const std::optional<domp::schema::event_id_t>& proof_reference =
        std::nullopt);

/// Lazy timeout: expire a transaction that is still waiting on delivery or
/// funding once `now` passes the escrow timeout.
std::optional<transition_t> check_timeout(
    const domp::schema::transaction_t& transaction,
    const domp::schema::escrow_t& escrow,
    domp::schema::timestamp_seconds_t now);

/// Absolute escrow timeout for an acceptance created at `accepted_at`.
domp::schema::timestamp_seconds_t escrow_timeout(
    domp::schema::timestamp_seconds_t accepted_at,
    uint32_t htlc_timeout_blocks);

}  // namespace domp::market
