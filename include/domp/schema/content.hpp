#pragma once

#include <domp/schema/enum_string.hpp>
#include <domp/schema/event_kind.hpp>
#include <domp/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

// Per-kind event content. Parsed once from the JSON payload; the state machine
// only ever sees these typed shapes.
namespace domp::schema {

inline constexpr auto kMaxProductNameLength = std::size_t{100};
inline constexpr auto kDefaultHtlcTimeoutBlocks = uint32_t{144};
inline constexpr auto kSecondsPerBlock = duration_seconds_t{600};

enum class payment_method_t : uint8_t {
  lightning_htlc = 0,
  lightning_keysend = 1,
  onchain = 2
};

inline constexpr auto kPaymentMethodMappings =
    enum_mappings_t<payment_method_t, 3>{
        std::pair{std::string_view{"lightning_htlc"},
                  payment_method_t::lightning_htlc},
        std::pair{std::string_view{"lightning_keysend"},
                  payment_method_t::lightning_keysend},
        std::pair{std::string_view{"onchain"}, payment_method_t::onchain}};

template <>
inline std::optional<payment_method_t> try_from_string<payment_method_t>(
    const std::string_view value) {
  return from_string(value, kPaymentMethodMappings);
}

inline constexpr std::string_view to_string(const payment_method_t value) {
  return to_string(value, kPaymentMethodMappings).value_or("unknown");
}

enum class receipt_status_t : uint8_t {
  received = 0,
  partially_received = 1,
  not_received = 2,
  damaged = 3
};

inline constexpr auto kReceiptStatusMappings =
    enum_mappings_t<receipt_status_t, 4>{
        std::pair{std::string_view{"received"}, receipt_status_t::received},
        std::pair{std::string_view{"partially_received"},
                  receipt_status_t::partially_received},
        std::pair{std::string_view{"not_received"},
                  receipt_status_t::not_received},
        std::pair{std::string_view{"damaged"}, receipt_status_t::damaged}};

template <>
inline std::optional<receipt_status_t> try_from_string<receipt_status_t>(
    const std::string_view value) {
  return from_string(value, kReceiptStatusMappings);
}

inline constexpr std::string_view to_string(const receipt_status_t value) {
  return to_string(value, kReceiptStatusMappings).value_or("unknown");
}

/// Agreed or arbitrated outcome of a dispute.
enum class resolution_t : uint8_t { refund = 0, release = 1 };

inline constexpr auto kResolutionMappings = enum_mappings_t<resolution_t, 2>{
    std::pair{std::string_view{"refund"}, resolution_t::refund},
    std::pair{std::string_view{"release"}, resolution_t::release}};

template <>
inline std::optional<resolution_t> try_from_string<resolution_t>(
    const std::string_view value) {
  return from_string(value, kResolutionMappings);
}

inline constexpr std::string_view to_string(const resolution_t value) {
  return to_string(value, kResolutionMappings).value_or("unknown");
}

// 300
struct product_listing_t final {
  std::string product_name;
  std::string description;
  amount_sats_t price_satoshis{};
  std::optional<std::string> category;
  std::optional<std::string> storage_link;
  amount_sats_t seller_collateral_satoshis{};
  std::optional<std::string> shipping_info;
};

// 301
struct bid_submission_t final {
  event_id_t product_ref{};
  amount_sats_t bid_amount_satoshis{};
  amount_sats_t buyer_collateral_satoshis{};
  std::optional<std::string> message;
  std::optional<std::string> shipping_address_hash;
  std::optional<uint32_t> payment_timeout_hours;
};

// 302
struct counter_bid_t final {
  event_id_t bid_ref{};
  amount_sats_t counter_amount_satoshis{};
  std::optional<amount_sats_t> counter_collateral_satoshis;
  std::optional<std::string> message;
};

// 303
struct bid_acceptance_t final {
  event_id_t bid_ref{};
  std::string ln_invoice;
  amount_sats_t invoice_amount_satoshis{};
  std::optional<std::string> collateral_invoice;
  std::optional<uint32_t> shipping_time_days;
  std::optional<std::string> terms;
  uint32_t htlc_timeout_blocks{kDefaultHtlcTimeoutBlocks};
};

// 310
struct collateral_deposit_t final {
  event_id_t bid_ref{};
  hash32_t collateral_proof{};
  amount_sats_t amount_satoshis{};
};

// 311
struct payment_confirmation_t final {
  event_id_t bid_ref{};
  std::optional<event_id_t> acceptance_ref;
  hash32_t payment_proof{};
  payment_method_t payment_method{payment_method_t::lightning_htlc};
  std::optional<hash32_t> collateral_proof;
  std::optional<amount_sats_t> payment_amount_satoshis;
  std::optional<amount_sats_t> collateral_amount_satoshis;
  std::optional<timestamp_seconds_t> payment_timestamp;
};

// 312
struct escrow_dispute_t final {
  event_id_t payment_ref{};
  std::string reason;
  std::optional<std::string> evidence_hash;
};

/// Optional structured feedback carried by a receipt confirmation.
struct receipt_rating_t final {
  uint32_t rating{};
  std::optional<std::string> feedback;
  std::optional<std::string> item_condition;
  std::optional<uint32_t> shipping_rating;
  std::optional<uint32_t> communication_rating;
  std::optional<bool> would_buy_again;
};

// 313
struct receipt_confirmation_t final {
  event_id_t payment_ref{};
  receipt_status_t status{receipt_status_t::received};
  std::optional<std::string> dispute_reason;
  std::optional<preimage_t> payment_preimage;
  std::optional<receipt_rating_t> rating;
};

// 314
struct refund_initiation_t final {
  event_id_t payment_ref{};
  std::optional<std::string> reason;
};

// 315. Each party posts its own; the dispute settles once buyer and seller
// name the same resolution. With `offer_ref` the event instead binds its
// author to the arbitration offer and `resolution` is not counted.
struct mutual_agreement_t final {
  event_id_t dispute_ref{};
  resolution_t resolution{resolution_t::refund};
  std::optional<std::string> terms;
  std::optional<event_id_t> offer_ref;
};

// 316
struct arbitration_offer_t final {
  event_id_t dispute_ref{};
  amount_sats_t fee_satoshis{};
  std::optional<std::string> terms;
};

// 317
struct arbitration_resolution_t final {
  event_id_t offer_ref{};
  resolution_t resolution{resolution_t::refund};
  std::optional<std::string> rationale;
};

// 320
struct communication_message_t final {
  public_key_t recipient_pubkey{};
  std::string message;
  std::optional<event_id_t> transaction_ref;
};

/// 321, 322 and 323 share one shape; the kind selects whom is rated.
struct reputation_feedback_t final {
  event_kind_t kind{event_kind_t::user_reputation_feedback};
  hash32_t transaction_ref{};
  public_key_t rated_pubkey{};
  uint32_t rating{};
  std::optional<uint32_t> item_quality;
  std::optional<uint32_t> shipping_speed;
  std::optional<uint32_t> communication;
  std::optional<uint32_t> payment_reliability;
  std::optional<std::string> feedback;
  std::optional<std::string> relay_url;
};

using content_t = std::variant<product_listing_t,
                               bid_submission_t,
                               counter_bid_t,
                               bid_acceptance_t,
                               collateral_deposit_t,
                               payment_confirmation_t,
                               escrow_dispute_t,
                               receipt_confirmation_t,
                               refund_initiation_t,
                               mutual_agreement_t,
                               arbitration_offer_t,
                               arbitration_resolution_t,
                               communication_message_t,
                               reputation_feedback_t>;

}  // namespace domp::schema
