#pragma once

#include <domp/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Wire-level event kinds. Values are normative and must not be renumbered.
namespace domp::schema {

enum class event_kind_t : uint16_t {
  product_listing = 300,
  bid_submission = 301,
  counter_bid = 302,
  bid_acceptance = 303,
  collateral_deposit = 310,
  payment_confirmation = 311,
  escrow_dispute = 312,
  receipt_confirmation = 313,
  refund_initiation = 314,
  mutual_agreement = 315,
  arbitration_offer = 316,
  arbitration_resolution = 317,
  communication_message = 320,
  user_reputation_feedback = 321,
  arbitrator_reputation_feedback = 322,
  relay_reputation_feedback = 323
};

inline constexpr auto kEventKindMappings = enum_mappings_t<event_kind_t, 16>{
    std::pair{std::string_view{"product_listing"},
              event_kind_t::product_listing},
    std::pair{std::string_view{"bid_submission"}, event_kind_t::bid_submission},
    std::pair{std::string_view{"counter_bid"}, event_kind_t::counter_bid},
    std::pair{std::string_view{"bid_acceptance"}, event_kind_t::bid_acceptance},
    std::pair{std::string_view{"collateral_deposit"},
              event_kind_t::collateral_deposit},
    std::pair{std::string_view{"payment_confirmation"},
              event_kind_t::payment_confirmation},
    std::pair{std::string_view{"escrow_dispute"}, event_kind_t::escrow_dispute},
    std::pair{std::string_view{"receipt_confirmation"},
              event_kind_t::receipt_confirmation},
    std::pair{std::string_view{"refund_initiation"},
              event_kind_t::refund_initiation},
    std::pair{std::string_view{"mutual_agreement"},
              event_kind_t::mutual_agreement},
    std::pair{std::string_view{"arbitration_offer"},
              event_kind_t::arbitration_offer},
    std::pair{std::string_view{"arbitration_resolution"},
              event_kind_t::arbitration_resolution},
    std::pair{std::string_view{"communication_message"},
              event_kind_t::communication_message},
    std::pair{std::string_view{"user_reputation_feedback"},
              event_kind_t::user_reputation_feedback},
    std::pair{std::string_view{"arbitrator_reputation_feedback"},
              event_kind_t::arbitrator_reputation_feedback},
    std::pair{std::string_view{"relay_reputation_feedback"},
              event_kind_t::relay_reputation_feedback}};

template <>
inline std::optional<event_kind_t> try_from_string<event_kind_t>(
    const std::string_view value) {
  return from_string(value, kEventKindMappings);
}

inline constexpr std::string_view to_string(const event_kind_t value) {
  return to_string(value, kEventKindMappings).value_or("unknown");
}

/// Map a raw wire kind onto a known protocol kind.
inline constexpr std::optional<event_kind_t> try_make_event_kind(
    const uint16_t raw) {
  for (const auto& [name, kind] : kEventKindMappings) {
    if (static_cast<uint16_t>(kind) == raw) {
      return kind;
    }
  }
  return std::nullopt;
}

inline constexpr bool is_reputation_kind(const event_kind_t kind) {
  return kind == event_kind_t::user_reputation_feedback ||
         kind == event_kind_t::arbitrator_reputation_feedback ||
         kind == event_kind_t::relay_reputation_feedback;
}

}  // namespace domp::schema
