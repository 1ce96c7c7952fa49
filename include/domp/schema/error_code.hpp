#pragma once

#include <domp/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace domp::schema {

/// Protocol error codes. The hundreds digit selects the category.
enum class error_code : uint32_t {
  ok = 0,

  // Malformed: dropped, never stored.
  id_mismatch = 101,
  bad_signature = 102,
  malformed_event = 103,
  malformed_content = 104,
  unsupported_kind = 105,
  timestamp_in_future = 106,

  // PolicyRejected: the sender may retry with a stronger proof.
  missing_proof = 201,
  malformed_proof = 202,
  insufficient_difficulty = 203,
  unconfirmed_payment = 204,
  reference_already_consumed = 205,
  reference_not_found = 206,

  // SequenceRejected: illegal for the current transaction state.
  invalid_transition = 301,
  unknown_reference = 302,
  unauthorized_author = 303,
  self_dealing = 304,
  causality_violation = 305,
  invalid_amount = 306,
  insufficient_collateral = 307,

  // EscrowViolation: surfaced to the initiating party, recoverable.
  amount_mismatch = 401,
  incomplete_funding = 402,
  preimage_mismatch = 403,
  recipient_mismatch = 404,
  escrow_not_found = 405,
  escrow_state_invalid = 406,
  escrow_not_expired = 407,

  // Reputation.
  duplicate_reference = 501,
  invalid_rating = 502,
};

enum class error_category_t : uint8_t {
  none = 0,
  malformed = 1,
  policy_rejected = 2,
  sequence_rejected = 3,
  escrow_violation = 4,
  reputation = 5
};

inline constexpr error_category_t category_of(const error_code code) {
  switch (static_cast<uint32_t>(code) / 100) {
    case 1:
      return error_category_t::malformed;
    case 2:
      return error_category_t::policy_rejected;
    case 3:
      return error_category_t::sequence_rejected;
    case 4:
      return error_category_t::escrow_violation;
    case 5:
      return error_category_t::reputation;
    default:
      return error_category_t::none;
  }
}

inline constexpr auto kErrorCategoryMappings =
    enum_mappings_t<error_category_t, 6>{
        std::pair{std::string_view{"none"}, error_category_t::none},
        std::pair{std::string_view{"malformed"}, error_category_t::malformed},
        std::pair{std::string_view{"policy_rejected"},
                  error_category_t::policy_rejected},
        std::pair{std::string_view{"sequence_rejected"},
                  error_category_t::sequence_rejected},
        std::pair{std::string_view{"escrow_violation"},
                  error_category_t::escrow_violation},
        std::pair{std::string_view{"reputation"},
                  error_category_t::reputation}};

inline constexpr std::string_view to_string(const error_category_t value) {
  return to_string(value, kErrorCategoryMappings).value_or("unknown");
}

inline constexpr auto kErrorCodeMappings = enum_mappings_t<error_code, 29>{
    std::pair{std::string_view{"ok"}, error_code::ok},
    std::pair{std::string_view{"id_mismatch"}, error_code::id_mismatch},
    std::pair{std::string_view{"bad_signature"}, error_code::bad_signature},
    std::pair{std::string_view{"malformed_event"}, error_code::malformed_event},
    std::pair{std::string_view{"malformed_content"},
              error_code::malformed_content},
    std::pair{std::string_view{"unsupported_kind"},
              error_code::unsupported_kind},
    std::pair{std::string_view{"timestamp_in_future"},
              error_code::timestamp_in_future},
    std::pair{std::string_view{"missing_proof"}, error_code::missing_proof},
    std::pair{std::string_view{"malformed_proof"}, error_code::malformed_proof},
    std::pair{std::string_view{"insufficient_difficulty"},
              error_code::insufficient_difficulty},
    std::pair{std::string_view{"unconfirmed_payment"},
              error_code::unconfirmed_payment},
    std::pair{std::string_view{"reference_already_consumed"},
              error_code::reference_already_consumed},
    std::pair{std::string_view{"reference_not_found"},
              error_code::reference_not_found},
    std::pair{std::string_view{"invalid_transition"},
              error_code::invalid_transition},
    std::pair{std::string_view{"unknown_reference"},
              error_code::unknown_reference},
    std::pair{std::string_view{"unauthorized_author"},
              error_code::unauthorized_author},
    std::pair{std::string_view{"self_dealing"}, error_code::self_dealing},
    std::pair{std::string_view{"causality_violation"},
              error_code::causality_violation},
    std::pair{std::string_view{"invalid_amount"}, error_code::invalid_amount},
    std::pair{std::string_view{"insufficient_collateral"},
              error_code::insufficient_collateral},
    std::pair{std::string_view{"amount_mismatch"}, error_code::amount_mismatch},
    std::pair{std::string_view{"incomplete_funding"},
              error_code::incomplete_funding},
    std::pair{std::string_view{"preimage_mismatch"},
              error_code::preimage_mismatch},
    std::pair{std::string_view{"recipient_mismatch"},
              error_code::recipient_mismatch},
    std::pair{std::string_view{"escrow_not_found"},
              error_code::escrow_not_found},
    std::pair{std::string_view{"escrow_state_invalid"},
              error_code::escrow_state_invalid},
    std::pair{std::string_view{"escrow_not_expired"},
              error_code::escrow_not_expired},
    std::pair{std::string_view{"duplicate_reference"},
              error_code::duplicate_reference},
    std::pair{std::string_view{"invalid_rating"}, error_code::invalid_rating}};

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

}  // namespace domp::schema
