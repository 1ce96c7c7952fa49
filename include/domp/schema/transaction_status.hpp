#pragma once

#include <domp/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Marketplace transaction lifecycle rooted at a listing.
namespace domp::schema {

enum class transaction_status_t : uint8_t {
  listed = 0,
  bid_received = 1,
  bid_accepted = 2,
  payment_confirmed = 3,
  completed = 4,
  disputed = 5,
  arbitration_offered = 6,
  mutually_agreed = 7,
  refunded = 8,
  expired = 9
};

inline constexpr auto kTransactionStatusMappings =
    enum_mappings_t<transaction_status_t, 10>{
        std::pair{std::string_view{"listed"}, transaction_status_t::listed},
        std::pair{std::string_view{"bid_received"},
                  transaction_status_t::bid_received},
        std::pair{std::string_view{"bid_accepted"},
                  transaction_status_t::bid_accepted},
        std::pair{std::string_view{"payment_confirmed"},
                  transaction_status_t::payment_confirmed},
        std::pair{std::string_view{"completed"},
                  transaction_status_t::completed},
        std::pair{std::string_view{"disputed"}, transaction_status_t::disputed},
        std::pair{std::string_view{"arbitration_offered"},
                  transaction_status_t::arbitration_offered},
        std::pair{std::string_view{"mutually_agreed"},
                  transaction_status_t::mutually_agreed},
        std::pair{std::string_view{"refunded"}, transaction_status_t::refunded},
        std::pair{std::string_view{"expired"}, transaction_status_t::expired}};

template <>
inline std::optional<transaction_status_t>
try_from_string<transaction_status_t>(const std::string_view value) {
  return from_string(value, kTransactionStatusMappings);
}

inline constexpr std::string_view to_string(const transaction_status_t value) {
  return to_string(value, kTransactionStatusMappings).value_or("unknown");
}

inline constexpr bool is_terminal(const transaction_status_t value) {
  return value == transaction_status_t::completed ||
         value == transaction_status_t::refunded ||
         value == transaction_status_t::expired;
}

/// State of one bid branch under a listing.
enum class bid_status_t : uint8_t {
  open = 0,
  accepted = 1,
  closed = 2,
  countered = 3
};

inline constexpr auto kBidStatusMappings = enum_mappings_t<bid_status_t, 4>{
    std::pair{std::string_view{"open"}, bid_status_t::open},
    std::pair{std::string_view{"accepted"}, bid_status_t::accepted},
    std::pair{std::string_view{"closed"}, bid_status_t::closed},
    std::pair{std::string_view{"countered"}, bid_status_t::countered}};

inline constexpr std::string_view to_string(const bid_status_t value) {
  return to_string(value, kBidStatusMappings).value_or("unknown");
}

}  // namespace domp::schema
