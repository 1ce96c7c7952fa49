#pragma once

#include <domp/schema/enum_string.hpp>
#include <domp/schema/error_code.hpp>
#include <domp/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Hash time-locked escrow owned by a marketplace transaction.
namespace domp::schema {

enum class escrow_state_t : uint8_t {
  pending = 0,
  active = 1,
  completed = 2,
  refunded = 3,
  expired = 4
};

inline constexpr auto kEscrowStateMappings =
    enum_mappings_t<escrow_state_t, 5>{
        std::pair{std::string_view{"pending"}, escrow_state_t::pending},
        std::pair{std::string_view{"active"}, escrow_state_t::active},
        std::pair{std::string_view{"completed"}, escrow_state_t::completed},
        std::pair{std::string_view{"refunded"}, escrow_state_t::refunded},
        std::pair{std::string_view{"expired"}, escrow_state_t::expired}};

template <>
inline std::optional<escrow_state_t> try_from_string<escrow_state_t>(
    const std::string_view value) {
  return from_string(value, kEscrowStateMappings);
}

inline constexpr std::string_view to_string(const escrow_state_t value) {
  return to_string(value, kEscrowStateMappings).value_or("unknown");
}

/// Amount owed to each side once an escrow settles.
struct fund_distribution_t final {
  amount_sats_t to_seller{};
  amount_sats_t to_buyer{};

  amount_sats_t total() const { return to_seller + to_buyer; }
  bool operator==(const fund_distribution_t&) const = default;
};

template <uint16_t Version>
struct escrow;

template <>
struct escrow<1> final {
  uint16_t version{1};
  hash32_t transaction_id{};
  hash32_t payment_hash{};
  preimage_t preimage{};
  public_key_t buyer{};
  public_key_t seller{};
  amount_sats_t purchase_amount{};
  amount_sats_t buyer_collateral{};
  amount_sats_t seller_collateral{};
  timestamp_seconds_t timeout{};
  escrow_state_t state{escrow_state_t::pending};
  std::optional<fund_distribution_t> distribution;

  amount_sats_t total_locked() const {
    return purchase_amount + buyer_collateral + seller_collateral;
  }
};

using escrow_t = escrow<1>;

/// Which obligation a settled payment discharges.
enum class funding_leg_t : uint8_t {
  purchase = 0,
  buyer_collateral = 1,
  seller_collateral = 2
};

inline constexpr auto kFundingLegMappings = enum_mappings_t<funding_leg_t, 3>{
    std::pair{std::string_view{"purchase"}, funding_leg_t::purchase},
    std::pair{std::string_view{"buyer_collateral"},
              funding_leg_t::buyer_collateral},
    std::pair{std::string_view{"seller_collateral"},
              funding_leg_t::seller_collateral}};

inline constexpr std::string_view to_string(const funding_leg_t value) {
  return to_string(value, kFundingLegMappings).value_or("unknown");
}

/// Evidence that one funding leg was paid, identified by its payment hash.
struct funding_proof_t final {
  funding_leg_t leg{funding_leg_t::purchase};
  hash32_t payment_hash{};
  amount_sats_t amount_sats{};
};

/// Payment as reported settled by the payment collaborator.
struct settled_payment_t final {
  hash32_t payment_hash{};
  amount_sats_t amount_sats{};
  public_key_t payee{};
  timestamp_seconds_t settled_at{};
};

struct escrow_result_t final {
  error_code code{error_code::ok};
  std::string log;
  escrow_state_t state{escrow_state_t::pending};
  std::optional<fund_distribution_t> distribution;

  bool ok() const { return code == error_code::ok; }
};

}  // namespace domp::schema
