#pragma once

#include <domp/schema/enum_string.hpp>
#include <domp/schema/event_kind.hpp>
#include <domp/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

// Anti-spam evidence attached to every event as a single
// ["anti_spam_proof", <type>, ...] tag.
namespace domp::schema {

enum class proof_type_t : uint8_t { pow = 0, ln = 1, ref = 2 };

inline constexpr auto kProofTypeMappings = enum_mappings_t<proof_type_t, 3>{
    std::pair{std::string_view{"pow"}, proof_type_t::pow},
    std::pair{std::string_view{"ln"}, proof_type_t::ln},
    std::pair{std::string_view{"ref"}, proof_type_t::ref}};

template <>
inline std::optional<proof_type_t> try_from_string<proof_type_t>(
    const std::string_view value) {
  return from_string(value, kProofTypeMappings);
}

inline constexpr std::string_view to_string(const proof_type_t value) {
  return to_string(value, kProofTypeMappings).value_or("unknown");
}

struct pow_proof_t final {
  uint64_t nonce{};
  uint32_t difficulty{};
};

struct payment_proof_t final {
  hash32_t payment_hash{};
  amount_sats_t amount_sats{};
};

struct reference_proof_t final {
  event_id_t event_id{};
  uint16_t kind{};
};

using anti_spam_proof_t =
    std::variant<pow_proof_t, payment_proof_t, reference_proof_t>;

/// Minimums the validator enforces.
struct anti_spam_policy_t final {
  uint32_t min_pow_difficulty{8};
  amount_sats_t min_payment_sats{10};
};

}  // namespace domp::schema
