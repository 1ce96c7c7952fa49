#pragma once

#include <domp/schema/enum_string.hpp>
#include <domp/schema/event_kind.hpp>
#include <domp/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace domp::schema {

inline constexpr auto kMinRating = uint32_t{1};
inline constexpr auto kMaxRating = uint32_t{5};

template <uint16_t Version>
struct reputation_record;

/// One rating of `rated` by `rater`, anchored at the referenced event.
template <>
struct reputation_record<1> final {
  uint16_t version{1};
  public_key_t rater{};
  public_key_t rated{};
  hash32_t transaction_id{};
  event_id_t referenced_event_id{};
  event_id_t source_event_id{};
  event_kind_t source_kind{event_kind_t::receipt_confirmation};
  uint32_t rating{};
  amount_sats_t amount_sats{};
  timestamp_seconds_t created_at{};
  bool verified_purchase{false};
  bool escrow_completed{false};
  std::optional<uint32_t> item_quality;
  std::optional<uint32_t> shipping_speed;
  std::optional<uint32_t> communication;
  std::optional<uint32_t> payment_reliability;
  std::optional<std::string> feedback;
};

using reputation_record_t = reputation_record<1>;

inline constexpr auto kMinReviewsForReliability = uint64_t{5};

enum class reliability_t : uint8_t {
  unknown = 0,
  new_participant = 1,
  limited_data = 2,
  poor = 3,
  below_average = 4,
  average = 5,
  good = 6,
  excellent = 7
};

inline constexpr auto kReliabilityMappings = enum_mappings_t<reliability_t, 8>{
    std::pair{std::string_view{"unknown"}, reliability_t::unknown},
    std::pair{std::string_view{"new"}, reliability_t::new_participant},
    std::pair{std::string_view{"limited_data"}, reliability_t::limited_data},
    std::pair{std::string_view{"poor"}, reliability_t::poor},
    std::pair{std::string_view{"below_average"}, reliability_t::below_average},
    std::pair{std::string_view{"average"}, reliability_t::average},
    std::pair{std::string_view{"good"}, reliability_t::good},
    std::pair{std::string_view{"excellent"}, reliability_t::excellent}};

inline constexpr std::string_view to_string(const reliability_t value) {
  return to_string(value, kReliabilityMappings).value_or("unknown");
}

/// Aggregate view of every record about one participant.
struct reputation_summary_t final {
  public_key_t subject{};
  double overall_score{};
  uint64_t transaction_count{};
  amount_sats_t total_volume_sats{};
  uint64_t unique_reviewers{};
  uint64_t verified_purchases{};
  uint64_t completed_escrows{};
  std::optional<double> item_quality;
  std::optional<double> shipping_speed;
  std::optional<double> communication;
  std::optional<double> payment_reliability;
  double review_concentration{};
  uint64_t recent_activity{};
  timestamp_seconds_t first_activity{};
  timestamp_seconds_t last_activity{};
  double trust_score{};
  reliability_t reliability{reliability_t::unknown};

  double volume_btc() const {
    return static_cast<double>(total_volume_sats) /
           static_cast<double>(kSatsPerBtc);
  }
};

}  // namespace domp::schema
