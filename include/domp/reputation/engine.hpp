#pragma once

#include <domp/schema/primitives.hpp>
#include <domp/schema/reputation.hpp>
#include <domp/schema/result.hpp>

#include <map>
#include <set>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace domp::reputation {

inline constexpr auto kSecondsPerDay = double{86'400.0};
inline constexpr auto kRecentActivityWindow =
    domp::schema::duration_seconds_t{30 * 86'400};

/// Time, volume and verification weighted mean of the 1-5 ratings.
/// Returns 0.0 for no records or when every weight is zero.
double compute_score(const std::vector<domp::schema::reputation_record_t>& records,
                     domp::schema::timestamp_seconds_t now);

/// Combined trust in [0, 1].
double trust_score(const domp::schema::reputation_summary_t& summary);

/// Gini coefficient of reviews per reviewer; 0 is evenly spread.
double review_concentration(
    const std::vector<domp::schema::reputation_record_t>& records);

domp::schema::reliability_t classify(uint64_t transaction_count,
                                     double overall_score);

/// Duplicate-filtering store of reputation records, indexed by subject.
class engine final {
 public:
  /// Admit a record. `duplicate_reference` when the rater already rated
  /// against the same reference; `invalid_rating` when any rating is
  /// outside 1..5.
  domp::schema::status_t record(const domp::schema::reputation_record_t& record);

  std::vector<domp::schema::reputation_record_t> records_for(
      const domp::schema::public_key_t& subject) const;

  domp::schema::reputation_summary_t summarize(
      const domp::schema::public_key_t& subject,
      domp::schema::timestamp_seconds_t now) const;

  /// Summaries ordered best first by overall score.
  std::vector<domp::schema::reputation_summary_t> compare(
      const std::vector<domp::schema::public_key_t>& subjects,
      domp::schema::timestamp_seconds_t now) const;

  /// Every record, grouped by subject in key order.
  std::vector<domp::schema::reputation_record_t> all_records() const;

  bool seen(const domp::schema::public_key_t& rater,
            const domp::schema::event_id_t& referenced_event_id) const;

  std::size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::map<domp::schema::public_key_t,
           std::vector<domp::schema::reputation_record_t>>
      by_subject_;
  std::set<std::pair<domp::schema::public_key_t, domp::schema::event_id_t>>
      references_;
};

}  // namespace domp::reputation
