#include <domp/reputation/engine.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <mutex>

using namespace domp::schema;

namespace domp::reputation {

namespace {

bool rating_in_range(const uint32_t rating) {
  return rating >= kMinRating && rating <= kMaxRating;
}

bool optional_rating_in_range(const std::optional<uint32_t>& rating) {
  return !rating.has_value() || rating_in_range(*rating);
}

template <typename Field>
std::optional<double> optional_average(
    const std::vector<reputation_record_t>& records,
    Field field) {
  auto sum = 0.0;
  auto count = 0u;
  for (const auto& record : records) {
    const auto& value = record.*field;
    if (value) {
      sum += static_cast<double>(*value);
      ++count;
    }
  }
  if (count == 0) {
    return std::nullopt;
  }
  return sum / static_cast<double>(count);
}

}  // namespace

double compute_score(const std::vector<reputation_record_t>& records,
                     const timestamp_seconds_t now) {
  auto total_weight = 0.0;
  auto weighted_sum = 0.0;
  for (const auto& record : records) {
    auto age_seconds = now > record.created_at ? now - record.created_at : 0;
    auto age_days = static_cast<double>(age_seconds) / kSecondsPerDay;
    auto time_weight = std::exp(-age_days / 365.0);
    auto volume_weight = std::log10(
        std::max(1.0, static_cast<double>(record.amount_sats) / 100'000.0));
    auto verification_bonus = 1.0 + (record.verified_purchase ? 0.2 : 0.0) +
                              (record.escrow_completed ? 0.3 : 0.0);
    auto weight = time_weight * volume_weight * verification_bonus;
    total_weight += weight;
    weighted_sum += weight * static_cast<double>(record.rating);
  }
  if (total_weight <= 0.0) {
    return 0.0;
  }
  return weighted_sum / total_weight;
}

double trust_score(const reputation_summary_t& summary) {
  auto count = static_cast<double>(summary.transaction_count);
  auto score =
      0.4 * (summary.overall_score / 5.0) +
      0.2 * std::min(1.0, summary.volume_btc() / 10.0) +
      0.2 * std::min(1.0, count / 50.0) +
      0.1 * std::min(1.0, static_cast<double>(summary.unique_reviewers) /
                              20.0) +
      0.1 * (static_cast<double>(summary.verified_purchases) /
             std::max(1.0, count));
  return std::clamp(score, 0.0, 1.0);
}

double review_concentration(const std::vector<reputation_record_t>& records) {
  if (records.empty()) {
    return 0.0;
  }
  auto per_reviewer = std::map<public_key_t, uint64_t>{};
  for (const auto& record : records) {
    ++per_reviewer[record.rater];
  }
  auto counts = std::vector<uint64_t>{};
  counts.reserve(per_reviewer.size());
  for (const auto& [rater, count] : per_reviewer) {
    counts.push_back(count);
  }
  std::sort(counts.begin(), counts.end());

  auto n = static_cast<double>(counts.size());
  auto total = 0.0;
  auto ranked = 0.0;
  for (std::size_t i = 0; i < counts.size(); ++i) {
    total += static_cast<double>(counts[i]);
    ranked += static_cast<double>(i + 1) * static_cast<double>(counts[i]);
  }
  auto gini = (2.0 * ranked) / (n * total) - (n + 1.0) / n;
  return std::clamp(gini, 0.0, 1.0);
}

reliability_t classify(const uint64_t transaction_count,
                       const double overall_score) {
  if (transaction_count == 0) {
    return reliability_t::unknown;
  }
  if (transaction_count < kMinReviewsForReliability) {
    return transaction_count < 3 ? reliability_t::new_participant
                                 : reliability_t::limited_data;
  }
  if (overall_score >= 4.5) {
    return reliability_t::excellent;
  }
  if (overall_score >= 4.0) {
    return reliability_t::good;
  }
  if (overall_score >= 3.5) {
    return reliability_t::average;
  }
  if (overall_score >= 2.5) {
    return reliability_t::below_average;
  }
  return reliability_t::poor;
}

status_t engine::record(const reputation_record_t& record) {
  if (!rating_in_range(record.rating) ||
      !optional_rating_in_range(record.item_quality) ||
      !optional_rating_in_range(record.shipping_speed) ||
      !optional_rating_in_range(record.communication) ||
      !optional_rating_in_range(record.payment_reliability)) {
    return status_t::failure(error_code::invalid_rating,
                             "ratings must be between 1 and 5");
  }
  if (record.rater == record.rated) {
    return status_t::failure(error_code::invalid_rating,
                             "participants cannot rate themselves");
  }

  auto lock = std::unique_lock{mutex_};
  auto key = std::pair{record.rater, record.referenced_event_id};
  if (!references_.insert(key).second) {
    return status_t::failure(
        error_code::duplicate_reference,
        fmt::format("{} already rated against {}", short_hex(record.rater),
                    short_hex(record.referenced_event_id)));
  }
  by_subject_[record.rated].push_back(record);
  spdlog::debug("reputation record {} -> {} rating {}", short_hex(record.rater),
                short_hex(record.rated), record.rating);
  return status_t::success();
}

std::vector<reputation_record_t> engine::records_for(
    const public_key_t& subject) const {
  auto lock = std::shared_lock{mutex_};
  auto it = by_subject_.find(subject);
  if (it == by_subject_.end()) {
    return {};
  }
  return it->second;
}

reputation_summary_t engine::summarize(const public_key_t& subject,
                                       const timestamp_seconds_t now) const {
  auto records = records_for(subject);
  auto summary = reputation_summary_t{.subject = subject};
  if (records.empty()) {
    return summary;
  }

  auto reviewers = std::set<public_key_t>{};
  summary.first_activity = records.front().created_at;
  summary.last_activity = records.front().created_at;
  for (const auto& record : records) {
    summary.total_volume_sats += record.amount_sats;
    reviewers.insert(record.rater);
    if (record.verified_purchase) {
      ++summary.verified_purchases;
    }
    if (record.escrow_completed) {
      ++summary.completed_escrows;
    }
    if (record.created_at + kRecentActivityWindow > now) {
      ++summary.recent_activity;
    }
    summary.first_activity = std::min(summary.first_activity, record.created_at);
    summary.last_activity = std::max(summary.last_activity, record.created_at);
  }
  summary.transaction_count = records.size();
  summary.unique_reviewers = reviewers.size();
  summary.overall_score = compute_score(records, now);
  summary.item_quality =
      optional_average(records, &reputation_record_t::item_quality);
  summary.shipping_speed =
      optional_average(records, &reputation_record_t::shipping_speed);
  summary.communication =
      optional_average(records, &reputation_record_t::communication);
  summary.payment_reliability =
      optional_average(records, &reputation_record_t::payment_reliability);
  summary.review_concentration = review_concentration(records);
  summary.trust_score = trust_score(summary);
  summary.reliability =
      classify(summary.transaction_count, summary.overall_score);
  return summary;
}

std::vector<reputation_summary_t> engine::compare(
    const std::vector<public_key_t>& subjects,
    const timestamp_seconds_t now) const {
  auto summaries = std::vector<reputation_summary_t>{};
  summaries.reserve(subjects.size());
  for (const auto& subject : subjects) {
    summaries.push_back(summarize(subject, now));
  }
  std::stable_sort(summaries.begin(), summaries.end(),
                   [](const auto& lhs, const auto& rhs) {
                     return lhs.overall_score > rhs.overall_score;
                   });
  return summaries;
}

std::vector<reputation_record_t> engine::all_records() const {
  auto lock = std::shared_lock{mutex_};
  auto out = std::vector<reputation_record_t>{};
  for (const auto& [subject, records] : by_subject_) {
    out.insert(out.end(), records.begin(), records.end());
  }
  return out;
}

bool engine::seen(const public_key_t& rater,
                  const event_id_t& referenced_event_id) const {
  auto lock = std::shared_lock{mutex_};
  return references_.contains(std::pair{rater, referenced_event_id});
}

std::size_t engine::size() const {
  auto lock = std::shared_lock{mutex_};
  auto total = std::size_t{0};
  for (const auto& [subject, records] : by_subject_) {
    total += records.size();
  }
  return total;
}

}  // namespace domp::reputation
