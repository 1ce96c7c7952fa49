#include <domp/reputation/engine.hpp>
#include <domp/testing/common.hpp>
#include <gtest/gtest.h>

#include <cmath>

using namespace domp::schema;

namespace {

inline constexpr auto kNow = domp::testing::kGenesis;

reputation_record_t make_record(const uint8_t rater,
                                const uint8_t rated,
                                const uint8_t reference,
                                const uint32_t rating,
                                const amount_sats_t amount = 1'000'000) {
  return reputation_record_t{
      .rater = domp::testing::make_hash(rater),
      .rated = domp::testing::make_hash(rated),
      .transaction_id = domp::testing::make_hash(reference),
      .referenced_event_id = domp::testing::make_hash(reference),
      .source_event_id = domp::testing::make_hash(static_cast<uint8_t>(reference + 100)),
      .rating = rating,
      .amount_sats = amount,
      .created_at = kNow};
}

}  // namespace

TEST(reputation_score, weights_by_volume_and_verification) {
  auto verified = make_record(1, 9, 10, 5, 1'000'000);
  verified.verified_purchase = true;
  verified.escrow_completed = true;
  auto large = make_record(2, 9, 11, 2, 10'000'000);

  // Weights 1.5 and 2.0.
  EXPECT_NEAR(domp::reputation::compute_score({verified, large}, kNow),
              (1.5 * 5 + 2.0 * 2) / 3.5, 1e-9);
}

TEST(reputation_score, older_records_count_less) {
  auto fresh = make_record(1, 9, 10, 5);
  auto stale = make_record(2, 9, 11, 1);
  stale.created_at = kNow - 365 * 86'400;
  auto decay = std::exp(-1.0);
  EXPECT_NEAR(domp::reputation::compute_score({fresh, stale}, kNow),
              (5.0 + decay) / (1.0 + decay), 1e-9);
}

TEST(reputation_score, zero_total_weight_scores_zero) {
  EXPECT_EQ(domp::reputation::compute_score({}, kNow), 0.0);
  // Below 100k sats the volume weight is log10(1) = 0.
  EXPECT_EQ(domp::reputation::compute_score({make_record(1, 9, 10, 5, 50'000)},
                                            kNow),
            0.0);
}

TEST(reputation_concentration, gini_of_reviews_per_reviewer) {
  EXPECT_EQ(domp::reputation::review_concentration({}), 0.0);
  EXPECT_NEAR(domp::reputation::review_concentration(
                  {make_record(1, 9, 10, 5), make_record(2, 9, 11, 5)}),
              0.0, 1e-9);
  EXPECT_NEAR(domp::reputation::review_concentration(
                  {make_record(1, 9, 10, 5), make_record(2, 9, 11, 5),
                   make_record(2, 9, 12, 5), make_record(2, 9, 13, 5)}),
              0.25, 1e-9);
}

TEST(reputation_classify, buckets_by_count_then_score) {
  using domp::reputation::classify;
  EXPECT_EQ(classify(0, 5.0), reliability_t::unknown);
  EXPECT_EQ(classify(2, 5.0), reliability_t::new_participant);
  EXPECT_EQ(classify(4, 5.0), reliability_t::limited_data);
  EXPECT_EQ(classify(5, 4.5), reliability_t::excellent);
  EXPECT_EQ(classify(5, 4.2), reliability_t::good);
  EXPECT_EQ(classify(5, 3.5), reliability_t::average);
  EXPECT_EQ(classify(5, 2.5), reliability_t::below_average);
  EXPECT_EQ(classify(5, 2.4), reliability_t::poor);
}

TEST(reputation_engine, rejects_duplicates_self_ratings_and_bad_ranges) {
  auto engine = domp::reputation::engine{};
  EXPECT_TRUE(engine.record(make_record(1, 9, 10, 4)).ok());
  EXPECT_TRUE(engine.seen(domp::testing::make_hash(1), domp::testing::make_hash(10)));

  EXPECT_EQ(engine.record(make_record(1, 8, 10, 3)).code,
            error_code::duplicate_reference);
  EXPECT_EQ(engine.record(make_record(9, 9, 11, 3)).code,
            error_code::invalid_rating);
  EXPECT_EQ(engine.record(make_record(1, 9, 12, 0)).code,
            error_code::invalid_rating);

  auto bad_detail = make_record(1, 9, 13, 4);
  bad_detail.shipping_speed = 6;
  EXPECT_EQ(engine.record(bad_detail).code, error_code::invalid_rating);

  // Another rater may use the same reference.
  EXPECT_TRUE(engine.record(make_record(2, 9, 10, 5)).ok());
  EXPECT_EQ(engine.size(), 2u);
}

TEST(reputation_engine, summary_aggregates_subject_records) {
  auto engine = domp::reputation::engine{};
  auto first = make_record(1, 9, 10, 5, 100'000'000);
  first.verified_purchase = true;
  first.item_quality = 4;
  first.created_at = kNow - 40 * 86'400;
  auto second = make_record(2, 9, 11, 3, 100'000'000);
  second.item_quality = 2;
  ASSERT_TRUE(engine.record(first).ok());
  ASSERT_TRUE(engine.record(second).ok());
  ASSERT_TRUE(engine.record(make_record(9, 1, 12, 1)).ok());

  auto summary = engine.summarize(domp::testing::make_hash(9), kNow);
  EXPECT_EQ(summary.transaction_count, 2u);
  EXPECT_EQ(summary.unique_reviewers, 2u);
  EXPECT_EQ(summary.verified_purchases, 1u);
  EXPECT_EQ(summary.recent_activity, 1u);
  EXPECT_EQ(summary.total_volume_sats, 200'000'000u);
  EXPECT_DOUBLE_EQ(summary.volume_btc(), 2.0);
  ASSERT_TRUE(summary.item_quality.has_value());
  EXPECT_DOUBLE_EQ(*summary.item_quality, 3.0);
  EXPECT_FALSE(summary.communication.has_value());
  EXPECT_EQ(summary.first_activity, first.created_at);
  EXPECT_EQ(summary.last_activity, kNow);
  EXPECT_EQ(summary.reliability, reliability_t::new_participant);
  EXPECT_GT(summary.trust_score, 0.0);
  EXPECT_LE(summary.trust_score, 1.0);

  auto empty = engine.summarize(domp::testing::make_hash(50), kNow);
  EXPECT_EQ(empty.transaction_count, 0u);
  EXPECT_EQ(empty.reliability, reliability_t::unknown);
}

TEST(reputation_engine, trust_score_combines_weighted_components) {
  auto summary = reputation_summary_t{.overall_score = 5.0,
                                      .transaction_count = 50,
                                      .total_volume_sats = 10 * kSatsPerBtc,
                                      .unique_reviewers = 20,
                                      .verified_purchases = 50};
  EXPECT_DOUBLE_EQ(domp::reputation::trust_score(summary), 1.0);

  summary.overall_score = 2.5;
  summary.verified_purchases = 25;
  EXPECT_NEAR(domp::reputation::trust_score(summary), 0.2 + 0.2 + 0.2 + 0.1 + 0.05,
              1e-9);
}

TEST(reputation_engine, compare_orders_best_first) {
  auto engine = domp::reputation::engine{};
  ASSERT_TRUE(engine.record(make_record(1, 8, 10, 2)).ok());
  ASSERT_TRUE(engine.record(make_record(1, 9, 11, 5)).ok());
  auto ranked = engine.compare(
      {domp::testing::make_hash(8), domp::testing::make_hash(7),
       domp::testing::make_hash(9)},
      kNow);
  ASSERT_EQ(ranked.size(), 3u);
  EXPECT_EQ(ranked[0].subject, domp::testing::make_hash(9));
  EXPECT_EQ(ranked[1].subject, domp::testing::make_hash(8));
  EXPECT_EQ(ranked[2].subject, domp::testing::make_hash(7));
}
