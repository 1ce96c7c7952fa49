#include <domp/antispam/pow_miner.hpp>
#include <domp/antispam/validator.hpp>
#include <domp/builder/event_builder.hpp>
#include <domp/codec/event_codec.hpp>
#include <domp/payment/memory_gateway.hpp>
#include <domp/testing/common.hpp>
#include <gtest/gtest.h>

#include <map>

using namespace domp::schema;

namespace {

/// Validator over a memory ledger and a map standing in for the event index.
struct harness final {
  domp::testing::manual_clock clock;
  domp::payment::memory_gateway gateway{clock.fn()};
  std::map<event_id_t, event_index_entry_t> index;
  domp::antispam::validator validator{
      anti_spam_policy_t{.min_pow_difficulty = 4, .min_payment_sats = 10},
      &gateway, [this](const event_id_t& id) -> std::optional<event_index_entry_t> {
        auto it = index.find(id);
        if (it == index.end()) {
          return std::nullopt;
        }
        return it->second;
      }};
  domp::builder::event_builder author{domp::testing::make_keys(1), clock.fn()};

  event_t signed_event(const unsigned_event_t& event) {
    auto signed_event = author.sign(event);
    EXPECT_TRUE(signed_event.has_value());
    return *signed_event;
  }

  unsigned_event_t listing() {
    return author.build(product_listing_t{.product_name = "Lens",
                                          .description = "50mm",
                                          .price_satoshis = 1000});
  }

  unsigned_event_t feedback(const uint16_t kind = 321) {
    auto content = reputation_feedback_t{
        .kind = static_cast<event_kind_t>(kind),
        .transaction_ref = domp::testing::make_hash(9),
        .rated_pubkey = domp::testing::make_keys(2).public_key,
        .rating = 5};
    return author.build(content);
  }

  void remember(const event_id_t& id, const public_key_t& author_key,
                const uint16_t kind) {
    index[id] = event_index_entry_t{
        .id = id, .author_key = author_key, .kind = kind, .created_at = clock.now()};
  }

  payment_proof_t paid(const amount_sats_t amount) {
    auto invoice = gateway.create_invoice(author.public_key(), amount, "proof", 600);
    EXPECT_TRUE(invoice.has_value());
    auto payer = domp::testing::make_keys(5).public_key;
    gateway.deposit(payer, amount);
    EXPECT_TRUE(gateway.pay(invoice->invoice, payer).ok());
    return payment_proof_t{.payment_hash = invoice->payment_hash,
                           .amount_sats = amount};
  }
};

}  // namespace

TEST(leading_zero_bits, counts_across_byte_boundaries) {
  auto id = hash32_t{};
  EXPECT_EQ(domp::antispam::leading_zero_bits(id), 256u);
  id[0] = 0x80;
  EXPECT_EQ(domp::antispam::leading_zero_bits(id), 0u);
  id[0] = 0x00;
  id[1] = 0x10;
  EXPECT_EQ(domp::antispam::leading_zero_bits(id), 11u);
}

TEST(proof_tag, parse_rejects_missing_repeated_and_unknown_tags) {
  auto code = error_code::ok;
  auto error = std::string{};

  EXPECT_FALSE(domp::antispam::parse_proof({{"t", "x"}}, code, error));
  EXPECT_EQ(code, error_code::missing_proof);

  auto pow = domp::antispam::make_proof_tag(pow_proof_t{.nonce = 1, .difficulty = 4});
  EXPECT_EQ(pow, (tag_t{"anti_spam_proof", "pow", "1", "4"}));
  EXPECT_FALSE(domp::antispam::parse_proof({pow, pow}, code, error));
  EXPECT_EQ(code, error_code::malformed_proof);

  EXPECT_FALSE(domp::antispam::parse_proof(
      {{"anti_spam_proof", "stake", "1", "2"}}, code, error));
  EXPECT_EQ(code, error_code::malformed_proof);

  EXPECT_FALSE(domp::antispam::parse_proof(
      {{"anti_spam_proof", "pow", "-1", "4"}}, code, error));
  EXPECT_EQ(code, error_code::malformed_proof);

  EXPECT_FALSE(domp::antispam::parse_proof(
      {{"anti_spam_proof", "ln", "zz", "10"}}, code, error));
  EXPECT_EQ(code, error_code::malformed_proof);

  auto parsed = domp::antispam::parse_proof({{"t", "x"}, pow}, code, error);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(code, error_code::ok);
  EXPECT_EQ(std::get<pow_proof_t>(*parsed).difficulty, 4u);
}

TEST(validator, pow_must_meet_declared_and_minimum_difficulty) {
  auto h = harness{};
  auto mined = h.author.with_pow(h.listing(), 6);
  ASSERT_TRUE(mined.has_value());
  auto result = h.validator.validate(h.signed_event(*mined));
  EXPECT_TRUE(result.ok()) << result.log;
  EXPECT_TRUE(std::holds_alternative<pow_proof_t>(*result.proof));

  auto weak = h.author.with_pow(h.listing(), 2);
  ASSERT_TRUE(weak.has_value());
  EXPECT_EQ(h.validator.validate(h.signed_event(*weak)).code,
            error_code::insufficient_difficulty);
}

TEST(validator, pow_claim_larger_than_the_id_supports_is_rejected) {
  auto h = harness{};
  // Search nonces for an id with a zero first bit but claim far more.
  for (auto nonce = uint64_t{0};; ++nonce) {
    auto event = domp::builder::stamp(
        h.listing(), pow_proof_t{.nonce = nonce, .difficulty = 64});
    auto signed_event = h.signed_event(event);
    if (domp::antispam::leading_zero_bits(signed_event.id) < 64) {
      EXPECT_EQ(h.validator.validate(signed_event).code,
                error_code::insufficient_difficulty);
      break;
    }
  }
}

TEST(validator, settled_payment_is_consumed_once) {
  auto h = harness{};
  auto proof = h.paid(25);
  auto first = h.signed_event(h.author.with_payment(h.listing(), proof));
  auto result = h.validator.validate(first);
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(result.reservation.type,
            domp::antispam::reservation_t::type_t::payment);

  h.clock.advance(1);
  auto second = h.signed_event(h.author.with_payment(h.listing(), proof));
  EXPECT_EQ(h.validator.validate(second).code,
            error_code::reference_already_consumed);

  h.validator.release(result.reservation);
  EXPECT_TRUE(h.validator.validate(second).ok());
}

TEST(validator, unsettled_or_small_payment_is_unconfirmed) {
  auto h = harness{};
  auto unknown = payment_proof_t{.payment_hash = domp::testing::make_hash(3),
                                 .amount_sats = 50};
  EXPECT_EQ(h.validator.validate(h.signed_event(
                                     h.author.with_payment(h.listing(), unknown)))
                .code,
            error_code::unconfirmed_payment);

  auto small = h.paid(5);
  EXPECT_EQ(h.validator.validate(h.signed_event(
                                     h.author.with_payment(h.listing(), small)))
                .code,
            error_code::unconfirmed_payment);

  auto overclaimed = h.paid(20);
  overclaimed.amount_sats = 40;
  EXPECT_EQ(h.validator.validate(h.signed_event(h.author.with_payment(
                                     h.listing(), overclaimed)))
                .code,
            error_code::unconfirmed_payment);
}

TEST(validator, reference_must_be_own_event_of_declared_kind) {
  auto h = harness{};
  auto own = domp::testing::make_hash(40);
  auto foreign = domp::testing::make_hash(41);
  h.remember(own, h.author.public_key(), 300);
  h.remember(foreign, domp::testing::make_keys(2).public_key, 300);

  auto result = h.validator.validate(
      h.signed_event(h.author.with_reference(h.feedback(), own, 300)));
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(result.reservation.referenced_event, own);
  EXPECT_EQ(result.reservation.consuming_kind, 321);

  EXPECT_EQ(h.validator
                .validate(h.signed_event(
                    h.author.with_reference(h.feedback(), own, 300)))
                .code,
            error_code::reference_already_consumed);

  // The same reference may stamp a different consuming kind.
  EXPECT_TRUE(h.validator
                  .validate(h.signed_event(
                      h.author.with_reference(h.feedback(322), own, 300)))
                  .ok());

  EXPECT_EQ(h.validator
                .validate(h.signed_event(
                    h.author.with_reference(h.feedback(), foreign, 300)))
                .code,
            error_code::reference_not_found);
  EXPECT_EQ(h.validator
                .validate(h.signed_event(h.author.with_reference(
                    h.feedback(), domp::testing::make_hash(42), 300)))
                .code,
            error_code::reference_not_found);

  h.remember(domp::testing::make_hash(43), h.author.public_key(), 301);
  EXPECT_EQ(h.validator
                .validate(h.signed_event(h.author.with_reference(
                    h.feedback(), domp::testing::make_hash(43), 300)))
                .code,
            error_code::reference_not_found);
}

TEST(validator, reputation_feedback_requires_reference_proof) {
  auto h = harness{};
  auto mined = h.author.with_pow(h.feedback(), 6);
  ASSERT_TRUE(mined.has_value());
  EXPECT_EQ(h.validator.validate(h.signed_event(*mined)).code,
            error_code::missing_proof);

  auto proof = h.paid(25);
  EXPECT_EQ(h.validator
                .validate(h.signed_event(
                    h.author.with_payment(h.feedback(323), proof)))
                .code,
            error_code::missing_proof);
}
