#include <domp/crypto/hash.hpp>
#include <domp/escrow/manager.hpp>
#include <domp/payment/memory_gateway.hpp>
#include <domp/testing/common.hpp>
#include <gtest/gtest.h>

#include <vector>

using namespace domp::schema;

namespace {

inline constexpr auto kPurchase = amount_sats_t{80'000'000};
inline constexpr auto kBuyerCollateral = amount_sats_t{8'000'000};
inline constexpr auto kSellerCollateral = amount_sats_t{2'000'000};
inline constexpr auto kTimeout = domp::testing::kGenesis + 86'400;

struct harness final {
  domp::testing::manual_clock clock;
  domp::payment::memory_gateway gateway{clock.fn()};
  domp::escrow::manager escrows{gateway};
  public_key_t buyer{domp::testing::make_keys(2).public_key};
  public_key_t seller{domp::testing::make_keys(1).public_key};
  hash32_t transaction_id{domp::testing::make_hash(77)};

  domp::escrow::escrow_terms_t terms(const amount_sats_t seller_collateral = 0) {
    return domp::escrow::escrow_terms_t{.transaction_id = transaction_id,
                                        .buyer = buyer,
                                        .seller = seller,
                                        .purchase_amount = kPurchase,
                                        .buyer_collateral = kBuyerCollateral,
                                        .seller_collateral = seller_collateral,
                                        .timeout = kTimeout};
  }

  funding_proof_t pay(const funding_leg_t leg,
                      const public_key_t& payer,
                      const public_key_t& payee,
                      const amount_sats_t amount) {
    auto invoice = gateway.create_invoice(payee, amount, "escrow", 3600);
    EXPECT_TRUE(invoice.has_value());
    gateway.deposit(payer, amount);
    EXPECT_TRUE(gateway.pay(invoice->invoice, payer).ok());
    return funding_proof_t{
        .leg = leg, .payment_hash = invoice->payment_hash, .amount_sats = amount};
  }

  std::vector<funding_proof_t> buyer_legs() {
    return {pay(funding_leg_t::purchase, buyer, seller, kPurchase),
            pay(funding_leg_t::buyer_collateral, buyer, seller, kBuyerCollateral)};
  }

  escrow_t funded() {
    EXPECT_TRUE(escrows.create(terms()).ok());
    EXPECT_TRUE(escrows.fund(transaction_id, buyer_legs()).ok());
    return *escrows.find(transaction_id);
  }
};

}  // namespace

TEST(escrow_manager, create_locks_terms_under_a_hashed_preimage) {
  auto h = harness{};
  auto created = h.escrows.create(h.terms(kSellerCollateral));
  ASSERT_TRUE(created.ok()) << created.log;
  EXPECT_EQ(created.state, escrow_state_t::pending);

  auto escrow = h.escrows.find(h.transaction_id);
  ASSERT_TRUE(escrow.has_value());
  EXPECT_EQ(escrow->payment_hash,
            domp::crypto::sha256(
                bytes_view_t{escrow->preimage.data(), escrow->preimage.size()}));
  EXPECT_EQ(escrow->total_locked(),
            kPurchase + kBuyerCollateral + kSellerCollateral);
  EXPECT_FALSE(escrow->distribution.has_value());

  EXPECT_EQ(h.escrows.create(h.terms()).code, error_code::escrow_state_invalid);
}

TEST(escrow_manager, create_reuses_a_supplied_preimage) {
  auto h = harness{};
  auto preimage = domp::testing::make_hash(5);
  ASSERT_TRUE(h.escrows.create(h.terms(), preimage).ok());
  EXPECT_EQ(h.escrows.find(h.transaction_id)->preimage, preimage);

  auto zero = h.terms();
  zero.transaction_id = domp::testing::make_hash(78);
  zero.purchase_amount = 0;
  EXPECT_EQ(h.escrows.create(zero).code, error_code::invalid_amount);
}

TEST(escrow_manager, release_pays_seller_and_returns_buyer_collateral) {
  auto h = harness{};
  auto escrow = h.funded();
  EXPECT_EQ(escrow.state, escrow_state_t::active);

  auto released = h.escrows.release(h.transaction_id, escrow.preimage);
  ASSERT_TRUE(released.ok()) << released.log;
  EXPECT_EQ(released.state, escrow_state_t::completed);
  EXPECT_EQ(*released.distribution,
            (fund_distribution_t{.to_seller = kPurchase,
                                 .to_buyer = kBuyerCollateral}));

  EXPECT_EQ(h.escrows.release(h.transaction_id, escrow.preimage).code,
            error_code::escrow_state_invalid);
  EXPECT_EQ(h.escrows.refund(h.transaction_id).code,
            error_code::escrow_state_invalid);
}

TEST(escrow_manager, wrong_preimage_leaves_escrow_active) {
  auto h = harness{};
  h.funded();
  auto released = h.escrows.release(h.transaction_id, domp::testing::make_hash(1));
  EXPECT_EQ(released.code, error_code::preimage_mismatch);
  EXPECT_EQ(h.escrows.find(h.transaction_id)->state, escrow_state_t::active);
}

TEST(escrow_manager, funding_checks_every_leg) {
  auto h = harness{};
  ASSERT_TRUE(h.escrows.create(h.terms(kSellerCollateral)).ok());

  auto legs = h.buyer_legs();
  EXPECT_EQ(h.escrows.fund(h.transaction_id, legs).code,
            error_code::incomplete_funding);

  auto misdirected = legs;
  misdirected.push_back(h.pay(funding_leg_t::seller_collateral, h.seller,
                              h.seller, kSellerCollateral));
  EXPECT_EQ(h.escrows.fund(h.transaction_id, misdirected).code,
            error_code::recipient_mismatch);

  auto short_paid = legs;
  short_paid.push_back(h.pay(funding_leg_t::seller_collateral, h.seller,
                             h.buyer, kSellerCollateral - 1));
  EXPECT_EQ(h.escrows.fund(h.transaction_id, short_paid).code,
            error_code::amount_mismatch);

  auto reused = legs;
  reused.push_back(funding_proof_t{.leg = funding_leg_t::seller_collateral,
                                   .payment_hash = legs[0].payment_hash,
                                   .amount_sats = kSellerCollateral});
  EXPECT_EQ(h.escrows.fund(h.transaction_id, reused).code,
            error_code::incomplete_funding);

  auto unsettled = legs;
  unsettled.push_back(funding_proof_t{.leg = funding_leg_t::seller_collateral,
                                      .payment_hash = domp::testing::make_hash(99),
                                      .amount_sats = kSellerCollateral});
  EXPECT_EQ(h.escrows.fund(h.transaction_id, unsettled).code,
            error_code::incomplete_funding);

  EXPECT_EQ(h.escrows.find(h.transaction_id)->state, escrow_state_t::pending);

  legs.push_back(h.pay(funding_leg_t::seller_collateral, h.seller, h.buyer,
                       kSellerCollateral));
  auto funded = h.escrows.fund(h.transaction_id, legs);
  ASSERT_TRUE(funded.ok()) << funded.log;
  EXPECT_EQ(funded.state, escrow_state_t::active);
  EXPECT_EQ(h.escrows.fund(h.transaction_id, legs).code,
            error_code::escrow_state_invalid);
}

TEST(escrow_manager, purchase_paid_to_buyer_is_a_recipient_mismatch) {
  auto h = harness{};
  ASSERT_TRUE(h.escrows.create(h.terms()).ok());
  auto legs = std::vector<funding_proof_t>{
      h.pay(funding_leg_t::purchase, h.buyer, h.buyer, kPurchase),
      h.pay(funding_leg_t::buyer_collateral, h.buyer, h.seller,
            kBuyerCollateral)};
  EXPECT_EQ(h.escrows.fund(h.transaction_id, legs).code,
            error_code::recipient_mismatch);
}

TEST(escrow_manager, one_payment_funds_one_escrow) {
  auto h = harness{};
  auto other = h.terms();
  other.transaction_id = domp::testing::make_hash(78);
  ASSERT_TRUE(h.escrows.create(h.terms()).ok());
  ASSERT_TRUE(h.escrows.create(other).ok());

  auto legs = h.buyer_legs();
  ASSERT_TRUE(h.escrows.fund(h.transaction_id, legs).ok());
  auto again = h.escrows.fund(other.transaction_id, legs);
  EXPECT_EQ(again.code, error_code::incomplete_funding);
  EXPECT_EQ(again.state, escrow_state_t::pending);
  EXPECT_EQ(h.escrows.find(other.transaction_id)->state, escrow_state_t::pending);

  // Reusing only the collateral payment is refused as well.
  auto mixed = std::vector<funding_proof_t>{
      h.pay(funding_leg_t::purchase, h.buyer, h.seller, kPurchase), legs[1]};
  EXPECT_EQ(h.escrows.fund(other.transaction_id, mixed).code,
            error_code::incomplete_funding);

  // The rejected fresh purchase payment is still usable.
  mixed[1] = h.pay(funding_leg_t::buyer_collateral, h.buyer, h.seller,
                   kBuyerCollateral);
  EXPECT_TRUE(h.escrows.fund(other.transaction_id, mixed).ok());
}

TEST(escrow_manager, refund_returns_purchase_and_collateral_to_buyer) {
  auto h = harness{};
  ASSERT_TRUE(h.escrows.create(h.terms()).ok());
  EXPECT_EQ(h.escrows.refund(h.transaction_id).code,
            error_code::escrow_state_invalid);

  ASSERT_TRUE(h.escrows.fund(h.transaction_id, h.buyer_legs()).ok());
  auto refunded = h.escrows.refund(h.transaction_id);
  ASSERT_TRUE(refunded.ok()) << refunded.log;
  EXPECT_EQ(refunded.state, escrow_state_t::refunded);
  EXPECT_EQ(*refunded.distribution,
            (fund_distribution_t{.to_seller = 0,
                                 .to_buyer = kPurchase + kBuyerCollateral}));
}

TEST(escrow_manager, expire_only_after_timeout) {
  auto h = harness{};
  h.funded();
  EXPECT_EQ(h.escrows.expire(h.transaction_id, kTimeout).code,
            error_code::escrow_not_expired);
  EXPECT_EQ(h.escrows.find(h.transaction_id)->state, escrow_state_t::active);

  auto expired = h.escrows.expire(h.transaction_id, kTimeout + 1);
  ASSERT_TRUE(expired.ok()) << expired.log;
  EXPECT_EQ(expired.state, escrow_state_t::expired);
  EXPECT_EQ(expired.distribution->to_buyer, kPurchase + kBuyerCollateral);
  EXPECT_EQ(h.escrows.expire(h.transaction_id, kTimeout + 2).code,
            error_code::escrow_state_invalid);
}

TEST(escrow_manager, unfunded_escrow_expires_with_nothing_to_return) {
  auto h = harness{};
  ASSERT_TRUE(h.escrows.create(h.terms(kSellerCollateral)).ok());
  auto expired = h.escrows.expire(h.transaction_id, kTimeout + 1);
  ASSERT_TRUE(expired.ok());
  EXPECT_EQ(*expired.distribution, fund_distribution_t{});
  EXPECT_EQ(h.escrows.list().size(), 1u);
}

TEST(escrow_manager, unknown_escrow_is_not_found) {
  auto h = harness{};
  auto missing = domp::testing::make_hash(3);
  EXPECT_EQ(h.escrows.fund(missing, {}).code, error_code::escrow_not_found);
  EXPECT_EQ(h.escrows.release(missing, missing).code,
            error_code::escrow_not_found);
  EXPECT_EQ(h.escrows.refund(missing).code, error_code::escrow_not_found);
  EXPECT_EQ(h.escrows.expire(missing, 0).code, error_code::escrow_not_found);
  EXPECT_FALSE(h.escrows.find(missing).has_value());
}
