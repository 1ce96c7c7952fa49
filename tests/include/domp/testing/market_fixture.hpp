#pragma once

#include <domp/builder/event_builder.hpp>
#include <domp/execution/engine.hpp>
#include <domp/payment/memory_gateway.hpp>
#include <domp/schema/content.hpp>
#include <domp/schema/event.hpp>
#include <domp/testing/common.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace domp::testing {

/// Seller, buyer, a rival buyer and an arbitrator trading through one engine
/// on a manual clock and an in-memory payment ledger. Every event built here
/// moves the clock one second forward so timestamps are strictly ordered.
class market_fixture final {
 public:
  static constexpr auto kPowBits = uint32_t{4};
  static constexpr auto kInvoiceExpiry = domp::schema::duration_seconds_t{3600};

  /// Events up to and including a confirmed payment.
  struct deal_t final {
    domp::schema::event_t listing;
    domp::schema::event_t bid;
    domp::schema::event_t acceptance;
    domp::schema::event_t payment;
  };

  explicit market_fixture(const std::string& db_path = {})
      : gateway_{clock_.fn()},
        seller_{make_keys(1), clock_.fn()},
        buyer_{make_keys(2), clock_.fn()},
        rival_{make_keys(3), clock_.fn()},
        arbitrator_{make_keys(4), clock_.fn()} {
    policy_.anti_spam.min_pow_difficulty = kPowBits;
    open(db_path);
  }

  market_fixture(const market_fixture&) = delete;
  market_fixture& operator=(const market_fixture&) = delete;

  /// Replace the engine with a fresh one on `db_path`.
  void open(const std::string& db_path) {
    engine_.reset();
    engine_ = std::make_unique<domp::execution::engine>(
        gateway_, domp::execution::engine_options_t{
                      .policy = policy_, .db_path = db_path, .clock = clock_.fn()});
  }

  domp::execution::engine& engine() { return *engine_; }
  domp::payment::memory_gateway& gateway() { return gateway_; }
  manual_clock& clock() { return clock_; }
  const domp::schema::market_policy_t& policy() const { return policy_; }

  const domp::builder::event_builder& seller() const { return seller_; }
  const domp::builder::event_builder& buyer() const { return buyer_; }
  const domp::builder::event_builder& rival() const { return rival_; }
  const domp::builder::event_builder& arbitrator() const { return arbitrator_; }

  domp::schema::event_t make(const domp::builder::event_builder& author,
                             const domp::schema::content_t& content) {
    auto event = author.publish_with_pow(content, kPowBits);
    if (!event) {
      throw std::runtime_error{"could not build event"};
    }
    clock_.advance(1);
    return *event;
  }

  domp::schema::event_t make_with_reference(
      const domp::builder::event_builder& author,
      const domp::schema::content_t& content,
      const domp::schema::event_id_t& referenced,
      const domp::schema::event_kind_t referenced_kind) {
    auto event = author.sign(author.with_reference(
        author.build(content), referenced,
        static_cast<uint16_t>(referenced_kind)));
    if (!event) {
      throw std::runtime_error{"could not sign event"};
    }
    clock_.advance(1);
    return *event;
  }

  domp::schema::ingest_result_t submit(
      const domp::builder::event_builder& author,
      const domp::schema::content_t& content) {
    return engine_->ingest(make(author, content));
  }

  /// Ingest and expect acceptance.
  domp::schema::event_t accept(const domp::schema::event_t& event) {
    auto result = engine_->ingest(event);
    EXPECT_EQ(result.code, domp::schema::error_code::ok) << result.log;
    EXPECT_FALSE(result.duplicate);
    return event;
  }

  /// Invoice payable by anyone to `payee`.
  domp::payment::invoice_t invoice(const domp::schema::public_key_t& payee,
                                   const domp::schema::amount_sats_t amount) {
    auto created =
        gateway_.create_invoice(payee, amount, "test", kInvoiceExpiry);
    if (!created) {
      throw std::runtime_error{"could not create invoice"};
    }
    return *created;
  }

  /// Fund `payer` and settle `invoice` from it.
  domp::schema::hash32_t settle(const domp::schema::public_key_t& payer,
                                const domp::payment::invoice_t& invoice) {
    gateway_.deposit(payer, invoice.amount_sats);
    auto paid = gateway_.pay(invoice.invoice, payer);
    if (!paid.ok()) {
      throw std::runtime_error{paid.error};
    }
    return invoice.payment_hash;
  }

  domp::schema::event_t list(const domp::schema::amount_sats_t price,
                             const domp::schema::amount_sats_t collateral = 0) {
    return accept(make(seller_, domp::schema::product_listing_t{
                                    .product_name = "Vintage camera",
                                    .description = "Rangefinder, 1968",
                                    .price_satoshis = price,
                                    .seller_collateral_satoshis = collateral}));
  }

  domp::schema::event_t bid(const domp::schema::event_t& listing,
                            const domp::schema::amount_sats_t amount,
                            const domp::schema::amount_sats_t collateral) {
    return accept(make(buyer_, domp::schema::bid_submission_t{
                                   .product_ref = listing.id,
                                   .bid_amount_satoshis = amount,
                                   .buyer_collateral_satoshis = collateral}));
  }

  domp::schema::event_t accept_bid(const domp::schema::event_t& bid,
                                   const domp::schema::amount_sats_t amount) {
    purchase_invoice_ = invoice(seller_.public_key(), amount);
    return accept(make(seller_, domp::schema::bid_acceptance_t{
                                    .bid_ref = bid.id,
                                    .ln_invoice = purchase_invoice_->invoice,
                                    .invoice_amount_satoshis = amount}));
  }

  /// Pay the accepted invoice and the buyer collateral, then confirm.
  domp::schema::event_t pay(const domp::schema::event_t& bid,
                            const domp::schema::event_t& acceptance,
                            const domp::schema::amount_sats_t amount,
                            const domp::schema::amount_sats_t collateral) {
    auto purchase_hash = settle(buyer_.public_key(), *purchase_invoice_);
    auto content = domp::schema::payment_confirmation_t{
        .bid_ref = bid.id,
        .acceptance_ref = acceptance.id,
        .payment_proof = purchase_hash,
        .payment_amount_satoshis = amount};
    if (collateral > 0) {
      content.collateral_proof = settle(
          buyer_.public_key(), invoice(seller_.public_key(), collateral));
      content.collateral_amount_satoshis = collateral;
    }
    return accept(make(buyer_, content));
  }

  /// Listing through confirmed payment for `amount` with buyer collateral.
  deal_t open_deal(const domp::schema::amount_sats_t amount,
                   const domp::schema::amount_sats_t collateral) {
    auto deal = deal_t{};
    deal.listing = list(amount);
    deal.bid = bid(deal.listing, amount, collateral);
    deal.acceptance = accept_bid(deal.bid, amount);
    deal.payment = pay(deal.bid, deal.acceptance, amount, collateral);
    return deal;
  }

 private:
  manual_clock clock_;
  domp::payment::memory_gateway gateway_;
  domp::schema::market_policy_t policy_;
  domp::builder::event_builder seller_;
  domp::builder::event_builder buyer_;
  domp::builder::event_builder rival_;
  domp::builder::event_builder arbitrator_;
  std::optional<domp::payment::invoice_t> purchase_invoice_;
  std::unique_ptr<domp::execution::engine> engine_;
};

}  // namespace domp::testing
