#include <domp/market/state_machine.hpp>

#include <spdlog/fmt/fmt.h>

#include <cmath>

using namespace domp::schema;

namespace domp::market {

namespace {

transition_t reject(const error_code code, std::string log) {
  return transition_t{.code = code, .log = std::move(log)};
}

transition_t reject_status(const transaction_t& transaction,
                           const event_kind_t kind) {
  return reject(error_code::invalid_transition,
                fmt::format("{} is not allowed while {}", to_string(kind),
                            to_string(transaction.status)));
}

/// Copy of `current` with the event appended to its chain.
transition_t advance(const transaction_t& current, const event_t& event) {
  auto next = transition_t{.transaction = current};
  next.transaction.chain.push_back(event.id);
  next.transaction.updated_at = event.created_at;
  return next;
}

bool expects_reference(const std::optional<event_id_t>& expected,
                       const event_id_t& actual) {
  return expected.has_value() && *expected == actual;
}

amount_sats_t purchase_amount(const transaction_t& transaction) {
  if (!transaction.accepted_bid) {
    return 0;
  }
  auto bid = transaction.find_bid(*transaction.accepted_bid);
  return bid == nullptr ? 0 : bid->bid_amount_satoshis;
}

amount_sats_t buyer_collateral(const transaction_t& transaction) {
  if (!transaction.accepted_bid) {
    return 0;
  }
  auto bid = transaction.find_bid(*transaction.accepted_bid);
  return bid == nullptr ? 0 : bid->buyer_collateral_satoshis;
}

const collateral_deposit_view_t* find_deposit(const transaction_t& transaction,
                                              const public_key_t& depositor) {
  for (const auto& deposit : transaction.deposits) {
    if (deposit.depositor == depositor) {
      return &deposit;
    }
  }
  return nullptr;
}

transition_t on_listing(const transaction_t* current,
                        const event_t& event,
                        const product_listing_t& listing) {
  if (current != nullptr) {
    return reject(error_code::invalid_transition, "listing already exists");
  }
  auto next = transition_t{};
  auto& transaction = next.transaction;
  transaction.id = event.id;
  transaction.listing = listing_view_t{
      .id = event.id,
      .seller = event.author_key,
      .created_at = event.created_at,
      .product_name = listing.product_name,
      .price_satoshis = listing.price_satoshis,
      .seller_collateral_satoshis = listing.seller_collateral_satoshis};
  transaction.status = transaction_status_t::listed;
  transaction.chain.push_back(event.id);
  transaction.updated_at = event.created_at;
  return next;
}

transition_t on_bid(const transaction_t& current,
                    const event_t& event,
                    const bid_submission_t& bid,
                    const market_policy_t& policy) {
  if (current.status != transaction_status_t::listed &&
      current.status != transaction_status_t::bid_received) {
    return reject_status(current, event_kind_t::bid_submission);
  }
  if (current.accepted_bid) {
    return reject(error_code::invalid_transition,
                  "listing already has an accepted bid");
  }
  if (event.author_key == current.listing.seller) {
    return reject(error_code::self_dealing, "sellers cannot bid on their own "
                                            "listing");
  }
  if (bid.bid_amount_satoshis == 0) {
    return reject(error_code::invalid_amount, "bid amount must be positive");
  }
  auto required = static_cast<amount_sats_t>(
      std::ceil(policy.min_buyer_collateral_ratio *
                static_cast<double>(bid.bid_amount_satoshis)));
  if (bid.buyer_collateral_satoshis < required) {
    return reject(error_code::insufficient_collateral,
                  fmt::format("buyer collateral {} below required {}",
                              bid.buyer_collateral_satoshis, required));
  }

  auto next = advance(current, event);
  next.transaction.bids.push_back(
      bid_view_t{.id = event.id,
                 .buyer = event.author_key,
                 .created_at = event.created_at,
                 .bid_amount_satoshis = bid.bid_amount_satoshis,
                 .buyer_collateral_satoshis = bid.buyer_collateral_satoshis});
  next.transaction.status = transaction_status_t::bid_received;
  return next;
}

transition_t on_counter_bid(const transaction_t& current,
                            const event_t& event,
                            const counter_bid_t& counter) {
  if (event.author_key != current.listing.seller) {
    return reject(error_code::unauthorized_author,
                  "only the seller can counter a bid");
  }
  if (current.status != transaction_status_t::bid_received ||
      current.accepted_bid) {
    return reject_status(current, event_kind_t::counter_bid);
  }
  auto bid = current.find_bid(counter.bid_ref);
  if (bid == nullptr) {
    return reject(error_code::unknown_reference, "countered bid is unknown");
  }
  if (bid->status != bid_status_t::open) {
    return reject(error_code::invalid_transition,
                  fmt::format("bid is {}", to_string(bid->status)));
  }

  auto next = advance(current, event);
  auto countered = next.transaction.find_bid(counter.bid_ref);
  countered->status = bid_status_t::countered;
  countered->counter_id = event.id;
  countered->counter_amount_satoshis = counter.counter_amount_satoshis;
  return next;
}

transition_t on_acceptance(const transaction_t& current,
                           const event_t& event,
                           const bid_acceptance_t& acceptance) {
  if (event.author_key != current.listing.seller) {
    return reject(error_code::unauthorized_author,
                  "only the seller can accept a bid");
  }
  if (current.status != transaction_status_t::bid_received ||
      current.accepted_bid) {
    return reject_status(current, event_kind_t::bid_acceptance);
  }
  auto bid = current.find_bid(acceptance.bid_ref);
  if (bid == nullptr) {
    return reject(error_code::unknown_reference, "accepted bid is unknown");
  }
  if (bid->status != bid_status_t::open) {
    return reject(error_code::invalid_transition,
                  fmt::format("bid is {}", to_string(bid->status)));
  }
  if (acceptance.invoice_amount_satoshis != bid->bid_amount_satoshis) {
    return reject(error_code::amount_mismatch,
                  fmt::format("invoice for {} sats, bid was {}",
                              acceptance.invoice_amount_satoshis,
                              bid->bid_amount_satoshis));
  }

  auto next = advance(current, event);
  auto& transaction = next.transaction;
  for (auto& sibling : transaction.bids) {
    if (sibling.id == acceptance.bid_ref) {
      sibling.status = bid_status_t::accepted;
    } else if (sibling.status == bid_status_t::open) {
      sibling.status = bid_status_t::closed;
    }
  }
  transaction.accepted_bid = acceptance.bid_ref;
  transaction.acceptance_id = event.id;
  transaction.status = transaction_status_t::bid_accepted;
  next.escrow = escrow_create_t{
      .terms = domp::escrow::escrow_terms_t{
          .transaction_id = transaction.id,
          .buyer = bid->buyer,
          .seller = transaction.listing.seller,
          .purchase_amount = bid->bid_amount_satoshis,
          .buyer_collateral = bid->buyer_collateral_satoshis,
          .seller_collateral = transaction.listing.seller_collateral_satoshis,
          .timeout = escrow_timeout(event.created_at,
                                    acceptance.htlc_timeout_blocks)}};
  return next;
}

transition_t on_collateral_deposit(const transaction_t& current,
                                   const event_t& event,
                                   const collateral_deposit_t& deposit) {
  if (current.status != transaction_status_t::bid_accepted) {
    return reject_status(current, event_kind_t::collateral_deposit);
  }
  if (!current.is_party(event.author_key)) {
    return reject(error_code::unauthorized_author,
                  "only a party can deposit collateral");
  }
  if (!expects_reference(current.accepted_bid, deposit.bid_ref)) {
    return reject(error_code::unknown_reference,
                  "deposit does not reference the accepted bid");
  }
  if (find_deposit(current, event.author_key) != nullptr) {
    return reject(error_code::invalid_transition,
                  "collateral already deposited");
  }
  auto expected = event.author_key == current.listing.seller
                      ? current.listing.seller_collateral_satoshis
                      : buyer_collateral(current);
  if (deposit.amount_satoshis != expected) {
    return reject(error_code::amount_mismatch,
                  fmt::format("deposit of {} sats, terms require {}",
                              deposit.amount_satoshis, expected));
  }

  auto next = advance(current, event);
  next.transaction.deposits.push_back(
      collateral_deposit_view_t{.id = event.id,
                                .depositor = event.author_key,
                                .collateral_proof = deposit.collateral_proof,
                                .amount_satoshis = deposit.amount_satoshis});
  return next;
}

transition_t on_payment(const transaction_t& current,
                        const event_t& event,
                        const payment_confirmation_t& payment) {
  auto buyer = current.buyer();
  if (!buyer || *buyer != event.author_key) {
    return reject(error_code::unauthorized_author,
                  "only the buyer can confirm payment");
  }
  if (current.status != transaction_status_t::bid_accepted) {
    return reject_status(current, event_kind_t::payment_confirmation);
  }
  if (!expects_reference(current.accepted_bid, payment.bid_ref)) {
    return reject(error_code::unknown_reference,
                  "payment does not reference the accepted bid");
  }
  if (payment.acceptance_ref &&
      !expects_reference(current.acceptance_id, *payment.acceptance_ref)) {
    return reject(error_code::unknown_reference,
                  "payment references a different acceptance");
  }

  auto purchase = purchase_amount(current);
  auto declared_purchase = payment.payment_amount_satoshis.value_or(purchase);
  if (declared_purchase != purchase) {
    return reject(error_code::amount_mismatch,
                  fmt::format("paid {} sats, accepted bid is {}",
                              declared_purchase, purchase));
  }
  auto proofs = std::vector<funding_proof_t>{
      funding_proof_t{.leg = funding_leg_t::purchase,
                      .payment_hash = payment.payment_proof,
                      .amount_sats = declared_purchase}};

  auto buyer_required = buyer_collateral(current);
  if (buyer_required > 0) {
    if (payment.collateral_proof) {
      proofs.push_back(funding_proof_t{
          .leg = funding_leg_t::buyer_collateral,
          .payment_hash = *payment.collateral_proof,
          .amount_sats =
              payment.collateral_amount_satoshis.value_or(buyer_required)});
    } else if (auto deposit = find_deposit(current, *buyer)) {
      proofs.push_back(
          funding_proof_t{.leg = funding_leg_t::buyer_collateral,
                          .payment_hash = deposit->collateral_proof,
                          .amount_sats = deposit->amount_satoshis});
    }
  }
  if (current.listing.seller_collateral_satoshis > 0) {
    if (auto deposit = find_deposit(current, current.listing.seller)) {
      proofs.push_back(
          funding_proof_t{.leg = funding_leg_t::seller_collateral,
                          .payment_hash = deposit->collateral_proof,
                          .amount_sats = deposit->amount_satoshis});
    }
  }

  auto next = advance(current, event);
  next.transaction.payment_id = event.id;
  next.transaction.status = transaction_status_t::payment_confirmed;
  next.escrow = escrow_fund_t{.proofs = std::move(proofs)};
  return next;
}

transition_t on_dispute(const transaction_t& current,
                        const event_t& event,
                        const escrow_dispute_t& dispute) {
  if (!current.is_party(event.author_key)) {
    return reject(error_code::unauthorized_author,
                  "only a party can open a dispute");
  }
  if (current.status != transaction_status_t::payment_confirmed) {
    return reject_status(current, event_kind_t::escrow_dispute);
  }
  if (!expects_reference(current.payment_id, dispute.payment_ref)) {
    return reject(error_code::unknown_reference,
                  "dispute does not reference the payment");
  }
  auto next = advance(current, event);
  next.transaction.dispute_id = event.id;
  next.transaction.status = transaction_status_t::disputed;
  return next;
}

/// Buyer rates the seller on a received confirmation.
std::optional<reputation_record_t> make_receipt_rating(
    const transaction_t& transaction,
    const event_t& event,
    const receipt_rating_t& rating) {
  auto record = reputation_record_t{};
  record.rater = event.author_key;
  record.rated = transaction.listing.seller;
  record.transaction_id = transaction.id;
  record.referenced_event_id = transaction.id;
  record.source_event_id = event.id;
  record.source_kind = event_kind_t::receipt_confirmation;
  record.rating = rating.rating;
  record.amount_sats = purchase_amount(transaction);
  record.created_at = event.created_at;
  record.verified_purchase = true;
  record.escrow_completed = true;
  record.shipping_speed = rating.shipping_rating;
  record.communication = rating.communication_rating;
  record.feedback = rating.feedback;
  return record;
}

transition_t on_receipt(const transaction_t& current,
                        const event_t& event,
                        const receipt_confirmation_t& receipt) {
  auto buyer = current.buyer();
  if (!buyer || *buyer != event.author_key) {
    return reject(error_code::unauthorized_author,
                  "only the buyer can confirm receipt");
  }
  auto agreed_release =
      current.status == transaction_status_t::mutually_agreed &&
      current.agreed_resolution == resolution_t::release;
  if (current.status != transaction_status_t::payment_confirmed &&
      !agreed_release) {
    return reject_status(current, event_kind_t::receipt_confirmation);
  }
  if (!expects_reference(current.payment_id, receipt.payment_ref)) {
    return reject(error_code::unknown_reference,
                  "receipt does not reference the payment");
  }
  if (receipt.status != receipt_status_t::received && agreed_release) {
    return reject(error_code::invalid_transition,
                  "release was agreed; only a received confirmation applies");
  }

  auto next = advance(current, event);
  next.transaction.receipt_id = event.id;
  if (receipt.status != receipt_status_t::received) {
    next.transaction.dispute_id = event.id;
    next.transaction.status = transaction_status_t::disputed;
    return next;
  }
  next.transaction.status = transaction_status_t::completed;
  next.escrow = escrow_release_t{.preimage = receipt.payment_preimage};
  if (receipt.rating) {
    next.rating = make_receipt_rating(current, event, *receipt.rating);
  }
  return next;
}

transition_t on_refund(const transaction_t& current,
                       const event_t& event,
                       const refund_initiation_t& refund) {
  auto seller_refund =
      event.author_key == current.listing.seller &&
      (current.status == transaction_status_t::payment_confirmed ||
       current.status == transaction_status_t::disputed);
  auto agreed_refund =
      current.is_party(event.author_key) &&
      current.status == transaction_status_t::mutually_agreed &&
      current.agreed_resolution == resolution_t::refund;
  if (!current.is_party(event.author_key)) {
    return reject(error_code::unauthorized_author,
                  "only a party can initiate a refund");
  }
  if (!seller_refund && !agreed_refund) {
    return reject_status(current, event_kind_t::refund_initiation);
  }
  if (!expects_reference(current.payment_id, refund.payment_ref)) {
    return reject(error_code::unknown_reference,
                  "refund does not reference the payment");
  }
  auto next = advance(current, event);
  next.transaction.refund_id = event.id;
  next.transaction.status = transaction_status_t::refunded;
  next.escrow = escrow_refund_t{};
  return next;
}

transition_t on_agreement(const transaction_t& current,
                          const event_t& event,
                          const mutual_agreement_t& agreement) {
  if (!current.is_party(event.author_key)) {
    return reject(error_code::unauthorized_author,
                  "only a party can record an agreement");
  }
  if (current.status != transaction_status_t::disputed &&
      current.status != transaction_status_t::arbitration_offered) {
    return reject_status(current, event_kind_t::mutual_agreement);
  }
  if (!expects_reference(current.dispute_id, agreement.dispute_ref)) {
    return reject(error_code::unknown_reference,
                  "agreement does not reference the dispute");
  }

  auto from_seller = event.author_key == current.listing.seller;
  auto next = advance(current, event);
  auto& transaction = next.transaction;
  if (agreement.offer_ref) {
    if (!expects_reference(current.offer_id, *agreement.offer_ref)) {
      return reject(error_code::unknown_reference,
                    "agreement does not reference the arbitration offer");
    }
    (from_seller ? transaction.seller_accepted_offer
                 : transaction.buyer_accepted_offer) = true;
    return next;
  }

  (from_seller ? transaction.seller_proposal : transaction.buyer_proposal) =
      agreement.resolution;
  if (transaction.buyer_proposal &&
      transaction.buyer_proposal == transaction.seller_proposal) {
    transaction.agreed_resolution = agreement.resolution;
    transaction.status = transaction_status_t::mutually_agreed;
  }
  return next;
}

transition_t on_arbitration_offer(const transaction_t& current,
                                  const event_t& event,
                                  const arbitration_offer_t& offer) {
  if (current.is_party(event.author_key)) {
    return reject(error_code::self_dealing,
                  "a party cannot arbitrate its own dispute");
  }
  if (current.status != transaction_status_t::disputed) {
    return reject_status(current, event_kind_t::arbitration_offer);
  }
  if (!expects_reference(current.dispute_id, offer.dispute_ref)) {
    return reject(error_code::unknown_reference,
                  "offer does not reference the dispute");
  }
  auto next = advance(current, event);
  next.transaction.offer_id = event.id;
  next.transaction.arbitrator = event.author_key;
  next.transaction.status = transaction_status_t::arbitration_offered;
  return next;
}

transition_t on_arbitration_resolution(
    const transaction_t& current,
    const event_t& event,
    const arbitration_resolution_t& resolution) {
  if (!current.arbitrator || *current.arbitrator != event.author_key) {
    return reject(error_code::unauthorized_author,
                  "only the offering arbitrator can resolve");
  }
  if (current.status != transaction_status_t::arbitration_offered) {
    return reject_status(current, event_kind_t::arbitration_resolution);
  }
  if (!expects_reference(current.offer_id, resolution.offer_ref)) {
    return reject(error_code::unknown_reference,
                  "resolution does not reference the offer");
  }
  if (!current.buyer_accepted_offer || !current.seller_accepted_offer) {
    return reject(error_code::invalid_transition,
                  "both parties must accept the offer before it is resolved");
  }
  auto next = advance(current, event);
  if (resolution.resolution == resolution_t::release) {
    next.transaction.status = transaction_status_t::completed;
    next.escrow = escrow_release_t{};
  } else {
    next.transaction.status = transaction_status_t::refunded;
    next.escrow = escrow_refund_t{};
  }
  return next;
}

transition_t on_feedback(const transaction_t& current,
                         const event_t& event,
                         const reputation_feedback_t& feedback,
                         const std::optional<event_id_t>& proof_reference) {
  if (!is_terminal(current.status)) {
    return reject(error_code::invalid_transition,
                  fmt::format("feedback requires a settled transaction, it "
                              "is {}",
                              to_string(current.status)));
  }
  if (!current.is_party(event.author_key)) {
    return reject(error_code::unauthorized_author,
                  "only a party can leave feedback");
  }

  auto record = reputation_record_t{};
  record.rater = event.author_key;
  record.rated = feedback.rated_pubkey;
  record.transaction_id = current.id;
  record.source_event_id = event.id;
  record.source_kind = feedback.kind;
  record.rating = feedback.rating;
  record.amount_sats = purchase_amount(current);
  record.created_at = event.created_at;
  record.verified_purchase = current.payment_id.has_value();
  record.escrow_completed = current.status == transaction_status_t::completed;
  record.item_quality = feedback.item_quality;
  record.shipping_speed = feedback.shipping_speed;
  record.communication = feedback.communication;
  record.payment_reliability = feedback.payment_reliability;
  record.feedback = feedback.feedback;

  switch (feedback.kind) {
    case event_kind_t::user_reputation_feedback: {
      auto counterparty = event.author_key == current.listing.seller
                              ? current.buyer()
                              : std::optional{current.listing.seller};
      if (!counterparty || *counterparty != feedback.rated_pubkey) {
        return reject(error_code::invalid_rating,
                      "user feedback must rate the counterparty");
      }
      record.referenced_event_id = current.id;
      break;
    }
    case event_kind_t::arbitrator_reputation_feedback:
      if (!current.arbitrator || !current.offer_id ||
          *current.arbitrator != feedback.rated_pubkey) {
        return reject(error_code::invalid_rating,
                      "arbitrator feedback must rate the arbitrator");
      }
      record.referenced_event_id = *current.offer_id;
      break;
    case event_kind_t::relay_reputation_feedback:
      if (current.is_party(feedback.rated_pubkey)) {
        return reject(error_code::invalid_rating,
                      "relay feedback cannot rate a party");
      }
      record.referenced_event_id = proof_reference.value_or(event.id);
      break;
    default:
      return reject(error_code::unsupported_kind, "not a feedback kind");
  }

  auto next = advance(current, event);
  next.rating = std::move(record);
  return next;
}

}  // namespace

timestamp_seconds_t escrow_timeout(const timestamp_seconds_t accepted_at,
                                   const uint32_t htlc_timeout_blocks) {
  return accepted_at +
         static_cast<timestamp_seconds_t>(htlc_timeout_blocks) *
             kSecondsPerBlock;
}

std::optional<event_id_t> anchor_of(const content_t& content) {
  return std::visit(
      overloaded{
          [](const product_listing_t&) -> std::optional<event_id_t> {
            return std::nullopt;
          },
          [](const bid_submission_t& value) -> std::optional<event_id_t> {
            return value.product_ref;
          },
          [](const counter_bid_t& value) -> std::optional<event_id_t> {
            return value.bid_ref;
          },
          [](const bid_acceptance_t& value) -> std::optional<event_id_t> {
            return value.bid_ref;
          },
          [](const collateral_deposit_t& value) -> std::optional<event_id_t> {
            return value.bid_ref;
          },
          [](const payment_confirmation_t& value)
              -> std::optional<event_id_t> { return value.bid_ref; },
          [](const escrow_dispute_t& value) -> std::optional<event_id_t> {
            return value.payment_ref;
          },
          [](const receipt_confirmation_t& value)
              -> std::optional<event_id_t> { return value.payment_ref; },
          [](const refund_initiation_t& value) -> std::optional<event_id_t> {
            return value.payment_ref;
          },
          [](const mutual_agreement_t& value) -> std::optional<event_id_t> {
            return value.dispute_ref;
          },
          [](const arbitration_offer_t& value) -> std::optional<event_id_t> {
            return value.dispute_ref;
          },
          [](const arbitration_resolution_t& value)
              -> std::optional<event_id_t> { return value.offer_ref; },
          [](const communication_message_t& value)
              -> std::optional<event_id_t> { return value.transaction_ref; },
          [](const reputation_feedback_t& value)
              -> std::optional<event_id_t> { return value.transaction_ref; }},
      content);
}

transition_t apply(const transaction_t* current,
                   const event_t& event,
                   const content_t& content,
                   const market_policy_t& policy,
                   const std::optional<event_id_t>& proof_reference) {
  if (std::holds_alternative<product_listing_t>(content)) {
    return on_listing(current, event, std::get<product_listing_t>(content));
  }
  if (current == nullptr) {
    return reject(error_code::unknown_reference,
                  "event does not belong to a known transaction");
  }
  if (is_terminal(current->status) &&
      !std::holds_alternative<reputation_feedback_t>(content)) {
    return reject(error_code::invalid_transition,
                  fmt::format("transaction is {}", to_string(current->status)));
  }

  return std::visit(
      overloaded{
          [&](const product_listing_t&) {
            return reject(error_code::invalid_transition,
                          "listing already exists");
          },
          [&](const bid_submission_t& value) {
            return on_bid(*current, event, value, policy);
          },
          [&](const counter_bid_t& value) {
            return on_counter_bid(*current, event, value);
          },
          [&](const bid_acceptance_t& value) {
            return on_acceptance(*current, event, value);
          },
          [&](const collateral_deposit_t& value) {
            return on_collateral_deposit(*current, event, value);
          },
          [&](const payment_confirmation_t& value) {
            return on_payment(*current, event, value);
          },
          [&](const escrow_dispute_t& value) {
            return on_dispute(*current, event, value);
          },
          [&](const receipt_confirmation_t& value) {
            return on_receipt(*current, event, value);
          },
          [&](const refund_initiation_t& value) {
            return on_refund(*current, event, value);
          },
          [&](const mutual_agreement_t& value) {
            return on_agreement(*current, event, value);
          },
          [&](const arbitration_offer_t& value) {
            return on_arbitration_offer(*current, event, value);
          },
          [&](const arbitration_resolution_t& value) {
            return on_arbitration_resolution(*current, event, value);
          },
          [&](const communication_message_t&) {
            return reject(error_code::invalid_transition,
                          "messages do not change transaction state");
          },
          [&](const reputation_feedback_t& value) {
            return on_feedback(*current, event, value, proof_reference);
          }},
      content);
}

std::optional<transition_t> check_timeout(const transaction_t& transaction,
                                          const escrow_t& escrow,
                                          const timestamp_seconds_t now) {
  if (transaction.status != transaction_status_t::bid_accepted &&
      transaction.status != transaction_status_t::payment_confirmed &&
      transaction.status != transaction_status_t::disputed) {
    return std::nullopt;
  }
  if (now <= escrow.timeout) {
    return std::nullopt;
  }
  auto next = transition_t{.transaction = transaction};
  next.transaction.status = transaction_status_t::expired;
  next.transaction.updated_at = escrow.timeout;
  next.escrow = escrow_expire_t{.now = now};
  return next;
}

}  // namespace domp::market
