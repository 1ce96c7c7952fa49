#pragma once

#include <domp/schema/content.hpp>
#include <domp/schema/primitives.hpp>
#include <domp/schema/transaction_status.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Derived marketplace views folded from accepted events.
namespace domp::schema {

struct listing_view_t final {
  event_id_t id{};
  public_key_t seller{};
  timestamp_seconds_t created_at{};
  std::string product_name;
  amount_sats_t price_satoshis{};
  amount_sats_t seller_collateral_satoshis{};
};

struct bid_view_t final {
  event_id_t id{};
  public_key_t buyer{};
  timestamp_seconds_t created_at{};
  amount_sats_t bid_amount_satoshis{};
  amount_sats_t buyer_collateral_satoshis{};
  bid_status_t status{bid_status_t::open};
  std::optional<event_id_t> counter_id;
  std::optional<amount_sats_t> counter_amount_satoshis;
};

struct collateral_deposit_view_t final {
  event_id_t id{};
  public_key_t depositor{};
  hash32_t collateral_proof{};
  amount_sats_t amount_satoshis{};
};

template <uint16_t Version>
struct transaction;

/// Aggregate rooted at a listing. The transaction id is the listing id.
template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t id{};
  listing_view_t listing;
  std::vector<bid_view_t> bids;
  transaction_status_t status{transaction_status_t::listed};
  std::optional<event_id_t> accepted_bid;
  std::optional<event_id_t> acceptance_id;
  std::optional<event_id_t> payment_id;
  std::optional<event_id_t> receipt_id;
  std::optional<event_id_t> dispute_id;
  std::optional<event_id_t> offer_id;
  std::optional<event_id_t> refund_id;
  std::optional<public_key_t> arbitrator;
  std::optional<resolution_t> agreed_resolution;
  /// Resolution each party has put forward while the dispute is open.
  std::optional<resolution_t> buyer_proposal;
  std::optional<resolution_t> seller_proposal;
  /// Parties bound to the arbitration offer.
  bool buyer_accepted_offer{false};
  bool seller_accepted_offer{false};
  std::vector<collateral_deposit_view_t> deposits;
  /// Accepted event ids in application order, listing first.
  std::vector<event_id_t> chain;
  timestamp_seconds_t updated_at{};

  const bid_view_t* find_bid(const event_id_t& bid_id) const {
    for (const auto& bid : bids) {
      if (bid.id == bid_id) {
        return &bid;
      }
    }
    return nullptr;
  }

  bid_view_t* find_bid(const event_id_t& bid_id) {
    for (auto& bid : bids) {
      if (bid.id == bid_id) {
        return &bid;
      }
    }
    return nullptr;
  }

  /// Buyer of the accepted bid, once there is one.
  std::optional<public_key_t> buyer() const {
    if (!accepted_bid) {
      return std::nullopt;
    }
    auto bid = find_bid(*accepted_bid);
    if (bid == nullptr) {
      return std::nullopt;
    }
    return bid->buyer;
  }

  bool is_party(const public_key_t& key) const {
    if (key == listing.seller) {
      return true;
    }
    auto buyer_key = buyer();
    return buyer_key.has_value() && *buyer_key == key;
  }
};

using transaction_t = transaction<1>;

}  // namespace domp::schema
