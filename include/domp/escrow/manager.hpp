#pragma once

#include <domp/payment/gateway.hpp>
#include <domp/schema/escrow.hpp>
#include <domp/schema/primitives.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace domp::escrow {

/// Terms fixed at bid acceptance.
struct escrow_terms_t final {
  domp::schema::hash32_t transaction_id{};
  domp::schema::public_key_t buyer{};
  domp::schema::public_key_t seller{};
  domp::schema::amount_sats_t purchase_amount{};
  domp::schema::amount_sats_t buyer_collateral{};
  domp::schema::amount_sats_t seller_collateral{};
  domp::schema::timestamp_seconds_t timeout{};
};

/// Owner of every hash time-locked escrow on this node.
///
/// Escrows are keyed by transaction id and only move forward:
/// pending -> active -> completed | refunded | expired, or
/// pending -> expired. A failed call leaves the escrow untouched.
class manager final {
 public:
  explicit manager(domp::payment::gateway& gateway);

  /// Lock the terms under a fresh preimage, or under `preimage` when the
  /// escrow is being rebuilt from a persisted log.
  domp::schema::escrow_result_t create(
      const escrow_terms_t& terms,
      std::optional<domp::schema::preimage_t> preimage = std::nullopt);

  /// Check every funding leg against the payment network and activate.
  ///
  /// The purchase leg is always required; collateral legs only when their
  /// amount is non-zero. Purchase and buyer collateral must be paid to the
  /// seller, seller collateral to the buyer. A payment that already funds
  /// any escrow on this node is refused.
  domp::schema::escrow_result_t fund(
      const domp::schema::hash32_t& escrow_id,
      const std::vector<domp::schema::funding_proof_t>& proofs);

  domp::schema::escrow_result_t release(
      const domp::schema::hash32_t& escrow_id,
      const domp::schema::preimage_t& preimage);

  domp::schema::escrow_result_t refund(const domp::schema::hash32_t& escrow_id);

  domp::schema::escrow_result_t expire(
      const domp::schema::hash32_t& escrow_id,
      domp::schema::timestamp_seconds_t now);

  std::optional<domp::schema::escrow_t> find(
      const domp::schema::hash32_t& escrow_id) const;

  std::vector<domp::schema::escrow_t> list() const;

  /// Distribution when the goods are delivered.
  static domp::schema::fund_distribution_t release_distribution(
      const domp::schema::escrow_t& escrow);

  /// Distribution when everything goes back to the depositors.
  static domp::schema::fund_distribution_t refund_distribution(
      const domp::schema::escrow_t& escrow);

 private:
  domp::payment::gateway& gateway_;
  mutable std::mutex mutex_;
  std::map<domp::schema::hash32_t, domp::schema::escrow_t> escrows_;
  /// Payment hash -> escrow it funds.
  std::map<domp::schema::hash32_t, domp::schema::hash32_t> funding_;
};

}  // namespace domp::escrow
