#include <domp/crypto/hash.hpp>
#include <domp/escrow/manager.hpp>

#include <spdlog/spdlog.h>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <set>

using namespace domp::schema;

namespace domp::escrow {

namespace {

escrow_result_t make_error(const error_code code,
                           std::string log,
                           const escrow_state_t state) {
  return escrow_result_t{.code = code, .log = std::move(log), .state = state};
}

escrow_result_t make_not_found(const hash32_t& escrow_id) {
  return make_error(error_code::escrow_not_found,
                    fmt::format("no escrow for {}", short_hex(escrow_id)),
                    escrow_state_t::pending);
}

amount_sats_t expected_amount(const escrow_t& escrow, const funding_leg_t leg) {
  switch (leg) {
    case funding_leg_t::purchase:
      return escrow.purchase_amount;
    case funding_leg_t::buyer_collateral:
      return escrow.buyer_collateral;
    case funding_leg_t::seller_collateral:
      return escrow.seller_collateral;
  }
  return 0;
}

const public_key_t& expected_payee(const escrow_t& escrow,
                                   const funding_leg_t leg) {
  if (leg == funding_leg_t::seller_collateral) {
    return escrow.buyer;
  }
  return escrow.seller;
}

/// Validate one funding leg against the payment network.
escrow_result_t check_leg(domp::payment::gateway& gateway,
                          const escrow_t& escrow,
                          const funding_leg_t leg,
                          const std::vector<funding_proof_t>& proofs) {
  auto required = expected_amount(escrow, leg);
  if (required == 0) {
    return escrow_result_t{.state = escrow.state};
  }
  auto proof = std::find_if(
      proofs.begin(), proofs.end(),
      [&](const funding_proof_t& candidate) { return candidate.leg == leg; });
  if (proof == proofs.end()) {
    return make_error(error_code::incomplete_funding,
                      fmt::format("no proof for {} leg", to_string(leg)),
                      escrow.state);
  }
  if (proof->amount_sats != required) {
    return make_error(
        error_code::amount_mismatch,
        fmt::format("{} leg declares {} sats, terms require {}",
                    to_string(leg), proof->amount_sats, required),
        escrow.state);
  }
  auto settled = gateway.lookup(proof->payment_hash);
  if (!settled) {
    return make_error(error_code::incomplete_funding,
                      fmt::format("{} payment {} is not settled",
                                  to_string(leg),
                                  short_hex(proof->payment_hash)),
                      escrow.state);
  }
  if (settled->amount_sats != required) {
    return make_error(error_code::amount_mismatch,
                      fmt::format("{} payment settled {} sats, terms require {}",
                                  to_string(leg), settled->amount_sats,
                                  required),
                      escrow.state);
  }
  if (settled->payee != expected_payee(escrow, leg)) {
    return make_error(error_code::recipient_mismatch,
                      fmt::format("{} payment went to the wrong party",
                                  to_string(leg)),
                      escrow.state);
  }
  return escrow_result_t{.state = escrow.state};
}

}  // namespace

manager::manager(domp::payment::gateway& gateway) : gateway_(gateway) {}

fund_distribution_t manager::release_distribution(const escrow_t& escrow) {
  return fund_distribution_t{
      .to_seller = escrow.purchase_amount + escrow.seller_collateral,
      .to_buyer = escrow.buyer_collateral};
}

fund_distribution_t manager::refund_distribution(const escrow_t& escrow) {
  if (escrow.state == escrow_state_t::pending) {
    return fund_distribution_t{};
  }
  return fund_distribution_t{
      .to_seller = escrow.seller_collateral,
      .to_buyer = escrow.purchase_amount + escrow.buyer_collateral};
}

escrow_result_t manager::create(const escrow_terms_t& terms,
                                std::optional<preimage_t> preimage) {
  if (terms.purchase_amount == 0) {
    return make_error(error_code::invalid_amount,
                      "purchase amount must be positive",
                      escrow_state_t::pending);
  }
  if (!preimage) {
    preimage = domp::crypto::random_array<32>();
  }
  auto escrow = escrow_t{};
  escrow.transaction_id = terms.transaction_id;
  escrow.preimage = *preimage;
  escrow.payment_hash =
      domp::crypto::sha256(bytes_view_t{preimage->data(), preimage->size()});
  escrow.buyer = terms.buyer;
  escrow.seller = terms.seller;
  escrow.purchase_amount = terms.purchase_amount;
  escrow.buyer_collateral = terms.buyer_collateral;
  escrow.seller_collateral = terms.seller_collateral;
  escrow.timeout = terms.timeout;
  escrow.state = escrow_state_t::pending;

  auto lock = std::scoped_lock{mutex_};
  auto [it, inserted] = escrows_.emplace(terms.transaction_id, escrow);
  if (!inserted) {
    return make_error(error_code::escrow_state_invalid,
                      fmt::format("escrow {} already exists",
                                  short_hex(terms.transaction_id)),
                      it->second.state);
  }
  spdlog::info("escrow {} created: {} sats locked until {}",
               short_hex(terms.transaction_id), escrow.total_locked(),
               escrow.timeout);
  return escrow_result_t{.state = escrow_state_t::pending};
}

escrow_result_t manager::fund(const hash32_t& escrow_id,
                              const std::vector<funding_proof_t>& proofs) {
  auto snapshot = find(escrow_id);
  if (!snapshot) {
    return make_not_found(escrow_id);
  }
  if (snapshot->state != escrow_state_t::pending) {
    return make_error(error_code::escrow_state_invalid,
                      fmt::format("cannot fund an escrow that is {}",
                                  to_string(snapshot->state)),
                      snapshot->state);
  }

  auto seen = std::set<hash32_t>{};
  for (const auto& proof : proofs) {
    if (!seen.insert(proof.payment_hash).second) {
      return make_error(error_code::incomplete_funding,
                        "one payment cannot fund two legs", snapshot->state);
    }
  }

  // Network lookups run without holding the manager lock.
  for (auto leg : {funding_leg_t::purchase, funding_leg_t::buyer_collateral,
                   funding_leg_t::seller_collateral}) {
    auto checked = check_leg(gateway_, *snapshot, leg, proofs);
    if (!checked.ok()) {
      spdlog::warn("escrow {} funding rejected: {}", short_hex(escrow_id),
                   checked.log);
      return checked;
    }
  }

  auto hashes = std::vector<hash32_t>{};
  for (const auto& proof : proofs) {
    if (expected_amount(*snapshot, proof.leg) > 0) {
      hashes.push_back(proof.payment_hash);
    }
  }

  auto lock = std::scoped_lock{mutex_};
  auto& escrow = escrows_.at(escrow_id);
  if (escrow.state != escrow_state_t::pending) {
    return make_error(error_code::escrow_state_invalid,
                      "escrow changed state while funding was checked",
                      escrow.state);
  }
  for (const auto& hash : hashes) {
    auto it = funding_.find(hash);
    if (it != funding_.end()) {
      spdlog::warn("escrow {} funding rejected: payment {} already funds {}",
                   short_hex(escrow_id), short_hex(hash),
                   short_hex(it->second));
      return make_error(error_code::incomplete_funding,
                        fmt::format("payment {} already funds escrow {}",
                                    short_hex(hash), short_hex(it->second)),
                        escrow.state);
    }
  }
  for (const auto& hash : hashes) {
    funding_.emplace(hash, escrow_id);
  }
  escrow.state = escrow_state_t::active;
  spdlog::info("escrow {} active", short_hex(escrow_id));
  return escrow_result_t{.state = escrow.state};
}

escrow_result_t manager::release(const hash32_t& escrow_id,
                                 const preimage_t& preimage) {
  auto lock = std::scoped_lock{mutex_};
  auto it = escrows_.find(escrow_id);
  if (it == escrows_.end()) {
    return make_not_found(escrow_id);
  }
  auto& escrow = it->second;
  if (escrow.state != escrow_state_t::active) {
    return make_error(error_code::escrow_state_invalid,
                      fmt::format("cannot release an escrow that is {}",
                                  to_string(escrow.state)),
                      escrow.state);
  }
  auto digest =
      domp::crypto::sha256(bytes_view_t{preimage.data(), preimage.size()});
  if (digest != escrow.payment_hash) {
    return make_error(error_code::preimage_mismatch,
                      "preimage does not hash to the payment hash",
                      escrow.state);
  }
  escrow.state = escrow_state_t::completed;
  escrow.distribution = release_distribution(escrow);
  spdlog::info("escrow {} released: seller {} sats, buyer {} sats",
               short_hex(escrow_id), escrow.distribution->to_seller,
               escrow.distribution->to_buyer);
  return escrow_result_t{.state = escrow.state,
                         .distribution = escrow.distribution};
}

escrow_result_t manager::refund(const hash32_t& escrow_id) {
  auto lock = std::scoped_lock{mutex_};
  auto it = escrows_.find(escrow_id);
  if (it == escrows_.end()) {
    return make_not_found(escrow_id);
  }
  auto& escrow = it->second;
  if (escrow.state != escrow_state_t::active) {
    return make_error(error_code::escrow_state_invalid,
                      fmt::format("cannot refund an escrow that is {}",
                                  to_string(escrow.state)),
                      escrow.state);
  }
  escrow.distribution = refund_distribution(escrow);
  escrow.state = escrow_state_t::refunded;
  spdlog::info("escrow {} refunded", short_hex(escrow_id));
  return escrow_result_t{.state = escrow.state,
                         .distribution = escrow.distribution};
}

escrow_result_t manager::expire(const hash32_t& escrow_id,
                                const timestamp_seconds_t now) {
  auto lock = std::scoped_lock{mutex_};
  auto it = escrows_.find(escrow_id);
  if (it == escrows_.end()) {
    return make_not_found(escrow_id);
  }
  auto& escrow = it->second;
  if (escrow.state != escrow_state_t::active &&
      escrow.state != escrow_state_t::pending) {
    return make_error(error_code::escrow_state_invalid,
                      fmt::format("cannot expire an escrow that is {}",
                                  to_string(escrow.state)),
                      escrow.state);
  }
  if (now <= escrow.timeout) {
    return make_error(error_code::escrow_not_expired,
                      fmt::format("timeout {} not reached at {}",
                                  escrow.timeout, now),
                      escrow.state);
  }
  escrow.distribution = refund_distribution(escrow);
  escrow.state = escrow_state_t::expired;
  spdlog::info("escrow {} expired", short_hex(escrow_id));
  return escrow_result_t{.state = escrow.state,
                         .distribution = escrow.distribution};
}

std::optional<escrow_t> manager::find(const hash32_t& escrow_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = escrows_.find(escrow_id);
  if (it == escrows_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<escrow_t> manager::list() const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<escrow_t>{};
  out.reserve(escrows_.size());
  for (const auto& [id, escrow] : escrows_) {
    out.push_back(escrow);
  }
  return out;
}

}  // namespace domp::escrow
