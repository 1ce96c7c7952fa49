#pragma once

#include <domp/schema/anti_spam_proof.hpp>
#include <domp/schema/primitives.hpp>

namespace domp::schema {

/// Node-local economic and admission policy.
struct market_policy_t final {
  anti_spam_policy_t anti_spam;
  /// Buyer collateral must be at least this fraction of the bid amount.
  double min_buyer_collateral_ratio{0.0};
  /// Events stamped further than this into the future are malformed.
  duration_seconds_t max_future_skew_seconds{900};
};

}  // namespace domp::schema
