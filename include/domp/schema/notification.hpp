#pragma once

#include <domp/schema/escrow.hpp>
#include <domp/schema/event.hpp>
#include <domp/schema/primitives.hpp>
#include <domp/schema/transaction_status.hpp>

#include <functional>
#include <optional>

namespace domp::schema {

/// Published to observers after a transition has committed.
struct notification_t final {
  event_id_t event_id{};
  uint16_t kind{};
  public_key_t author{};
  std::optional<hash32_t> transaction_id;
  std::optional<transaction_status_t> previous_status;
  std::optional<transaction_status_t> status;
  std::optional<escrow_state_t> escrow_state;
  std::optional<fund_distribution_t> distribution;
};

using notification_observer_t = std::function<void(const notification_t&)>;

}  // namespace domp::schema
