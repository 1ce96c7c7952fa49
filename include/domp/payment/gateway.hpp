#pragma once

#include <domp/schema/escrow.hpp>
#include <domp/schema/primitives.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace domp::payment {

struct invoice_t final {
  std::string invoice;
  domp::schema::hash32_t payment_hash{};
  domp::schema::amount_sats_t amount_sats{};
  domp::schema::public_key_t payee{};
  std::string memo;
  domp::schema::timestamp_seconds_t expires_at{};
};

struct payment_receipt_t final {
  domp::schema::preimage_t preimage{};
  domp::schema::timestamp_seconds_t paid_at{};
};

enum class pay_status_t : uint8_t { succeeded = 0, failed = 1 };

struct pay_result_t final {
  pay_status_t status{pay_status_t::failed};
  std::optional<domp::schema::preimage_t> preimage;
  domp::schema::hash32_t payment_hash{};
  std::string error;

  bool ok() const { return status == pay_status_t::succeeded; }
};

/// Boundary to the payment network. Implementations must be safe to call
/// from several ingestion threads at once.
class gateway {
 public:
  virtual ~gateway() = default;

  virtual std::optional<invoice_t> create_invoice(
      const domp::schema::public_key_t& payee,
      domp::schema::amount_sats_t amount_sats,
      std::string_view memo,
      domp::schema::duration_seconds_t expiry_seconds) = 0;

  /// Block until the invoice is paid or `timeout` elapses.
  virtual std::optional<payment_receipt_t> await_payment(
      const domp::schema::hash32_t& payment_hash,
      std::chrono::milliseconds timeout) = 0;

  virtual pay_result_t pay(std::string_view invoice,
                           const domp::schema::public_key_t& payer) = 0;

  /// Settled payment for the hash, if the network has seen one.
  virtual std::optional<domp::schema::settled_payment_t> lookup(
      const domp::schema::hash32_t& payment_hash) const = 0;
};

}  // namespace domp::payment
