#pragma once

#include <domp/common/clock.hpp>
#include <domp/payment/gateway.hpp>

#include <condition_variable>
#include <map>
#include <mutex>
#include <string_view>

namespace domp::payment {

/// In-process payment ledger. Invoices are `lnbcrt<amount>1p<payment hash>`;
/// paying one moves balance from payer to payee and settles it.
class memory_gateway final : public gateway {
 public:
  explicit memory_gateway(
      domp::common::clock_fn_t clock = domp::common::make_system_clock());

  std::optional<invoice_t> create_invoice(
      const domp::schema::public_key_t& payee,
      domp::schema::amount_sats_t amount_sats,
      std::string_view memo,
      domp::schema::duration_seconds_t expiry_seconds) override;

  std::optional<payment_receipt_t> await_payment(
      const domp::schema::hash32_t& payment_hash,
      std::chrono::milliseconds timeout) override;

  pay_result_t pay(std::string_view invoice,
                   const domp::schema::public_key_t& payer) override;

  std::optional<domp::schema::settled_payment_t> lookup(
      const domp::schema::hash32_t& payment_hash) const override;

  /// Credit an account out of thin air. Test and tooling use only.
  void deposit(const domp::schema::public_key_t& account,
               domp::schema::amount_sats_t amount_sats);

  domp::schema::amount_sats_t balance_of(
      const domp::schema::public_key_t& account) const;

  /// Persist settled payments and balances as JSON lines.
  bool save(std::string_view path) const;
  /// Merge a ledger written by save(). On unreadable input nothing is merged
  /// and false is returned.
  bool load(std::string_view path);

 private:
  struct invoice_record_t final {
    invoice_t invoice;
    domp::schema::preimage_t preimage{};
    std::optional<domp::schema::timestamp_seconds_t> paid_at;
  };

  domp::common::clock_fn_t clock_;
  mutable std::mutex mutex_;
  std::condition_variable paid_;
  std::map<domp::schema::hash32_t, invoice_record_t> invoices_;
  std::map<domp::schema::hash32_t, domp::schema::settled_payment_t> settled_;
  std::map<domp::schema::public_key_t, domp::schema::amount_sats_t> balances_;
};

/// Payment hash embedded in a ledger invoice string.
std::optional<domp::schema::hash32_t> parse_invoice_hash(
    std::string_view invoice);

}  // namespace domp::payment
