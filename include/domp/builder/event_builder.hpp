#pragma once

#include <domp/antispam/pow_miner.hpp>
#include <domp/common/clock.hpp>
#include <domp/crypto/sign.hpp>
#include <domp/payment/gateway.hpp>
#include <domp/schema/anti_spam_proof.hpp>
#include <domp/schema/content.hpp>
#include <domp/schema/event.hpp>
#include <domp/schema/primitives.hpp>

#include <optional>
#include <string>

namespace domp::builder {

/// Marker of a ["ref", <id>, <relay hint>, <marker>] tag.
inline constexpr auto kRootMarker = std::string_view{"root"};
inline constexpr auto kReplyMarker = std::string_view{"reply"};

/// Remove every anti-spam proof tag and append one for `proof`.
domp::schema::unsigned_event_t stamp(domp::schema::unsigned_event_t event,
                                     const domp::schema::anti_spam_proof_t& proof);

/// Pay `amount_sats` to `payee` through the gateway and return the proof
/// of that payment.
std::optional<domp::schema::payment_proof_t> buy_payment_proof(
    domp::payment::gateway& gateway,
    const domp::schema::public_key_t& payer,
    const domp::schema::public_key_t& payee,
    domp::schema::amount_sats_t amount_sats);

/// Author-side construction of protocol events for one key.
class event_builder final {
 public:
  explicit event_builder(
      domp::crypto::keypair_t keys,
      domp::common::clock_fn_t clock = domp::common::make_system_clock(),
      std::string relay_hint = {});

  /// Unsigned event carrying `content`. The anchor the content references
  /// is tagged as the reply target; `root`, when given and different, is
  /// tagged as the transaction root.
  domp::schema::unsigned_event_t build(
      const domp::schema::content_t& content,
      const std::optional<domp::schema::event_id_t>& root = std::nullopt) const;

  /// Mine a pow proof in the calling thread.
  std::optional<domp::schema::unsigned_event_t> with_pow(
      const domp::schema::unsigned_event_t& event,
      uint32_t difficulty,
      const domp::antispam::cancel_fn_t& cancelled = {}) const;

  domp::antispam::pow_miner::job_t with_pow(
      domp::antispam::pow_miner& miner,
      const domp::schema::unsigned_event_t& event,
      uint32_t difficulty) const;

  domp::schema::unsigned_event_t with_payment(
      const domp::schema::unsigned_event_t& event,
      const domp::schema::payment_proof_t& proof) const;

  /// Reference one of this author's accepted events of `kind`.
  domp::schema::unsigned_event_t with_reference(
      const domp::schema::unsigned_event_t& event,
      const domp::schema::event_id_t& referenced,
      uint16_t kind) const;

  std::optional<domp::schema::event_t> sign(
      const domp::schema::unsigned_event_t& event) const;

  /// build(), mine and sign in one step.
  std::optional<domp::schema::event_t> publish_with_pow(
      const domp::schema::content_t& content,
      uint32_t difficulty,
      const std::optional<domp::schema::event_id_t>& root = std::nullopt) const;

  const domp::schema::public_key_t& public_key() const {
    return keys_.public_key;
  }

 private:
  domp::crypto::keypair_t keys_;
  domp::common::clock_fn_t clock_;
  std::string relay_hint_;
};

}  // namespace domp::builder
