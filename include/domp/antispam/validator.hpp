#pragma once

#include <domp/payment/gateway.hpp>
#include <domp/schema/anti_spam_proof.hpp>
#include <domp/schema/error_code.hpp>
#include <domp/schema/event.hpp>

#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <tuple>

namespace domp::antispam {

/// Number of leading zero bits of a 32-byte id.
uint32_t leading_zero_bits(const domp::schema::hash32_t& id);

/// Build the tag that carries a proof.
domp::schema::tag_t make_proof_tag(const domp::schema::anti_spam_proof_t& proof);

/// Locate and parse the single proof tag.
/// `missing_proof` when absent; `malformed_proof` when repeated, of an
/// unknown type, or with unparsable fields.
std::optional<domp::schema::anti_spam_proof_t> parse_proof(
    const domp::schema::tags_t& tags,
    domp::schema::error_code& code,
    std::string& error);

/// Consumption held by an accepted proof until the event commits or fails.
struct reservation_t final {
  enum class type_t : uint8_t { none = 0, payment = 1, reference = 2 };

  type_t type{type_t::none};
  domp::schema::hash32_t payment_hash{};
  domp::schema::public_key_t author{};
  domp::schema::event_id_t referenced_event{};
  uint16_t consuming_kind{};
};

struct proof_result_t final {
  domp::schema::error_code code{domp::schema::error_code::ok};
  std::string log;
  std::optional<domp::schema::anti_spam_proof_t> proof;
  reservation_t reservation;

  bool ok() const { return code == domp::schema::error_code::ok; }
};

/// Previously accepted event, by id.
using event_lookup_t = std::function<std::optional<
    domp::schema::event_index_entry_t>(const domp::schema::event_id_t&)>;

/// Checks the anti-spam proof of an already verified event.
///
/// Payment hashes and (author, referenced event, consuming kind) triples
/// are consumed at most once. A successful validate() reserves the
/// consumption; call release() if the event is rejected further down the
/// pipeline, otherwise the reservation stands.
class validator final {
 public:
  validator(domp::schema::anti_spam_policy_t policy,
            domp::payment::gateway* gateway,
            event_lookup_t lookup);

  proof_result_t validate(const domp::schema::event_t& event);

  void release(const reservation_t& reservation);

  const domp::schema::anti_spam_policy_t& policy() const { return policy_; }

 private:
  proof_result_t check_pow(const domp::schema::event_t& event,
                           const domp::schema::pow_proof_t& proof) const;
  proof_result_t check_payment(const domp::schema::payment_proof_t& proof);
  proof_result_t check_reference(const domp::schema::event_t& event,
                                 const domp::schema::reference_proof_t& proof);

  domp::schema::anti_spam_policy_t policy_;
  domp::payment::gateway* gateway_{nullptr};
  event_lookup_t lookup_;
  std::mutex mutex_;
  std::set<domp::schema::hash32_t> consumed_payments_;
  std::set<std::tuple<domp::schema::public_key_t,
                      domp::schema::event_id_t,
                      uint16_t>>
      consumed_references_;
};

}  // namespace domp::antispam
