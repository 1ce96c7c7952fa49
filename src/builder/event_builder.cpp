#include <spdlog/spdlog.h>
#include <algorithm>
#include <domp/antispam/validator.hpp>
#include <domp/builder/event_builder.hpp>
#include <domp/codec/content_codec.hpp>
#include <domp/codec/event_codec.hpp>
#include <domp/market/state_machine.hpp>
#include <utility>

using namespace domp::schema;

namespace domp::builder {

namespace {

inline constexpr auto kPubkeyTag = std::string_view{"p"};
inline constexpr auto kProofInvoiceExpiry = duration_seconds_t{600};

tag_t make_ref_tag(const event_id_t& id,
                   const std::string& relay_hint,
                   const std::string_view marker) {
  return tag_t{std::string{kReferenceTag}, to_hex(id), relay_hint,
               std::string{marker}};
}

/// Key the content is addressed to, if any.
std::optional<public_key_t> addressee_of(const content_t& content) {
  if (auto message = std::get_if<communication_message_t>(&content)) {
    return message->recipient_pubkey;
  }
  if (auto feedback = std::get_if<reputation_feedback_t>(&content)) {
    return feedback->rated_pubkey;
  }
  return std::nullopt;
}

}  // namespace

unsigned_event_t stamp(unsigned_event_t event,
                       const anti_spam_proof_t& proof) {
  std::erase_if(event.tags, [](const tag_t& tag) {
    return !tag.empty() && tag.front() == kAntiSpamProofTag;
  });
  event.tags.push_back(domp::antispam::make_proof_tag(proof));
  return event;
}

std::optional<payment_proof_t> buy_payment_proof(
    domp::payment::gateway& gateway,
    const public_key_t& payer,
    const public_key_t& payee,
    const amount_sats_t amount_sats) {
  auto invoice = gateway.create_invoice(payee, amount_sats, "anti-spam proof",
                                        kProofInvoiceExpiry);
  if (!invoice) {
    spdlog::warn("payment network refused a {} sat proof invoice",
                 amount_sats);
    return std::nullopt;
  }
  auto paid = gateway.pay(invoice->invoice, payer);
  if (!paid.ok()) {
    spdlog::warn("anti-spam proof payment failed: {}", paid.error);
    return std::nullopt;
  }
  return payment_proof_t{.payment_hash = invoice->payment_hash,
                         .amount_sats = amount_sats};
}

event_builder::event_builder(domp::crypto::keypair_t keys,
                             domp::common::clock_fn_t clock,
                             std::string relay_hint)
    : keys_(keys),
      clock_(std::move(clock)),
      relay_hint_(std::move(relay_hint)) {}

unsigned_event_t event_builder::build(
    const content_t& content,
    const std::optional<event_id_t>& root) const {
  auto event = unsigned_event_t{.author_key = keys_.public_key,
                                .created_at = clock_(),
                                .kind = domp::codec::kind_of(content),
                                .content = domp::codec::serialize_content(content)};

  auto anchor = domp::market::anchor_of(content);
  if (root && (!anchor || *anchor != *root)) {
    event.tags.push_back(make_ref_tag(*root, relay_hint_, kRootMarker));
  }
  if (anchor) {
    event.tags.push_back(make_ref_tag(*anchor, relay_hint_, kReplyMarker));
  }
  if (auto addressee = addressee_of(content)) {
    event.tags.push_back(tag_t{std::string{kPubkeyTag}, to_hex(*addressee)});
  }
  return event;
}

std::optional<unsigned_event_t> event_builder::with_pow(
    const unsigned_event_t& event,
    const uint32_t difficulty,
    const domp::antispam::cancel_fn_t& cancelled) const {
  auto mined = domp::antispam::mine(event, difficulty, cancelled);
  if (!mined) {
    return std::nullopt;
  }
  spdlog::debug("mined {} bits in {} attempts", difficulty, mined->attempts);
  return std::move(mined->event);
}

domp::antispam::pow_miner::job_t event_builder::with_pow(
    domp::antispam::pow_miner& miner,
    const unsigned_event_t& event,
    const uint32_t difficulty) const {
  return miner.submit(event, difficulty);
}

unsigned_event_t event_builder::with_payment(
    const unsigned_event_t& event,
    const payment_proof_t& proof) const {
  return stamp(event, proof);
}

unsigned_event_t event_builder::with_reference(const unsigned_event_t& event,
                                               const event_id_t& referenced,
                                               const uint16_t kind) const {
  return stamp(event, reference_proof_t{.event_id = referenced, .kind = kind});
}

std::optional<event_t> event_builder::sign(
    const unsigned_event_t& event) const {
  return domp::codec::sign_event(event, keys_.secret_key);
}

std::optional<event_t> event_builder::publish_with_pow(
    const content_t& content,
    const uint32_t difficulty,
    const std::optional<event_id_t>& root) const {
  auto mined = with_pow(build(content, root), difficulty);
  if (!mined) {
    return std::nullopt;
  }
  return sign(*mined);
}

}  // namespace domp::builder
