#include <domp/antispam/validator.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <bit>

using namespace domp::schema;

namespace domp::antispam {

namespace {

inline constexpr auto kMaxDifficulty = uint32_t{256};

proof_result_t make_error(const error_code code, std::string log) {
  return proof_result_t{.code = code, .log = std::move(log)};
}

}  // namespace

uint32_t leading_zero_bits(const hash32_t& id) {
  auto bits = uint32_t{0};
  for (auto byte : id) {
    if (byte == 0) {
      bits += 8;
      continue;
    }
    bits += static_cast<uint32_t>(std::countl_zero(byte));
    break;
  }
  return bits;
}

tag_t make_proof_tag(const anti_spam_proof_t& proof) {
  auto tag = tag_t{std::string{kAntiSpamProofTag}};
  std::visit(overloaded{[&](const pow_proof_t& value) {
                          tag.emplace_back(to_string(proof_type_t::pow));
                          tag.push_back(std::to_string(value.nonce));
                          tag.push_back(std::to_string(value.difficulty));
                        },
                        [&](const payment_proof_t& value) {
                          tag.emplace_back(to_string(proof_type_t::ln));
                          tag.push_back(to_hex(value.payment_hash));
                          tag.push_back(std::to_string(value.amount_sats));
                        },
                        [&](const reference_proof_t& value) {
                          tag.emplace_back(to_string(proof_type_t::ref));
                          tag.push_back(to_hex(value.event_id));
                          tag.push_back(std::to_string(value.kind));
                        }},
             proof);
  return tag;
}

std::optional<anti_spam_proof_t> parse_proof(const tags_t& tags,
                                             error_code& code,
                                             std::string& error) {
  const tag_t* found = nullptr;
  for (const auto& tag : tags) {
    if (tag.empty() || tag.front() != kAntiSpamProofTag) {
      continue;
    }
    if (found != nullptr) {
      code = error_code::malformed_proof;
      error = "more than one anti_spam_proof tag";
      return std::nullopt;
    }
    found = &tag;
  }
  if (found == nullptr) {
    code = error_code::missing_proof;
    error = "no anti_spam_proof tag";
    return std::nullopt;
  }

  code = error_code::malformed_proof;
  const auto& tag = *found;
  if (tag.size() != 4) {
    error = fmt::format("anti_spam_proof tag has {} elements, expected 4",
                        tag.size());
    return std::nullopt;
  }
  auto type = try_from_string<proof_type_t>(tag[1]);
  if (!type) {
    error = fmt::format("unknown proof type '{}'", tag[1]);
    return std::nullopt;
  }

  switch (*type) {
    case proof_type_t::pow: {
      auto nonce = try_parse_u64(tag[2]);
      auto difficulty = try_parse_u64(tag[3]);
      if (!nonce || !difficulty || *difficulty > kMaxDifficulty) {
        error = "pow proof needs a decimal nonce and difficulty <= 256";
        return std::nullopt;
      }
      code = error_code::ok;
      return pow_proof_t{.nonce = *nonce,
                         .difficulty = static_cast<uint32_t>(*difficulty)};
    }
    case proof_type_t::ln: {
      auto payment_hash = try_make_hash32(tag[2]);
      auto amount = try_parse_u64(tag[3]);
      if (!payment_hash || !amount) {
        error = "ln proof needs a payment hash and decimal amount";
        return std::nullopt;
      }
      code = error_code::ok;
      return payment_proof_t{.payment_hash = *payment_hash,
                             .amount_sats = *amount};
    }
    case proof_type_t::ref: {
      auto event_id = try_make_hash32(tag[2]);
      auto kind = try_parse_u64(tag[3]);
      if (!event_id || !kind || *kind > UINT16_MAX) {
        error = "ref proof needs an event id and kind";
        return std::nullopt;
      }
      code = error_code::ok;
      return reference_proof_t{.event_id = *event_id,
                               .kind = static_cast<uint16_t>(*kind)};
    }
  }
  error = "unhandled proof type";
  return std::nullopt;
}

validator::validator(anti_spam_policy_t policy,
                     domp::payment::gateway* gateway,
                     event_lookup_t lookup)
    : policy_(policy), gateway_(gateway), lookup_(std::move(lookup)) {}

proof_result_t validator::validate(const event_t& event) {
  auto code = error_code::ok;
  auto error = std::string{};
  auto proof = parse_proof(event.tags, code, error);
  if (!proof) {
    return make_error(code, std::move(error));
  }

  auto kind = try_make_event_kind(event.kind);
  if (kind && is_reputation_kind(*kind) &&
      !std::holds_alternative<reference_proof_t>(*proof)) {
    return make_error(error_code::missing_proof,
                      "reputation feedback requires a reference proof");
  }

  auto result = proof_result_t{};
  std::visit(
      overloaded{
          [&](const pow_proof_t& value) { result = check_pow(event, value); },
          [&](const payment_proof_t& value) { result = check_payment(value); },
          [&](const reference_proof_t& value) {
            result = check_reference(event, value);
          }},
      *proof);
  if (result.ok()) {
    result.proof = *proof;
  }
  return result;
}

proof_result_t validator::check_pow(const event_t& event,
                                    const pow_proof_t& proof) const {
  if (proof.difficulty < policy_.min_pow_difficulty) {
    return make_error(error_code::insufficient_difficulty,
                      fmt::format("declared difficulty {} below minimum {}",
                                  proof.difficulty,
                                  policy_.min_pow_difficulty));
  }
  auto bits = leading_zero_bits(event.id);
  if (bits < proof.difficulty) {
    return make_error(error_code::insufficient_difficulty,
                      fmt::format("id has {} leading zero bits, {} declared",
                                  bits, proof.difficulty));
  }
  return proof_result_t{};
}

proof_result_t validator::check_payment(const payment_proof_t& proof) {
  if (gateway_ == nullptr) {
    return make_error(error_code::unconfirmed_payment,
                      "no payment network configured");
  }
  auto settled = gateway_->lookup(proof.payment_hash);
  if (!settled) {
    return make_error(error_code::unconfirmed_payment,
                      fmt::format("payment {} not settled",
                                  short_hex(proof.payment_hash)));
  }
  if (settled->amount_sats < policy_.min_payment_sats ||
      settled->amount_sats < proof.amount_sats) {
    return make_error(
        error_code::unconfirmed_payment,
        fmt::format("settled {} sats; need {} and declared {}",
                    settled->amount_sats, policy_.min_payment_sats,
                    proof.amount_sats));
  }

  auto lock = std::scoped_lock{mutex_};
  if (!consumed_payments_.insert(proof.payment_hash).second) {
    return make_error(error_code::reference_already_consumed,
                      fmt::format("payment {} already stamped an event",
                                  short_hex(proof.payment_hash)));
  }
  auto result = proof_result_t{};
  result.reservation.type = reservation_t::type_t::payment;
  result.reservation.payment_hash = proof.payment_hash;
  return result;
}

proof_result_t validator::check_reference(const event_t& event,
                                          const reference_proof_t& proof) {
  auto referenced = lookup_ ? lookup_(proof.event_id) : std::nullopt;
  if (!referenced) {
    return make_error(error_code::reference_not_found,
                      fmt::format("referenced event {} was never accepted",
                                  short_hex(proof.event_id)));
  }
  if (referenced->author_key != event.author_key) {
    return make_error(error_code::reference_not_found,
                      "referenced event has a different author");
  }
  if (referenced->kind != proof.kind) {
    return make_error(error_code::reference_not_found,
                      fmt::format("referenced event is kind {}, {} declared",
                                  referenced->kind, proof.kind));
  }

  auto key = std::tuple{event.author_key, proof.event_id, event.kind};
  auto lock = std::scoped_lock{mutex_};
  if (!consumed_references_.insert(key).second) {
    return make_error(error_code::reference_already_consumed,
                      fmt::format("{} already used as proof for kind {}",
                                  short_hex(proof.event_id), event.kind));
  }
  auto result = proof_result_t{};
  result.reservation = reservation_t{.type = reservation_t::type_t::reference,
                                     .author = event.author_key,
                                     .referenced_event = proof.event_id,
                                     .consuming_kind = event.kind};
  return result;
}

void validator::release(const reservation_t& reservation) {
  auto lock = std::scoped_lock{mutex_};
  switch (reservation.type) {
    case reservation_t::type_t::none:
      return;
    case reservation_t::type_t::payment:
      consumed_payments_.erase(reservation.payment_hash);
      return;
    case reservation_t::type_t::reference:
      consumed_references_.erase(std::tuple{reservation.author,
                                            reservation.referenced_event,
                                            reservation.consuming_kind});
      return;
  }
}

}  // namespace domp::antispam
