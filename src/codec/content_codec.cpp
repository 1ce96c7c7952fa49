#include <domp/codec/content_codec.hpp>
#include <domp/schema/reputation.hpp>

#include <nlohmann/json.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>

using namespace domp::schema;

namespace domp::codec {

namespace {

using json = nlohmann::json;

/// Typed accessors over one content object. The first failure is kept in
/// `error` and every later read short-circuits.
class field_reader final {
 public:
  field_reader(const json& object, std::string& error)
      : object_(object), error_(error) {}

  bool ok() const { return error_.empty(); }

  void fail(std::string message) {
    if (error_.empty()) {
      error_ = std::move(message);
    }
  }

  const json* find(const char* name) const {
    auto it = object_.find(name);
    if (it == object_.end() || it->is_null()) {
      return nullptr;
    }
    return &*it;
  }

  std::string required_string(const char* name) {
    auto value = find(name);
    if (value == nullptr) {
      fail(fmt::format("missing required field '{}'", name));
      return {};
    }
    if (!value->is_string()) {
      fail(fmt::format("field '{}' must be a string", name));
      return {};
    }
    return value->get<std::string>();
  }

  std::optional<std::string> optional_string(const char* name) {
    auto value = find(name);
    if (value == nullptr) {
      return std::nullopt;
    }
    if (!value->is_string()) {
      fail(fmt::format("field '{}' must be a string", name));
      return std::nullopt;
    }
    return value->get<std::string>();
  }

  /// Any JSON value, kept as its compact text.
  std::optional<std::string> optional_raw(const char* name) {
    auto value = find(name);
    if (value == nullptr) {
      return std::nullopt;
    }
    if (value->is_string()) {
      return value->get<std::string>();
    }
    return value->dump(-1, ' ', false, json::error_handler_t::replace);
  }

  uint64_t required_u64(const char* name) {
    auto value = find(name);
    if (value == nullptr) {
      fail(fmt::format("missing required field '{}'", name));
      return 0;
    }
    return to_u64(name, *value).value_or(0);
  }

  std::optional<uint64_t> optional_u64(const char* name) {
    auto value = find(name);
    if (value == nullptr) {
      return std::nullopt;
    }
    return to_u64(name, *value);
  }

  std::optional<uint32_t> optional_rating(const char* name) {
    auto value = optional_u64(name);
    if (!value) {
      return std::nullopt;
    }
    if (*value < kMinRating || *value > kMaxRating) {
      fail(fmt::format("field '{}' must be between {} and {}", name,
                       kMinRating, kMaxRating));
      return std::nullopt;
    }
    return static_cast<uint32_t>(*value);
  }

  uint32_t required_rating(const char* name) {
    if (find(name) == nullptr) {
      fail(fmt::format("missing required field '{}'", name));
      return 0;
    }
    return optional_rating(name).value_or(0);
  }

  std::optional<bool> optional_bool(const char* name) {
    auto value = find(name);
    if (value == nullptr) {
      return std::nullopt;
    }
    if (!value->is_boolean()) {
      fail(fmt::format("field '{}' must be a boolean", name));
      return std::nullopt;
    }
    return value->get<bool>();
  }

  hash32_t required_hash(const char* name) {
    auto hex = required_string(name);
    if (!ok()) {
      return {};
    }
    auto decoded = try_make_hash32(hex);
    if (!decoded) {
      fail(fmt::format("field '{}' must be 64 hex characters", name));
      return {};
    }
    return *decoded;
  }

  std::optional<hash32_t> optional_hash(const char* name) {
    auto hex = optional_string(name);
    if (!hex) {
      return std::nullopt;
    }
    auto decoded = try_make_hash32(*hex);
    if (!decoded) {
      fail(fmt::format("field '{}' must be 64 hex characters", name));
      return std::nullopt;
    }
    return decoded;
  }

  template <typename Enum>
  Enum required_enum(const char* name) {
    auto text = required_string(name);
    if (!ok()) {
      return Enum{};
    }
    auto value = try_from_string<Enum>(text);
    if (!value) {
      fail(fmt::format("field '{}' has unknown value '{}'", name, text));
      return Enum{};
    }
    return *value;
  }

 private:
  std::optional<uint64_t> to_u64(const char* name, const json& value) {
    if (value.is_number_unsigned()) {
      return value.get<uint64_t>();
    }
    if (value.is_number_integer()) {
      fail(fmt::format("field '{}' must not be negative", name));
      return std::nullopt;
    }
    fail(fmt::format("field '{}' must be an unsigned integer", name));
    return std::nullopt;
  }

  const json& object_;
  std::string& error_;
};

std::size_t utf8_length(const std::string_view& text) {
  return static_cast<std::size_t>(
      std::count_if(text.begin(), text.end(), [](const char c) {
        return (static_cast<uint8_t>(c) & 0xC0u) != 0x80u;
      }));
}

template <typename T>
std::optional<uint32_t> narrow_u32(field_reader& reader,
                                   const char* name,
                                   const std::optional<T>& value) {
  if (!value) {
    return std::nullopt;
  }
  if (*value > UINT32_MAX) {
    reader.fail(fmt::format("field '{}' out of range", name));
    return std::nullopt;
  }
  return static_cast<uint32_t>(*value);
}

product_listing_t parse_listing(field_reader& reader) {
  auto out = product_listing_t{};
  out.product_name = reader.required_string("product_name");
  out.description = reader.required_string("description");
  out.price_satoshis = reader.required_u64("price_satoshis");
  out.category = reader.optional_string("category");
  out.storage_link = reader.optional_string("storage_link");
  out.seller_collateral_satoshis =
      reader.optional_u64("seller_collateral_satoshis").value_or(0);
  out.shipping_info = reader.optional_raw("shipping_info");
  if (!reader.ok()) {
    return out;
  }
  if (out.product_name.empty()) {
    reader.fail("product_name must not be empty");
  } else if (utf8_length(out.product_name) > kMaxProductNameLength) {
    reader.fail(fmt::format("product_name longer than {} characters",
                            kMaxProductNameLength));
  }
  if (out.price_satoshis == 0) {
    reader.fail("price_satoshis must be positive");
  }
  return out;
}

bid_submission_t parse_bid(field_reader& reader) {
  auto out = bid_submission_t{};
  out.product_ref = reader.required_hash("product_ref");
  out.bid_amount_satoshis = reader.required_u64("bid_amount_satoshis");
  out.buyer_collateral_satoshis =
      reader.required_u64("buyer_collateral_satoshis");
  out.message = reader.optional_string("message");
  out.shipping_address_hash = reader.optional_string("shipping_address_hash");
  out.payment_timeout_hours = narrow_u32(
      reader, "payment_timeout_hours",
      reader.optional_u64("payment_timeout_hours"));
  if (reader.ok() && out.bid_amount_satoshis == 0) {
    reader.fail("bid_amount_satoshis must be positive");
  }
  return out;
}

counter_bid_t parse_counter(field_reader& reader) {
  auto out = counter_bid_t{};
  out.bid_ref = reader.required_hash("bid_ref");
  out.counter_amount_satoshis = reader.required_u64("counter_amount_satoshis");
  out.counter_collateral_satoshis =
      reader.optional_u64("counter_collateral_satoshis");
  out.message = reader.optional_string("message");
  if (reader.ok() && out.counter_amount_satoshis == 0) {
    reader.fail("counter_amount_satoshis must be positive");
  }
  return out;
}

bid_acceptance_t parse_acceptance(field_reader& reader) {
  auto out = bid_acceptance_t{};
  out.bid_ref = reader.required_hash("bid_ref");
  out.ln_invoice = reader.required_string("ln_invoice");
  out.invoice_amount_satoshis = reader.required_u64("invoice_amount_satoshis");
  out.collateral_invoice = reader.optional_string("collateral_invoice");
  out.shipping_time_days = narrow_u32(reader, "shipping_time_days",
                                      reader.optional_u64("shipping_time_days"));
  out.terms = reader.optional_string("terms");
  out.htlc_timeout_blocks =
      narrow_u32(reader, "htlc_timeout_blocks",
                 reader.optional_u64("htlc_timeout_blocks"))
          .value_or(kDefaultHtlcTimeoutBlocks);
  if (!reader.ok()) {
    return out;
  }
  if (!is_lightning_invoice(out.ln_invoice)) {
    reader.fail("ln_invoice is not a Lightning invoice");
  } else if (out.collateral_invoice &&
             !is_lightning_invoice(*out.collateral_invoice)) {
    reader.fail("collateral_invoice is not a Lightning invoice");
  } else if (out.htlc_timeout_blocks == 0) {
    reader.fail("htlc_timeout_blocks must be positive");
  }
  return out;
}

collateral_deposit_t parse_deposit(field_reader& reader) {
  auto out = collateral_deposit_t{};
  out.bid_ref = reader.required_hash("bid_ref");
  out.collateral_proof = reader.required_hash("collateral_proof");
  out.amount_satoshis = reader.required_u64("amount_satoshis");
  if (reader.ok() && out.amount_satoshis == 0) {
    reader.fail("amount_satoshis must be positive");
  }
  return out;
}

payment_confirmation_t parse_payment(field_reader& reader) {
  auto out = payment_confirmation_t{};
  out.bid_ref = reader.required_hash("bid_ref");
  out.acceptance_ref = reader.optional_hash("acceptance_ref");
  out.payment_proof = reader.required_hash("payment_proof");
  out.payment_method = reader.required_enum<payment_method_t>("payment_method");
  out.collateral_proof = reader.optional_hash("collateral_proof");
  out.payment_amount_satoshis = reader.optional_u64("payment_amount_satoshis");
  out.collateral_amount_satoshis =
      reader.optional_u64("collateral_amount_satoshis");
  out.payment_timestamp = reader.optional_u64("payment_timestamp");
  return out;
}

escrow_dispute_t parse_dispute(field_reader& reader) {
  auto out = escrow_dispute_t{};
  out.payment_ref = reader.required_hash("payment_ref");
  out.reason = reader.required_string("reason");
  out.evidence_hash = reader.optional_string("evidence_hash");
  return out;
}

receipt_confirmation_t parse_receipt(field_reader& reader) {
  auto out = receipt_confirmation_t{};
  out.payment_ref = reader.required_hash("payment_ref");
  out.status = reader.required_enum<receipt_status_t>("status");
  out.dispute_reason = reader.optional_string("dispute_reason");
  if (auto preimage = reader.optional_string("payment_preimage")) {
    out.payment_preimage = try_from_hex_array<32>(*preimage);
    if (!out.payment_preimage) {
      reader.fail("payment_preimage must be 64 hex characters");
    }
  }
  if (auto rating = reader.optional_rating("rating")) {
    out.rating = receipt_rating_t{
        .rating = *rating,
        .feedback = reader.optional_string("feedback"),
        .item_condition = reader.optional_string("item_condition"),
        .shipping_rating = reader.optional_rating("shipping_rating"),
        .communication_rating = reader.optional_rating("communication_rating"),
        .would_buy_again = reader.optional_bool("would_buy_again")};
  }
  if (reader.ok() && out.status != receipt_status_t::received &&
      !out.dispute_reason) {
    reader.fail("dispute_reason is required unless status is 'received'");
  }
  return out;
}

refund_initiation_t parse_refund(field_reader& reader) {
  auto out = refund_initiation_t{};
  out.payment_ref = reader.required_hash("payment_ref");
  out.reason = reader.optional_string("reason");
  return out;
}

mutual_agreement_t parse_agreement(field_reader& reader) {
  auto out = mutual_agreement_t{};
  out.dispute_ref = reader.required_hash("dispute_ref");
  out.resolution = reader.required_enum<resolution_t>("resolution");
  out.terms = reader.optional_string("terms");
  out.offer_ref = reader.optional_hash("offer_ref");
  return out;
}

arbitration_offer_t parse_offer(field_reader& reader) {
  auto out = arbitration_offer_t{};
  out.dispute_ref = reader.required_hash("dispute_ref");
  out.fee_satoshis = reader.required_u64("fee_satoshis");
  out.terms = reader.optional_string("terms");
  return out;
}

arbitration_resolution_t parse_resolution(field_reader& reader) {
  auto out = arbitration_resolution_t{};
  out.offer_ref = reader.required_hash("offer_ref");
  out.resolution = reader.required_enum<resolution_t>("resolution");
  out.rationale = reader.optional_string("rationale");
  return out;
}

communication_message_t parse_message(field_reader& reader) {
  auto out = communication_message_t{};
  auto recipient = reader.required_string("recipient_pubkey");
  if (reader.ok()) {
    auto decoded = try_from_hex_array<32>(recipient);
    if (!decoded) {
      reader.fail("recipient_pubkey must be 64 hex characters");
    } else {
      out.recipient_pubkey = *decoded;
    }
  }
  out.message = reader.required_string("message");
  out.transaction_ref = reader.optional_hash("transaction_ref");
  return out;
}

reputation_feedback_t parse_feedback(field_reader& reader,
                                     const event_kind_t kind) {
  auto out = reputation_feedback_t{.kind = kind};
  out.transaction_ref = reader.required_hash("transaction_ref");
  auto rated = reader.required_string("rated_pubkey");
  if (reader.ok()) {
    auto decoded = try_from_hex_array<32>(rated);
    if (!decoded) {
      reader.fail("rated_pubkey must be 64 hex characters");
    } else {
      out.rated_pubkey = *decoded;
    }
  }
  out.rating = reader.required_rating("rating");
  out.item_quality = reader.optional_rating("item_quality");
  out.shipping_speed = reader.optional_rating("shipping_speed");
  out.communication = reader.optional_rating("communication");
  out.payment_reliability = reader.optional_rating("payment_reliability");
  out.feedback = reader.optional_string("feedback");
  out.relay_url = reader.optional_string("relay_url");
  if (reader.ok() && kind == event_kind_t::relay_reputation_feedback &&
      !out.relay_url) {
    reader.fail("relay_url is required for relay feedback");
  }
  return out;
}

template <typename T>
void put_optional(json& object, const char* name, const std::optional<T>& value) {
  if (value) {
    object[name] = *value;
  }
}

void put_optional_hash(json& object,
                       const char* name,
                       const std::optional<hash32_t>& value) {
  if (value) {
    object[name] = to_hex(*value);
  }
}

/// Re-embed structured shipping info when it parses as JSON.
void put_raw(json& object,
             const char* name,
             const std::optional<std::string>& value) {
  if (!value) {
    return;
  }
  auto parsed = json::parse(*value, nullptr, false);
  if (parsed.is_discarded() || parsed.is_string() || parsed.is_number()) {
    object[name] = *value;
  } else {
    object[name] = std::move(parsed);
  }
}

}  // namespace

bool is_lightning_invoice(const std::string_view& invoice) {
  // lnbc also covers lnbcrt.
  return invoice.starts_with("lnbc") || invoice.starts_with("lntb");
}

std::optional<content_t> try_parse_content(const uint16_t kind,
                                           const std::string_view& content,
                                           std::string& error) {
  auto known = try_make_event_kind(kind);
  if (!known) {
    error = fmt::format("unsupported event kind {}", kind);
    return std::nullopt;
  }

  auto object = json::parse(content, nullptr, false);
  if (object.is_discarded()) {
    error = "content is not valid JSON";
    return std::nullopt;
  }
  if (!object.is_object()) {
    error = "content must be a JSON object";
    return std::nullopt;
  }

  error.clear();
  auto reader = field_reader{object, error};
  auto parsed = std::optional<content_t>{};
  switch (*known) {
    case event_kind_t::product_listing:
      parsed = parse_listing(reader);
      break;
    case event_kind_t::bid_submission:
      parsed = parse_bid(reader);
      break;
    case event_kind_t::counter_bid:
      parsed = parse_counter(reader);
      break;
    case event_kind_t::bid_acceptance:
      parsed = parse_acceptance(reader);
      break;
    case event_kind_t::collateral_deposit:
      parsed = parse_deposit(reader);
      break;
    case event_kind_t::payment_confirmation:
      parsed = parse_payment(reader);
      break;
    case event_kind_t::escrow_dispute:
      parsed = parse_dispute(reader);
      break;
    case event_kind_t::receipt_confirmation:
      parsed = parse_receipt(reader);
      break;
    case event_kind_t::refund_initiation:
      parsed = parse_refund(reader);
      break;
    case event_kind_t::mutual_agreement:
      parsed = parse_agreement(reader);
      break;
    case event_kind_t::arbitration_offer:
      parsed = parse_offer(reader);
      break;
    case event_kind_t::arbitration_resolution:
      parsed = parse_resolution(reader);
      break;
    case event_kind_t::communication_message:
      parsed = parse_message(reader);
      break;
    case event_kind_t::user_reputation_feedback:
    case event_kind_t::arbitrator_reputation_feedback:
    case event_kind_t::relay_reputation_feedback:
      parsed = parse_feedback(reader, *known);
      break;
  }
  if (!reader.ok()) {
    return std::nullopt;
  }
  return parsed;
}

uint16_t kind_of(const content_t& content) {
  auto kind = event_kind_t{};
  std::visit(
      overloaded{
          [&](const product_listing_t&) {
            kind = event_kind_t::product_listing;
          },
          [&](const bid_submission_t&) { kind = event_kind_t::bid_submission; },
          [&](const counter_bid_t&) { kind = event_kind_t::counter_bid; },
          [&](const bid_acceptance_t&) { kind = event_kind_t::bid_acceptance; },
          [&](const collateral_deposit_t&) {
            kind = event_kind_t::collateral_deposit;
          },
          [&](const payment_confirmation_t&) {
            kind = event_kind_t::payment_confirmation;
          },
          [&](const escrow_dispute_t&) { kind = event_kind_t::escrow_dispute; },
          [&](const receipt_confirmation_t&) {
            kind = event_kind_t::receipt_confirmation;
          },
          [&](const refund_initiation_t&) {
            kind = event_kind_t::refund_initiation;
          },
          [&](const mutual_agreement_t&) {
            kind = event_kind_t::mutual_agreement;
          },
          [&](const arbitration_offer_t&) {
            kind = event_kind_t::arbitration_offer;
          },
          [&](const arbitration_resolution_t&) {
            kind = event_kind_t::arbitration_resolution;
          },
          [&](const communication_message_t&) {
            kind = event_kind_t::communication_message;
          },
          [&](const reputation_feedback_t& value) { kind = value.kind; }},
      content);
  return static_cast<uint16_t>(kind);
}

std::string serialize_content(const content_t& content) {
  auto object = json::object();
  std::visit(
      overloaded{
          [&](const product_listing_t& value) {
            object["product_name"] = value.product_name;
            object["description"] = value.description;
            object["price_satoshis"] = value.price_satoshis;
            put_optional(object, "category", value.category);
            put_optional(object, "storage_link", value.storage_link);
            if (value.seller_collateral_satoshis > 0) {
              object["seller_collateral_satoshis"] =
                  value.seller_collateral_satoshis;
            }
            put_raw(object, "shipping_info", value.shipping_info);
          },
          [&](const bid_submission_t& value) {
            object["product_ref"] = to_hex(value.product_ref);
            object["bid_amount_satoshis"] = value.bid_amount_satoshis;
            object["buyer_collateral_satoshis"] =
                value.buyer_collateral_satoshis;
            put_optional(object, "message", value.message);
            put_optional(object, "shipping_address_hash",
                         value.shipping_address_hash);
            put_optional(object, "payment_timeout_hours",
                         value.payment_timeout_hours);
          },
          [&](const counter_bid_t& value) {
            object["bid_ref"] = to_hex(value.bid_ref);
            object["counter_amount_satoshis"] = value.counter_amount_satoshis;
            put_optional(object, "counter_collateral_satoshis",
                         value.counter_collateral_satoshis);
            put_optional(object, "message", value.message);
          },
          [&](const bid_acceptance_t& value) {
            object["bid_ref"] = to_hex(value.bid_ref);
            object["ln_invoice"] = value.ln_invoice;
            object["invoice_amount_satoshis"] = value.invoice_amount_satoshis;
            put_optional(object, "collateral_invoice", value.collateral_invoice);
            put_optional(object, "shipping_time_days", value.shipping_time_days);
            put_optional(object, "terms", value.terms);
            if (value.htlc_timeout_blocks != kDefaultHtlcTimeoutBlocks) {
              object["htlc_timeout_blocks"] = value.htlc_timeout_blocks;
            }
          },
          [&](const collateral_deposit_t& value) {
            object["bid_ref"] = to_hex(value.bid_ref);
            object["collateral_proof"] = to_hex(value.collateral_proof);
            object["amount_satoshis"] = value.amount_satoshis;
          },
          [&](const payment_confirmation_t& value) {
            object["bid_ref"] = to_hex(value.bid_ref);
            put_optional_hash(object, "acceptance_ref", value.acceptance_ref);
            object["payment_proof"] = to_hex(value.payment_proof);
            object["payment_method"] = std::string{to_string(value.payment_method)};
            put_optional_hash(object, "collateral_proof",
                              value.collateral_proof);
            put_optional(object, "payment_amount_satoshis",
                         value.payment_amount_satoshis);
            put_optional(object, "collateral_amount_satoshis",
                         value.collateral_amount_satoshis);
            put_optional(object, "payment_timestamp", value.payment_timestamp);
          },
          [&](const escrow_dispute_t& value) {
            object["payment_ref"] = to_hex(value.payment_ref);
            object["reason"] = value.reason;
            put_optional(object, "evidence_hash", value.evidence_hash);
          },
          [&](const receipt_confirmation_t& value) {
            object["payment_ref"] = to_hex(value.payment_ref);
            object["status"] = std::string{to_string(value.status)};
            put_optional(object, "dispute_reason", value.dispute_reason);
            if (value.payment_preimage) {
              object["payment_preimage"] = to_hex(*value.payment_preimage);
            }
            if (value.rating) {
              object["rating"] = value.rating->rating;
              put_optional(object, "feedback", value.rating->feedback);
              put_optional(object, "item_condition",
                           value.rating->item_condition);
              put_optional(object, "shipping_rating",
                           value.rating->shipping_rating);
              put_optional(object, "communication_rating",
                           value.rating->communication_rating);
              put_optional(object, "would_buy_again",
                           value.rating->would_buy_again);
            }
          },
          [&](const refund_initiation_t& value) {
            object["payment_ref"] = to_hex(value.payment_ref);
            put_optional(object, "reason", value.reason);
          },
          [&](const mutual_agreement_t& value) {
            object["dispute_ref"] = to_hex(value.dispute_ref);
            object["resolution"] = std::string{to_string(value.resolution)};
            put_optional(object, "terms", value.terms);
            put_optional_hash(object, "offer_ref", value.offer_ref);
          },
          [&](const arbitration_offer_t& value) {
            object["dispute_ref"] = to_hex(value.dispute_ref);
            object["fee_satoshis"] = value.fee_satoshis;
            put_optional(object, "terms", value.terms);
          },
          [&](const arbitration_resolution_t& value) {
            object["offer_ref"] = to_hex(value.offer_ref);
            object["resolution"] = std::string{to_string(value.resolution)};
            put_optional(object, "rationale", value.rationale);
          },
          [&](const communication_message_t& value) {
            object["recipient_pubkey"] = to_hex(value.recipient_pubkey);
            object["message"] = value.message;
            put_optional_hash(object, "transaction_ref", value.transaction_ref);
          },
          [&](const reputation_feedback_t& value) {
            object["transaction_ref"] = to_hex(value.transaction_ref);
            object["rated_pubkey"] = to_hex(value.rated_pubkey);
            object["rating"] = value.rating;
            put_optional(object, "item_quality", value.item_quality);
            put_optional(object, "shipping_speed", value.shipping_speed);
            put_optional(object, "communication", value.communication);
            put_optional(object, "payment_reliability",
                         value.payment_reliability);
            put_optional(object, "feedback", value.feedback);
            put_optional(object, "relay_url", value.relay_url);
          }},
      content);
  return object.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace domp::codec
