#include <domp/codec/event_codec.hpp>
#include <domp/crypto/hash.hpp>
#include <domp/crypto/sign.hpp>
#include <domp/crypto/verify.hpp>

#include <nlohmann/json.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace domp::codec {

namespace {

using json = nlohmann::json;

json tags_to_json(const domp::schema::tags_t& tags) {
  auto out = json::array();
  for (const auto& tag : tags) {
    auto entry = json::array();
    for (const auto& value : tag) {
      entry.push_back(value);
    }
    out.push_back(std::move(entry));
  }
  return out;
}

std::optional<domp::schema::tags_t> tags_from_json(const json& value,
                                                   std::string& error) {
  if (!value.is_array()) {
    error = "tags must be an array";
    return std::nullopt;
  }
  auto tags = domp::schema::tags_t{};
  tags.reserve(value.size());
  for (const auto& entry : value) {
    if (!entry.is_array()) {
      error = "each tag must be an array of strings";
      return std::nullopt;
    }
    auto tag = domp::schema::tag_t{};
    tag.reserve(entry.size());
    for (const auto& item : entry) {
      if (!item.is_string()) {
        error = "each tag must be an array of strings";
        return std::nullopt;
      }
      tag.push_back(item.get<std::string>());
    }
    tags.push_back(std::move(tag));
  }
  return tags;
}

const json* find_field(const json& object,
                       const char* name,
                       std::string& error) {
  auto it = object.find(name);
  if (it == object.end()) {
    error = fmt::format("missing field '{}'", name);
    return nullptr;
  }
  return &*it;
}

}  // namespace

std::optional<std::string> canonicalize(
    const domp::schema::public_key_t& author_key,
    const domp::schema::timestamp_seconds_t created_at,
    const uint16_t kind,
    const domp::schema::tags_t& tags,
    const std::string& content) {
  auto array = json::array({0, domp::schema::to_hex(author_key), created_at,
                            kind, tags_to_json(tags), content});
  try {
    return array.dump(-1, ' ', false, json::error_handler_t::strict);
  } catch (const json::type_error& ex) {
    spdlog::debug("canonicalize rejected non UTF-8 input: {}", ex.what());
    return std::nullopt;
  }
}

std::optional<std::string> canonicalize(
    const domp::schema::unsigned_event_t& event) {
  return canonicalize(event.author_key, event.created_at, event.kind,
                      event.tags, event.content);
}

domp::schema::hash32_t compute_id(const std::string_view& canonical) {
  return domp::crypto::sha256(canonical);
}

std::optional<domp::schema::event_id_t> compute_event_id(
    const domp::schema::unsigned_event_t& event) {
  auto canonical = canonicalize(event);
  if (!canonical) {
    return std::nullopt;
  }
  return compute_id(*canonical);
}

domp::schema::status_t verify(const domp::schema::event_t& event) {
  auto canonical = canonicalize(event.author_key, event.created_at, event.kind,
                                event.tags, event.content);
  if (!canonical) {
    return domp::schema::status_t::failure(
        domp::schema::error_code::malformed_event,
        "event strings are not valid UTF-8");
  }
  auto id = compute_id(*canonical);
  if (id != event.id) {
    return domp::schema::status_t::failure(
        domp::schema::error_code::id_mismatch,
        fmt::format("declared id {} but canonical form hashes to {}",
                    domp::schema::short_hex(event.id),
                    domp::schema::short_hex(id)));
  }
  if (!domp::crypto::verify_signature(
          domp::schema::bytes_view_t{event.id.data(), event.id.size()},
          event.author_key, event.signature)) {
    return domp::schema::status_t::failure(
        domp::schema::error_code::bad_signature,
        "signature does not verify against author key");
  }
  return domp::schema::status_t::success();
}

std::optional<domp::schema::event_t> sign_event(
    const domp::schema::unsigned_event_t& event,
    const domp::schema::secret_key_t& secret_key) {
  auto id = compute_event_id(event);
  if (!id) {
    return std::nullopt;
  }
  auto signature = domp::crypto::sign(
      domp::schema::bytes_view_t{id->data(), id->size()}, secret_key);
  if (!signature) {
    return std::nullopt;
  }
  return domp::schema::event_t{.id = *id,
                               .author_key = event.author_key,
                               .created_at = event.created_at,
                               .kind = event.kind,
                               .tags = event.tags,
                               .content = event.content,
                               .signature = *signature};
}

std::string to_json(const domp::schema::event_t& event) {
  auto object = json::object();
  object["id"] = domp::schema::to_hex(event.id);
  object["pubkey"] = domp::schema::to_hex(event.author_key);
  object["created_at"] = event.created_at;
  object["kind"] = event.kind;
  object["tags"] = tags_to_json(event.tags);
  object["content"] = event.content;
  object["sig"] = domp::schema::to_hex(event.signature);
  return object.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<domp::schema::event_t> try_from_json(const std::string_view& raw,
                                                   std::string& error) {
  auto object = json{};
  try {
    object = json::parse(raw);
  } catch (const json::parse_error& ex) {
    error = ex.what();
    return std::nullopt;
  }
  if (!object.is_object()) {
    error = "event must be a JSON object";
    return std::nullopt;
  }

  auto id = find_field(object, "id", error);
  auto pubkey = find_field(object, "pubkey", error);
  auto created_at = find_field(object, "created_at", error);
  auto kind = find_field(object, "kind", error);
  auto tags = find_field(object, "tags", error);
  auto content = find_field(object, "content", error);
  auto sig = find_field(object, "sig", error);
  if (!id || !pubkey || !created_at || !kind || !tags || !content || !sig) {
    return std::nullopt;
  }

  if (!id->is_string() || !pubkey->is_string() || !sig->is_string()) {
    error = "id, pubkey and sig must be hex strings";
    return std::nullopt;
  }
  if (!created_at->is_number_unsigned() || !kind->is_number_unsigned()) {
    error = "created_at and kind must be unsigned integers";
    return std::nullopt;
  }
  if (!content->is_string()) {
    error = "content must be a string";
    return std::nullopt;
  }

  auto decoded_id =
      domp::schema::try_make_hash32(id->get_ref<const std::string&>());
  auto decoded_pubkey = domp::schema::try_from_hex_array<32>(
      pubkey->get_ref<const std::string&>());
  auto decoded_sig =
      domp::schema::try_from_hex_array<64>(sig->get_ref<const std::string&>());
  if (!decoded_id || !decoded_pubkey || !decoded_sig) {
    error = "id and pubkey must be 64 hex chars, sig 128 hex chars";
    return std::nullopt;
  }

  auto raw_kind = kind->get<uint64_t>();
  if (raw_kind > UINT16_MAX) {
    error = "kind out of range";
    return std::nullopt;
  }

  auto decoded_tags = tags_from_json(*tags, error);
  if (!decoded_tags) {
    return std::nullopt;
  }

  return domp::schema::event_t{
      .id = *decoded_id,
      .author_key = *decoded_pubkey,
      .created_at = created_at->get<uint64_t>(),
      .kind = static_cast<uint16_t>(raw_kind),
      .tags = std::move(*decoded_tags),
      .content = content->get<std::string>(),
      .signature = *decoded_sig};
}

}  // namespace domp::codec
