#pragma once

#include <domp/schema/event.hpp>
#include <domp/schema/primitives.hpp>
#include <domp/schema/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace domp::codec {

/// Canonical NIP-01 serialization:
/// `[0,"<author hex>",created_at,kind,tags,"content"]`, compact, UTF-8
/// emitted unescaped. Empty when a string is not valid UTF-8.
std::optional<std::string> canonicalize(
    const domp::schema::public_key_t& author_key,
    domp::schema::timestamp_seconds_t created_at,
    uint16_t kind,
    const domp::schema::tags_t& tags,
    const std::string& content);

std::optional<std::string> canonicalize(
    const domp::schema::unsigned_event_t& event);

domp::schema::hash32_t compute_id(const std::string_view& canonical);

std::optional<domp::schema::event_id_t> compute_event_id(
    const domp::schema::unsigned_event_t& event);

/// Recompute the id and check the signature over it.
domp::schema::status_t verify(const domp::schema::event_t& event);

/// Assign the id and sign it. Fails only on bad keys or invalid UTF-8.
std::optional<domp::schema::event_t> sign_event(
    const domp::schema::unsigned_event_t& event,
    const domp::schema::secret_key_t& secret_key);

/// Wire form `{"id","pubkey","created_at","kind","tags","content","sig"}`.
std::string to_json(const domp::schema::event_t& event);

/// Strict wire parse. Field types and hex lengths are checked; the id and
/// signature are not verified here.
std::optional<domp::schema::event_t> try_from_json(const std::string_view& raw,
                                                   std::string& error);

}  // namespace domp::codec
