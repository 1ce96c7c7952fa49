#pragma once

#include <domp/schema/content.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace domp::codec {

/// Parse and schema-check the JSON content of an event of `kind`.
/// Unknown kinds and schema violations return nullopt with `error` set.
std::optional<domp::schema::content_t> try_parse_content(
    uint16_t kind,
    const std::string_view& content,
    std::string& error);

/// Compact JSON for a typed content payload. Optional fields that are unset
/// are omitted.
std::string serialize_content(const domp::schema::content_t& content);

/// Wire kind a content payload is carried in.
uint16_t kind_of(const domp::schema::content_t& content);

/// True when the invoice carries a recognised Lightning network prefix.
bool is_lightning_invoice(const std::string_view& invoice);

}  // namespace domp::codec
