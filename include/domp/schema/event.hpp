#pragma once
#include <domp/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace domp::schema {

template <uint16_t Version>
struct event;

/// Signed, content-addressed protocol event. Never mutated after signing.
template <>
struct event<1> final {
  event_id_t id{};
  public_key_t author_key{};
  timestamp_seconds_t created_at{};
  uint16_t kind{};
  tags_t tags;
  std::string content;
  signature_t signature{};
};

using event_t = event<1>;

/// Event fields before the id and signature exist.
struct unsigned_event_t final {
  public_key_t author_key{};
  timestamp_seconds_t created_at{};
  uint16_t kind{};
  tags_t tags;
  std::string content;
};

/// What the node remembers about an accepted event.
struct event_index_entry_t final {
  event_id_t id{};
  public_key_t author_key{};
  uint16_t kind{};
  timestamp_seconds_t created_at{};
  std::optional<hash32_t> transaction_id;
};

inline constexpr auto kAntiSpamProofTag = std::string_view{"anti_spam_proof"};
inline constexpr auto kReferenceTag = std::string_view{"ref"};

/// First tag whose leading element equals `name`.
inline const tag_t* find_tag(const tags_t& tags, const std::string_view name) {
  for (const auto& tag : tags) {
    if (!tag.empty() && tag.front() == name) {
      return &tag;
    }
  }
  return nullptr;
}

}  // namespace domp::schema
