#pragma once
#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace domp::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using event_id_t = hash32_t;
using public_key_t = std::array<uint8_t, 32>;
using secret_key_t = std::array<uint8_t, 32>;
using signature_t = std::array<uint8_t, 64>;
using preimage_t = std::array<uint8_t, 32>;
using amount_sats_t = uint64_t;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;
using tag_t = std::vector<std::string>;
using tags_t = std::vector<tag_t>;

inline constexpr auto kSatsPerBtc = amount_sats_t{100'000'000};

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Decode exactly N bytes of lowercase or uppercase hex, without `0x`.
template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_from_hex_array(
    const std::string_view hex) {
  if (hex.size() != N * 2) {
    return std::nullopt;
  }
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(decoded->begin(), decoded->end(), out.begin());
  return out;
}

template <std::size_t N>
std::string to_hex(const std::array<uint8_t, N>& bytes) {
  return to_hex(bytes_view_t{bytes.data(), bytes.size()});
}

std::optional<hash32_t> try_make_hash32(std::string_view hex);
hash32_t make_zero_hash();

/// Short printable prefix of a hash, for logs.
std::string short_hex(const hash32_t& hash);

/// Parse an unsigned decimal string; rejects signs, blanks and overflow.
std::optional<uint64_t> try_parse_u64(std::string_view value);

}  // namespace domp::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
