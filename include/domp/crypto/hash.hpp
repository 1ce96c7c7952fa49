#pragma once

#include <domp/schema/primitives.hpp>

#include <string_view>

namespace domp::crypto {

domp::schema::hash32_t sha256(const domp::schema::bytes_view_t& bytes);
domp::schema::hash32_t sha256(const std::string_view& str);

/// Fill a buffer from the OpenSSL CSPRNG. Fatal if the generator fails.
void random_bytes(std::span<uint8_t> out);

template <std::size_t N>
std::array<uint8_t, N> random_array() {
  auto out = std::array<uint8_t, N>{};
  random_bytes(std::span<uint8_t>{out.data(), out.size()});
  return out;
}

}  // namespace domp::crypto
