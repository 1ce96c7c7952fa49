#pragma once

#include <domp/schema/primitives.hpp>

#include <optional>

namespace domp::crypto {

struct keypair_t final {
  domp::schema::secret_key_t secret_key{};
  domp::schema::public_key_t public_key{};
};

std::optional<keypair_t> generate_keypair();

/// Rebuild the public half from a raw 32-byte Ed25519 seed.
std::optional<keypair_t> keypair_from_secret(
    const domp::schema::secret_key_t& secret_key);

std::optional<domp::schema::signature_t> sign(
    const domp::schema::bytes_view_t& message,
    const domp::schema::secret_key_t& secret_key);

}  // namespace domp::crypto
