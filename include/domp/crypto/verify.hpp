#pragma once

#include <domp/schema/primitives.hpp>

namespace domp::crypto {

/// True when the linked OpenSSL provides Ed25519.
bool available();

bool verify_signature(const domp::schema::bytes_view_t& message,
                      const domp::schema::public_key_t& author,
                      const domp::schema::signature_t& signature);

}  // namespace domp::crypto
