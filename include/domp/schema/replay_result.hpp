#pragma once

#include <domp/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Rebuild of derived state from the persisted event log, checked against the
// last committed digest.
namespace domp::schema {

template <uint16_t Version>
struct replay_result;

template <>
struct replay_result<1> final {
  uint16_t version{1};
  bool ok{};
  uint64_t event_count{};
  uint64_t applied_count{};
  hash32_t state_digest{};
  std::optional<hash32_t> committed_digest;
  std::string error;
};

using replay_result_t = replay_result<1>;

}  // namespace domp::schema
