#pragma once

#include <domp/common/clock.hpp>
#include <domp/crypto/sign.hpp>
#include <domp/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace domp::testing {

inline constexpr auto kGenesis = domp::schema::timestamp_seconds_t{1'700'000'000};

inline domp::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = domp::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Deterministic Ed25519 keypair derived from a one-byte seed.
inline domp::crypto::keypair_t make_keys(const uint8_t seed) {
  auto keys = domp::crypto::keypair_from_secret(make_hash(seed));
  if (!keys) {
    throw std::runtime_error{"Ed25519 is unavailable"};
  }
  return *keys;
}

/// Clock that only moves when a test moves it. Copies share the time.
class manual_clock final {
 public:
  explicit manual_clock(const domp::schema::timestamp_seconds_t start = kGenesis)
      : now_{std::make_shared<std::atomic<uint64_t>>(start)} {}

  domp::common::clock_fn_t fn() const {
    return [now = now_] { return now->load(); };
  }

  domp::schema::timestamp_seconds_t now() const { return now_->load(); }
  void set(const domp::schema::timestamp_seconds_t value) { now_->store(value); }
  void advance(const domp::schema::duration_seconds_t seconds) {
    now_->fetch_add(seconds);
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_;
};

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace domp::testing
