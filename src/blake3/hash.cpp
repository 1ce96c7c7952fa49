#include <blake3.h>
#include <domp/blake3/hash.hpp>

namespace domp::blake3 {

domp::schema::hash32_t hash(const std::string_view& str) {
  auto state = hasher{};
  state.update(str);
  return state.finalize();
}

domp::schema::hash32_t hash(const domp::schema::bytes_view_t& bytes) {
  auto state = hasher{};
  state.update(bytes);
  return state.finalize();
}

hasher::hasher() { blake3_hasher_init(&state_); }

void hasher::update(const domp::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
}

void hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
}

domp::schema::hash32_t hasher::finalize() const {
  // BLAKE3_OUT_LEN
  auto output = domp::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

}  // namespace domp::blake3
