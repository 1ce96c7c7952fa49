#pragma once
#include <blake3.h>
#include <domp/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace domp::blake3 {

domp::schema::hash32_t hash(const std::string_view& str);
domp::schema::hash32_t hash(const domp::schema::bytes_view_t& bytes);

/// Incremental hasher for folding many records into one digest.
class hasher final {
 public:
  hasher();

  void update(const domp::schema::bytes_view_t& bytes);
  void update(const std::string_view& str);
  domp::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

}  // namespace domp::blake3
