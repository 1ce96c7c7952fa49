#pragma once
#include <domp/schema/primitives.hpp>
#include <optional>
#include <span>

namespace domp::schema::encoding {

// Build-time selection of the storage value codec. Each backend specializes
// this template with its own tag; callers hold an `encoder<Tag>` and never
// name the library directly.
template <typename Library>
struct encoder {
  template <typename T>
  domp::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, domp::schema::bytes_t& out);

  template <typename T>
  std::optional<T> try_decode(const domp::schema::bytes_view_t& bytes);
};

}  // namespace domp::schema::encoding
