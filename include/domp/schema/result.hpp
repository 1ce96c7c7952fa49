#pragma once

#include <domp/schema/error_code.hpp>
#include <domp/schema/primitives.hpp>
#include <domp/schema/transaction_status.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace domp::schema {

/// Outcome of a single protocol operation.
struct status_t final {
  error_code code{error_code::ok};
  std::string log;

  bool ok() const { return code == error_code::ok; }
  error_category_t category() const { return category_of(code); }

  static status_t success() { return {}; }
  static status_t failure(const error_code code, std::string log) {
    return status_t{.code = code, .log = std::move(log)};
  }
};

template <uint16_t Version>
struct ingest_result;

/// Result of pushing one event through the ingestion pipeline.
template <>
struct ingest_result<1> final {
  uint16_t version{1};
  error_code code{error_code::ok};
  std::string log;
  std::string info;
  std::string codespace;
  event_id_t event_id{};
  bool duplicate{false};
  std::optional<hash32_t> transaction_id;
  std::optional<transaction_status_t> status;

  bool ok() const { return code == error_code::ok; }
  error_category_t category() const { return category_of(code); }
};

using ingest_result_t = ingest_result<1>;

}  // namespace domp::schema
