#pragma once

#include <domp/schema/event.hpp>
#include <domp/schema/primitives.hpp>
#include <domp/schema/result.hpp>

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace domp::network {

/// Relay subscription filter. Empty lists match everything.
struct filter_t final {
  std::vector<uint16_t> kinds;
  std::vector<domp::schema::public_key_t> authors;
  std::optional<domp::schema::timestamp_seconds_t> since;
  std::optional<std::size_t> limit;

  bool matches(const domp::schema::event_t& event) const;
};

/// Lazy sequence of events matching a filter. restart() rewinds to the
/// first match so the same subscription can be read again.
class event_stream {
 public:
  virtual ~event_stream() = default;

  virtual std::optional<domp::schema::event_t> next() = 0;
  virtual void restart() = 0;
};

/// Broadcast collaborator events are published to and read back from.
class relay {
 public:
  virtual ~relay() = default;

  virtual domp::schema::status_t publish(
      const domp::schema::event_t& event) = 0;

  virtual std::unique_ptr<event_stream> subscribe(filter_t filter) = 0;
};

/// Relay backed by a file holding one wire event per line.
///
/// publish() verifies the event and appends it; subscribe() re-reads the
/// file lazily, skipping lines that do not parse.
class jsonl_relay final : public relay {
 public:
  explicit jsonl_relay(std::string path);

  domp::schema::status_t publish(const domp::schema::event_t& event) override;

  std::unique_ptr<event_stream> subscribe(filter_t filter) override;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
  std::mutex mutex_;
};

/// Drain a stream into a vector.
std::vector<domp::schema::event_t> collect(event_stream& stream);

}  // namespace domp::network
