#include <spdlog/spdlog.h>
#include <algorithm>
#include <domp/codec/event_codec.hpp>
#include <domp/network/relay.hpp>
#include <spdlog/fmt/fmt.h>
#include <utility>

using namespace domp::schema;

namespace domp::network {

namespace {

class jsonl_stream final : public event_stream {
 public:
  jsonl_stream(std::string path, filter_t filter)
      : path_(std::move(path)), filter_(std::move(filter)) {}

  std::optional<event_t> next() override {
    if (filter_.limit && emitted_ >= *filter_.limit) {
      return std::nullopt;
    }
    if (!input_.is_open()) {
      if (exhausted_) {
        return std::nullopt;
      }
      input_.open(path_);
      if (!input_.is_open()) {
        exhausted_ = true;
        spdlog::warn("relay log '{}' cannot be opened", path_);
        return std::nullopt;
      }
    }

    auto line = std::string{};
    while (std::getline(input_, line)) {
      ++line_number_;
      if (line.empty()) {
        continue;
      }
      auto error = std::string{};
      auto event = domp::codec::try_from_json(line, error);
      if (!event) {
        spdlog::warn("{}:{}: skipping unparsable event: {}", path_,
                     line_number_, error);
        continue;
      }
      if (!filter_.matches(*event)) {
        continue;
      }
      ++emitted_;
      return event;
    }
    input_.close();
    exhausted_ = true;
    return std::nullopt;
  }

  void restart() override {
    if (input_.is_open()) {
      input_.close();
    }
    input_.clear();
    exhausted_ = false;
    emitted_ = 0;
    line_number_ = 0;
  }

 private:
  std::string path_;
  filter_t filter_;
  std::ifstream input_;
  bool exhausted_{false};
  std::size_t emitted_{0};
  std::size_t line_number_{0};
};

}  // namespace

bool filter_t::matches(const event_t& event) const {
  if (!kinds.empty() &&
      std::find(kinds.begin(), kinds.end(), event.kind) == kinds.end()) {
    return false;
  }
  if (!authors.empty() && std::find(authors.begin(), authors.end(),
                                    event.author_key) == authors.end()) {
    return false;
  }
  return !since || event.created_at >= *since;
}

jsonl_relay::jsonl_relay(std::string path) : path_(std::move(path)) {}

status_t jsonl_relay::publish(const event_t& event) {
  auto verified = domp::codec::verify(event);
  if (!verified.ok()) {
    return verified;
  }
  auto lock = std::scoped_lock{mutex_};
  auto output = std::ofstream{path_, std::ios::app};
  if (!output) {
    return status_t::failure(error_code::malformed_event,
                             fmt::format("relay log '{}' is not writable",
                                         path_));
  }
  output << domp::codec::to_json(event) << '\n';
  output.flush();
  if (!output) {
    return status_t::failure(error_code::malformed_event,
                             fmt::format("write to relay log '{}' failed",
                                         path_));
  }
  spdlog::debug("published {} to {}", short_hex(event.id), path_);
  return status_t::success();
}

std::unique_ptr<event_stream> jsonl_relay::subscribe(filter_t filter) {
  return std::make_unique<jsonl_stream>(path_, std::move(filter));
}

std::vector<event_t> collect(event_stream& stream) {
  auto events = std::vector<event_t>{};
  while (auto event = stream.next()) {
    events.push_back(std::move(*event));
  }
  return events;
}

}  // namespace domp::network
