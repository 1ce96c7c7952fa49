#pragma once

#include <domp/schema/event.hpp>
#include <domp/schema/primitives.hpp>

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace domp::antispam {

/// Event whose pow proof tag satisfies the requested difficulty.
struct mined_event_t final {
  domp::schema::unsigned_event_t event;
  domp::schema::event_id_t id{};
  uint64_t nonce{};
  uint64_t attempts{};
};

/// Polled between nonce batches; true abandons the search.
using cancel_fn_t = std::function<bool()>;

/// Search nonces from `start_nonce` until the event id has `difficulty`
/// leading zero bits. Any existing proof tag is replaced by the pow tag.
/// Returns nullopt when cancelled or when the event cannot be canonicalized.
std::optional<mined_event_t> mine(const domp::schema::unsigned_event_t& event,
                                  uint32_t difficulty,
                                  const cancel_fn_t& cancelled,
                                  uint64_t start_nonce = 0);

/// Background proof-of-work pool.
///
/// Jobs are queued and picked up by a fixed set of worker threads. Every job
/// carries its own stop source so a caller can abandon one search without
/// touching the others; destroying the pool cancels everything still queued
/// or running, and their futures resolve to nullopt.
class pow_miner final {
 public:
  struct job_t final {
    std::future<std::optional<mined_event_t>> result;
    std::stop_source stop;

    void cancel() { stop.request_stop(); }
  };

  explicit pow_miner(std::size_t workers = 1);
  ~pow_miner();

  pow_miner(const pow_miner&) = delete;
  pow_miner& operator=(const pow_miner&) = delete;

  job_t submit(domp::schema::unsigned_event_t event, uint32_t difficulty);

  /// Cancel all jobs and join the workers. Idempotent.
  void shutdown();

  std::size_t queued() const;

 private:
  struct task_t final {
    domp::schema::unsigned_event_t event;
    uint32_t difficulty{};
    std::stop_source stop;
    std::promise<std::optional<mined_event_t>> promise;
  };

  void run(std::stop_token worker_stop);

  mutable std::mutex mutex_;
  std::condition_variable_any work_;
  std::deque<task_t> queue_;
  std::vector<std::stop_source> running_;
  bool stopped_{false};
  std::vector<std::jthread> workers_;
};

}  // namespace domp::antispam
