#include <domp/antispam/pow_miner.hpp>
#include <domp/antispam/validator.hpp>
#include <domp/codec/event_codec.hpp>
#include <domp/schema/anti_spam_proof.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

using namespace domp::schema;

namespace domp::antispam {

namespace {

inline constexpr auto kCancelCheckInterval = uint64_t{256};
inline constexpr auto kMaxDifficulty = uint32_t{256};

}  // namespace

std::optional<mined_event_t> mine(const unsigned_event_t& event,
                                  const uint32_t difficulty,
                                  const cancel_fn_t& cancelled,
                                  const uint64_t start_nonce) {
  if (difficulty > kMaxDifficulty) {
    return std::nullopt;
  }
  auto candidate = event;
  std::erase_if(candidate.tags, [](const tag_t& tag) {
    return !tag.empty() && tag.front() == kAntiSpamProofTag;
  });
  candidate.tags.emplace_back();
  const auto proof_index = candidate.tags.size() - 1;

  auto attempts = uint64_t{0};
  for (auto nonce = start_nonce;; ++nonce) {
    if (attempts % kCancelCheckInterval == 0 && cancelled && cancelled()) {
      spdlog::debug("pow search cancelled after {} attempts", attempts);
      return std::nullopt;
    }
    candidate.tags[proof_index] = make_proof_tag(
        pow_proof_t{.nonce = nonce, .difficulty = difficulty});
    auto canonical = domp::codec::canonicalize(candidate);
    if (!canonical) {
      return std::nullopt;
    }
    auto id = domp::codec::compute_id(*canonical);
    ++attempts;
    if (leading_zero_bits(id) >= difficulty) {
      return mined_event_t{.event = std::move(candidate),
                           .id = id,
                           .nonce = nonce,
                           .attempts = attempts};
    }
  }
}

pow_miner::pow_miner(const std::size_t workers) {
  auto count = std::max<std::size_t>(1, workers);
  workers_.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    workers_.emplace_back([this](std::stop_token stop) { run(stop); });
  }
}

pow_miner::~pow_miner() { shutdown(); }

pow_miner::job_t pow_miner::submit(unsigned_event_t event,
                                   const uint32_t difficulty) {
  auto task = task_t{.event = std::move(event), .difficulty = difficulty};
  auto job = job_t{.result = task.promise.get_future(), .stop = task.stop};
  {
    auto lock = std::scoped_lock{mutex_};
    if (!stopped_) {
      queue_.push_back(std::move(task));
      work_.notify_one();
      return job;
    }
  }
  task.promise.set_value(std::nullopt);
  return job;
}

void pow_miner::run(std::stop_token worker_stop) {
  while (true) {
    auto task = task_t{};
    {
      auto lock = std::unique_lock{mutex_};
      if (!work_.wait(lock, worker_stop, [&] { return !queue_.empty(); })) {
        return;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
      running_.push_back(task.stop);
    }

    auto job_stop = task.stop.get_token();
    auto mined = mine(task.event, task.difficulty, [&] {
      return job_stop.stop_requested() || worker_stop.stop_requested();
    });

    {
      auto lock = std::scoped_lock{mutex_};
      std::erase(running_, task.stop);
    }
    task.promise.set_value(std::move(mined));
  }
}

void pow_miner::shutdown() {
  {
    auto lock = std::scoped_lock{mutex_};
    if (stopped_) {
      return;
    }
    stopped_ = true;
    for (auto& stop : running_) {
      stop.request_stop();
    }
  }
  // jthread requests stop and joins on destruction.
  workers_.clear();

  auto lock = std::scoped_lock{mutex_};
  for (auto& task : queue_) {
    task.promise.set_value(std::nullopt);
  }
  queue_.clear();
}

std::size_t pow_miner::queued() const {
  auto lock = std::scoped_lock{mutex_};
  return queue_.size();
}

}  // namespace domp::antispam
