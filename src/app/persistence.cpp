#include <healthcam/app/persistence.hpp>
#include <healthcam/core/error.hpp>
#include <spdlog/spdlog.h>
#include <thread>

namespace healthcam::app {

namespace hc = healthcam::core;

void PersistenceQueue::enqueue(hc::SessionResult record) { queue_.push(std::move(record)); }

std::size_t PersistenceQueue::drain_into(std::vector<hc::SessionResult>& out) {
  std::size_t n = 0;
  hc::SessionResult record;
  while (queue_.try_pop(record)) {
    out.push_back(std::move(record));
    ++n;
  }
  return n;
}

Flusher::Flusher(PersistenceQueue& queue, healthcam::storage::IStorageBackend& backend,
                 FlushPolicy policy, Clock::time_point start)
    : queue_(queue), backend_(backend), policy_(std::move(policy)), last_attempt_(start) {}

FlushOutcome Flusher::tick(Clock::time_point now) {
  queue_.drain_into(accumulator_);
  if (accumulator_.empty()) return FlushOutcome::Idle;
  if (now - last_attempt_ < policy_.interval) return FlushOutcome::Waiting;
  last_attempt_ = now;
  return save();
}

FlushOutcome Flusher::flush_now() {
  queue_.drain_into(accumulator_);
  if (accumulator_.empty()) return FlushOutcome::Idle;
  last_attempt_ = Clock::now();
  return save();
}

void Flusher::run(const std::atomic<bool>& running, std::chrono::milliseconds poll) {
  while (running.load()) {
    tick(Clock::now());
    std::this_thread::sleep_for(poll);
  }
  if (flush_now() == FlushOutcome::Failed) {
    spdlog::error("Final flush failed; {} records were not persisted", accumulator_.size());
  }
}

FlushOutcome Flusher::save() {
  const auto base = next_base_path();
  auto saved = backend_.save(accumulator_, base, policy_.format);
  if (!saved) {
    ++failed_attempts_;
    spdlog::warn("Flush to {} failed ({}); keeping {} records for the next attempt",
                 base.string(), hc::error_name(saved.error()), accumulator_.size());
    return FlushOutcome::Failed;
  }
  spdlog::info("Saved {} records to {}", accumulator_.size(), saved->string());
  saved_records_ += accumulator_.size();
  last_path_ = *saved;
  accumulator_.clear();
  return FlushOutcome::Saved;
}

std::filesystem::path Flusher::next_base_path() {
  return namer_.next(policy_.output_dir, policy_.file_prefix, hc::make_timestamp());
}

std::filesystem::path StampedNamer::next(const std::filesystem::path& dir,
                                         std::string_view prefix, const std::string& stamp) {
  std::string name(prefix);
  name += stamp;
  if (stamp == last_stamp_) {
    name += "_" + std::to_string(++repeats_);
  } else {
    last_stamp_ = stamp;
    repeats_ = 0;
  }
  return dir / name;
}

}  // namespace healthcam::app
