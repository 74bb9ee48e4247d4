#include "dispatch/dispatcher.hpp"

#include <exception>
#include <iostream>
#include <utility>

#include "core/timestamp.hpp"
#include "model/topic.hpp"

namespace rack_guard::dispatch {

namespace {

std::string encode_value(const std::int32_t value) { return std::to_string(value); }

}  // namespace

Dispatcher::Dispatcher(transport::Transport& transport, DispatcherOptions options)
    : Dispatcher(transport, std::move(options), core::monotonic_timestamp_now_ns) {}

Dispatcher::Dispatcher(transport::Transport& transport, DispatcherOptions options, Clock clock)
    : transport_(transport), options_(std::move(options)), clock_(std::move(clock)) {
  if (options_.sweep_interval.count() <= 0) {
    options_.sweep_interval = std::chrono::milliseconds(500);
  }
}

Dispatcher::~Dispatcher() { stop_sweeper(); }

const DispatcherOptions& Dispatcher::options() const noexcept { return options_; }

IssueResult Dispatcher::issue(const std::string& rack_id, const model::Actuator actuator,
                              const std::int32_t desired_value, ResultSink sink) {
  IssueResult result{};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const Key key{rack_id, actuator};
    if (pending_.find(key) != pending_.end()) {
      ++stats_.rejected;
      result.error = IssueError::REJECTED;
      return result;
    }

    const std::uint64_t now = clock_();
    PendingCommand pending{};
    pending.handle = CommandHandle{next_sequence_++, rack_id, actuator};
    pending.desired_value = desired_value;
    pending.issued_at_ns = now;
    pending.deadline_ns = now + core::to_ns(options_.timeout);
    pending.sink = std::move(sink);

    result.handle = pending.handle;
    pending_.emplace(key, std::move(pending));
    ++stats_.issued;
  }

  // Published outside the lock: an ack may be delivered on this thread.
  const std::string topic = model::command_topic(options_.base_topic, rack_id, actuator);
  if (!transport_.publish(topic, encode_value(desired_value))) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.publish_failures;
    std::cerr << "[dispatch] publish failed for " << topic << "; command #" << result.handle->sequence
              << " will expire\n";
  }

  return result;
}

bool Dispatcher::on_ack_received(const std::string& rack_id, const model::Actuator actuator,
                                 const std::int32_t achieved_value) {
  std::vector<Resolution> resolutions;
  bool matched = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = pending_.find(Key{rack_id, actuator});
    if (it == pending_.end()) {
      ++stats_.unmatched_acks;
      std::cerr << "[dispatch] unmatched ack " << rack_id << '/' << model::actuator_name(actuator) << '='
                << achieved_value << " discarded\n";
      return false;
    }

    const std::uint64_t now = clock_();
    PendingCommand& pending = it->second;
    if (pending.deadline_ns <= now) {
      // Late ack: the command already timed out even if the sweep has not run.
      resolutions.push_back(expire(pending, now));
      ++stats_.expired;
      std::cerr << "[dispatch] late ack for command #" << pending.handle.sequence << " on " << rack_id << '/'
                << model::actuator_name(actuator) << " discarded\n";
    } else {
      apply_confirmed(ensure_rack_locked(rack_id, 0), actuator, achieved_value);

      CommandOutcome outcome{};
      outcome.handle = pending.handle;
      outcome.status = CommandStatus::ACKNOWLEDGED;
      outcome.desired_value = pending.desired_value;
      outcome.achieved_value = achieved_value;
      outcome.issued_at_ns = pending.issued_at_ns;
      outcome.resolved_at_ns = now;
      resolutions.emplace_back(std::move(pending.sink), outcome);
      ++stats_.acknowledged;
      matched = true;
    }
    pending_.erase(it);
  }

  deliver(resolutions);
  return matched;
}

std::size_t Dispatcher::sweep_expired(const std::uint64_t now_ns) {
  std::vector<Resolution> resolutions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = pending_.begin(); it != pending_.end();) {
      if (it->second.deadline_ns <= now_ns) {
        std::cerr << "[dispatch] command #" << it->second.handle.sequence << " " << it->first.first << '/'
                  << model::actuator_name(it->first.second) << '=' << it->second.desired_value << " expired\n";
        resolutions.push_back(expire(it->second, now_ns));
        ++stats_.expired;
        it = pending_.erase(it);
      } else {
        ++it;
      }
    }
  }

  deliver(resolutions);
  return resolutions.size();
}

Dispatcher::Resolution Dispatcher::expire(PendingCommand& pending, const std::uint64_t now_ns) {
  CommandOutcome outcome{};
  outcome.handle = pending.handle;
  outcome.status = CommandStatus::EXPIRED;
  outcome.desired_value = pending.desired_value;
  outcome.issued_at_ns = pending.issued_at_ns;
  outcome.resolved_at_ns = now_ns;
  return Resolution{std::move(pending.sink), outcome};
}

void Dispatcher::deliver(std::vector<Resolution>& resolutions) {
  for (auto& [sink, outcome] : resolutions) {
    if (!sink) {
      continue;
    }
    try {
      sink(outcome);
    } catch (const std::exception& ex) {
      std::cerr << "[dispatch] result sink for command #" << outcome.handle.sequence << " failed: " << ex.what()
                << '\n';
    } catch (...) {
      std::cerr << "[dispatch] result sink for command #" << outcome.handle.sequence
                << " failed with a non-standard exception\n";
    }
  }
}

void Dispatcher::apply_confirmed(model::Rack& rack, const model::Actuator actuator, const std::int32_t achieved_value) {
  switch (actuator) {
    case model::Actuator::DOOR:
      rack.door_open = achieved_value != 0;
      break;
    case model::Actuator::VENTILATION:
      rack.ventilation_on = achieved_value != 0;
      break;
    case model::Actuator::ALARM: {
      const auto alarm = model::alarm_from_value(achieved_value);
      if (!alarm.has_value()) {
        std::cerr << "[dispatch] rack " << rack.id << " acked unknown alarm value " << achieved_value << '\n';
        break;
      }
      rack.alarm = *alarm;
      break;
    }
  }
}

void Dispatcher::start_sweeper() {
  std::lock_guard<std::mutex> lock(sweeper_mutex_);
  if (sweeper_running_) {
    return;
  }
  sweeper_running_ = true;
  sweeper_ = std::thread([this]() { sweeper_loop(); });
}

void Dispatcher::stop_sweeper() {
  {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    if (!sweeper_running_) {
      return;
    }
    sweeper_running_ = false;
  }
  sweeper_cv_.notify_all();
  if (sweeper_.joinable()) {
    sweeper_.join();
  }
}

void Dispatcher::sweeper_loop() {
  std::unique_lock<std::mutex> lock(sweeper_mutex_);
  while (sweeper_running_) {
    sweeper_cv_.wait_for(lock, options_.sweep_interval, [this]() { return !sweeper_running_; });
    if (!sweeper_running_) {
      break;
    }
    lock.unlock();
    sweep_expired(clock_());
    lock.lock();
  }
}

model::Rack& Dispatcher::ensure_rack_locked(const std::string& rack_id, const std::uint64_t timestamp_ns) {
  auto [it, inserted] = racks_.try_emplace(rack_id);
  if (inserted) {
    it->second.id = rack_id;
    std::cerr << "[dispatch] tracking rack " << rack_id << '\n';
  }
  if (timestamp_ns > it->second.last_seen_ns) {
    it->second.last_seen_ns = timestamp_ns;
  }
  return it->second;
}

void Dispatcher::record_telemetry(const std::string& rack_id, const model::Metric metric, const float value,
                                  const std::uint64_t timestamp_ns) {
  std::lock_guard<std::mutex> lock(mutex_);
  model::Rack& rack = ensure_rack_locked(rack_id, timestamp_ns);
  switch (metric) {
    case model::Metric::TEMPERATURE:
      rack.temperature = value;
      break;
    case model::Metric::HUMIDITY:
      rack.humidity = value;
      break;
  }
}

void Dispatcher::record_door(const std::string& rack_id, const bool open, const std::uint64_t timestamp_ns) {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_rack_locked(rack_id, timestamp_ns).door_open = open;
}

void Dispatcher::record_tilt(const std::string& rack_id, const bool tilted, const std::uint64_t timestamp_ns) {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_rack_locked(rack_id, timestamp_ns).tilted = tilted;
}

void Dispatcher::record_presence(const std::string& rack_id, const bool online, const std::uint64_t timestamp_ns) {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_rack_locked(rack_id, timestamp_ns).online = online;
}

void Dispatcher::record_location(const std::string& rack_id, const double latitude, const double longitude,
                                 const std::uint64_t timestamp_ns) {
  std::lock_guard<std::mutex> lock(mutex_);
  model::Rack& rack = ensure_rack_locked(rack_id, timestamp_ns);
  rack.latitude = latitude;
  rack.longitude = longitude;
}

std::optional<model::Rack> Dispatcher::rack(const std::string& rack_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = racks_.find(rack_id);
  if (it == racks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<model::Rack> Dispatcher::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<model::Rack> racks;
  racks.reserve(racks_.size());
  for (const auto& entry : racks_) {
    racks.push_back(entry.second);
  }
  return racks;
}

bool Dispatcher::has_pending(const std::string& rack_id, const model::Actuator actuator) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.find(Key{rack_id, actuator}) != pending_.end();
}

std::size_t Dispatcher::pending_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

DispatcherStats Dispatcher::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

}  // namespace rack_guard::dispatch
