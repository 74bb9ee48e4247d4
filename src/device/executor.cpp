#include "device/executor.hpp"

#include <iostream>
#include <string_view>
#include <utility>

#include "core/timestamp.hpp"
#include "model/topic.hpp"

namespace rack_guard::device {

CommandExecutor::CommandExecutor(transport::Transport& transport, std::unique_ptr<ActuatorDriver> driver,
                                 ExecutorOptions options)
    : transport_(transport),
      driver_(std::move(driver)),
      options_(std::move(options)),
      command_prefix_(options_.base_topic + "/" + options_.rack_id + "/command/"),
      ring_(options_.queue_capacity) {}

CommandExecutor::~CommandExecutor() { stop(); }

bool CommandExecutor::attach() {
  return transport_.subscribe(command_prefix_ + "+", [this](const std::string& topic, const std::string& payload) {
    on_command(topic, payload);
  });
}

void CommandExecutor::start() {
  if (running_) {
    return;
  }
  running_ = true;
  worker_ = std::thread([this]() { worker_loop(); });
}

void CommandExecutor::stop() {
  ring_.close();
  if (worker_.joinable()) {
    worker_.join();
  }
  running_ = false;
}

void CommandExecutor::on_command(const std::string& topic, const std::string& payload) noexcept {
  const std::string_view view(topic);
  if (view.size() <= command_prefix_.size() || view.compare(0, command_prefix_.size(), command_prefix_) != 0) {
    malformed_.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  const auto actuator = model::parse_actuator(view.substr(command_prefix_.size()));
  const auto value = model::parse_int_payload(payload);
  if (!actuator.has_value() || !value.has_value()) {
    malformed_.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  if (!ring_.try_push(DeviceCommand{*actuator, *value, core::monotonic_timestamp_now_ns()})) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
  }
}

bool CommandExecutor::process_one() {
  DeviceCommand command{};
  const bool got = ring_.wait_pop(command);
  report_losses();
  if (!got) {
    return false;
  }
  apply(command);
  return true;
}

void CommandExecutor::worker_loop() {
  while (process_one()) {
  }
}

void CommandExecutor::apply(const DeviceCommand& command) {
  const std::int32_t before = driver_->current(command.actuator);
  const std::int32_t achieved = driver_->apply(command.actuator, command.value);
  applied_.fetch_add(1, std::memory_order_relaxed);

  if (before == achieved) {
    std::cerr << "[device] " << options_.rack_id << ' ' << model::actuator_name(command.actuator)
              << " already at " << achieved << "; re-acknowledging\n";
  }

  const std::string topic = model::ack_topic(options_.base_topic, options_.rack_id, command.actuator);
  if (transport_.publish(topic, std::to_string(achieved))) {
    acks_published_.fetch_add(1, std::memory_order_relaxed);
  } else {
    ack_failures_.fetch_add(1, std::memory_order_relaxed);
    std::cerr << "[device] " << options_.rack_id << " failed to publish ack on " << topic << '\n';
  }
}

void CommandExecutor::report_losses() {
  const std::size_t dropped = dropped_.load(std::memory_order_relaxed);
  if (dropped != dropped_reported_) {
    std::cerr << "[device] " << options_.rack_id << " command queue full (capacity " << ring_.capacity()
              << "); dropped " << (dropped - dropped_reported_) << " command(s)\n";
    dropped_reported_ = dropped;
  }

  const std::size_t malformed = malformed_.load(std::memory_order_relaxed);
  if (malformed != malformed_reported_) {
    std::cerr << "[device] " << options_.rack_id << " ignored " << (malformed - malformed_reported_)
              << " malformed command(s)\n";
    malformed_reported_ = malformed;
  }
}

ExecutorStats CommandExecutor::stats() const noexcept {
  ExecutorStats stats{};
  stats.applied = applied_.load(std::memory_order_relaxed);
  stats.acks_published = acks_published_.load(std::memory_order_relaxed);
  stats.ack_failures = ack_failures_.load(std::memory_order_relaxed);
  stats.dropped = dropped_.load(std::memory_order_relaxed);
  stats.malformed = malformed_.load(std::memory_order_relaxed);
  return stats;
}

const std::string& CommandExecutor::rack_id() const noexcept { return options_.rack_id; }

std::int32_t CommandExecutor::current(const model::Actuator actuator) const { return driver_->current(actuator); }

}  // namespace rack_guard::device
