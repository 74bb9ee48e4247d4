#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "device/actuator_driver.hpp"
#include "device/command_ring.hpp"
#include "device/executor.hpp"
#include "sim/environment.hpp"
#include "transport/transport.hpp"

using rack_guard::device::CommandExecutor;
using rack_guard::device::CommandRing;
using rack_guard::device::DeviceCommand;
using rack_guard::device::ExecutorOptions;
using rack_guard::device::make_simulated_driver;
using rack_guard::model::Actuator;
using rack_guard::sim::EnvironmentModel;
using rack_guard::sim::EnvironmentOptions;

namespace {

struct AckLog {
  std::mutex mutex;
  std::vector<std::pair<std::string, std::string>> acks;

  void add(const std::string& topic, const std::string& payload) {
    std::lock_guard<std::mutex> lock(mutex);
    acks.emplace_back(topic, payload);
  }

  std::size_t size() {
    std::lock_guard<std::mutex> lock(mutex);
    return acks.size();
  }
};

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

ExecutorOptions executor_options(const std::size_t capacity) {
  ExecutorOptions options{};
  options.rack_id = "R1";
  options.queue_capacity = capacity;
  return options;
}

int test_command_ring_bounds_and_order() {
  CommandRing<DeviceCommand> ring(5);
  if (ring.capacity() != 8) {
    return fail("test_command_ring_bounds_and_order", "capacity should round up to a power of two");
  }

  for (int i = 0; i < 8; ++i) {
    if (!ring.try_push(DeviceCommand{Actuator::DOOR, i, 0})) {
      return fail("test_command_ring_bounds_and_order", "push below capacity should succeed");
    }
  }
  if (ring.try_push(DeviceCommand{Actuator::DOOR, 99, 0}) || ring.size() != 8) {
    return fail("test_command_ring_bounds_and_order", "push on a full ring should fail");
  }

  DeviceCommand out{};
  for (int i = 0; i < 8; ++i) {
    if (!ring.try_pop(out) || out.value != i) {
      return fail("test_command_ring_bounds_and_order", "records should come out in order");
    }
  }
  if (ring.try_pop(out)) {
    return fail("test_command_ring_bounds_and_order", "empty ring should not pop");
  }

  ring.try_push(DeviceCommand{Actuator::VENTILATION, 1, 0});
  ring.close();
  if (!ring.wait_pop(out) || out.actuator != Actuator::VENTILATION || ring.wait_pop(out)) {
    return fail("test_command_ring_bounds_and_order", "closed ring should drain then stop");
  }
  if (ring.try_push(DeviceCommand{Actuator::DOOR, 1, 0})) {
    return fail("test_command_ring_bounds_and_order", "closed ring should refuse pushes");
  }

  return 0;
}

int test_command_ring_wakes_blocked_consumer() {
  CommandRing<DeviceCommand> ring(4);
  std::atomic<int> received{-1};
  std::thread consumer([&]() {
    DeviceCommand out{};
    if (ring.wait_pop(out)) {
      received.store(out.value);
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  ring.try_push(DeviceCommand{Actuator::ALARM, 2, 0});
  consumer.join();

  if (received.load() != 2) {
    return fail("test_command_ring_wakes_blocked_consumer", "blocked consumer should receive the record");
  }

  return 0;
}

int test_executor_overflow_drops_newest() {
  auto transport = rack_guard::transport::make_loopback_transport();
  CommandExecutor executor(*transport, make_simulated_driver("R1"), executor_options(2));
  AckLog log;
  executor.attach();
  transport->subscribe("racks/R1/ack/+", [&log](const std::string& topic, const std::string& payload) {
    log.add(topic, payload);
  });
  transport->start();

  transport->publish("racks/R1/command/door", "1");
  transport->publish("racks/R1/command/ventilation", "1");
  transport->publish("racks/R1/command/buzzer", "3");
  transport->publish("racks/R1/command/buzzer", "1");

  if (executor.stats().dropped != 2) {
    return fail("test_executor_overflow_drops_newest", "commands past capacity should be dropped");
  }

  executor.process_one();
  executor.process_one();
  if (log.size() != 2 || log.acks[0].first != "racks/R1/ack/door" || log.acks[1].first != "racks/R1/ack/ventilation") {
    return fail("test_executor_overflow_drops_newest", "oldest commands should be kept and acked");
  }
  if (executor.current(Actuator::ALARM) != 0) {
    return fail("test_executor_overflow_drops_newest", "dropped commands must not be applied");
  }

  return 0;
}

int test_executor_clamps_and_reacks() {
  auto transport = rack_guard::transport::make_loopback_transport();
  CommandExecutor executor(*transport, make_simulated_driver("R1"), executor_options(8));
  AckLog log;
  executor.attach();
  transport->subscribe("racks/R1/ack/+", [&log](const std::string& topic, const std::string& payload) {
    log.add(topic, payload);
  });
  transport->start();

  transport->publish("racks/R1/command/buzzer", "7");
  transport->publish("racks/R1/command/ventilation", "5");
  transport->publish("racks/R1/command/ventilation", "1");
  for (int i = 0; i < 3; ++i) {
    executor.process_one();
  }

  if (log.size() != 3 || log.acks[0].second != "3" || log.acks[1].second != "1" || log.acks[2].second != "1") {
    return fail("test_executor_clamps_and_reacks", "achieved values should be clamped and re-acked");
  }
  const auto stats = executor.stats();
  if (stats.applied != 3 || stats.acks_published != 3 || executor.current(Actuator::VENTILATION) != 1) {
    return fail("test_executor_clamps_and_reacks", "stats or state mismatch");
  }

  return 0;
}

int test_executor_ignores_malformed_commands() {
  auto transport = rack_guard::transport::make_loopback_transport();
  CommandExecutor executor(*transport, make_simulated_driver("R1"), executor_options(8));
  executor.attach();
  transport->start();

  transport->publish("racks/R1/command/sprinkler", "1");
  transport->publish("racks/R1/command/door", "open");
  transport->publish("racks/R2/command/door", "1");
  executor.on_command("racks/R2/command/door", "1");

  const auto stats = executor.stats();
  if (stats.malformed != 3 || stats.dropped != 0) {
    return fail("test_executor_ignores_malformed_commands", "malformed commands should be counted and skipped");
  }

  return 0;
}

int test_executor_worker_thread() {
  auto transport = rack_guard::transport::make_loopback_transport();
  CommandExecutor executor(*transport, make_simulated_driver("R1"), executor_options(8));
  AckLog log;
  executor.attach();
  transport->subscribe("racks/R1/ack/+", [&log](const std::string& topic, const std::string& payload) {
    log.add(topic, payload);
  });
  transport->start();
  executor.start();

  transport->publish("racks/R1/command/door", "1");
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (log.size() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  executor.stop();

  if (log.size() != 1 || executor.current(Actuator::DOOR) != 1) {
    return fail("test_executor_worker_thread", "worker should apply and ack the command");
  }

  return 0;
}

int test_environment_model_follows_actuators() {
  EnvironmentOptions options{};
  options.anomaly_probability = 0.0;
  EnvironmentModel model(options, 42U, 0.0);

  for (int i = 0; i < 200; ++i) {
    const auto ventilated = model.next_temperature(static_cast<double>(i), false, true);
    if (ventilated.anomaly || ventilated.value < 20.0F || ventilated.value > 32.0F) {
      return fail("test_environment_model_follows_actuators", "ventilated temperature out of band");
    }
    const auto humidity = model.next_humidity(static_cast<double>(i), true, false);
    if (humidity.value < 35.0F || humidity.value > 65.0F) {
      return fail("test_environment_model_follows_actuators", "open door humidity out of band");
    }
  }

  if (rack_guard::sim::log_envelope(0.0) != 0.0 || rack_guard::sim::log_envelope(1.0) != 0.0 ||
      std::fabs(rack_guard::sim::log_envelope(0.5) - 1.0) > 1e-9) {
    return fail("test_environment_model_follows_actuators", "anomaly envelope should peak mid-way");
  }

  return 0;
}

int test_environment_door_schedule() {
  EnvironmentOptions options{};
  options.door_interval_min_s = 10.0;
  options.door_interval_max_s = 10.0;
  options.door_open_min_s = 5.0;
  options.door_open_max_s = 5.0;
  EnvironmentModel model(options, 7U, 0.0);

  if (model.poll_door_schedule(9.0).has_value()) {
    return fail("test_environment_door_schedule", "door should stay closed before the interval");
  }
  const auto opened = model.poll_door_schedule(10.0);
  if (!opened.has_value() || !*opened || !model.door_held_open()) {
    return fail("test_environment_door_schedule", "door should open on schedule");
  }
  const auto closed = model.poll_door_schedule(15.0);
  if (!closed.has_value() || *closed || model.door_held_open()) {
    return fail("test_environment_door_schedule", "door should close after the open duration");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_command_ring_bounds_and_order(); rc != 0) return rc;
  if (int rc = test_command_ring_wakes_blocked_consumer(); rc != 0) return rc;
  if (int rc = test_executor_overflow_drops_newest(); rc != 0) return rc;
  if (int rc = test_executor_clamps_and_reacks(); rc != 0) return rc;
  if (int rc = test_executor_ignores_malformed_commands(); rc != 0) return rc;
  if (int rc = test_executor_worker_thread(); rc != 0) return rc;
  if (int rc = test_environment_model_follows_actuators(); rc != 0) return rc;
  if (int rc = test_environment_door_schedule(); rc != 0) return rc;

  std::cout << "[PASS] device unit tests\n";
  return 0;
}
