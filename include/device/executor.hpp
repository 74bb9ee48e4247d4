#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "device/actuator_driver.hpp"
#include "device/command_ring.hpp"
#include "model/rack.hpp"
#include "transport/transport.hpp"

namespace rack_guard::device {

struct DeviceCommand {
  model::Actuator actuator;
  std::int32_t value;
  std::uint64_t received_ns;
};

struct ExecutorOptions {
  std::string base_topic{"racks"};
  std::string rack_id{};
  std::size_t queue_capacity{32};
};

struct ExecutorStats {
  std::size_t applied{0};
  std::size_t acks_published{0};
  std::size_t ack_failures{0};
  std::size_t dropped{0};
  std::size_t malformed{0};
};

// Device-resident command handler for one rack. on_command runs in the
// transport's delivery context and only enqueues; the worker thread is
// the only caller of the actuator driver.
class CommandExecutor {
 public:
  CommandExecutor(transport::Transport& transport, std::unique_ptr<ActuatorDriver> driver, ExecutorOptions options);
  ~CommandExecutor();

  CommandExecutor(const CommandExecutor&) = delete;
  CommandExecutor& operator=(const CommandExecutor&) = delete;
  CommandExecutor(CommandExecutor&&) = delete;
  CommandExecutor& operator=(CommandExecutor&&) = delete;

  // Registers the command subscription; call before the transport starts.
  bool attach();
  void start();
  void stop();

  void on_command(const std::string& topic, const std::string& payload) noexcept;

  // Blocks for one record and applies it; false once stopped and drained.
  bool process_one();

  [[nodiscard]] ExecutorStats stats() const noexcept;
  [[nodiscard]] const std::string& rack_id() const noexcept;
  [[nodiscard]] std::int32_t current(model::Actuator actuator) const;

 private:
  void worker_loop();
  void apply(const DeviceCommand& command);
  void report_losses();

  transport::Transport& transport_;
  std::unique_ptr<ActuatorDriver> driver_;
  ExecutorOptions options_;
  std::string command_prefix_;
  CommandRing<DeviceCommand> ring_;

  std::atomic<std::size_t> dropped_{0};
  std::atomic<std::size_t> malformed_{0};
  std::size_t dropped_reported_{0};
  std::size_t malformed_reported_{0};
  std::atomic<std::size_t> applied_{0};
  std::atomic<std::size_t> acks_published_{0};
  std::atomic<std::size_t> ack_failures_{0};

  std::thread worker_;
  bool running_{false};
};

}  // namespace rack_guard::device
