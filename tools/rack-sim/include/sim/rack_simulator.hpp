#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

#include "device/executor.hpp"
#include "sim/environment.hpp"
#include "transport/transport.hpp"

namespace rack_guard::sim {

struct RackSite {
  std::string rack_id;
  double latitude;
  double longitude;
};

struct SimulatorOptions {
  std::string base_topic{"racks"};
  std::size_t queue_capacity{32};
  EnvironmentOptions environment{};
};

// One simulated rack: a command executor over the simulated actuators
// plus telemetry shaped by what those actuators are doing.
class RackSimulator {
 public:
  RackSimulator(transport::Transport& transport, RackSite site, const SimulatorOptions& options, std::uint32_t seed,
                double now_s);

  RackSimulator(const RackSimulator&) = delete;
  RackSimulator& operator=(const RackSimulator&) = delete;

  bool attach();
  void start();
  void stop();

  // Presence and fixed location, published once the transport is up.
  void announce();
  void retire();

  // Publishes one telemetry event.
  void step(double now_s);

  [[nodiscard]] const RackSite& site() const noexcept;
  [[nodiscard]] const device::CommandExecutor& executor() const noexcept;
  [[nodiscard]] std::size_t publishes() const noexcept;

 private:
  void publish(const std::string& topic, const std::string& payload);

  transport::Transport& transport_;
  RackSite site_;
  std::string base_topic_;
  device::CommandExecutor executor_;
  EnvironmentModel environment_;
  std::mt19937 random_;

  int reported_door_{-1};
  std::size_t publishes_{0};
  bool publish_ok_{true};
};

}  // namespace rack_guard::sim
