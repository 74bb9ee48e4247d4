#include "device/actuator_driver.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace rack_guard::device {
namespace {

// Relay, door servo and buzzer held in memory. The servo and relay are
// binary and the buzzer only has the four alarm patterns, so out-of-range
// requests are clamped.
class SimulatedDriver final : public ActuatorDriver {
 public:
  explicit SimulatedDriver(std::string rack_id) : rack_id_(std::move(rack_id)) {}

  std::int32_t apply(const model::Actuator actuator, const std::int32_t desired) override {
    const std::int32_t achieved = clamp(actuator, desired);
    auto& state = states_[static_cast<std::size_t>(actuator)];
    const std::int32_t previous = state.exchange(achieved, std::memory_order_release);
    if (previous != achieved) {
      std::cerr << "[device] " << rack_id_ << ' ' << model::actuator_name(actuator) << ' ' << previous << " -> "
                << achieved << '\n';
    }
    return achieved;
  }

  std::int32_t current(const model::Actuator actuator) const override {
    return states_[static_cast<std::size_t>(actuator)].load(std::memory_order_acquire);
  }

 private:
  static std::int32_t clamp(const model::Actuator actuator, const std::int32_t desired) {
    switch (actuator) {
      case model::Actuator::DOOR:
      case model::Actuator::VENTILATION:
        return desired != 0 ? 1 : 0;
      case model::Actuator::ALARM:
        return std::clamp(desired, static_cast<std::int32_t>(model::AlarmState::OFF),
                          static_cast<std::int32_t>(model::AlarmState::OVERHEAT));
    }
    return 0;
  }

  std::string rack_id_;
  // Written by the executor worker, read by telemetry publishers.
  std::array<std::atomic<std::int32_t>, model::kActuatorCount> states_{};
};

}  // namespace

std::unique_ptr<ActuatorDriver> make_simulated_driver(std::string rack_id) {
  return std::make_unique<SimulatedDriver>(std::move(rack_id));
}

}  // namespace rack_guard::device
