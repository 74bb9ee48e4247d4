#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rack_guard::model {

enum class Actuator : std::uint8_t {
  DOOR = 0,
  VENTILATION = 1,
  ALARM = 2,
};

inline constexpr std::size_t kActuatorCount = 3;

// Ordered by priority: a larger value always wins.
enum class AlarmState : std::uint8_t {
  OFF = 0,
  DOOR_OPEN = 1,
  BREAK_IN = 2,
  OVERHEAT = 3,
};

enum class Metric : std::uint8_t {
  TEMPERATURE = 0,
  HUMIDITY = 1,
};

struct Rack {
  std::string id{};

  // Sensor readings, last received.
  std::optional<float> temperature{};
  std::optional<float> humidity{};
  bool door_open{false};
  bool tilted{false};
  bool online{false};
  std::optional<double> latitude{};
  std::optional<double> longitude{};
  std::uint64_t last_seen_ns{0};

  // Actuator state, only as confirmed by an acknowledgment.
  bool ventilation_on{false};
  AlarmState alarm{AlarmState::OFF};
};

const char* actuator_name(Actuator actuator) noexcept;
std::optional<Actuator> parse_actuator(std::string_view name) noexcept;

const char* alarm_name(AlarmState alarm) noexcept;
std::optional<AlarmState> alarm_from_value(std::int32_t value) noexcept;

const char* metric_name(Metric metric) noexcept;

inline constexpr bool outranks(const AlarmState lhs, const AlarmState rhs) noexcept {
  return static_cast<std::uint8_t>(lhs) > static_cast<std::uint8_t>(rhs);
}

}  // namespace rack_guard::model
