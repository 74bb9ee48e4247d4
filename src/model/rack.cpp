#include "model/rack.hpp"

namespace rack_guard::model {

const char* actuator_name(const Actuator actuator) noexcept {
  switch (actuator) {
    case Actuator::DOOR:
      return "door";
    case Actuator::VENTILATION:
      return "ventilation";
    case Actuator::ALARM:
      return "buzzer";
  }
  return "unknown";
}

std::optional<Actuator> parse_actuator(const std::string_view name) noexcept {
  if (name == "door") {
    return Actuator::DOOR;
  }
  if (name == "ventilation") {
    return Actuator::VENTILATION;
  }
  if (name == "buzzer" || name == "alarm") {
    return Actuator::ALARM;
  }
  return std::nullopt;
}

const char* alarm_name(const AlarmState alarm) noexcept {
  switch (alarm) {
    case AlarmState::OFF:
      return "off";
    case AlarmState::DOOR_OPEN:
      return "door_open";
    case AlarmState::BREAK_IN:
      return "break_in";
    case AlarmState::OVERHEAT:
      return "overheat";
  }
  return "unknown";
}

std::optional<AlarmState> alarm_from_value(const std::int32_t value) noexcept {
  if (value < 0 || value > static_cast<std::int32_t>(AlarmState::OVERHEAT)) {
    return std::nullopt;
  }
  return static_cast<AlarmState>(value);
}

const char* metric_name(const Metric metric) noexcept {
  switch (metric) {
    case Metric::TEMPERATURE:
      return "temperature";
    case Metric::HUMIDITY:
      return "humidity";
  }
  return "unknown";
}

}  // namespace rack_guard::model
