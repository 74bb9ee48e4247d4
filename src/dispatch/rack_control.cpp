#include "dispatch/rack_control.hpp"

#include <iostream>
#include <utility>

namespace rack_guard::dispatch {

RackControl::RackControl(Dispatcher& dispatcher) noexcept : dispatcher_(dispatcher) {}

IssueResult RackControl::send(const std::string& rack_id, const model::Actuator actuator, const std::int32_t value,
                              ResultSink sink) {
  auto result = dispatcher_.issue(rack_id, actuator, value, std::move(sink));
  if (result.accepted()) {
    std::cerr << "[control] sent " << model::actuator_name(actuator) << '=' << value << " to rack " << rack_id
              << '\n';
  } else {
    std::cerr << "[control] " << model::actuator_name(actuator) << " command for rack " << rack_id
              << " rejected: command already in flight\n";
  }
  return result;
}

IssueResult RackControl::open_door(const std::string& rack_id, ResultSink sink) {
  return send(rack_id, model::Actuator::DOOR, 1, std::move(sink));
}

IssueResult RackControl::close_door(const std::string& rack_id, ResultSink sink) {
  return send(rack_id, model::Actuator::DOOR, 0, std::move(sink));
}

IssueResult RackControl::toggle_door(const std::string& rack_id, ResultSink sink) {
  const auto rack = dispatcher_.rack(rack_id);
  const bool open = rack.has_value() && rack->door_open;
  return open ? close_door(rack_id, std::move(sink)) : open_door(rack_id, std::move(sink));
}

IssueResult RackControl::turn_on_ventilation(const std::string& rack_id, ResultSink sink) {
  return send(rack_id, model::Actuator::VENTILATION, 1, std::move(sink));
}

IssueResult RackControl::turn_off_ventilation(const std::string& rack_id, ResultSink sink) {
  return send(rack_id, model::Actuator::VENTILATION, 0, std::move(sink));
}

IssueResult RackControl::toggle_ventilation(const std::string& rack_id, ResultSink sink) {
  const auto rack = dispatcher_.rack(rack_id);
  const bool on = rack.has_value() && rack->ventilation_on;
  return on ? turn_off_ventilation(rack_id, std::move(sink)) : turn_on_ventilation(rack_id, std::move(sink));
}

IssueResult RackControl::activate_critical_temperature_alert(const std::string& rack_id, ResultSink sink) {
  return send(rack_id, model::Actuator::ALARM, static_cast<std::int32_t>(model::AlarmState::OVERHEAT),
              std::move(sink));
}

IssueResult RackControl::deactivate_critical_temperature_alert(const std::string& rack_id, ResultSink sink) {
  return silence_alarm(rack_id, std::move(sink));
}

IssueResult RackControl::activate_door_open_alert(const std::string& rack_id, ResultSink sink) {
  return send(rack_id, model::Actuator::ALARM, static_cast<std::int32_t>(model::AlarmState::DOOR_OPEN),
              std::move(sink));
}

IssueResult RackControl::activate_break_in_alert(const std::string& rack_id, ResultSink sink) {
  return send(rack_id, model::Actuator::ALARM, static_cast<std::int32_t>(model::AlarmState::BREAK_IN),
              std::move(sink));
}

IssueResult RackControl::silence_alarm(const std::string& rack_id, ResultSink sink) {
  return send(rack_id, model::Actuator::ALARM, static_cast<std::int32_t>(model::AlarmState::OFF), std::move(sink));
}

}  // namespace rack_guard::dispatch
