#pragma once

#include <string>

#include "dispatch/dispatcher.hpp"

namespace rack_guard::dispatch {

// Operator commands. Every call goes through the dispatcher, so it is
// rejected while a command for the same actuator is in flight and only
// changes the confirmed rack state once the device acknowledges it.
class RackControl {
 public:
  explicit RackControl(Dispatcher& dispatcher) noexcept;

  IssueResult open_door(const std::string& rack_id, ResultSink sink = {});
  IssueResult close_door(const std::string& rack_id, ResultSink sink = {});
  IssueResult toggle_door(const std::string& rack_id, ResultSink sink = {});

  IssueResult turn_on_ventilation(const std::string& rack_id, ResultSink sink = {});
  IssueResult turn_off_ventilation(const std::string& rack_id, ResultSink sink = {});
  IssueResult toggle_ventilation(const std::string& rack_id, ResultSink sink = {});

  IssueResult activate_critical_temperature_alert(const std::string& rack_id, ResultSink sink = {});
  IssueResult deactivate_critical_temperature_alert(const std::string& rack_id, ResultSink sink = {});
  IssueResult activate_door_open_alert(const std::string& rack_id, ResultSink sink = {});
  IssueResult activate_break_in_alert(const std::string& rack_id, ResultSink sink = {});
  IssueResult silence_alarm(const std::string& rack_id, ResultSink sink = {});

 private:
  IssueResult send(const std::string& rack_id, model::Actuator actuator, std::int32_t value, ResultSink sink);

  Dispatcher& dispatcher_;
};

}  // namespace rack_guard::dispatch
