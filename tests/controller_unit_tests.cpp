#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "core/config.hpp"
#include "core/controller.hpp"
#include "device/actuator_driver.hpp"
#include "device/executor.hpp"
#include "sinks/stdout_debug.hpp"
#include "transport/transport.hpp"

using rack_guard::core::Controller;
using rack_guard::core::ControllerConfig;
using rack_guard::core::ControllerStats;
using rack_guard::device::CommandExecutor;
using rack_guard::device::ExecutorOptions;
using rack_guard::model::Actuator;
using rack_guard::model::AlarmState;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool wait_until(const std::function<bool()>& predicate) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (!predicate()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return true;
}

ControllerConfig quiet_config() {
  ControllerConfig config{};
  config.stdout_debug = false;
  config.tick_interval = std::chrono::milliseconds(1);
  return config;
}

int test_telemetry_updates_rack_store() {
  Controller controller(quiet_config(), rack_guard::transport::make_loopback_transport());
  if (!controller.start()) {
    return fail("test_telemetry_updates_rack_store", "controller should start");
  }
  auto& bus = controller.transport();

  bus.publish("racks/R1/status", "online");
  bus.publish("racks/R1/environment/temperature", "31.25");
  bus.publish("racks/R1/environment/humidity", "55");
  bus.publish("racks/R1/status", "1");
  bus.publish("racks/R1/tilt", "1");
  bus.publish("racks/R1/location", R"({"latitude": -3.7319, "longitude": -38.5267})");

  const auto rack = controller.dispatcher().rack("R1");
  if (!rack.has_value() || !rack->online || rack->temperature != 31.25F || rack->humidity != 55.0F || !rack->door_open ||
      !rack->tilted || rack->latitude != -3.7319 || rack->longitude != -38.5267) {
    return fail("test_telemetry_updates_rack_store", "rack store mismatch");
  }
  if (controller.trend().sample_count("R1", rack_guard::model::Metric::TEMPERATURE) != 1) {
    return fail("test_telemetry_updates_rack_store", "temperature should feed the trend estimator");
  }

  bus.publish("racks/R1/environment/door", "0");
  bus.publish("racks/R1/status", "offline");
  const auto updated = controller.dispatcher().rack("R1");
  if (updated->door_open || updated->online) {
    return fail("test_telemetry_updates_rack_store", "door and presence should follow the latest message");
  }

  controller.stop();
  return 0;
}

int test_malformed_messages_are_dropped() {
  Controller controller(quiet_config(), rack_guard::transport::make_loopback_transport());
  controller.start();
  auto& bus = controller.transport();

  bus.publish("racks/R1/environment/temperature", "hot");
  bus.publish("racks/R1/environment/pressure", "1013");
  bus.publish("racks/R1/status", "ajar");
  bus.publish("racks/R1/location", "{not json");
  bus.publish("racks/R1/location", R"({"latitude": "north"})");
  bus.publish("racks/R1/ack/door", "yes");

  if (controller.malformed_messages() != 6) {
    return fail("test_malformed_messages_are_dropped", "every malformed message should be counted");
  }
  if (controller.dispatcher().rack("R1").has_value()) {
    return fail("test_malformed_messages_are_dropped", "malformed messages must not create racks");
  }

  controller.stop();
  return 0;
}

int test_pending_command_defers_intents() {
  Controller controller(quiet_config(), rack_guard::transport::make_loopback_transport());
  controller.start();
  controller.transport().publish("racks/R2/environment/temperature", "36");

  ControllerStats stats{};
  controller.evaluate_racks(stats);
  if (stats.intents_issued != 1 || !controller.dispatcher().has_pending("R2", Actuator::VENTILATION)) {
    return fail("test_pending_command_defers_intents", "hot rack should get a ventilation command");
  }

  controller.evaluate_racks(stats);
  if (stats.intents_issued != 1 || stats.intents_deferred != 1) {
    return fail("test_pending_command_defers_intents", "intent for a busy actuator should be deferred");
  }

  controller.stop();
  return 0;
}

int test_end_to_end_ventilation_and_alarm() {
  Controller controller(quiet_config(), rack_guard::transport::make_loopback_transport());
  auto& bus = controller.transport();

  ExecutorOptions options{};
  options.rack_id = "R1";
  CommandExecutor executor(bus, rack_guard::device::make_simulated_driver("R1"), options);
  executor.attach();
  if (!controller.start()) {
    return fail("test_end_to_end_ventilation_and_alarm", "controller should start");
  }
  executor.start();

  bus.publish("racks/R1/environment/temperature", "46");
  const auto stats = controller.run_for_ticks(1);
  if (stats.intents_issued != 2) {
    return fail("test_end_to_end_ventilation_and_alarm", "overheat should issue alarm and ventilation");
  }

  const bool confirmed = wait_until([&controller]() {
    const auto rack = controller.dispatcher().rack("R1");
    return rack.has_value() && rack->ventilation_on && rack->alarm == AlarmState::OVERHEAT &&
           controller.commands_confirmed() == 2;
  });
  if (!confirmed) {
    return fail("test_end_to_end_ventilation_and_alarm", "device acks should confirm both actuators");
  }

  bus.publish("racks/R1/environment/temperature", "39");
  controller.run_for_ticks(1);
  const bool released = wait_until([&controller]() {
    const auto rack = controller.dispatcher().rack("R1");
    return rack->alarm == AlarmState::OFF && controller.dispatcher().pending_count() == 0;
  });
  if (!released || !controller.dispatcher().rack("R1")->ventilation_on) {
    return fail("test_end_to_end_ventilation_and_alarm", "alarm should release while ventilation holds");
  }

  controller.control().open_door("R1");
  const bool door_open = wait_until([&controller]() { return controller.dispatcher().rack("R1")->door_open; });
  if (!door_open || executor.current(Actuator::DOOR) != 1) {
    return fail("test_end_to_end_ventilation_and_alarm", "operator door command should be confirmed");
  }

  executor.stop();
  controller.stop();
  return 0;
}

int test_unacknowledged_command_expires() {
  ControllerConfig config = quiet_config();
  config.command.timeout = std::chrono::milliseconds(40);
  config.command.sweep_interval = std::chrono::milliseconds(10);
  Controller controller(config, rack_guard::transport::make_loopback_transport());
  controller.start();

  controller.transport().publish("racks/R3/environment/humidity", "90");
  ControllerStats stats{};
  controller.evaluate_racks(stats);

  const bool expired = wait_until([&controller]() { return controller.commands_unconfirmed() == 1; });
  if (!expired || controller.dispatcher().rack("R3")->ventilation_on) {
    return fail("test_unacknowledged_command_expires", "command without a device should expire unconfirmed");
  }

  controller.stop();
  return 0;
}

int test_status_json_lines() {
  rack_guard::model::Rack rack{};
  rack.id = "R1";
  rack.temperature = 30.5F;
  rack.alarm = AlarmState::BREAK_IN;
  rack.latitude = -3.5;
  rack.longitude = -38.5;

  const auto json = rack_guard::sinks::rack_to_json(rack);
  if (json.at("rack") != "R1" || json.at("alarm") != "break_in" || json.at("temperature_c") != 30.5 ||
      !json.at("humidity_pct").is_null() || json.at("location").at("latitude") != -3.5) {
    return fail("test_status_json_lines", "rack json mismatch");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_telemetry_updates_rack_store(); rc != 0) return rc;
  if (int rc = test_malformed_messages_are_dropped(); rc != 0) return rc;
  if (int rc = test_pending_command_defers_intents(); rc != 0) return rc;
  if (int rc = test_end_to_end_ventilation_and_alarm(); rc != 0) return rc;
  if (int rc = test_unacknowledged_command_expires(); rc != 0) return rc;
  if (int rc = test_status_json_lines(); rc != 0) return rc;

  std::cout << "[PASS] controller unit tests\n";
  return 0;
}
