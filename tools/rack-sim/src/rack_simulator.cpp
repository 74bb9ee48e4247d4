#include "sim/rack_simulator.hpp"

#include <iostream>
#include <utility>

#include <nlohmann/json.hpp>

#include "device/actuator_driver.hpp"
#include "model/topic.hpp"

namespace rack_guard::sim {
namespace {

device::ExecutorOptions executor_options(const SimulatorOptions& options, const std::string& rack_id) {
  device::ExecutorOptions out{};
  out.base_topic = options.base_topic;
  out.rack_id = rack_id;
  out.queue_capacity = options.queue_capacity;
  return out;
}

}  // namespace

RackSimulator::RackSimulator(transport::Transport& transport, RackSite site, const SimulatorOptions& options,
                             const std::uint32_t seed, const double now_s)
    : transport_(transport),
      site_(std::move(site)),
      base_topic_(options.base_topic),
      executor_(transport, device::make_simulated_driver(site_.rack_id), executor_options(options, site_.rack_id)),
      environment_(options.environment, seed, now_s),
      random_(seed ^ 0x9e3779b9U) {}

bool RackSimulator::attach() { return executor_.attach(); }

void RackSimulator::start() { executor_.start(); }

void RackSimulator::stop() { executor_.stop(); }

void RackSimulator::announce() {
  publish(model::status_topic(base_topic_, site_.rack_id), "online");

  const nlohmann::json location{{"latitude", site_.latitude}, {"longitude", site_.longitude}};
  publish(model::location_topic(base_topic_, site_.rack_id), location.dump());
  std::cerr << "[sim] " << site_.rack_id << " online at " << site_.latitude << ',' << site_.longitude << '\n';
}

void RackSimulator::retire() { publish(model::status_topic(base_topic_, site_.rack_id), "offline"); }

void RackSimulator::step(const double now_s) {
  environment_.poll_door_schedule(now_s);
  const bool door_open = environment_.door_held_open() || executor_.current(model::Actuator::DOOR) != 0;
  const bool ventilation_on = executor_.current(model::Actuator::VENTILATION) != 0;

  // Door transitions go out before any periodic reading.
  if (reported_door_ != static_cast<int>(door_open)) {
    reported_door_ = static_cast<int>(door_open);
    publish(model::status_topic(base_topic_, site_.rack_id), door_open ? "1" : "0");
    return;
  }

  switch (std::uniform_int_distribution<int>(0, 2)(random_)) {
    case 0: {
      const Reading reading = environment_.next_temperature(now_s, door_open, ventilation_on);
      publish(model::environment_topic(base_topic_, site_.rack_id, "temperature"),
              model::format_float_payload(reading.value));
      break;
    }
    case 1: {
      const Reading reading = environment_.next_humidity(now_s, door_open, ventilation_on);
      publish(model::environment_topic(base_topic_, site_.rack_id, "humidity"),
              model::format_float_payload(reading.value));
      break;
    }
    default:
      publish(model::status_topic(base_topic_, site_.rack_id), door_open ? "1" : "0");
      break;
  }
}

void RackSimulator::publish(const std::string& topic, const std::string& payload) {
  if (transport_.publish(topic, payload)) {
    ++publishes_;
    if (!publish_ok_) {
      std::cerr << "[sim] " << site_.rack_id << " publish recovered\n";
      publish_ok_ = true;
    }
    return;
  }

  if (publish_ok_) {
    std::cerr << "[sim] " << site_.rack_id << " publish failed on " << topic << '\n';
    publish_ok_ = false;
  }
}

const RackSite& RackSimulator::site() const noexcept { return site_; }

const device::CommandExecutor& RackSimulator::executor() const noexcept { return executor_; }

std::size_t RackSimulator::publishes() const noexcept { return publishes_; }

}  // namespace rack_guard::sim
