#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "decision/hysteresis_engine.hpp"
#include "transport/transport.hpp"
#include "trend/trend_estimator.hpp"

namespace rack_guard::core {

struct RedisConfig {
  transport::RedisOptions options{};
  bool enabled{false};
};

struct CommandConfig {
  std::chrono::milliseconds timeout{5000};
  std::chrono::milliseconds sweep_interval{500};
};

struct DeviceConfig {
  std::size_t queue_capacity{32};
};

struct ControllerConfig {
  std::chrono::milliseconds tick_interval{100};
  std::string base_topic{"racks"};
  CommandConfig command{};
  decision::EngineConfig engine{};
  trend::TrendOptions trend{};
  bool stdout_debug{true};
  std::uint64_t status_every_ticks{50};
  RedisConfig redis{};
  DeviceConfig device{};
};

ControllerConfig load_controller_config(const std::string& path);

}  // namespace rack_guard::core
