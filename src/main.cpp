#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "core/config.hpp"
#include "core/controller.hpp"
#include "transport/transport.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

std::string format_redis_address(const rack_guard::transport::RedisOptions& options) {
  if (!options.unix_socket.empty()) {
    return "unix://" + options.unix_socket;
  }
  return options.host + ':' + std::to_string(options.port);
}

}  // namespace

std::string format_config_settings(const rack_guard::core::ControllerConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[controller] loaded config from " << config_path
         << " | tick_interval_ms=" << config.tick_interval.count()
         << " | base_topic=" << config.base_topic
         << " | command_timeout_ms=" << config.command.timeout.count()
         << " | temperature=" << config.engine.temperature.low << '/' << config.engine.temperature.high << '/'
         << config.engine.temperature.critical_reset << '/' << config.engine.temperature.critical
         << " | humidity=" << config.engine.humidity.low << '/' << config.engine.humidity.high << '/'
         << config.engine.humidity.critical_reset << '/' << config.engine.humidity.critical
         << " | anticipation=" << (config.engine.anticipation ? "true" : "false")
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_address=" << format_redis_address(config.redis.options);
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/rack-guard.yaml";

  rack_guard::core::ControllerConfig config{};
  try {
    config = rack_guard::core::load_controller_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';
  if (!config.redis.enabled) {
    std::cerr << "[controller] redis.address not set; using " << format_redis_address(config.redis.options) << '\n';
  }

  rack_guard::core::Controller controller{config, rack_guard::transport::make_redis_transport(config.redis.options)};
  if (!controller.start()) {
    std::cerr << "[controller] startup failed\n";
    return 1;
  }

  while (g_shutdown_requested == 0) {
    controller.run_for_ticks(1);
  }

  std::cerr << "[controller] shutdown signal received; exiting cleanly\n";
  controller.stop();

  return 0;
}
