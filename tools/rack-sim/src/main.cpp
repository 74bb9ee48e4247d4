#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/config.hpp"
#include "core/timestamp.hpp"
#include "sim/rack_simulator.hpp"
#include "transport/transport.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

// Fixed sites around Fortaleza-CE; racks do not move.
const std::vector<std::pair<double, double>> kSites = {
    {-3.7319, -38.5267}, {-3.7403, -38.4993}, {-3.7648, -38.4712}, {-3.7271, -38.4909},
    {-3.7191, -38.5089}, {-3.7456, -38.5302}, {-3.7589, -38.4834}, {-3.7744, -38.5566},
    {-3.7505, -38.5124}, {-3.7380, -38.5189}, {-3.7612, -38.4563}, {-3.7283, -38.5434},
    {-3.7834, -38.5912}, {-3.7422, -38.4621}, {-3.7956, -38.5234}, {-3.9012, -38.3876},
};

std::string rack_id_for(const std::size_t index) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "RACK%02zu", index + 1);
  return buffer;
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/rack-guard.yaml";

  rack_guard::core::ControllerConfig config{};
  std::size_t rack_count = 10;
  try {
    config = rack_guard::core::load_controller_config(config_path);
    if (argc > 2) {
      const auto parsed = std::stoi(argv[2]);
      if (parsed <= 0) {
        throw std::runtime_error("rack count must be greater than 0");
      }
      rack_count = static_cast<std::size_t>(parsed);
    }
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  auto transport = rack_guard::transport::make_redis_transport(config.redis.options);

  rack_guard::sim::SimulatorOptions options{};
  options.base_topic = config.base_topic;
  options.queue_capacity = config.device.queue_capacity;

  std::vector<std::unique_ptr<rack_guard::sim::RackSimulator>> racks;
  const double start_s = rack_guard::core::monotonic_seconds_now();
  std::random_device seed_source;
  for (std::size_t i = 0; i < rack_count; ++i) {
    const auto& coordinates = kSites[i % kSites.size()];
    rack_guard::sim::RackSite site{rack_id_for(i), coordinates.first, coordinates.second};
    racks.push_back(std::make_unique<rack_guard::sim::RackSimulator>(*transport, std::move(site), options,
                                                                     seed_source(), start_s));
    if (!racks.back()->attach()) {
      std::cerr << "[sim] failed to subscribe commands for " << racks.back()->site().rack_id << '\n';
      return 1;
    }
  }

  if (!transport->start()) {
    std::cerr << "[sim] transport failed to start\n";
    return 1;
  }

  for (auto& rack : racks) {
    rack->start();
    rack->announce();
  }
  std::cerr << "[sim] simulating " << racks.size() << " racks under " << config.base_topic << '\n';

  // Each rack publishes about once per second.
  const auto period = std::chrono::milliseconds(1000);
  auto next_wakeup = std::chrono::steady_clock::now();
  while (g_shutdown_requested == 0) {
    const double now_s = rack_guard::core::monotonic_seconds_now();
    for (auto& rack : racks) {
      rack->step(now_s);
    }
    next_wakeup += period;
    std::this_thread::sleep_until(next_wakeup);
  }

  std::cerr << "[sim] shutdown signal received; exiting cleanly\n";
  for (auto& rack : racks) {
    rack->retire();
    rack->stop();
  }
  transport->stop();

  return 0;
}
