#include "sinks/stdout_debug.hpp"

#include <cstdio>

namespace rack_guard::sinks {

nlohmann::json rack_to_json(const model::Rack& rack) {
  nlohmann::json out{
      {"rack", rack.id},
      {"online", rack.online},
      {"door_open", rack.door_open},
      {"tilted", rack.tilted},
      {"ventilation_on", rack.ventilation_on},
      {"alarm", model::alarm_name(rack.alarm)},
  };
  out["temperature_c"] = rack.temperature.has_value() ? nlohmann::json(*rack.temperature) : nlohmann::json(nullptr);
  out["humidity_pct"] = rack.humidity.has_value() ? nlohmann::json(*rack.humidity) : nlohmann::json(nullptr);
  if (rack.latitude.has_value() && rack.longitude.has_value()) {
    out["location"] = {{"latitude", *rack.latitude}, {"longitude", *rack.longitude}};
  }
  return out;
}

void StdoutDebugSink::publish(const std::vector<model::Rack>& racks, const std::size_t pending_commands) const {
  std::printf("[status] racks=%zu pending_commands=%zu\n", racks.size(), pending_commands);
  for (const auto& rack : racks) {
    std::printf("[status] %s\n", rack_to_json(rack).dump().c_str());
  }
  std::fflush(stdout);
}

}  // namespace rack_guard::sinks
