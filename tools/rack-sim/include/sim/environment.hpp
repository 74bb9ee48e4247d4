#pragma once

#include <cstdint>
#include <optional>
#include <random>

namespace rack_guard::sim {

struct EnvironmentOptions {
  double anomaly_probability{0.07};
  double external_temperature_c{18.0};
  double door_interval_min_s{14.0 * 60.0};
  double door_interval_max_s{16.0 * 60.0};
  double door_open_min_s{45.0};
  double door_open_max_s{150.0};
};

struct Reading {
  float value{0.0F};
  bool anomaly{false};
};

// Rises to the peak at progress 0.5 and falls back; 0 outside (0, 1).
double log_envelope(double progress) noexcept;

// Temperature and humidity of one rack, shaped by the door and the
// ventilation relay. Anomalies ramp toward an out-of-band target over
// about twenty seconds and never start while the rack is in a safe mode
// (door open or ventilation running).
class EnvironmentModel {
 public:
  EnvironmentModel(EnvironmentOptions options, std::uint32_t seed, double now_s);

  Reading next_temperature(double now_s, bool door_open, bool ventilation_on);
  Reading next_humidity(double now_s, bool door_open, bool ventilation_on);

  // Scheduled manual door opening; returns the new state when it changes.
  std::optional<bool> poll_door_schedule(double now_s);
  [[nodiscard]] bool door_held_open() const noexcept;

  [[nodiscard]] float temperature() const noexcept;
  [[nodiscard]] float humidity() const noexcept;

 private:
  struct Anomaly {
    double start_s;
    double duration_s;
    double baseline;
    double target;
  };

  double normal_temperature(bool door_open, bool ventilation_on);
  double normal_humidity(bool door_open, bool ventilation_on);
  double uniform(double low, double high);
  double normal(double mean, double stddev);

  EnvironmentOptions options_;
  std::mt19937 random_;

  float temperature_;
  float humidity_;
  std::optional<Anomaly> temperature_anomaly_{};
  std::optional<Anomaly> humidity_anomaly_{};

  bool door_held_open_{false};
  double next_door_open_s_;
  double door_close_s_{0.0};
};

}  // namespace rack_guard::sim
