#include "sim/environment.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace rack_guard::sim {

double log_envelope(const double progress) noexcept {
  if (progress <= 0.0 || progress >= 1.0) {
    return 0.0;
  }
  const double scaled = progress <= 0.5 ? progress / 0.5 : (1.0 - progress) / 0.5;
  return std::log1p(9.0 * std::clamp(scaled, 0.0, 1.0)) / std::log1p(9.0);
}

EnvironmentModel::EnvironmentModel(EnvironmentOptions options, const std::uint32_t seed, const double now_s)
    : options_(options), random_(seed) {
  temperature_ = static_cast<float>(uniform(22.0, 30.0));
  humidity_ = static_cast<float>(uniform(40.0, 60.0));
  next_door_open_s_ = now_s + uniform(options_.door_interval_min_s, options_.door_interval_max_s);
}

double EnvironmentModel::uniform(const double low, const double high) {
  return std::uniform_real_distribution<double>(low, high)(random_);
}

double EnvironmentModel::normal(const double mean, const double stddev) {
  return std::normal_distribution<double>(mean, stddev)(random_);
}

double EnvironmentModel::normal_temperature(const bool door_open, const bool ventilation_on) {
  const double external = options_.external_temperature_c;
  if (door_open) {
    return std::clamp(normal(external + 2.0, 1.0), external - 1.0, external + 6.0);
  }
  if (ventilation_on) {
    return std::clamp(normal(25.0, 1.0), 20.0, 32.0);
  }
  return std::clamp(normal(27.0, 2.0), 18.0, 40.0);
}

double EnvironmentModel::normal_humidity(const bool door_open, const bool ventilation_on) {
  if (door_open) {
    return std::clamp(normal(47.0, 4.0), 35.0, 65.0);
  }
  if (ventilation_on) {
    return std::clamp(normal(46.0, 3.0), 35.0, 60.0);
  }
  return std::clamp(normal(50.0, 7.0), 30.0, 70.0);
}

Reading EnvironmentModel::next_temperature(const double now_s, const bool door_open, const bool ventilation_on) {
  Reading reading{};
  double candidate = 0.0;

  if (temperature_anomaly_.has_value()) {
    const Anomaly& anomaly = *temperature_anomaly_;
    const double progress = (now_s - anomaly.start_s) / anomaly.duration_s;
    if (progress >= 1.0) {
      temperature_anomaly_.reset();
      candidate = normal_temperature(door_open, ventilation_on);
    } else {
      candidate = anomaly.baseline + (anomaly.target - anomaly.baseline) * log_envelope(progress) + uniform(-0.2, 0.2);
      reading.anomaly = true;
    }
  } else if (!door_open && !ventilation_on && uniform(0.0, 1.0) < options_.anomaly_probability) {
    const double target = uniform(0.0, 1.0) < 0.5 ? uniform(-5.0, 5.0) : uniform(60.0, 90.0);
    temperature_anomaly_ = Anomaly{now_s, uniform(18.0, 22.0), temperature_, target};
    std::cerr << "[sim] thermal anomaly toward " << target << " C\n";
    candidate = temperature_ + (target - temperature_) * log_envelope(0.02);
    reading.anomaly = true;
  } else {
    candidate = normal_temperature(door_open, ventilation_on);
  }

  temperature_ = static_cast<float>(std::clamp(candidate, -10.0, 120.0));
  reading.value = temperature_;
  return reading;
}

Reading EnvironmentModel::next_humidity(const double now_s, const bool door_open, const bool ventilation_on) {
  Reading reading{};
  double candidate = 0.0;

  if (humidity_anomaly_.has_value()) {
    const Anomaly& anomaly = *humidity_anomaly_;
    const double progress = (now_s - anomaly.start_s) / anomaly.duration_s;
    if (progress >= 1.0) {
      humidity_anomaly_.reset();
      candidate = normal_humidity(door_open, ventilation_on);
    } else {
      candidate = anomaly.baseline + (anomaly.target - anomaly.baseline) * log_envelope(progress) + uniform(-0.5, 0.5);
      reading.anomaly = true;
    }
  } else if (!door_open && !ventilation_on && uniform(0.0, 1.0) < options_.anomaly_probability) {
    const double target = uniform(0.0, 1.0) < 0.5 ? uniform(0.0, 20.0) : uniform(85.0, 100.0);
    humidity_anomaly_ = Anomaly{now_s, uniform(18.0, 22.0), humidity_, target};
    std::cerr << "[sim] humidity anomaly toward " << target << " %\n";
    candidate = humidity_ + (target - humidity_) * log_envelope(0.02);
    reading.anomaly = true;
  } else {
    candidate = normal_humidity(door_open, ventilation_on);
  }

  humidity_ = static_cast<float>(std::clamp(candidate, 0.0, 100.0));
  reading.value = humidity_;
  return reading;
}

std::optional<bool> EnvironmentModel::poll_door_schedule(const double now_s) {
  if (!door_held_open_ && now_s >= next_door_open_s_) {
    door_held_open_ = true;
    door_close_s_ = now_s + uniform(options_.door_open_min_s, options_.door_open_max_s);
    return true;
  }

  if (door_held_open_ && now_s >= door_close_s_) {
    door_held_open_ = false;
    next_door_open_s_ = now_s + uniform(options_.door_interval_min_s, options_.door_interval_max_s);
    return false;
  }

  return std::nullopt;
}

bool EnvironmentModel::door_held_open() const noexcept { return door_held_open_; }

float EnvironmentModel::temperature() const noexcept { return temperature_; }

float EnvironmentModel::humidity() const noexcept { return humidity_; }

}  // namespace rack_guard::sim
