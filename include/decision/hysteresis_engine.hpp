#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "model/rack.hpp"
#include "trend/trend_estimator.hpp"

namespace rack_guard::decision {

// Dual thresholds per metric. Valid only when
// low < high <= critical_reset < critical.
struct ThresholdConfig {
  float high{35.0F};
  float low{28.0F};
  float critical{45.0F};
  float critical_reset{40.0F};
};

[[nodiscard]] bool thresholds_valid(const ThresholdConfig& config) noexcept;

struct EngineConfig {
  ThresholdConfig temperature{35.0F, 28.0F, 45.0F, 40.0F};
  ThresholdConfig humidity{70.0F, 60.0F, 85.0F, 80.0F};
  // Pre-emptive ventilation on a rising temperature trend.
  bool anticipation{false};
  float rising_rate_per_min{0.5F};
};

enum class IntentKind : std::uint8_t {
  ACTIVATE_VENTILATION,
  DEACTIVATE_VENTILATION,
  ACTIVATE_ALARM,
  DEACTIVATE_ALARM,
};

struct ActionIntent {
  IntentKind kind;
  model::Actuator actuator;
  std::int32_t value;
  // Target alarm for alarm intents; OFF otherwise.
  model::AlarmState alarm;
  const char* reason;
};

const char* intent_name(IntentKind kind) noexcept;

// Highest-priority active cause, OFF when none is active.
model::AlarmState resolve_alarm(bool overheat, bool break_in, bool door_open) noexcept;

class HysteresisEngine {
 public:
  explicit HysteresisEngine(EngineConfig config = {});

  [[nodiscard]] std::vector<ActionIntent> evaluate(const model::Rack& rack,
                                                   const std::optional<trend::TrendEstimate>& temperature_trend) const;

  [[nodiscard]] const EngineConfig& config() const noexcept;

 private:
  [[nodiscard]] bool overheat_active(const model::Rack& rack) const noexcept;

  EngineConfig config_;
};

}  // namespace rack_guard::decision
