#include "decision/hysteresis_engine.hpp"

namespace rack_guard::decision {

bool thresholds_valid(const ThresholdConfig& config) noexcept {
  return config.low < config.high && config.high <= config.critical_reset && config.critical_reset < config.critical;
}

const char* intent_name(const IntentKind kind) noexcept {
  switch (kind) {
    case IntentKind::ACTIVATE_VENTILATION:
      return "activate_ventilation";
    case IntentKind::DEACTIVATE_VENTILATION:
      return "deactivate_ventilation";
    case IntentKind::ACTIVATE_ALARM:
      return "activate_alarm";
    case IntentKind::DEACTIVATE_ALARM:
      return "deactivate_alarm";
  }
  return "unknown";
}

model::AlarmState resolve_alarm(const bool overheat, const bool break_in, const bool door_open) noexcept {
  if (overheat) {
    return model::AlarmState::OVERHEAT;
  }
  if (break_in) {
    return model::AlarmState::BREAK_IN;
  }
  if (door_open) {
    return model::AlarmState::DOOR_OPEN;
  }
  return model::AlarmState::OFF;
}

HysteresisEngine::HysteresisEngine(EngineConfig config) : config_(config) {}

const EngineConfig& HysteresisEngine::config() const noexcept { return config_; }

bool HysteresisEngine::overheat_active(const model::Rack& rack) const noexcept {
  const bool latched = rack.alarm == model::AlarmState::OVERHEAT;
  if (!rack.temperature.has_value()) {
    return latched;
  }

  const float t = *rack.temperature;
  if (latched) {
    // Released below critical_reset, not critical.
    return t >= config_.temperature.critical_reset;
  }
  return t >= config_.temperature.critical;
}

std::vector<ActionIntent> HysteresisEngine::evaluate(const model::Rack& rack,
                                                     const std::optional<trend::TrendEstimate>& temperature_trend) const {
  std::vector<ActionIntent> intents;

  const bool overheat = overheat_active(rack);
  // BREAK_IN is latched until an operator silences it.
  const bool break_in = rack.alarm == model::AlarmState::BREAK_IN || rack.tilted;
  const model::AlarmState desired_alarm = resolve_alarm(overheat, break_in, rack.door_open);

  if (desired_alarm != rack.alarm) {
    if (model::outranks(desired_alarm, rack.alarm)) {
      intents.push_back({IntentKind::ACTIVATE_ALARM, model::Actuator::ALARM, static_cast<std::int32_t>(desired_alarm),
                         desired_alarm, "higher priority alarm cause active"});
    } else {
      intents.push_back({IntentKind::DEACTIVATE_ALARM, model::Actuator::ALARM,
                         static_cast<std::int32_t>(desired_alarm), desired_alarm, "active alarm cause cleared"});
    }
  }

  const auto& t = rack.temperature;
  const auto& h = rack.humidity;
  const ThresholdConfig& temp = config_.temperature;
  const ThresholdConfig& hum = config_.humidity;

  if (!rack.ventilation_on) {
    if (overheat) {
      intents.push_back({IntentKind::ACTIVATE_VENTILATION, model::Actuator::VENTILATION, 1, model::AlarmState::OFF,
                         "temperature critical"});
    } else if (t.has_value() && *t >= temp.high) {
      intents.push_back({IntentKind::ACTIVATE_VENTILATION, model::Actuator::VENTILATION, 1, model::AlarmState::OFF,
                         "temperature above high threshold"});
    } else if (h.has_value() && *h >= hum.high) {
      intents.push_back({IntentKind::ACTIVATE_VENTILATION, model::Actuator::VENTILATION, 1, model::AlarmState::OFF,
                         "humidity above high threshold"});
    } else if (config_.anticipation && t.has_value() && temperature_trend.has_value() &&
               (temperature_trend->rate_of_change * 60.0) >= static_cast<double>(config_.rising_rate_per_min)) {
      intents.push_back({IntentKind::ACTIVATE_VENTILATION, model::Actuator::VENTILATION, 1, model::AlarmState::OFF,
                         "temperature rising"});
    }
    return intents;
  }

  if (!t.has_value() && !h.has_value()) {
    return intents;
  }

  // An absent metric does not hold the fan on.
  const bool temperature_allows_off = !overheat && (!t.has_value() || *t <= temp.low);
  const bool humidity_allows_off = !h.has_value() || *h <= hum.low;
  if (temperature_allows_off && humidity_allows_off) {
    intents.push_back({IntentKind::DEACTIVATE_VENTILATION, model::Actuator::VENTILATION, 0, model::AlarmState::OFF,
                       "all metrics below low threshold"});
  }

  return intents;
}

}  // namespace rack_guard::decision
