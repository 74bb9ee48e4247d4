#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace rack_guard::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

long long parse_positive(const std::string& key, const std::string& value) {
  const auto parsed = std::stoll(value);
  if (parsed <= 0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return parsed;
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  transport::RedisOptions& options = redis.options;
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    options.unix_socket = value.substr(std::string("unix://").size());
    options.host.clear();
    options.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    options.unix_socket = value;
    options.host.clear();
    options.port = 0;
    return;
  }

  options.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    options.host = value;
    return;
  }

  options.host = value.substr(0, split);
  const auto parsed_port = std::stoi(value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }
  options.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_threshold(decision::ThresholdConfig& thresholds, const std::string& key, const std::string& field,
                     const std::string& value) {
  if (field == "high") {
    thresholds.high = std::stof(value);
  } else if (field == "low") {
    thresholds.low = std::stof(value);
  } else if (field == "critical") {
    thresholds.critical = std::stof(value);
  } else if (field == "critical_reset") {
    thresholds.critical_reset = std::stof(value);
  } else {
    throw std::runtime_error("unknown threshold key: " + key);
  }
}

void apply_key_value(ControllerConfig& config, const std::string& key, const std::string& value) {
  if (key == "tick_rate_hz") {
    const auto hz = std::stoi(value);
    if (hz <= 0) {
      throw std::runtime_error("tick_rate_hz must be greater than 0");
    }

    if (hz > 1000) {
      throw std::runtime_error("tick_rate_hz must be less than or equal to 1000");
    }

    config.tick_interval = std::chrono::milliseconds(1000 / hz);
    return;
  }

  if (key == "base_topic") {
    std::string base = value;
    while (!base.empty() && base.back() == '/') {
      base.pop_back();
    }
    if (base.empty()) {
      throw std::runtime_error("base_topic must not be empty");
    }
    config.base_topic = base;
    return;
  }

  if (key == "command.timeout_ms") {
    config.command.timeout = std::chrono::milliseconds(parse_positive(key, value));
    return;
  }

  if (key == "command.sweep_interval_ms") {
    config.command.sweep_interval = std::chrono::milliseconds(parse_positive(key, value));
    return;
  }

  if (key.rfind("thresholds.temperature.", 0) == 0) {
    apply_threshold(config.engine.temperature, key, key.substr(std::string("thresholds.temperature.").size()), value);
    return;
  }

  if (key.rfind("thresholds.humidity.", 0) == 0) {
    apply_threshold(config.engine.humidity, key, key.substr(std::string("thresholds.humidity.").size()), value);
    return;
  }

  if (key == "trend.max_samples") {
    config.trend.max_samples = static_cast<std::size_t>(parse_positive(key, value));
    return;
  }

  if (key == "trend.retention_s") {
    config.trend.retention = std::chrono::seconds(parse_positive(key, value));
    return;
  }

  if (key == "trend.min_samples") {
    const auto min_samples = parse_positive(key, value);
    if (min_samples < 2) {
      throw std::runtime_error("trend.min_samples must be at least 2");
    }
    config.trend.min_samples = static_cast<std::size_t>(min_samples);
    return;
  }

  if (key == "trend.anticipation") {
    config.engine.anticipation = parse_bool(value);
    return;
  }

  if (key == "trend.rising_rate_per_min") {
    config.engine.rising_rate_per_min = std::stof(value);
    if (config.engine.rising_rate_per_min <= 0.0F) {
      throw std::runtime_error("trend.rising_rate_per_min must be greater than 0");
    }
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "agent.status_every_ticks") {
    config.status_every_ticks = static_cast<std::uint64_t>(parse_positive(key, value));
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.password") {
    config.redis.options.password = value;
    return;
  }

  if (key == "redis.db") {
    const auto db = std::stoi(value);
    if (db < 0) {
      throw std::runtime_error("redis.db must be greater than or equal to 0");
    }
    config.redis.options.db = db;
    return;
  }

  if (key == "device.queue_capacity") {
    config.device.queue_capacity = static_cast<std::size_t>(parse_positive(key, value));
  }
}

void validate(const ControllerConfig& config) {
  if (!decision::thresholds_valid(config.engine.temperature)) {
    throw std::runtime_error("thresholds.temperature must satisfy low < high <= critical_reset < critical");
  }
  if (!decision::thresholds_valid(config.engine.humidity)) {
    throw std::runtime_error("thresholds.humidity must satisfy low < high <= critical_reset < critical");
  }
  if (config.command.sweep_interval > config.command.timeout) {
    throw std::runtime_error("command.sweep_interval_ms must not exceed command.timeout_ms");
  }
}

}  // namespace

ControllerConfig load_controller_config(const std::string& path) {
  ControllerConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }
    if (depth > sections.size()) {
      throw std::runtime_error("config line '" + key + "' is indented past its parent section");
    }

    if (value.empty()) {
      sections.push_back(key);
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate(config);
  return config;
}

}  // namespace rack_guard::core
