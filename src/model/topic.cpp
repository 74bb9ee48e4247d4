#include "model/topic.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

namespace rack_guard::model {

namespace {

std::vector<std::string_view> split_levels(std::string_view topic) {
  std::vector<std::string_view> levels;
  std::size_t start = 0;
  while (true) {
    const auto slash = topic.find('/', start);
    if (slash == std::string_view::npos) {
      levels.push_back(topic.substr(start));
      break;
    }
    levels.push_back(topic.substr(start, slash - start));
    start = slash + 1;
  }
  return levels;
}

std::string_view trim(std::string_view value) noexcept {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())) != 0) {
    value.remove_prefix(1);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())) != 0) {
    value.remove_suffix(1);
  }
  return value;
}

std::string join(std::string_view base, std::string_view rack_id, std::string_view suffix) {
  std::string topic;
  topic.reserve(base.size() + rack_id.size() + suffix.size() + 2);
  topic.append(base);
  topic.push_back('/');
  topic.append(rack_id);
  topic.push_back('/');
  topic.append(suffix);
  return topic;
}

}  // namespace

std::string command_topic(const std::string_view base, const std::string_view rack_id, const Actuator actuator) {
  return join(base, rack_id, std::string("command/") + actuator_name(actuator));
}

std::string ack_topic(const std::string_view base, const std::string_view rack_id, const Actuator actuator) {
  return join(base, rack_id, std::string("ack/") + actuator_name(actuator));
}

std::string environment_topic(const std::string_view base, const std::string_view rack_id, const std::string_view name) {
  return join(base, rack_id, std::string("environment/").append(name));
}

std::string status_topic(const std::string_view base, const std::string_view rack_id) {
  return join(base, rack_id, "status");
}

std::string location_topic(const std::string_view base, const std::string_view rack_id) {
  return join(base, rack_id, "location");
}

std::string any_rack_filter(const std::string_view base, const std::string_view suffix) {
  return join(base, "+", suffix);
}

std::optional<Topic> parse_topic(const std::string_view base, const std::string_view topic) {
  if (topic.size() <= base.size() + 1 || topic.compare(0, base.size(), base) != 0 || topic[base.size()] != '/') {
    return std::nullopt;
  }

  const auto levels = split_levels(topic.substr(base.size() + 1));
  if (levels.size() < 2 || levels[0].empty()) {
    return std::nullopt;
  }

  Topic parsed{};
  parsed.rack_id = std::string(levels[0]);
  const std::string_view kind = levels[1];

  if (levels.size() == 2) {
    if (kind == "status") {
      parsed.kind = TopicKind::STATUS;
      return parsed;
    }
    if (kind == "location") {
      parsed.kind = TopicKind::LOCATION;
      return parsed;
    }
    if (kind == "tilt") {
      parsed.kind = TopicKind::ENVIRONMENT;
      parsed.leaf = "tilt";
      return parsed;
    }
    return std::nullopt;
  }

  if (levels.size() != 3 || levels[2].empty()) {
    return std::nullopt;
  }

  if (kind == "command") {
    parsed.kind = TopicKind::COMMAND;
  } else if (kind == "ack") {
    parsed.kind = TopicKind::ACK;
  } else if (kind == "environment") {
    parsed.kind = TopicKind::ENVIRONMENT;
  } else {
    return std::nullopt;
  }
  parsed.leaf = std::string(levels[2]);
  return parsed;
}

bool topic_matches(const std::string_view filter, const std::string_view topic) noexcept {
  std::size_t f = 0;
  std::size_t t = 0;
  while (f < filter.size()) {
    const auto f_end = std::min(filter.find('/', f), filter.size());
    const std::string_view level = filter.substr(f, f_end - f);

    if (level == "#") {
      return f_end == filter.size();
    }
    if (t > topic.size()) {
      return false;
    }

    const auto t_end = std::min(topic.find('/', t), topic.size());
    if (level != "+" && level != topic.substr(t, t_end - t)) {
      return false;
    }

    f = f_end + 1;
    t = t_end + 1;
  }
  return t > topic.size();
}

std::optional<bool> parse_flag_payload(const std::string_view payload) noexcept {
  const auto value = trim(payload);
  if (value == "1" || value == "true" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "off") {
    return false;
  }
  return std::nullopt;
}

std::optional<float> parse_float_payload(const std::string_view payload) noexcept {
  const auto value = trim(payload);
  if (value.empty() || value.size() >= 64) {
    return std::nullopt;
  }

  char buffer[64]{};
  std::copy(value.begin(), value.end(), buffer);
  char* end = nullptr;
  const float parsed = std::strtof(buffer, &end);
  if (end == buffer || *end != '\0' || !std::isfinite(parsed)) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<std::int32_t> parse_int_payload(const std::string_view payload) noexcept {
  const auto value = trim(payload);
  std::int32_t parsed = 0;
  const auto result = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (result.ec != std::errc{} || result.ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return parsed;
}

std::string format_float_payload(const float value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.2f", static_cast<double>(value));
  return buffer;
}

}  // namespace rack_guard::model
