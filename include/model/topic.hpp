#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "model/rack.hpp"

namespace rack_guard::model {

enum class TopicKind : std::uint8_t {
  COMMAND,
  ACK,
  ENVIRONMENT,
  STATUS,
  LOCATION,
};

// {base}/{rack_id}/{kind}[/{leaf}]
struct Topic {
  std::string rack_id{};
  TopicKind kind{TopicKind::STATUS};
  std::string leaf{};
};

std::string command_topic(std::string_view base, std::string_view rack_id, Actuator actuator);
std::string ack_topic(std::string_view base, std::string_view rack_id, Actuator actuator);
std::string environment_topic(std::string_view base, std::string_view rack_id, std::string_view name);
std::string status_topic(std::string_view base, std::string_view rack_id);
std::string location_topic(std::string_view base, std::string_view rack_id);

// Filter over every rack: {base}/+/{suffix}
std::string any_rack_filter(std::string_view base, std::string_view suffix);

std::optional<Topic> parse_topic(std::string_view base, std::string_view topic);

// MQTT-style matching: '+' is exactly one level, a trailing '#' is any remainder.
bool topic_matches(std::string_view filter, std::string_view topic) noexcept;

std::optional<bool> parse_flag_payload(std::string_view payload) noexcept;
std::optional<float> parse_float_payload(std::string_view payload) noexcept;
std::optional<std::int32_t> parse_int_payload(std::string_view payload) noexcept;
std::string format_float_payload(float value);

}  // namespace rack_guard::model
