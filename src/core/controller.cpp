#include "core/controller.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/timestamp.hpp"

namespace rack_guard::core {
namespace {

transport::Transport& require_transport(const std::unique_ptr<transport::Transport>& transport) {
  if (transport == nullptr) {
    throw std::invalid_argument("controller requires a transport");
  }
  return *transport;
}

dispatch::DispatcherOptions dispatcher_options(const ControllerConfig& config) {
  dispatch::DispatcherOptions options{};
  options.base_topic = config.base_topic;
  options.timeout = config.command.timeout;
  options.sweep_interval = config.command.sweep_interval;
  return options;
}

std::optional<model::Metric> parse_metric(const std::string& name) {
  if (name == "temperature") {
    return model::Metric::TEMPERATURE;
  }
  if (name == "humidity") {
    return model::Metric::HUMIDITY;
  }
  return std::nullopt;
}

}  // namespace

Controller::Controller(ControllerConfig config, std::unique_ptr<transport::Transport> transport)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      dispatcher_(require_transport(transport_), dispatcher_options(config_)),
      control_(dispatcher_),
      trend_(config_.trend),
      engine_(config_.engine) {}

Controller::~Controller() { stop(); }

bool Controller::start() {
  if (started_) {
    return true;
  }

  const auto handler = [this](const std::string& topic, const std::string& payload) { on_message(topic, payload); };
  for (const char* suffix : {"ack/+", "environment/+", "status", "location", "tilt"}) {
    const std::string filter = model::any_rack_filter(config_.base_topic, suffix);
    if (!transport_->subscribe(filter, handler)) {
      std::cerr << "[controller] subscribe failed for " << filter << '\n';
      return false;
    }
  }

  if (!transport_->start()) {
    std::cerr << "[controller] transport failed to start\n";
    return false;
  }

  dispatcher_.start_sweeper();
  started_ = true;
  std::cerr << "[controller] listening on " << config_.base_topic << "/+/... | command_timeout_ms="
            << config_.command.timeout.count() << " | sweep_interval_ms=" << config_.command.sweep_interval.count()
            << '\n';
  return true;
}

void Controller::stop() {
  if (!started_) {
    return;
  }
  dispatcher_.stop_sweeper();
  transport_->stop();
  started_ = false;
}

ControllerStats Controller::run_for_ticks(const std::size_t total_ticks) {
  ControllerStats stats{};

  if (first_tick_) {
    next_wakeup_ = std::chrono::steady_clock::now();
    first_tick_ = false;
  }

  for (std::size_t i = 0; total_ticks == 0 || i < total_ticks; ++i) {
    evaluate_racks(stats);
    publish_sinks(stats);

    ++stats.ticks_executed;
    ++tick_count_;

    next_wakeup_ += config_.tick_interval;
    std::this_thread::sleep_until(next_wakeup_);
  }

  return stats;
}

void Controller::evaluate_racks(ControllerStats& stats) {
  ++stats.evaluation_cycles;

  for (const auto& rack : dispatcher_.snapshot()) {
    const auto temperature_trend = trend_.estimate(rack.id, model::Metric::TEMPERATURE);
    for (const auto& intent : engine_.evaluate(rack, temperature_trend)) {
      // One command per actuator in flight; re-evaluated once it resolves.
      if (dispatcher_.has_pending(rack.id, intent.actuator)) {
        ++stats.intents_deferred;
        continue;
      }
      if (issue_intent(rack, intent)) {
        ++stats.intents_issued;
      } else {
        ++stats.intents_deferred;
      }
    }
  }
}

bool Controller::issue_intent(const model::Rack& rack, const decision::ActionIntent& intent) {
  const std::string rack_id = rack.id;
  const char* kind = decision::intent_name(intent.kind);
  const char* reason = intent.reason;

  const auto result = dispatcher_.issue(rack.id, intent.actuator, intent.value,
                                        [this, rack_id, kind](const dispatch::CommandOutcome& outcome) {
                                          if (outcome.status == dispatch::CommandStatus::ACKNOWLEDGED) {
                                            commands_confirmed_.fetch_add(1, std::memory_order_relaxed);
                                            std::cerr << "[controller] " << rack_id << ' ' << kind << " confirmed ("
                                                      << model::actuator_name(outcome.handle.actuator) << '='
                                                      << outcome.achieved_value.value_or(outcome.desired_value)
                                                      << ")\n";
                                            return;
                                          }
                                          commands_unconfirmed_.fetch_add(1, std::memory_order_relaxed);
                                          std::cerr << "[controller] " << rack_id << ' ' << kind
                                                    << " not acknowledged before timeout\n";
                                        });

  if (!result.accepted()) {
    return false;
  }

  std::cerr << "[controller] " << rack_id << ' ' << kind << " (" << reason << ") -> command #"
            << result.handle->sequence << '\n';
  return true;
}

void Controller::publish_sinks(ControllerStats& stats) {
  if (!config_.stdout_debug || tick_count_ % config_.status_every_ticks != 0) {
    return;
  }
  ++stats.status_cycles;
  stdout_sink_.publish(dispatcher_.snapshot(), dispatcher_.pending_count());
}

void Controller::on_message(const std::string& topic, const std::string& payload) {
  const auto parsed = model::parse_topic(config_.base_topic, topic);
  if (!parsed.has_value()) {
    note_malformed(topic, payload);
    return;
  }

  const std::uint64_t now_ns = monotonic_timestamp_now_ns();
  switch (parsed->kind) {
    case model::TopicKind::ENVIRONMENT:
      handle_environment(*parsed, payload, now_ns);
      break;
    case model::TopicKind::STATUS:
      handle_status(*parsed, payload, now_ns);
      break;
    case model::TopicKind::LOCATION:
      handle_location(*parsed, payload, now_ns);
      break;
    case model::TopicKind::ACK:
      handle_ack(*parsed, payload);
      break;
    case model::TopicKind::COMMAND:
      break;
  }
}

void Controller::handle_environment(const model::Topic& topic, const std::string& payload, const std::uint64_t now_ns) {
  if (topic.leaf == "door" || topic.leaf == "tilt") {
    const auto flag = model::parse_flag_payload(payload);
    if (!flag.has_value()) {
      note_malformed(topic.rack_id + "/" + topic.leaf, payload);
      return;
    }
    if (topic.leaf == "door") {
      dispatcher_.record_door(topic.rack_id, *flag, now_ns);
    } else {
      dispatcher_.record_tilt(topic.rack_id, *flag, now_ns);
    }
    return;
  }

  const auto metric = parse_metric(topic.leaf);
  const auto value = model::parse_float_payload(payload);
  if (!metric.has_value() || !value.has_value()) {
    note_malformed(topic.rack_id + "/" + topic.leaf, payload);
    return;
  }

  dispatcher_.record_telemetry(topic.rack_id, *metric, *value, now_ns);
  trend_.ingest(topic.rack_id, *metric, *value, now_ns);
}

void Controller::handle_status(const model::Topic& topic, const std::string& payload, const std::uint64_t now_ns) {
  if (payload == "online" || payload == "offline") {
    const bool online = payload == "online";
    const auto previous = dispatcher_.rack(topic.rack_id);
    dispatcher_.record_presence(topic.rack_id, online, now_ns);
    if (!previous.has_value() || previous->online != online) {
      std::cerr << "[controller] rack " << topic.rack_id << " is " << payload << '\n';
    }
    return;
  }

  // Bare 0/1 status carries the door sensor.
  const auto door_open = model::parse_flag_payload(payload);
  if (!door_open.has_value()) {
    note_malformed(topic.rack_id + "/status", payload);
    return;
  }
  dispatcher_.record_door(topic.rack_id, *door_open, now_ns);
}

void Controller::handle_location(const model::Topic& topic, const std::string& payload, const std::uint64_t now_ns) {
  const auto location = nlohmann::json::parse(payload, nullptr, false);
  if (location.is_discarded() || !location.is_object()) {
    note_malformed(topic.rack_id + "/location", payload);
    return;
  }

  const auto latitude = location.find("latitude");
  const auto longitude = location.find("longitude");
  if (latitude == location.end() || longitude == location.end() || !latitude->is_number() ||
      !longitude->is_number()) {
    note_malformed(topic.rack_id + "/location", payload);
    return;
  }

  dispatcher_.record_location(topic.rack_id, latitude->get<double>(), longitude->get<double>(), now_ns);
}

void Controller::handle_ack(const model::Topic& topic, const std::string& payload) {
  const auto actuator = model::parse_actuator(topic.leaf);
  const auto achieved = model::parse_int_payload(payload);
  if (!actuator.has_value() || !achieved.has_value()) {
    note_malformed(topic.rack_id + "/ack/" + topic.leaf, payload);
    return;
  }
  dispatcher_.on_ack_received(topic.rack_id, *actuator, *achieved);
}

void Controller::note_malformed(const std::string& topic, const std::string& payload) {
  const std::size_t count = malformed_messages_.fetch_add(1, std::memory_order_relaxed) + 1;
  std::cerr << "[controller] dropped malformed message on " << topic << " payload='" << payload
            << "' (total " << count << ")\n";
}

dispatch::Dispatcher& Controller::dispatcher() noexcept { return dispatcher_; }

dispatch::RackControl& Controller::control() noexcept { return control_; }

const trend::TrendEstimator& Controller::trend() const noexcept { return trend_; }

transport::Transport& Controller::transport() noexcept { return *transport_; }

std::size_t Controller::malformed_messages() const noexcept {
  return malformed_messages_.load(std::memory_order_relaxed);
}

std::size_t Controller::commands_confirmed() const noexcept {
  return commands_confirmed_.load(std::memory_order_relaxed);
}

std::size_t Controller::commands_unconfirmed() const noexcept {
  return commands_unconfirmed_.load(std::memory_order_relaxed);
}

}  // namespace rack_guard::core
