#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "core/config.hpp"
#include "decision/hysteresis_engine.hpp"
#include "dispatch/dispatcher.hpp"
#include "dispatch/rack_control.hpp"
#include "model/topic.hpp"
#include "sinks/stdout_debug.hpp"
#include "transport/transport.hpp"
#include "trend/trend_estimator.hpp"

namespace rack_guard::core {

struct ControllerStats {
  std::size_t ticks_executed{0};
  std::size_t evaluation_cycles{0};
  std::size_t intents_issued{0};
  std::size_t intents_deferred{0};
  std::size_t status_cycles{0};
};

class Controller {
 public:
  Controller(ControllerConfig config, std::unique_ptr<transport::Transport> transport);
  ~Controller();

  Controller(const Controller&) = delete;
  Controller& operator=(const Controller&) = delete;

  // Subscribes to rack topics, starts the transport and the expiry sweeper.
  bool start();
  void stop();

  ControllerStats run_for_ticks(std::size_t total_ticks);

  // One decision cycle over every known rack.
  void evaluate_racks(ControllerStats& stats);

  void on_message(const std::string& topic, const std::string& payload);

  dispatch::Dispatcher& dispatcher() noexcept;
  dispatch::RackControl& control() noexcept;
  const trend::TrendEstimator& trend() const noexcept;
  transport::Transport& transport() noexcept;

  [[nodiscard]] std::size_t malformed_messages() const noexcept;
  [[nodiscard]] std::size_t commands_confirmed() const noexcept;
  [[nodiscard]] std::size_t commands_unconfirmed() const noexcept;

 private:
  void handle_environment(const model::Topic& topic, const std::string& payload, std::uint64_t now_ns);
  void handle_status(const model::Topic& topic, const std::string& payload, std::uint64_t now_ns);
  void handle_location(const model::Topic& topic, const std::string& payload, std::uint64_t now_ns);
  void handle_ack(const model::Topic& topic, const std::string& payload);
  bool issue_intent(const model::Rack& rack, const decision::ActionIntent& intent);
  void publish_sinks(ControllerStats& stats);
  void note_malformed(const std::string& topic, const std::string& payload);

  ControllerConfig config_;
  std::unique_ptr<transport::Transport> transport_;
  dispatch::Dispatcher dispatcher_;
  dispatch::RackControl control_;
  trend::TrendEstimator trend_;
  decision::HysteresisEngine engine_;
  sinks::StdoutDebugSink stdout_sink_{};

  std::chrono::steady_clock::time_point next_wakeup_{};
  bool first_tick_{true};
  std::uint64_t tick_count_{0};
  bool started_{false};

  std::atomic<std::size_t> malformed_messages_{0};
  std::atomic<std::size_t> commands_confirmed_{0};
  std::atomic<std::size_t> commands_unconfirmed_{0};
};

}  // namespace rack_guard::core
