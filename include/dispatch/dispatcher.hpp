#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "model/rack.hpp"
#include "transport/transport.hpp"

namespace rack_guard::dispatch {

enum class CommandStatus : std::uint8_t {
  ACKNOWLEDGED,
  EXPIRED,
};

enum class IssueError : std::uint8_t {
  NONE,
  REJECTED,
};

struct CommandHandle {
  std::uint64_t sequence{0};
  std::string rack_id{};
  model::Actuator actuator{model::Actuator::DOOR};
};

struct CommandOutcome {
  CommandHandle handle{};
  CommandStatus status{CommandStatus::EXPIRED};
  std::int32_t desired_value{0};
  std::optional<std::int32_t> achieved_value{};
  std::uint64_t issued_at_ns{0};
  std::uint64_t resolved_at_ns{0};
};

// Called exactly once per accepted command, outside the dispatcher lock.
using ResultSink = std::function<void(const CommandOutcome&)>;

struct IssueResult {
  std::optional<CommandHandle> handle{};
  IssueError error{IssueError::NONE};

  [[nodiscard]] bool accepted() const noexcept { return handle.has_value(); }
};

struct DispatcherOptions {
  std::string base_topic{"racks"};
  std::chrono::milliseconds timeout{5000};
  std::chrono::milliseconds sweep_interval{500};
};

struct DispatcherStats {
  std::size_t issued{0};
  std::size_t rejected{0};
  std::size_t acknowledged{0};
  std::size_t expired{0};
  std::size_t unmatched_acks{0};
  std::size_t publish_failures{0};
};

// Owns the pending-command table and the confirmed rack store. Every
// access goes through one mutex shared by the issue, ack and sweep paths.
class Dispatcher {
 public:
  using Clock = std::function<std::uint64_t()>;

  Dispatcher(transport::Transport& transport, DispatcherOptions options);
  Dispatcher(transport::Transport& transport, DispatcherOptions options, Clock clock);
  ~Dispatcher();

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;
  Dispatcher(Dispatcher&&) = delete;
  Dispatcher& operator=(Dispatcher&&) = delete;

  IssueResult issue(const std::string& rack_id, model::Actuator actuator, std::int32_t desired_value, ResultSink sink);
  // Returns true when the ack resolved a live pending command.
  bool on_ack_received(const std::string& rack_id, model::Actuator actuator, std::int32_t achieved_value);
  std::size_t sweep_expired(std::uint64_t now_ns);

  void start_sweeper();
  void stop_sweeper();

  void record_telemetry(const std::string& rack_id, model::Metric metric, float value, std::uint64_t timestamp_ns);
  void record_door(const std::string& rack_id, bool open, std::uint64_t timestamp_ns);
  void record_tilt(const std::string& rack_id, bool tilted, std::uint64_t timestamp_ns);
  void record_presence(const std::string& rack_id, bool online, std::uint64_t timestamp_ns);
  void record_location(const std::string& rack_id, double latitude, double longitude, std::uint64_t timestamp_ns);

  [[nodiscard]] std::optional<model::Rack> rack(const std::string& rack_id) const;
  [[nodiscard]] std::vector<model::Rack> snapshot() const;
  [[nodiscard]] bool has_pending(const std::string& rack_id, model::Actuator actuator) const;
  [[nodiscard]] std::size_t pending_count() const;
  [[nodiscard]] DispatcherStats stats() const;
  [[nodiscard]] const DispatcherOptions& options() const noexcept;

 private:
  struct PendingCommand {
    CommandHandle handle;
    std::int32_t desired_value;
    std::uint64_t issued_at_ns;
    std::uint64_t deadline_ns;
    ResultSink sink;
  };

  using Key = std::pair<std::string, model::Actuator>;
  using Resolution = std::pair<ResultSink, CommandOutcome>;

  model::Rack& ensure_rack_locked(const std::string& rack_id, std::uint64_t timestamp_ns);
  static void apply_confirmed(model::Rack& rack, model::Actuator actuator, std::int32_t achieved_value);
  static Resolution expire(PendingCommand& pending, std::uint64_t now_ns);
  static void deliver(std::vector<Resolution>& resolutions);
  void sweeper_loop();

  transport::Transport& transport_;
  DispatcherOptions options_;
  Clock clock_;

  mutable std::mutex mutex_;
  std::map<Key, PendingCommand> pending_;
  std::map<std::string, model::Rack> racks_;
  std::uint64_t next_sequence_{1};
  DispatcherStats stats_{};

  std::mutex sweeper_mutex_;
  std::condition_variable sweeper_cv_;
  bool sweeper_running_{false};
  std::thread sweeper_;
};

}  // namespace rack_guard::dispatch
