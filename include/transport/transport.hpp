#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace rack_guard::transport {

// Invoked on the transport's delivery thread.
using MessageHandler = std::function<void(const std::string& topic, const std::string& payload)>;

class Transport {
 public:
  virtual bool publish(const std::string& topic, const std::string& payload) = 0;
  // Filters use '+' for one level and a trailing '#' for the remainder.
  // Subscriptions must be registered before start().
  virtual bool subscribe(const std::string& filter, MessageHandler handler) = 0;
  virtual bool start() = 0;
  virtual void stop() = 0;
  virtual ~Transport() = default;
};

struct RedisOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::uint32_t connect_timeout_ms{1000};
  std::uint32_t reconnect_backoff_ms{1000};
};

std::unique_ptr<Transport> make_redis_transport(RedisOptions options);
std::unique_ptr<Transport> make_loopback_transport();

}  // namespace rack_guard::transport
