#include "transport/transport.hpp"

#include <sys/socket.h>
#include <sys/time.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

#include "model/topic.hpp"

namespace rack_guard::transport {
namespace {

struct ContextDeleter {
  void operator()(redisContext* context) const {
    if (context != nullptr) {
      redisFree(context);
    }
  }
};

struct ReplyDeleter {
  void operator()(redisReply* reply) const {
    if (reply != nullptr) {
      freeReplyObject(reply);
    }
  }
};

using ContextPtr = std::unique_ptr<redisContext, ContextDeleter>;
using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

timeval to_timeval(const std::uint32_t ms) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(ms / 1000U);
  tv.tv_usec = static_cast<suseconds_t>((ms % 1000U) * 1000U);
  return tv;
}

// Redis glob patterns: '+' and '#' both widen to '*'. Exact matching is
// re-checked against the filter on delivery.
std::string to_redis_pattern(const std::string& filter) {
  std::string pattern;
  pattern.reserve(filter.size());
  for (const char c : filter) {
    switch (c) {
      case '+':
      case '#':
        pattern.push_back('*');
        break;
      case '*':
      case '?':
      case '[':
      case ']':
      case '\\':
        pattern.push_back('\\');
        pattern.push_back(c);
        break;
      default:
        pattern.push_back(c);
        break;
    }
  }
  return pattern;
}

ReplyPtr command_argv(redisContext* context, const std::vector<std::string>& args) {
  std::vector<const char*> argv;
  std::vector<std::size_t> argv_len;
  argv.reserve(args.size());
  argv_len.reserve(args.size());
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
    argv_len.push_back(arg.size());
  }
  return ReplyPtr(static_cast<redisReply*>(
      redisCommandArgv(context, static_cast<int>(argv.size()), argv.data(), argv_len.data())));
}

class RedisPubSubTransport final : public Transport {
 public:
  explicit RedisPubSubTransport(RedisOptions options) : options_(std::move(options)) {}

  ~RedisPubSubTransport() override { stop(); }

  RedisPubSubTransport(const RedisPubSubTransport&) = delete;
  RedisPubSubTransport& operator=(const RedisPubSubTransport&) = delete;

  bool publish(const std::string& topic, const std::string& payload) override {
    std::lock_guard<std::mutex> lock(publish_mutex_);
    bool ok = ensure_publisher() && publish_once(topic, payload);
    if (!ok) {
      publisher_.reset();
      ok = ensure_publisher() && publish_once(topic, payload);
    }

    if (!ok && publish_was_ok_) {
      std::cerr << "[redis] publish failed on " << topic << '\n';
      publish_was_ok_ = false;
    } else if (ok && !publish_was_ok_) {
      std::cerr << "[redis] publish recovered\n";
      publish_was_ok_ = true;
    }
    return ok;
  }

  bool subscribe(const std::string& filter, MessageHandler handler) override {
    std::lock_guard<std::mutex> lock(subscriber_mutex_);
    if (running_) {
      std::cerr << "[redis] subscribe after start is not supported: " << filter << '\n';
      return false;
    }
    subscriptions_.emplace_back(filter, std::move(handler));
    return true;
  }

  bool start() override {
    {
      std::lock_guard<std::mutex> lock(subscriber_mutex_);
      if (running_) {
        return true;
      }
      running_ = true;
    }

    {
      std::lock_guard<std::mutex> lock(publish_mutex_);
      if (!ensure_publisher()) {
        std::cerr << "[redis] publisher not connected yet; will retry on publish\n";
      }
    }

    reader_ = std::thread([this]() { reader_loop(); });
    return true;
  }

  void stop() override {
    {
      std::lock_guard<std::mutex> lock(subscriber_mutex_);
      if (!running_) {
        return;
      }
      running_ = false;
      if (subscriber_fd_ >= 0) {
        ::shutdown(subscriber_fd_, SHUT_RDWR);
      }
    }
    {
      std::lock_guard<std::mutex> wait_lock(wait_mutex_);
    }
    wait_cv_.notify_all();
    if (reader_.joinable()) {
      reader_.join();
    }

    std::lock_guard<std::mutex> lock(publish_mutex_);
    publisher_.reset();
  }

 private:
  ContextPtr connect() const {
    const timeval timeout = to_timeval(options_.connect_timeout_ms);
    redisContext* raw = nullptr;
    if (!options_.unix_socket.empty()) {
      raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
    } else {
      raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
    }

    if (raw == nullptr) {
      std::cerr << "[redis] connect failed: out of memory\n";
      return nullptr;
    }
    ContextPtr context(raw);
    if (context->err != REDIS_OK) {
      std::cerr << "[redis] connect failed: " << context->errstr << '\n';
      return nullptr;
    }

    if (!options_.password.empty()) {
      ReplyPtr reply(static_cast<redisReply*>(redisCommand(context.get(), "AUTH %s", options_.password.c_str())));
      if (reply == nullptr || reply->type == REDIS_REPLY_ERROR) {
        std::cerr << "[redis] AUTH rejected\n";
        return nullptr;
      }
    }

    if (options_.db != 0) {
      ReplyPtr reply(static_cast<redisReply*>(redisCommand(context.get(), "SELECT %d", options_.db)));
      if (reply == nullptr || reply->type == REDIS_REPLY_ERROR) {
        std::cerr << "[redis] SELECT " << options_.db << " rejected\n";
        return nullptr;
      }
    }

    return context;
  }

  bool ensure_publisher() {
    if (publisher_ != nullptr && publisher_->err == REDIS_OK) {
      return true;
    }
    publisher_ = connect();
    if (publisher_ == nullptr) {
      return false;
    }
    // Bound how long an issuing thread can stall on a dead broker.
    return redisSetTimeout(publisher_.get(), to_timeval(options_.connect_timeout_ms)) == REDIS_OK;
  }

  bool publish_once(const std::string& topic, const std::string& payload) {
    const ReplyPtr reply = command_argv(publisher_.get(), {"PUBLISH", topic, payload});
    return reply != nullptr && reply->type != REDIS_REPLY_ERROR;
  }

  bool subscribe_all(redisContext* context) {
    std::vector<std::string> patterns;
    {
      std::lock_guard<std::mutex> lock(subscriber_mutex_);
      for (const auto& subscription : subscriptions_) {
        patterns.push_back(to_redis_pattern(subscription.first));
      }
    }

    for (const auto& pattern : patterns) {
      const ReplyPtr reply = command_argv(context, {"PSUBSCRIBE", pattern});
      if (reply == nullptr || reply->type == REDIS_REPLY_ERROR) {
        std::cerr << "[redis] PSUBSCRIBE " << pattern << " failed\n";
        return false;
      }
    }
    return true;
  }

  void reader_loop() {
    bool was_connected = true;
    while (running_) {
      ContextPtr context = connect();
      if (context != nullptr && redisSetTimeout(context.get(), timeval{}) == REDIS_OK &&
          subscribe_all(context.get())) {
        {
          std::lock_guard<std::mutex> lock(subscriber_mutex_);
          if (!running_) {
            break;
          }
          subscriber_fd_ = context->fd;
        }
        if (!was_connected) {
          std::cerr << "[redis] subscriber reconnected\n";
        }
        was_connected = true;

        read_messages(context.get());

        std::lock_guard<std::mutex> lock(subscriber_mutex_);
        subscriber_fd_ = -1;
      } else if (was_connected) {
        std::cerr << "[redis] subscriber unavailable; retrying every " << options_.reconnect_backoff_ms << " ms\n";
        was_connected = false;
      }

      std::unique_lock<std::mutex> lock(wait_mutex_);
      wait_cv_.wait_for(lock, std::chrono::milliseconds(options_.reconnect_backoff_ms),
                        [this]() { return !running_; });
    }
  }

  void read_messages(redisContext* context) {
    while (running_) {
      void* raw = nullptr;
      if (redisGetReply(context, &raw) != REDIS_OK) {
        if (running_) {
          std::cerr << "[redis] subscriber connection lost: " << context->errstr << '\n';
        }
        return;
      }

      const ReplyPtr reply(static_cast<redisReply*>(raw));
      if (reply == nullptr || reply->type != REDIS_REPLY_ARRAY || reply->elements != 4) {
        continue;
      }

      const redisReply* kind = reply->element[0];
      const redisReply* pattern = reply->element[1];
      const redisReply* channel = reply->element[2];
      const redisReply* payload = reply->element[3];
      if (kind->str == nullptr || std::strcmp(kind->str, "pmessage") != 0 || pattern->str == nullptr || channel->str == nullptr ||
          payload->str == nullptr) {
        continue;
      }

      deliver(std::string(pattern->str, pattern->len), std::string(channel->str, channel->len),
              std::string(payload->str, payload->len));
    }
  }

  // Redis sends one pmessage per matching pattern and its '*' crosses '/',
  // so only subscriptions behind the reported pattern take the message.
  void deliver(const std::string& pattern, const std::string& topic, const std::string& payload) {
    std::vector<MessageHandler> targets;
    {
      std::lock_guard<std::mutex> lock(subscriber_mutex_);
      for (const auto& subscription : subscriptions_) {
        if (to_redis_pattern(subscription.first) == pattern && model::topic_matches(subscription.first, topic)) {
          targets.push_back(subscription.second);
        }
      }
    }

    for (const auto& handler : targets) {
      try {
        handler(topic, payload);
      } catch (const std::exception& ex) {
        std::cerr << "[redis] handler failed on " << topic << ": " << ex.what() << '\n';
      }
    }
  }

  RedisOptions options_;

  std::mutex publish_mutex_;
  ContextPtr publisher_;
  bool publish_was_ok_{true};

  std::mutex subscriber_mutex_;
  std::vector<std::pair<std::string, MessageHandler>> subscriptions_;
  std::atomic<bool> running_{false};
  int subscriber_fd_{-1};

  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;
  std::thread reader_;
};

}  // namespace

std::unique_ptr<Transport> make_redis_transport(RedisOptions options) {
  return std::make_unique<RedisPubSubTransport>(std::move(options));
}

}  // namespace rack_guard::transport
