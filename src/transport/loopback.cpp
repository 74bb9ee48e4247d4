#include "transport/transport.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "model/topic.hpp"

namespace rack_guard::transport {
namespace {

// In-process bus. Handlers run synchronously on the publishing thread.
class LoopbackTransport final : public Transport {
 public:
  bool publish(const std::string& topic, const std::string& payload) override {
    std::vector<MessageHandler> targets;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!running_) {
        return false;
      }
      for (const auto& subscription : subscriptions_) {
        if (model::topic_matches(subscription.first, topic)) {
          targets.push_back(subscription.second);
        }
      }
    }

    for (const auto& handler : targets) {
      handler(topic, payload);
    }
    return true;
  }

  bool subscribe(const std::string& filter, MessageHandler handler) override {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.emplace_back(filter, std::move(handler));
    return true;
  }

  bool start() override {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = true;
    return true;
  }

  void stop() override {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }

 private:
  std::mutex mutex_;
  std::vector<std::pair<std::string, MessageHandler>> subscriptions_;
  bool running_{false};
};

}  // namespace

std::unique_ptr<Transport> make_loopback_transport() { return std::make_unique<LoopbackTransport>(); }

}  // namespace rack_guard::transport
