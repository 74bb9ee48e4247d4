#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "model/rack.hpp"

namespace rack_guard::trend {

struct TrendOptions {
  std::size_t max_samples{3600};
  std::chrono::seconds retention{3600};
  std::size_t min_samples{2};
};

struct TrendEstimate {
  double window_mean{0.0};
  // Least-squares slope, value units per second.
  double rate_of_change{0.0};
  std::size_t sample_count{0};
};

// Rolling window of telemetry per (rack, metric). Eviction is by count and
// by age relative to the newest retained sample.
class TrendEstimator {
 public:
  explicit TrendEstimator(TrendOptions options = {});

  bool ingest(const std::string& rack_id, model::Metric metric, double value, std::uint64_t timestamp_ns);
  [[nodiscard]] std::optional<TrendEstimate> estimate(const std::string& rack_id, model::Metric metric) const;
  [[nodiscard]] std::size_t sample_count(const std::string& rack_id, model::Metric metric) const;

 private:
  struct Sample {
    std::uint64_t timestamp_ns;
    double value;
  };

  using Key = std::pair<std::string, model::Metric>;

  void evict(std::deque<Sample>& window) const;

  TrendOptions options_;
  mutable std::mutex mutex_;
  std::map<Key, std::deque<Sample>> windows_;
};

}  // namespace rack_guard::trend
