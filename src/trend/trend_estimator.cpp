#include "trend/trend_estimator.hpp"

#include <algorithm>
#include <iterator>

#include "core/timestamp.hpp"

namespace rack_guard::trend {

namespace {
constexpr double kNanosPerSecond = 1'000'000'000.0;
}  // namespace

TrendEstimator::TrendEstimator(TrendOptions options) : options_(options) {
  if (options_.max_samples == 0) {
    options_.max_samples = 1;
  }
  if (options_.min_samples < 2) {
    options_.min_samples = 2;
  }
}

bool TrendEstimator::ingest(const std::string& rack_id, const model::Metric metric, const double value,
                            const std::uint64_t timestamp_ns) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& window = windows_[Key{rack_id, metric}];

  const std::uint64_t retention_ns = core::to_ns(options_.retention);
  if (!window.empty()) {
    const std::uint64_t newest = window.back().timestamp_ns;
    if (newest > retention_ns && timestamp_ns < newest - retention_ns) {
      return false;
    }
  }

  // Late samples are placed in timestamp order.
  auto position = window.end();
  while (position != window.begin() && std::prev(position)->timestamp_ns > timestamp_ns) {
    --position;
  }
  window.insert(position, Sample{timestamp_ns, value});

  evict(window);
  return true;
}

void TrendEstimator::evict(std::deque<Sample>& window) const {
  while (window.size() > options_.max_samples) {
    window.pop_front();
  }

  const std::uint64_t retention_ns = core::to_ns(options_.retention);
  const std::uint64_t newest = window.back().timestamp_ns;
  if (newest <= retention_ns) {
    return;
  }
  const std::uint64_t oldest_allowed = newest - retention_ns;
  while (!window.empty() && window.front().timestamp_ns < oldest_allowed) {
    window.pop_front();
  }
}

std::optional<TrendEstimate> TrendEstimator::estimate(const std::string& rack_id, const model::Metric metric) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = windows_.find(Key{rack_id, metric});
  if (it == windows_.end() || it->second.size() < options_.min_samples) {
    return std::nullopt;
  }

  const auto& window = it->second;
  const std::uint64_t origin = window.front().timestamp_ns;
  const auto count = static_cast<double>(window.size());

  double sum_t = 0.0;
  double sum_v = 0.0;
  for (const auto& sample : window) {
    sum_t += static_cast<double>(sample.timestamp_ns - origin) / kNanosPerSecond;
    sum_v += sample.value;
  }
  const double mean_t = sum_t / count;
  const double mean_v = sum_v / count;

  double sxx = 0.0;
  double sxy = 0.0;
  for (const auto& sample : window) {
    const double dt = (static_cast<double>(sample.timestamp_ns - origin) / kNanosPerSecond) - mean_t;
    sxx += dt * dt;
    sxy += dt * (sample.value - mean_v);
  }

  // All samples share one timestamp: no slope to report.
  if (sxx <= 0.0) {
    return std::nullopt;
  }

  TrendEstimate estimate{};
  estimate.window_mean = mean_v;
  estimate.rate_of_change = sxy / sxx;
  estimate.sample_count = window.size();
  return estimate;
}

std::size_t TrendEstimator::sample_count(const std::string& rack_id, const model::Metric metric) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = windows_.find(Key{rack_id, metric});
  return it == windows_.end() ? 0 : it->second.size();
}

}  // namespace rack_guard::trend
