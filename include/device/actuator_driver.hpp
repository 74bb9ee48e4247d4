#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "model/rack.hpp"

namespace rack_guard::device {

// Hardware side of the executor. Only the executor's worker thread calls
// apply(); current() may be read from any thread.
class ActuatorDriver {
 public:
  // Drives the actuator toward desired and returns the value actually reached.
  virtual std::int32_t apply(model::Actuator actuator, std::int32_t desired) = 0;
  virtual std::int32_t current(model::Actuator actuator) const = 0;
  virtual ~ActuatorDriver() = default;
};

std::unique_ptr<ActuatorDriver> make_simulated_driver(std::string rack_id);

}  // namespace rack_guard::device
