#pragma once

#include <cstddef>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/rack.hpp"

namespace rack_guard::sinks {

nlohmann::json rack_to_json(const model::Rack& rack);

class StdoutDebugSink {
 public:
  void publish(const std::vector<model::Rack>& racks, std::size_t pending_commands) const;
};

}  // namespace rack_guard::sinks
