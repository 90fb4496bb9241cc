#pragma once

#include <string>

#include <vecarrows/core/Scalar.hpp>
#include <vecarrows/core/ErrorDefs.hpp>

namespace VecArrows {

// the value of configs remain unchanged once the engine config has been loaded
struct EngineConfig {
  std::string log_path = "./log/";
  int log_level = 2;
  bool log_to_file = false;
  // number of ticks the headless engine runs a scene for
  uint num_ticks = 600;
  // log arrow state every n ticks, 0 disables the report
  uint report_interval = 60;
};

}  // namespace VecArrows
