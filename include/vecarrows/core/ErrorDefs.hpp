#pragma once

namespace VecArrows {
// process exit codes
enum VECARROWS_EXIT : int {
  SUCCESS = 0,
  ARGUMENT_PARSING_ERROR = 1,
  MISSING_ARGUMENT = 2,
  INVALID_ENGINE_CONFIG = 3,
  INVALID_SCENE_CONFIG = 4,
  ARROW_PART_MISSING = 5,
  PLUGIN_INSTALL_ERROR = 6,
};
}  // namespace VecArrows
