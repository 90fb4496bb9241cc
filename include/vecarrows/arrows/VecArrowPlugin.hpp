#pragma once

#include <memory>

#include <vecarrows/arrows/VecArrowSystem.hpp>

namespace VecArrows {
class VecArrowPlugin {
 public:
  // Registers the attach, update and detach reactions on the game's stages.
  // Falls back to the game's own pool when pool is nullptr; fails when
  // neither is set.
  static bool Build(GameInstance* game, ResourcePool* pool = nullptr);
};
}  // namespace VecArrows
