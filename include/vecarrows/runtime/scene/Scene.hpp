#pragma once

#include <memory>
#include <string>

#include <vecarrows/core/Scalar.hpp>
#include <vecarrows/runtime/engine/GameInstance.hpp>
#include <vecarrows/runtime/mesh/MeshData.hpp>
#include <vecarrows/runtime/scene/Actor.hpp>
#include <vecarrows/utils/Callback.hpp>

namespace VecArrows {

class Scene {
 public:
  virtual ~Scene() = default;

  std::string name = "BaseScene";

  virtual void PopulateActors(GameInstance* game) = 0;

  void ClearCallbacks();

  Callback<void()> on_enter;
  Callback<void()> on_exit;

 protected:
  // Actor with a MeshRenderer allocated from the game's resource pool. The
  // renderer is skipped when the game has no pool.
  std::shared_ptr<Actor> SpawnShape(GameInstance* game, const std::string& name,
                                    const MeshShape& shape, const Color& color);

  std::shared_ptr<Actor> SpawnColoredCube(GameInstance* game, const Color& color = Colors::WHITE);
};
}  // namespace VecArrows
