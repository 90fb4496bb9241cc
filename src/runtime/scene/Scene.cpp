#include <vecarrows/runtime/scene/Scene.hpp>

#include <vecarrows/runtime/rendering/MeshRenderer.hpp>
#include <vecarrows/runtime/resources/ResourcePool.hpp>
#include <vecarrows/utils/Logger.hpp>

namespace VecArrows {

void Scene::ClearCallbacks() {
  on_enter.Clear();
  on_exit.Clear();
}

std::shared_ptr<Actor> Scene::SpawnShape(GameInstance* game, const std::string& name,
                                         const MeshShape& shape, const Color& color) {
  auto actor = game->CreateActor(name);
  ResourcePool* pool = game->GetResourcePool();
  if (pool == nullptr) {
    LOG_WARN("No resource pool, {} is spawned without a renderer", name);
    return actor;
  }

  auto renderer =
      std::make_shared<MeshRenderer>(pool, pool->AllocateMesh(shape), pool->AllocateMaterial(color));
  actor->AddComponent(renderer);
  return actor;
}

std::shared_ptr<Actor> Scene::SpawnColoredCube(GameInstance* game, const Color& color) {
  return SpawnShape(game, "Cube", MeshShape::Cuboid(1.0f, 1.0f, 1.0f), color);
}

}  // namespace VecArrows
