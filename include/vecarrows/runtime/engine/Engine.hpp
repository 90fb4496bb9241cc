#pragma once

#include <memory>
#include <vector>

#include <vecarrows/core/Common.hpp>

namespace VecArrows {
class Scene;
class GameInstance;
class MemoryResourcePool;

// Headless host: owns the resource pool and plays each scene for the
// configured number of ticks.
class Engine {
 public:
  Engine();

  int Run();

  void SetScenes(const std::vector<std::shared_ptr<Scene>>& initializers);

  MemoryResourcePool* GetResourcePool() const;

  std::vector<std::shared_ptr<Scene>> scenes;
  uint scene_index = 0;  // current scene index

 private:
  int RunScene(const std::shared_ptr<Scene>& scene);

  std::shared_ptr<MemoryResourcePool> resource_pool_;
  std::shared_ptr<GameInstance> game_;
};
}  // namespace VecArrows
