#include <vecarrows/runtime/engine/Engine.hpp>

#include <vecarrows/arrows/VecArrowPlugin.hpp>
#include <vecarrows/core/ErrorDefs.hpp>
#include <vecarrows/core/Global.hpp>
#include <vecarrows/runtime/engine/GameInstance.hpp>
#include <vecarrows/runtime/resources/MemoryResourcePool.hpp>
#include <vecarrows/runtime/scene/Scene.hpp>
#include <vecarrows/utils/Logger.hpp>

namespace VecArrows {

Engine::Engine() : resource_pool_(std::make_shared<MemoryResourcePool>()) {}

void Engine::SetScenes(const std::vector<std::shared_ptr<Scene>>& initializers) {
  scenes = initializers;
}

MemoryResourcePool* Engine::GetResourcePool() const {
  return resource_pool_.get();
}

int Engine::Run() {
  if (scenes.empty()) {
    LOG_ERROR("No scene to run");
    return VECARROWS_EXIT::INVALID_SCENE_CONFIG;
  }

  for (scene_index = 0; scene_index < scenes.size(); scene_index++) {
    int code = RunScene(scenes[scene_index]);
    if (code != VECARROWS_EXIT::SUCCESS) {
      return code;
    }
  }
  return VECARROWS_EXIT::SUCCESS;
}

int Engine::RunScene(const std::shared_ptr<Scene>& scene) {
  LOG_INFO("Run scene {} for {} ticks", scene->name, Global::engine_config.num_ticks);

  game_ = std::make_shared<GameInstance>(resource_pool_.get());
  if (!VecArrowPlugin::Build(game_.get(), resource_pool_.get())) {
    LOG_ERROR("Cannot install arrows for scene {}", scene->name);
    return VECARROWS_EXIT::PLUGIN_INSTALL_ERROR;
  }

  scene->PopulateActors(game_.get());
  scene->on_enter.Invoke();
  game_->Run(Global::engine_config.num_ticks);
  scene->on_exit.Invoke();
  scene->ClearCallbacks();
  game_.reset();

  if (resource_pool_->NumMeshes() != 0 || resource_pool_->NumMaterials() != 0) {
    LOG_WARN("Scene {} leaked {} meshes and {} materials", scene->name,
             resource_pool_->NumMeshes(), resource_pool_->NumMaterials());
    resource_pool_->Clear();
  }
  return VECARROWS_EXIT::SUCCESS;
}
}  // namespace VecArrows
