#include <vecarrows/arrows/VecArrowPlugin.hpp>

#include <vecarrows/utils/Logger.hpp>

namespace VecArrows {
bool VecArrowPlugin::Build(GameInstance* game, ResourcePool* pool) {
  if (game == nullptr) {
    LOG_ERROR("Cannot install VecArrowPlugin without a game instance");
    return false;
  }
  if (pool == nullptr) {
    pool = game->GetResourcePool();
  }
  if (pool == nullptr) {
    LOG_ERROR("Cannot install VecArrowPlugin without a resource pool");
    return false;
  }

  auto system = std::make_shared<VecArrowSystem>(game, pool);
  game->on_attach_stage.Register([system]() { system->OnAttach(); });
  game->on_update_stage.Register([system]() { system->OnUpdate(); });
  game->on_detach_stage.Register([system]() { system->OnDetach(); });

  LOG_DEBUG("VecArrowPlugin installed");
  return true;
}
}  // namespace VecArrows
