#include <vecarrows/runtime/engine/GameInstance.hpp>

#include <algorithm>

#include <vecarrows/core/Global.hpp>
#include <vecarrows/utils/Logger.hpp>

namespace VecArrows {

GameInstance::GameInstance(ResourcePool* resource_pool) : resource_pool_(resource_pool) {
  Global::game = this;
}

GameInstance::~GameInstance() {
  if (Global::game == this) {
    Global::game = nullptr;
  }
}

std::shared_ptr<Actor> GameInstance::AddActor(std::shared_ptr<Actor> actor) {
  if (actor->game_ != nullptr) {
    LOG_WARN("Actor {} already belongs to a game instance", actor->name);
    return actor;
  }

  actor->id_ = next_actor_id_++;
  actor->game_ = this;
  actors_.push_back(actor);
  actor_lookup_[actor->id_] = actor;

  // components attached before the actor joined the scene count as added
  for (const auto& c : actor->components) {
    OnComponentAdded(actor.get(), c);
  }

  LOG_TRACE("Add actor #{} {}", actor->id_, actor->name);
  return actor;
}

std::shared_ptr<Actor> GameInstance::CreateActor(const std::string& name) {
  auto actor = std::make_shared<Actor>(name);
  return AddActor(actor);
}

bool GameInstance::DestroyActor(ActorId id) {
  auto iter = actor_lookup_.find(id);
  if (iter == actor_lookup_.end()) {
    return false;
  }

  std::shared_ptr<Actor> actor = iter->second;
  actor_lookup_.erase(iter);
  actors_.erase(std::remove(actors_.begin(), actors_.end(), actor), actors_.end());

  actor->OnDestroy();
  actor->game_ = nullptr;

  LOG_TRACE("Destroy actor #{} {}", id, actor->name);
  return true;
}

bool GameInstance::IsAlive(ActorId id) const {
  return actor_lookup_.count(id) > 0;
}

void GameInstance::Step() {
  frame_count_++;

  added_this_tick_.clear();
  removed_this_tick_.clear();
  added_this_tick_.swap(pending_added_);
  removed_this_tick_.swap(pending_removed_);

  PropagateTransforms();

  on_attach_stage.Invoke();

  auto actors = actors_;
  for (const auto& actor : actors) {
    if (!IsAlive(actor->id_)) {
      continue;
    }
    actor->Start();
    actor->Update();
  }

  PropagateTransforms();

  on_update_stage.Invoke();

  on_detach_stage.Invoke();
}

int GameInstance::Run(uint num_ticks) {
  LOG_TRACE("Total actors: {}", actors_.size());
  for (auto actor : actors_) {
    LOG_TRACE("   + {}", actor->name);
    for (auto component : actor->components) {
      LOG_TRACE("   |-- {}", component->name);
    }
  }

  for (uint i = 0; i < num_ticks; i++) {
    Step();
  }

  Finalize();

  return 0;
}

void GameInstance::Finalize() {
  on_finalize.Invoke();

  std::vector<ActorId> ids;
  for (const auto& actor : actors_) {
    ids.push_back(actor->id_);
  }
  for (ActorId id : ids) {
    // children may already be gone with their owner
    if (IsAlive(id)) {
      DestroyActor(id);
    }
  }

  pending_added_.clear();
  pending_removed_.clear();
  added_this_tick_.clear();
  removed_this_tick_.clear();
}

std::shared_ptr<Actor> GameInstance::FindActor(ActorId id) const {
  auto iter = actor_lookup_.find(id);
  if (iter == actor_lookup_.end()) {
    return nullptr;
  }
  return iter->second;
}

std::shared_ptr<Actor> GameInstance::FindActor(const std::string& name) {
  for (auto actor : actors_) {
    if (actor->GetName() == name) {
      return actor;
    }
  }
  return nullptr;
}

std::vector<std::shared_ptr<Actor>> GameInstance::GetActors() {
  return actors_;
}

ResourcePool* GameInstance::GetResourcePool() const {
  return resource_pool_;
}

uint64_t GameInstance::FrameCount() const {
  return frame_count_;
}

void GameInstance::OnComponentAdded(Actor* actor, const std::shared_ptr<Component>& component) {
  pending_added_.push_back({actor->id_, component});
}

void GameInstance::OnComponentRemoved(ActorId actor, const std::shared_ptr<Component>& component) {
  pending_removed_.push_back({actor, component});
}

void GameInstance::PropagateTransforms() {
  for (const auto& actor : actors_) {
    actor->transform->UpdateWorld();
  }
}

}  // namespace VecArrows
