#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <vecarrows/runtime/scene/Component.hpp>
#include <vecarrows/runtime/scene/Actor.hpp>
#include <vecarrows/utils/Callback.hpp>
#include <vecarrows/core/Common.hpp>

namespace VecArrows {
class ResourcePool;

// Owns the actors of a scene and drives them one tick at a time.
//
// A tick runs, in order:
//  - transform propagation
//  - on_attach_stage
//  - Start/Update of every live actor's components
//  - transform propagation
//  - on_update_stage
//  - on_detach_stage
//
// Component additions and removals are buffered and become visible through
// Added<T>() / Removed<T>() during the following tick only.
class GameInstance {
 public:
  GameInstance(ResourcePool* resource_pool = nullptr);
  GameInstance(const GameInstance&) = delete;
  ~GameInstance();

  std::shared_ptr<Actor> AddActor(std::shared_ptr<Actor> actor);
  std::shared_ptr<Actor> CreateActor(const std::string& name);

  // Runs OnDestroy on the actor's components and drops it from the scene. No
  // component removal is reported for a destroyed actor.
  bool DestroyActor(ActorId id);

  bool IsAlive(ActorId id) const;

  void Step();

  // Steps num_ticks times, then finalizes the scene.
  int Run(uint num_ticks);

  void Finalize();

  template <class T>
  std::enable_if_t<std::is_base_of<Component, T>::value, std::vector<T*>> FindComponents() {
    std::vector<T*> result;

    for (auto actor : actors_) {
      auto component = actor->template GetComponents<T>();
      if (component.size() > 0) {
        result.insert(result.end(), component.begin(), component.end());
      }
    }
    return result;
  }

  // Components of type T added since the previous tick that are still attached
  // to a live actor.
  template <class T>
  std::enable_if_t<std::is_base_of<Component, T>::value, std::vector<T*>> Added() {
    std::vector<T*> result;
    std::unordered_set<const Component*> seen;
    for (const auto& record : added_this_tick_) {
      auto item = dynamic_cast<T*>(record.component.get());
      if (item == nullptr || item->actor == nullptr || !IsAlive(record.actor)) {
        continue;
      }
      if (seen.insert(item).second) {
        result.push_back(item);
      }
    }
    return result;
  }

  // Ids of actors that had a T removed since the previous tick. The actor may
  // have been destroyed since.
  template <class T>
  std::enable_if_t<std::is_base_of<Component, T>::value, std::vector<ActorId>> Removed() {
    std::vector<ActorId> result;
    std::unordered_set<ActorId> seen;
    for (const auto& record : removed_this_tick_) {
      if (dynamic_cast<T*>(record.component.get()) == nullptr) {
        continue;
      }
      if (seen.insert(record.actor).second) {
        result.push_back(record.actor);
      }
    }
    return result;
  }

  std::shared_ptr<Actor> FindActor(ActorId id) const;

  std::shared_ptr<Actor> FindActor(const std::string& name);

  std::vector<std::shared_ptr<Actor>> GetActors();

  ResourcePool* GetResourcePool() const;

  uint64_t FrameCount() const;

 public:
  Callback<void()> on_attach_stage;
  Callback<void()> on_update_stage;
  Callback<void()> on_detach_stage;
  Callback<void()> on_finalize;

 private:
  friend class Actor;

  struct ComponentRecord {
    ActorId actor;
    std::shared_ptr<Component> component;
  };

  void OnComponentAdded(Actor* actor, const std::shared_ptr<Component>& component);

  void OnComponentRemoved(ActorId actor, const std::shared_ptr<Component>& component);

  void PropagateTransforms();

 private:
  ResourcePool* resource_pool_ = nullptr;

  std::vector<std::shared_ptr<Actor>> actors_;
  std::unordered_map<ActorId, std::shared_ptr<Actor>> actor_lookup_;
  ActorId next_actor_id_ = 1;
  uint64_t frame_count_ = 0;

  std::vector<ComponentRecord> pending_added_;
  std::vector<ComponentRecord> pending_removed_;
  std::vector<ComponentRecord> added_this_tick_;
  std::vector<ComponentRecord> removed_this_tick_;
};
}  // namespace VecArrows
