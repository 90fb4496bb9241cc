#pragma once

#include <memory>

#include <vecarrows/arrows/ArrowGeometry.hpp>
#include <vecarrows/arrows/VecArrow.hpp>
#include <vecarrows/runtime/engine/GameInstance.hpp>
#include <vecarrows/runtime/resources/ResourcePool.hpp>
#include <vecarrows/runtime/scene/Actor.hpp>

namespace VecArrows {

// Links an owner to the two actors that draw its arrow. Destroying the owner
// destroys both parts.
class VecArrowParts : public Component {
 public:
  VecArrowParts(ActorId _shaft, ActorId _tip);

  void OnDestroy() override;

  ActorId shaft;
  ActorId tip;
};

// Marks the cylinder of an arrow.
class VecArrowShaft : public Component {
 public:
  VecArrowShaft(ActorId _owner);

  ActorId owner;
};

// Marks the cone of an arrow.
class VecArrowTip : public Component {
 public:
  VecArrowTip(ActorId _owner);

  ActorId owner;
};

// Creates, refreshes and tears down arrow parts for every actor carrying a
// VecArrow. Each reaction is meant to run once per tick in its own stage.
class VecArrowSystem {
 public:
  // Neither pointer is owned.
  VecArrowSystem(GameInstance* game, ResourcePool* pool);

  // Materializes arrows for owners whose VecArrow was added last tick.
  void OnAttach();

  // Rewrites part transforms and colors of every materialized arrow.
  void OnUpdate();

  // Destroys parts of live owners whose VecArrow was removed last tick.
  void OnDetach();

  static const MeshShape& ShaftShape();

  static const MeshShape& TipShape();

 private:
  std::shared_ptr<Actor> SpawnPart(Actor* owner, const char* suffix, const MeshShape& shape,
                                   const Pose& pose, const Color& color);

  // Exits the process when the part is gone or no longer carries its
  // MeshRenderer and a Marker pointing back at the owner.
  template <class Marker>
  std::shared_ptr<Actor> RequirePart(Actor* owner, ActorId part, const char* label) const;

  void Refresh(const std::shared_ptr<Actor>& part, const Pose& pose, const Color& color) const;

  GameInstance* game_;
  ResourcePool* pool_;
};
}  // namespace VecArrows
