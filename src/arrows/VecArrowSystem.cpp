#include <vecarrows/arrows/VecArrowSystem.hpp>

#include <cstdlib>

#include <vecarrows/core/ErrorDefs.hpp>
#include <vecarrows/runtime/rendering/MeshRenderer.hpp>
#include <vecarrows/runtime/scene/Visibility.hpp>
#include <vecarrows/utils/Logger.hpp>

namespace VecArrows {

VecArrowParts::VecArrowParts(ActorId _shaft, ActorId _tip) : shaft(_shaft), tip(_tip) {
  SET_COMPONENT_NAME;
}

void VecArrowParts::OnDestroy() {
  if (actor == nullptr || actor->GetGame() == nullptr) {
    return;
  }
  GameInstance* game = actor->GetGame();
  if (!game->DestroyActor(shaft)) {
    LOG_WARN("Shaft #{} of {} was destroyed before its owner", shaft, actor->name);
  }
  if (!game->DestroyActor(tip)) {
    LOG_WARN("Tip #{} of {} was destroyed before its owner", tip, actor->name);
  }
}

VecArrowShaft::VecArrowShaft(ActorId _owner) : owner(_owner) {
  SET_COMPONENT_NAME;
}

VecArrowTip::VecArrowTip(ActorId _owner) : owner(_owner) {
  SET_COMPONENT_NAME;
}

VecArrowSystem::VecArrowSystem(GameInstance* game, ResourcePool* pool)
    : game_(game), pool_(pool) {}

const MeshShape& VecArrowSystem::ShaftShape() {
  static const MeshShape shape = MeshShape::Cylinder(0.01f, 1.0f);
  return shape;
}

const MeshShape& VecArrowSystem::TipShape() {
  static const MeshShape shape = MeshShape::Cone(1.0f, 1.0f);
  return shape;
}

void VecArrowSystem::OnAttach() {
  for (VecArrow* arrow : game_->Added<VecArrow>()) {
    Actor* owner = arrow->actor;
    if (owner->GetComponent<VecArrowParts>() != nullptr) {
      continue;
    }
    if (owner->GetComponent<Visibility>() == nullptr) {
      owner->AddComponent(std::make_shared<Visibility>());
    }

    auto transforms = ArrowGeometry::Solve(owner->transform->world(), *arrow);
    auto shaft = SpawnPart(owner, "Shaft", ShaftShape(), transforms.shaft, arrow->color);
    auto tip = SpawnPart(owner, "Tip", TipShape(), transforms.tip, arrow->color);
    shaft->AddComponent(std::make_shared<VecArrowShaft>(owner->GetId()));
    tip->AddComponent(std::make_shared<VecArrowTip>(owner->GetId()));

    owner->AddComponent(std::make_shared<VecArrowParts>(shaft->GetId(), tip->GetId()));
    LOG_DEBUG("Attach arrow to {} (shaft #{}, tip #{})", owner->name, shaft->GetId(),
              tip->GetId());
  }
}

void VecArrowSystem::OnUpdate() {
  for (const auto& owner : game_->GetActors()) {
    auto arrow = owner->GetComponent<VecArrow>();
    auto parts = owner->GetComponent<VecArrowParts>();
    if (arrow == nullptr || parts == nullptr) {
      continue;
    }

    auto transforms = ArrowGeometry::Solve(owner->transform->world(), *arrow);
    Refresh(RequirePart<VecArrowShaft>(owner.get(), parts->shaft, "shaft"), transforms.shaft,
            arrow->color);
    Refresh(RequirePart<VecArrowTip>(owner.get(), parts->tip, "tip"), transforms.tip,
            arrow->color);
  }
}

void VecArrowSystem::OnDetach() {
  for (ActorId id : game_->Removed<VecArrow>()) {
    auto owner = game_->FindActor(id);
    if (owner == nullptr) {
      continue;
    }
    auto parts = owner->GetComponent<VecArrowParts>();
    if (parts == nullptr) {
      continue;
    }
    // removed and added again within one tick
    if (owner->GetComponent<VecArrow>() != nullptr) {
      continue;
    }

    ActorId shaft = RequirePart<VecArrowShaft>(owner.get(), parts->shaft, "shaft")->GetId();
    ActorId tip = RequirePart<VecArrowTip>(owner.get(), parts->tip, "tip")->GetId();
    owner->RemoveComponent(parts);
    game_->DestroyActor(shaft);
    game_->DestroyActor(tip);
    LOG_DEBUG("Detach arrow from {}", owner->name);
  }
}

std::shared_ptr<Actor> VecArrowSystem::SpawnPart(Actor* owner, const char* suffix,
                                                 const MeshShape& shape, const Pose& pose,
                                                 const Color& color) {
  auto part = game_->CreateActor(owner->name + "/VecArrow" + suffix);
  part->transform->SetLocal(pose);
  part->transform->UpdateWorld();

  auto renderer = std::make_shared<MeshRenderer>(pool_, pool_->AllocateMesh(shape),
                                                 pool_->AllocateMaterial(color));
  part->AddComponents({renderer, std::make_shared<Visibility>()});
  return part;
}

template <class Marker>
std::shared_ptr<Actor> VecArrowSystem::RequirePart(Actor* owner, ActorId part,
                                                   const char* label) const {
  auto actor = game_->FindActor(part);
  if (actor == nullptr) {
    LOG_ERROR("Arrow {} #{} of {} no longer exists", label, part, owner->name);
    exit(VECARROWS_EXIT::ARROW_PART_MISSING);
  }
  if (actor->GetComponent<MeshRenderer>() == nullptr) {
    LOG_ERROR("Arrow {} #{} of {} lost its MeshRenderer", label, part, owner->name);
    exit(VECARROWS_EXIT::ARROW_PART_MISSING);
  }
  auto marker = actor->GetComponent<Marker>();
  if (marker == nullptr || marker->owner != owner->GetId()) {
    LOG_ERROR("Arrow {} #{} of {} is not marked as its {}", label, part, owner->name, label);
    exit(VECARROWS_EXIT::ARROW_PART_MISSING);
  }
  return actor;
}

void VecArrowSystem::Refresh(const std::shared_ptr<Actor>& part, const Pose& pose,
                             const Color& color) const {
  part->transform->SetLocal(pose);
  part->transform->UpdateWorld();

  if (!part->GetComponent<MeshRenderer>()->SetColor(color)) {
    LOG_WARN("Color of {} was not updated", part->name);
  }
}
}  // namespace VecArrows
