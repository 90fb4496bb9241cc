#include <vecarrows/runtime/scene/Transform.hpp>

namespace VecArrows {

Pose Pose::Compose(const Pose& child) const {
  Pose result;
  result.translation = rotation * (scale * child.translation) + translation;
  result.rotation = rotation * child.rotation;
  result.scale = scale * child.scale;
  return result;
}

Pose Transform::local() const {
  Pose result;
  result.translation = position;
  result.rotation = rotation;
  result.scale = scale;
  return result;
}

void Transform::SetLocal(const Pose& pose) {
  position = pose.translation;
  rotation = pose.rotation;
  scale = pose.scale;
}

void Transform::SetParent(const std::shared_ptr<Transform>& parent) {
  parent_ = parent;
}

std::shared_ptr<Transform> Transform::GetParent() const {
  return parent_.lock();
}

const std::optional<Pose>& Transform::world() const {
  return world_;
}

const Pose& Transform::UpdateWorld() {
  auto parent = parent_.lock();
  if (parent) {
    world_ = parent->UpdateWorld().Compose(local());
  } else {
    world_ = local();
  }
  return *world_;
}

}  // namespace VecArrows
