#include <vecarrows/arrows/ArrowGeometry.hpp>

#include <vecarrows/utils/Helper.hpp>

namespace VecArrows {
namespace ArrowGeometry {

namespace {
const Vector3 kUp(0.0f, 1.0f, 0.0f);

// Rotation taking +Y onto the vector, or nothing for a degenerate vector.
bool AlignUp(const Vector3& vector, Quat& rotation) {
  Vector3 direction;
  if (!Helper::TryNormalize(vector, direction)) {
    return false;
  }
  rotation = Helper::FromRotationArc(kUp, direction);
  return true;
}
}  // namespace

Vector3 EffectiveVector(const std::optional<Pose>& owner, const Vector3& target,
                        TargetCoordinateSpace space) {
  if (space == TargetCoordinateSpace::LOCAL) {
    return target;
  }
  Vector3 origin = owner ? owner->translation : Vector3(0.0f);
  return target - origin;
}

Pose ComposeWithOwner(const std::optional<Pose>& owner, const Pose& pose,
                      TargetCoordinateSpace space) {
  const Pose frame = owner.value_or(Pose::Identity());
  Pose result = pose;
  if (space == TargetCoordinateSpace::GLOBAL) {
    result.translation = pose.translation + frame.translation;
  } else {
    result.translation = frame.rotation * pose.translation + frame.translation;
    result.rotation = frame.rotation * pose.rotation;
  }
  return result;
}

Pose ShaftTransform(const std::optional<Pose>& owner, const Vector3& target,
                    TargetCoordinateSpace space) {
  const Vector3 vector = EffectiveVector(owner, target, space);
  Quat rotation;
  if (!AlignUp(vector, rotation)) {
    return Pose::FromScale(Vector3(0.0f));
  }

  Pose pose;
  pose.translation = vector * 0.5f;
  pose.rotation = rotation;
  pose.scale = Vector3(1.0f, glm::length(vector), 1.0f);
  return ComposeWithOwner(owner, pose, space);
}

Pose TipTransform(const std::optional<Pose>& owner, const Vector3& target,
                  TargetCoordinateSpace space, Scalar tip_length, Scalar tip_thickness) {
  const Vector3 vector = EffectiveVector(owner, target, space);
  Quat rotation;
  if (!AlignUp(vector, rotation)) {
    return Pose::FromScale(Vector3(0.0f));
  }

  Pose pose;
  pose.translation = vector;
  pose.rotation = rotation;
  pose.scale = Vector3(tip_thickness, tip_length, tip_thickness);
  return ComposeWithOwner(owner, pose, space);
}

ArrowTransforms Solve(const std::optional<Pose>& owner, const VecArrow& arrow) {
  ArrowTransforms result;
  result.shaft = ShaftTransform(owner, arrow.target, arrow.target_coordinate_space);
  result.tip = TipTransform(owner, arrow.target, arrow.target_coordinate_space, arrow.tip_length,
                            arrow.tip_thickness);
  return result;
}

}  // namespace ArrowGeometry
}  // namespace VecArrows
