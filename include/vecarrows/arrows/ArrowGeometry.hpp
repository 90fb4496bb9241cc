#pragma once

#include <optional>

#include <vecarrows/arrows/VecArrow.hpp>
#include <vecarrows/core/Scalar.hpp>
#include <vecarrows/runtime/scene/Transform.hpp>

namespace VecArrows {
namespace ArrowGeometry {

struct ArrowTransforms {
  Pose shaft;
  Pose tip;
};

// Vector from the owner's origin to the arrow end. An absent owner pose reads
// as identity.
Vector3 EffectiveVector(const std::optional<Pose>& owner, const Vector3& target,
                        TargetCoordinateSpace space);

// Moves a pose solved around the world origin onto the owner. GLOBAL only
// offsets the translation, LOCAL also applies the owner rotation. Owner scale
// is ignored in both cases.
Pose ComposeWithOwner(const std::optional<Pose>& owner, const Pose& pose,
                      TargetCoordinateSpace space);

// Unit-height cylinder stretched along the vector, centered halfway.
Pose ShaftTransform(const std::optional<Pose>& owner, const Vector3& target,
                    TargetCoordinateSpace space);

// Unit cone placed at the vector end.
Pose TipTransform(const std::optional<Pose>& owner, const Vector3& target,
                  TargetCoordinateSpace space, Scalar tip_length, Scalar tip_thickness);

ArrowTransforms Solve(const std::optional<Pose>& owner, const VecArrow& arrow);

}  // namespace ArrowGeometry
}  // namespace VecArrows
