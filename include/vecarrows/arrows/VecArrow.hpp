#pragma once

#include <string>

#include <vecarrows/core/Scalar.hpp>
#include <vecarrows/runtime/scene/Component.hpp>

namespace VecArrows {

enum class TargetCoordinateSpace {
  GLOBAL,  // target is a world-space point
  LOCAL    // target is expressed in the owner's frame
};

std::string ToString(TargetCoordinateSpace space);

// Accepts "GLOBAL" and "LOCAL".
bool ParseTargetCoordinateSpace(const std::string& text, TargetCoordinateSpace& space);

// Draws an arrow from the owner's origin toward target. The arrow appears on
// the tick after the component is added and disappears on the tick after it
// is removed.
class VecArrow : public Component {
 public:
  VecArrow(const Vector3& _target = Vector3(0.0f),
           TargetCoordinateSpace _space = TargetCoordinateSpace::LOCAL);

  VecArrow& WithThickness(Scalar _thickness);

  VecArrow& WithColor(const Color& _color);

  VecArrow& WithTipThickness(Scalar _tip_thickness);

  VecArrow& WithTipLength(Scalar _tip_length);

  Vector3 target;
  TargetCoordinateSpace target_coordinate_space;
  // shaft radius hint, the shaft mesh has a fixed radius
  Scalar thickness = 0.1f;
  Color color = Colors::WHITE;
  Scalar tip_thickness = 0.075f;
  Scalar tip_length = 0.15f;
};
}  // namespace VecArrows
