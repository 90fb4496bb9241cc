#include <vecarrows/arrows/VecArrow.hpp>

namespace VecArrows {

std::string ToString(TargetCoordinateSpace space) {
  switch (space) {
    case TargetCoordinateSpace::GLOBAL:
      return "GLOBAL";
    case TargetCoordinateSpace::LOCAL:
      return "LOCAL";
  }
  return "UNKNOWN";
}

bool ParseTargetCoordinateSpace(const std::string& text, TargetCoordinateSpace& space) {
  if (text == "GLOBAL") {
    space = TargetCoordinateSpace::GLOBAL;
    return true;
  }
  if (text == "LOCAL") {
    space = TargetCoordinateSpace::LOCAL;
    return true;
  }
  return false;
}

VecArrow::VecArrow(const Vector3& _target, TargetCoordinateSpace _space)
    : target(_target), target_coordinate_space(_space) {
  SET_COMPONENT_NAME;
}

VecArrow& VecArrow::WithThickness(Scalar _thickness) {
  thickness = _thickness;
  return *this;
}

VecArrow& VecArrow::WithColor(const Color& _color) {
  color = _color;
  return *this;
}

VecArrow& VecArrow::WithTipThickness(Scalar _tip_thickness) {
  tip_thickness = _tip_thickness;
  return *this;
}

VecArrow& VecArrow::WithTipLength(Scalar _tip_length) {
  tip_length = _tip_length;
  return *this;
}
}  // namespace VecArrows
