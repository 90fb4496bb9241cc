#pragma once

#include <string>

#include <vecarrows/core/Scalar.hpp>

namespace VecArrows {
// Unlit color material, the only property arrows write is base_color.
class Material {
 public:
  Material() {}

  Material(const Color& _base_color) : base_color(_base_color) {}

  std::string name = "";
  Color base_color = Colors::WHITE;
};
}  // namespace VecArrows
