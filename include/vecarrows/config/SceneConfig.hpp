#pragma once

#include <string>
#include <vector>

#include <vecarrows/arrows/VecArrow.hpp>
#include <vecarrows/core/Scalar.hpp>

namespace VecArrows {

enum class ArrowParent { CUBE, WORLD };

enum class SceneAction { ROLL, TOGGLE_SPACE, MOVE, REMOVE_ARROWS, ADD_ARROWS };

std::string ToString(SceneAction action);

bool ParseSceneAction(const std::string& text, SceneAction& action);

struct ArrowSettings {
  std::string name = "Arrow";
  Vector3 target{0.0f};
  TargetCoordinateSpace space = TargetCoordinateSpace::LOCAL;
  Color color = Colors::WHITE;
  Scalar thickness = 0.1f;
  Scalar tip_thickness = 0.075f;
  Scalar tip_length = 0.15f;
  ArrowParent parent = ArrowParent::CUBE;
};

struct SceneEvent {
  uint tick = 0;
  SceneAction action = SceneAction::ROLL;
  // MOVE only
  Vector3 offset{0.0f};
};

struct TurntableSettings {
  Vector3 cube_position{0.0f, 1.0f, 0.0f};
  // degrees per tick around +Y
  Scalar turntable_speed = 3.0f;
  uint seed = 0;
  std::vector<ArrowSettings> arrows;
  std::vector<SceneEvent> events;

  // X/Y/Z/XY arrows on the cube and a short script touching every action.
  static TurntableSettings Default();
};

}  // namespace VecArrows
