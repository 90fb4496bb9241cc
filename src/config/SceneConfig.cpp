#include <vecarrows/config/SceneConfig.hpp>

namespace VecArrows {

std::string ToString(SceneAction action) {
  switch (action) {
    case SceneAction::ROLL:
      return "ROLL";
    case SceneAction::TOGGLE_SPACE:
      return "TOGGLE_SPACE";
    case SceneAction::MOVE:
      return "MOVE";
    case SceneAction::REMOVE_ARROWS:
      return "REMOVE_ARROWS";
    case SceneAction::ADD_ARROWS:
      return "ADD_ARROWS";
  }
  return "UNKNOWN";
}

bool ParseSceneAction(const std::string& text, SceneAction& action) {
  const SceneAction all[] = {SceneAction::ROLL, SceneAction::TOGGLE_SPACE, SceneAction::MOVE,
                             SceneAction::REMOVE_ARROWS, SceneAction::ADD_ARROWS};
  for (SceneAction candidate : all) {
    if (ToString(candidate) == text) {
      action = candidate;
      return true;
    }
  }
  return false;
}

TurntableSettings TurntableSettings::Default() {
  TurntableSettings settings;

  auto make_arrow = [](const std::string& name, const Vector3& target, const Color& color) {
    ArrowSettings arrow;
    arrow.name = name;
    arrow.target = target;
    arrow.color = color;
    return arrow;
  };
  settings.arrows = {
      make_arrow("X arrow", Vector3(2.0f, 0.0f, 0.0f), Colors::RED),
      make_arrow("Y arrow", Vector3(0.0f, 2.0f, 0.0f), Colors::GREEN),
      make_arrow("Z arrow", Vector3(0.0f, 0.0f, 2.0f), Colors::BLUE),
      make_arrow("XY arrow", Vector3(2.0f, 2.0f, 0.0f), Colors::YELLOW),
  };

  settings.events = {
      {120, SceneAction::ROLL, Vector3(0.0f)},
      {240, SceneAction::TOGGLE_SPACE, Vector3(0.0f)},
      {300, SceneAction::MOVE, Vector3(1.0f, 0.0f, 0.0f)},
      {360, SceneAction::REMOVE_ARROWS, Vector3(0.0f)},
      {420, SceneAction::ADD_ARROWS, Vector3(0.0f)},
      {480, SceneAction::TOGGLE_SPACE, Vector3(0.0f)},
  };
  return settings;
}

}  // namespace VecArrows
