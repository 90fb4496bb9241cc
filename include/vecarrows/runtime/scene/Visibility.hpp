#pragma once

#include <vecarrows/runtime/scene/Component.hpp>

namespace VecArrows {

enum class VisibilityState { INHERITED, VISIBLE, HIDDEN };

class Visibility : public Component {
 public:
  Visibility(VisibilityState _state = VisibilityState::INHERITED) : state(_state) {
    SET_COMPONENT_NAME;
  }

  VisibilityState state;
};
}  // namespace VecArrows
